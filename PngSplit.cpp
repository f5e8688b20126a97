/* split a PNG into one file per chunk
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#include "PngSplit.h"
#include "FileUtils.h"
#include "StringUtils.h"

#include <cstdio>

std::string png_split_filename(size_t index, const PngStreamRecord& rec) {
	char buf[32];
	snprintf(buf, sizeof(buf), "%04u", (unsigned int)index);
	if(rec.isSignature())
		return std::string(buf) + ".sig";
	return std::string(buf) + "-" + sanitizedFilename(rec.chunk.type) + ".chunk";
}

static Return __prepareDestDir(const std::string& destDir) {
	if(destDir.empty())
		return Return(RK_Resource, "no destination dir given");
	if(pathExists(destDir)) {
		if(!isDir(destDir))
			return Return(RK_Resource, "'" + destDir + "' exists and is not a directory");
		if(!isEmptyDir(destDir))
			return Return(RK_Resource, "'" + destDir + "' is not empty");
		return true;
	}
	ASSERT( createRecDir(destDir) );
	return true;
}

static Return __writeRecordFile(const std::string& filename, const PngStreamRecord& rec) {
	ScopedFile f;
	ASSERT( f.open(filename, "wb") );
	ASSERT_EXT( fwrite_all(f, rec.rawBytes()), "cannot write " + filename );
	ASSERT( f.close() );
	return true;
}

Return png_split_chunks(FILE* in, const std::string& destDir, size_t& fileCount,
						const PngChunkStreamOptions& opts) {
	fileCount = 0;
	ASSERT( __prepareDestDir(destDir) );

	PngChunkStream stream(in, opts);
	PngStreamRecord rec;
	while(stream) {
		ASSERT( stream.next(rec) );
		ASSERT( __writeRecordFile(destDir + "/" + png_split_filename(fileCount, rec), rec) );
		++fileCount;
	}
	return true;
}
