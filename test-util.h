/* helpers for the tests
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#ifndef __AZ__TESTUTIL_H__
#define __AZ__TESTUTIL_H__

#include "Png.h"
#include "StringUtils.h"
#include "Utils.h"
#include "Crc.h"

#include <cstdio>
#include <list>
#include <string>
#include <stdint.h>

// a FILE* with the given content, positioned at the start
struct MemFile : DontCopyTag {
	FILE* file;
	MemFile(const std::string& content) : file(tmpfile()) {
		if(file == NULL) return;
		if(!content.empty() && fwrite(content.data(), 1, content.size(), file) != content.size()) {
			fclose(file);
			file = NULL;
			return;
		}
		rewind(file);
	}
	~MemFile() { if(file) fclose(file); }
	operator FILE*() const { return file; }
	long pos() const { return ftell(file); }
};

struct CollectWarnings : WarningCallbackIntf {
	std::list<std::string> msgs;
	void warning(const std::string& msg) { msgs.push_back(msg); }
};

// raw chunk with a correct CRC, built by hand (not through png_encode_chunk)
static inline std::string rawChunk(const std::string& type, const std::string& data) {
	std::string crcInput = type + data;
	return rawString<uint32_t>((uint32_t)data.size()) + type + data
		+ rawString<uint32_t>(calc_crc(crcInput));
}

static inline std::string ihdrChunk() {
	std::string d = rawString<uint32_t>(1) + rawString<uint32_t>(1);
	d += (char)8; d += (char)6; d += (char)0; d += (char)0; d += (char)0;
	return rawChunk("IHDR", d);
}

static inline std::string actlChunk(uint32_t frames, uint32_t plays) {
	return rawChunk("acTL", rawString<uint32_t>(frames) + rawString<uint32_t>(plays));
}

static inline std::string iendChunk() {
	return rawChunk("IEND", "");
}

#endif
