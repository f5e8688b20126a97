/* File utils
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#ifndef __AZ__FILEUTILS_H__
#define __AZ__FILEUTILS_H__

#include "Return.h"
#include "StringUtils.h"
#include "Utils.h"

#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <string>

// Reads exactly s bytes. Running out of data is RK_Truncated.
static inline Return fread_bytes(FILE* f, char* d, size_t s) {
	while(s > 0) {
		size_t r = fread(d, 1, s, f);
		d += r;
		s -= r;
		if(r > 0) continue;
		if(ferror(f))
			return Return(RK_Io, "file-read-error");
		return Return(RK_Truncated, "end-of-file");
	}
	return true;
}

template<typename T>
static inline Return fread_bytes(FILE* f, T& d) {
	ASSERT( fread_bytes(f, &d[0], sizeof(T)/sizeof(d[0])) );
	return true;
}

#ifndef FileReadPieceSize
#define FileReadPieceSize 64*1024
#endif

// Grows out only by what actually arrives, so a bogus size s cannot make us allocate it upfront.
static inline Return fread_string(FILE* f, std::string& out, size_t s) {
	out.clear();
	char buf[FileReadPieceSize];
	while(s > 0) {
		size_t n = (s < sizeof(buf)) ? s : sizeof(buf);
		ASSERT( fread_bytes(f, buf, n) );
		out.append(buf, n);
		s -= n;
	}
	return true;
}

template <typename T, typename _D>
static Return fread_bigendian(FILE* stream, _D& d) {
	char data[sizeof(T)];
	ASSERT( fread_bytes(stream, data) );
	d = (_D)valueFromRaw<T>(data);
	return true;
}

Return fwrite_bytes(FILE* f, const char* d, size_t s);
Return fwrite_all(FILE* fp, const std::string& in);

// Owns the FILE* only if it opened it itself; stdin/stdout are just borrowed.
struct ScopedFile : DontCopyTag {
	FILE* file;
	bool owned;

	ScopedFile() : file(NULL), owned(false) {}
	~ScopedFile() { (void)close(); }
	Return open(const std::string& filename, const char* mode);
	// "-" or empty means the given std stream
	Return openOrStd(const std::string& filename, const char* mode, FILE* stdStream);
	Return close();
	operator FILE*() const { return file; }
};

struct DirIter : DontCopyTag {
	DIR* dir;
	std::string filename;
	
	DirIter(const std::string& dirname) : dir(opendir(dirname.c_str())) { next(); /* set first filename */ }
	~DirIter();
	void next();
	operator bool() const { return dir != NULL && !filename.empty(); }
};

bool isDir(const std::string& path);
bool pathExists(const std::string& path);
// true if it is a directory with nothing but "." and ".."
bool isEmptyDir(const std::string& path);

Return createRecDir(const std::string& abs_filename, bool last_is_dir = true);

struct FileWriteCallback : WriteCallbackIntf {
	FILE* file;
	FileWriteCallback(FILE* f) : file(f) {}
	using WriteCallbackIntf::write;
	Return write(const char* data, size_t s) { return fwrite_bytes(file, data, s); }
};

#endif
