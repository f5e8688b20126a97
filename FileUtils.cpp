/* File utils
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#include "FileUtils.h"
#include <sys/stat.h> // mkdir
#include <errno.h>
#include <cstdio>

Return fwrite_bytes(FILE* fp, const char* d, size_t size) {
	while(size > 0) {
		size_t n = fwrite(d, 1, size, fp);
		if(n == 0 || ferror(fp))
			return Return(RK_Io, "file-write-error");
		d += n;
		size -= n;
	}
	
	return true;	
}

Return fwrite_all(FILE* fp, const std::string& in) {
	return fwrite_bytes(fp, in.data(), in.size());
}

Return ScopedFile::open(const std::string& filename, const char* mode) {
	ASSERT( close() );
	file = fopen(filename.c_str(), mode);
	if(file == NULL)
		return Return(RK_Resource, "cannot open '" + filename + "': " + strerror(errno));
	owned = true;
	return true;
}

Return ScopedFile::openOrStd(const std::string& filename, const char* mode, FILE* stdStream) {
	if(filename.empty() || filename == "-") {
		ASSERT( close() );
		file = stdStream;
		owned = false;
		return true;
	}
	return open(filename, mode);
}

Return ScopedFile::close() {
	Return r = true;
	if(file != NULL) {
		if(owned) {
			if(fclose(file) != 0)
				r = Return(RK_Io, std::string() + "close failed: " + strerror(errno));
		}
		else if(file != stdin && fflush(file) != 0)
			r = Return(RK_Io, std::string() + "flush failed: " + strerror(errno));
	}
	file = NULL;
	owned = false;
	return r;
}

DirIter::~DirIter() {
	if(dir != NULL) {
		closedir(dir);
		dir = NULL;
	}
}

void DirIter::next() {
	filename = "";
	if(dir == NULL) return;
	dirent* entry = readdir(dir);
	if(entry == NULL) return;
	filename = entry->d_name;
}

bool isDir(const std::string& path) {
	struct stat st;
	if(stat(path.c_str(), &st) != 0) return false;
	return S_ISDIR(st.st_mode);
}

bool pathExists(const std::string& path) {
	struct stat st;
	return stat(path.c_str(), &st) == 0;
}

bool isEmptyDir(const std::string& path) {
	if(!isDir(path)) return false;
	for(DirIter it(path); it; it.next()) {
		if(it.filename != "." && it.filename != "..")
			return false;
	}
	return true;
}

static Return __createDir(const std::string& dir, mode_t mode = 0777) {
	if(dir.empty()) return true; // leading '/'
	if(mkdir(dir.c_str(), mode) != 0) {
		if(errno == EEXIST) return true; // no error
		return Return(RK_Resource, std::string() + "cannot create dir '" + dir + "': " + strerror(errno));
	}
	return true;
}

Return createRecDir(const std::string& abs_filename, bool last_is_dir) {
	std::string tmp;
	std::string::const_iterator f = abs_filename.begin();
	for(tmp = ""; f != abs_filename.end(); f++) {
		if(*f == '\\' || *f == '/')
			ASSERT( __createDir(tmp) );
		tmp += *f;
	}
	if(last_is_dir)
		ASSERT( __createDir(tmp) );
	return true;
}
