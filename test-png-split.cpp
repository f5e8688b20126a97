/* tests for splitting a PNG into files
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#include <catch2/catch.hpp>

#include "PngSplit.h"
#include "FileUtils.h"
#include "test-util.h"

#include <cstdlib>
#include <cstdio>
#include <string>
#include <unistd.h>

namespace {

	struct TempDir : DontCopyTag {
		std::string path;
		TempDir() {
			char tmpl[] = "/tmp/png-split-test.XXXXXX";
			if(mkdtemp(tmpl) != NULL) path = tmpl;
		}
		~TempDir() {
			removeTree(path);
		}
		static void removeTree(const std::string& dir) {
			std::list<std::string> files;
			for(DirIter it(dir); it; it.next())
				if(it.filename != "." && it.filename != "..")
					files.push_back(dir + "/" + it.filename);
			for(std::list<std::string>::iterator i = files.begin(); i != files.end(); ++i)
				if(unlink(i->c_str()) != 0) removeTree(*i);
			rmdir(dir.c_str());
		}
	};

	std::string readFile(const std::string& fn) {
		std::string ret;
		FILE* f = fopen(fn.c_str(), "rb");
		if(f == NULL) return "<missing>";
		char buf[256];
		size_t n;
		while((n = fread(buf, 1, sizeof(buf), f)) > 0)
			ret.append(buf, n);
		fclose(f);
		return ret;
	}

}

TEST_CASE("split file names", "[split]") {
	PngStreamRecord sig;
	CHECK(png_split_filename(0, sig) == "0000.sig");

	PngStreamRecord rec;
	rec.kind = PngStreamRecord::Chunk;
	rec.chunk = PngChunk("IHDR", "");
	CHECK(png_split_filename(1, rec) == "0001-IHDR.chunk");
	rec.chunk.type = std::string("a b\xff", 4);
	CHECK(png_split_filename(12345, rec) == "12345-a_b_.chunk");
}

TEST_CASE("split writes one file per record", "[split]") {
	TempDir tmp;
	REQUIRE(!tmp.path.empty());
	std::string dest = tmp.path + "/out/chunks";

	MemFile in(png_sig() + ihdrChunk() + actlChunk(2, 0) + iendChunk() + "trailing");
	size_t fileCount = 0;
	REQUIRE(png_split_chunks(in, dest, fileCount));
	CHECK(fileCount == 4);

	CHECK(readFile(dest + "/0000.sig") == png_sig());
	CHECK(readFile(dest + "/0001-IHDR.chunk") == ihdrChunk());
	CHECK(readFile(dest + "/0002-acTL.chunk") == actlChunk(2, 0));
	CHECK(readFile(dest + "/0003-IEND.chunk") == iendChunk());
	CHECK(readFile(dest + "/0004-IEND.chunk") == "<missing>");
}

TEST_CASE("split into an existing empty dir", "[split]") {
	TempDir tmp;
	REQUIRE(!tmp.path.empty());
	MemFile in(png_sig() + iendChunk());
	size_t fileCount = 0;
	REQUIRE(png_split_chunks(in, tmp.path, fileCount));
	CHECK(fileCount == 2);
}

TEST_CASE("split refuses a non-empty destination before reading", "[split][error]") {
	TempDir tmp;
	REQUIRE(!tmp.path.empty());
	{
		FILE* f = fopen((tmp.path + "/already-here").c_str(), "wb");
		REQUIRE(f);
		fclose(f);
	}

	MemFile in(png_sig() + iendChunk());
	size_t fileCount = 0;
	Return r = png_split_chunks(in, tmp.path, fileCount);
	CHECK_FALSE(r);
	CHECK(r.kind == RK_Resource);
	CHECK_FALSE(r.isFormatError());
	CHECK(in.pos() == 0);
	CHECK(fileCount == 0);

	Return r2 = png_split_chunks(in, tmp.path + "/already-here", fileCount);
	CHECK(r2.kind == RK_Resource);
}

TEST_CASE("split keeps the files written before a format error", "[split][error]") {
	TempDir tmp;
	REQUIRE(!tmp.path.empty());
	MemFile in(png_sig() + ihdrChunk() + rawString<uint32_t>(50) + "IDAT");
	size_t fileCount = 0;
	Return r = png_split_chunks(in, tmp.path, fileCount);
	CHECK(r.kind == RK_Truncated);
	CHECK(fileCount == 2);
	CHECK(readFile(tmp.path + "/0001-IHDR.chunk") == ihdrChunk());
}
