/* tests for the APNG replay count rewriting
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#include <catch2/catch.hpp>

#include "ApngLoop.h"
#include "Png.h"
#include "StringUtils.h"
#include "test-util.h"

namespace {

	// reads back all acTL chunks of a PNG in memory
	std::list<PngChunk> actlChunks(const std::string& png) {
		std::list<PngChunk> ret;
		MemFile f(png);
		PngChunkStream stream(f);
		PngStreamRecord rec;
		while(stream) {
			Return r = stream.next(rec);
			REQUIRE(r);
			if(rec.isChunk() && rec.chunk.type == "acTL")
				ret.push_back(rec.chunk);
		}
		return ret;
	}

}

TEST_CASE("acTL payload layout", "[apng]") {
	ApngAnimControl actl(5, 3);
	CHECK(hexString(actl.serialized()) == "0000000500000003");

	ApngAnimControl parsed;
	REQUIRE(parsed.parse(actl.serialized()));
	CHECK(parsed.numFrames == 5);
	CHECK(parsed.numPlays == 3);

	CHECK(parsed.parse("1234567").kind == RK_BadChunk);
}

TEST_CASE("PNG without acTL is copied unchanged", "[apng]") {
	std::string png = png_sig() + ihdrChunk() + rawChunk("IDAT", "pixels") + rawChunk("tEXt", "Comment hi") + iendChunk();
	uint32_t plays[] = { 0, 1, 7, 0xFFFFFFFFu };
	for(size_t i = 0; i < sizeof(plays)/sizeof(plays[0]); ++i) {
		MemFile in(png);
		StringWriteCallback out;
		CollectWarnings warnings;
		size_t matchCount = 99;
		REQUIRE(apng_set_num_plays(in, &out, plays[i], matchCount, &warnings));
		CHECK(out.data == png);
		CHECK(matchCount == 0);
		REQUIRE(warnings.msgs.size() == 1);
		CHECK(warnings.msgs.front().find("not an animated PNG") != std::string::npos);
	}
}

TEST_CASE("numPlays of the acTL chunk is replaced", "[apng]") {
	std::string head = png_sig() + ihdrChunk();
	std::string tail = rawChunk("IDAT", "data") + iendChunk();
	MemFile in(head + actlChunk(5, 3) + tail);
	StringWriteCallback out;
	CollectWarnings warnings;
	size_t matchCount = 0;
	REQUIRE(apng_set_num_plays(in, &out, 7, matchCount, &warnings));

	CHECK(matchCount == 1);
	CHECK(warnings.msgs.empty());
	REQUIRE(out.data.size() == head.size() + 20 + tail.size());
	CHECK(out.data.substr(0, head.size()) == head);
	CHECK(out.data.substr(head.size() + 20) == tail);

	std::string actl = out.data.substr(head.size(), 20);
	CHECK(hexString(actl) == "00000008" "6163544C" "00000005" "00000007" "DFC9DAC3");

	std::list<PngChunk> chunks = actlChunks(out.data);
	REQUIRE(chunks.size() == 1);
	CHECK(chunks.front().crcMatches());
}

TEST_CASE("multiple acTL chunks are all rewritten with a warning", "[apng]") {
	std::string png = png_sig() + ihdrChunk() + actlChunk(5, 3) + rawChunk("IDAT", "x") + actlChunk(9, 0) + iendChunk();
	MemFile in(png);
	StringWriteCallback out;
	CollectWarnings warnings;
	size_t matchCount = 0;
	REQUIRE(apng_set_num_plays(in, &out, 2, matchCount, &warnings));

	CHECK(matchCount == 2);
	REQUIRE(warnings.msgs.size() == 1);
	CHECK(warnings.msgs.front().find("non-conformant") != std::string::npos);

	std::list<PngChunk> chunks = actlChunks(out.data);
	REQUIRE(chunks.size() == 2);
	ApngAnimControl first, second;
	REQUIRE(first.parse(chunks.front().data));
	REQUIRE(second.parse(chunks.back().data));
	CHECK(first.numFrames == 5);
	CHECK(first.numPlays == 2);
	CHECK(second.numFrames == 9);
	CHECK(second.numPlays == 2);
	CHECK(chunks.front().crcMatches());
	CHECK(chunks.back().crcMatches());
}

TEST_CASE("setting the same numPlays again gives identical bytes", "[apng]") {
	std::string png = png_sig() + ihdrChunk() + actlChunk(4, 1) + iendChunk();
	MemFile in(png);
	StringWriteCallback out;
	size_t matchCount = 0;
	REQUIRE(apng_set_num_plays(in, &out, 1, matchCount));
	CHECK(matchCount == 1);
	CHECK(out.data == png);
}

TEST_CASE("acTL CRC is recomputed even if it was wrong", "[apng]") {
	std::string broken = actlChunk(4, 1);
	broken[broken.size() - 1] ^= 0x01;
	std::string png = png_sig() + broken + iendChunk();
	MemFile in(png);
	StringWriteCallback out;
	size_t matchCount = 0;
	REQUIRE(apng_set_num_plays(in, &out, 1, matchCount));
	CHECK(out.data == png_sig() + actlChunk(4, 1) + iendChunk());
}

TEST_CASE("a truncated stream aborts with partial output", "[apng][error]") {
	std::string good = png_sig() + ihdrChunk() + actlChunk(5, 3);
	std::string idat = rawChunk("IDAT", "abcdef");
	MemFile in(good + idat.substr(0, idat.size() - 2));
	StringWriteCallback out;
	CollectWarnings warnings;
	size_t matchCount = 0;

	Return r = apng_set_num_plays(in, &out, 0, matchCount, &warnings);
	CHECK_FALSE(r);
	CHECK(r.kind == RK_Truncated);
	// everything up to the broken chunk was already written
	CHECK(out.data == png_sig() + ihdrChunk() + actlChunk(5, 0));
	CHECK(matchCount == 1);
	CHECK(warnings.msgs.empty());
}

TEST_CASE("malformed acTL payload is a format error", "[apng][error]") {
	MemFile in(png_sig() + rawChunk("acTL", "short") + iendChunk());
	StringWriteCallback out;
	size_t matchCount = 0;
	Return r = apng_set_num_plays(in, &out, 0, matchCount);
	CHECK(r.kind == RK_BadChunk);
	CHECK(r.errmsg.find("acTL") != std::string::npos);
}

TEST_CASE("bad signature writes nothing", "[apng][error]") {
	MemFile in(std::string("GIF89a..") + iendChunk());
	StringWriteCallback out;
	size_t matchCount = 0;
	Return r = apng_set_num_plays(in, &out, 0, matchCount);
	CHECK(r.kind == RK_BadSignature);
	CHECK(out.data.empty());
}
