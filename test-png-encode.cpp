/* tests for CRC and chunk encoding
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#include <catch2/catch.hpp>

#include "Png.h"
#include "Crc.h"
#include "StringUtils.h"
#include "Utils.h"
#include "test-util.h"

TEST_CASE("CRC-32 matches the PNG reference values", "[crc]") {
	CHECK(calc_crc(std::string("IEND")) == 0xAE426082u);
	CHECK(calc_crc(std::string("tEXt")) == 0x9642C585u);
	CHECK(calc_crc(std::string("tE"), std::string("Xt")) == 0x9642C585u);
	CHECK(calc_crc(std::string("123456789")) == 0xCBF43926u);
}

TEST_CASE("encoding an empty tEXt chunk", "[png][encode]") {
	std::string out;
	REQUIRE(png_encode_chunk(out, "tEXt", ""));
	REQUIRE(out.size() == 12);
	CHECK(hexString(out) == "00000000" "74455874" "9642C585");
}

TEST_CASE("encoding a chunk with payload", "[png][encode]") {
	std::string data = rawString<uint32_t>(5) + rawString<uint32_t>(3);
	std::string out;
	REQUIRE(png_encode_chunk(out, "acTL", data));
	CHECK(hexString(out) == "00000008" "6163544C" "0000000500000003" "D8A41EDA");
	CHECK(out == rawChunk("acTL", data));
}

TEST_CASE("encoding rejects a bad chunk type", "[png][encode][error]") {
	std::string out = "untouched";
	Return r = png_encode_chunk(out, "IEN", "");
	CHECK_FALSE(r);
	CHECK(r.kind == RK_BadChunk);
	CHECK(out == "untouched");
	CHECK(png_encode_chunk(out, "IENDX", "").kind == RK_BadChunk);
}

TEST_CASE("PngChunk recomputes on write but not on rawBytes", "[png][encode]") {
	PngChunk chunk("tEXt", "abc");
	CHECK(chunk.length == 3);
	CHECK(chunk.crcMatches());
	CHECK(chunk.rawBytes() == rawChunk("tEXt", "abc"));

	chunk.crc = 0x12345678;
	CHECK_FALSE(chunk.crcMatches());
	CHECK(hexString(chunk.rawBytes().substr(11)) == "12345678");

	StringWriteCallback w;
	REQUIRE(png_write_chunk(&w, chunk));
	CHECK(w.data == rawChunk("tEXt", "abc"));
}

TEST_CASE("signature round trip through the writer", "[png][encode]") {
	StringWriteCallback w;
	REQUIRE(png_write_sig(&w));
	CHECK(hexString(w.data) == "89504E470D0A1A0A");

	MemFile f(w.data + iendChunk());
	CHECK(png_read_sig(f));
}

TEST_CASE("error kinds map to tool exit codes", "[return]") {
	CHECK(Return(true).exitCode() == 0);

	ReturnKind formatKinds[] = { RK_BadSignature, RK_Truncated, RK_BadChunk };
	for(size_t i = 0; i < sizeof(formatKinds)/sizeof(formatKinds[0]); ++i) {
		Return r(formatKinds[i], "x");
		CHECK(r.isFormatError());
		CHECK(r.exitCode() == 1);
	}

	ReturnKind otherKinds[] = { RK_Resource, RK_Io, RK_Error };
	for(size_t i = 0; i < sizeof(otherKinds)/sizeof(otherKinds[0]); ++i) {
		Return r(otherKinds[i], "x");
		CHECK_FALSE(r.isFormatError());
		CHECK(r.exitCode() == 2);
	}

	// context added on the way up keeps the kind
	Return inner(RK_Resource, "cannot open 'x'");
	Return outer(inner, "split");
	CHECK(outer.kind == RK_Resource);
	CHECK(outer.exitCode() == 2);
	CHECK(outer.errmsg == "split: cannot open 'x'");
}
