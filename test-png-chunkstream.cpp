/* tests for the PNG chunk stream
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#include <catch2/catch.hpp>

#include "Png.h"
#include "test-util.h"

#include <string>

namespace {

	std::string simplePng() {
		return png_sig() + ihdrChunk() + iendChunk();
	}

}

TEST_CASE("chunk stream yields signature then chunks", "[png][stream]") {
	std::string trailing = "garbage after IEND";
	MemFile f(simplePng() + trailing);
	REQUIRE(f.file);

	PngChunkStream stream(f);
	PngStreamRecord rec;

	REQUIRE(stream);
	REQUIRE(stream.next(rec));
	CHECK(rec.isSignature());
	CHECK(rec.signature == png_sig());
	CHECK(rec.rawBytes() == png_sig());

	REQUIRE(stream);
	REQUIRE(stream.next(rec));
	REQUIRE(rec.isChunk());
	CHECK(rec.chunk.type == "IHDR");
	CHECK(rec.chunk.length == 13);
	CHECK(rec.chunk.data.size() == 13);
	CHECK(rec.chunk.crcMatches());
	CHECK(rec.rawBytes() == ihdrChunk());

	REQUIRE(stream);
	REQUIRE(stream.next(rec));
	REQUIRE(rec.isChunk());
	CHECK(rec.chunk.type == "IEND");
	CHECK(rec.chunk.length == 0);

	CHECK_FALSE(stream);
	CHECK(stream.gotEndChunk);
	CHECK_FALSE(stream.gotEof);
	CHECK(stream.recordCount == 3);
	// nothing behind IEND was touched
	CHECK(f.pos() == (long)simplePng().size());
}

TEST_CASE("pulling from a finished stream fails", "[png][stream]") {
	MemFile f(simplePng());
	PngChunkStream stream(f);
	PngStreamRecord rec;
	while(stream)
		REQUIRE(stream.next(rec));

	Return r = stream.next(rec);
	CHECK_FALSE(r);
	CHECK(r.errmsg == "cannot read more: finished already");
}

TEST_CASE("wrong signature is rejected before any chunk is read", "[png][stream][error]") {
	std::string data = simplePng();
	data[1] = 'X';
	MemFile f(data);
	PngChunkStream stream(f);
	PngStreamRecord rec;

	Return r = stream.next(rec);
	CHECK_FALSE(r);
	CHECK(r.kind == RK_BadSignature);
	CHECK(r.isFormatError());
	CHECK(f.pos() == 8);
	CHECK_FALSE(stream);
	CHECK(stream.recordCount == 0);

	// sticks with the error
	Return r2 = stream.next(rec);
	CHECK(r2.kind == RK_BadSignature);
}

TEST_CASE("short signature is a premature end", "[png][stream][error]") {
	MemFile f(png_sig().substr(0, 5));
	PngChunkStream stream(f);
	PngStreamRecord rec;

	Return r = stream.next(rec);
	CHECK_FALSE(r);
	CHECK(r.kind == RK_Truncated);
}

TEST_CASE("declared length beyond the available data is a truncated record", "[png][stream][error]") {
	// claims 100 bytes of payload but there are only 4
	std::string broken = rawString<uint32_t>(100) + "tEXt" + "abcd";
	MemFile f(png_sig() + ihdrChunk() + broken);
	PngChunkStream stream(f);
	PngStreamRecord rec;

	REQUIRE(stream.next(rec));
	REQUIRE(stream.next(rec));
	REQUIRE(rec.chunk.type == "IHDR");

	Return r = stream.next(rec);
	CHECK_FALSE(r);
	CHECK(r.kind == RK_Truncated);
	CHECK(r.errmsg.find("chunk data") != std::string::npos);
	// no record for the broken chunk
	CHECK(rec.chunk.type == "IHDR");
	CHECK(stream.recordCount == 2);
	CHECK_FALSE(stream);
}

TEST_CASE("every fixed-size read of a chunk detects truncation", "[png][stream][error]") {
	std::string full = png_sig() + ihdrChunk();
	std::string idat = rawChunk("IDAT", "xyz");

	const char* what[] = { "chunk len", "chunk len", "chunk type", "chunk data", "chunk crc" };
	size_t cut[] = { 0, 2, 6, 9, 13 };
	for(size_t i = 0; i < sizeof(cut)/sizeof(cut[0]); ++i) {
		MemFile f(full + idat.substr(0, cut[i]));
		PngChunkStream stream(f);
		PngStreamRecord rec;
		REQUIRE(stream.next(rec));
		REQUIRE(stream.next(rec));

		Return r = stream.next(rec);
		INFO("cut after " << cut[i] << " bytes");
		CHECK(r.kind == RK_Truncated);
		CHECK(r.errmsg.find(what[i]) != std::string::npos);
	}
}

TEST_CASE("missing IEND ends the stream only in lenient mode", "[png][stream][options]") {
	std::string data = png_sig() + ihdrChunk();

	SECTION("strict") {
		MemFile f(data);
		PngChunkStream stream(f);
		PngStreamRecord rec;
		REQUIRE(stream.next(rec));
		REQUIRE(stream.next(rec));
		REQUIRE(stream);
		CHECK(stream.next(rec).kind == RK_Truncated);
	}

	SECTION("lenient") {
		PngChunkStreamOptions opts;
		opts.allowMissingEnd = true;
		MemFile f(data);
		PngChunkStream stream(f, opts);
		PngStreamRecord rec;
		REQUIRE(stream.next(rec));
		REQUIRE(stream.next(rec));
		CHECK(rec.chunk.type == "IHDR");
		CHECK_FALSE(stream);
		CHECK(stream.gotEof);
		CHECK_FALSE(stream.gotEndChunk);
	}

	SECTION("lenient still rejects a partial length") {
		PngChunkStreamOptions opts;
		opts.allowMissingEnd = true;
		MemFile f(data + std::string(2, '\0'));
		PngChunkStream stream(f, opts);
		PngStreamRecord rec;
		REQUIRE(stream.next(rec));
		REQUIRE(stream.next(rec));
		REQUIRE(stream);
		CHECK(stream.next(rec).kind == RK_Truncated);
	}
}

TEST_CASE("CRC is passed through and only checked on request", "[png][stream][options]") {
	std::string bad = rawChunk("tEXt", "hello");
	bad[bad.size() - 1] ^= 0x55;
	std::string data = png_sig() + bad + iendChunk();

	SECTION("default trusts the wire value") {
		MemFile f(data);
		PngChunkStream stream(f);
		PngStreamRecord rec;
		REQUIRE(stream.next(rec));
		REQUIRE(stream.next(rec));
		CHECK_FALSE(rec.chunk.crcMatches());
		CHECK(rec.rawBytes() == bad);
	}

	SECTION("verifyCrc") {
		PngChunkStreamOptions opts;
		opts.verifyCrc = true;
		MemFile f(data);
		PngChunkStream stream(f, opts);
		PngStreamRecord rec;
		REQUIRE(stream.next(rec));
		Return r = stream.next(rec);
		CHECK(r.kind == RK_BadChunk);
		CHECK(r.isFormatError());
	}
}

TEST_CASE("oversized chunk length is rejected before reading the payload", "[png][stream][options]") {
	PngChunkStreamOptions opts;
	opts.maxChunkLength = 16;
	MemFile f(png_sig() + rawChunk("tEXt", std::string(17, 'x')) + iendChunk());
	PngChunkStream stream(f, opts);
	PngStreamRecord rec;
	REQUIRE(stream.next(rec));

	Return r = stream.next(rec);
	CHECK(r.kind == RK_BadChunk);
	CHECK(f.pos() == 8 + 4);
}

TEST_CASE("chunk types are opaque", "[png][stream]") {
	MemFile f(png_sig() + rawChunk("\x01\x02 z", "?") + iendChunk());
	PngChunkStream stream(f);
	PngStreamRecord rec;
	REQUIRE(stream.next(rec));
	REQUIRE(stream.next(rec));
	CHECK(rec.chunk.type == std::string("\x01\x02 z"));
	REQUIRE(stream.next(rec));
	CHECK_FALSE(stream);
}

TEST_CASE("huge declared length with little data is truncated without allocating it", "[png][stream][error]") {
	MemFile f(png_sig() + rawString<uint32_t>(0x7FFFFFF0) + "tEXt" + "abcd");
	PngChunkStream stream(f);
	PngStreamRecord rec;
	REQUIRE(stream.next(rec));

	Return r = stream.next(rec);
	CHECK_FALSE(r);
	CHECK(r.kind == RK_Truncated);
	CHECK(r.errmsg.find("chunk data") != std::string::npos);
	CHECK(rec.isSignature());
	CHECK_FALSE(stream);
}

TEST_CASE("payloads bigger than one read piece come through whole", "[png][stream]") {
	std::string data;
	for(size_t i = 0; i < 200 * 1000; ++i)
		data += (char)(i * 7);
	MemFile f(png_sig() + rawChunk("IDAT", data) + iendChunk());
	PngChunkStream stream(f);
	PngStreamRecord rec;
	REQUIRE(stream.next(rec));
	REQUIRE(stream.next(rec));
	CHECK(rec.chunk.length == data.size());
	CHECK(rec.chunk.data == data);
	CHECK(rec.chunk.crcMatches());
}
