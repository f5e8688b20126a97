/* PNG chunk stream
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#include "Png.h"
#include "FileUtils.h"
#include "StringUtils.h"
#include "Crc.h"

#include <cstring>
#include <stdint.h>

const char PNGSIG[8] = {(char)137,80,78,71,13,10,26,10};

std::string png_sig() {
	return std::string(PNGSIG, sizeof(PNGSIG));
}

Return png_read_sig(FILE* f, std::string* sig) {
	char buf[sizeof(PNGSIG)]; memset(buf, 0, sizeof(PNGSIG));
	ASSERT_EXT( fread_bytes(f, buf), "failed to read PNG signature" );
	if(memcmp(PNGSIG, buf, sizeof(PNGSIG)) != 0)
		return Return(RK_BadSignature, "PNG signature wrong");
	if(sig) *sig = std::string(buf, sizeof(buf));
	return true;
}

Return png_write_sig(WriteCallbackIntf* w) {
	ASSERT( w->write(PNGSIG, sizeof(PNGSIG)) );
	return true;
}

PngChunk::PngChunk(const std::string& t, const std::string& d)
: length((uint32_t)d.size()), type(t), data(d), crc(calc_crc(t, d)) {}

uint32_t PngChunk::computedCrc() const {
	return calc_crc(type, data);
}

std::string PngChunk::rawBytes() const {
	return rawString<uint32_t>(length) + type + data + rawString<uint32_t>(crc);
}

std::string PngStreamRecord::rawBytes() const {
	switch(kind) {
		case Signature: return signature;
		case Chunk: return chunk.rawBytes();
	}
	return "";
}

Return png_read_chunk(FILE* f, PngChunk& chunk, const PngChunkStreamOptions& opts) {
	uint32_t len;
	ASSERT_EXT( fread_bigendian<uint32_t>(f, len), "failed to read chunk len" );
	if(len > opts.maxChunkLength)
		return Return(RK_BadChunk, "chunk len " + std::to_string(len) + " exceeds the maximum");

	char type[4];
	ASSERT_EXT( fread_bytes(f, type), "failed to read chunk type" );

	// the chunk is only touched once everything is read, so a failed read leaves no half record
	std::string data;
	ASSERT_EXT( fread_string(f, data, len), "failed to read chunk data" );

	uint32_t crc;
	ASSERT_EXT( fread_bigendian<uint32_t>(f, crc), "failed to read chunk crc" );

	chunk.length = len;
	chunk.type = std::string(type, sizeof(type));
	chunk.data.swap(data);
	chunk.crc = crc;

	if(opts.verifyCrc && !chunk.crcMatches())
		return Return(RK_BadChunk, "CRC does not match in chunk " + chunk.type);

	return true;
}

Return png_encode_chunk(std::string& out, const std::string& type, const std::string& data) {
	if(type.size() != 4) return Return(RK_BadChunk, "chunk type size is invalid");
	if((uint64_t)data.size() > (uint64_t)0xFFFFFFFFu)
		return Return(RK_BadChunk, "chunk data too big");
	out = rawString<uint32_t>((uint32_t)data.size());
	out += type;
	out += data;
	out += rawString<uint32_t>(calc_crc(type, data));
	return true;
}

Return png_write_chunk(WriteCallbackIntf* w, const PngChunk& chunk) {
	std::string raw;
	ASSERT( png_encode_chunk(raw, chunk.type, chunk.data) );
	ASSERT_EXT( w->write(raw), "failed to write chunk " + chunk.type );
	return true;
}

static Return __PngChunkStream_atEof(PngChunkStream& s, bool& eof) {
	int c = fgetc(s.file);
	if(c == EOF) {
		if(ferror(s.file)) return Return(RK_Io, "file-read-error");
		eof = true;
		return true;
	}
	if(ungetc(c, s.file) == EOF) return Return(RK_Io, "ungetc failed");
	eof = false;
	return true;
}

static Return __PngChunkStream_next(PngChunkStream& s, PngStreamRecord& rec) {
	if(!s.hasReadSig) {
		std::string sig;
		ASSERT( png_read_sig(s.file, &sig) );
		s.hasReadSig = true;
		rec.kind = PngStreamRecord::Signature;
		rec.signature = sig;
		rec.chunk = PngChunk();
		return true;
	}

	ASSERT( png_read_chunk(s.file, rec.chunk, s.options) );
	rec.kind = PngStreamRecord::Chunk;
	rec.signature = "";
	if(rec.chunk.type == "IEND")
		s.gotEndChunk = true;
	return true;
}

// Every successful call yields one record. Afterwards, operator bool tells whether there is another one.
Return PngChunkStream::next(PngStreamRecord& rec) {
	if(hasFinished) {
		if(!lastError) return lastError;
		return "cannot read more: finished already";
	}

	Return r = __PngChunkStream_next(*this, rec);
	if(r && !gotEndChunk && options.allowMissingEnd)
		r = __PngChunkStream_atEof(*this, gotEof);
	if(!r) {
		lastError = r;
		hasFinished = true;
		return r;
	}

	++recordCount;
	if(gotEndChunk || gotEof) hasFinished = true;
	return true;
}
