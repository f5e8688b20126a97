/* PNG chunk stream
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#ifndef __AZ__PNG_H__
#define __AZ__PNG_H__

#include "Return.h"
#include "Utils.h"

#include <string>
#include <cstdio>
#include <stdint.h>

#ifndef PngMaxChunkLength
#define PngMaxChunkLength 0x7FFFFFFFu /* 2^31-1, see http://www.w3.org/TR/PNG/#5Chunk-layout */
#endif

extern const char PNGSIG[8];
std::string png_sig();

struct PngChunk {
	uint32_t length; // as on the wire; always == data.size()
	std::string type;
	std::string data;
	uint32_t crc; // as on the wire

	PngChunk() : length(0), crc(0) {}
	PngChunk(const std::string& t, const std::string& d);
	uint32_t computedCrc() const;
	bool crcMatches() const { return crc == computedCrc(); }
	// exactly the bytes we have read, i.e. with the original CRC
	std::string rawBytes() const;
};

// What PngChunkStream yields: first the bare signature, then chunks.
struct PngStreamRecord {
	enum Kind { Signature, Chunk };
	Kind kind;
	std::string signature;
	PngChunk chunk;

	PngStreamRecord() : kind(Signature) {}
	bool isSignature() const { return kind == Signature; }
	bool isChunk() const { return kind == Chunk; }
	std::string rawBytes() const;
};

struct PngChunkStreamOptions {
	bool verifyCrc; // CRC mismatch becomes RK_BadChunk
	bool allowMissingEnd; // EOF right at a chunk boundary ends the stream
	uint32_t maxChunkLength;
	PngChunkStreamOptions()
	: verifyCrc(false), allowMissingEnd(false), maxChunkLength(PngMaxChunkLength) {}
};

Return png_read_sig(FILE* f, std::string* sig = NULL);
Return png_write_sig(WriteCallbackIntf* w);
Return png_read_chunk(FILE* f, PngChunk& chunk, const PngChunkStreamOptions& opts = PngChunkStreamOptions());
// length || type || data || crc(type || data)
Return png_encode_chunk(/*out*/ std::string& out, const std::string& type, const std::string& data);
// writes a freshly encoded chunk (CRC recomputed)
Return png_write_chunk(WriteCallbackIntf* w, const PngChunk& chunk);

/* Lazy reader over a PNG stream. Not restartable; create a new one for a new pass.
 * Stops after IEND without touching anything behind it.
 */
struct PngChunkStream : DontCopyTag {
	FILE* file;
	PngChunkStreamOptions options;
	bool hasReadSig, gotEndChunk, gotEof, hasFinished;
	size_t recordCount;
	Return lastError;

	PngChunkStream(FILE* f, const PngChunkStreamOptions& opts = PngChunkStreamOptions())
	: file(f), options(opts), hasReadSig(false), gotEndChunk(false), gotEof(false), hasFinished(false),
	recordCount(0) {}
	Return next(/*out*/ PngStreamRecord& rec);
	operator bool() const { return !hasFinished; }
};

#endif
