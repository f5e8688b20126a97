/* APNG replay count rewriting
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#include "ApngLoop.h"
#include "StringUtils.h"

#include <sstream>

const size_t ApngAnimControl::SIZE;

Return ApngAnimControl::parse(const std::string& data) {
	if(data.size() != SIZE)
		return Return(RK_BadChunk, "acTL size is invalid");
	numFrames = valueFromRaw<uint32_t>(&data[0]);
	numPlays = valueFromRaw<uint32_t>(&data[4]);
	return true;
}

std::string ApngAnimControl::serialized() const {
	return rawString<uint32_t>(numFrames) + rawString<uint32_t>(numPlays);
}

static Return __rewriteAnimControl(WriteCallbackIntf* out, const PngChunk& chunk, uint32_t numPlays) {
	ApngAnimControl actl;
	ASSERT( actl.parse(chunk.data) );
	actl.numPlays = numPlays;
	ASSERT( png_write_chunk(out, PngChunk(chunk.type, actl.serialized())) );
	return true;
}

Return apng_set_num_plays(FILE* in, WriteCallbackIntf* out, uint32_t numPlays,
						  size_t& matchCount, WarningCallbackIntf* warnings,
						  const PngChunkStreamOptions& opts) {
	matchCount = 0;
	PngChunkStream stream(in, opts);
	PngStreamRecord rec;
	while(stream) {
		ASSERT( stream.next(rec) );
		if(rec.isChunk() && rec.chunk.type == "acTL") {
			++matchCount;
			ASSERT_EXT( __rewriteAnimControl(out, rec.chunk, numPlays), "acTL #" + std::to_string(matchCount) );
		}
		else
			ASSERT_EXT( out->write(rec.rawBytes()), "failed to write record" );
	}

	if(warnings) {
		if(matchCount == 0)
			warnings->warning("no acTL chunk found, this is not an animated PNG");
		else if(matchCount > 1) {
			std::ostringstream msg;
			msg << "found " << matchCount << " acTL chunks but at most one is allowed;"
				<< " the PNG is non-conformant and the output might not be valid";
			warnings->warning(msg.str());
		}
	}
	return true;
}
