/* APNG replay count rewriting
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#ifndef __AZ__APNGLOOP_H__
#define __AZ__APNGLOOP_H__

#include "Png.h"
#include "Utils.h"

#include <cstdio>
#include <string>
#include <stdint.h>

// acTL, see https://wiki.mozilla.org/APNG_Specification#.60acTL.60:_The_Animation_Control_Chunk
struct ApngAnimControl {
	static const size_t SIZE = 8;
	uint32_t numFrames;
	uint32_t numPlays; // 0 = forever

	ApngAnimControl(uint32_t frames = 0, uint32_t plays = 0) : numFrames(frames), numPlays(plays) {}
	Return parse(const std::string& data);
	std::string serialized() const;
};

/* Copies the PNG from in to out and sets numPlays in every acTL chunk.
 * Everything else is passed through byte by byte.
 * Output is written while reading; on error, what was written so far stays.
 * No acTL or more than one acTL only results in a warning.
 */
Return apng_set_num_plays(FILE* in, WriteCallbackIntf* out, uint32_t numPlays,
						  /*out*/ size_t& matchCount,
						  WarningCallbackIntf* warnings = NULL,
						  const PngChunkStreamOptions& opts = PngChunkStreamOptions());

#endif
