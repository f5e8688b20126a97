/* split a PNG into one file per chunk
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#ifndef __AZ__PNGSPLIT_H__
#define __AZ__PNGSPLIT_H__

#include "Png.h"

#include <cstdio>
#include <string>

// 0000.sig, 0001-IHDR.chunk, ...
std::string png_split_filename(size_t index, const PngStreamRecord& rec);

/* destDir must not exist (then it is created) or must be an empty dir.
 * That is checked before anything is read from in (RK_Resource otherwise).
 */
Return png_split_chunks(FILE* in, const std::string& destDir,
						/*out*/ size_t& fileCount,
						const PngChunkStreamOptions& opts = PngChunkStreamOptions());

#endif
