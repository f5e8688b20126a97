/* calculate CRC
 * by Albert Zeyer, 2011
 * code public domain
 */

#include "Crc.h"
#include <zlib.h>
#include <climits>

// zlib's crc32 is the same CRC-32 (ISO-HDLC) that PNG uses.
// It takes uInt lengths, so feed it in pieces.
uint32_t update_crc(uint32_t crc, const char *buf, size_t len) {
	uLong c = crc;
	while(len > 0) {
		uInt n = (len > UINT_MAX) ? UINT_MAX : (uInt)len;
		c = crc32(c, (const Bytef*) buf, n);
		buf += n;
		len -= n;
	}
	return (uint32_t) c;
}

uint32_t calc_crc(const char *buf, size_t len) {
	return update_crc((uint32_t) crc32(0L, Z_NULL, 0), buf, len);
}

uint32_t calc_crc(const std::string& s) {
	return calc_crc(s.data(), s.size());
}

uint32_t calc_crc(const std::string& s1, const std::string& s2) {
	return update_crc(calc_crc(s1), s2.data(), s2.size());
}
