/* String utils
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#ifndef __AZ__STRINGUTILS_H__
#define __AZ__STRINGUTILS_H__

#include <string>
#include <cstddef>
#include <stdint.h>

std::string hexString(char c);
std::string hexString(const std::string& rawData);
std::string hexString(uint32_t v);

// big endian raw representation, as used everywhere in PNG
template<typename T>
std::string rawString(T val) {
	std::string ret(sizeof(T), '\0');
	for(size_t i = 0; i < sizeof(T); ++i)
		ret[sizeof(T) - i - 1] = (char)(unsigned char)(val >> (8 * i));
	return ret;
}

template<typename T>
T valueFromRaw(const char* s) {
	T val = 0;
	for(size_t i = 0; i < sizeof(T); ++i)
		val = (T)((val << 8) | (unsigned char)s[i]);
	return val;
}

// keeps [A-Za-z0-9], everything else becomes '_'
std::string sanitizedFilename(const std::string& s);

#endif
