/* String utils
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#include "StringUtils.h"
#include <cstdio>

std::string hexString(char c) {
	char buf[3];
	sprintf(buf, "%02X", (int)(unsigned char)c);
	return buf;
}

std::string hexString(const std::string& rawData) {
	std::string ret;
	for(size_t i = 0; i < rawData.size(); ++i)
		ret += hexString(rawData[i]);
	return ret;
}

std::string hexString(uint32_t v) {
	return hexString(rawString<uint32_t>(v));
}

std::string sanitizedFilename(const std::string& s) {
	std::string ret(s);
	for(size_t i = 0; i < ret.size(); ++i) {
		char c = ret[i];
		bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
		if(!ok) ret[i] = '_';
	}
	return ret;
}
