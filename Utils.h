/* some small utils
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#ifndef __AZ__UTILS_H__
#define __AZ__UTILS_H__

#include "Return.h"
#include <cstddef>
#include <string>

struct DontCopyTag {
	DontCopyTag() {}
private:
	DontCopyTag(const DontCopyTag&);
	DontCopyTag& operator=(const DontCopyTag&);
};

struct WriteCallbackIntf {
	virtual ~WriteCallbackIntf() {}
	virtual Return write(const char* data, size_t s) = 0;
	Return write(const std::string& data) { return write(data.data(), data.size()); }
};

struct StringWriteCallback : WriteCallbackIntf {
	std::string data;
	using WriteCallbackIntf::write;
	Return write(const char* d, size_t s) { data.append(d, s); return true; }
};

// Side channel for non-fatal conditions. Never aborts anything.
struct WarningCallbackIntf {
	virtual ~WarningCallbackIntf() {}
	virtual void warning(const std::string& msg) = 0;
};

struct CerrWarningCallback : WarningCallbackIntf {
	void warning(const std::string& msg);
};

#endif
