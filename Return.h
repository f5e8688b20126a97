/* Return value class
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#ifndef __AZ__RETURN_H__
#define __AZ__RETURN_H__

#include <string>

enum ReturnKind {
	RK_Ok = 0,
	RK_Error,        // unclassified
	RK_BadSignature, // input is not a PNG at all
	RK_Truncated,    // premature end of stream
	RK_BadChunk,     // structurally invalid chunk
	RK_Resource,     // precondition / environment (open, create dir, ...)
	RK_Io            // read/write error
};

struct Return {
	bool success;
	ReturnKind kind;
	std::string errmsg;

	Return(bool s = true) : success(s), kind(s ? RK_Ok : RK_Error) {}
	Return(const char* errm) : success(false), kind(RK_Error), errmsg(errm) {}
	Return(const std::string& errm) : success(false), kind(RK_Error), errmsg(errm) {}
	Return(ReturnKind k, const std::string& errm) : success(false), kind(k), errmsg(errm) {}
	Return(const Return& r, const std::string& extmsg) : success(false), kind(r.kind) {
		if(r) { errmsg = extmsg; kind = RK_Error; }
		else errmsg = extmsg + ": " + r.errmsg;
	}
	operator bool() const { return success; }

	bool isFormatError() const {
		return kind == RK_BadSignature || kind == RK_Truncated || kind == RK_BadChunk;
	}

	// for main(): 0 ok, 1 malformed input, 2 anything else (resource, io, ...)
	int exitCode() const {
		if(success) return 0;
		return isFormatError() ? 1 : 2;
	}
};

#define ASSERT(x) { Return ___r = (x); if(!___r) return ___r; }
#define ASSERT_EXT(x, msg) { Return ___r = (x); if(!___r) return Return(___r, msg); }

#endif
