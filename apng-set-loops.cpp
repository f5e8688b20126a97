/* tool to set the number of plays of an APNG
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#include "ApngLoop.h"
#include "FileUtils.h"

#include <cstdio>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
using namespace std;

static void usage(const char* prog) {
	cerr << "usage: " << prog << " [-n plays] [-i in.png] [-o out.png] [--strict]" << endl;
	cerr << "  -n plays   number of plays, 0 means forever (default: 0)" << endl;
	cerr << "  -i, -o     input/output file, '-' or nothing means stdin/stdout" << endl;
	cerr << "  --strict   fail on CRC mismatches" << endl;
}

static bool parseNumPlays(const char* s, uint32_t& numPlays) {
	char* end = NULL;
	errno = 0;
	unsigned long long v = strtoull(s, &end, 10);
	if(end == s || *end != '\0' || errno != 0 || s[0] == '-' || v > 0xFFFFFFFFull)
		return false;
	numPlays = (uint32_t)v;
	return true;
}

Return _main(const std::string& inFn, const std::string& outFn, uint32_t numPlays, const PngChunkStreamOptions& opts) {
	ScopedFile in, out;
	ASSERT( in.openOrStd(inFn, "rb", stdin) );
	ASSERT( out.openOrStd(outFn, "wb", stdout) );

	FileWriteCallback writer(out);
	CerrWarningCallback warnings;
	size_t matchCount = 0;
	ASSERT( apng_set_num_plays(in, &writer, numPlays, matchCount, &warnings, opts) );

	ASSERT( out.close() );
	ASSERT( in.close() );
	cerr << "rewrote " << matchCount << " acTL chunk(s)" << endl;
	return true;
}

int main(int argc, char** argv) {
	std::string inFn, outFn;
	uint32_t numPlays = 0;
	PngChunkStreamOptions opts;

	for(int i = 1; i < argc; ++i) {
		std::string arg = argv[i];
		if(arg == "-h" || arg == "--help") {
			usage(argv[0]);
			return 0;
		}
		else if(arg == "--strict")
			opts.verifyCrc = true;
		else if((arg == "-n" || arg == "-i" || arg == "-o") && i + 1 < argc) {
			const char* val = argv[++i];
			if(arg == "-i") inFn = val;
			else if(arg == "-o") outFn = val;
			else if(!parseNumPlays(val, numPlays)) {
				cerr << "error: invalid number of plays: " << val << endl;
				return 1;
			}
		}
		else {
			usage(argv[0]);
			return 1;
		}
	}

	Return r = _main(inFn, outFn, numPlays, opts);
	if(!r) {
		cerr << "error: " << r.errmsg << endl;
		return r.exitCode();
	}
	
	return 0;
}
