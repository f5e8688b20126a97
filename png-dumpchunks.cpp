/* lists the chunks of a PNG
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#include "Png.h"
#include "FileUtils.h"
#include "StringUtils.h"

#include <cstdio>
#include <iostream>
using namespace std;

Return _main(const std::string& filename) {
	ScopedFile f;
	ASSERT( f.openOrStd(filename, "rb", stdin) );

	PngChunkStream stream(f);
	PngStreamRecord rec;
	while(stream) {
		ASSERT( stream.next(rec) );
		if(rec.isSignature()) {
			cout << "* signature: OK" << endl;
			continue;
		}
		const PngChunk& chunk = rec.chunk;
		cout << "* chunk: " << chunk.type << ", len=" << chunk.length
			<< ", crc=" << hexString(chunk.crc)
			<< (chunk.crcMatches() ? "" : " (mismatch, computed " + hexString(chunk.computedCrc()) + ")")
			<< endl;
	}

	ASSERT( f.close() );
	return true;
}

int main(int argc, char** argv) {
	if(argc <= 1) {
		cerr << "please give me a filename" << endl;
		return 1;
	}
	
	Return r = _main(argv[1]);
	if(!r) {
		cerr << "error: " << r.errmsg << endl;
		return r.exitCode();
	}
	
	return 0;
}
