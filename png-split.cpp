/* tool to split a PNG into one file per chunk
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#include "PngSplit.h"
#include "FileUtils.h"

#include <cstdio>
#include <iostream>
using namespace std;

Return _main(const std::string& filename, const std::string& destDir) {
	ScopedFile f;
	ASSERT( f.openOrStd(filename, "rb", stdin) );

	size_t fileCount = 0;
	ASSERT( png_split_chunks(f, destDir, fileCount) );
	ASSERT( f.close() );

	cout << "wrote " << fileCount << " files to " << destDir << endl;
	return true;
}

int main(int argc, char** argv) {
	if(argc <= 2) {
		cerr << "usage: " << argv[0] << " <file.png|-> <destdir>" << endl;
		return 1;
	}
	
	Return r = _main(argv[1], argv[2]);
	if(!r) {
		cerr << "error: " << r.errmsg << endl;
		return r.exitCode();
	}
	
	return 0;
}
