/* some small utils
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#include "Utils.h"

#include <iostream>
using namespace std;

void CerrWarningCallback::warning(const std::string& msg) {
	cerr << "warning: " << msg << endl;
}
