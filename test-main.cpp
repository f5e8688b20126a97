/* test runner
 * by Albert Zeyer, 2011
 * code under LGPL
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
