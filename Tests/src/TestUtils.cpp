/**
 * @file TestUtils.cpp
 * @brief Storage for the counters shared by every test suite
 */

#include "TestUtils.h"

namespace TestGlobals {
    int g_testsRun = 0;
    int g_testsPassed = 0;
    int g_testsFailed = 0;
}
