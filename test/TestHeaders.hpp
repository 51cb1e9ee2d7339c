#ifndef __LD_TEST_HEADERS__
#define __LD_TEST_HEADERS__

#include "Headers.hpp"
#include "catch2/catch.hpp"

#endif  // __LD_TEST_HEADERS__
