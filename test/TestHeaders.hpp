#ifndef __FJ_TEST_HEADERS__
#define __FJ_TEST_HEADERS__

#include "Headers.hpp"
#include "catch2/catch.hpp"

#endif  // __FJ_TEST_HEADERS__
