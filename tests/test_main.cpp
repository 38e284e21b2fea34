// tests/test_main.cpp
//
// The only translation unit of mazerl_tests that provides the doctest
// implementation and main().
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
