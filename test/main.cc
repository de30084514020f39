//
// Main entry point for the doctest test runner.
// Test cases live in the test_*.cc files of the subdirectories and register
// themselves at static initialization time.
//

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>
