/**
 * @file test_main.cpp
 * @brief doctest runner for host tests
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
