/**
 * @file debug.hpp
 * @brief Stream-style diagnostic logging for the fountain core
 *
 * Output is compiled in only when FOUNTAIN_ENABLE_DEBUG is non-zero (the
 * CMake option of the same name sets it). Messages at or below
 * CURRENT_DEBUG_LEVEL are written to std::cout.
 */

#pragma once

#include <iostream>

#ifndef FOUNTAIN_ENABLE_DEBUG
#define FOUNTAIN_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

#ifndef CURRENT_DEBUG_LEVEL
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (FOUNTAIN_ENABLE_DEBUG && (level) <= CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)
