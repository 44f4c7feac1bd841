/*
 * File: core/debug.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */


#pragma once

#include "tslab/core/assert.hpp"

#ifdef TSLAB_ENABLE_PRIVATE_TESTS
#define TSLAB_PRIVATE_TESTABLE public
#else
#define TSLAB_PRIVATE_TESTABLE private
#endif
