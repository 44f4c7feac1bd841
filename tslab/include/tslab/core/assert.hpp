/*
 * File: core/assert.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */


#pragma once

#ifndef TSLAB_ASSERT
#include <cassert>
#define TSLAB_ASSERT(cond, msg) do { static_cast<void>(msg); assert(cond); } while(0)
#endif
