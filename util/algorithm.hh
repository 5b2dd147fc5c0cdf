// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_UTIL_ALGORITHM_HH__
#define __FTLSIM_UTIL_ALGORITHM_HH__

#include <cinttypes>
#include <climits>
#include <cmath>

#ifdef _MSC_VER

#define LIKELY
#define UNLIKELY

#else

#define LIKELY(x) __builtin_expect(!!(x), 1)
#define UNLIKELY(x) __builtin_expect(!!(x), 0)

#endif

#ifndef MIN
#define MIN(x, y) ((x) > (y) ? (y) : (x))
#endif

#ifndef MAX
#define MAX(x, y) ((x) > (y) ? (x) : (y))
#endif

#define CLAMP(v, lo, hi) MIN(MAX(v, lo), hi)

#endif
