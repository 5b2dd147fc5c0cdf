// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FIL_DEF_HH__
#define __FTLSIM_FIL_DEF_HH__

#include <cinttypes>
#include <limits>

#include "sim/object.hh"
#include "sim/types.hh"

namespace FTLSim::FIL {

//! Physical block index
using PBN = uint32_t;
const PBN InvalidPBN = std::numeric_limits<PBN>::max();

enum class PageState : uint8_t {
  Free,
  Valid,
  Invalid,
};

//! One flash page. lpn is kept after invalidation.
struct Page {
  PageState state;
  LPN lpn;

  Page() : state(PageState::Free), lpn(InvalidLPN) {}
};

}  // namespace FTLSim::FIL

#endif
