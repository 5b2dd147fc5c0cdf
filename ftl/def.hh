// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FTL_DEF_HH__
#define __FTLSIM_FTL_DEF_HH__

#include <cinttypes>

#include "fil/def.hh"

namespace FTLSim::FTL {

//! Location of one flash page
struct PhysicalAddress {
  FIL::PBN blockID;
  uint32_t pageIndex;

  PhysicalAddress() : blockID(FIL::InvalidPBN), pageIndex(0) {}
  PhysicalAddress(FIL::PBN b, uint32_t p) : blockID(b), pageIndex(p) {}

  inline bool isValid() const { return blockID != FIL::InvalidPBN; }

  inline bool operator==(const PhysicalAddress &rhs) const {
    return blockID == rhs.blockID && pageIndex == rhs.pageIndex;
  }
  inline bool operator!=(const PhysicalAddress &rhs) const {
    return !(*this == rhs);
  }
};

/**
 * \brief Counters of one simulation run
 *
 * Owned by FTL write path. physicalWrites includes pages copied by GC.
 */
struct RunCounters {
  uint64_t hostWrites;
  uint64_t physicalWrites;
  uint64_t gcInvocations;

  RunCounters() : hostWrites(0), physicalWrites(0), gcInvocations(0) {}
};

}  // namespace FTLSim::FTL

#endif
