// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FTL_ALLOCATOR_BASELINE_ALLOCATOR_HH__
#define __FTLSIM_FTL_ALLOCATOR_BASELINE_ALLOCATOR_HH__

#include "ftl/allocator/abstract_allocator.hh"

namespace FTLSim::FTL::BlockAllocator {

/**
 * \brief Baseline allocator
 *
 * Fills blocks in round-robin order starting from a persistent cursor, and
 * reclaims the block with most invalid pages.
 */
class BaselineAllocator : public AbstractAllocator {
 protected:
  FIL::PBN cursor;

  Log::DebugID getDebugID() const noexcept override {
    return Log::DebugID::FTL_BaselineAllocator;
  }

 public:
  BaselineAllocator(ObjectData &, FTLObjectData &);

  Response allocatePage(PhysicalAddress &,
                        FIL::PBN = FIL::InvalidPBN) override;

  FIL::PBN getActiveBlock() const noexcept override;
};

}  // namespace FTLSim::FTL::BlockAllocator

#endif
