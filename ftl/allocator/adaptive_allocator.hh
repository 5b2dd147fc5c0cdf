// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FTL_ALLOCATOR_ADAPTIVE_ALLOCATOR_HH__
#define __FTLSIM_FTL_ALLOCATOR_ADAPTIVE_ALLOCATOR_HH__

#include "ftl/allocator/abstract_allocator.hh"
#include "ftl/allocator/weight_controller.hh"

namespace FTLSim::FTL::BlockAllocator {

/**
 * \brief Adaptive allocator
 *
 * Allocates from lowest-indexed block with free page. Victim is selected by
 * weighted score, and weights are tuned by WeightController every
 * AdaptationInterval host writes.
 */
class AdaptiveAllocator : public AbstractAllocator {
 protected:
  WeightController controller;

  const uint64_t adaptationInterval;

  Log::DebugID getDebugID() const noexcept override {
    return Log::DebugID::FTL_AdaptiveAllocator;
  }

 public:
  AdaptiveAllocator(ObjectData &, FTLObjectData &);

  Response allocatePage(PhysicalAddress &,
                        FIL::PBN = FIL::InvalidPBN) override;

  void notifyHostWrite(uint64_t) override;

  inline const WeightController &getController() const { return controller; }

  void getStatList(std::vector<Stat> &, std::string) noexcept override;
  void getStatValues(std::vector<double> &) noexcept override;
};

}  // namespace FTLSim::FTL::BlockAllocator

#endif
