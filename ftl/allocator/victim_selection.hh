// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FTL_ALLOCATOR_VICTIM_SELECTION_HH__
#define __FTLSIM_FTL_ALLOCATOR_VICTIM_SELECTION_HH__

#include "fil/block.hh"
#include "ftl/allocator/weight_controller.hh"
#include "ftl/object.hh"

namespace FTLSim::FTL::BlockAllocator {

class AbstractAllocator;

class AbstractVictimSelection {
 protected:
  AbstractAllocator *pAllocator;

 public:
  AbstractVictimSelection(AbstractAllocator *);
  virtual ~AbstractVictimSelection();

  /**
   * \brief Select victim block
   *
   * Only blocks with at least one invalid page are eligible. Ties are broken
   * by lowest block index.
   *
   * \return Victim block index, FIL::InvalidPBN if no block is eligible.
   */
  virtual FIL::PBN getVictim() noexcept = 0;
};

enum class VictimSelectionID {
  Greedy,         // Select block with a largest number of invalid pages.
  WeightedScore,  // Select block with highest efficiency/wear/cost score.
};

/**
 * \brief Score of block in weighted victim selection
 *
 * score = alpha * invalid ratio - gamma * valid ratio
 *         + beta * (1 - erase count / max erase count)
 *
 * \param[in] block          Candidate block
 * \param[in] maxEraseCount  Largest erase count in device, at least 1
 * \param[in] weights        Current weights
 */
double getBlockScore(const FIL::Block &block, uint32_t maxEraseCount,
                     const Weights &weights);

class VictimSelectionFactory {
 public:
  static AbstractVictimSelection *createVictimSelectionAlgorithm(
      AbstractAllocator *pAllocator, VictimSelectionID id,
      const WeightController *pController = nullptr);
};

}  // namespace FTLSim::FTL::BlockAllocator

#endif
