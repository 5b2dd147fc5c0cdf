// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "ftl/allocator/victim_selection.hh"

#include <limits>

#include "fil/device.hh"
#include "ftl/allocator/abstract_allocator.hh"

namespace FTLSim::FTL::BlockAllocator {

AbstractVictimSelection::AbstractVictimSelection(AbstractAllocator *p)
    : pAllocator(p) {}

AbstractVictimSelection::~AbstractVictimSelection() {}

double getBlockScore(const FIL::Block &block, uint32_t maxEraseCount,
                     const Weights &weights) {
  const double capacity = block.getPageCount();
  const double efficiency = block.getInvalidPageCount() / capacity;
  const double migrationCost = block.getValidPageCount() / capacity;
  const double wearScore =
      1. - (double)block.getEraseCount() / MAX(maxEraseCount, 1u);

  return weights.alpha * efficiency - weights.gamma * migrationCost +
         weights.beta * wearScore;
}

class GreedyVictimSelection : public AbstractVictimSelection {
 public:
  GreedyVictimSelection(AbstractAllocator *p) : AbstractVictimSelection(p) {}

  FIL::PBN getVictim() noexcept override {
    auto pDevice = pAllocator->getDevice();
    auto active = pAllocator->getActiveBlock();
    uint32_t max = 0;
    FIL::PBN victim = FIL::InvalidPBN;

    for (FIL::PBN i = 0; i < pDevice->getBlockCount(); i++) {
      auto &block = pDevice->getBlock(i);

      // Block being filled is not a candidate
      if (i == active && block.getFreePageCount() > 0) {
        continue;
      }

      if (block.getInvalidPageCount() > max) {
        max = block.getInvalidPageCount();
        victim = i;
      }
    }

    return victim;
  }
};

class WeightedScoreVictimSelection : public AbstractVictimSelection {
 protected:
  const WeightController *pController;

 public:
  WeightedScoreVictimSelection(AbstractAllocator *p,
                               const WeightController *c)
      : AbstractVictimSelection(p), pController(c) {}

  FIL::PBN getVictim() noexcept override {
    auto pDevice = pAllocator->getDevice();
    auto &weights = pController->getWeights();
    auto maxErase = pDevice->getMaxEraseCount();
    double max = -std::numeric_limits<double>::infinity();
    FIL::PBN victim = FIL::InvalidPBN;

    for (FIL::PBN i = 0; i < pDevice->getBlockCount(); i++) {
      auto &block = pDevice->getBlock(i);

      if (block.getInvalidPageCount() == 0) {
        continue;
      }

      auto score = getBlockScore(block, maxErase, weights);

      if (score > max) {
        max = score;
        victim = i;
      }
    }

    return victim;
  }
};

AbstractVictimSelection *VictimSelectionFactory::createVictimSelectionAlgorithm(
    AbstractAllocator *pAllocator, VictimSelectionID id,
    const WeightController *pController) {
  switch (id) {
    case VictimSelectionID::Greedy:
      return new GreedyVictimSelection(pAllocator);
    case VictimSelectionID::WeightedScore:
      if (pController) {
        return new WeightedScoreVictimSelection(pAllocator, pController);
      }

      break;
  }

  return nullptr;
}

}  // namespace FTLSim::FTL::BlockAllocator
