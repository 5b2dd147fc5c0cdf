// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "ftl/allocator/adaptive_allocator.hh"

#include "fil/device.hh"
#include "ftl/metrics.hh"

namespace FTLSim::FTL::BlockAllocator {

AdaptiveAllocator::AdaptiveAllocator(ObjectData &o, FTLObjectData &fo)
    : AbstractAllocator(o, fo),
      controller(
          readConfigRatio(Section::FlashTranslation, Config::Key::TargetWAF),
          readConfigRatio(Section::FlashTranslation,
                          Config::Key::TargetVariance),
          readConfigRatio(Section::FlashTranslation, Config::Key::EmergencyWAF),
          readConfigRatio(Section::FlashTranslation,
                          Config::Key::SmoothingFactor)),
      adaptationInterval(readConfigUint(Section::FlashTranslation,
                                        Config::Key::AdaptationInterval)) {
  panic_if(adaptationInterval == 0, "AdaptationInterval must be non-zero.");

  method = VictimSelectionFactory::createVictimSelectionAlgorithm(
      this, VictimSelectionID::WeightedScore, &controller);

  panic_if(!method, "Failed to create victim selection algorithm.");
}

Response AdaptiveAllocator::allocatePage(PhysicalAddress &addr,
                                         FIL::PBN exclude) {
  auto pDevice = ftlobject.pDevice;

  for (FIL::PBN i = 0; i < pDevice->getBlockCount(); i++) {
    auto &block = pDevice->getBlock(i);

    if (i != exclude && !block.isFull()) {
      addr = PhysicalAddress(i, block.getNextWritePageIndex());

      return Response::Success;
    }
  }

  return Response::AllocationExhausted;
}

void AdaptiveAllocator::notifyHostWrite(uint64_t hostWrites) {
  if (hostWrites == 0 || hostWrites % adaptationInterval != 0) {
    return;
  }

  double waf = calculateWAF(*ftlobject.pCounters);
  double variance = calculateWearVariance(*ftlobject.pDevice);

  controller.update(waf, variance);

  auto &weights = controller.getWeights();

  debugprint(getDebugID(),
             "Adapt   | WAF %.3f (avg %.3f) | Var %.3f (avg %.3f) | alpha %.2f "
             "beta %.2f gamma %.2f",
             waf, controller.getWAFAverage(), variance,
             controller.getVarianceAverage(), weights.alpha, weights.beta,
             weights.gamma);
}

void AdaptiveAllocator::getStatList(std::vector<Stat> &list,
                                    std::string prefix) noexcept {
  AbstractAllocator::getStatList(list, prefix);

  list.emplace_back(prefix + "adaptive.alpha", "Efficiency weight");
  list.emplace_back(prefix + "adaptive.beta", "Wear leveling weight");
  list.emplace_back(prefix + "adaptive.gamma", "Migration cost weight");
  list.emplace_back(prefix + "adaptive.waf_average", "Moving average of WAF");
  list.emplace_back(prefix + "adaptive.variance_average",
                    "Moving average of wear variance");
  list.emplace_back(prefix + "adaptive.rounds", "Weight adaptation rounds");
  list.emplace_back(prefix + "adaptive.emergency",
                    "Rounds with emergency weight profile");
}

void AdaptiveAllocator::getStatValues(std::vector<double> &values) noexcept {
  AbstractAllocator::getStatValues(values);

  auto &weights = controller.getWeights();

  values.push_back(weights.alpha);
  values.push_back(weights.beta);
  values.push_back(weights.gamma);
  values.push_back(controller.getWAFAverage());
  values.push_back(controller.getVarianceAverage());
  values.push_back((double)controller.getRoundCount());
  values.push_back((double)controller.getEmergencyCount());
}

}  // namespace FTLSim::FTL::BlockAllocator
