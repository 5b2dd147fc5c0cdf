// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "ftl/allocator/weight_controller.hh"

#include "util/algorithm.hh"

namespace FTLSim::FTL::BlockAllocator {

WeightController::WeightController()
    : WeightController(4.0, 20.0, 6.0, 0.1) {}

WeightController::WeightController(double waf, double var, double emergency,
                                   double smoothing)
    : wafAverage(1.),
      varianceAverage(0.),
      targetWAF(waf),
      targetVariance(var),
      emergencyWAF(emergency),
      smoothingFactor(smoothing),
      rounds(0),
      emergencies(0) {}

void WeightController::update(double waf, double variance) {
  rounds++;

  wafAverage = (1. - smoothingFactor) * wafAverage + smoothingFactor * waf;
  varianceAverage =
      (1. - smoothingFactor) * varianceAverage + smoothingFactor * variance;

  if (wafAverage > emergencyWAF) {
    emergencies++;

    weights = Weights(EmergencyAlpha, EmergencyBeta, EmergencyGamma);

    return;
  }

  // Both adjustments may apply in same round
  if (wafAverage > targetWAF) {
    weights.alpha += Step;
    weights.gamma += Step;
    weights.beta -= Penalty;
  }

  if (varianceAverage > targetVariance) {
    weights.beta += Step;
    weights.alpha -= Penalty;
  }

  weights.alpha = CLAMP(weights.alpha, MinWeight, MaxWeight);
  weights.beta = CLAMP(weights.beta, MinWeight, MaxWeight);
  weights.gamma = CLAMP(weights.gamma, MinWeight, MaxWeight);
}

}  // namespace FTLSim::FTL::BlockAllocator
