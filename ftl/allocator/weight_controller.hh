// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FTL_ALLOCATOR_WEIGHT_CONTROLLER_HH__
#define __FTLSIM_FTL_ALLOCATOR_WEIGHT_CONTROLLER_HH__

#include <cinttypes>

namespace FTLSim::FTL::BlockAllocator {

//! Victim scoring weights
struct Weights {
  double alpha;  //!< Reclaim efficiency
  double beta;   //!< Wear leveling
  double gamma;  //!< Migration cost

  Weights() : alpha(1.), beta(1.), gamma(1.) {}
  Weights(double a, double b, double g) : alpha(a), beta(b), gamma(g) {}
};

/**
 * \brief Feedback controller of victim scoring weights
 *
 * Keeps exponential moving averages of WAF and wear variance and nudges the
 * weights toward lower write amplification or better wear leveling. When the
 * WAF average exceeds emergency level, weights are reset to a fixed
 * migration-averse profile. Weights always stay in [MinWeight, MaxWeight].
 */
class WeightController {
 public:
  static constexpr double MinWeight = 0.1;
  static constexpr double MaxWeight = 2.0;
  static constexpr double Step = 0.05;
  static constexpr double Penalty = 0.01;

  static constexpr double EmergencyAlpha = 1.5;
  static constexpr double EmergencyBeta = 0.5;
  static constexpr double EmergencyGamma = 1.5;

 private:
  Weights weights;

  double wafAverage;
  double varianceAverage;

  double targetWAF;
  double targetVariance;
  double emergencyWAF;
  double smoothingFactor;

  uint64_t rounds;
  uint64_t emergencies;

 public:
  WeightController();
  WeightController(double, double, double, double);

  /**
   * \brief Run one adaptation round
   *
   * \param[in] waf       Current write amplification factor
   * \param[in] variance  Current wear variance
   */
  void update(double waf, double variance);

  inline const Weights &getWeights() const { return weights; }
  inline double getWAFAverage() const { return wafAverage; }
  inline double getVarianceAverage() const { return varianceAverage; }
  inline uint64_t getRoundCount() const { return rounds; }
  inline uint64_t getEmergencyCount() const { return emergencies; }
};

}  // namespace FTLSim::FTL::BlockAllocator

#endif
