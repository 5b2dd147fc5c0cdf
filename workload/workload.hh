// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_WORKLOAD_WORKLOAD_HH__
#define __FTLSIM_WORKLOAD_WORKLOAD_HH__

#include <random>

#include "sim/object.hh"
#include "util/stat_helper.hh"

namespace FTLSim::Workload {

/**
 * \brief Logical address stream generator
 *
 * Draws addresses from raw output of std::mt19937, so same seed produces same
 * sequence on every standard library.
 */
class Workload : public Object {
 private:
  const Config::PatternType pattern;
  const uint64_t range;
  const double hotRatio;
  const uint64_t hotRange;

  std::mt19937 engine;
  uint64_t sequence;

  CountStat generatedStat;
  CountStat hotStat;

  inline double probability() { return engine() / 4294967296.; }

  LPN nextSequential();
  LPN nextRandom();
  LPN nextHotspot();
  LPN nextMixed();

 public:
  /**
   * \brief Create generator from workload section
   *
   * \param[in] o        Object data
   * \param[in] logical  Logical capacity, used when LogicalRange is zero
   */
  Workload(ObjectData &o, uint64_t logical);
  Workload(ObjectData &o, Config::PatternType p, uint64_t r, double ratio,
           double fraction, uint32_t seed);

  //! Next logical page number
  LPN next();

  //! Append count addresses to list
  void generate(std::vector<LPN> &list, uint64_t count);

  inline Config::PatternType getPattern() const { return pattern; }
  inline uint64_t getRange() const { return range; }
  inline uint64_t getHotRange() const { return hotRange; }

  void getStatList(std::vector<Stat> &, std::string) noexcept override;
  void getStatValues(std::vector<double> &) noexcept override;
  void resetStatValues() noexcept override;
};

const char *getPatternName(Config::PatternType);

}  // namespace FTLSim::Workload

#endif
