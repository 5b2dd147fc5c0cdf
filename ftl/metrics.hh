// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FTL_METRICS_HH__
#define __FTLSIM_FTL_METRICS_HH__

#include <vector>

#include "ftl/def.hh"

namespace FTLSim {

namespace FIL {

class Device;

}

namespace FTL {

/**
 * \brief Write amplification factor
 *
 * \return physical writes / host writes, 1.0 before first host write.
 */
double calculateWAF(const RunCounters &counters);

/**
 * \brief Population variance of per-block erase counts
 *
 * \return 0.0 for device without block.
 */
double calculateWearVariance(const FIL::Device &device);

/**
 * \brief Projected host writes until first block wears out
 *
 * Scales host writes so far by the remaining headroom of the most erased
 * block.
 *
 * \param[in] device          Flash device
 * \param[in] counters        Run counters
 * \param[in] maxEraseLimit   P/E cycle limit of a block
 * \return Infinity if no block has been erased yet.
 */
double calculateLifetime(const FIL::Device &device,
                         const RunCounters &counters, uint64_t maxEraseLimit);

//! Metrics at one point of simulation
struct MetricsSnapshot {
  uint64_t hostWrites;
  uint64_t physicalWrites;
  uint64_t gcInvocations;
  double waf;
  double wearVariance;
  double lifetime;
  uint32_t maxEraseCount;
  uint32_t minEraseCount;

  MetricsSnapshot();
};

MetricsSnapshot takeSnapshot(const FIL::Device &device,
                             const RunCounters &counters,
                             uint64_t maxEraseLimit);

/**
 * \brief Periodic metrics recorder
 *
 * Records snapshot every interval host writes.
 */
class MetricsRecorder {
 private:
  const uint64_t interval;
  const uint64_t maxEraseLimit;

  uint64_t lastRecorded;

  std::vector<MetricsSnapshot> history;

 public:
  MetricsRecorder(uint64_t interval, uint64_t limit);

  /**
   * \brief Record snapshot if checkpoint reached
   *
   * \return True if snapshot recorded
   */
  bool update(const FIL::Device &device, const RunCounters &counters);

  inline const std::vector<MetricsSnapshot> &getHistory() const {
    return history;
  }

  void clear();
};

}  // namespace FTL

}  // namespace FTLSim

#endif
