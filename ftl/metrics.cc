// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "ftl/metrics.hh"

#include <limits>

#include "fil/device.hh"

namespace FTLSim::FTL {

double calculateWAF(const RunCounters &counters) {
  if (counters.hostWrites == 0) {
    return 1.;
  }

  return (double)counters.physicalWrites / counters.hostWrites;
}

double calculateWearVariance(const FIL::Device &device) {
  std::vector<uint32_t> list;
  double mean = 0.;
  double sum = 0.;

  device.getEraseCounts(list);

  if (list.empty()) {
    return 0.;
  }

  for (auto &count : list) {
    mean += count;
  }

  mean /= list.size();

  for (auto &count : list) {
    double diff = count - mean;

    sum += diff * diff;
  }

  return sum / list.size();
}

double calculateLifetime(const FIL::Device &device,
                         const RunCounters &counters, uint64_t maxEraseLimit) {
  auto maxErase = device.getMaxEraseCount();

  if (maxErase == 0) {
    return std::numeric_limits<double>::infinity();
  }

  return (double)maxEraseLimit / maxErase * counters.hostWrites;
}

MetricsSnapshot::MetricsSnapshot()
    : hostWrites(0),
      physicalWrites(0),
      gcInvocations(0),
      waf(1.),
      wearVariance(0.),
      lifetime(std::numeric_limits<double>::infinity()),
      maxEraseCount(0),
      minEraseCount(0) {}

MetricsSnapshot takeSnapshot(const FIL::Device &device,
                             const RunCounters &counters,
                             uint64_t maxEraseLimit) {
  MetricsSnapshot ret;

  ret.hostWrites = counters.hostWrites;
  ret.physicalWrites = counters.physicalWrites;
  ret.gcInvocations = counters.gcInvocations;
  ret.waf = calculateWAF(counters);
  ret.wearVariance = calculateWearVariance(device);
  ret.lifetime = calculateLifetime(device, counters, maxEraseLimit);
  ret.maxEraseCount = device.getMaxEraseCount();
  ret.minEraseCount = device.getMinEraseCount();

  return ret;
}

MetricsRecorder::MetricsRecorder(uint64_t i, uint64_t limit)
    : interval(i), maxEraseLimit(limit), lastRecorded(0) {}

bool MetricsRecorder::update(const FIL::Device &device,
                             const RunCounters &counters) {
  // Failed write does not advance host writes, record once per checkpoint
  if (interval == 0 || counters.hostWrites == 0 ||
      counters.hostWrites % interval != 0 ||
      counters.hostWrites == lastRecorded) {
    return false;
  }

  lastRecorded = counters.hostWrites;
  history.emplace_back(takeSnapshot(device, counters, maxEraseLimit));

  return true;
}

void MetricsRecorder::clear() {
  history.clear();
  lastRecorded = 0;
}

}  // namespace FTLSim::FTL
