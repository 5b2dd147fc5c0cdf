// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "workload/workload.hh"

namespace FTLSim::Workload {

const char *getPatternName(Config::PatternType p) {
  switch (p) {
    case Config::PatternType::Sequential:
      return "Sequential";
    case Config::PatternType::Random:
      return "Random";
    case Config::PatternType::Hotspot:
      return "Hotspot";
    case Config::PatternType::Mixed:
      return "Mixed";
  }

  return "Unknown";
}

Workload::Workload(ObjectData &o, uint64_t logical)
    : Workload(
          o,
          (Config::PatternType)o.config->readUint(Section::Workload,
                                                  Config::Key::Mode),
          o.config->readUint(Section::Workload, Config::Key::LogicalRange) > 0
              ? o.config->readUint(Section::Workload,
                                   Config::Key::LogicalRange)
              : logical,
          o.config->readRatio(Section::Workload, Config::Key::HotRatio),
          o.config->readRatio(Section::Workload, Config::Key::HotFraction),
          (uint32_t)o.config->readUint(Section::Workload, Config::Key::Seed)) {
}

Workload::Workload(ObjectData &o, Config::PatternType p, uint64_t r,
                   double ratio, double fraction, uint32_t seed)
    : Object(o),
      pattern(p),
      range(r),
      hotRatio(ratio),
      hotRange((uint64_t)(r * fraction)),
      engine(seed),
      sequence(0) {
  panic_if(range == 0, "Logical range of workload must be non-zero.");
  panic_if(ratio < 0. || ratio > 1., "HotRatio must be in [0, 1].");
  panic_if(fraction < 0. || fraction > 1., "HotFraction must be in [0, 1].");

  debugprint(Log::DebugID::Workload,
             "Created | %s | range %" PRIu64 " | hot %" PRIu64 " | seed %u",
             getPatternName(pattern), range, hotRange, seed);
}

LPN Workload::nextSequential() {
  return sequence++ % range;
}

LPN Workload::nextRandom() {
  return engine() % range;
}

LPN Workload::nextHotspot() {
  bool hot = probability() < hotRatio && hotRange > 0;

  // Empty cold region
  if (!hot && hotRange == range) {
    hot = true;
  }

  if (hot) {
    hotStat.add();

    return engine() % hotRange;
  }

  return hotRange + engine() % (range - hotRange);
}

LPN Workload::nextMixed() {
  if (probability() < 0.5) {
    return nextSequential();
  }

  return nextRandom();
}

LPN Workload::next() {
  generatedStat.add();

  switch (pattern) {
    case Config::PatternType::Sequential:
      return nextSequential();
    case Config::PatternType::Random:
      return nextRandom();
    case Config::PatternType::Hotspot:
      return nextHotspot();
    case Config::PatternType::Mixed:
      return nextMixed();
  }

  panic("Unexpected workload pattern.");

  return InvalidLPN;
}

void Workload::generate(std::vector<LPN> &list, uint64_t count) {
  list.reserve(list.size() + count);

  for (uint64_t i = 0; i < count; i++) {
    list.push_back(next());
  }
}

void Workload::getStatList(std::vector<Stat> &list,
                           std::string prefix) noexcept {
  list.emplace_back(prefix + "generated", "Generated addresses");
  list.emplace_back(prefix + "hot", "Addresses drawn from hot region");
}

void Workload::getStatValues(std::vector<double> &values) noexcept {
  values.push_back((double)generatedStat.getCount());
  values.push_back((double)hotStat.getCount());
}

void Workload::resetStatValues() noexcept {
  generatedStat.clear();
  hotStat.clear();
}

}  // namespace FTLSim::Workload
