// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "workload/config.hh"

#include <limits>

namespace FTLSim::Workload {

const char NAME_MODE[] = "Mode";
const char NAME_WRITE_COUNT[] = "WriteCount";
const char NAME_LOGICAL_RANGE[] = "LogicalRange";
const char NAME_HOT_RATIO[] = "HotRatio";
const char NAME_HOT_FRACTION[] = "HotFraction";
const char NAME_SEED[] = "Seed";

Config::Config() {
  mode = PatternType::Hotspot;
  writeCount = 100000;
  logicalRange = 0;
  hotRatio = 0.8f;
  hotFraction = 0.2f;
  seed = 5489;
}

void Config::loadFrom(pugi::xml_node &section) noexcept {
  for (auto node = section.first_child(); node; node = node.next_sibling()) {
    LOAD_NAME_UINT_TYPE(node, NAME_MODE, PatternType, mode);
    LOAD_NAME_UINT(node, NAME_WRITE_COUNT, writeCount);
    LOAD_NAME_UINT(node, NAME_LOGICAL_RANGE, logicalRange);
    LOAD_NAME_FLOAT(node, NAME_HOT_RATIO, hotRatio);
    LOAD_NAME_FLOAT(node, NAME_HOT_FRACTION, hotFraction);
    LOAD_NAME_UINT(node, NAME_SEED, seed);
  }
}

void Config::storeTo(pugi::xml_node &section) noexcept {
  STORE_NAME_UINT(section, NAME_MODE, mode);
  STORE_NAME_UINT(section, NAME_WRITE_COUNT, writeCount);
  STORE_NAME_UINT(section, NAME_LOGICAL_RANGE, logicalRange);
  STORE_NAME_FLOAT(section, NAME_HOT_RATIO, hotRatio);
  STORE_NAME_FLOAT(section, NAME_HOT_FRACTION, hotFraction);
  STORE_NAME_UINT(section, NAME_SEED, seed);
}

void Config::update() noexcept {
  panic_if((uint8_t)mode > 3, "Invalid workload Mode.");
  panic_if(hotRatio < 0.f || hotRatio > 1.f, "HotRatio must be in [0, 1].");
  panic_if(hotFraction < 0.f || hotFraction > 1.f,
           "HotFraction must be in [0, 1].");
  panic_if(seed > std::numeric_limits<uint32_t>::max(),
           "Seed must fit in 32 bits.");
}

uint64_t Config::readUint(uint32_t idx) const noexcept {
  switch (idx) {
    case Mode:
      return (uint64_t)mode;
    case WriteCount:
      return writeCount;
    case LogicalRange:
      return logicalRange;
    case Seed:
      return seed;
  }

  return 0;
}

float Config::readFloat(uint32_t idx) const noexcept {
  switch (idx) {
    case HotRatio:
      return hotRatio;
    case HotFraction:
      return hotFraction;
  }

  return 0.f;
}

bool Config::writeUint(uint32_t idx, uint64_t value) noexcept {
  bool ret = true;

  switch (idx) {
    case Mode:
      mode = (PatternType)value;
      break;
    case WriteCount:
      writeCount = value;
      break;
    case LogicalRange:
      logicalRange = value;
      break;
    case Seed:
      seed = value;
      break;
    default:
      ret = false;
      break;
  }

  return ret;
}

bool Config::writeFloat(uint32_t idx, float value) noexcept {
  bool ret = true;

  switch (idx) {
    case HotRatio:
      hotRatio = value;
      break;
    case HotFraction:
      hotFraction = value;
      break;
    default:
      ret = false;
      break;
  }

  return ret;
}

}  // namespace FTLSim::Workload
