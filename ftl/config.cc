// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "ftl/config.hh"

namespace FTLSim::FTL {

const char NAME_STRATEGY[] = "Strategy";

// gc section
const char NAME_BASE_THRESHOLD[] = "BaseThreshold";
const char NAME_WAF_FACTOR[] = "WAFFactor";
const char NAME_VARIANCE_FACTOR[] = "VarianceFactor";
const char NAME_CLAMP_THRESHOLD[] = "ClampThreshold";
const char NAME_ERASE_ON_PARTIAL[] = "EraseOnPartialMigration";

// adaptive section
const char NAME_ADAPTATION_INTERVAL[] = "AdaptationInterval";
const char NAME_TARGET_WAF[] = "TargetWAF";
const char NAME_TARGET_VARIANCE[] = "TargetVariance";
const char NAME_EMERGENCY_WAF[] = "EmergencyWAF";
const char NAME_SMOOTHING_FACTOR[] = "SmoothingFactor";

Config::Config() {
  strategy = StrategyType::Baseline;

  baseThreshold = 0.2f;
  wafFactor = 0.05f;
  varianceFactor = 0.01f;
  clampThreshold = true;
  eraseOnPartial = false;

  adaptationInterval = 1000;
  targetWAF = 4.f;
  targetVariance = 20.f;
  emergencyWAF = 6.f;
  smoothingFactor = 0.1f;
}

void Config::loadGC(pugi::xml_node &section) noexcept {
  for (auto node = section.first_child(); node; node = node.next_sibling()) {
    LOAD_NAME_FLOAT(node, NAME_BASE_THRESHOLD, baseThreshold);
    LOAD_NAME_FLOAT(node, NAME_WAF_FACTOR, wafFactor);
    LOAD_NAME_FLOAT(node, NAME_VARIANCE_FACTOR, varianceFactor);
    LOAD_NAME_BOOLEAN(node, NAME_CLAMP_THRESHOLD, clampThreshold);
    LOAD_NAME_BOOLEAN(node, NAME_ERASE_ON_PARTIAL, eraseOnPartial);
  }
}

void Config::loadAdaptive(pugi::xml_node &section) noexcept {
  for (auto node = section.first_child(); node; node = node.next_sibling()) {
    LOAD_NAME_UINT(node, NAME_ADAPTATION_INTERVAL, adaptationInterval);
    LOAD_NAME_FLOAT(node, NAME_TARGET_WAF, targetWAF);
    LOAD_NAME_FLOAT(node, NAME_TARGET_VARIANCE, targetVariance);
    LOAD_NAME_FLOAT(node, NAME_EMERGENCY_WAF, emergencyWAF);
    LOAD_NAME_FLOAT(node, NAME_SMOOTHING_FACTOR, smoothingFactor);
  }
}

void Config::storeGC(pugi::xml_node &section) noexcept {
  STORE_NAME_FLOAT(section, NAME_BASE_THRESHOLD, baseThreshold);
  STORE_NAME_FLOAT(section, NAME_WAF_FACTOR, wafFactor);
  STORE_NAME_FLOAT(section, NAME_VARIANCE_FACTOR, varianceFactor);
  STORE_NAME_BOOLEAN(section, NAME_CLAMP_THRESHOLD, clampThreshold);
  STORE_NAME_BOOLEAN(section, NAME_ERASE_ON_PARTIAL, eraseOnPartial);
}

void Config::storeAdaptive(pugi::xml_node &section) noexcept {
  STORE_NAME_UINT(section, NAME_ADAPTATION_INTERVAL, adaptationInterval);
  STORE_NAME_FLOAT(section, NAME_TARGET_WAF, targetWAF);
  STORE_NAME_FLOAT(section, NAME_TARGET_VARIANCE, targetVariance);
  STORE_NAME_FLOAT(section, NAME_EMERGENCY_WAF, emergencyWAF);
  STORE_NAME_FLOAT(section, NAME_SMOOTHING_FACTOR, smoothingFactor);
}

void Config::loadFrom(pugi::xml_node &section) noexcept {
  for (auto node = section.first_child(); node; node = node.next_sibling()) {
    auto name = node.attribute(CONFIG_ATTRIBUTE).value();

    LOAD_NAME_UINT_TYPE(node, NAME_STRATEGY, StrategyType, strategy);

    if (strcmp(name, "gc") == 0 && isSection(node)) {
      loadGC(node);
    }
    else if (strcmp(name, "adaptive") == 0 && isSection(node)) {
      loadAdaptive(node);
    }
  }
}

void Config::storeTo(pugi::xml_node &section) noexcept {
  pugi::xml_node node;

  STORE_NAME_UINT(section, NAME_STRATEGY, strategy);

  STORE_SECTION(section, "gc", node);
  storeGC(node);

  STORE_SECTION(section, "adaptive", node);
  storeAdaptive(node);
}

void Config::update() noexcept {
  panic_if((uint8_t)strategy > 1, "Invalid Strategy.");

  panic_if(baseThreshold < 0.f, "Invalid BaseThreshold.");
  panic_if(adaptationInterval == 0, "AdaptationInterval must be non-zero.");
  panic_if(smoothingFactor <= 0.f || smoothingFactor > 1.f,
           "SmoothingFactor must be in (0, 1].");
  panic_if(emergencyWAF < targetWAF,
           "EmergencyWAF should not be smaller than TargetWAF.");
}

uint64_t Config::readUint(uint32_t idx) const noexcept {
  uint64_t ret = 0;

  switch (idx) {
    case Strategy:
      ret = (uint64_t)strategy;
      break;
    case AdaptationInterval:
      ret = adaptationInterval;
      break;
  }

  return ret;
}

float Config::readFloat(uint32_t idx) const noexcept {
  float ret = 0.f;

  switch (idx) {
    case BaseThreshold:
      ret = baseThreshold;
      break;
    case WAFFactor:
      ret = wafFactor;
      break;
    case VarianceFactor:
      ret = varianceFactor;
      break;
    case TargetWAF:
      ret = targetWAF;
      break;
    case TargetVariance:
      ret = targetVariance;
      break;
    case EmergencyWAF:
      ret = emergencyWAF;
      break;
    case SmoothingFactor:
      ret = smoothingFactor;
      break;
  }

  return ret;
}

bool Config::readBoolean(uint32_t idx) const noexcept {
  bool ret = false;

  switch (idx) {
    case ClampThreshold:
      ret = clampThreshold;
      break;
    case EraseOnPartialMigration:
      ret = eraseOnPartial;
      break;
  }

  return ret;
}

bool Config::writeUint(uint32_t idx, uint64_t value) noexcept {
  bool ret = true;

  switch (idx) {
    case Strategy:
      strategy = (StrategyType)value;
      break;
    case AdaptationInterval:
      adaptationInterval = value;
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
    case BaseThreshold:
      baseThreshold = value;
      break;
    case WAFFactor:
      wafFactor = value;
      break;
    case VarianceFactor:
      varianceFactor = value;
      break;
    case TargetWAF:
      targetWAF = value;
      break;
    case TargetVariance:
      targetVariance = value;
      break;
    case EmergencyWAF:
      emergencyWAF = value;
      break;
    case SmoothingFactor:
      smoothingFactor = value;
      break;
    default:
      ret = false;
      break;
  }

  return ret;
}

bool Config::writeBoolean(uint32_t idx, bool value) noexcept {
  bool ret = true;

  switch (idx) {
    case ClampThreshold:
      clampThreshold = value;
      break;
    case EraseOnPartialMigration:
      eraseOnPartial = value;
      break;
    default:
      ret = false;
      break;
  }

  return ret;
}

}  // namespace FTLSim::FTL
