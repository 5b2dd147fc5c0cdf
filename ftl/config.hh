// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FTL_CONFIG_HH__
#define __FTLSIM_FTL_CONFIG_HH__

#include "sim/base_config.hh"

namespace FTLSim::FTL {

class Config : public BaseConfig {
 public:
  enum Key : uint32_t {
    Strategy,

    // Garbage Collection
    BaseThreshold,
    WAFFactor,
    VarianceFactor,
    ClampThreshold,
    EraseOnPartialMigration,

    // Adaptive weight controller
    AdaptationInterval,
    TargetWAF,
    TargetVariance,
    EmergencyWAF,
    SmoothingFactor,
  };

  enum class StrategyType : uint8_t {
    Baseline,
    Adaptive,
  };

 private:
  StrategyType strategy;

  float baseThreshold;
  float wafFactor;
  float varianceFactor;
  bool clampThreshold;
  bool eraseOnPartial;

  uint64_t adaptationInterval;
  float targetWAF;
  float targetVariance;
  float emergencyWAF;
  float smoothingFactor;

  void loadGC(pugi::xml_node &) noexcept;
  void loadAdaptive(pugi::xml_node &) noexcept;
  void storeGC(pugi::xml_node &) noexcept;
  void storeAdaptive(pugi::xml_node &) noexcept;

 public:
  Config();

  const char *getSectionName() noexcept override { return "ftl"; }

  void loadFrom(pugi::xml_node &) noexcept override;
  void storeTo(pugi::xml_node &) noexcept override;
  void update() noexcept override;

  uint64_t readUint(uint32_t) const noexcept override;
  float readFloat(uint32_t) const noexcept override;
  bool readBoolean(uint32_t) const noexcept override;
  bool writeUint(uint32_t, uint64_t) noexcept override;
  bool writeFloat(uint32_t, float) noexcept override;
  bool writeBoolean(uint32_t, bool) noexcept override;
};

}  // namespace FTLSim::FTL

#endif
