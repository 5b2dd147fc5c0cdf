// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_WORKLOAD_CONFIG_HH__
#define __FTLSIM_WORKLOAD_CONFIG_HH__

#include "sim/base_config.hh"

namespace FTLSim::Workload {

/**
 * \brief Workload Config object declaration
 *
 * Describes synthetic host write stream.
 */
class Config : public BaseConfig {
 public:
  enum Key : uint32_t {
    Mode,
    WriteCount,
    LogicalRange,
    HotRatio,
    HotFraction,
    Seed,
  };

  enum class PatternType : uint8_t {
    Sequential,
    Random,
    Hotspot,
    Mixed,
  };

 private:
  PatternType mode;
  uint64_t writeCount;
  uint64_t logicalRange;
  float hotRatio;
  float hotFraction;
  uint64_t seed;

 public:
  Config();

  const char *getSectionName() noexcept override { return "workload"; }

  void loadFrom(pugi::xml_node &) noexcept override;
  void storeTo(pugi::xml_node &) noexcept override;
  void update() noexcept override;

  uint64_t readUint(uint32_t) const noexcept override;
  float readFloat(uint32_t) const noexcept override;
  bool writeUint(uint32_t, uint64_t) noexcept override;
  bool writeFloat(uint32_t, float) noexcept override;
};

}  // namespace FTLSim::Workload

#endif
