// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FIL_CONFIG_HH__
#define __FTLSIM_FIL_CONFIG_HH__

#include "sim/base_config.hh"

namespace FTLSim::FIL {

/**
 * \brief FIL Config object declaration
 *
 * Geometry of the simulated flash device.
 */
class Config : public BaseConfig {
 public:
  enum Key : uint32_t {
    BlockCount,
    PageCount,
    OverProvisioningRatio,
  };

 private:
  uint64_t blockCount;
  uint64_t pageCount;
  float overProvision;

 public:
  Config();

  const char *getSectionName() noexcept override { return "fil"; }

  void loadFrom(pugi::xml_node &) noexcept override;
  void storeTo(pugi::xml_node &) noexcept override;
  void update() noexcept override;

  uint64_t readUint(uint32_t) const noexcept override;
  float readFloat(uint32_t) const noexcept override;
  bool writeUint(uint32_t, uint64_t) noexcept override;
  bool writeFloat(uint32_t, float) noexcept override;
};

}  // namespace FTLSim::FIL

#endif
