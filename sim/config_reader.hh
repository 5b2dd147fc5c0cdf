// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_SIM_CONFIG_READER_HH__
#define __FTLSIM_SIM_CONFIG_READER_HH__

#include <string>

#include "fil/config.hh"
#include "ftl/config.hh"
#include "sim/config.hh"
#include "workload/config.hh"

namespace FTLSim {

//! Configuration section enum.
enum class Section {
  Simulation,
  FlashInterface,
  FlashTranslation,
  Workload,
};

/**
 * \brief ConfigReader object declaration
 *
 * Simulation configuration object. This object provides configuration parser.
 * Also, you can override configuration by calling set function.
 */
class ConfigReader {
 private:
  pugi::xml_document file;

  Config simConfig;
  FIL::Config filConfig;
  FTL::Config ftlConfig;
  Workload::Config workloadConfig;

  BaseConfig *getSection(Section) noexcept;
  const BaseConfig *getSection(Section) const noexcept;

 public:
  ConfigReader();
  ConfigReader(const ConfigReader &) = delete;
  ConfigReader(ConfigReader &&) noexcept = default;
  ~ConfigReader();

  ConfigReader &operator=(const ConfigReader &) = delete;
  ConfigReader &operator=(ConfigReader &&) = default;

  void load(const char *) noexcept;
  void load(std::string &) noexcept;

  void save(const char *) noexcept;
  void save(std::string &) noexcept;

  uint64_t readUint(Section, uint32_t) const noexcept;
  float readFloat(Section, uint32_t) const noexcept;
  double readRatio(Section, uint32_t) const noexcept;
  std::string readString(Section, uint32_t) const noexcept;
  bool readBoolean(Section, uint32_t) const noexcept;

  bool writeUint(Section, uint32_t, uint64_t) noexcept;
  bool writeFloat(Section, uint32_t, float) noexcept;
  bool writeString(Section, uint32_t, std::string) noexcept;
  bool writeBoolean(Section, uint32_t, bool) noexcept;
};

}  // namespace FTLSim

#endif
