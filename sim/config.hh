// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_SIM_CONFIG_HH__
#define __FTLSIM_SIM_CONFIG_HH__

#include "sim/base_config.hh"

#define FILE_STDOUT "STDOUT"
#define FILE_STDERR "STDERR"

namespace FTLSim {

/**
 * \brief SimConfig object declaration
 *
 * Stores simulation configurations such as simulation output files and
 * reporting parameters.
 */
class Config : public BaseConfig {
 public:
  enum Key : uint32_t {
    OutputDirectory,
    OutputFile,
    ErrorFile,
    DebugFile,
    CheckpointInterval,
    MaxEraseLimit,
    CompareStrategies,
  };

 private:
  std::string outputDirectory;
  std::string outputFile;
  std::string errorFile;
  std::string debugFile;
  uint64_t checkpointInterval;
  uint64_t maxEraseLimit;
  bool compare;

 public:
  Config();

  const char *getSectionName() noexcept override { return "sim"; }

  void loadFrom(pugi::xml_node &) noexcept override;
  void storeTo(pugi::xml_node &) noexcept override;
  void update() noexcept override;

  uint64_t readUint(uint32_t) const noexcept override;
  std::string readString(uint32_t) const noexcept override;
  bool readBoolean(uint32_t) const noexcept override;
  bool writeUint(uint32_t, uint64_t) noexcept override;
  bool writeString(uint32_t, std::string &) noexcept override;
  bool writeBoolean(uint32_t, bool) noexcept override;
};

}  // namespace FTLSim

#endif
