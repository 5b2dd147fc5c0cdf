// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_SIM_LOG_HH__
#define __FTLSIM_SIM_LOG_HH__

#include <cinttypes>
#include <cstdarg>
#include <functional>
#include <ostream>
#include <string>

namespace FTLSim {

const std::string idPrefix[] = {
    "global",  //!< DebugID::Common
    "Simulator",
    "Workload",
    "FIL::Device",
    "FTL",
    "FTL::PageLevelMapping",
    "FTL::BaselineAllocator",
    "FTL::AdaptiveAllocator",
};

const std::string logPrefix[] = {
    "info",   //!< LogID::Info
    "warn",   //!< LogID::Warn
    "panic",  //!< LogID::Panic
};

//! Current simulation time, as seen by the log system
using TickFunction = std::function<uint64_t()>;

/**
 * \brief Log object declaration
 *
 * Log object for logging and assertion.
 */
class Log {
 public:
  enum class DebugID : uint32_t {
    Common,
    Simulator,
    Workload,
    FIL_Device,
    FTL,
    FTL_PageLevel,
    FTL_BaselineAllocator,
    FTL_AdaptiveAllocator,
  };

  enum class LogID : uint32_t {
    Info,
    Warn,
    Panic,
  };

 private:
  TickFunction tick;  //!< Simulation time source
  bool inited;        //!< Flag whether this object is initialized

  std::ostream *out;    //!< File for info
  std::ostream *err;    //!< File for warn/panic
  std::ostream *debug;  //!< File for debug printout

  void write(std::ostream *, const std::string &, const char *,
             va_list) const noexcept;

 public:
  Log();
  Log(const Log &) = delete;
  Log(Log &&) noexcept = default;
  ~Log();

  Log &operator=(const Log &) = delete;
  Log &operator=(Log &&) = default;

  void init(TickFunction, std::ostream *, std::ostream *,
            std::ostream *) noexcept;
  void deinit() noexcept;

  void print(LogID, const char *, va_list) const noexcept;
  void debugprint(DebugID, const char *, va_list) const noexcept;
};

}  // namespace FTLSim

#endif
