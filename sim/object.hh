// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_SIM_OBJECT_HH__
#define __FTLSIM_SIM_OBJECT_HH__

#include <limits>
#include <string>
#include <vector>

#include "sim/config_reader.hh"
#include "sim/log.hh"
#include "util/algorithm.hh"

#ifndef __FILENAME__
#define __FILENAME__ __FILE__
#endif

namespace FTLSim {

// Prefix message with source location of caller
#define LOG_WITH_LOCATION(logfn, format, ...)                                  \
  logfn("%s:%u: %s\n  " format, __FILENAME__, __LINE__, __PRETTY_FUNCTION__,   \
        ##__VA_ARGS__)

#define panic_if(cond, format, ...)                                            \
  {                                                                            \
    if (UNLIKELY(cond)) {                                                      \
      LOG_WITH_LOCATION(panic_log, format, ##__VA_ARGS__);                     \
    }                                                                          \
  }

#define panic(format, ...)                                                     \
  { LOG_WITH_LOCATION(panic_log, format, ##__VA_ARGS__); }

#define warn_if(cond, format, ...)                                             \
  {                                                                            \
    if (UNLIKELY(cond)) {                                                      \
      LOG_WITH_LOCATION(warn_log, format, ##__VA_ARGS__);                      \
    }                                                                          \
  }

#define warn(format, ...)                                                      \
  { LOG_WITH_LOCATION(warn_log, format, ##__VA_ARGS__); }

#define info(format, ...)                                                      \
  { info_log(format, ##__VA_ARGS__); }

/**
 * \brief Common data for Object
 *
 * Simulation system like configuration reader and log system.
 */
struct ObjectData {
  ConfigReader *config;
  Log *log;

  ObjectData() : config(nullptr), log(nullptr) {}
  ObjectData(ConfigReader *c, Log *l) : config(c), log(l) {}
};

//! Statistic entry
struct Stat {
  std::string name;
  std::string desc;

  Stat(std::string n, std::string d) : name(std::move(n)), desc(std::move(d)) {}
};

//! Logical Page Number definition
using LPN = uint64_t;
const LPN InvalidLPN = std::numeric_limits<LPN>::max();

/**
 * \brief Object object declaration
 *
 * Simulation object. All simulation module must inherit this class. Provides
 * API for accessing config and log system.
 */
class Object {
 protected:
  ObjectData &object;

  /* Helper APIs for Config */
  inline uint64_t readConfigUint(Section s, uint32_t k) noexcept {
    return object.config->readUint(s, k);
  }
  inline double readConfigRatio(Section s, uint32_t k) noexcept {
    return object.config->readRatio(s, k);
  }
  inline bool readConfigBoolean(Section s, uint32_t k) noexcept {
    return object.config->readBoolean(s, k);
  }

  /* Helper APIs for Log */
  inline void info_log(const char *format, ...) noexcept {
    va_list args;

    va_start(args, format);
    object.log->print(Log::LogID::Info, format, args);
    va_end(args);
  }
  inline void warn_log(const char *format, ...) noexcept {
    va_list args;

    va_start(args, format);
    object.log->print(Log::LogID::Warn, format, args);
    va_end(args);
  }
  inline void panic_log(const char *format, ...) noexcept {
    va_list args;

    va_start(args, format);
    object.log->print(Log::LogID::Panic, format, args);
    va_end(args);
  }
  inline void debugprint(Log::DebugID id, const char *format, ...) noexcept {
    va_list args;

    va_start(args, format);
    object.log->debugprint(id, format, args);
    va_end(args);
  }

 public:
  Object(ObjectData &o) : object(o) {}
  Object(const Object &) = delete;
  Object(Object &&) noexcept = delete;
  virtual ~Object() {}

  Object &operator=(const Object &) = delete;
  Object &operator=(Object &&) = delete;

  /* Statistic API */
  virtual void getStatList(std::vector<Stat> &, std::string) noexcept = 0;
  virtual void getStatValues(std::vector<double> &) noexcept = 0;
  virtual void resetStatValues() noexcept = 0;
};

}  // namespace FTLSim

#endif
