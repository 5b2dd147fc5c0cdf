// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_SIM_SIMULATOR_HH__
#define __FTLSIM_SIM_SIMULATOR_HH__

#include "ftl/ftl.hh"
#include "ftl/metrics.hh"
#include "sim/config_reader.hh"
#include "sim/log.hh"

namespace FTLSim {

/**
 * \brief Result of one simulation run
 */
struct RunReport {
  FTL::Config::StrategyType strategy;

  uint64_t requestedWrites;  //!< Writes the workload asked for
  uint64_t completedWrites;  //!< Writes accepted by FTL
  bool exhausted;            //!< Run stopped by StorageExhausted
  uint64_t failedWrite;      //!< Zero-based index of failed write

  FTL::MetricsSnapshot summary;
  std::vector<FTL::MetricsSnapshot> history;

  RunReport();
};

/**
 * \brief Simulator object
 *
 * Owns output streams and log system, and drives workload through freshly
 * created flash device and FTL for each run.
 */
class Simulator {
 private:
  bool inited;  //!< Flag whether this object is initialized

  ObjectData object;
  Log log;  //!< Log system

  FTL::FTL *pFTL;  //!< FTL of current run

  std::ostream *outfile;
  std::ostream *errfile;
  std::ostream *debugfile;

  std::ostream *openStream(std::string &, std::string &) noexcept;
  void closeStream(std::ostream *) noexcept;

  void printStats(Object *, std::string);
  void printReport(const RunReport &);
  void printComparison(const RunReport &, const RunReport &);

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
  inline void debugprint(Log::DebugID id, const char *format, ...) noexcept {
    va_list args;

    va_start(args, format);
    object.log->debugprint(id, format, args);
    va_end(args);
  }

 public:
  Simulator();
  Simulator(const Simulator &) = delete;
  Simulator(Simulator &&) noexcept = delete;
  ~Simulator();

  Simulator &operator=(const Simulator &) = delete;
  Simulator &operator=(Simulator &&) = delete;

  bool init(ConfigReader *) noexcept;
  void deinit() noexcept;

  /**
   * \brief Run workload with given strategy
   *
   * Device, FTL and workload are created from configuration for this run
   * only. Run stops at first write which fails with StorageExhausted.
   *
   * \param[in]  strategy FTL strategy
   * \param[out] report   Run result and metric history
   */
  void run(FTL::Config::StrategyType strategy, RunReport &report);

  /**
   * \brief Run configured simulation and print report
   *
   * Runs both strategies on same workload when CompareStrategies is set.
   */
  void run();
};

}  // namespace FTLSim

#endif
