// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "sim/simulator.hh"

#include <fstream>
#include <iostream>

#include "fil/device.hh"
#include "sim/version.hh"
#include "util/path.hh"
#include "workload/workload.hh"

namespace FTLSim {

static const char *getStrategyName(FTL::Config::StrategyType s) {
  return s == FTL::Config::StrategyType::Adaptive ? "Adaptive" : "Baseline";
}

RunReport::RunReport()
    : strategy(FTL::Config::StrategyType::Baseline),
      requestedWrites(0),
      completedWrites(0),
      exhausted(false),
      failedWrite(0) {}

Simulator::Simulator()
    : inited(false),
      pFTL(nullptr),
      outfile(nullptr),
      errfile(nullptr),
      debugfile(nullptr) {}

Simulator::~Simulator() {
  if (inited) {
    deinit();
  }
}

/**
 * \brief Open output file stream
 *
 * If path is FILE_STDOUT or FILE_STDERR, it returns std::cout or std::cerr.
 * Empty path returns nullptr.
 *
 * \param[in] prefix Directory path
 * \param[in] path   File name
 */
std::ostream *Simulator::openStream(std::string &prefix,
                                    std::string &path) noexcept {
  std::ostream *os = nullptr;

  if (path.compare(FILE_STDOUT) == 0) {
    os = &std::cout;
  }
  else if (path.compare(FILE_STDERR) == 0) {
    os = &std::cerr;
  }
  else if (path.length() > 0) {
    std::string filepath = Path::joinPath(prefix.c_str(), path.c_str());

    os = new std::ofstream(filepath);

    if (!((std::ofstream *)os)->is_open()) {
      // Log system not initialized yet
      std::cerr << "panic: Failed to open file: " << filepath << std::endl;
      abort();
    }
  }

  return os;
}

void Simulator::closeStream(std::ostream *os) noexcept {
  if (os == nullptr || os == &std::cout || os == &std::cerr) {
    return;
  }

  if (auto ofs = dynamic_cast<std::ofstream *>(os)) {
    ofs->close();
  }

  delete os;
}

bool Simulator::init(ConfigReader *c) noexcept {
  object.config = c;
  object.log = &log;

  // Open file streams
  auto prefix = c->readString(Section::Simulation, Config::OutputDirectory);
  auto outpath = c->readString(Section::Simulation, Config::OutputFile);
  auto errpath = c->readString(Section::Simulation, Config::ErrorFile);
  auto debugpath = c->readString(Section::Simulation, Config::DebugFile);

  outfile = openStream(prefix, outpath);

  if (Path::comparePath(prefix, outpath, errpath)) {
    errfile = outfile;
  }
  else {
    errfile = openStream(prefix, errpath);
  }

  if (Path::comparePath(prefix, outpath, debugpath)) {
    debugfile = outfile;
  }
  else if (Path::comparePath(prefix, errpath, debugpath)) {
    debugfile = errfile;
  }
  else {
    debugfile = openStream(prefix, debugpath);
  }

  // Host write count of running FTL is simulation time
  log.init([this]() -> uint64_t { return pFTL ? pFTL->getHostWrites() : 0; },
           outfile, errfile, debugfile);

  debugprint(Log::DebugID::Simulator, "Initialized | FTLSim %s",
             FTLSIM_VERSION);

  inited = true;

  return inited;
}

void Simulator::deinit() noexcept {
  if (inited) {
    log.deinit();

    closeStream(outfile);

    if (errfile != outfile) {
      closeStream(errfile);
    }

    if (debugfile != errfile && debugfile != outfile) {
      closeStream(debugfile);
    }

    outfile = nullptr;
    errfile = nullptr;
    debugfile = nullptr;
  }

  inited = false;
}

void Simulator::run(FTL::Config::StrategyType strategy, RunReport &report) {
  auto c = object.config;
  auto interval =
      c->readUint(Section::Simulation, Config::Key::CheckpointInterval);
  auto limit = c->readUint(Section::Simulation, Config::Key::MaxEraseLimit);
  auto count =
      c->readUint(Section::Workload, Workload::Config::Key::WriteCount);

  FIL::Device device(object);
  FTL::FTL ftl(object, &device, strategy);
  Workload::Workload workload(object, device.getLogicalPageCount());
  FTL::MetricsRecorder recorder(interval, limit);

  pFTL = &ftl;

  report = RunReport();
  report.strategy = strategy;
  report.requestedWrites = count;

  debugprint(Log::DebugID::Simulator,
             "Run     | %s | %" PRIu64 " writes | %u blocks x %u pages | OP "
             "%.2lf",
             getStrategyName(strategy), count, device.getBlockCount(),
             device.getPagesPerBlock(), device.getOverProvisioningRatio());

  for (uint64_t i = 0; i < count; i++) {
    LPN lpn = workload.next();
    auto ret = ftl.write(lpn);

    if (ret != Response::Success) {
      report.exhausted = true;
      report.failedWrite = i;

      warn_log("%s: stopped at write %" PRIu64 " (LPN %" PRIu64 "): %s",
               getStrategyName(strategy), i, lpn, getResponseName(ret));

      break;
    }

    report.completedWrites++;

    recorder.update(device, ftl.getCounters());
  }

  report.summary = FTL::takeSnapshot(device, ftl.getCounters(), limit);
  report.history = recorder.getHistory();

  printReport(report);

  printStats(&device, "fil.");
  printStats(&ftl, "ftl.");
  printStats(&workload, "workload.");

  pFTL = nullptr;
}

void Simulator::run() {
  RunReport baseline;
  RunReport adaptive;

  if (object.config->readBoolean(Section::Simulation,
                                 Config::Key::CompareStrategies)) {
    run(FTL::Config::StrategyType::Baseline, baseline);
    run(FTL::Config::StrategyType::Adaptive, adaptive);

    printComparison(baseline, adaptive);
  }
  else {
    auto strategy = (FTL::Config::StrategyType)object.config->readUint(
        Section::FlashTranslation, FTL::Config::Key::Strategy);

    run(strategy, baseline);
  }
}

void Simulator::printStats(Object *pObject, std::string prefix) {
  std::vector<Stat> list;
  std::vector<double> values;

  pObject->getStatList(list, prefix);
  pObject->getStatValues(values);

  for (size_t i = 0; i < list.size() && i < values.size(); i++) {
    info_log("%-40s %16.6lf # %s", list[i].name.c_str(), values[i],
             list[i].desc.c_str());
  }
}

void Simulator::printReport(const RunReport &report) {
  auto &s = report.summary;

  info_log("%s FTL: %" PRIu64 "/%" PRIu64 " writes%s",
           getStrategyName(report.strategy), report.completedWrites,
           report.requestedWrites,
           report.exhausted ? " (storage exhausted)" : "");

  for (auto &h : report.history) {
    info_log("  checkpoint %8" PRIu64 " | WAF %.3lf | Var %.3lf | Life %.0lf",
             h.hostWrites, h.waf, h.wearVariance, h.lifetime);
  }

  info_log("  Host writes     : %" PRIu64, s.hostWrites);
  info_log("  Physical writes : %" PRIu64, s.physicalWrites);
  info_log("  GC invocations  : %" PRIu64, s.gcInvocations);
  info_log("  WAF             : %.3lf", s.waf);
  info_log("  Wear variance   : %.3lf", s.wearVariance);
  info_log("  Erase count     : max %u | min %u", s.maxEraseCount,
           s.minEraseCount);
  info_log("  Lifetime        : %.0lf host writes", s.lifetime);
}

void Simulator::printComparison(const RunReport &baseline,
                                const RunReport &adaptive) {
  auto &b = baseline.summary;
  auto &a = adaptive.summary;

  info_log("%-16s %12s %12s", "Metric", "Baseline", "Adaptive");
  info_log("%-16s %12.3lf %12.3lf", "WAF", b.waf, a.waf);
  info_log("%-16s %12.3lf %12.3lf", "Wear variance", b.wearVariance,
           a.wearVariance);
  info_log("%-16s %12" PRIu64 " %12" PRIu64, "GC invocations",
           b.gcInvocations, a.gcInvocations);
  info_log("%-16s %12.0lf %12.0lf", "Lifetime", b.lifetime, a.lifetime);
}

}  // namespace FTLSim
