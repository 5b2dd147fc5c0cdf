// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "sim/simulator.hh"

#include <catch2/catch.hpp>

TEST_CASE("Simulator") {
  using namespace FTLSim;

  ConfigReader config;
  Simulator simulator;

  // Disable all outputs
  config.writeString(Section::Simulation, Config::Key::OutputFile, "");
  config.writeString(Section::Simulation, Config::Key::ErrorFile, "");
  config.writeString(Section::Simulation, Config::Key::DebugFile, "");
  config.writeUint(Section::Simulation, Config::Key::CheckpointInterval, 500);

  config.writeUint(Section::FlashInterface, FIL::Config::Key::BlockCount, 16);
  config.writeUint(Section::FlashInterface, FIL::Config::Key::PageCount, 16);
  config.writeFloat(Section::FlashInterface,
                    FIL::Config::Key::OverProvisioningRatio, .25f);

  config.writeUint(Section::Workload, Workload::Config::Key::Mode,
                   (uint64_t)Workload::Config::PatternType::Random);
  config.writeUint(Section::Workload, Workload::Config::Key::WriteCount, 2000);

  REQUIRE(simulator.init(&config));

  for (auto strategy : {FTL::Config::StrategyType::Baseline,
                        FTL::Config::StrategyType::Adaptive}) {
    RunReport report;
    RunReport again;

    simulator.run(strategy, report);

    REQUIRE(report.strategy == strategy);
    REQUIRE(report.requestedWrites == 2000);
    REQUIRE(report.summary.hostWrites == report.completedWrites);
    REQUIRE(report.history.size() == report.completedWrites / 500);
    REQUIRE(report.summary.waf >= 1.);

    if (report.exhausted) {
      REQUIRE(report.failedWrite == report.completedWrites);
    }
    else {
      REQUIRE(report.completedWrites == 2000);
    }

    for (size_t i = 0; i < report.history.size(); i++) {
      REQUIRE(report.history[i].hostWrites == (i + 1) * 500);
    }

    // Each run starts from a fresh device with same workload
    simulator.run(strategy, again);

    REQUIRE(again.completedWrites == report.completedWrites);
    REQUIRE(again.summary.physicalWrites == report.summary.physicalWrites);
    REQUIRE(again.summary.wearVariance == report.summary.wearVariance);
  }

  simulator.deinit();
}
