// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "ftl/metrics.hh"

#include <catch2/catch.hpp>
#include <cmath>

#include "fil/device.hh"

TEST_CASE("Metrics") {
  using namespace FTLSim;

  ConfigReader config;
  Log log;

  log.init(nullptr, nullptr, nullptr, nullptr);

  ObjectData object(&config, &log);
  FIL::Device device(object, 4, 4, 0.);
  FTL::RunCounters counters;

  SECTION("Write amplification") {
    REQUIRE(FTL::calculateWAF(counters) == 1.);

    counters.hostWrites = 100;
    counters.physicalWrites = 250;

    REQUIRE(FTL::calculateWAF(counters) == Approx(2.5));
  }

  SECTION("Wear variance") {
    REQUIRE(FTL::calculateWearVariance(device) == 0.);

    device.erase(0);
    device.erase(0);
    device.erase(1);

    // Erase counts 2, 1, 0, 0
    REQUIRE(FTL::calculateWearVariance(device) == Approx(.6875));

    FIL::Device empty(object, 0, 4, 0.);

    REQUIRE(FTL::calculateWearVariance(empty) == 0.);
  }

  SECTION("Lifetime estimate") {
    counters.hostWrites = 100;

    REQUIRE(std::isinf(FTL::calculateLifetime(device, counters, 10000)));

    device.erase(2);
    device.erase(2);

    REQUIRE(FTL::calculateLifetime(device, counters, 10000) ==
            Approx(500000.));
  }

  SECTION("Snapshot") {
    counters.hostWrites = 10;
    counters.physicalWrites = 12;
    counters.gcInvocations = 3;

    device.erase(3);

    auto snapshot = FTL::takeSnapshot(device, counters, 1000);

    REQUIRE(snapshot.hostWrites == 10);
    REQUIRE(snapshot.physicalWrites == 12);
    REQUIRE(snapshot.gcInvocations == 3);
    REQUIRE(snapshot.waf == Approx(1.2));
    REQUIRE(snapshot.wearVariance == Approx(.1875));
    REQUIRE(snapshot.lifetime == Approx(10000.));
    REQUIRE(snapshot.maxEraseCount == 1);
    REQUIRE(snapshot.minEraseCount == 0);
  }

  SECTION("Recorder checkpoints") {
    FTL::MetricsRecorder recorder(10, 1000);

    REQUIRE_FALSE(recorder.update(device, counters));

    counters.hostWrites = 9;
    REQUIRE_FALSE(recorder.update(device, counters));

    counters.hostWrites = 10;
    counters.physicalWrites = 10;
    REQUIRE(recorder.update(device, counters));

    // Same checkpoint only once
    REQUIRE_FALSE(recorder.update(device, counters));

    counters.hostWrites = 20;
    counters.physicalWrites = 30;
    REQUIRE(recorder.update(device, counters));

    auto &history = recorder.getHistory();

    REQUIRE(history.size() == 2);
    REQUIRE(history[0].hostWrites == 10);
    REQUIRE(history[0].waf == Approx(1.));
    REQUIRE(history[1].hostWrites == 20);
    REQUIRE(history[1].waf == Approx(1.5));

    recorder.clear();

    REQUIRE(recorder.getHistory().empty());
  }
}
