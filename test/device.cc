// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "fil/device.hh"

#include <catch2/catch.hpp>

TEST_CASE("Device") {
  using namespace FTLSim;

  ConfigReader config;
  Log log;

  log.init(nullptr, nullptr, nullptr, nullptr);

  ObjectData object(&config, &log);

  SECTION("Geometry from configuration") {
    FIL::Device device(object);

    REQUIRE(device.getBlockCount() == 50);
    REQUIRE(device.getPagesPerBlock() == 64);
    REQUIRE(device.getOverProvisioningRatio() == .1);
    REQUIRE(device.getTotalPageCount() == 3200);
    REQUIRE(device.getLogicalPageCount() == 2880);
    REQUIRE(device.getFreePageCount() == 3200);
  }

  SECTION("Write, invalidate and erase") {
    FIL::Device device(object, 4, 4, 0.25);
    uint32_t pageIndex = 0;

    REQUIRE(device.getLogicalPageCount() == 12);

    REQUIRE(device.writePage(1, 10, pageIndex) == Response::Success);
    REQUIRE(pageIndex == 0);
    REQUIRE(device.writePage(1, 11, pageIndex) == Response::Success);
    REQUIRE(pageIndex == 1);

    REQUIRE(device.invalidatePage(1, 0));
    REQUIRE_FALSE(device.invalidatePage(1, 0));
    REQUIRE_FALSE(device.invalidatePage(1, 3));

    REQUIRE(device.getValidPageCount() == 1);
    REQUIRE(device.getInvalidPageCount() == 1);
    REQUIRE(device.getFreePageCount() == 14);

    device.erase(1);
    device.erase(1);
    device.erase(2);

    std::vector<uint32_t> counts;

    device.getEraseCounts(counts);

    REQUIRE(counts == std::vector<uint32_t>{0, 2, 1, 0});
    REQUIRE(device.getMaxEraseCount() == 2);
    REQUIRE(device.getMinEraseCount() == 0);
    REQUIRE(device.getFreePageCount() == 16);
    REQUIRE(device.getValidPageCount() == 0);
    REQUIRE(device.getInvalidPageCount() == 0);
  }

  SECTION("Full block") {
    FIL::Device device(object, 2, 2, 0.);
    uint32_t pageIndex = 0;

    device.writePage(0, 1, pageIndex);
    device.writePage(0, 2, pageIndex);

    REQUIRE(device.writePage(0, 3, pageIndex) == Response::Full);
    REQUIRE(device.getBlock(0).getEraseCount() == 0);
    REQUIRE(device.getBlock(0).getValidPageCount() == 2);
  }

  SECTION("Statistics") {
    FIL::Device device(object, 2, 2, 0.);
    std::vector<Stat> list;
    std::vector<double> values;
    uint32_t pageIndex = 0;

    device.writePage(0, 1, pageIndex);
    device.invalidatePage(0, 0);
    device.erase(0);

    device.getStatList(list, "fil.");
    device.getStatValues(values);

    REQUIRE(list.size() == values.size());
    REQUIRE(list.front().name == "fil.program");
    REQUIRE(values[0] == 1.);
    REQUIRE(values[1] == 1.);
    REQUIRE(values[2] == 1.);

    device.resetStatValues();
    values.clear();
    device.getStatValues(values);

    REQUIRE(values[0] == 0.);
  }
}
