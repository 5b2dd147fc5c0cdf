// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include <catch2/catch.hpp>

#include "fil/device.hh"
#include "ftl/allocator/adaptive_allocator.hh"
#include "ftl/allocator/baseline_allocator.hh"
#include "ftl/mapping/page_level_mapping.hh"

using namespace FTLSim;

namespace {

double findStat(Object &obj, const std::string &name) {
  std::vector<Stat> list;
  std::vector<double> values;

  obj.getStatList(list, "");
  obj.getStatValues(values);

  for (size_t i = 0; i < list.size(); i++) {
    if (list[i].name == name) {
      return values.at(i);
    }
  }

  FAIL("No statistic named " << name);

  return 0.;
}

//! Write through allocator the way FTL does, without GC
FTL::PhysicalAddress program(FTL::FTLObjectData &fo, LPN lpn) {
  FTL::PhysicalAddress addr;
  uint32_t pageIndex = 0;

  if (fo.pMapping->readMapping(lpn, addr)) {
    fo.pDevice->invalidatePage(addr.blockID, addr.pageIndex);
  }

  REQUIRE(fo.pAllocator->allocatePage(addr) == Response::Success);
  REQUIRE(fo.pDevice->writePage(addr.blockID, lpn, pageIndex) ==
          Response::Success);
  REQUIRE(pageIndex == addr.pageIndex);

  fo.pMapping->writeMapping(lpn, addr);
  fo.pCounters->physicalWrites++;

  return addr;
}

}  // namespace

TEST_CASE("BaselineAllocator") {
  ConfigReader config;
  Log log;

  log.init(nullptr, nullptr, nullptr, nullptr);

  ObjectData object(&config, &log);
  FIL::Device device(object, 4, 4, 0.);
  FTL::RunCounters counters;
  FTL::FTLObjectData ftlobject;

  ftlobject.pDevice = &device;
  ftlobject.pCounters = &counters;

  FTL::Mapping::PageLevelMapping mapping(object, ftlobject);

  ftlobject.pMapping = &mapping;

  FTL::BlockAllocator::BaselineAllocator allocator(object, ftlobject);

  ftlobject.pAllocator = &allocator;

  FTL::PhysicalAddress addr;

  SECTION("Rotating cursor") {
    for (LPN i = 0; i < 4; i++) {
      REQUIRE(program(ftlobject, i) == FTL::PhysicalAddress(0, (uint32_t)i));
    }

    REQUIRE(program(ftlobject, 4) == FTL::PhysicalAddress(1, 0));
    REQUIRE(allocator.getActiveBlock() == 1);

    // Cursor does not go back to erased block
    device.erase(0);

    REQUIRE(allocator.allocatePage(addr) == Response::Success);
    REQUIRE(addr == FTL::PhysicalAddress(1, 1));
  }

  SECTION("Excluded block") {
    REQUIRE(allocator.allocatePage(addr, 0) == Response::Success);
    REQUIRE(addr == FTL::PhysicalAddress(1, 0));
  }

  SECTION("Exhaustion after full rotation") {
    for (LPN i = 0; i < 16; i++) {
      program(ftlobject, i);
    }

    REQUIRE(allocator.allocatePage(addr) == Response::AllocationExhausted);

    device.erase(0);

    REQUIRE(allocator.allocatePage(addr) == Response::Success);
    REQUIRE(addr == FTL::PhysicalAddress(0, 0));
  }

  SECTION("GC without victim") {
    program(ftlobject, 0);

    allocator.garbageCollect();

    REQUIRE(counters.gcInvocations == 1);
    REQUIRE(device.getMaxEraseCount() == 0);
    REQUIRE(findStat(allocator, "gc.skip") == 1.);
  }

  SECTION("GC skips active block") {
    program(ftlobject, 0);
    program(ftlobject, 1);
    program(ftlobject, 0);

    REQUIRE(device.getBlock(0).getInvalidPageCount() == 1);
    REQUIRE(allocator.getActiveBlock() == 0);

    allocator.garbageCollect();

    REQUIRE(device.getBlock(0).getEraseCount() == 0);
    REQUIRE(findStat(allocator, "gc.skip") == 1.);
  }

  SECTION("GC migrates valid pages") {
    program(ftlobject, 0);
    program(ftlobject, 1);
    program(ftlobject, 2);
    program(ftlobject, 3);
    program(ftlobject, 0);
    program(ftlobject, 1);

    allocator.garbageCollect();

    REQUIRE(counters.gcInvocations == 1);
    REQUIRE(counters.physicalWrites == 8);
    REQUIRE(device.getBlock(0).getEraseCount() == 1);
    REQUIRE(device.getBlock(0).getFreePageCount() == 4);
    REQUIRE(findStat(allocator, "gc.copy") == 2.);

    // Migrated pages follow in page order
    REQUIRE(mapping.readMapping(2, addr));
    REQUIRE(addr == FTL::PhysicalAddress(1, 2));
    REQUIRE(mapping.isCurrent(2, addr));
    REQUIRE(mapping.readMapping(3, addr));
    REQUIRE(addr == FTL::PhysicalAddress(1, 3));
    REQUIRE(mapping.isCurrent(3, addr));

    REQUIRE(device.getValidPageCount() == 4);
  }
}

TEST_CASE("AdaptiveAllocator") {
  ConfigReader config;
  Log log;

  log.init(nullptr, nullptr, nullptr, nullptr);

  ObjectData object(&config, &log);
  FIL::Device device(object, 4, 4, 0.);
  FTL::RunCounters counters;
  FTL::FTLObjectData ftlobject;

  ftlobject.pDevice = &device;
  ftlobject.pCounters = &counters;

  FTL::Mapping::PageLevelMapping mapping(object, ftlobject);

  ftlobject.pMapping = &mapping;

  FTL::BlockAllocator::AdaptiveAllocator allocator(object, ftlobject);

  ftlobject.pAllocator = &allocator;

  FTL::PhysicalAddress addr;

  SECTION("First fit") {
    for (LPN i = 0; i < 5; i++) {
      program(ftlobject, i);
    }

    device.erase(0);

    REQUIRE(allocator.allocatePage(addr) == Response::Success);
    REQUIRE(addr == FTL::PhysicalAddress(0, 0));

    REQUIRE(allocator.allocatePage(addr, 0) == Response::Success);
    REQUIRE(addr == FTL::PhysicalAddress(1, 1));
  }

  SECTION("Weight adaptation interval") {
    auto &controller = allocator.getController();

    counters.hostWrites = 999;
    counters.physicalWrites = 999;
    allocator.notifyHostWrite(counters.hostWrites);

    REQUIRE(controller.getRoundCount() == 0);

    counters.hostWrites = 1000;
    counters.physicalWrites = 1000;
    allocator.notifyHostWrite(counters.hostWrites);

    REQUIRE(controller.getRoundCount() == 1);
    REQUIRE(controller.getWAFAverage() == Approx(1.));
    REQUIRE(controller.getWeights().alpha == Approx(1.));

    allocator.notifyHostWrite(0);

    REQUIRE(controller.getRoundCount() == 1);
  }

  SECTION("Weighted victim selection") {
    for (LPN i = 0; i < 8; i++) {
      program(ftlobject, i);
    }

    program(ftlobject, 0);
    program(ftlobject, 1);
    program(ftlobject, 4);

    FTL::BlockAllocator::WeightController controller;
    auto method = FTL::BlockAllocator::VictimSelectionFactory::
        createVictimSelectionAlgorithm(
            &allocator, FTL::BlockAllocator::VictimSelectionID::WeightedScore,
            &controller);

    REQUIRE(method != nullptr);

    auto &weights = controller.getWeights();

    REQUIRE(FTL::BlockAllocator::getBlockScore(device.getBlock(0), 0,
                                               weights) == Approx(1.));
    REQUIRE(FTL::BlockAllocator::getBlockScore(device.getBlock(1), 0,
                                               weights) == Approx(.5));

    auto free = device.getFreePageCount();
    auto valid = device.getValidPageCount();
    auto invalid = device.getInvalidPageCount();

    // Selection does not change device state
    REQUIRE(method->getVictim() == 0);
    REQUIRE(method->getVictim() == 0);
    REQUIRE(device.getFreePageCount() == free);
    REQUIRE(device.getValidPageCount() == valid);
    REQUIRE(device.getInvalidPageCount() == invalid);

    delete method;

    REQUIRE(FTL::BlockAllocator::VictimSelectionFactory::
                createVictimSelectionAlgorithm(
                    &allocator,
                    FTL::BlockAllocator::VictimSelectionID::WeightedScore) ==
            nullptr);
  }

  SECTION("Equal scores select lower block") {
    for (LPN i = 0; i < 8; i++) {
      program(ftlobject, i);
    }

    // One stale page in each of block 0 and 1
    program(ftlobject, 0);
    program(ftlobject, 4);

    FTL::BlockAllocator::WeightController controller;
    auto method = FTL::BlockAllocator::VictimSelectionFactory::
        createVictimSelectionAlgorithm(
            &allocator, FTL::BlockAllocator::VictimSelectionID::WeightedScore,
            &controller);

    REQUIRE(method != nullptr);

    auto &weights = controller.getWeights();
    auto maxErase = device.getMaxEraseCount();

    REQUIRE(FTL::BlockAllocator::getBlockScore(device.getBlock(0), maxErase,
                                               weights) ==
            FTL::BlockAllocator::getBlockScore(device.getBlock(1), maxErase,
                                               weights));
    REQUIRE(method->getVictim() == 0);
    REQUIRE(method->getVictim() == 0);

    delete method;
  }

  SECTION("Worn block scores lower") {
    FTL::BlockAllocator::Weights weights;
    FIL::Block fresh(0, 4);
    FIL::Block worn(1, 4);
    uint32_t pageIndex = 0;

    worn.erase();
    worn.erase();

    for (uint32_t i = 0; i < 4; i++) {
      fresh.write(i, pageIndex);
      worn.write(i, pageIndex);
    }

    fresh.invalidate(0);
    worn.invalidate(0);

    // efficiency .25, cost .75, wear 1 and 0
    REQUIRE(FTL::BlockAllocator::getBlockScore(fresh, 2, weights) ==
            Approx(.5));
    REQUIRE(FTL::BlockAllocator::getBlockScore(worn, 2, weights) ==
            Approx(-.5));
  }
}

TEST_CASE("Partial migration") {
  ConfigReader config;
  Log log;

  log.init(nullptr, nullptr, nullptr, nullptr);

  ObjectData object(&config, &log);
  FIL::Device device(object, 2, 2, 0.);
  FTL::RunCounters counters;
  FTL::FTLObjectData ftlobject;
  uint32_t pageIndex = 0;

  ftlobject.pDevice = &device;
  ftlobject.pCounters = &counters;

  FTL::Mapping::PageLevelMapping mapping(object, ftlobject);

  ftlobject.pMapping = &mapping;

  // Block 0: INVALID(0) VALID(1), block 1: VALID(0) VALID(2)
  device.writePage(0, 0, pageIndex);
  device.writePage(0, 1, pageIndex);
  device.invalidatePage(0, 0);
  device.writePage(1, 0, pageIndex);
  device.writePage(1, 2, pageIndex);

  mapping.writeMapping(0, FTL::PhysicalAddress(1, 0));
  mapping.writeMapping(1, FTL::PhysicalAddress(0, 1));
  mapping.writeMapping(2, FTL::PhysicalAddress(1, 1));

  FTL::PhysicalAddress addr;

  SECTION("Erase skipped") {
    FTL::BlockAllocator::BaselineAllocator allocator(object, ftlobject);

    ftlobject.pAllocator = &allocator;

    allocator.garbageCollect();

    REQUIRE(counters.gcInvocations == 1);
    REQUIRE(device.getBlock(0).getEraseCount() == 0);
    REQUIRE(device.getBlock(0).getValidPageCount() == 1);
    REQUIRE(mapping.readMapping(1, addr));
    REQUIRE(mapping.isCurrent(1, addr));
    REQUIRE(findStat(allocator, "gc.lost") == 0.);
  }

  SECTION("Legacy erase discards data") {
    config.writeBoolean(Section::FlashTranslation,
                        FTL::Config::Key::EraseOnPartialMigration, true);

    FTL::BlockAllocator::BaselineAllocator allocator(object, ftlobject);

    ftlobject.pAllocator = &allocator;

    allocator.garbageCollect();

    REQUIRE(device.getBlock(0).getEraseCount() == 1);
    REQUIRE(device.getBlock(0).getFreePageCount() == 2);
    REQUIRE(mapping.readMapping(1, addr));
    REQUIRE_FALSE(mapping.isCurrent(1, addr));
    REQUIRE(findStat(allocator, "gc.lost") == 1.);
  }
}
