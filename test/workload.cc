// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "workload/workload.hh"

#include <catch2/catch.hpp>

TEST_CASE("Workload") {
  using namespace FTLSim;
  using Pattern = Workload::Config::PatternType;

  ConfigReader config;
  Log log;

  log.init(nullptr, nullptr, nullptr, nullptr);

  ObjectData object(&config, &log);

  SECTION("Configured workload") {
    Workload::Workload workload(object, 2880);

    REQUIRE(workload.getPattern() == Pattern::Hotspot);
    REQUIRE(workload.getRange() == 2880);
    REQUIRE(workload.getHotRange() == 576);

    config.writeUint(Section::Workload, Workload::Config::Key::LogicalRange,
                     1000);

    Workload::Workload limited(object, 2880);

    REQUIRE(limited.getRange() == 1000);
  }

  SECTION("Sequential") {
    Workload::Workload workload(object, Pattern::Sequential, 5, .8, .2, 1);
    std::vector<LPN> list;

    workload.generate(list, 7);

    REQUIRE(list == std::vector<LPN>{0, 1, 2, 3, 4, 0, 1});
  }

  SECTION("Raw engine output") {
    // First output of std::mt19937 with default seed
    Workload::Workload workload(object, Pattern::Random, 4294967296ull, .8, .2,
                                5489);

    REQUIRE(workload.next() == 3499211612ull);
  }

  SECTION("Same seed, same sequence") {
    for (auto pattern : {Pattern::Random, Pattern::Hotspot, Pattern::Mixed}) {
      Workload::Workload a(object, pattern, 1000, .8, .2, 42);
      Workload::Workload b(object, pattern, 1000, .8, .2, 42);
      Workload::Workload c(object, pattern, 1000, .8, .2, 43);
      std::vector<LPN> la;
      std::vector<LPN> lb;
      std::vector<LPN> lc;

      a.generate(la, 1000);
      b.generate(lb, 1000);
      c.generate(lc, 1000);

      REQUIRE(la == lb);
      REQUIRE(la != lc);

      for (auto lpn : la) {
        REQUIRE(lpn < 1000);
      }
    }
  }

  SECTION("Hotspot skew") {
    Workload::Workload workload(object, Pattern::Hotspot, 1000, .8, .2, 5489);
    uint64_t hot = 0;

    REQUIRE(workload.getHotRange() == 200);

    for (int i = 0; i < 10000; i++) {
      if (workload.next() < 200) {
        hot++;
      }
    }

    REQUIRE(hot > 7700);
    REQUIRE(hot < 8300);
  }

  SECTION("Hotspot without cold region") {
    Workload::Workload workload(object, Pattern::Hotspot, 100, .5, 1., 7);

    for (int i = 0; i < 1000; i++) {
      REQUIRE(workload.next() < 100);
    }
  }

  SECTION("Hotspot without hot region") {
    Workload::Workload workload(object, Pattern::Hotspot, 100, .9, 0., 7);

    REQUIRE(workload.getHotRange() == 0);

    for (int i = 0; i < 1000; i++) {
      REQUIRE(workload.next() < 100);
    }
  }

  SECTION("Mixed follows sequence") {
    Workload::Workload workload(object, Pattern::Mixed, 1000000, .8, .2, 5489);
    LPN expected = 0;
    uint64_t sequential = 0;

    for (int i = 0; i < 1000; i++) {
      if (workload.next() == expected) {
        expected++;
        sequential++;
      }
    }

    REQUIRE(sequential > 400);
    REQUIRE(sequential < 600);
  }
}
