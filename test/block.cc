// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "fil/block.hh"

#include <catch2/catch.hpp>

TEST_CASE("Block") {
  using namespace FTLSim;

  FIL::Block block(3, 4);
  uint32_t pageIndex = 0;

  REQUIRE(block.getBlockIndex() == 3);
  REQUIRE(block.getFreePageCount() == 4);
  REQUIRE(block.getEraseCount() == 0);

  SECTION("Append only write") {
    for (uint32_t i = 0; i < 4; i++) {
      REQUIRE(block.write(100 + i, pageIndex) == Response::Success);
      REQUIRE(pageIndex == i);
      REQUIRE(block.getPage(i).state == FIL::PageState::Valid);
      REQUIRE(block.getPage(i).lpn == 100 + i);
    }

    REQUIRE(block.isFull());
    REQUIRE(block.getValidPageCount() == 4);
    REQUIRE(block.write(200, pageIndex) == Response::Full);
    REQUIRE(block.getValidPageCount() == 4);
    REQUIRE(block.getEraseCount() == 0);
  }

  SECTION("Invalidate is idempotent") {
    block.write(1, pageIndex);
    block.write(2, pageIndex);

    REQUIRE(block.invalidate(0));
    REQUIRE_FALSE(block.invalidate(0));
    REQUIRE(block.getPage(0).state == FIL::PageState::Invalid);
    REQUIRE(block.getPage(0).lpn == 1);
    REQUIRE(block.getValidPageCount() == 1);
    REQUIRE(block.getInvalidPageCount() == 1);

    // Free and out of range pages
    REQUIRE_FALSE(block.invalidate(3));
    REQUIRE_FALSE(block.invalidate(10));
    REQUIRE(block.getPage(3).state == FIL::PageState::Free);
    REQUIRE(block.getInvalidPageCount() == 1);
  }

  SECTION("Erase resets pages") {
    block.write(1, pageIndex);
    block.write(2, pageIndex);
    block.write(3, pageIndex);
    block.invalidate(1);

    block.erase();

    REQUIRE(block.getEraseCount() == 1);
    REQUIRE(block.getNextWritePageIndex() == 0);
    REQUIRE(block.getFreePageCount() == 4);
    REQUIRE(block.getValidPageCount() == 0);
    REQUIRE(block.getInvalidPageCount() == 0);

    for (uint32_t i = 0; i < 4; i++) {
      REQUIRE(block.getPage(i).state == FIL::PageState::Free);
      REQUIRE(block.getPage(i).lpn == InvalidLPN);
    }

    // Erase never checks valid pages
    block.erase();

    REQUIRE(block.getEraseCount() == 2);
  }

  SECTION("Page counts add up to capacity") {
    block.write(1, pageIndex);
    REQUIRE(block.getFreePageCount() + block.getValidPageCount() +
                block.getInvalidPageCount() ==
            block.getPageCount());

    block.write(2, pageIndex);
    block.invalidate(0);
    REQUIRE(block.getFreePageCount() + block.getValidPageCount() +
                block.getInvalidPageCount() ==
            block.getPageCount());
  }
}
