// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "ftl/allocator/baseline_allocator.hh"

#include "fil/device.hh"

namespace FTLSim::FTL::BlockAllocator {

BaselineAllocator::BaselineAllocator(ObjectData &o, FTLObjectData &fo)
    : AbstractAllocator(o, fo), cursor(0) {
  method = VictimSelectionFactory::createVictimSelectionAlgorithm(
      this, VictimSelectionID::Greedy);

  panic_if(!method, "Failed to create victim selection algorithm.");
}

Response BaselineAllocator::allocatePage(PhysicalAddress &addr,
                                         FIL::PBN exclude) {
  auto pDevice = ftlobject.pDevice;
  const uint32_t count = pDevice->getBlockCount();

  // Cursor stays on block while it has free page
  for (uint32_t i = 0; i < count; i++) {
    auto &block = pDevice->getBlock(cursor);

    if (cursor != exclude && !block.isFull()) {
      addr = PhysicalAddress(cursor, block.getNextWritePageIndex());

      return Response::Success;
    }

    cursor = (cursor + 1) % count;
  }

  return Response::AllocationExhausted;
}

FIL::PBN BaselineAllocator::getActiveBlock() const noexcept {
  return cursor;
}

}  // namespace FTLSim::FTL::BlockAllocator
