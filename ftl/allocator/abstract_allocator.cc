// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "ftl/allocator/abstract_allocator.hh"

#include "fil/device.hh"
#include "ftl/mapping/page_level_mapping.hh"

namespace FTLSim::FTL::BlockAllocator {

AbstractAllocator::AbstractAllocator(ObjectData &o, FTLObjectData &fo)
    : Object(o),
      ftlobject(fo),
      method(nullptr),
      eraseOnPartialMigration(readConfigBoolean(
          Section::FlashTranslation, Config::Key::EraseOnPartialMigration)) {
  panic_if(!ftlobject.pDevice, "Device not attached to block allocator.");
}

AbstractAllocator::~AbstractAllocator() {
  delete method;
}

FIL::Device *AbstractAllocator::getDevice() noexcept {
  return ftlobject.pDevice;
}

void AbstractAllocator::garbageCollect() {
  ftlobject.pCounters->gcInvocations++;
  gcStat.add();

  auto victim = method->getVictim();

  if (victim == FIL::InvalidPBN) {
    skipStat.add();

    debugprint(getDebugID(), "GC      | No victim block");

    return;
  }

  if (!reclaimBlock(victim)) {
    debugprint(getDebugID(), "GC      | Block %u kept", victim);
  }
}

bool AbstractAllocator::reclaimBlock(FIL::PBN victim) {
  auto pDevice = ftlobject.pDevice;
  auto &block = pDevice->getBlock(victim);
  const uint32_t written = block.getNextWritePageIndex();
  uint64_t copied = 0;
  bool complete = true;

  debugprint(getDebugID(), "GC      | Victim %u | valid %u | invalid %u",
             victim, block.getValidPageCount(), block.getInvalidPageCount());

  for (uint32_t i = 0; i < written; i++) {
    PhysicalAddress addr;
    uint32_t pageIndex = 0;

    if (block.getPage(i).state != FIL::PageState::Valid) {
      continue;
    }

    if (allocatePage(addr, victim) != Response::Success) {
      complete = false;

      break;
    }

    LPN lpn = block.getPage(i).lpn;
    auto ret = pDevice->writePage(addr.blockID, lpn, pageIndex);

    panic_if(ret != Response::Success || pageIndex != addr.pageIndex,
             "BlockAllocator corrupted.");

    ftlobject.pMapping->writeMapping(lpn, addr);
    pDevice->invalidatePage(victim, i);

    ftlobject.pCounters->physicalWrites++;
    copied++;
  }

  copyStat.add(copied);

  if (!complete) {
    uint32_t remaining = block.getValidPageCount();

    if (!eraseOnPartialMigration) {
      warn("Migration from block %u stopped with %u valid pages left. Erase "
           "skipped.",
           victim, remaining);

      return false;
    }

    warn("Migration from block %u stopped. %u valid pages discarded.", victim,
         remaining);

    lostStat.add(remaining);
  }

  pDevice->erase(victim);
  reclaimStat.add();

  debugprint(getDebugID(), "GC      | Block %u erased | %" PRIu64 " pages copied",
             victim, copied);

  return true;
}

void AbstractAllocator::getStatList(std::vector<Stat> &list,
                                    std::string prefix) noexcept {
  list.emplace_back(prefix + "gc.invocations", "Total GC invocations");
  list.emplace_back(prefix + "gc.block", "Total reclaimed blocks in GC");
  list.emplace_back(prefix + "gc.copy", "Total valid page copy");
  list.emplace_back(prefix + "gc.lost", "Valid pages discarded by GC");
  list.emplace_back(prefix + "gc.skip", "GC invocations without victim");
}

void AbstractAllocator::getStatValues(std::vector<double> &values) noexcept {
  values.push_back((double)gcStat.getCount());
  values.push_back((double)reclaimStat.getCount());
  values.push_back((double)copyStat.getCount());
  values.push_back((double)lostStat.getCount());
  values.push_back((double)skipStat.getCount());
}

void AbstractAllocator::resetStatValues() noexcept {
  gcStat.clear();
  reclaimStat.clear();
  copyStat.clear();
  lostStat.clear();
  skipStat.clear();
}

}  // namespace FTLSim::FTL::BlockAllocator
