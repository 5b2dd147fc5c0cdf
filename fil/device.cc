// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "fil/device.hh"

#include <limits>

namespace FTLSim::FIL {

Device::Device(ObjectData &o)
    : Device(o,
             (uint32_t)o.config->readUint(Section::FlashInterface,
                                          Config::Key::BlockCount),
             (uint32_t)o.config->readUint(Section::FlashInterface,
                                          Config::Key::PageCount),
             o.config->readRatio(Section::FlashInterface,
                                 Config::Key::OverProvisioningRatio)) {}

Device::Device(ObjectData &o, uint32_t blockCount, uint32_t pageCount,
               double op)
    : Object(o), pagesPerBlock(pageCount), overProvisioningRatio(op) {
  panic_if(pageCount == 0, "Block must contain at least one page.");

  blocks.reserve(blockCount);

  for (uint32_t i = 0; i < blockCount; i++) {
    blocks.emplace_back(i, pagesPerBlock);
  }

  debugprint(Log::DebugID::FIL_Device,
             "Created | %u blocks x %u pages | OP %.2f", blockCount,
             pagesPerBlock, overProvisioningRatio);
}

Block &Device::getBlockInternal(PBN pbn) {
  panic_if(pbn >= blocks.size(), "Block index %u out of range.", pbn);

  return blocks[pbn];
}

//! Number of logical pages exposed to host
uint64_t Device::getLogicalPageCount() const {
  return (uint64_t)(getTotalPageCount() * (1. - overProvisioningRatio));
}

const Block &Device::getBlock(PBN pbn) const {
  return const_cast<Device *>(this)->getBlockInternal(pbn);
}

Response Device::writePage(PBN pbn, LPN lpn, uint32_t &pageIndex) {
  auto ret = getBlockInternal(pbn).write(lpn, pageIndex);

  if (ret == Response::Success) {
    programStat.add();

    debugprint(Log::DebugID::FIL_Device,
               "Program | LPN %" PRIu64 " -> (%u, %u)", lpn, pbn, pageIndex);
  }

  return ret;
}

bool Device::invalidatePage(PBN pbn, uint32_t pageIndex) {
  bool ret = getBlockInternal(pbn).invalidate(pageIndex);

  if (ret) {
    invalidateStat.add();
  }

  return ret;
}

void Device::erase(PBN pbn) {
  auto &block = getBlockInternal(pbn);

  block.erase();
  eraseStat.add();

  debugprint(Log::DebugID::FIL_Device, "Erase   | Block %u | P/E %u", pbn,
             block.getEraseCount());
}

uint64_t Device::getFreePageCount() const {
  uint64_t sum = 0;

  for (auto &block : blocks) {
    sum += block.getFreePageCount();
  }

  return sum;
}

uint64_t Device::getValidPageCount() const {
  uint64_t sum = 0;

  for (auto &block : blocks) {
    sum += block.getValidPageCount();
  }

  return sum;
}

uint64_t Device::getInvalidPageCount() const {
  uint64_t sum = 0;

  for (auto &block : blocks) {
    sum += block.getInvalidPageCount();
  }

  return sum;
}

void Device::getEraseCounts(std::vector<uint32_t> &list) const {
  list.clear();
  list.reserve(blocks.size());

  for (auto &block : blocks) {
    list.push_back(block.getEraseCount());
  }
}

uint32_t Device::getMaxEraseCount() const {
  uint32_t ret = 0;

  for (auto &block : blocks) {
    ret = MAX(ret, block.getEraseCount());
  }

  return ret;
}

uint32_t Device::getMinEraseCount() const {
  uint32_t ret = std::numeric_limits<uint32_t>::max();

  if (blocks.empty()) {
    return 0;
  }

  for (auto &block : blocks) {
    ret = MIN(ret, block.getEraseCount());
  }

  return ret;
}

void Device::getStatList(std::vector<Stat> &list, std::string prefix) noexcept {
  list.emplace_back(prefix + "program", "Total programmed pages");
  list.emplace_back(prefix + "invalidate", "Total invalidated pages");
  list.emplace_back(prefix + "erase", "Total erased blocks");
  list.emplace_back(prefix + "page.free", "Free pages in device");
  list.emplace_back(prefix + "page.valid", "Valid pages in device");
  list.emplace_back(prefix + "page.invalid", "Invalid pages in device");
}

void Device::getStatValues(std::vector<double> &values) noexcept {
  values.push_back((double)programStat.getCount());
  values.push_back((double)invalidateStat.getCount());
  values.push_back((double)eraseStat.getCount());
  values.push_back((double)getFreePageCount());
  values.push_back((double)getValidPageCount());
  values.push_back((double)getInvalidPageCount());
}

void Device::resetStatValues() noexcept {
  programStat.clear();
  invalidateStat.clear();
  eraseStat.clear();
}

}  // namespace FTLSim::FIL
