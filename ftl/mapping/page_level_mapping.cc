// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "ftl/mapping/page_level_mapping.hh"

#include "fil/device.hh"

namespace FTLSim::FTL::Mapping {

PageLevelMapping::PageLevelMapping(ObjectData &o, FTLObjectData &fo)
    : Object(o), ftlobject(fo) {
  panic_if(!ftlobject.pDevice, "Device not attached to mapping table.");

  table.reserve(ftlobject.pDevice->getLogicalPageCount());
}

bool PageLevelMapping::readMapping(LPN lpn, PhysicalAddress &addr) {
  readStat.add();

  auto iter = table.find(lpn);

  if (iter == table.end()) {
    return false;
  }

  addr = iter->second;

  return true;
}

void PageLevelMapping::writeMapping(LPN lpn, const PhysicalAddress &addr) {
  panic_if(!addr.isValid(), "Invalid physical address for LPN %" PRIu64 ".",
           lpn);
  panic_if(addr.blockID >= ftlobject.pDevice->getBlockCount() ||
               addr.pageIndex >= ftlobject.pDevice->getPagesPerBlock(),
           "Physical address (%u, %u) out of range.", addr.blockID,
           addr.pageIndex);

  writeStat.add();

  table[lpn] = addr;

  debugprint(Log::DebugID::FTL_PageLevel, "Map     | LPN %" PRIu64 " -> (%u, %u)",
             lpn, addr.blockID, addr.pageIndex);
}

bool PageLevelMapping::isCurrent(LPN lpn, const PhysicalAddress &addr) const {
  if (!addr.isValid() || addr.blockID >= ftlobject.pDevice->getBlockCount() ||
      addr.pageIndex >= ftlobject.pDevice->getPagesPerBlock()) {
    return false;
  }

  auto &page =
      ftlobject.pDevice->getBlock(addr.blockID).getPage(addr.pageIndex);

  return page.state == FIL::PageState::Valid && page.lpn == lpn;
}

void PageLevelMapping::getStatList(std::vector<Stat> &list,
                                   std::string prefix) noexcept {
  list.emplace_back(prefix + "mapping.read", "Mapping table lookups");
  list.emplace_back(prefix + "mapping.write", "Mapping table updates");
  list.emplace_back(prefix + "mapping.entries", "Mapped logical pages");
}

void PageLevelMapping::getStatValues(std::vector<double> &values) noexcept {
  values.push_back((double)readStat.getCount());
  values.push_back((double)writeStat.getCount());
  values.push_back((double)table.size());
}

void PageLevelMapping::resetStatValues() noexcept {
  readStat.clear();
  writeStat.clear();
}

}  // namespace FTLSim::FTL::Mapping
