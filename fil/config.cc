// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "fil/config.hh"

#include <limits>

namespace FTLSim::FIL {

const char NAME_BLOCK_COUNT[] = "BlockCount";
const char NAME_PAGE_COUNT[] = "PageCount";
const char NAME_OVERPROVISION_RATIO[] = "OverProvisioningRatio";

Config::Config() {
  blockCount = 50;
  pageCount = 64;
  overProvision = 0.1f;
}

void Config::loadFrom(pugi::xml_node &section) noexcept {
  for (auto node = section.first_child(); node; node = node.next_sibling()) {
    LOAD_NAME_UINT(node, NAME_BLOCK_COUNT, blockCount);
    LOAD_NAME_UINT(node, NAME_PAGE_COUNT, pageCount);
    LOAD_NAME_FLOAT(node, NAME_OVERPROVISION_RATIO, overProvision);
  }
}

void Config::storeTo(pugi::xml_node &section) noexcept {
  STORE_NAME_UINT(section, NAME_BLOCK_COUNT, blockCount);
  STORE_NAME_UINT(section, NAME_PAGE_COUNT, pageCount);
  STORE_NAME_FLOAT(section, NAME_OVERPROVISION_RATIO, overProvision);
}

void Config::update() noexcept {
  panic_if(pageCount == 0, "Block must contain at least one page.");
  panic_if(blockCount > std::numeric_limits<uint32_t>::max(),
           "Too many blocks.");
  panic_if(pageCount > std::numeric_limits<uint32_t>::max(),
           "Too many pages per block.");
  panic_if(overProvision < 0.f || overProvision >= 1.f,
           "Invalid OverProvisioningRatio.");
}

uint64_t Config::readUint(uint32_t idx) const noexcept {
  switch (idx) {
    case BlockCount:
      return blockCount;
    case PageCount:
      return pageCount;
  }

  return 0;
}

float Config::readFloat(uint32_t idx) const noexcept {
  switch (idx) {
    case OverProvisioningRatio:
      return overProvision;
  }

  return 0.f;
}

bool Config::writeUint(uint32_t idx, uint64_t value) noexcept {
  bool ret = true;

  switch (idx) {
    case BlockCount:
      blockCount = value;
      break;
    case PageCount:
      pageCount = value;
      break;
    default:
      ret = false;
      break;
  }

  return ret;
}

bool Config::writeFloat(uint32_t idx, float value) noexcept {
  bool ret = true;

  switch (idx) {
    case OverProvisioningRatio:
      overProvision = value;
      break;
    default:
      ret = false;
      break;
  }

  return ret;
}

}  // namespace FTLSim::FIL
