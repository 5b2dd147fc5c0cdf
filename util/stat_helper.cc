// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "util/stat_helper.hh"

namespace FTLSim {

CountStat::CountStat() : count(0) {}

void CountStat::add() noexcept {
  count++;
}

void CountStat::add(uint64_t v) noexcept {
  count += v;
}

uint64_t CountStat::getCount() const noexcept {
  return count;
}

void CountStat::clear() noexcept {
  count = 0;
}

}  // namespace FTLSim
