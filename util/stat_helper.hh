// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_UTIL_STAT_HELPER_HH__
#define __FTLSIM_UTIL_STAT_HELPER_HH__

#include <cinttypes>

namespace FTLSim {

class CountStat {
 private:
  uint64_t count;

 public:
  CountStat();
  virtual ~CountStat() {}

  void add() noexcept;
  void add(uint64_t) noexcept;

  uint64_t getCount() const noexcept;

  virtual void clear() noexcept;
};

}  // namespace FTLSim

#endif
