// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FIL_DEVICE_HH__
#define __FTLSIM_FIL_DEVICE_HH__

#include <vector>

#include "fil/block.hh"
#include "util/stat_helper.hh"

namespace FTLSim::FIL {

/**
 * \brief Flash device object declaration
 *
 * Fixed array of blocks. Provides block-level program, invalidate and erase
 * operations and device-wide page statistics. Has no knowledge of mapping or
 * allocation policy.
 */
class Device : public Object {
 private:
  const uint32_t pagesPerBlock;
  const double overProvisioningRatio;

  std::vector<Block> blocks;

  CountStat programStat;
  CountStat invalidateStat;
  CountStat eraseStat;

  Block &getBlockInternal(PBN);

 public:
  Device(ObjectData &);
  Device(ObjectData &, uint32_t, uint32_t, double);

  inline uint32_t getBlockCount() const {
    return static_cast<uint32_t>(blocks.size());
  }
  inline uint32_t getPagesPerBlock() const { return pagesPerBlock; }
  inline double getOverProvisioningRatio() const {
    return overProvisioningRatio;
  }
  inline uint64_t getTotalPageCount() const {
    return (uint64_t)blocks.size() * pagesPerBlock;
  }

  uint64_t getLogicalPageCount() const;

  const Block &getBlock(PBN) const;

  /**
   * \brief Program next free page of block
   *
   * \param[in]  pbn        Physical block index
   * \param[in]  lpn        Logical page to store
   * \param[out] pageIndex  Index of programmed page
   * \return Response::Full if block has no free page
   */
  Response writePage(PBN pbn, LPN lpn, uint32_t &pageIndex);

  /**
   * \brief Invalidate page
   *
   * No-op when page is not valid.
   *
   * \return True if page state changed
   */
  bool invalidatePage(PBN pbn, uint32_t pageIndex);

  /**
   * \brief Erase block
   *
   * All pages become free regardless of their state, and erase count of block
   * increases. Caller must migrate valid pages before erase.
   */
  void erase(PBN pbn);

  uint64_t getFreePageCount() const;
  uint64_t getValidPageCount() const;
  uint64_t getInvalidPageCount() const;

  void getEraseCounts(std::vector<uint32_t> &) const;
  uint32_t getMaxEraseCount() const;
  uint32_t getMinEraseCount() const;

  void getStatList(std::vector<Stat> &, std::string) noexcept override;
  void getStatValues(std::vector<double> &) noexcept override;
  void resetStatValues() noexcept override;
};

}  // namespace FTLSim::FIL

#endif
