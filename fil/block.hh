// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FIL_BLOCK_HH__
#define __FTLSIM_FIL_BLOCK_HH__

#include <vector>

#include "fil/def.hh"

namespace FTLSim::FIL {

/**
 * \brief Flash block
 *
 * Pages are programmed strictly in order, starting from the write cursor.
 * Free, valid and invalid page counts always sum up to page count.
 */
class Block {
 private:
  PBN idx;
  uint32_t pageCount;
  uint32_t nextWritePageIndex;

  uint32_t validPages;
  uint32_t invalidPages;
  uint32_t eraseCount;

  std::vector<Page> pages;

 public:
  Block(PBN, uint32_t);

  inline PBN getBlockIndex() const { return idx; }
  inline uint32_t getPageCount() const { return pageCount; }
  inline uint32_t getEraseCount() const { return eraseCount; }
  inline uint32_t getValidPageCount() const { return validPages; }
  inline uint32_t getInvalidPageCount() const { return invalidPages; }
  inline uint32_t getFreePageCount() const {
    return pageCount - nextWritePageIndex;
  }
  inline uint32_t getNextWritePageIndex() const { return nextWritePageIndex; }
  inline bool isFull() const { return nextWritePageIndex == pageCount; }

  const Page &getPage(uint32_t) const;

  Response write(LPN, uint32_t &);
  bool invalidate(uint32_t);
  void erase();
};

}  // namespace FTLSim::FIL

#endif
