// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "fil/block.hh"

namespace FTLSim::FIL {

Block::Block(PBN blockIdx, uint32_t count)
    : idx(blockIdx),
      pageCount(count),
      nextWritePageIndex(0),
      validPages(0),
      invalidPages(0),
      eraseCount(0),
      pages(count) {}

//! Get page at index. Index must be smaller than page count.
const Page &Block::getPage(uint32_t pageIndex) const {
  return pages.at(pageIndex);
}

/**
 * \brief Program next free page
 *
 * \param[in]  lpn        Logical page stored in new page
 * \param[out] pageIndex  Index of programmed page
 * \return Response::Full when block has no free page
 */
Response Block::write(LPN lpn, uint32_t &pageIndex) {
  if (nextWritePageIndex >= pageCount) {
    return Response::Full;
  }

  pageIndex = nextWritePageIndex++;

  auto &page = pages[pageIndex];

  page.state = PageState::Valid;
  page.lpn = lpn;

  validPages++;

  return Response::Success;
}

/**
 * \brief Mark page as invalid
 *
 * Only valid page changes its state. LPN of page is preserved.
 *
 * \return True if page was valid
 */
bool Block::invalidate(uint32_t pageIndex) {
  if (pageIndex >= pageCount) {
    return false;
  }

  auto &page = pages[pageIndex];

  if (page.state != PageState::Valid) {
    return false;
  }

  page.state = PageState::Invalid;

  validPages--;
  invalidPages++;

  return true;
}

//! Erase block. Valid pages are discarded without check.
void Block::erase() {
  for (auto &page : pages) {
    page = Page();
  }

  nextWritePageIndex = 0;
  validPages = 0;
  invalidPages = 0;
  eraseCount++;
}

}  // namespace FTLSim::FIL
