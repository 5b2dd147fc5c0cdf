// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FTL_MAPPING_PAGE_LEVEL_MAPPING_HH__
#define __FTLSIM_FTL_MAPPING_PAGE_LEVEL_MAPPING_HH__

#include <unordered_map>

#include "ftl/def.hh"
#include "ftl/object.hh"
#include "util/stat_helper.hh"

namespace FTLSim::FTL::Mapping {

/**
 * \brief Page-level mapping table
 *
 * Maps logical page to physical page. Entry is created on first write and
 * replaced on every rewrite or GC copy. Entry is never removed.
 */
class PageLevelMapping : public Object {
 private:
  FTLObjectData &ftlobject;

  std::unordered_map<LPN, PhysicalAddress> table;

  CountStat readStat;
  CountStat writeStat;

 public:
  PageLevelMapping(ObjectData &, FTLObjectData &);

  /**
   * \brief Lookup mapping table
   *
   * \param[in]  lpn  Logical page number
   * \param[out] addr Mapped physical page, untouched if not mapped
   * \return True if lpn has ever been written
   */
  bool readMapping(LPN lpn, PhysicalAddress &addr);

  //! Create or replace mapping of lpn
  void writeMapping(LPN lpn, const PhysicalAddress &addr);

  /**
   * \brief Check physical page still holds data of logical page
   *
   * \return True if page is valid and tagged with lpn
   */
  bool isCurrent(LPN lpn, const PhysicalAddress &addr) const;

  inline uint64_t getMappedPageCount() const { return table.size(); }

  void getStatList(std::vector<Stat> &, std::string) noexcept override;
  void getStatValues(std::vector<double> &) noexcept override;
  void resetStatValues() noexcept override;
};

}  // namespace FTLSim::FTL::Mapping

#endif
