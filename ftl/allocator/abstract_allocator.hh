// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FTL_ALLOCATOR_ABSTRACT_ALLOCATOR_HH__
#define __FTLSIM_FTL_ALLOCATOR_ABSTRACT_ALLOCATOR_HH__

#include "ftl/allocator/victim_selection.hh"
#include "ftl/def.hh"
#include "ftl/object.hh"
#include "util/stat_helper.hh"

namespace FTLSim::FTL::BlockAllocator {

/**
 * \brief Block allocator and garbage collector
 *
 * Decides where new pages are written and which block is reclaimed by GC.
 * Concrete allocators differ in allocation order and victim selection policy,
 * valid page migration is shared.
 */
class AbstractAllocator : public Object {
 protected:
  FTLObjectData &ftlobject;

  AbstractVictimSelection *method;

  const bool eraseOnPartialMigration;

  CountStat gcStat;
  CountStat reclaimStat;
  CountStat copyStat;
  CountStat lostStat;
  CountStat skipStat;

  /**
   * \brief Move valid pages out of victim and erase it
   *
   * Valid pages are copied in page order to blocks other than victim. Victim
   * is erased only when all valid pages are moved, unless
   * EraseOnPartialMigration is set.
   *
   * \param[in] victim  Victim block index
   * \return True if victim is erased
   */
  bool reclaimBlock(FIL::PBN victim);

  //! Logging category of derived class
  virtual Log::DebugID getDebugID() const noexcept = 0;

 public:
  AbstractAllocator(ObjectData &, FTLObjectData &);
  virtual ~AbstractAllocator();

  FIL::Device *getDevice() noexcept;

  /**
   * \brief Find free page
   *
   * Returned address is next write position of selected block. Caller must
   * program the page before calling this function again.
   *
   * \param[out] addr     Physical address of free page
   * \param[in]  exclude  Block which must not be selected
   * \return Response::AllocationExhausted if no block has free page
   */
  virtual Response allocatePage(PhysicalAddress &addr,
                                FIL::PBN exclude = FIL::InvalidPBN) = 0;

  /**
   * \brief Block currently receiving new pages
   *
   * \return Block index, FIL::InvalidPBN if allocator does not keep one.
   */
  virtual FIL::PBN getActiveBlock() const noexcept {
    return FIL::InvalidPBN;
  }

  /**
   * \brief Run one garbage collection pass
   *
   * Always counted as one GC invocation, even when no victim is found.
   */
  virtual void garbageCollect();

  /**
   * \brief Notify host write completed
   *
   * Called by FTL after every successful host write.
   *
   * \param[in] hostWrites  Number of host writes so far
   */
  virtual void notifyHostWrite(uint64_t hostWrites) { (void)hostWrites; }

  void getStatList(std::vector<Stat> &, std::string) noexcept override;
  void getStatValues(std::vector<double> &) noexcept override;
  void resetStatValues() noexcept override;
};

}  // namespace FTLSim::FTL::BlockAllocator

#endif
