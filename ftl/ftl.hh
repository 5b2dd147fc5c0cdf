// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FTL_FTL_HH__
#define __FTLSIM_FTL_FTL_HH__

#include "ftl/allocator/weight_controller.hh"
#include "ftl/def.hh"
#include "ftl/object.hh"
#include "util/stat_helper.hh"

namespace FTLSim::FTL {

/**
 * \brief Flash translation layer
 *
 * Owns mapping table, block allocator and run counters on top of a flash
 * device. Every host write goes through GC trigger check, invalidation of old
 * copy, page allocation and mapping update.
 */
class FTL : public Object {
 private:
  FTLObjectData ftlobject;
  RunCounters counters;

  const Config::StrategyType strategy;

  const double baseThreshold;
  const double wafFactor;
  const double varianceFactor;
  const bool clampThreshold;
  const uint64_t maxEraseLimit;

  CountStat triggeredGCStat;
  CountStat forcedGCStat;
  CountStat failedWriteStat;
  CountStat lostReadStat;

 public:
  FTL(ObjectData &, FIL::Device *);
  FTL(ObjectData &, FIL::Device *, Config::StrategyType);
  ~FTL();

  /**
   * \brief Write one logical page
   *
   * \param[in] lpn Logical page number
   * \return Response::StorageExhausted if no free page even after forced GC
   */
  Response write(LPN lpn);

  /**
   * \brief Find physical location of logical page
   *
   * \param[in]  lpn  Logical page number
   * \param[out] addr Physical page holding data of lpn
   * \return Response::NotMapped if lpn has no valid copy
   */
  Response read(LPN lpn, PhysicalAddress &addr);

  //! Dynamic invalid page ratio threshold of GC trigger
  double getGCThreshold() const;

  //! True if GC should run before next write
  bool checkGCTrigger() const;

  inline Config::StrategyType getStrategy() const { return strategy; }
  inline const RunCounters &getCounters() const { return counters; }
  inline uint64_t getHostWrites() const { return counters.hostWrites; }
  inline uint64_t getPhysicalWrites() const {
    return counters.physicalWrites;
  }
  inline uint64_t getGCInvocations() const { return counters.gcInvocations; }

  const FIL::Device &getDevice() const;

  double getWAF() const;
  double getWearVariance() const;
  double getLifetimeEstimate() const;

  /**
   * \brief Current victim scoring weights
   *
   * \return nullptr when strategy is not adaptive
   */
  const BlockAllocator::Weights *getWeights() const;

  void getStatList(std::vector<Stat> &, std::string) noexcept override;
  void getStatValues(std::vector<double> &) noexcept override;
  void resetStatValues() noexcept override;
};

}  // namespace FTLSim::FTL

#endif
