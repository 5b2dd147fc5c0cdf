// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "ftl/ftl.hh"

#include "fil/device.hh"
#include "ftl/allocator/adaptive_allocator.hh"
#include "ftl/allocator/baseline_allocator.hh"
#include "ftl/mapping/page_level_mapping.hh"
#include "ftl/metrics.hh"

namespace FTLSim::FTL {

FTL::FTL(ObjectData &o, FIL::Device *d)
    : FTL(o, d,
          (Config::StrategyType)o.config->readUint(Section::FlashTranslation,
                                                   Config::Key::Strategy)) {}

FTL::FTL(ObjectData &o, FIL::Device *d, Config::StrategyType s)
    : Object(o),
      strategy(s),
      baseThreshold(
          readConfigRatio(Section::FlashTranslation, Config::Key::BaseThreshold)),
      wafFactor(
          readConfigRatio(Section::FlashTranslation, Config::Key::WAFFactor)),
      varianceFactor(readConfigRatio(Section::FlashTranslation,
                                     Config::Key::VarianceFactor)),
      clampThreshold(readConfigBoolean(Section::FlashTranslation,
                                       Config::Key::ClampThreshold)),
      maxEraseLimit(readConfigUint(Section::Simulation,
                                   FTLSim::Config::Key::MaxEraseLimit)) {
  panic_if(!d, "FTL requires flash device.");

  ftlobject.pDevice = d;
  ftlobject.pCounters = &counters;
  ftlobject.pMapping = new Mapping::PageLevelMapping(object, ftlobject);

  switch (strategy) {
    case Config::StrategyType::Baseline:
      ftlobject.pAllocator =
          new BlockAllocator::BaselineAllocator(object, ftlobject);
      break;
    case Config::StrategyType::Adaptive:
      ftlobject.pAllocator =
          new BlockAllocator::AdaptiveAllocator(object, ftlobject);
      break;
    default:
      panic("Unexpected strategy.");
      break;
  }

  debugprint(Log::DebugID::FTL,
             "Created | %s strategy | %u blocks x %u pages | %" PRIu64
             " logical pages",
             strategy == Config::StrategyType::Adaptive ? "Adaptive"
                                                        : "Baseline",
             d->getBlockCount(), d->getPagesPerBlock(),
             d->getLogicalPageCount());
}

FTL::~FTL() {
  delete ftlobject.pAllocator;
  delete ftlobject.pMapping;
}

double FTL::getGCThreshold() const {
  double threshold = baseThreshold + wafFactor * getWAF() -
                     varianceFactor * getWearVariance();

  if (clampThreshold) {
    threshold = CLAMP(threshold, 0., 1.);
  }

  return threshold;
}

bool FTL::checkGCTrigger() const {
  auto pDevice = ftlobject.pDevice;
  auto total = pDevice->getTotalPageCount();

  if (pDevice->getFreePageCount() <= pDevice->getPagesPerBlock()) {
    return true;
  }

  double ratio =
      total > 0 ? (double)pDevice->getInvalidPageCount() / total : 0.;

  return ratio > getGCThreshold();
}

Response FTL::write(LPN lpn) {
  auto pDevice = ftlobject.pDevice;
  auto pMapping = ftlobject.pMapping;
  auto pAllocator = ftlobject.pAllocator;
  PhysicalAddress addr;
  uint32_t pageIndex = 0;

  counters.hostWrites++;

  if (checkGCTrigger()) {
    triggeredGCStat.add();

    pAllocator->garbageCollect();
  }

  // Old copy becomes stale
  if (pMapping->readMapping(lpn, addr) && pMapping->isCurrent(lpn, addr)) {
    pDevice->invalidatePage(addr.blockID, addr.pageIndex);
  }

  if (pAllocator->allocatePage(addr) != Response::Success) {
    forcedGCStat.add();

    debugprint(Log::DebugID::FTL, "Write   | LPN %" PRIu64 " | Forced GC",
               lpn);

    pAllocator->garbageCollect();

    if (pAllocator->allocatePage(addr) != Response::Success) {
      counters.hostWrites--;
      failedWriteStat.add();

      warn("Storage exhausted while writing LPN %" PRIu64 ".", lpn);

      return Response::StorageExhausted;
    }
  }

  auto ret = pDevice->writePage(addr.blockID, lpn, pageIndex);

  panic_if(ret != Response::Success || pageIndex != addr.pageIndex,
           "BlockAllocator corrupted.");

  pMapping->writeMapping(lpn, addr);

  counters.physicalWrites++;

  pAllocator->notifyHostWrite(counters.hostWrites);

  return Response::Success;
}

Response FTL::read(LPN lpn, PhysicalAddress &addr) {
  auto pMapping = ftlobject.pMapping;
  PhysicalAddress found;

  if (!pMapping->readMapping(lpn, found)) {
    return Response::NotMapped;
  }

  if (!pMapping->isCurrent(lpn, found)) {
    lostReadStat.add();

    warn("Data of LPN %" PRIu64 " is lost.", lpn);

    return Response::NotMapped;
  }

  addr = found;

  return Response::Success;
}

const FIL::Device &FTL::getDevice() const {
  return *ftlobject.pDevice;
}

double FTL::getWAF() const {
  return calculateWAF(counters);
}

double FTL::getWearVariance() const {
  return calculateWearVariance(*ftlobject.pDevice);
}

double FTL::getLifetimeEstimate() const {
  return calculateLifetime(*ftlobject.pDevice, counters, maxEraseLimit);
}

const BlockAllocator::Weights *FTL::getWeights() const {
  if (strategy != Config::StrategyType::Adaptive) {
    return nullptr;
  }

  auto pAdaptive =
      static_cast<BlockAllocator::AdaptiveAllocator *>(ftlobject.pAllocator);

  return &pAdaptive->getController().getWeights();
}

void FTL::getStatList(std::vector<Stat> &list, std::string prefix) noexcept {
  list.emplace_back(prefix + "host_writes", "Host write count");
  list.emplace_back(prefix + "physical_writes",
                    "Physical page writes including GC copy");
  list.emplace_back(prefix + "failed_writes", "Writes failed with no space");
  list.emplace_back(prefix + "waf", "Write amplification factor");
  list.emplace_back(prefix + "wear_variance", "Variance of erase counts");
  list.emplace_back(prefix + "erase.max", "Largest erase count");
  list.emplace_back(prefix + "erase.min", "Smallest erase count");
  list.emplace_back(prefix + "gc.triggered", "GC started by trigger");
  list.emplace_back(prefix + "gc.forced", "GC started by allocation failure");
  list.emplace_back(prefix + "read.lost", "Reads of lost data");

  ftlobject.pMapping->getStatList(list, prefix);
  ftlobject.pAllocator->getStatList(list, prefix);
}

void FTL::getStatValues(std::vector<double> &values) noexcept {
  values.push_back((double)counters.hostWrites);
  values.push_back((double)counters.physicalWrites);
  values.push_back((double)failedWriteStat.getCount());
  values.push_back(getWAF());
  values.push_back(getWearVariance());
  values.push_back((double)ftlobject.pDevice->getMaxEraseCount());
  values.push_back((double)ftlobject.pDevice->getMinEraseCount());
  values.push_back((double)triggeredGCStat.getCount());
  values.push_back((double)forcedGCStat.getCount());
  values.push_back((double)lostReadStat.getCount());

  ftlobject.pMapping->getStatValues(values);
  ftlobject.pAllocator->getStatValues(values);
}

void FTL::resetStatValues() noexcept {
  triggeredGCStat.clear();
  forcedGCStat.clear();
  failedWriteStat.clear();
  lostReadStat.clear();

  ftlobject.pMapping->resetStatValues();
  ftlobject.pAllocator->resetStatValues();
}

}  // namespace FTLSim::FTL
