// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_FTL_OBJECT_HH__
#define __FTLSIM_FTL_OBJECT_HH__

namespace FTLSim {

namespace FIL {

class Device;

}

namespace FTL {

class FTL;
struct RunCounters;

namespace Mapping {

class PageLevelMapping;

}

namespace BlockAllocator {

class AbstractAllocator;

}

//! Encapsulates all FTL models
struct FTLObjectData {
  FIL::Device *pDevice;
  Mapping::PageLevelMapping *pMapping;
  BlockAllocator::AbstractAllocator *pAllocator;
  RunCounters *pCounters;

  FTLObjectData()
      : pDevice(nullptr),
        pMapping(nullptr),
        pAllocator(nullptr),
        pCounters(nullptr) {}
};

}  // namespace FTL

}  // namespace FTLSim

#endif
