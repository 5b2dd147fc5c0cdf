// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_SIM_TYPES_HH__
#define __FTLSIM_SIM_TYPES_HH__

#include <cinttypes>

namespace FTLSim {

/**
 * \brief Result of device, allocator and FTL operations
 *
 * Every failure is recoverable by the layer above it, except
 * StorageExhausted and NotMapped which are returned to the host.
 */
enum class Response : uint8_t {
  Success,
  Full,                 //!< Block has no free page left
  AllocationExhausted,  //!< No block in device has a free page
  StorageExhausted,     //!< Write failed even after forced GC
  NotMapped,            //!< Logical page has no valid physical copy
};

inline const char *getResponseName(Response r) noexcept {
  switch (r) {
    case Response::Success:
      return "Success";
    case Response::Full:
      return "Full";
    case Response::AllocationExhausted:
      return "AllocationExhausted";
    case Response::StorageExhausted:
      return "StorageExhausted";
    case Response::NotMapped:
      return "NotMapped";
  }

  return "Unknown";
}

}  // namespace FTLSim

#endif
