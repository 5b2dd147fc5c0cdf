// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "sim/log.hh"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <vector>

#include "util/algorithm.hh"

namespace FTLSim {

//! A constructor
Log::Log() : inited(false), out(nullptr), err(nullptr), debug(nullptr) {}

//! A destructor
Log::~Log() {
  if (inited) {
    deinit();
  }
}

/**
 * \brief Initialize log system
 *
 * Initialize log system by provided stream. Any stream can be nullptr, which
 * disables the corresponding output.
 *
 * \param[in]  t         Function returning current simulation tick
 * \param[in]  outfile   std::ostream object for output file
 * \param[in]  errfile   std::ostream object for error file
 * \param[in]  debugfile std::ostream object for debug log file
 */
void Log::init(TickFunction t, std::ostream *outfile, std::ostream *errfile,
               std::ostream *debugfile) noexcept {
  tick = std::move(t);

  out = outfile;
  err = errfile;
  debug = debugfile;

  inited = true;
}

//! Deinitialize log system
void Log::deinit() noexcept {
  inited = false;
}

void Log::write(std::ostream *stream, const std::string &prefix,
                const char *format, va_list args) const noexcept {
  va_list copied;
  std::vector<char> str;

  va_copy(copied, args);
  str.resize(vsnprintf(nullptr, 0, format, copied) + 1);
  va_end(copied);
  vsnprintf(str.data(), str.size(), format, args);

  if (LIKELY(stream->good())) {
    *stream << (tick ? tick() : 0) << ": " << prefix << ": " << str.data()
            << std::endl;
  }
  else {
    std::cerr << "panic: Stream is not opened" << std::endl;

    abort();
  }
}

void Log::print(LogID id, const char *format, va_list args) const noexcept {
  std::ostream *stream = nullptr;

  if (UNLIKELY(!inited)) {
    std::cerr << "panic: Log system not initialized" << std::endl;

    abort();
  }

  switch (id) {
    case LogID::Info:
      stream = out;

      break;
    case LogID::Warn:
    case LogID::Panic:
      stream = err;

      break;
    default:
      std::cerr << "panic: Undefined Log ID: " << (uint32_t)id << std::endl;

      abort();

      break;
  }

  if (stream) {
    write(stream, logPrefix[(uint32_t)id], format, args);
  }

  if (id == LogID::Panic) {
    abort();
  }
}

void Log::debugprint(DebugID id, const char *format,
                     va_list args) const noexcept {
  if (UNLIKELY(!inited)) {
    std::cerr << "panic: Log system not initialized" << std::endl;

    abort();
  }

  if (UNLIKELY(!debug)) {
    return;
  }

  write(debug, idPrefix[(uint32_t)id], format, args);
}

}  // namespace FTLSim
