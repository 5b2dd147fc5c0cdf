// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "util/path.hh"

#include <filesystem>

namespace FTLSim::Path {

std::string joinPath(const char *prefix, const char *path) {
  std::filesystem::path ret(prefix);

  ret /= path;

  return ret.string();
}

bool comparePath(const std::string &prefix, const std::string &file1,
                 const std::string &file2) {
  if (file1.empty() || file2.empty()) {
    return false;
  }

  // Standard streams are compared by name
  if (file1 == file2) {
    return true;
  }

  std::filesystem::path a(joinPath(prefix.c_str(), file1.c_str()));
  std::filesystem::path b(joinPath(prefix.c_str(), file2.c_str()));
  std::error_code ec;

  return std::filesystem::equivalent(a, b, ec);
}

}  // namespace FTLSim::Path
