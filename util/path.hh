// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#pragma once

#ifndef __FTLSIM_UTIL_PATH_HH__
#define __FTLSIM_UTIL_PATH_HH__

#include <string>

namespace FTLSim::Path {

//! Join directory prefix and file name, file name wins if absolute
std::string joinPath(const char *prefix, const char *path);

//! True if both names under prefix refer to same file
bool comparePath(const std::string &prefix, const std::string &file1,
                 const std::string &file2);

}  // namespace FTLSim::Path

#endif
