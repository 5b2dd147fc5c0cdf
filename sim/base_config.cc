// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "sim/base_config.hh"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <regex>
#include <vector>

namespace FTLSim {

const std::regex regexInteger("(\\d+)([kKmMgGtT]?)",
                              std::regex_constants::ECMAScript);

struct UnitSuffix {
  char suffix;
  uint64_t multiplier;
};

const UnitSuffix unitSuffixList[] = {
    {'k', 1000ull},          {'K', 1024ull},
    {'m', 1000000ull},       {'M', 1048576ull},
    {'g', 1000000000ull},    {'G', 1073741824ull},
    {'t', 1000000000000ull}, {'T', 1099511627776ull},
};

static void printMessage(const char *prefix, const char *format,
                         va_list args) {
  va_list copy;
  std::vector<char> str;

  va_copy(copy, args);
  str.resize(vsnprintf(nullptr, 0, format, copy) + 1);
  va_end(copy);
  vsnprintf(str.data(), str.size(), format, args);

  std::cerr << prefix << str.data() << std::endl;
}

BaseConfig::BaseConfig() {}

/**
 * \brief Convert string to unsigned integer
 *
 * Accepts decimal number with optional SI (k, m, g, t) or binary (K, M, G, T)
 * suffix.
 *
 * \param[in]  value String to convert
 * \param[out] valid Set to true when value is well-formed
 * \return Converted value, 0 when malformed
 */
uint64_t BaseConfig::convertUint(const char *value, bool *valid) noexcept {
  uint64_t ret = 0;
  std::cmatch match;
  bool matched = std::regex_match(value, match, regexInteger);

  if (valid) {
    *valid = matched;
  }

  if (!matched) {
    return 0;
  }

  ret = (uint64_t)strtoull(match[1].str().c_str(), nullptr, 10);

  if (match[2].length() > 0) {
    char suffix = match[2].str().at(0);

    for (auto &unit : unitSuffixList) {
      if (unit.suffix == suffix) {
        ret *= unit.multiplier;

        break;
      }
    }
  }

  return ret;
}

bool BaseConfig::isSection(pugi::xml_node &node) noexcept {
  return strcmp(node.name(), CONFIG_SECTION_NAME) == 0;
}

bool BaseConfig::isKey(pugi::xml_node &node) noexcept {
  return strcmp(node.name(), CONFIG_KEY_NAME) == 0;
}

// Configuration is validated before Log exists, so messages go to stderr
void BaseConfig::panic_if(bool eval, const char *format, ...) noexcept {
  if (eval) {
    va_list args;

    va_start(args, format);
    printMessage("panic: ", format, args);
    va_end(args);

    abort();
  }
}

void BaseConfig::warn_if(bool eval, const char *format, ...) noexcept {
  if (eval) {
    va_list args;

    va_start(args, format);
    printMessage("warn: ", format, args);
    va_end(args);
  }
}

}  // namespace FTLSim
