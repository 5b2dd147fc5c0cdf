// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "sim/config.hh"

namespace FTLSim {

const char NAME_OUTPUT_DIRECTORY[] = "OutputDirectory";
const char NAME_OUTPUT_FILE[] = "OutputFile";
const char NAME_ERROR_FILE[] = "ErrorFile";
const char NAME_DEBUG_FILE[] = "DebugFile";
const char NAME_CHECKPOINT_INTERVAL[] = "CheckpointInterval";
const char NAME_MAX_ERASE_LIMIT[] = "MaxEraseLimit";
const char NAME_COMPARE[] = "CompareStrategies";

//! A constructor
Config::Config() {
  outputDirectory = ".";
  outputFile = FILE_STDOUT;
  errorFile = FILE_STDERR;
  debugFile = "";
  checkpointInterval = 1000;
  maxEraseLimit = 10000;
  compare = false;
}

void Config::loadFrom(pugi::xml_node &section) noexcept {
  for (auto node = section.first_child(); node; node = node.next_sibling()) {
    LOAD_NAME_STRING(node, NAME_OUTPUT_DIRECTORY, outputDirectory);
    LOAD_NAME_STRING(node, NAME_OUTPUT_FILE, outputFile);
    LOAD_NAME_STRING(node, NAME_ERROR_FILE, errorFile);
    LOAD_NAME_STRING(node, NAME_DEBUG_FILE, debugFile);
    LOAD_NAME_UINT(node, NAME_CHECKPOINT_INTERVAL, checkpointInterval);
    LOAD_NAME_UINT(node, NAME_MAX_ERASE_LIMIT, maxEraseLimit);
    LOAD_NAME_BOOLEAN(node, NAME_COMPARE, compare);
  }
}

void Config::storeTo(pugi::xml_node &section) noexcept {
  // Assume section node is empty
  STORE_NAME_STRING(section, NAME_OUTPUT_DIRECTORY, outputDirectory);
  STORE_NAME_STRING(section, NAME_OUTPUT_FILE, outputFile);
  STORE_NAME_STRING(section, NAME_ERROR_FILE, errorFile);
  STORE_NAME_STRING(section, NAME_DEBUG_FILE, debugFile);
  STORE_NAME_UINT(section, NAME_CHECKPOINT_INTERVAL, checkpointInterval);
  STORE_NAME_UINT(section, NAME_MAX_ERASE_LIMIT, maxEraseLimit);
  STORE_NAME_BOOLEAN(section, NAME_COMPARE, compare);
}

void Config::update() noexcept {
  panic_if(checkpointInterval == 0, "CheckpointInterval must be non-zero.");
  panic_if(maxEraseLimit == 0, "MaxEraseLimit must be non-zero.");
}

uint64_t Config::readUint(uint32_t idx) const noexcept {
  switch (idx) {
    case CheckpointInterval:
      return checkpointInterval;
    case MaxEraseLimit:
      return maxEraseLimit;
  }

  return 0;
}

std::string Config::readString(uint32_t idx) const noexcept {
  switch (idx) {
    case OutputDirectory:
      return outputDirectory;
    case OutputFile:
      return outputFile;
    case ErrorFile:
      return errorFile;
    case DebugFile:
      return debugFile;
  }

  return "";
}

bool Config::readBoolean(uint32_t idx) const noexcept {
  switch (idx) {
    case CompareStrategies:
      return compare;
  }

  return false;
}

bool Config::writeUint(uint32_t idx, uint64_t value) noexcept {
  bool ret = true;

  switch (idx) {
    case CheckpointInterval:
      checkpointInterval = value;
      break;
    case MaxEraseLimit:
      maxEraseLimit = value;
      break;
    default:
      ret = false;
      break;
  }

  return ret;
}

bool Config::writeString(uint32_t idx, std::string &value) noexcept {
  bool ret = true;

  switch (idx) {
    case OutputDirectory:
      outputDirectory = value;
      break;
    case OutputFile:
      outputFile = value;
      break;
    case ErrorFile:
      errorFile = value;
      break;
    case DebugFile:
      debugFile = value;
      break;
    default:
      ret = false;
      break;
  }

  return ret;
}

bool Config::writeBoolean(uint32_t idx, bool value) noexcept {
  bool ret = true;

  switch (idx) {
    case CompareStrategies:
      compare = value;
      break;
    default:
      ret = false;
      break;
  }

  return ret;
}

}  // namespace FTLSim
