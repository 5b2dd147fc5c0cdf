// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "sim/config_reader.hh"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include "sim/version.hh"

namespace FTLSim {

//! ConfigReader constructor
ConfigReader::ConfigReader() {}

//! ConfigReader destructor
ConfigReader::~ConfigReader() {}

BaseConfig *ConfigReader::getSection(Section section) noexcept {
  switch (section) {
    case Section::Simulation:
      return &simConfig;
    case Section::FlashInterface:
      return &filConfig;
    case Section::FlashTranslation:
      return &ftlConfig;
    case Section::Workload:
      return &workloadConfig;
  }

  return nullptr;
}

const BaseConfig *ConfigReader::getSection(Section section) const noexcept {
  return const_cast<ConfigReader *>(this)->getSection(section);
}

/**
 * \brief Load configuration from file
 *
 * Sections not present in file keep their default values. All sections are
 * validated after parsing.
 *
 * \param[in] path Input file path
 */
void ConfigReader::load(const char *path) noexcept {
  auto result = file.load_file(
      path, pugi::parse_default | pugi::parse_trim_pcdata, pugi::encoding_utf8);

  if (!result) {
    std::cerr << "Failed to parse configuration file: " << result.description()
              << std::endl;

    abort();
  }

  // Check node
  auto config = file.child(CONFIG_NODE_NAME);

  if (config) {
    // Check version
    auto version = config.attribute("version").value();

    if (strcmp(version, FTLSIM_VERSION) != 0) {
      std::cerr << "FTLSim configuration file version is different."
                << std::endl;
      std::cerr << " File version: " << version << std::endl;
      std::cerr << " Program version: " << FTLSIM_VERSION << std::endl;
    }

    // Travel sections
    for (auto section = config.first_child(); section;
         section = section.next_sibling()) {
      if (strcmp(section.name(), CONFIG_SECTION_NAME)) {
        continue;
      }

      auto name = section.attribute(CONFIG_ATTRIBUTE).value();

      if (strcmp(name, simConfig.getSectionName()) == 0) {
        simConfig.loadFrom(section);
      }
      else if (strcmp(name, filConfig.getSectionName()) == 0) {
        filConfig.loadFrom(section);
      }
      else if (strcmp(name, ftlConfig.getSectionName()) == 0) {
        ftlConfig.loadFrom(section);
      }
      else if (strcmp(name, workloadConfig.getSectionName()) == 0) {
        workloadConfig.loadFrom(section);
      }
    }

    // Update config objects
    simConfig.update();
    filConfig.update();
    ftlConfig.update();
    workloadConfig.update();
  }
  else {
    std::cerr << "Configuration file has no <" CONFIG_NODE_NAME "> node."
              << std::endl;
  }

  // Close
  file.reset();
}

//! Load configuration from file
void ConfigReader::load(std::string &path) noexcept {
  load(path.c_str());
}

/**
 * \brief Save configuration to file
 *
 * \param[in] path Output file path
 */
void ConfigReader::save(const char *path) noexcept {
  // Create ftlsim node
  auto config = file.append_child(CONFIG_NODE_NAME);
  config.append_attribute("version").set_value(FTLSIM_VERSION);

  // Append configuration sections
  pugi::xml_node section;

  STORE_SECTION(config, simConfig.getSectionName(), section);
  simConfig.storeTo(section);

  STORE_SECTION(config, filConfig.getSectionName(), section);
  filConfig.storeTo(section);

  STORE_SECTION(config, ftlConfig.getSectionName(), section);
  ftlConfig.storeTo(section);

  STORE_SECTION(config, workloadConfig.getSectionName(), section);
  workloadConfig.storeTo(section);

  auto result =
      file.save_file(path, "  ", pugi::format_default, pugi::encoding_utf8);

  if (!result) {
    std::cerr << "Failed to save configuration file" << std::endl;

    abort();
  }

  file.reset();
}

//! Save configuration to file
void ConfigReader::save(std::string &path) noexcept {
  save(path.c_str());
}

//! Read configuration as uint64
uint64_t ConfigReader::readUint(Section section, uint32_t key) const noexcept {
  auto pConfig = getSection(section);

  return pConfig ? pConfig->readUint(key) : 0ull;
}

//! Read configuration as float
float ConfigReader::readFloat(Section section, uint32_t key) const noexcept {
  auto pConfig = getSection(section);

  return pConfig ? pConfig->readFloat(key) : 0.f;
}

/**
 * \brief Read configuration as decimal ratio
 *
 * Float keys lose precision (0.1 becomes 0.100000001). Value is rounded to six
 * decimal places so that products with page counts are exact.
 */
double ConfigReader::readRatio(Section section, uint32_t key) const noexcept {
  return std::round(readFloat(section, key) * 1e6) / 1e6;
}

//! Read configuration as string
std::string ConfigReader::readString(Section section,
                                     uint32_t key) const noexcept {
  auto pConfig = getSection(section);

  return pConfig ? pConfig->readString(key) : std::string();
}

//! Read configuration as boolean
bool ConfigReader::readBoolean(Section section, uint32_t key) const noexcept {
  auto pConfig = getSection(section);

  return pConfig ? pConfig->readBoolean(key) : false;
}

//! Write configuration as uint64
bool ConfigReader::writeUint(Section section, uint32_t key,
                             uint64_t value) noexcept {
  auto pConfig = getSection(section);

  return pConfig ? pConfig->writeUint(key, value) : false;
}

//! Write configuration as float
bool ConfigReader::writeFloat(Section section, uint32_t key,
                              float value) noexcept {
  auto pConfig = getSection(section);

  return pConfig ? pConfig->writeFloat(key, value) : false;
}

//! Write configuration as string
bool ConfigReader::writeString(Section section, uint32_t key,
                               std::string value) noexcept {
  auto pConfig = getSection(section);

  return pConfig ? pConfig->writeString(key, value) : false;
}

//! Write configuration as boolean
bool ConfigReader::writeBoolean(Section section, uint32_t key,
                                bool value) noexcept {
  auto pConfig = getSection(section);

  return pConfig ? pConfig->writeBoolean(key, value) : false;
}

}  // namespace FTLSim
