// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include <iostream>

#include "sim/config_reader.hh"
#include "sim/simulator.hh"
#include "sim/version.hh"

void printUsage(const char *prog) {
  std::cerr << "FTLSim " << FTLSIM_VERSION << std::endl;
  std::cerr << " Usage: " << prog << " <config.xml> [<dump.xml>]" << std::endl;
  std::cerr << "  config.xml: Simulation configuration file" << std::endl;
  std::cerr << "  dump.xml:   Save effective configuration to this file"
            << std::endl;
}

int main(int argc, char *argv[]) {
  if (argc < 2 || argc > 3) {
    printUsage(argv[0]);

    return 1;
  }

  FTLSim::ConfigReader config;
  FTLSim::Simulator simulator;

  config.load(argv[1]);

  if (argc == 3) {
    std::string path(argv[2]);

    config.save(path);
  }

  simulator.init(&config);
  simulator.run();
  simulator.deinit();

  return 0;
}
