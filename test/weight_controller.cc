// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2026 FTLSim Developers
 */

#include "ftl/allocator/weight_controller.hh"

#include <catch2/catch.hpp>
#include <random>

TEST_CASE("WeightController") {
  using namespace FTLSim::FTL::BlockAllocator;

  WeightController controller;

  REQUIRE(controller.getWeights().alpha == 1.);
  REQUIRE(controller.getWeights().beta == 1.);
  REQUIRE(controller.getWeights().gamma == 1.);
  REQUIRE(controller.getWAFAverage() == 1.);
  REQUIRE(controller.getVarianceAverage() == 0.);

  SECTION("Within targets") {
    controller.update(1., 0.);

    REQUIRE(controller.getRoundCount() == 1);
    REQUIRE(controller.getWeights().alpha == Approx(1.));
    REQUIRE(controller.getWeights().beta == Approx(1.));
    REQUIRE(controller.getWeights().gamma == Approx(1.));
  }

  SECTION("Moving average") {
    controller.update(3., 50.);

    REQUIRE(controller.getWAFAverage() == Approx(1.2));
    REQUIRE(controller.getVarianceAverage() == Approx(5.));
  }

  SECTION("High variance") {
    controller.update(1., 1000.);

    REQUIRE(controller.getVarianceAverage() == Approx(100.));
    REQUIRE(controller.getWeights().alpha == Approx(.99));
    REQUIRE(controller.getWeights().beta == Approx(1.05));
    REQUIRE(controller.getWeights().gamma == Approx(1.));
  }

  SECTION("Sustained high WAF") {
    for (int i = 0; i < 200; i++) {
      controller.update(5., 0.);
    }

    REQUIRE(controller.getWAFAverage() < 6.);
    REQUIRE(controller.getEmergencyCount() == 0);
    REQUIRE(controller.getWeights().alpha == Approx(WeightController::MaxWeight));
    REQUIRE(controller.getWeights().gamma == Approx(WeightController::MaxWeight));
    REQUIRE(controller.getWeights().beta == Approx(WeightController::MinWeight));
  }

  SECTION("Emergency profile") {
    controller.update(100., 1000.);

    REQUIRE(controller.getWAFAverage() == Approx(10.9));
    REQUIRE(controller.getEmergencyCount() == 1);
    REQUIRE(controller.getWeights().alpha == WeightController::EmergencyAlpha);
    REQUIRE(controller.getWeights().beta == WeightController::EmergencyBeta);
    REQUIRE(controller.getWeights().gamma == WeightController::EmergencyGamma);
  }

  SECTION("Weights stay in range") {
    std::mt19937 engine(42);
    std::uniform_real_distribution<double> waf(1., 10.);
    std::uniform_real_distribution<double> variance(0., 500.);

    for (int i = 0; i < 2000; i++) {
      controller.update(waf(engine), variance(engine));

      auto &weights = controller.getWeights();

      REQUIRE(weights.alpha >= WeightController::MinWeight);
      REQUIRE(weights.alpha <= WeightController::MaxWeight);
      REQUIRE(weights.beta >= WeightController::MinWeight);
      REQUIRE(weights.beta <= WeightController::MaxWeight);
      REQUIRE(weights.gamma >= WeightController::MinWeight);
      REQUIRE(weights.gamma <= WeightController::MaxWeight);
    }

    REQUIRE(controller.getRoundCount() == 2000);
  }
}
