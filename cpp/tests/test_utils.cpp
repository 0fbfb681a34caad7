// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <cdgw/utils/logger.hpp>
#include <cdgw/utils/omp_utils.hpp>
#include <cdgw/utils/quadrature.hpp>
#include <cdgw/utils/string_utils.hpp>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "ut_common.hpp"

using namespace cdgw::utils;

class QuadratureTest : public ::testing::Test {};

TEST_F(QuadratureTest, SinglePointRule) {
  auto [nodes, weights] = gauss_legendre(1);
  ASSERT_EQ(nodes.size(), 1);
  EXPECT_NEAR(nodes(0), 0.0, testing::numerical_zero_tolerance);
  EXPECT_NEAR(weights(0), 2.0, testing::numerical_zero_tolerance);
}

TEST_F(QuadratureTest, ZeroOrderThrows) {
  EXPECT_THROW(gauss_legendre(0), std::invalid_argument);
}

TEST_F(QuadratureTest, NodesSortedAndSymmetric) {
  auto [nodes, weights] = gauss_legendre(17);
  for (Eigen::Index i = 1; i < nodes.size(); ++i) {
    EXPECT_LT(nodes(i - 1), nodes(i));
  }
  for (Eigen::Index i = 0; i < nodes.size(); ++i) {
    const Eigen::Index mirror = nodes.size() - 1 - i;
    EXPECT_NEAR(nodes(i), -nodes(mirror), 1e-13);
    EXPECT_NEAR(weights(i), weights(mirror), 1e-13);
    EXPECT_GT(weights(i), 0.0);
  }
  EXPECT_NEAR(weights.sum(), 2.0, 1e-13);
}

TEST_F(QuadratureTest, ExactForPolynomials) {
  // An n-point rule integrates polynomials up to degree 2n - 1 exactly
  const std::size_t order = 6;
  auto [nodes, weights] = gauss_legendre(order);
  for (int degree = 0; degree <= 2 * static_cast<int>(order) - 1; ++degree) {
    const double exact = degree % 2 == 1 ? 0.0 : 2.0 / (degree + 1);
    double approx = 0.0;
    for (Eigen::Index i = 0; i < nodes.size(); ++i) {
      approx += weights(i) * std::pow(nodes(i), degree);
    }
    EXPECT_NEAR(approx, exact, 1e-13) << "degree " << degree;
  }
}

TEST(StringUtilsTest, SnakeCase) {
  EXPECT_EQ(to_snake_case("SelfEnergy"), "self_energy");
  EXPECT_EQ(to_snake_case("ThreeCenterIntegrals"), "three_center_integrals");
  EXPECT_EQ(to_snake_case("QuasiparticleSpectrum"), "quasiparticle_spectrum");
  EXPECT_EQ(to_snake_case("GWResult"), "gw_result");
  EXPECT_EQ(to_snake_case("orbitals"), "orbitals");
}

TEST(StringUtilsTest, JoinAndLower) {
  EXPECT_EQ(join({"cd", "contour_deformation"}, ", "),
            "cd, contour_deformation");
  EXPECT_EQ(join({}, ", "), "");
  EXPECT_EQ(to_lower("HDF5"), "hdf5");
}

TEST(OmpUtilsTest, ResolveNumThreads) {
  EXPECT_EQ(resolve_num_threads(3), 3);
  EXPECT_GE(resolve_num_threads(0), 1);
  EXPECT_GE(resolve_num_threads(-2), 1);
}

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override { saved_ = Logger::get_global_level(); }
  void TearDown() override { Logger::set_global_level(saved_); }

  LogLevel saved_ = LogLevel::info;
};

TEST_F(LoggerTest, SetAndGetLevel) {
  Logger::set_global_level(LogLevel::error);
  EXPECT_EQ(Logger::get_global_level(), LogLevel::error);
  EXPECT_EQ(Logger::get()->name(), "cdgw");
}

TEST_F(LoggerTest, ScopedLevelRestores) {
  Logger::set_global_level(LogLevel::warn);
  {
    ScopedLogLevel scope(LogLevel::debug);
    EXPECT_EQ(Logger::get_global_level(), LogLevel::debug);
  }
  EXPECT_EQ(Logger::get_global_level(), LogLevel::warn);
}

TEST_F(LoggerTest, ScopedLevelNeverRaisesThreshold) {
  Logger::set_global_level(LogLevel::trace);
  {
    ScopedLogLevel scope(LogLevel::debug);
    EXPECT_EQ(Logger::get_global_level(), LogLevel::trace);
  }
  EXPECT_EQ(Logger::get_global_level(), LogLevel::trace);
}

TEST_F(LoggerTest, LevelConversionRoundTrip) {
  for (auto level : {LogLevel::trace, LogLevel::debug, LogLevel::info,
                     LogLevel::warn, LogLevel::error, LogLevel::critical,
                     LogLevel::off}) {
    EXPECT_EQ(Logger::from_spdlog_level(Logger::to_spdlog_level(level)), level);
  }
}
