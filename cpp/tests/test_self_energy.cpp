// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <cdgw/data/errors.hpp>
#include <cdgw/data/self_energy.hpp>
#include <complex>
#include <filesystem>

#include "ut_common.hpp"

using namespace cdgw::data;

class SelfEnergyTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // Two orbitals, five samples each
    frequencies.resize(5, 2);
    correlation.resize(5, 2);
    for (Eigen::Index k = 0; k < 5; ++k) {
      frequencies(k, 0) = -0.5 + 0.1 * static_cast<double>(k - 2);
      frequencies(k, 1) = 0.2 + 0.1 * static_cast<double>(k - 2);
      correlation(k, 0) = {0.01 * static_cast<double>(k), -0.001};
      correlation(k, 1) = {-0.02 * static_cast<double>(k), 0.002};
    }
    reference.resize(2);
    reference << -0.5, 0.2;
    exchange.resize(2);
    exchange << -0.6, -0.1;
    vxc.resize(2);
    vxc << -0.55, -0.12;
  }

  void TearDown() override {
    std::filesystem::remove(testing::scratch_file("test.self_energy.json"));
    std::filesystem::remove(testing::scratch_file("test.self_energy.h5"));
  }

  SelfEnergy make() const {
    return SelfEnergy({1, 2}, reference, exchange, vxc, frequencies,
                      correlation);
  }

  Eigen::MatrixXd frequencies;
  Eigen::MatrixXcd correlation;
  Eigen::VectorXd reference;
  Eigen::VectorXd exchange;
  Eigen::VectorXd vxc;
};

TEST_F(SelfEnergyTest, Dimensions) {
  auto sigma = make();
  EXPECT_EQ(sigma.size(), 2u);
  EXPECT_EQ(sigma.get_num_frequencies(), 5u);
  EXPECT_EQ(sigma.find_column(2), 1u);
  EXPECT_THROW(sigma.find_column(0), std::out_of_range);
}

TEST_F(SelfEnergyTest, RejectsInconsistentShapes) {
  EXPECT_THROW(SelfEnergy({1, 2, 3}, reference, exchange, vxc, frequencies,
                          correlation),
               InconsistentInputShapes);
  EXPECT_THROW(SelfEnergy({1, 2}, reference, exchange, vxc,
                          frequencies.topRows(4), correlation),
               InconsistentInputShapes);
}

TEST_F(SelfEnergyTest, StaticAndTotal) {
  auto sigma = make();
  EXPECT_NEAR(sigma.get_static_part(0), -0.05, testing::numerical_zero_tolerance);
  EXPECT_NEAR(sigma.get_static_part(1), 0.02, testing::numerical_zero_tolerance);
  EXPECT_THROW(sigma.get_static_part(2), std::out_of_range);

  const Eigen::VectorXcd total = sigma.get_total(0);
  EXPECT_NEAR(total(3).real(), 0.03 - 0.05, testing::numerical_zero_tolerance);
  EXPECT_NEAR(total(3).imag(), -0.001, testing::numerical_zero_tolerance);
}

TEST_F(SelfEnergyTest, InterpolationIsLinear) {
  auto sigma = make();
  // On a sample
  const auto at_center = sigma.interpolate(1, 0.2);
  EXPECT_NEAR(at_center.real(), -0.04 + 0.02, 1e-12);
  // Halfway between samples 2 and 3
  const auto midway = sigma.interpolate(1, 0.25);
  EXPECT_NEAR(midway.real(), -0.05 + 0.02, 1e-12);
  EXPECT_NEAR(midway.imag(), 0.002, 1e-12);
  // Grid ends are inside the range
  EXPECT_NO_THROW(sigma.interpolate(0, -0.7));
  EXPECT_NO_THROW(sigma.interpolate(0, -0.3));
}

TEST_F(SelfEnergyTest, InterpolationOutsideGridThrows) {
  auto sigma = make();
  EXPECT_THROW(sigma.interpolate(0, -0.71), std::out_of_range);
  EXPECT_THROW(sigma.interpolate(1, 0.41), std::out_of_range);
  EXPECT_THROW(sigma.interpolate(2, 0.2), std::out_of_range);
}

TEST_F(SelfEnergyTest, JsonRoundTrip) {
  auto sigma = make();
  auto j = sigma.to_json();
  EXPECT_EQ(j["type"], "SelfEnergy");
  auto restored = SelfEnergy::from_json(j);
  EXPECT_EQ(restored->get_orbital_indices(), sigma.get_orbital_indices());
  EXPECT_TRUE(restored->get_correlation().isApprox(correlation,
                                                   testing::json_tolerance));
  EXPECT_TRUE(
      restored->get_frequencies().isApprox(frequencies, testing::json_tolerance));

  const auto filename = testing::scratch_file("test.self_energy.json");
  sigma.to_file(filename, "json");
  auto from_file = SelfEnergy::from_file(filename, "json");
  EXPECT_TRUE(from_file->get_vxc().isApprox(vxc, testing::json_tolerance));
}

TEST_F(SelfEnergyTest, Hdf5RoundTrip) {
  auto sigma = make();
  const auto filename = testing::scratch_file("test.self_energy.h5");
  sigma.to_hdf5_file(filename);
  auto restored = SelfEnergy::from_hdf5_file(filename);
  EXPECT_EQ(restored->get_orbital_indices(), sigma.get_orbital_indices());
  EXPECT_TRUE(restored->get_correlation().isApprox(correlation,
                                                   testing::hdf5_tolerance));
  EXPECT_TRUE(
      restored->get_exchange().isApprox(exchange, testing::hdf5_tolerance));
}

TEST_F(SelfEnergyTest, SummaryListsOrbitals) {
  auto sigma = make();
  EXPECT_NE(sigma.get_summary().find("SelfEnergy"), std::string::npos);
}
