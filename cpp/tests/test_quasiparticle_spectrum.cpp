// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <cdgw/data/quasiparticle_spectrum.hpp>
#include <cmath>
#include <filesystem>
#include <limits>

#include "ut_common.hpp"

using namespace cdgw::data;

class QuasiparticleSpectrumTest : public ::testing::Test {
 protected:
  void SetUp() override {
    QuasiparticleSolution homo;
    homo.orbital_index = 1;
    homo.reference_energy = -0.5;
    homo.exchange_minus_vxc = -0.02;
    homo.correlation_at_reference = {0.03, -0.001};
    homo.linearized_z = 0.9;
    homo.linearized_energy = -0.491;
    homo.roots = {{-0.6, -0.2, RootQuality::PoleCrossing},
                  {-0.4911, 0.89, RootQuality::Physical}};
    homo.primary_root = 1;

    QuasiparticleSolution lumo;
    lumo.orbital_index = 2;
    lumo.reference_energy = 0.2;
    lumo.linearized_z = std::numeric_limits<double>::quiet_NaN();
    lumo.linearized_energy = std::numeric_limits<double>::quiet_NaN();
    lumo.issues = {QuasiparticleIssue::DegenerateLinearization,
                   QuasiparticleIssue::NoRootFound};

    spectrum = std::make_shared<QuasiparticleSpectrum>(
        std::vector<QuasiparticleSolution>{homo, lumo}, "analytic");
  }

  void TearDown() override {
    std::filesystem::remove(
        testing::scratch_file("test.quasiparticle_spectrum.json"));
    std::filesystem::remove(
        testing::scratch_file("test.quasiparticle_spectrum.h5"));
  }

  std::shared_ptr<QuasiparticleSpectrum> spectrum;
};

TEST_F(QuasiparticleSpectrumTest, EnumNames) {
  for (auto quality : {RootQuality::Physical, RootQuality::PoleCrossing,
                       RootQuality::UnphysicalZ}) {
    EXPECT_EQ(root_quality_from_string(to_string(quality)), quality);
  }
  for (auto issue : {QuasiparticleIssue::DegenerateLinearization,
                     QuasiparticleIssue::NoRootFound}) {
    EXPECT_EQ(quasiparticle_issue_from_string(to_string(issue)), issue);
  }
  EXPECT_EQ(to_string(RootQuality::PoleCrossing), "pole_crossing");
  EXPECT_THROW(root_quality_from_string("good"), std::invalid_argument);
  EXPECT_THROW(quasiparticle_issue_from_string("diverged"),
               std::invalid_argument);
}

TEST_F(QuasiparticleSpectrumTest, Accessors) {
  EXPECT_EQ(spectrum->size(), 2u);
  EXPECT_EQ(spectrum->get_screened_interaction_algorithm(), "analytic");
  EXPECT_TRUE(spectrum->has_issues());

  const auto& homo = spectrum->get_solution(1);
  EXPECT_FALSE(homo.has_issue(QuasiparticleIssue::NoRootFound));
  EXPECT_DOUBLE_EQ(homo.get_primary_root().energy, -0.4911);

  const auto& lumo = spectrum->get_solution(2);
  EXPECT_TRUE(lumo.has_issue(QuasiparticleIssue::NoRootFound));
  EXPECT_THROW(lumo.get_primary_root(), std::runtime_error);

  EXPECT_THROW(spectrum->get_solution(0), std::out_of_range);
}

TEST_F(QuasiparticleSpectrumTest, EnergyVectors) {
  const Eigen::VectorXd graphical = spectrum->get_graphical_energies();
  EXPECT_DOUBLE_EQ(graphical(0), -0.4911);
  EXPECT_TRUE(std::isnan(graphical(1)));

  const Eigen::VectorXd linearized = spectrum->get_linearized_energies();
  EXPECT_DOUBLE_EQ(linearized(0), -0.491);
  EXPECT_TRUE(std::isnan(linearized(1)));
}

TEST_F(QuasiparticleSpectrumTest, SummaryReportsIssues) {
  const auto summary = spectrum->get_summary();
  EXPECT_NE(summary.find("analytic"), std::string::npos);
  EXPECT_NE(summary.find("no_root_found"), std::string::npos);
  EXPECT_NE(summary.find("2 roots"), std::string::npos);
}

TEST_F(QuasiparticleSpectrumTest, JsonRoundTripKeepsNaN) {
  auto restored = QuasiparticleSpectrum::from_json(spectrum->to_json());
  ASSERT_EQ(restored->size(), 2u);
  EXPECT_EQ(restored->get_screened_interaction_algorithm(), "analytic");

  const auto& homo = restored->get_solution(1);
  ASSERT_EQ(homo.roots.size(), 2u);
  EXPECT_EQ(homo.roots[0].quality, RootQuality::PoleCrossing);
  ASSERT_TRUE(homo.primary_root.has_value());
  EXPECT_EQ(*homo.primary_root, 1u);
  EXPECT_NEAR(homo.correlation_at_reference.imag(), -0.001,
              testing::json_tolerance);

  const auto& lumo = restored->get_solution(2);
  EXPECT_TRUE(std::isnan(lumo.linearized_z));
  EXPECT_FALSE(lumo.primary_root.has_value());
  EXPECT_EQ(lumo.issues.size(), 2u);

  const auto filename =
      testing::scratch_file("test.quasiparticle_spectrum.json");
  spectrum->to_json_file(filename);
  EXPECT_EQ(QuasiparticleSpectrum::from_json_file(filename)->size(), 2u);
}

TEST_F(QuasiparticleSpectrumTest, Hdf5RoundTrip) {
  const auto filename = testing::scratch_file("test.quasiparticle_spectrum.h5");
  spectrum->to_file(filename, "hdf5");
  auto restored = QuasiparticleSpectrum::from_file(filename, "hdf5");
  ASSERT_EQ(restored->size(), 2u);

  const auto& homo = restored->get_solution(1);
  ASSERT_EQ(homo.roots.size(), 2u);
  EXPECT_NEAR(homo.roots[1].z, 0.89, testing::hdf5_tolerance);
  EXPECT_EQ(homo.roots[1].quality, RootQuality::Physical);
  EXPECT_TRUE(homo.primary_root_unique);

  const auto& lumo = restored->get_solution(2);
  EXPECT_TRUE(lumo.roots.empty());
  EXPECT_TRUE(lumo.has_issue(QuasiparticleIssue::DegenerateLinearization));
  EXPECT_TRUE(std::isnan(lumo.linearized_energy));
}
