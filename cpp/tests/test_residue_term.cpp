// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <cdgw/data/errors.hpp>
#include <cdgw/data/frequency_grid.hpp>
#include <complex>
#include <memory>
#include <vector>

#include "cdgw/algorithms/builtin/integral_term.hpp"
#include "cdgw/algorithms/builtin/residue_term.hpp"
#include "cdgw/algorithms/builtin/screened_interaction.hpp"
#include "ut_common.hpp"

using namespace cdgw::algorithms::builtin;
using cdgw::data::FrequencyGrid;

TEST(PoleEnclosureTest, ClassifyOccupiedPoles) {
  // Occupied poles are enclosed when omega lies below them
  EXPECT_EQ(classify_pole(true, -0.5, -0.7), PoleEnclosure::EnclosedNegative);
  EXPECT_EQ(classify_pole(true, -0.5, -0.3), PoleEnclosure::NotEnclosed);
  EXPECT_EQ(classify_pole(true, -0.5, -0.5), PoleEnclosure::NotEnclosed);
}

TEST(PoleEnclosureTest, ClassifyVirtualPoles) {
  EXPECT_EQ(classify_pole(false, 0.2, 0.3), PoleEnclosure::EnclosedPositive);
  EXPECT_EQ(classify_pole(false, 0.2, 0.1), PoleEnclosure::NotEnclosed);
  EXPECT_EQ(classify_pole(false, 0.2, 0.2), PoleEnclosure::NotEnclosed);
}

TEST(PoleEnclosureTest, ClassifyExhaustively) {
  const std::vector<double> energies = {-1.0, -0.3, 0.0, 0.25, 0.9};
  for (bool occupied : {true, false}) {
    for (double eps_q : energies) {
      for (double omega : energies) {
        const auto enclosure = classify_pole(occupied, eps_q, omega);
        if (occupied && omega < eps_q) {
          EXPECT_EQ(enclosure, PoleEnclosure::EnclosedNegative);
        } else if (!occupied && eps_q < omega) {
          EXPECT_EQ(enclosure, PoleEnclosure::EnclosedPositive);
        } else {
          EXPECT_EQ(enclosure, PoleEnclosure::NotEnclosed);
        }
      }
    }
  }
}

TEST(PoleEnclosureTest, SignsAndNames) {
  EXPECT_EQ(enclosure_sign(PoleEnclosure::EnclosedPositive), 1);
  EXPECT_EQ(enclosure_sign(PoleEnclosure::EnclosedNegative), -1);
  EXPECT_EQ(enclosure_sign(PoleEnclosure::NotEnclosed), 0);
  EXPECT_EQ(to_string(PoleEnclosure::EnclosedNegative), "enclosed_negative");
  EXPECT_EQ(to_string(PoleEnclosure::NotEnclosed), "not_enclosed");
}

TEST(PoleEnclosureTest, PoleOnContour) {
  EXPECT_TRUE(pole_on_contour(0.2, 0.2));
  EXPECT_TRUE(pole_on_contour(0.2, 0.2 + 0.5 * contour_tie_tolerance));
  EXPECT_FALSE(pole_on_contour(0.2, 0.2 + 2.0 * contour_tie_tolerance));
}

class ResidueTermTest : public ::testing::Test {
 protected:
  void SetUp() override {
    orbitals = testing::create_test_orbitals();
    integrals = testing::create_test_integrals();
    grid = std::make_shared<FrequencyGrid>(40, 11, 0.01);
    w = std::make_unique<AnalyticScreenedInteraction>(
        orbitals, integrals, grid, std::vector<std::size_t>{1, 2}, 1e-3, 1);
  }

  std::shared_ptr<cdgw::data::Orbitals> orbitals;
  std::shared_ptr<cdgw::data::ThreeCenterIntegrals> integrals;
  std::shared_ptr<FrequencyGrid> grid;
  std::unique_ptr<AnalyticScreenedInteraction> w;
};

TEST_F(ResidueTermTest, NoResidueInsideTheGap) {
  for (std::size_t n : {1u, 2u}) {
    const auto r = residue_term(*w, n, -0.1);
    EXPECT_EQ(r, std::complex<double>(0.0, 0.0)) << "n = " << n;
  }
}

TEST_F(ResidueTermTest, VirtualPoleBelowOmega) {
  // Only the pole at 0.2 lies between the Fermi level and omega = 0.3
  for (std::size_t n : {1u, 2u}) {
    const auto r = residue_term(*w, n, 0.3);
    const auto expected = w->real_axis(2, n, 0.1);
    EXPECT_NEAR(r.real(), expected.real(), testing::self_energy_tolerance);
    EXPECT_NEAR(r.imag(), expected.imag(), testing::self_energy_tolerance);
  }
}

TEST_F(ResidueTermTest, OccupiedPoleAboveOmega) {
  for (std::size_t n : {1u, 2u}) {
    const auto r = residue_term(*w, n, -0.7);
    const auto expected = -w->real_axis(1, n, 0.2);
    EXPECT_NEAR(r.real(), expected.real(), testing::self_energy_tolerance);
    EXPECT_NEAR(r.imag(), expected.imag(), testing::self_energy_tolerance);
  }
}

TEST_F(ResidueTermTest, PoleOnContourContributesHalf) {
  const auto r = residue_term(*w, 2, 0.2);
  const auto expected = 0.5 * w->real_axis(2, 2, 0.0);
  EXPECT_NEAR(r.real(), expected.real(), testing::self_energy_tolerance);
  EXPECT_NEAR(r.imag(), expected.imag(), testing::self_energy_tolerance);
  EXPECT_NE(r.real(), 0.0);

  // Occupied pole on the contour enters with the opposite sign
  const auto r_occ = residue_term(*w, 1, -0.5);
  const auto expected_occ = -0.5 * w->real_axis(1, 1, 0.0);
  EXPECT_NEAR(r_occ.real(), expected_occ.real(),
              testing::self_energy_tolerance);
}

TEST_F(ResidueTermTest, SeveralEnclosedPolesAdd) {
  // omega = 0.9 encloses the virtual poles at 0.2, 0.45 and 0.8
  const auto r = residue_term(*w, 2, 0.9);
  const auto expected = w->real_axis(2, 2, 0.7) + w->real_axis(3, 2, 0.45) +
                        w->real_axis(4, 2, 0.1);
  EXPECT_NEAR(r.real(), expected.real(), testing::self_energy_tolerance);
  EXPECT_NEAR(r.imag(), expected.imag(), testing::self_energy_tolerance);
}

TEST_F(ResidueTermTest, StaticScreeningIsAttractive) {
  // W_c(nn, 0) < 0 for a stable closed-shell reference
  EXPECT_LT(w->real_axis(2, 2, 0.0).real(), 0.0);
  EXPECT_LT(w->real_axis(1, 1, 0.0).real(), 0.0);
}

TEST_F(ResidueTermTest, IntegralTermStepsAcrossPole) {
  // Only the row of orbital 2 is non-zero and equals its static value, so the
  // quadrature vanishes and only the exact step -s/2 sign(omega - eps) is left
  Eigen::MatrixXd block = Eigen::MatrixXd::Zero(6, 40);
  block.row(2).setConstant(-0.01);
  Eigen::VectorXcd w_static = Eigen::VectorXcd::Zero(6);
  w_static(2) = -0.01;

  const auto on_contour =
      integral_term(*orbitals, block, w_static, *grid, 0.2, 1e-3);
  EXPECT_NEAR(std::abs(on_contour), 0.0, testing::numerical_zero_tolerance);

  const auto above =
      integral_term(*orbitals, block, w_static, *grid, 0.2 + 1e-9, 1e-3);
  EXPECT_NEAR(above.real(), 0.005, testing::self_energy_tolerance);
  const auto below =
      integral_term(*orbitals, block, w_static, *grid, 0.2 - 1e-9, 1e-3);
  EXPECT_NEAR(below.real(), -0.005, testing::self_energy_tolerance);
}

TEST_F(ResidueTermTest, IntegralTermOfConstantInteraction) {
  // With the static part subtracted a constant W is integrated exactly
  Eigen::MatrixXd block = Eigen::MatrixXd::Zero(6, 100);
  block.row(4).setConstant(-0.02);
  Eigen::VectorXcd w_static = Eigen::VectorXcd::Zero(6);
  w_static(4) = -0.02;
  FrequencyGrid fine(100, 3, 0.01);

  const auto below = integral_term(*orbitals, block, w_static, fine, 0.3, 1e-8);
  EXPECT_NEAR(below.real(), -0.01, testing::self_energy_tolerance);
  const auto above = integral_term(*orbitals, block, w_static, fine, 1.3, 1e-8);
  EXPECT_NEAR(above.real(), 0.01, testing::self_energy_tolerance);

  // Without it the quadrature alone tends to -W/2 sgn(Re z) for small eta
  const Eigen::VectorXcd no_static = Eigen::VectorXcd::Zero(6);
  const auto quad_below =
      integral_term(*orbitals, block, no_static, fine, 0.3, 1e-8);
  EXPECT_NEAR(quad_below.real(), -0.01, 1e-5);
  const auto quad_above =
      integral_term(*orbitals, block, no_static, fine, 1.3, 1e-8);
  EXPECT_NEAR(quad_above.real(), 0.01, 1e-5);
}

TEST_F(ResidueTermTest, IntegralTermRejectsWrongShape) {
  const Eigen::VectorXcd w_static = Eigen::VectorXcd::Zero(6);
  EXPECT_THROW(integral_term(*orbitals, Eigen::MatrixXd::Zero(5, 40), w_static,
                             *grid, 0.0, 1e-3),
               cdgw::data::InconsistentInputShapes);
  EXPECT_THROW(integral_term(*orbitals, Eigen::MatrixXd::Zero(6, 39), w_static,
                             *grid, 0.0, 1e-3),
               cdgw::data::InconsistentInputShapes);
  EXPECT_THROW(integral_term(*orbitals, Eigen::MatrixXd::Zero(6, 40),
                             Eigen::VectorXcd::Zero(5), *grid, 0.0, 1e-3),
               cdgw::data::InconsistentInputShapes);
}

TEST(ResidueTermNoOccupiedTest, VanishesWithoutPolarization) {
  auto orbitals = testing::create_test_orbitals(0);
  auto integrals = testing::create_test_integrals();
  auto grid = std::make_shared<FrequencyGrid>(10, 5, 0.01);
  AnalyticScreenedInteraction w(orbitals, integrals, grid, {0, 1}, 1e-3, 1);

  EXPECT_EQ(w.real_axis(2, 0, 0.1), std::complex<double>(0.0, 0.0));
  EXPECT_EQ(residue_term(w, 0, 1.0), std::complex<double>(0.0, 0.0));
  EXPECT_TRUE(w.imaginary_axis_block(1).isZero());
}
