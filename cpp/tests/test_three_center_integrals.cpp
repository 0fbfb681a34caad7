// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <cdgw/data/errors.hpp>
#include <cdgw/data/three_center_integrals.hpp>
#include <filesystem>

#include "ut_common.hpp"

using namespace cdgw::data;

class ThreeCenterIntegralsTest : public ::testing::Test {
 protected:
  void TearDown() override {
    std::filesystem::remove(
        testing::scratch_file("test.three_center_integrals.json"));
    std::filesystem::remove(
        testing::scratch_file("test.three_center_integrals.h5"));
  }
};

TEST_F(ThreeCenterIntegralsTest, Dimensions) {
  auto integrals = testing::create_test_integrals(6, 10);
  EXPECT_EQ(integrals->get_num_molecular_orbitals(), 6u);
  EXPECT_EQ(integrals->get_num_auxiliary_functions(), 10u);
  EXPECT_EQ(integrals->get_tensor().cols(), 36);
  EXPECT_FALSE(integrals->has_vxc());
  EXPECT_THROW(integrals->get_vxc(), std::runtime_error);
}

TEST_F(ThreeCenterIntegralsTest, RejectsInconsistentShapes) {
  EXPECT_THROW(ThreeCenterIntegrals(Eigen::MatrixXd::Zero(4, 35), 6),
               InconsistentInputShapes);
  EXPECT_THROW(ThreeCenterIntegrals(Eigen::MatrixXd::Zero(4, 36), 6,
                                    Eigen::MatrixXd::Zero(5, 6)),
               InconsistentInputShapes);
}

TEST_F(ThreeCenterIntegralsTest, PairsAreSymmetric) {
  auto integrals = testing::create_test_integrals();
  for (std::size_t p = 0; p < 6; ++p) {
    for (std::size_t q = 0; q < 6; ++q) {
      EXPECT_TRUE(integrals->get_pair(p, q).isApprox(integrals->get_pair(q, p)));
    }
  }
  EXPECT_THROW(integrals->get_pair(6, 0), std::out_of_range);
}

TEST_F(ThreeCenterIntegralsTest, OccupiedVirtualBlockLayout) {
  auto integrals = testing::create_test_integrals();
  const std::size_t nocc = 2;
  const Eigen::MatrixXd block = integrals->get_occupied_virtual_block(nocc);
  ASSERT_EQ(block.rows(), 10);
  ASSERT_EQ(block.cols(), 8);
  for (std::size_t a = 0; a < 4; ++a) {
    for (std::size_t i = 0; i < nocc; ++i) {
      EXPECT_TRUE(block.col(static_cast<Eigen::Index>(i + a * nocc))
                      .isApprox(integrals->get_pair(i, nocc + a)));
    }
  }
}

TEST_F(ThreeCenterIntegralsTest, ValidateAgainstOrbitals) {
  auto integrals = testing::create_test_integrals(6, 4);
  EXPECT_NO_THROW(integrals->validate_against(*testing::create_test_orbitals()));

  auto smaller = testing::create_test_integrals(5, 4);
  EXPECT_THROW(smaller->validate_against(*testing::create_test_orbitals()),
               InconsistentInputShapes);
}

TEST_F(ThreeCenterIntegralsTest, FromAtomicOrbitalsIdentity) {
  const Eigen::MatrixXd ao = testing::create_symmetric_tensor(4, 3);
  auto integrals = ThreeCenterIntegrals::from_atomic_orbitals(
      ao, Eigen::MatrixXd::Identity(4, 4));
  EXPECT_TRUE(integrals->get_tensor().isApprox(ao));
}

TEST_F(ThreeCenterIntegralsTest, FromAtomicOrbitalsTransforms) {
  const Eigen::Index nao = 5;
  const Eigen::Index nmo = 3;
  const Eigen::MatrixXd ao = testing::create_symmetric_tensor(nao, 4);
  Eigen::MatrixXd coefficients(nao, nmo);
  for (Eigen::Index mu = 0; mu < nao; ++mu) {
    for (Eigen::Index p = 0; p < nmo; ++p) {
      coefficients(mu, p) = 0.1 * static_cast<double>(mu + 1) -
                            0.05 * static_cast<double>(p * p);
    }
  }
  const Eigen::MatrixXd ao_vxc = Eigen::MatrixXd::Identity(nao, nao) * -0.3;

  auto integrals =
      ThreeCenterIntegrals::from_atomic_orbitals(ao, coefficients, ao_vxc);
  ASSERT_EQ(integrals->get_num_molecular_orbitals(), 3u);

  // B[P](p,q) = sum_mu,nu C(mu,p) A[P](mu,nu) C(nu,q)
  for (Eigen::Index P = 0; P < 4; ++P) {
    for (Eigen::Index p = 0; p < nmo; ++p) {
      for (Eigen::Index q = 0; q < nmo; ++q) {
        double expected = 0.0;
        for (Eigen::Index mu = 0; mu < nao; ++mu) {
          for (Eigen::Index nu = 0; nu < nao; ++nu) {
            expected += coefficients(mu, p) * ao(P, mu + nu * nao) *
                        coefficients(nu, q);
          }
        }
        EXPECT_NEAR(integrals->get_tensor()(P, p + q * nmo), expected,
                    testing::numerical_zero_tolerance);
      }
    }
  }

  ASSERT_TRUE(integrals->has_vxc());
  EXPECT_TRUE(integrals->get_vxc().isApprox(
      -0.3 * coefficients.transpose() * coefficients));

  EXPECT_THROW(ThreeCenterIntegrals::from_atomic_orbitals(
                   Eigen::MatrixXd::Zero(4, 24), coefficients),
               InconsistentInputShapes);
}

TEST_F(ThreeCenterIntegralsTest, JsonRoundTrip) {
  Eigen::MatrixXd vxc = Eigen::MatrixXd::Identity(6, 6) * -0.2;
  auto integrals = testing::create_test_integrals(6, 5, vxc);
  auto restored = ThreeCenterIntegrals::from_json(integrals->to_json());
  EXPECT_EQ(restored->get_num_molecular_orbitals(), 6u);
  EXPECT_TRUE(restored->get_tensor().isApprox(integrals->get_tensor(),
                                              testing::json_tolerance));
  ASSERT_TRUE(restored->has_vxc());
  EXPECT_TRUE(restored->get_vxc().isApprox(vxc, testing::json_tolerance));

  const auto filename =
      testing::scratch_file("test.three_center_integrals.json");
  integrals->to_json_file(filename);
  auto from_file = ThreeCenterIntegrals::from_json_file(filename);
  EXPECT_EQ(from_file->get_num_auxiliary_functions(), 5u);
}

TEST_F(ThreeCenterIntegralsTest, Hdf5RoundTrip) {
  auto integrals = testing::create_test_integrals(6, 7);
  const auto filename = testing::scratch_file("test.three_center_integrals.h5");
  integrals->to_file(filename, "hdf5");
  auto restored = ThreeCenterIntegrals::from_file(filename, "hdf5");
  EXPECT_EQ(restored->get_num_molecular_orbitals(), 6u);
  EXPECT_FALSE(restored->has_vxc());
  EXPECT_TRUE(restored->get_tensor().isApprox(integrals->get_tensor(),
                                              testing::hdf5_tolerance));
}
