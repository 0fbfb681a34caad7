// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <algorithm>
#include <cdgw/algorithms/quasiparticle.hpp>
#include <cdgw/data/settings.hpp>
#include <cmath>
#include <complex>
#include <limits>
#include <memory>

#include "cdgw/algorithms/builtin/graphical_quasiparticle_solver.hpp"
#include "ut_common.hpp"

using namespace cdgw::algorithms;
using namespace cdgw::algorithms::builtin;
using namespace cdgw::data;

namespace {

/// Sigma(omega) = a + b (omega - eps0)
std::shared_ptr<SelfEnergy> linear_self_energy(double eps0, double a,
                                               double b) {
  return testing::create_model_self_energy(
      eps0, [=](double omega) {
        return std::complex<double>(a + b * (omega - eps0), 0.0);
      });
}

/// Sigma(omega) = c / (omega - p), a single pole inside the grid
std::shared_ptr<SelfEnergy> pole_self_energy(double eps0, double c, double p,
                                             Eigen::Index num_points = 101) {
  return testing::create_model_self_energy(
      eps0,
      [=](double omega) { return std::complex<double>(c / (omega - p), -1e-4); },
      num_points);
}

// Solver that returns an empty spectrum, used to exercise the factory
class NullQuasiparticleSolver : public QuasiparticleSolver {
 public:
  NullQuasiparticleSolver() { _settings = std::make_unique<Settings>(); }
  std::string name() const override { return "null_solver"; }

 protected:
  std::shared_ptr<QuasiparticleSpectrum> _run_impl(
      std::shared_ptr<SelfEnergy>) const override {
    return std::make_shared<QuasiparticleSpectrum>(
        std::vector<QuasiparticleSolution>{});
  }
};

}  // namespace

class GraphicalQuasiparticleSolverTest : public ::testing::Test {
 protected:
  std::shared_ptr<QuasiparticleSpectrum> solve(
      std::shared_ptr<SelfEnergy> self_energy) {
    auto solver = QuasiparticleSolverFactory::create("graphical");
    return solver->run(std::move(self_energy));
  }
};

TEST_F(GraphicalQuasiparticleSolverTest, DefaultSettings) {
  auto solver = QuasiparticleSolverFactory::create();
  EXPECT_EQ(solver->name(), "graphical");
  EXPECT_EQ(solver->type_name(), "quasiparticle_solver");
  EXPECT_EQ(solver->settings().get<int64_t>("root_max_iterations"), 64);
  EXPECT_DOUBLE_EQ(solver->settings().get<double>("root_tolerance"), 1e-10);
  EXPECT_DOUBLE_EQ(solver->settings().get<double>("z_tie_tolerance"), 1e-2);
  EXPECT_FALSE(solver->settings().get<bool>("debug"));
  EXPECT_THROW(solver->settings().set("root_max_iterations", 0),
               std::invalid_argument);
}

TEST_F(GraphicalQuasiparticleSolverTest, LinearSelfEnergy) {
  // omega - eps0 = a + b (omega - eps0) has the root eps0 + a / (1 - b)
  const double eps0 = -0.5;
  auto sigma = linear_self_energy(eps0, -0.05, -0.25);

  const auto linear = linearize(*sigma, 0);
  EXPECT_FALSE(linear.degenerate);
  EXPECT_NEAR(linear.z, 0.8, testing::qp_energy_tolerance);
  EXPECT_NEAR(linear.energy, -0.54, testing::qp_energy_tolerance);

  auto spectrum = solve(sigma);
  const auto& solution = spectrum->get_solution(0);
  EXPECT_TRUE(solution.issues.empty());
  ASSERT_EQ(solution.roots.size(), 1u);
  EXPECT_EQ(solution.roots[0].quality, RootQuality::Physical);
  EXPECT_NEAR(solution.roots[0].energy, -0.54, testing::qp_energy_tolerance);
  EXPECT_NEAR(solution.roots[0].z, 0.8, 1e-10);
  ASSERT_TRUE(solution.primary_root.has_value());
  EXPECT_TRUE(solution.primary_root_unique);
  EXPECT_NEAR(solution.linearized_energy, solution.get_primary_root().energy,
              testing::qp_energy_tolerance);
  EXPECT_NEAR(solution.correlation_at_reference.real(), -0.05,
              testing::numerical_zero_tolerance);
}

TEST_F(GraphicalQuasiparticleSolverTest, SteepSelfEnergyIsDegenerate) {
  // b = 0.5 gives Z = 2
  auto spectrum = solve(linear_self_energy(0.1, -0.05, 0.5));
  const auto& solution = spectrum->get_solution(0);
  EXPECT_TRUE(solution.has_issue(QuasiparticleIssue::DegenerateLinearization));
  EXPECT_FALSE(solution.has_issue(QuasiparticleIssue::NoRootFound));
  EXPECT_NEAR(solution.linearized_z, 2.0, 1e-10);
  ASSERT_EQ(solution.roots.size(), 1u);
  EXPECT_EQ(solution.roots[0].quality, RootQuality::UnphysicalZ);
  EXPECT_NEAR(solution.roots[0].energy, 0.0, testing::qp_energy_tolerance);
  EXPECT_FALSE(solution.primary_root.has_value());
}

TEST_F(GraphicalQuasiparticleSolverTest, NoRootInsideGrid) {
  auto spectrum = solve(linear_self_energy(0.0, 5.0, 0.0));
  const auto& solution = spectrum->get_solution(0);
  EXPECT_TRUE(solution.roots.empty());
  EXPECT_TRUE(solution.has_issue(QuasiparticleIssue::NoRootFound));
  EXPECT_FALSE(solution.primary_root.has_value());
  // The linearization does not need a root on the grid
  EXPECT_FALSE(solution.has_issue(QuasiparticleIssue::DegenerateLinearization));
  EXPECT_NEAR(solution.linearized_energy, 5.0, testing::qp_energy_tolerance);
  EXPECT_TRUE(spectrum->has_issues());
}

TEST_F(GraphicalQuasiparticleSolverTest, PoleGivesSatelliteAndCrossing) {
  // omega^2 - p omega - c = 0 for eps0 = 0
  const double c = 0.01;
  const double p = 0.105;
  const double root_main = 0.5 * (p - std::sqrt(p * p + 4.0 * c));
  const double root_satellite = 0.5 * (p + std::sqrt(p * p + 4.0 * c));

  auto spectrum = solve(pole_self_energy(0.0, c, p));
  const auto& solution = spectrum->get_solution(0);
  ASSERT_EQ(solution.roots.size(), 3u);

  // Roots come in ascending energy
  EXPECT_NEAR(solution.roots[0].energy, root_main, 1e-4);
  EXPECT_EQ(solution.roots[0].quality, RootQuality::Physical);
  EXPECT_NEAR(solution.roots[1].energy, p, 0.01);
  EXPECT_EQ(solution.roots[1].quality, RootQuality::PoleCrossing);
  EXPECT_NEAR(solution.roots[2].energy, root_satellite, 1e-3);
  EXPECT_EQ(solution.roots[2].quality, RootQuality::Physical);

  // Z = 1 / (1 + c / (omega - p)^2)
  const double z_main =
      1.0 / (1.0 + c / ((root_main - p) * (root_main - p)));
  EXPECT_NEAR(solution.roots[0].z, z_main, 0.02);
  EXPECT_LT(solution.roots[2].z, solution.roots[0].z);

  ASSERT_TRUE(solution.primary_root.has_value());
  EXPECT_EQ(*solution.primary_root, 0u);
  EXPECT_TRUE(solution.primary_root_unique);
  EXPECT_NEAR(solution.correlation_at_reference.imag(), -1e-4,
              testing::numerical_zero_tolerance);
}

TEST_F(GraphicalQuasiparticleSolverTest, SymmetricRootsAreAmbiguous) {
  // Sigma = c / (omega - eps0) has roots eps0 +- sqrt(c) with equal Z; an
  // even point count keeps the pole between two samples
  auto sigma = testing::create_model_self_energy(
      0.0, [](double omega) { return std::complex<double>(0.01 / omega, 0.0); },
      100);
  auto spectrum = solve(sigma);
  const auto& solution = spectrum->get_solution(0);

  ASSERT_EQ(solution.roots.size(), 3u);
  EXPECT_NEAR(solution.roots[0].energy, -0.1, 1e-3);
  EXPECT_NEAR(solution.roots[2].energy, 0.1, 1e-3);
  EXPECT_NEAR(solution.roots[0].z, solution.roots[2].z, 1e-6);
  ASSERT_TRUE(solution.primary_root.has_value());
  EXPECT_FALSE(solution.primary_root_unique);

  // The slope across the pole makes Z negative
  EXPECT_TRUE(solution.has_issue(QuasiparticleIssue::DegenerateLinearization));
}

TEST_F(GraphicalQuasiparticleSolverTest, ReferenceOutsideGrid) {
  Eigen::MatrixXd frequencies(5, 1);
  frequencies << 0.0, 0.1, 0.2, 0.3, 0.4;
  Eigen::MatrixXcd correlation = Eigen::MatrixXcd::Zero(5, 1);
  Eigen::VectorXd reference(1);
  reference << 1.0;
  auto sigma = std::make_shared<SelfEnergy>(
      std::vector<std::size_t>{3}, reference, Eigen::VectorXd::Zero(1),
      Eigen::VectorXd::Zero(1), frequencies, correlation);

  const auto linear = linearize(*sigma, 0);
  EXPECT_TRUE(linear.degenerate);
  EXPECT_TRUE(std::isnan(linear.z));

  auto spectrum = solve(sigma);
  const auto& solution = spectrum->get_solution(3);
  EXPECT_TRUE(std::isnan(solution.correlation_at_reference.real()));
  EXPECT_TRUE(std::isnan(solution.linearized_energy));
  EXPECT_TRUE(solution.has_issue(QuasiparticleIssue::DegenerateLinearization));
  EXPECT_TRUE(solution.has_issue(QuasiparticleIssue::NoRootFound));
}

TEST_F(GraphicalQuasiparticleSolverTest, SelectPrimaryRoot) {
  const std::vector<QuasiparticleRoot> roots = {
      {-0.6, 0.3, RootQuality::Physical},
      {-0.5, -1.0, RootQuality::PoleCrossing},
      {-0.4, 0.85, RootQuality::Physical},
      {-0.3, 1.5, RootQuality::UnphysicalZ}};
  bool unique = false;
  auto primary = select_primary_root(roots, 1e-2, unique);
  ASSERT_TRUE(primary.has_value());
  EXPECT_EQ(*primary, 2u);
  EXPECT_TRUE(unique);

  primary = select_primary_root(roots, 0.6, unique);
  EXPECT_EQ(*primary, 2u);
  EXPECT_FALSE(unique);

  primary = select_primary_root({roots[1], roots[3]}, 1e-2, unique);
  EXPECT_FALSE(primary.has_value());
  EXPECT_TRUE(unique);
}

TEST_F(GraphicalQuasiparticleSolverTest, BisectionToleranceIsHonored) {
  auto sigma = pole_self_energy(0.0, 0.01, 0.105);
  const auto coarse = find_graphical_roots(*sigma, 0, 64, 1e-3);
  const auto fine = find_graphical_roots(*sigma, 0, 64, 1e-12);
  ASSERT_EQ(coarse.size(), fine.size());
  EXPECT_NEAR(coarse[0].energy, fine[0].energy, 1e-3);
  // A single step halves the bracket
  const auto one_step = find_graphical_roots(*sigma, 0, 1, 1e-12);
  EXPECT_NEAR(one_step[0].energy, fine[0].energy, 0.0025 + 1e-12);
}

TEST_F(GraphicalQuasiparticleSolverTest, SettingsLockAfterRun) {
  auto solver = QuasiparticleSolverFactory::create();
  solver->settings().set("z_tie_tolerance", 0.05);
  solver->run(linear_self_energy(0.0, 0.01, -0.1));
  EXPECT_TRUE(solver->settings().is_locked());
  EXPECT_THROW(solver->settings().set("z_tie_tolerance", 0.1),
               SettingsAreLocked);
}

TEST_F(GraphicalQuasiparticleSolverTest, NullSelfEnergyThrows) {
  auto solver = QuasiparticleSolverFactory::create();
  EXPECT_THROW(solver->run(nullptr), std::invalid_argument);
}

TEST_F(GraphicalQuasiparticleSolverTest, DebugRun) {
  auto solver = QuasiparticleSolverFactory::create();
  solver->settings().set("debug", true);
  auto spectrum = solver->run(pole_self_energy(0.0, 0.01, 0.105));
  EXPECT_EQ(spectrum->size(), 1u);
}

TEST(QuasiparticleSolverFactoryTest, RegisterAndUnregister) {
  EXPECT_TRUE(QuasiparticleSolverFactory::has("graphical"));
  EXPECT_FALSE(QuasiparticleSolverFactory::has("null_solver"));
  EXPECT_THROW(QuasiparticleSolverFactory::create("null_solver"),
               std::runtime_error);

  QuasiparticleSolverFactory::register_instance(
      []() { return std::make_unique<NullQuasiparticleSolver>(); });
  EXPECT_TRUE(QuasiparticleSolverFactory::has("null_solver"));
  const auto names = QuasiparticleSolverFactory::available();
  EXPECT_NE(std::find(names.begin(), names.end(), "null_solver"),
            names.end());
  EXPECT_EQ(QuasiparticleSolverFactory::create("null_solver")->name(),
            "null_solver");

  // Names are unique
  EXPECT_THROW(QuasiparticleSolverFactory::register_instance(
                   []() { return std::make_unique<NullQuasiparticleSolver>(); }),
               std::runtime_error);

  EXPECT_TRUE(QuasiparticleSolverFactory::unregister_instance("null_solver"));
  EXPECT_FALSE(QuasiparticleSolverFactory::unregister_instance("null_solver"));
  EXPECT_TRUE(QuasiparticleSolverFactory::has("graphical"));
}
