// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "graphical_quasiparticle_solver.hpp"

#include <algorithm>
#include <cdgw/utils/logger.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace cdgw::algorithms::builtin {

using utils::LogLevel;
using utils::ScopedLogLevel;

namespace {

constexpr double nan = std::numeric_limits<double>::quiet_NaN();

/// Slack for comparing frequencies against grid points
double grid_slack(const Eigen::VectorXd& f) {
  const double range = f.size() > 1 ? f(f.size() - 1) - f(0) : 0.0;
  return 1e-12 * std::max(1.0, std::abs(range));
}

bool inside_grid(const Eigen::VectorXd& f, double omega) {
  if (f.size() == 0) return false;
  const double slack = grid_slack(f);
  return omega >= f(0) - slack && omega <= f(f.size() - 1) + slack;
}

data::RootQuality classify_root(double slope) {
  if (slope < 0.0) {
    return data::RootQuality::PoleCrossing;
  }
  const double z = 1.0 / slope;
  if (std::isfinite(z) && z > 0.0 && z <= 1.0) {
    return data::RootQuality::Physical;
  }
  return data::RootQuality::UnphysicalZ;
}

}  // namespace

LinearizedSolution linearize(const data::SelfEnergy& self_energy,
                             std::size_t i) {
  const Eigen::VectorXd f = self_energy.get_frequencies().col(
      static_cast<Eigen::Index>(i));
  const double eps0 =
      self_energy.get_reference_energies()(static_cast<Eigen::Index>(i));
  const Eigen::Index npts = f.size();

  if (npts < 2 || !inside_grid(f, eps0)) {
    return {nan, nan, true};
  }

  const double slack = grid_slack(f);
  Eigen::Index lower = 0;
  while (lower + 1 < npts && f(lower + 1) <= eps0 + slack) {
    ++lower;
  }

  Eigen::Index l = lower;
  Eigen::Index u = lower + 1;
  if (std::abs(f(lower) - eps0) <= slack) {
    // eps0 on a grid point: central difference, one-sided at the edges
    l = std::max<Eigen::Index>(lower - 1, 0);
    u = std::min<Eigen::Index>(lower + 1, npts - 1);
  } else if (u >= npts) {
    return {nan, nan, true};
  }

  const Eigen::VectorXcd sigma = self_energy.get_total(i);
  const double dsigma = (sigma(u) - sigma(l)).real() / (f(u) - f(l));
  const double z = 1.0 / (1.0 - dsigma);
  const double energy = eps0 + z * self_energy.interpolate(i, eps0).real();

  const bool degenerate =
      !std::isfinite(z) || !std::isfinite(energy) || z <= 0.0 || z > 1.0;
  return {z, energy, degenerate};
}

std::vector<data::QuasiparticleRoot> find_graphical_roots(
    const data::SelfEnergy& self_energy, std::size_t i,
    std::size_t max_iterations, double tolerance) {
  const Eigen::VectorXd f = self_energy.get_frequencies().col(
      static_cast<Eigen::Index>(i));
  const double eps0 =
      self_energy.get_reference_energies()(static_cast<Eigen::Index>(i));
  const Eigen::Index npts = f.size();
  const Eigen::VectorXd g =
      (f.array() - eps0 - self_energy.get_total(i).real().array()).matrix();

  auto graphical = [&](double omega) {
    return omega - eps0 - self_energy.interpolate(i, omega).real();
  };
  auto slope = [&](Eigen::Index a, Eigen::Index b) {
    return (g(b) - g(a)) / (f(b) - f(a));
  };

  std::vector<data::QuasiparticleRoot> roots;
  for (Eigen::Index k = 0; k < npts; ++k) {
    if (g(k) == 0.0) {
      const auto a = std::max<Eigen::Index>(k - 1, 0);
      const auto b = std::min<Eigen::Index>(k + 1, npts - 1);
      const double s = a == b ? nan : slope(a, b);
      roots.push_back({f(k), 1.0 / s, classify_root(s)});
      continue;
    }
    if (k + 1 >= npts || g(k + 1) == 0.0 || (g(k) < 0.0) == (g(k + 1) < 0.0)) {
      continue;
    }

    double lo = f(k);
    double hi = f(k + 1);
    double g_lo = g(k);
    for (std::size_t iter = 0; iter < max_iterations && hi - lo > tolerance;
         ++iter) {
      const double mid = 0.5 * (lo + hi);
      const double g_mid = graphical(mid);
      if (g_mid == 0.0) {
        lo = hi = mid;
        break;
      }
      if ((g_mid < 0.0) == (g_lo < 0.0)) {
        lo = mid;
        g_lo = g_mid;
      } else {
        hi = mid;
      }
    }

    const double s = slope(k, k + 1);
    roots.push_back({0.5 * (lo + hi), 1.0 / s, classify_root(s)});
  }
  return roots;
}

std::optional<std::size_t> select_primary_root(
    const std::vector<data::QuasiparticleRoot>& roots, double z_tie_tolerance,
    bool& unique) {
  unique = true;
  std::optional<std::size_t> best;
  for (std::size_t r = 0; r < roots.size(); ++r) {
    if (roots[r].quality != data::RootQuality::Physical) continue;
    if (!best || roots[r].z > roots[*best].z) {
      best = r;
    }
  }
  if (!best) {
    return best;
  }

  for (std::size_t r = 0; r < roots.size(); ++r) {
    if (r == *best || roots[r].quality != data::RootQuality::Physical) {
      continue;
    }
    if (std::abs(roots[r].z - roots[*best].z) < z_tie_tolerance) {
      unique = false;
    }
  }
  return best;
}

std::shared_ptr<data::QuasiparticleSpectrum>
GraphicalQuasiparticleSolver::_run_impl(
    std::shared_ptr<data::SelfEnergy> self_energy) const {
  CDGW_LOG_TRACE_ENTERING();
  if (!self_energy) {
    throw std::invalid_argument("Quasiparticle solver needs a self-energy");
  }

  std::optional<ScopedLogLevel> debug_scope;
  if (_settings->get<bool>("debug")) {
    debug_scope.emplace(LogLevel::debug);
  }
  auto& logger = CDGW_LOGGER();

  const auto max_iterations =
      _settings->get<std::size_t>("root_max_iterations");
  const auto tolerance = _settings->get<double>("root_tolerance");
  const auto z_tie_tolerance = _settings->get<double>("z_tie_tolerance");

  std::vector<data::QuasiparticleSolution> solutions;
  solutions.reserve(self_energy->size());

  for (std::size_t i = 0; i < self_energy->size(); ++i) {
    const auto idx = static_cast<Eigen::Index>(i);
    data::QuasiparticleSolution solution;
    solution.orbital_index = self_energy->get_orbital_indices()[i];
    solution.reference_energy = self_energy->get_reference_energies()(idx);
    solution.exchange_minus_vxc = self_energy->get_static_part(i);

    const Eigen::VectorXd f = self_energy->get_frequencies().col(idx);
    if (inside_grid(f, solution.reference_energy)) {
      solution.correlation_at_reference =
          self_energy->interpolate(i, solution.reference_energy) -
          solution.exchange_minus_vxc;
    } else {
      solution.correlation_at_reference = {nan, nan};
    }

    const auto linear = linearize(*self_energy, i);
    solution.linearized_z = linear.z;
    solution.linearized_energy = linear.energy;
    if (linear.degenerate) {
      solution.issues.push_back(data::QuasiparticleIssue::DegenerateLinearization);
      logger.warn("Orbital {}: degenerate linearization (Z = {})",
                  solution.orbital_index, linear.z);
    }

    solution.roots =
        find_graphical_roots(*self_energy, i, max_iterations, tolerance);
    if (solution.roots.empty()) {
      solution.issues.push_back(data::QuasiparticleIssue::NoRootFound);
      logger.warn("Orbital {}: no graphical root within [{:.6f}, {:.6f}] Ha",
                  solution.orbital_index, f(0), f(f.size() - 1));
    }
    for (const auto& root : solution.roots) {
      logger.debug("Orbital {}: root at {:.8f} Ha, Z = {:.6f}, {}",
                   solution.orbital_index, root.energy, root.z,
                   data::to_string(root.quality));
    }

    bool unique = true;
    solution.primary_root =
        select_primary_root(solution.roots, z_tie_tolerance, unique);
    solution.primary_root_unique = unique;
    if (solution.primary_root && !unique) {
      logger.warn(
          "Orbital {}: several physical roots with Z within {} of the "
          "primary one",
          solution.orbital_index, z_tie_tolerance);
    }

    solutions.push_back(std::move(solution));
  }

  return std::make_shared<data::QuasiparticleSpectrum>(std::move(solutions));
}

}  // namespace cdgw::algorithms::builtin
