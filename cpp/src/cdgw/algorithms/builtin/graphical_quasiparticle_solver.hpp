// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cdgw/algorithms/quasiparticle.hpp>
#include <cdgw/data/quasiparticle_spectrum.hpp>
#include <cdgw/data/self_energy.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace cdgw::algorithms::builtin {

/**
 * @class GraphicalQuasiparticleSolverSettings
 * @brief Settings of the graphical quasiparticle solver
 *
 * Default settings:
 * - root_max_iterations: 64 - Bisection steps per bracketed root
 * - root_tolerance: 1e-10 - Bracket width at which bisection stops (Ha)
 * - z_tie_tolerance: 1e-2 - Physical roots whose Z differ by less than this
 *   make the primary root ambiguous
 * - debug: false - Log every root found
 */
class GraphicalQuasiparticleSolverSettings : public data::Settings {
 public:
  GraphicalQuasiparticleSolverSettings() : data::Settings() {
    set_default<int64_t>("root_max_iterations", 64,
                         "Maximum number of bisection steps per root",
                         data::BoundConstraint<int64_t>{1, 10000});
    set_default("root_tolerance", 1e-10,
                "Bracket width at which root bisection stops (Ha)",
                data::BoundConstraint<double>{1e-16, 1.0});
    set_default("z_tie_tolerance", 1e-2,
                "Physical roots with renormalization factors closer than this "
                "to the largest one make the primary root ambiguous",
                data::BoundConstraint<double>{0.0, 1.0});
    set_default("debug", false, "Log every graphical root");
  }
};

/**
 * @brief Linearized solution of the quasiparticle equation
 */
struct LinearizedSolution {
  double z;       ///< 1 / (1 - dRe Sigma/domega) at eps0
  double energy;  ///< eps0 + Z Re Sigma(eps0)
  bool degenerate;
};

/**
 * @brief Linearize the QP equation of column @p i around its reference energy
 *
 * The derivative is the finite difference between the grid points bracketing
 * eps0; when eps0 is a grid point its two neighbours are used. The solution
 * is degenerate when Z is not finite, lies outside (0, 1], or eps0 is not
 * inside the sampled grid. A degenerate solution outside the grid carries NaN
 * values.
 */
LinearizedSolution linearize(const data::SelfEnergy& self_energy,
                             std::size_t i);

/**
 * @brief All roots of omega - eps0 - Re Sigma(omega) on the sampled grid
 *
 * Sign changes between adjacent grid points are refined by bisection on the
 * linear interpolant; an exact zero at a grid point is a root by itself. Z is
 * the inverse slope of the graphical function across the root.
 *
 * @return Roots in ascending energy
 */
std::vector<data::QuasiparticleRoot> find_graphical_roots(
    const data::SelfEnergy& self_energy, std::size_t i,
    std::size_t max_iterations, double tolerance);

/**
 * @brief Physical root with the largest Z
 *
 * @param roots Candidate roots
 * @param z_tie_tolerance Ambiguity window for Z
 * @param unique Set to false when another physical root lies within the
 *        window
 * @return Position in @p roots, empty when no root is physical
 */
std::optional<std::size_t> select_primary_root(
    const std::vector<data::QuasiparticleRoot>& roots, double z_tie_tolerance,
    bool& unique);

/**
 * @class GraphicalQuasiparticleSolver
 * @brief Linearized and graphical solution of the quasiparticle equation
 *
 * Works on the sampled self-energy only. Orbitals never fail the batch:
 * unusable linearizations and missing roots are recorded as issues of the
 * orbital.
 */
class GraphicalQuasiparticleSolver : public QuasiparticleSolver {
 public:
  GraphicalQuasiparticleSolver() {
    _settings = std::make_unique<GraphicalQuasiparticleSolverSettings>();
  }

  ~GraphicalQuasiparticleSolver() = default;

  virtual std::string name() const final { return "graphical"; }

 protected:
  std::shared_ptr<data::QuasiparticleSpectrum> _run_impl(
      std::shared_ptr<data::SelfEnergy> self_energy) const override;
};

}  // namespace cdgw::algorithms::builtin
