// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cdgw/algorithms/gw.hpp>
#include <cstddef>
#include <vector>

namespace cdgw::algorithms::builtin {

/**
 * @class ContourDeformationGWSettings
 * @brief Settings of the contour-deformation GW calculator
 *
 * Orbital window:
 * - occupied_count: 1 - Highest occupied orbitals to compute, -1 for all
 * - virtual_count_included: 1 - Lowest virtual orbitals to compute, -1 for
 *   all
 *
 * Frequency grids:
 * - sigma_frequency_count: 101 - Real sampling points per orbital (odd puts
 *   eps_n on the grid)
 * - sigma_frequency_step: 0.01 - Spacing of the real sampling points (Ha)
 * - quadrature_order: 100 - Gauss-Legendre points on the imaginary axis
 *
 * Screened interaction:
 * - analytic_screened_interaction: false - Require the dense representation
 * - low_memory_mode: false - Force the on-demand representation
 * - memory_budget_mb: 4096 - Memory budget of the run (MiB)
 *
 * Other:
 * - eta: 1e-3 - Broadening of the real-axis poles (Ha)
 * - num_threads: 0 - Thread team size, 0 for the OpenMP default
 * - quasiparticle_solver: "graphical" - Quasiparticle solver, one of the
 *   built-in names
 * - debug: false - Verbose logging for this calculation
 *
 * The grid parameters carry no limits here; they are validated when the
 * grid is built so that a bad value surfaces as data::InvalidGridParameter.
 */
class ContourDeformationGWSettings : public data::Settings {
 public:
  ContourDeformationGWSettings() : data::Settings() {
    set_default<int64_t>("occupied_count", 1,
                         "Number of highest occupied orbitals, -1 for all",
                         data::BoundConstraint<int64_t>{-1, 1000000});
    set_default<int64_t>("virtual_count_included", 1,
                         "Number of lowest virtual orbitals, -1 for all",
                         data::BoundConstraint<int64_t>{-1, 1000000});
    set_default<int64_t>("sigma_frequency_count", 101,
                         "Real frequencies sampled per orbital");
    set_default("sigma_frequency_step", 0.01,
                "Spacing of the real frequency samples (Ha)");
    set_default<int64_t>("quadrature_order", 100,
                         "Gauss-Legendre points on the imaginary axis");
    set_default("analytic_screened_interaction", false,
                "Require the dense screened interaction");
    set_default("low_memory_mode", false,
                "Recompute the screened interaction per orbital");
    set_default("memory_budget_mb", 4096.0, "Memory budget of the run (MiB)",
                data::BoundConstraint<double>{0.0, 1e12});
    set_default("eta", 1e-3, "Broadening of real-axis poles (Ha)",
                data::BoundConstraint<double>{0.0, 1.0});
    set_default<int64_t>("num_threads", 0,
                         "Threads per parallel region, 0 for the default",
                         data::BoundConstraint<int64_t>{0, 4096});
    set_default("quasiparticle_solver", "graphical",
                "Quasiparticle solver",
                data::ListConstraint<std::string>{{"graphical"}});
    set_default("debug", false, "Verbose logging of the calculation");
  }
};

/**
 * @brief Orbitals of the window around the Fermi level
 *
 * @param num_occupied Occupied orbitals of the reference
 * @param num_virtual Virtual orbitals of the reference
 * @param occupied_count Highest occupied orbitals to include, -1 for all
 * @param virtual_count Lowest virtual orbitals to include, -1 for all
 * @return Ascending orbital indices
 * @throws std::invalid_argument if a count exceeds what is available or the
 *         window is empty
 */
std::vector<std::size_t> select_orbital_window(std::size_t num_occupied,
                                               std::size_t num_virtual,
                                               int64_t occupied_count,
                                               int64_t virtual_count);

/**
 * @class ContourDeformationGW
 * @brief One-shot G0W0 by contour deformation
 *
 * The correlation self-energy of each orbital in the window is split into
 * the residues of the Green's function poles enclosed by the deformed contour
 * and an integral along the imaginary axis, both built from the RPA screened
 * interaction of a closed-shell reference. The quasiparticle equation is then
 * solved by the configured QuasiparticleSolver.
 *
 * Typical usage:
 * ```cpp
 * auto gw = cdgw::algorithms::GWCalculatorFactory::create("cd");
 * gw->settings().set("occupied_count", 3);
 * gw->settings().set("low_memory_mode", true);
 * auto [spectrum, sigma] = gw->run(orbitals, integrals);
 * ```
 *
 * @see cdgw::algorithms::GWCalculator
 */
class ContourDeformationGW : public GWCalculator {
 public:
  ContourDeformationGW() {
    _settings = std::make_unique<ContourDeformationGWSettings>();
  }

  ~ContourDeformationGW() = default;

  virtual std::string name() const final { return "contour_deformation"; }

  std::vector<std::string> aliases() const override {
    return {"contour_deformation", "cd"};
  }

 protected:
  std::pair<std::shared_ptr<data::QuasiparticleSpectrum>,
            std::shared_ptr<data::SelfEnergy>>
  _run_impl(std::shared_ptr<data::Orbitals> orbitals,
            std::shared_ptr<data::ThreeCenterIntegrals> integrals)
      const override;
};

}  // namespace cdgw::algorithms::builtin
