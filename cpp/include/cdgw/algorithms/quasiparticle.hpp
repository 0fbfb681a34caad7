// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cdgw/algorithms/algorithm.hpp>
#include <cdgw/data/quasiparticle_spectrum.hpp>
#include <cdgw/data/self_energy.hpp>
#include <memory>
#include <string>

namespace cdgw::algorithms {

/**
 * @brief Abstract base class for quasiparticle equation solvers
 *
 * A quasiparticle solver turns a sampled self-energy into quasiparticle
 * energies, i.e. approximate solutions of the Dyson equation
 *
 *   omega - eps0 - Re Sigma(omega) = 0
 *
 * for every orbital held by the self-energy. Problems with individual
 * orbitals (no root, unusable linearization) are recorded in the returned
 * spectrum and never abort the batch.
 *
 * @code
 * auto solver = cdgw::algorithms::QuasiparticleSolverFactory::create();
 * solver->settings().set("root_tolerance", 1e-12);
 * auto spectrum = solver->run(self_energy);
 * std::cout << spectrum->get_summary();
 * @endcode
 */
class QuasiparticleSolver
    : public Algorithm<QuasiparticleSolver,
                       std::shared_ptr<data::QuasiparticleSpectrum>,
                       std::shared_ptr<data::SelfEnergy>> {
 public:
  QuasiparticleSolver() = default;
  virtual ~QuasiparticleSolver() = default;

  /**
   * @brief Solve the quasiparticle equation of every orbital
   *
   * \cond DOXYGEN_SUPRESS (Doxygen warning suppression for argument packs)
   * @param self_energy Sampled self-energy
   * \endcond
   *
   * @return Per-orbital linearized and graphical solutions
   * @throws std::invalid_argument if the self-energy is null
   * @throws cdgw::data::SettingsAreLocked if the settings are modified after
   *         run() was called
   */
  using Algorithm::run;

  std::string type_name() const override { return "quasiparticle_solver"; }

  std::string name() const override = 0;

 protected:
  virtual std::shared_ptr<data::QuasiparticleSpectrum> _run_impl(
      std::shared_ptr<data::SelfEnergy> self_energy) const = 0;
};

/**
 * @brief Factory of quasiparticle solvers
 *
 * The built-in "graphical" solver is the default.
 */
struct QuasiparticleSolverFactory
    : public AlgorithmFactory<QuasiparticleSolver,
                              QuasiparticleSolverFactory> {
  static std::string algorithm_type_name() { return "quasiparticle_solver"; }
  static void register_default_instances();
  static std::string default_algorithm_name() { return "graphical"; }
};

}  // namespace cdgw::algorithms
