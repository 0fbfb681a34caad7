// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cdgw/algorithms/algorithm.hpp>
#include <cdgw/data/orbitals.hpp>
#include <cdgw/data/quasiparticle_spectrum.hpp>
#include <cdgw/data/self_energy.hpp>
#include <cdgw/data/three_center_integrals.hpp>
#include <memory>
#include <string>
#include <utility>

namespace cdgw::algorithms {

/**
 * @brief Abstract base class for one-shot GW calculations
 *
 * A GW calculator evaluates the GW self-energy of a window of orbitals around
 * the Fermi level from a closed-shell mean-field reference and the
 * resolution-of-identity factors of its electron repulsion integrals, and
 * solves the quasiparticle equation for each orbital in the window.
 *
 * Example usage:
 * @code
 * auto orbitals = cdgw::data::Orbitals::from_file("h2o.orbitals.h5", "hdf5");
 * auto integrals = cdgw::data::ThreeCenterIntegrals::from_file(
 *     "h2o.three_center_integrals.h5", "hdf5");
 *
 * auto gw = cdgw::algorithms::GWCalculatorFactory::create();
 * gw->settings().set("occupied_count", 2);
 * gw->settings().set("virtual_count_included", 2);
 *
 * auto [spectrum, self_energy] = gw->run(orbitals, integrals);
 * std::cout << spectrum->get_summary();
 * @endcode
 */
class GWCalculator
    : public Algorithm<GWCalculator,
                       std::pair<std::shared_ptr<data::QuasiparticleSpectrum>,
                                 std::shared_ptr<data::SelfEnergy>>,
                       std::shared_ptr<data::Orbitals>,
                       std::shared_ptr<data::ThreeCenterIntegrals>> {
 public:
  GWCalculator() = default;
  virtual ~GWCalculator() = default;

  /**
   * @brief Compute the self-energy and quasiparticle energies
   *
   * \cond DOXYGEN_SUPRESS (Doxygen warning suppression for argument packs)
   * @param orbitals Mean-field reference orbitals
   * @param integrals Three-center integrals in the MO basis of @p orbitals
   * \endcond
   *
   * @return Pair of the quasiparticle spectrum and the self-energy it was
   *         solved from
   *
   * @throws cdgw::data::InconsistentInputShapes if the inputs disagree in
   *         their dimensions
   * @throws cdgw::data::InvalidGridParameter if the frequency grid settings
   *         are invalid
   * @throws cdgw::data::MemoryBudgetExceeded if the dense screened
   *         interaction was requested explicitly but does not fit the budget
   * @throws std::invalid_argument if the orbital window is invalid
   *
   * @note No numerical work starts before every input check has passed.
   */
  using Algorithm::run;

  std::string type_name() const override { return "gw_calculator"; }

  std::string name() const override = 0;

 protected:
  virtual std::pair<std::shared_ptr<data::QuasiparticleSpectrum>,
                    std::shared_ptr<data::SelfEnergy>>
  _run_impl(std::shared_ptr<data::Orbitals> orbitals,
            std::shared_ptr<data::ThreeCenterIntegrals> integrals) const = 0;
};

/**
 * @brief Factory of GW calculators
 *
 * The built-in contour-deformation implementation is the default and is also
 * registered as "cd".
 */
struct GWCalculatorFactory
    : public AlgorithmFactory<GWCalculator, GWCalculatorFactory> {
  static std::string algorithm_type_name() { return "gw_calculator"; }
  static void register_default_instances();
  static std::string default_algorithm_name() { return "contour_deformation"; }
};

}  // namespace cdgw::algorithms
