// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "contour_deformation_gw.hpp"

#include <cdgw/algorithms/quasiparticle.hpp>
#include <cdgw/constants.hpp>
#include <cdgw/data/frequency_grid.hpp>
#include <cdgw/utils/logger.hpp>
#include <cdgw/utils/omp_utils.hpp>
#include <optional>
#include <stdexcept>
#include <string>

#include "screened_interaction.hpp"
#include "self_energy_assembler.hpp"

namespace cdgw::algorithms::builtin {

using utils::LogLevel;
using utils::ScopedLogLevel;

std::vector<std::size_t> select_orbital_window(std::size_t num_occupied,
                                               std::size_t num_virtual,
                                               int64_t occupied_count,
                                               int64_t virtual_count) {
  const std::size_t nocc = occupied_count < 0
                               ? num_occupied
                               : static_cast<std::size_t>(occupied_count);
  const std::size_t nvir = virtual_count < 0
                               ? num_virtual
                               : static_cast<std::size_t>(virtual_count);

  if (nocc > num_occupied) {
    throw std::invalid_argument(
        "occupied_count = " + std::to_string(occupied_count) +
        " exceeds the " + std::to_string(num_occupied) +
        " occupied orbitals of the reference");
  }
  if (nvir > num_virtual) {
    throw std::invalid_argument(
        "virtual_count_included = " + std::to_string(virtual_count) +
        " exceeds the " + std::to_string(num_virtual) +
        " virtual orbitals of the reference");
  }
  if (nocc + nvir == 0) {
    throw std::invalid_argument("The orbital window is empty");
  }

  std::vector<std::size_t> window;
  window.reserve(nocc + nvir);
  for (std::size_t n = num_occupied - nocc; n < num_occupied + nvir; ++n) {
    window.push_back(n);
  }
  return window;
}

std::pair<std::shared_ptr<data::QuasiparticleSpectrum>,
          std::shared_ptr<data::SelfEnergy>>
ContourDeformationGW::_run_impl(
    std::shared_ptr<data::Orbitals> orbitals,
    std::shared_ptr<data::ThreeCenterIntegrals> integrals) const {
  CDGW_LOG_TRACE_ENTERING();

  std::optional<ScopedLogLevel> debug_scope;
  if (_settings->get<bool>("debug")) {
    debug_scope.emplace(LogLevel::debug);
  }
  auto& logger = CDGW_LOGGER();

  if (!orbitals || !integrals) {
    throw std::invalid_argument("GW calculation needs orbitals and integrals");
  }
  integrals->validate_against(*orbitals);

  // Structural checks first, nothing numerical has run yet
  const auto targets = select_orbital_window(
      orbitals->get_num_occupied_orbitals(),
      orbitals->get_num_virtual_orbitals(),
      _settings->get<int64_t>("occupied_count"),
      _settings->get<int64_t>("virtual_count_included"));

  auto grid = std::make_shared<const data::FrequencyGrid>(
      _settings->get<int64_t>("quadrature_order"),
      _settings->get<int64_t>("sigma_frequency_count"),
      _settings->get<double>("sigma_frequency_step"));

  auto solver = QuasiparticleSolverFactory::create(
      _settings->get<std::string>("quasiparticle_solver"));
  if (solver->settings().has("debug")) {
    solver->settings().set("debug", _settings->get<bool>("debug"));
  }

  const int num_threads =
      utils::resolve_num_threads(_settings->get<int64_t>("num_threads"));

  logger.info("{}", orbitals->get_summary());
  logger.info(
      "G0W0 by contour deformation: orbitals {}..{}, {} imaginary "
      "frequencies, {} real samples, eta = {} Ha, {} threads",
      targets.front(), targets.back(), grid->get_quadrature_order(),
      grid->get_num_real_points(), _settings->get<double>("eta"), num_threads);

  ScreenedInteractionOptions options;
  options.analytic_requested =
      _settings->get<bool>("analytic_screened_interaction");
  options.low_memory_mode = _settings->get<bool>("low_memory_mode");
  options.memory_budget_mb = _settings->get<double>("memory_budget_mb");
  options.eta = _settings->get<double>("eta");
  options.num_threads = num_threads;

  const auto screened_interaction =
      select_screened_interaction(orbitals, integrals, grid, targets, options);

  SelfEnergyAssembler assembler(*screened_interaction);
  auto self_energy = assembler.assemble(*integrals, targets, num_threads);

  auto solved = solver->run(self_energy);
  auto spectrum = std::make_shared<data::QuasiparticleSpectrum>(
      solved->get_solutions(), to_string(screened_interaction->algorithm()));

  for (const auto& solution : spectrum->get_solutions()) {
    if (solution.primary_root) {
      const auto& root = solution.get_primary_root();
      logger.info(
          "Orbital {:>4}: eps0 = {:>10.4f} eV, E_lin = {:>10.4f} eV, "
          "E_qp = {:>10.4f} eV, Z = {:.4f}",
          solution.orbital_index,
          solution.reference_energy * constants::hartree_to_ev,
          solution.linearized_energy * constants::hartree_to_ev,
          root.energy * constants::hartree_to_ev, root.z);
    } else {
      logger.info(
          "Orbital {:>4}: eps0 = {:>10.4f} eV, E_lin = {:>10.4f} eV, "
          "no physical graphical root",
          solution.orbital_index,
          solution.reference_energy * constants::hartree_to_ev,
          solution.linearized_energy * constants::hartree_to_ev);
    }
  }

  return {spectrum, self_energy};
}

}  // namespace cdgw::algorithms::builtin
