// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "self_energy_assembler.hpp"

#include <atomic>
#include <cdgw/utils/logger.hpp>
#include <mutex>
#include <stdexcept>
#include <string>

#include "integral_term.hpp"
#include "residue_term.hpp"

namespace cdgw::algorithms::builtin {

Eigen::VectorXd exchange_self_energy(
    const data::Orbitals& orbitals,
    const data::ThreeCenterIntegrals& integrals) {
  CDGW_LOG_TRACE_ENTERING();
  integrals.validate_against(orbitals);

  const auto nmo =
      static_cast<Eigen::Index>(orbitals.get_num_molecular_orbitals());
  const auto nocc =
      static_cast<Eigen::Index>(orbitals.get_num_occupied_orbitals());
  const auto& tensor = integrals.get_tensor();

  Eigen::VectorXd exchange(nmo);
  for (Eigen::Index n = 0; n < nmo; ++n) {
    // Columns p + n * nmo for p < nocc hold B[:](i,n) = B[:](n,i)
    exchange(n) = -tensor.middleCols(n * nmo, nocc).squaredNorm();
  }
  return exchange;
}

Eigen::VectorXd exchange_correlation_potential(
    const data::ThreeCenterIntegrals& integrals,
    const Eigen::VectorXd& exchange) {
  if (!integrals.has_vxc()) {
    return exchange;
  }
  return integrals.get_vxc().diagonal();
}

SelfEnergyAssembler::SelfEnergyAssembler(
    const ScreenedInteraction& screened_interaction)
    : screened_interaction_(screened_interaction) {}

Eigen::VectorXcd SelfEnergyAssembler::correlation(
    std::size_t n, const Eigen::VectorXd& frequencies) const {
  const auto& orbitals = screened_interaction_.orbitals();
  const auto& grid = screened_interaction_.grid();
  const double eta = screened_interaction_.eta();
  const Eigen::MatrixXd w_block = screened_interaction_.imaginary_axis_block(n);
  const Eigen::VectorXcd w_static =
      screened_interaction_.real_axis_static_column(n);

  Eigen::VectorXcd sigma(frequencies.size());
  for (Eigen::Index j = 0; j < frequencies.size(); ++j) {
    const double omega = frequencies(j);
    sigma(j) = residue_term(screened_interaction_, n, omega) +
               integral_term(orbitals, w_block, w_static, grid, omega, eta);
  }
  return sigma;
}

std::shared_ptr<data::SelfEnergy> SelfEnergyAssembler::assemble(
    const data::ThreeCenterIntegrals& integrals,
    const std::vector<std::size_t>& targets, int num_threads) const {
  CDGW_LOG_TRACE_ENTERING();
  auto& logger = CDGW_LOGGER();
  const auto& orbitals = screened_interaction_.orbitals();
  const auto& grid = screened_interaction_.grid();

  const Eigen::VectorXd exchange_all = exchange_self_energy(orbitals, integrals);
  const Eigen::VectorXd vxc_all =
      exchange_correlation_potential(integrals, exchange_all);

  const auto ntargets = static_cast<Eigen::Index>(targets.size());
  const auto nfreq = static_cast<Eigen::Index>(grid.get_num_real_points());

  Eigen::VectorXd reference(ntargets);
  Eigen::VectorXd exchange(ntargets);
  Eigen::VectorXd vxc(ntargets);
  Eigen::MatrixXd frequencies(nfreq, ntargets);
  for (Eigen::Index t = 0; t < ntargets; ++t) {
    const std::size_t n = targets[static_cast<std::size_t>(t)];
    reference(t) = orbitals.get_energy(n);
    exchange(t) = exchange_all(static_cast<Eigen::Index>(n));
    vxc(t) = vxc_all(static_cast<Eigen::Index>(n));
    frequencies.col(t) = grid.get_real_frequencies(reference(t));
  }

  Eigen::MatrixXcd correlation = Eigen::MatrixXcd::Zero(nfreq, ntargets);
  std::atomic<bool> failed{false};
  std::string failure;
  std::mutex failure_mutex;

#pragma omp parallel for num_threads(num_threads) schedule(dynamic)
  for (Eigen::Index t = 0; t < ntargets; ++t) {
    if (failed) continue;
    const std::size_t n = targets[static_cast<std::size_t>(t)];
    try {
      const Eigen::VectorXcd column = this->correlation(n, frequencies.col(t));
      correlation.col(t) = column;
    } catch (const std::exception& e) {
      std::lock_guard<std::mutex> lock(failure_mutex);
      if (!failed) {
        failure = "Orbital " + std::to_string(n) + ": " + e.what();
      }
      failed = true;
    }
  }

  if (failed) {
    throw std::runtime_error("Self-energy evaluation failed. " + failure);
  }

  if (logger.should_log(spdlog::level::debug)) {
    const auto center = static_cast<Eigen::Index>(nfreq / 2);
    for (Eigen::Index t = 0; t < ntargets; ++t) {
      logger.debug(
          "Orbital {:>4}: Sigma_X = {:>12.6f} Ha, V_xc = {:>12.6f} Ha, "
          "Sigma_c(grid center) = {:>12.6f} {:+.6f}i Ha",
          targets[static_cast<std::size_t>(t)], exchange(t), vxc(t),
          correlation(center, t).real(), correlation(center, t).imag());
    }
  }

  return std::make_shared<data::SelfEnergy>(targets, std::move(reference),
                                            std::move(exchange), std::move(vxc),
                                            std::move(frequencies),
                                            std::move(correlation));
}

}  // namespace cdgw::algorithms::builtin
