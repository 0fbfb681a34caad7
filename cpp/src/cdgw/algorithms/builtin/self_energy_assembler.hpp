// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cdgw/data/orbitals.hpp>
#include <cdgw/data/self_energy.hpp>
#include <cdgw/data/three_center_integrals.hpp>
#include <cstddef>
#include <memory>
#include <vector>

#include "screened_interaction.hpp"

namespace cdgw::algorithms::builtin {

/**
 * @brief Exchange self-energy of every orbital
 *
 *   Sigma_X(n) = -sum_i sum_P B[P](n,i)^2, i occupied
 */
Eigen::VectorXd exchange_self_energy(const data::Orbitals& orbitals,
                                     const data::ThreeCenterIntegrals& integrals);

/**
 * @brief Diagonal of the reference exchange-correlation potential
 *
 * Taken from the integrals when present. Otherwise the reference is
 * Hartree-Fock and V_xc equals the exchange self-energy, so that
 * Sigma_X - V_xc vanishes.
 */
Eigen::VectorXd exchange_correlation_potential(
    const data::ThreeCenterIntegrals& integrals, const Eigen::VectorXd& exchange);

/**
 * @brief Samples the GW self-energy of the target orbitals
 *
 * For every target n the correlation self-energy
 *
 *   Sigma_c(omega) = R(omega) + I(omega)
 *
 * is evaluated on omega = eps_n + offsets, R being the residue term and I the
 * imaginary-axis integral. Targets are processed in parallel. Each orbital's
 * column is completed before it is stored, so a failure never leaves a partly
 * written column behind.
 */
class SelfEnergyAssembler {
 public:
  explicit SelfEnergyAssembler(const ScreenedInteraction& screened_interaction);

  /**
   * @param integrals Integrals the screened interaction was built from
   * @param targets Target orbitals, ascending
   * @param num_threads Size of the thread team
   */
  std::shared_ptr<data::SelfEnergy> assemble(
      const data::ThreeCenterIntegrals& integrals,
      const std::vector<std::size_t>& targets, int num_threads) const;

  /**
   * @brief Correlation self-energy of a single orbital
   *
   * @param n Target orbital
   * @param frequencies Real sampling frequencies
   */
  Eigen::VectorXcd correlation(std::size_t n,
                               const Eigen::VectorXd& frequencies) const;

 private:
  const ScreenedInteraction& screened_interaction_;
};

}  // namespace cdgw::algorithms::builtin
