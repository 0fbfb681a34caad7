// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cdgw/data/orbitals.hpp>
#include <cdgw/data/self_energy.hpp>
#include <cdgw/data/three_center_integrals.hpp>
#include <complex>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace testing {

/// @brief Tolerance for JSON comparisons
inline static constexpr double json_tolerance = 1e-10;

///@brief Tolerance for HDF5 comparisons
inline static constexpr double hdf5_tolerance = 1e-10;

/// @brief Tolerance for numerical zeros
inline static constexpr double numerical_zero_tolerance = 1e-12;

/// @brief Tolerance for quadrature checks against closed-form integrals
inline static constexpr double quadrature_tolerance = 1e-8;

/// @brief Tolerance for comparing two evaluations of the same self-energy
inline static constexpr double self_energy_tolerance = 1e-9;

/// @brief Tolerance for quasiparticle energies from the graphical solver
inline static constexpr double qp_energy_tolerance = 1e-8;

using namespace cdgw::data;

/// Orbital energies of the six-orbital model system (Ha)
inline Eigen::VectorXd test_orbital_energies() {
  Eigen::VectorXd energies(6);
  energies << -0.9, -0.5, 0.2, 0.45, 0.8, 1.3;
  return energies;
}

/**
 * @brief Closed-shell model reference with two occupied and four virtual
 * orbitals
 */
inline std::shared_ptr<Orbitals> create_test_orbitals(
    std::size_t num_occupied = 2) {
  return std::make_shared<Orbitals>(test_orbital_energies(), num_occupied);
}

/**
 * @brief Random three-index tensor with B[P](p,q) = B[P](q,p)
 * @param num_molecular_orbitals Number of orbitals n_mo
 * @param num_auxiliary Number of auxiliary functions
 * @param scale Entries are uniform in [-scale, scale]
 * @param seed Seed of the generator, fixed for reproducibility
 */
inline Eigen::MatrixXd create_symmetric_tensor(std::size_t num_molecular_orbitals,
                                               std::size_t num_auxiliary,
                                               double scale = 0.1,
                                               unsigned seed = 20240611) {
  std::mt19937 generator(seed);
  std::uniform_real_distribution<double> distribution(-scale, scale);

  const auto nmo = static_cast<Eigen::Index>(num_molecular_orbitals);
  const auto naux = static_cast<Eigen::Index>(num_auxiliary);
  Eigen::MatrixXd tensor(naux, nmo * nmo);
  for (Eigen::Index P = 0; P < naux; ++P) {
    for (Eigen::Index q = 0; q < nmo; ++q) {
      for (Eigen::Index p = 0; p <= q; ++p) {
        const double value = distribution(generator);
        tensor(P, p + q * nmo) = value;
        tensor(P, q + p * nmo) = value;
      }
    }
  }
  return tensor;
}

/**
 * @brief Integrals of the model system, Hartree-Fock reference unless a
 * potential is given
 */
inline std::shared_ptr<ThreeCenterIntegrals> create_test_integrals(
    std::size_t num_molecular_orbitals = 6, std::size_t num_auxiliary = 10,
    std::optional<Eigen::MatrixXd> vxc = std::nullopt) {
  return std::make_shared<ThreeCenterIntegrals>(
      create_symmetric_tensor(num_molecular_orbitals, num_auxiliary),
      num_molecular_orbitals, std::move(vxc));
}

/**
 * @brief Self-energy of a single orbital with a prescribed total value
 *
 * Exchange and potential are zero, so Sigma(omega) = sigma(omega).
 *
 * @param reference_energy eps0 (Ha)
 * @param sigma Total self-energy as a function of the real frequency
 * @param num_points Number of samples, centered on eps0 when odd
 * @param step Sample spacing (Ha)
 */
inline std::shared_ptr<SelfEnergy> create_model_self_energy(
    double reference_energy,
    const std::function<std::complex<double>(double)>& sigma,
    Eigen::Index num_points = 101, double step = 0.01,
    std::size_t orbital_index = 0) {
  Eigen::MatrixXd frequencies(num_points, 1);
  Eigen::MatrixXcd correlation(num_points, 1);
  for (Eigen::Index k = 0; k < num_points; ++k) {
    const double offset =
        (static_cast<double>(k) - 0.5 * static_cast<double>(num_points - 1)) *
        step;
    frequencies(k, 0) = reference_energy + offset;
    correlation(k, 0) = sigma(frequencies(k, 0));
  }
  Eigen::VectorXd reference(1);
  reference << reference_energy;
  return std::make_shared<SelfEnergy>(
      std::vector<std::size_t>{orbital_index}, reference,
      Eigen::VectorXd::Zero(1), Eigen::VectorXd::Zero(1), frequencies,
      correlation);
}

/**
 * @brief Path of a scratch file in the system temporary directory
 */
inline std::string scratch_file(const std::string& name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

}  // namespace testing
