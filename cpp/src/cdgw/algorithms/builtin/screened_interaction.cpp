// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "screened_interaction.hpp"

#include <algorithm>
#include <atomic>
#include <cdgw/data/errors.hpp>
#include <cdgw/utils/logger.hpp>
#include <cmath>
#include <stdexcept>

namespace cdgw::algorithms::builtin {

namespace {
constexpr double bytes_per_mib = 1024.0 * 1024.0;
}

std::string to_string(ScreenedInteractionAlgorithm algorithm) {
  switch (algorithm) {
    case ScreenedInteractionAlgorithm::Analytic:
      return "analytic";
    case ScreenedInteractionAlgorithm::LowMemory:
      return "low_memory";
  }
  throw std::invalid_argument("Unknown ScreenedInteractionAlgorithm");
}

// ---------------------------------------------------------------------------
// ScreenedInteraction
// ---------------------------------------------------------------------------

ScreenedInteraction::ScreenedInteraction(
    std::shared_ptr<const data::Orbitals> orbitals,
    std::shared_ptr<const data::ThreeCenterIntegrals> integrals,
    std::shared_ptr<const data::FrequencyGrid> grid, double eta)
    : orbitals_(std::move(orbitals)),
      integrals_(std::move(integrals)),
      grid_(std::move(grid)),
      eta_(eta) {
  CDGW_LOG_TRACE_ENTERING();
  integrals_->validate_against(*orbitals_);

  const std::size_t nocc = orbitals_->get_num_occupied_orbitals();
  const std::size_t nvir = orbitals_->get_num_virtual_orbitals();
  const auto& energies = orbitals_->get_energies();

  ov_block_ = integrals_->get_occupied_virtual_block(nocc);
  ov_energies_.resize(static_cast<Eigen::Index>(nocc * nvir));
  for (std::size_t a = 0; a < nvir; ++a) {
    for (std::size_t i = 0; i < nocc; ++i) {
      ov_energies_(static_cast<Eigen::Index>(i + a * nocc)) =
          energies(static_cast<Eigen::Index>(i)) -
          energies(static_cast<Eigen::Index>(nocc + a));
    }
  }
}

void ScreenedInteraction::imaginary_dielectric(
    double omega, Eigen::MatrixXd& dielectric) const {
  const Eigen::ArrayXd e = ov_energies_.array();
  const Eigen::VectorXd weights =
      (4.0 * e / (omega * omega + e.square())).matrix();
  dielectric.setIdentity(ov_block_.rows(), ov_block_.rows());
  dielectric.noalias() -=
      ov_block_ * weights.asDiagonal() * ov_block_.transpose();
}

Eigen::MatrixXcd ScreenedInteraction::real_dielectric(double omega) const {
  const std::complex<double> shift(0.0, 2.0 * eta_);
  Eigen::VectorXd weights_re(ov_energies_.size());
  Eigen::VectorXd weights_im(ov_energies_.size());
  for (Eigen::Index ia = 0; ia < ov_energies_.size(); ++ia) {
    const double e = ov_energies_(ia);
    const std::complex<double> w =
        2.0 * (1.0 / (omega + e + shift) + 1.0 / (-omega + e));
    weights_re(ia) = w.real();
    weights_im(ia) = w.imag();
  }

  // Real and imaginary parts as two real products, B stays real
  const Eigen::Index naux = ov_block_.rows();
  Eigen::MatrixXcd dielectric(naux, naux);
  Eigen::MatrixXd product(naux, naux);
  product.noalias() =
      ov_block_ * weights_re.asDiagonal() * ov_block_.transpose();
  dielectric.real() = Eigen::MatrixXd::Identity(naux, naux) - product;
  product.noalias() =
      ov_block_ * weights_im.asDiagonal() * ov_block_.transpose();
  dielectric.imag() = -product;
  return dielectric;
}

Eigen::VectorXd ScreenedInteraction::imaginary_column(
    const ImaginaryFactorization& factor, std::size_t n) const {
  const auto b = pair_block(n);
  Eigen::MatrixXd x = b;
  factor.solveInPlace(x);
  // B^T [(1 - Pi)^{-1} - 1] B, column by column
  return ((b.array() * x.array()).colwise().sum() -
          b.array().square().colwise().sum())
      .transpose()
      .matrix();
}

Eigen::Ref<const Eigen::MatrixXd> ScreenedInteraction::pair_block(
    std::size_t n) const {
  const auto nmo =
      static_cast<Eigen::Index>(orbitals_->get_num_molecular_orbitals());
  return integrals_->get_tensor().middleCols(static_cast<Eigen::Index>(n) * nmo,
                                             nmo);
}

std::size_t ScreenedInteraction::input_bytes() const {
  return sizeof(double) *
         static_cast<std::size_t>(ov_block_.size() + ov_energies_.size());
}

std::complex<double> ScreenedInteraction::real_axis(std::size_t m,
                                                    std::size_t n,
                                                    double omega) const {
  // Without occupied orbitals there is no polarization and W_c vanishes
  if (ov_block_.cols() == 0) {
    return {0.0, 0.0};
  }

  const Eigen::VectorXcd b =
      integrals_->get_pair(m, n).cast<std::complex<double>>();
  Eigen::MatrixXcd dielectric = real_dielectric(omega);
  Eigen::PartialPivLU<Eigen::Ref<Eigen::MatrixXcd>> lu(dielectric);

  // B^T [(1 - Pi)^{-1} - 1] B without forming the inverse
  const Eigen::VectorXcd x = lu.solve(b);
  return (b.transpose() * x).value() - b.cwiseProduct(b).sum();
}

Eigen::VectorXcd ScreenedInteraction::real_axis_static_column(
    std::size_t n) const {
  const auto nmo =
      static_cast<Eigen::Index>(orbitals_->get_num_molecular_orbitals());
  if (n >= orbitals_->get_num_molecular_orbitals()) {
    throw std::out_of_range("Orbital " + std::to_string(n) + " out of range");
  }
  if (ov_block_.cols() == 0) {
    return Eigen::VectorXcd::Zero(nmo);
  }

  Eigen::MatrixXcd dielectric = real_dielectric(0.0);
  Eigen::PartialPivLU<Eigen::Ref<Eigen::MatrixXcd>> lu(dielectric);
  const Eigen::MatrixXcd b = pair_block(n).cast<std::complex<double>>();
  const Eigen::MatrixXcd x = lu.solve(b);
  return ((b.array() * x.array()).colwise().sum() -
          b.array().square().colwise().sum())
      .transpose()
      .matrix();
}

// ---------------------------------------------------------------------------
// ScreenedInteractionMemory
// ---------------------------------------------------------------------------

ScreenedInteractionMemory::ScreenedInteractionMemory(
    const data::Orbitals& orbitals, const data::ThreeCenterIntegrals& integrals,
    const data::FrequencyGrid& grid, int num_threads)
    : num_molecular_orbitals(orbitals.get_num_molecular_orbitals()),
      num_auxiliary(integrals.get_num_auxiliary_functions()),
      num_excitations(orbitals.get_num_occupied_orbitals() *
                      orbitals.get_num_virtual_orbitals()),
      num_frequencies(grid.get_quadrature_order()),
      num_workers(static_cast<std::size_t>(std::max(num_threads, 1))) {}

std::size_t ScreenedInteractionMemory::input_bytes() const {
  return sizeof(double) * (num_auxiliary * num_excitations + num_excitations);
}

std::size_t ScreenedInteractionMemory::imaginary_workspace_bytes() const {
  // Dielectric, B scaled by the polarizability weights, right-hand sides
  return sizeof(double) *
         (num_auxiliary * num_auxiliary + num_auxiliary * num_excitations +
          num_auxiliary * num_molecular_orbitals);
}

std::size_t ScreenedInteractionMemory::assembly_workspace_bytes() const {
  const std::size_t naux = num_auxiliary;
  // W block and complex static column of the target
  const std::size_t block =
      num_molecular_orbitals * num_frequencies + 2 * num_molecular_orbitals;
  // Complex dielectric, one real product, scaled B, complex B and solution
  const std::size_t dielectric = 3 * naux * naux + naux * num_excitations +
                                 4 * naux * num_molecular_orbitals;
  return sizeof(double) * (block + dielectric);
}

// ---------------------------------------------------------------------------
// AnalyticScreenedInteraction
// ---------------------------------------------------------------------------

AnalyticScreenedInteraction::AnalyticScreenedInteraction(
    std::shared_ptr<const data::Orbitals> orbitals,
    std::shared_ptr<const data::ThreeCenterIntegrals> integrals,
    std::shared_ptr<const data::FrequencyGrid> grid,
    const std::vector<std::size_t>& targets, double eta, int num_threads)
    : ScreenedInteraction(std::move(orbitals), std::move(integrals),
                          std::move(grid), eta),
      targets_(targets) {
  CDGW_LOG_TRACE_ENTERING();
  const auto nmo =
      static_cast<Eigen::Index>(orbitals_->get_num_molecular_orbitals());
  const auto nw = static_cast<Eigen::Index>(grid_->get_quadrature_order());
  const Eigen::VectorXd& freqs = grid_->get_imaginary_frequencies();

  for (auto n : targets_) {
    if (n >= orbitals_->get_num_molecular_orbitals()) {
      throw std::out_of_range("Target orbital " + std::to_string(n) +
                              " out of range");
    }
  }
  blocks_.assign(targets_.size(), Eigen::MatrixXd::Zero(nmo, nw));
  if (ov_block_.cols() == 0) {
    return;
  }

  std::atomic<bool> factorization_failed{false};
#pragma omp parallel for num_threads(num_threads) schedule(dynamic)
  for (Eigen::Index k = 0; k < nw; ++k) {
    Eigen::MatrixXd dielectric;
    imaginary_dielectric(freqs(k), dielectric);
    ImaginaryFactorization factor(dielectric);
    if (factor.info() != Eigen::Success) {
      factorization_failed = true;
      continue;
    }
    // Each thread writes column k of every block only
    for (std::size_t t = 0; t < targets_.size(); ++t) {
      blocks_[t].col(k) = imaginary_column(factor, targets_[t]);
    }
  }

  if (factorization_failed) {
    throw std::runtime_error(
        "Dielectric matrix on the imaginary axis is not positive definite");
  }
  CDGW_LOGGER().debug(
      "Dense screened interaction: {} target orbitals, {} frequencies",
      targets_.size(), nw);
}

std::size_t AnalyticScreenedInteraction::projected_memory_bytes(
    const ScreenedInteractionMemory& memory, std::size_t num_targets) {
  const std::size_t tensor = sizeof(double) * num_targets *
                             memory.num_molecular_orbitals *
                             memory.num_frequencies;
  const std::size_t workspace = std::max(memory.imaginary_workspace_bytes(),
                                         memory.assembly_workspace_bytes());
  return memory.input_bytes() + tensor + memory.num_workers * workspace;
}

const Eigen::MatrixXd& AnalyticScreenedInteraction::_block(
    std::size_t n) const {
  auto it = std::find(targets_.begin(), targets_.end(), n);
  if (it == targets_.end()) {
    throw std::out_of_range("Orbital " + std::to_string(n) +
                            " is not a target of the dense screened "
                            "interaction");
  }
  return blocks_[static_cast<std::size_t>(std::distance(targets_.begin(), it))];
}

Eigen::MatrixXd AnalyticScreenedInteraction::imaginary_axis_block(
    std::size_t n) const {
  return _block(n);
}

double AnalyticScreenedInteraction::imaginary_axis(std::size_t m,
                                                   std::size_t n,
                                                   std::size_t k) const {
  const auto& block = _block(n);
  return block(static_cast<Eigen::Index>(m), static_cast<Eigen::Index>(k));
}

std::size_t AnalyticScreenedInteraction::memory_bytes() const {
  std::size_t total = input_bytes();
  for (const auto& block : blocks_) {
    total += sizeof(double) * static_cast<std::size_t>(block.size());
  }
  return total;
}

// ---------------------------------------------------------------------------
// LowMemoryScreenedInteraction
// ---------------------------------------------------------------------------

LowMemoryScreenedInteraction::LowMemoryScreenedInteraction(
    std::shared_ptr<const data::Orbitals> orbitals,
    std::shared_ptr<const data::ThreeCenterIntegrals> integrals,
    std::shared_ptr<const data::FrequencyGrid> grid, double eta)
    : ScreenedInteraction(std::move(orbitals), std::move(integrals),
                          std::move(grid), eta) {}

std::size_t LowMemoryScreenedInteraction::projected_memory_bytes(
    const ScreenedInteractionMemory& memory, std::size_t num_targets) {
  // A worker builds the block of its target and keeps it during assembly
  const std::size_t block_bytes = sizeof(double) *
                                  memory.num_molecular_orbitals *
                                  memory.num_frequencies;
  const std::size_t workspace =
      std::max(memory.imaginary_workspace_bytes() + block_bytes,
               memory.assembly_workspace_bytes());
  const std::size_t busy =
      std::min(memory.num_workers, std::max<std::size_t>(num_targets, 1));
  return memory.input_bytes() + busy * workspace;
}

Eigen::MatrixXd LowMemoryScreenedInteraction::imaginary_axis_block(
    std::size_t n) const {
  const auto nmo =
      static_cast<Eigen::Index>(orbitals_->get_num_molecular_orbitals());
  const auto nw = static_cast<Eigen::Index>(grid_->get_quadrature_order());
  if (n >= orbitals_->get_num_molecular_orbitals()) {
    throw std::out_of_range("Orbital " + std::to_string(n) + " out of range");
  }

  Eigen::MatrixXd block = Eigen::MatrixXd::Zero(nmo, nw);
  if (ov_block_.cols() == 0) {
    return block;
  }

  const Eigen::VectorXd& freqs = grid_->get_imaginary_frequencies();
  Eigen::MatrixXd dielectric;
  for (Eigen::Index k = 0; k < nw; ++k) {
    imaginary_dielectric(freqs(k), dielectric);
    ImaginaryFactorization factor(dielectric);
    if (factor.info() != Eigen::Success) {
      throw std::runtime_error(
          "Dielectric matrix on the imaginary axis is not positive definite");
    }
    block.col(k) = imaginary_column(factor, n);
  }
  return block;
}

double LowMemoryScreenedInteraction::imaginary_axis(std::size_t m,
                                                    std::size_t n,
                                                    std::size_t k) const {
  const Eigen::VectorXd& freqs = grid_->get_imaginary_frequencies();
  if (k >= static_cast<std::size_t>(freqs.size())) {
    throw std::out_of_range("Grid point " + std::to_string(k) +
                            " out of range");
  }
  if (ov_block_.cols() == 0) {
    return 0.0;
  }

  Eigen::MatrixXd dielectric;
  imaginary_dielectric(freqs(static_cast<Eigen::Index>(k)), dielectric);
  ImaginaryFactorization factor(dielectric);
  if (factor.info() != Eigen::Success) {
    throw std::runtime_error(
        "Dielectric matrix on the imaginary axis is not positive definite");
  }
  const Eigen::VectorXd b = integrals_->get_pair(m, n);
  Eigen::VectorXd x = b;
  factor.solveInPlace(x);
  return b.dot(x) - b.squaredNorm();
}

std::size_t LowMemoryScreenedInteraction::memory_bytes() const {
  return input_bytes();
}

// ---------------------------------------------------------------------------
// Selection
// ---------------------------------------------------------------------------

std::unique_ptr<ScreenedInteraction> select_screened_interaction(
    std::shared_ptr<const data::Orbitals> orbitals,
    std::shared_ptr<const data::ThreeCenterIntegrals> integrals,
    std::shared_ptr<const data::FrequencyGrid> grid,
    const std::vector<std::size_t>& targets,
    const ScreenedInteractionOptions& options) {
  CDGW_LOG_TRACE_ENTERING();
  auto& logger = CDGW_LOGGER();
  integrals->validate_against(*orbitals);

  const ScreenedInteractionMemory memory(*orbitals, *integrals, *grid,
                                         options.num_threads);
  const std::size_t dense_bytes =
      AnalyticScreenedInteraction::projected_memory_bytes(memory,
                                                          targets.size());
  const std::size_t on_demand_bytes =
      LowMemoryScreenedInteraction::projected_memory_bytes(memory,
                                                           targets.size());
  const auto budget_bytes =
      static_cast<std::size_t>(options.memory_budget_mb * bytes_per_mib);

  auto make_low_memory = [&]() -> std::unique_ptr<ScreenedInteraction> {
    if (on_demand_bytes > budget_bytes) {
      throw data::MemoryBudgetExceeded(on_demand_bytes, budget_bytes);
    }
    logger.info("Screened interaction: low_memory (projected {:.2f} MB)",
                static_cast<double>(on_demand_bytes) / bytes_per_mib);
    return std::make_unique<LowMemoryScreenedInteraction>(orbitals, integrals,
                                                          grid, options.eta);
  };

  if (options.low_memory_mode) {
    if (options.analytic_requested) {
      logger.warn(
          "Both low_memory_mode and analytic_screened_interaction are set; "
          "low_memory_mode takes precedence");
    }
    return make_low_memory();
  }

  if (dense_bytes > budget_bytes) {
    if (options.analytic_requested) {
      throw data::MemoryBudgetExceeded(dense_bytes, budget_bytes);
    }
    logger.warn(
        "Dense screened interaction needs {:.2f} MB, above the {:.2f} MB "
        "budget; falling back to low_memory",
        static_cast<double>(dense_bytes) / bytes_per_mib,
        options.memory_budget_mb);
    return make_low_memory();
  }

  logger.info("Screened interaction: analytic (projected {:.2f} MB)",
              static_cast<double>(dense_bytes) / bytes_per_mib);
  return std::make_unique<AnalyticScreenedInteraction>(
      orbitals, integrals, grid, targets, options.eta, options.num_threads);
}

}  // namespace cdgw::algorithms::builtin
