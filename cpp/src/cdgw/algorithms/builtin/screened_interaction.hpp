// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cdgw/data/frequency_grid.hpp>
#include <cdgw/data/orbitals.hpp>
#include <cdgw/data/three_center_integrals.hpp>
#include <complex>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace cdgw::algorithms::builtin {

/**
 * @brief Representation of the screened interaction on the imaginary axis
 */
enum class ScreenedInteractionAlgorithm {
  /// Dense W_c(m, n, i omega_k) for all m, all targets n and all k
  Analytic,
  /// W_c(mn, i omega_k) recomputed per target orbital on request
  LowMemory
};

std::string to_string(ScreenedInteractionAlgorithm algorithm);

/**
 * @brief Correlation part of the RPA screened interaction
 *
 * Evaluates the diagonal matrix elements
 *
 *   W_c(mn, omega) = sum_PQ B[P](m,n) [(1 - Pi(omega))^{-1} - 1]_PQ B[Q](m,n)
 *
 * of the screened interaction minus the bare Coulomb interaction, where Pi is
 * the closed-shell RPA polarizability in the auxiliary basis.
 *
 * The imaginary-axis values on the quadrature grid come from the concrete
 * representation through imaginary_axis_block(). The real-axis values needed
 * for pole residues are computed on demand by real_axis(), which is shared by
 * both representations.
 *
 * Instances are read-only after construction and may be queried
 * concurrently.
 */
class ScreenedInteraction {
 public:
  ScreenedInteraction(std::shared_ptr<const data::Orbitals> orbitals,
                      std::shared_ptr<const data::ThreeCenterIntegrals> integrals,
                      std::shared_ptr<const data::FrequencyGrid> grid,
                      double eta);
  virtual ~ScreenedInteraction() = default;

  ScreenedInteraction(const ScreenedInteraction&) = delete;
  ScreenedInteraction& operator=(const ScreenedInteraction&) = delete;

  virtual ScreenedInteractionAlgorithm algorithm() const = 0;

  /**
   * @brief W_c(mn, i omega_k) for every orbital m and grid point k
   *
   * @param n Target orbital
   * @return n_mo x N matrix
   */
  virtual Eigen::MatrixXd imaginary_axis_block(std::size_t n) const = 0;

  /**
   * @brief Single value W_c(mn, i omega_k)
   */
  virtual double imaginary_axis(std::size_t m, std::size_t n,
                                std::size_t k) const = 0;

  /**
   * @brief W_c(mn, omega) at a real frequency, broadened by eta
   *
   * @param omega Non-negative real frequency (Ha)
   */
  std::complex<double> real_axis(std::size_t m, std::size_t n,
                                 double omega) const;

  /**
   * @brief W_c(mn, 0) on the real axis for every orbital m
   *
   * One dielectric solve serves the whole column.
   *
   * @param n Target orbital
   * @return n_mo complex values
   */
  Eigen::VectorXcd real_axis_static_column(std::size_t n) const;

  /**
   * @brief Bytes held by the representation after construction, including
   * the copy of the occupied-virtual integrals
   */
  virtual std::size_t memory_bytes() const = 0;

  const data::Orbitals& orbitals() const { return *orbitals_; }

  const data::FrequencyGrid& grid() const { return *grid_; }

  double eta() const { return eta_; }

 protected:
  using ImaginaryFactorization = Eigen::LLT<Eigen::Ref<Eigen::MatrixXd>>;

  /// Writes 1 - Pi(i omega) into @p dielectric (positive definite)
  void imaginary_dielectric(double omega, Eigen::MatrixXd& dielectric) const;

  /// 1 - Pi(omega) on the real axis, n_aux x n_aux
  Eigen::MatrixXcd real_dielectric(double omega) const;

  /**
   * @brief W_c(mn, i omega) for every m from the in-place Cholesky factor of
   * 1 - Pi(i omega)
   */
  Eigen::VectorXd imaginary_column(const ImaginaryFactorization& factor,
                                   std::size_t n) const;

  /// B[:](m,n) for all m, n_aux x n_mo
  Eigen::Ref<const Eigen::MatrixXd> pair_block(std::size_t n) const;

  /// Bytes of ov_block_ and ov_energies_
  std::size_t input_bytes() const;

  std::shared_ptr<const data::Orbitals> orbitals_;
  std::shared_ptr<const data::ThreeCenterIntegrals> integrals_;
  std::shared_ptr<const data::FrequencyGrid> grid_;
  double eta_;

  /// B[P](i,a), n_aux x (n_occ * n_vir)
  Eigen::MatrixXd ov_block_;
  /// eps_i - eps_a, same column order as ov_block_
  Eigen::VectorXd ov_energies_;
};

/**
 * @brief Peak memory of a GW run with either representation
 *
 * Both projections count the occupied-virtual integral copy, the stored
 * representation, and per worker the larger of the construction and the
 * self-energy work space. The self-energy work space holds the W block and
 * static column of one target plus one real-axis dielectric solve.
 */
struct ScreenedInteractionMemory {
  std::size_t num_molecular_orbitals;
  std::size_t num_auxiliary;
  /// n_occ * n_vir
  std::size_t num_excitations;
  std::size_t num_frequencies;
  std::size_t num_workers;

  ScreenedInteractionMemory(const data::Orbitals& orbitals,
                            const data::ThreeCenterIntegrals& integrals,
                            const data::FrequencyGrid& grid, int num_threads);

  std::size_t input_bytes() const;
  /// Per worker, dielectric of one frequency and one solve for all m
  std::size_t imaginary_workspace_bytes() const;
  /// Per worker, during self-energy assembly
  std::size_t assembly_workspace_bytes() const;
};

/**
 * @brief Dense imaginary-axis screened interaction
 *
 * Factorizes the dielectric matrix once per quadrature point and stores
 * W_c(mn, i omega_k) for all m and every target orbital n. Frequencies are
 * processed in parallel.
 */
class AnalyticScreenedInteraction : public ScreenedInteraction {
 public:
  AnalyticScreenedInteraction(
      std::shared_ptr<const data::Orbitals> orbitals,
      std::shared_ptr<const data::ThreeCenterIntegrals> integrals,
      std::shared_ptr<const data::FrequencyGrid> grid,
      const std::vector<std::size_t>& targets, double eta, int num_threads);

  /**
   * @brief Peak memory of a run with the dense representation, before
   * construction
   */
  static std::size_t projected_memory_bytes(
      const ScreenedInteractionMemory& memory, std::size_t num_targets);

  ScreenedInteractionAlgorithm algorithm() const override {
    return ScreenedInteractionAlgorithm::Analytic;
  }

  /// @throws std::out_of_range if @p n is not a target orbital
  Eigen::MatrixXd imaginary_axis_block(std::size_t n) const override;

  double imaginary_axis(std::size_t m, std::size_t n,
                        std::size_t k) const override;

  std::size_t memory_bytes() const override;

 private:
  const Eigen::MatrixXd& _block(std::size_t n) const;

  std::vector<std::size_t> targets_;
  /// One n_mo x N matrix per target, in the order of targets_
  std::vector<Eigen::MatrixXd> blocks_;
};

/**
 * @brief On-demand imaginary-axis screened interaction
 *
 * Nothing is stored beyond the occupied-virtual integrals. Each call to
 * imaginary_axis_block() refactorizes 1 - Pi(i omega_k) for every grid point
 * and solves for the requested target only, so a worker holds one n_mo x N
 * block and one dielectric matrix at a time. The values are identical to the
 * dense representation; the price is N factorizations per target instead of
 * N in total.
 */
class LowMemoryScreenedInteraction : public ScreenedInteraction {
 public:
  LowMemoryScreenedInteraction(
      std::shared_ptr<const data::Orbitals> orbitals,
      std::shared_ptr<const data::ThreeCenterIntegrals> integrals,
      std::shared_ptr<const data::FrequencyGrid> grid, double eta);

  /**
   * @brief Peak memory of a run with the on-demand representation
   *
   * Only the workers busy with a target hold a block, so the projection never
   * exceeds the dense one for the same targets.
   */
  static std::size_t projected_memory_bytes(
      const ScreenedInteractionMemory& memory, std::size_t num_targets);

  ScreenedInteractionAlgorithm algorithm() const override {
    return ScreenedInteractionAlgorithm::LowMemory;
  }

  Eigen::MatrixXd imaginary_axis_block(std::size_t n) const override;

  double imaginary_axis(std::size_t m, std::size_t n,
                        std::size_t k) const override;

  std::size_t memory_bytes() const override;
};

/**
 * @brief How the screened interaction representation is chosen
 */
struct ScreenedInteractionOptions {
  /// Explicitly request the dense representation
  bool analytic_requested = false;
  /// Force the on-demand representation
  bool low_memory_mode = false;
  /// Memory budget of the run, in MiB
  double memory_budget_mb = 4096.0;
  double eta = 1e-3;
  int num_threads = 1;
};

/**
 * @brief Choose and build the screened interaction representation
 *
 * - low_memory_mode: on-demand.
 * - analytic_requested: dense.
 * - neither: dense when it fits the budget, on-demand otherwise.
 *
 * The projection of the chosen representation is checked against the budget
 * before anything is allocated, and data::MemoryBudgetExceeded is thrown when
 * it does not fit. In particular an automatic fallback never exceeds the
 * budget.
 */
std::unique_ptr<ScreenedInteraction> select_screened_interaction(
    std::shared_ptr<const data::Orbitals> orbitals,
    std::shared_ptr<const data::ThreeCenterIntegrals> integrals,
    std::shared_ptr<const data::FrequencyGrid> grid,
    const std::vector<std::size_t>& targets,
    const ScreenedInteractionOptions& options);

}  // namespace cdgw::algorithms::builtin
