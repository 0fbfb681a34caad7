// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>

#include <Eigen/Dense>
#include <cdgw/data/data_class.hpp>
#include <cdgw/utils/string_utils.hpp>
#include <complex>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace cdgw::data {

/**
 * @class SelfEnergy
 * @brief Sampled GW self-energy of a window of orbitals
 *
 * For every computed orbital n (column i of the stored matrices) this holds
 * the reference energy eps_n, the static part Sigma_X(n) - V_xc(n), and the
 * complex correlation self-energy Sigma_c(omega) sampled on the orbital's own
 * real frequency grid omega = eps_n + offsets. The total self-energy is
 *
 *   Sigma(omega) = Sigma_X(n) - V_xc(n) + Sigma_c(omega)
 *
 * Columns follow the order of get_orbital_indices(), which is ascending in
 * the orbital index.
 */
class SelfEnergy : public DataClass,
                   public std::enable_shared_from_this<SelfEnergy> {
 public:
  /**
   * @brief Construct from sampled data
   *
   * @param orbital_indices Indices of the computed orbitals (n_orb)
   * @param reference_energies Mean-field energies of those orbitals (n_orb)
   * @param exchange Exchange self-energy Sigma_X (n_orb)
   * @param vxc Diagonal exchange-correlation potential (n_orb)
   * @param frequencies Real sampling frequencies (M x n_orb), increasing down
   *        each column
   * @param correlation Correlation self-energy at those frequencies
   *        (M x n_orb)
   * @throws InconsistentInputShapes if the dimensions disagree
   */
  SelfEnergy(std::vector<std::size_t> orbital_indices,
             Eigen::VectorXd reference_energies, Eigen::VectorXd exchange,
             Eigen::VectorXd vxc, Eigen::MatrixXd frequencies,
             Eigen::MatrixXcd correlation);

  SelfEnergy(const SelfEnergy&) = default;
  SelfEnergy(SelfEnergy&&) noexcept = default;
  SelfEnergy& operator=(const SelfEnergy&) = default;
  SelfEnergy& operator=(SelfEnergy&&) noexcept = default;
  virtual ~SelfEnergy() = default;

  /// Number of computed orbitals
  std::size_t size() const { return orbital_indices_.size(); }

  std::size_t get_num_frequencies() const {
    return static_cast<std::size_t>(frequencies_.rows());
  }

  const std::vector<std::size_t>& get_orbital_indices() const {
    return orbital_indices_;
  }

  /**
   * @brief Column holding a given orbital
   * @throws std::out_of_range if the orbital was not computed
   */
  std::size_t find_column(std::size_t orbital_index) const;

  const Eigen::VectorXd& get_reference_energies() const {
    return reference_energies_;
  }

  const Eigen::VectorXd& get_exchange() const { return exchange_; }

  const Eigen::VectorXd& get_vxc() const { return vxc_; }

  /**
   * @brief Sigma_X - V_xc of column @p i
   */
  double get_static_part(std::size_t i) const;

  const Eigen::MatrixXd& get_frequencies() const { return frequencies_; }

  const Eigen::MatrixXcd& get_correlation() const { return correlation_; }

  /**
   * @brief Total self-energy of column @p i on its sampling grid
   */
  Eigen::VectorXcd get_total(std::size_t i) const;

  /**
   * @brief Total self-energy of column @p i at an arbitrary frequency
   *
   * Linear interpolation between the two bracketing grid points.
   *
   * @throws std::out_of_range if omega lies outside the sampled grid
   */
  std::complex<double> interpolate(std::size_t i, double omega) const;

  std::string get_data_type_name() const override {
    return DATACLASS_TO_SNAKE_CASE(SelfEnergy);
  }

  std::string get_summary() const override;

  void to_file(const std::string& filename,
               const std::string& type) const override;

  nlohmann::json to_json() const override;

  void to_json_file(const std::string& filename) const override;

  void to_hdf5(H5::Group& group) const override;

  void to_hdf5_file(const std::string& filename) const override;

  static std::shared_ptr<SelfEnergy> from_file(const std::string& filename,
                                               const std::string& type);

  static std::shared_ptr<SelfEnergy> from_json(const nlohmann::json& j);

  static std::shared_ptr<SelfEnergy> from_json_file(
      const std::string& filename);

  static std::shared_ptr<SelfEnergy> from_hdf5(H5::Group& group);

  static std::shared_ptr<SelfEnergy> from_hdf5_file(
      const std::string& filename);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  void _check_column(std::size_t i) const;

  std::vector<std::size_t> orbital_indices_;
  Eigen::VectorXd reference_energies_;
  Eigen::VectorXd exchange_;
  Eigen::VectorXd vxc_;
  Eigen::MatrixXd frequencies_;
  Eigen::MatrixXcd correlation_;
};

static_assert(DataClassCompliant<SelfEnergy>,
              "SelfEnergy must derive from DataClass and implement all "
              "required deserialization methods");

}  // namespace cdgw::data
