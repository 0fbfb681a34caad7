// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>

#include <Eigen/Dense>
#include <cdgw/data/data_class.hpp>
#include <cdgw/utils/string_utils.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace cdgw::data {

/**
 * @class Orbitals
 * @brief Closed-shell molecular orbitals of the mean-field reference
 *
 * Holds the orbital energies and occupation numbers produced by the
 * reference calculation (Hartree-Fock or Kohn-Sham), and optionally the
 * molecular orbital coefficients in the atomic orbital basis. Energies are in
 * Hartree.
 *
 * Occupied orbitals always precede the virtual ones, so orbital p is occupied
 * exactly when p < get_num_occupied_orbitals(). An orbital counts as occupied
 * when its occupation number exceeds 1.0.
 */
class Orbitals : public DataClass, public std::enable_shared_from_this<Orbitals> {
 public:
  /**
   * @brief Construct from energies and occupation numbers
   *
   * @param energies Orbital energies (n_mo)
   * @param occupations Occupation numbers (n_mo), 2 or 0 for a closed shell
   * @param coefficients Optional AO coefficient matrix (n_ao x n_mo)
   * @throws InconsistentInputShapes if the lengths disagree or an occupied
   *         orbital follows a virtual one
   */
  Orbitals(const Eigen::VectorXd& energies, const Eigen::VectorXd& occupations,
           std::optional<Eigen::MatrixXd> coefficients = std::nullopt);

  /**
   * @brief Construct from energies and the number of doubly occupied orbitals
   *
   * @param energies Orbital energies (n_mo)
   * @param num_occupied Number of doubly occupied orbitals
   * @param coefficients Optional AO coefficient matrix (n_ao x n_mo)
   * @throws InconsistentInputShapes if num_occupied exceeds n_mo
   */
  Orbitals(const Eigen::VectorXd& energies, std::size_t num_occupied,
           std::optional<Eigen::MatrixXd> coefficients = std::nullopt);

  Orbitals(const Orbitals&) = default;
  Orbitals(Orbitals&&) noexcept = default;
  Orbitals& operator=(const Orbitals&) = default;
  Orbitals& operator=(Orbitals&&) noexcept = default;
  virtual ~Orbitals() = default;

  std::size_t get_num_molecular_orbitals() const {
    return static_cast<std::size_t>(energies_.size());
  }

  std::size_t get_num_occupied_orbitals() const { return num_occupied_; }

  std::size_t get_num_virtual_orbitals() const {
    return get_num_molecular_orbitals() - num_occupied_;
  }

  const Eigen::VectorXd& get_energies() const { return energies_; }

  /**
   * @brief Energy of a single orbital
   * @throws std::out_of_range if the index is invalid
   */
  double get_energy(std::size_t index) const;

  const Eigen::VectorXd& get_occupations() const { return occupations_; }

  /**
   * @brief Whether orbital @p index is occupied in the reference
   * @throws std::out_of_range if the index is invalid
   */
  bool is_occupied(std::size_t index) const;

  bool has_coefficients() const { return coefficients_.has_value(); }

  /**
   * @brief AO coefficient matrix
   * @throws std::runtime_error if no coefficients were provided
   */
  const Eigen::MatrixXd& get_coefficients() const;

  /**
   * @brief Energy of the highest occupied orbital
   * @throws std::runtime_error if there are no occupied orbitals
   */
  double get_homo_energy() const;

  /**
   * @brief Energy of the lowest unoccupied orbital
   * @throws std::runtime_error if there are no virtual orbitals
   */
  double get_lumo_energy() const;

  /**
   * @brief Midpoint between HOMO and LUMO energies
   */
  double get_fermi_level() const;

  std::string get_data_type_name() const override {
    return DATACLASS_TO_SNAKE_CASE(Orbitals);
  }

  std::string get_summary() const override;

  void to_file(const std::string& filename,
               const std::string& type) const override;

  nlohmann::json to_json() const override;

  void to_json_file(const std::string& filename) const override;

  void to_hdf5(H5::Group& group) const override;

  void to_hdf5_file(const std::string& filename) const override;

  static std::shared_ptr<Orbitals> from_file(const std::string& filename,
                                             const std::string& type);

  static std::shared_ptr<Orbitals> from_json(const nlohmann::json& j);

  static std::shared_ptr<Orbitals> from_json_file(const std::string& filename);

  static std::shared_ptr<Orbitals> from_hdf5(H5::Group& group);

  static std::shared_ptr<Orbitals> from_hdf5_file(const std::string& filename);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  /// Occupation numbers above this value mark an occupied orbital
  static constexpr double occupation_threshold = 1.0;

  void _validate() const;

  Eigen::VectorXd energies_;
  Eigen::VectorXd occupations_;
  std::optional<Eigen::MatrixXd> coefficients_;
  std::size_t num_occupied_ = 0;
};

static_assert(DataClassCompliant<Orbitals>,
              "Orbitals must derive from DataClass and implement all required "
              "deserialization methods");

}  // namespace cdgw::data
