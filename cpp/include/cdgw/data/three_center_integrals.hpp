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

class Orbitals;

/**
 * @class ThreeCenterIntegrals
 * @brief Resolution-of-identity factors of the MO electron repulsion integrals
 *
 * Stores the metric-contracted three-index tensor B such that
 *
 *   (pq|rs) = sum_P B[P](p,q) B[P](r,s)
 *
 * together with an optional exchange-correlation potential of the reference
 * in the MO basis.
 *
 * @section tensor_layout Tensor Layout
 *
 * The tensor is an n_aux x (n_mo * n_mo) matrix. Row P holds B[P] with the
 * first orbital index varying fastest, i.e. B[P](p,q) is element
 * (P, p + q * n_mo). Every B[P] is symmetric in (p,q).
 *
 * When no exchange-correlation potential is provided the reference is taken
 * to be Hartree-Fock, for which the potential equals the exact exchange.
 */
class ThreeCenterIntegrals
    : public DataClass,
      public std::enable_shared_from_this<ThreeCenterIntegrals> {
 public:
  /**
   * @brief Construct from an MO-basis tensor
   *
   * @param tensor Three-index tensor (n_aux x n_mo^2)
   * @param num_molecular_orbitals Number of molecular orbitals n_mo
   * @param vxc Optional exchange-correlation potential (n_mo x n_mo)
   * @throws InconsistentInputShapes if the column count is not n_mo^2 or
   *         the potential is not n_mo x n_mo
   */
  ThreeCenterIntegrals(Eigen::MatrixXd tensor,
                       std::size_t num_molecular_orbitals,
                       std::optional<Eigen::MatrixXd> vxc = std::nullopt);

  ThreeCenterIntegrals(const ThreeCenterIntegrals&) = default;
  ThreeCenterIntegrals(ThreeCenterIntegrals&&) noexcept = default;
  ThreeCenterIntegrals& operator=(const ThreeCenterIntegrals&) = default;
  ThreeCenterIntegrals& operator=(ThreeCenterIntegrals&&) noexcept = default;
  virtual ~ThreeCenterIntegrals() = default;

  /**
   * @brief Transform AO-basis quantities to the MO basis
   *
   * For every auxiliary function B[P] = C^T A[P] C, and V_xc = C^T V C.
   *
   * @param ao_tensor AO three-index tensor (n_aux x n_ao^2), same layout as
   *        the MO tensor
   * @param coefficients MO coefficients (n_ao x n_mo)
   * @param ao_vxc Optional AO exchange-correlation potential (n_ao x n_ao)
   * @throws InconsistentInputShapes on any dimension mismatch
   */
  static std::shared_ptr<ThreeCenterIntegrals> from_atomic_orbitals(
      const Eigen::MatrixXd& ao_tensor, const Eigen::MatrixXd& coefficients,
      const std::optional<Eigen::MatrixXd>& ao_vxc = std::nullopt);

  std::size_t get_num_molecular_orbitals() const { return num_mo_; }

  std::size_t get_num_auxiliary_functions() const {
    return static_cast<std::size_t>(tensor_.rows());
  }

  const Eigen::MatrixXd& get_tensor() const { return tensor_; }

  /**
   * @brief Column of the tensor for the orbital pair (p,q)
   *
   * @return B[:](p,q), length n_aux
   */
  Eigen::VectorXd get_pair(std::size_t p, std::size_t q) const;

  /**
   * @brief Occupied-virtual block of the tensor
   *
   * @param num_occupied Number of occupied orbitals, which come first
   * @return n_aux x (n_occ * n_vir) matrix, column i + a * n_occ holds
   *         B[:](i, n_occ + a)
   */
  Eigen::MatrixXd get_occupied_virtual_block(std::size_t num_occupied) const;

  bool has_vxc() const { return vxc_.has_value(); }

  /**
   * @brief Exchange-correlation potential in the MO basis
   * @throws std::runtime_error if none was provided
   */
  const Eigen::MatrixXd& get_vxc() const;

  /**
   * @brief Check that these integrals describe the given orbitals
   * @throws InconsistentInputShapes if the orbital counts differ
   */
  void validate_against(const Orbitals& orbitals) const;

  std::string get_data_type_name() const override {
    return DATACLASS_TO_SNAKE_CASE(ThreeCenterIntegrals);
  }

  std::string get_summary() const override;

  void to_file(const std::string& filename,
               const std::string& type) const override;

  nlohmann::json to_json() const override;

  void to_json_file(const std::string& filename) const override;

  void to_hdf5(H5::Group& group) const override;

  void to_hdf5_file(const std::string& filename) const override;

  static std::shared_ptr<ThreeCenterIntegrals> from_file(
      const std::string& filename, const std::string& type);

  static std::shared_ptr<ThreeCenterIntegrals> from_json(
      const nlohmann::json& j);

  static std::shared_ptr<ThreeCenterIntegrals> from_json_file(
      const std::string& filename);

  static std::shared_ptr<ThreeCenterIntegrals> from_hdf5(H5::Group& group);

  static std::shared_ptr<ThreeCenterIntegrals> from_hdf5_file(
      const std::string& filename);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  Eigen::MatrixXd tensor_;
  std::size_t num_mo_;
  std::optional<Eigen::MatrixXd> vxc_;
};

static_assert(DataClassCompliant<ThreeCenterIntegrals>,
              "ThreeCenterIntegrals must derive from DataClass and implement "
              "all required deserialization methods");

}  // namespace cdgw::data
