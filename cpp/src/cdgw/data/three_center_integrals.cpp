// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cdgw/data/errors.hpp>
#include <cdgw/data/orbitals.hpp>
#include <cdgw/data/three_center_integrals.hpp>
#include <cdgw/utils/logger.hpp>
#include <sstream>
#include <stdexcept>

#include "filename_utils.hpp"
#include "hdf5_error_handling.hpp"
#include "hdf5_serialization.hpp"
#include "json_serialization.hpp"

namespace cdgw::data {

ThreeCenterIntegrals::ThreeCenterIntegrals(Eigen::MatrixXd tensor,
                                           std::size_t num_molecular_orbitals,
                                           std::optional<Eigen::MatrixXd> vxc)
    : tensor_(std::move(tensor)),
      num_mo_(num_molecular_orbitals),
      vxc_(std::move(vxc)) {
  CDGW_LOG_TRACE_ENTERING();
  const auto expected_cols = static_cast<Eigen::Index>(num_mo_ * num_mo_);
  if (tensor_.cols() != expected_cols) {
    throw InconsistentInputShapes(
        "three-center tensor has " + std::to_string(tensor_.cols()) +
        " columns, expected n_mo^2 = " + std::to_string(expected_cols));
  }
  if (vxc_.has_value()) {
    const auto n = static_cast<Eigen::Index>(num_mo_);
    if (vxc_->rows() != n || vxc_->cols() != n) {
      throw InconsistentInputShapes(
          "exchange-correlation potential is " +
          std::to_string(vxc_->rows()) + " x " + std::to_string(vxc_->cols()) +
          ", expected " + std::to_string(n) + " x " + std::to_string(n));
    }
  }
}

std::shared_ptr<ThreeCenterIntegrals>
ThreeCenterIntegrals::from_atomic_orbitals(
    const Eigen::MatrixXd& ao_tensor, const Eigen::MatrixXd& coefficients,
    const std::optional<Eigen::MatrixXd>& ao_vxc) {
  CDGW_LOG_TRACE_ENTERING();
  const Eigen::Index num_ao = coefficients.rows();
  const Eigen::Index num_mo = coefficients.cols();
  if (ao_tensor.cols() != num_ao * num_ao) {
    throw InconsistentInputShapes(
        "AO three-center tensor has " + std::to_string(ao_tensor.cols()) +
        " columns, expected n_ao^2 = " + std::to_string(num_ao * num_ao));
  }
  if (ao_vxc.has_value() &&
      (ao_vxc->rows() != num_ao || ao_vxc->cols() != num_ao)) {
    throw InconsistentInputShapes(
        "AO exchange-correlation potential must be " +
        std::to_string(num_ao) + " x " + std::to_string(num_ao));
  }

  const Eigen::Index num_aux = ao_tensor.rows();
  Eigen::MatrixXd mo_tensor(num_aux, num_mo * num_mo);
  for (Eigen::Index P = 0; P < num_aux; ++P) {
    // Row P reshaped to the n_ao x n_ao matrix A[P]
    const Eigen::MatrixXd ao_row = ao_tensor.row(P);
    Eigen::Map<const Eigen::MatrixXd> ao_block(ao_row.data(), num_ao, num_ao);
    Eigen::MatrixXd mo_block = coefficients.transpose() * ao_block * coefficients;
    mo_tensor.row(P) =
        Eigen::Map<const Eigen::RowVectorXd>(mo_block.data(), num_mo * num_mo);
  }

  std::optional<Eigen::MatrixXd> mo_vxc;
  if (ao_vxc.has_value()) {
    mo_vxc = coefficients.transpose() * (*ao_vxc) * coefficients;
  }
  return std::make_shared<ThreeCenterIntegrals>(
      std::move(mo_tensor), static_cast<std::size_t>(num_mo),
      std::move(mo_vxc));
}

Eigen::VectorXd ThreeCenterIntegrals::get_pair(std::size_t p,
                                               std::size_t q) const {
  if (p >= num_mo_ || q >= num_mo_) {
    throw std::out_of_range("Orbital pair (" + std::to_string(p) + ", " +
                            std::to_string(q) + ") out of range");
  }
  return tensor_.col(static_cast<Eigen::Index>(p + q * num_mo_));
}

Eigen::MatrixXd ThreeCenterIntegrals::get_occupied_virtual_block(
    std::size_t num_occupied) const {
  CDGW_LOG_TRACE_ENTERING();
  if (num_occupied > num_mo_) {
    throw std::out_of_range("More occupied orbitals than molecular orbitals");
  }
  const std::size_t num_virtual = num_mo_ - num_occupied;
  Eigen::MatrixXd block(tensor_.rows(),
                        static_cast<Eigen::Index>(num_occupied * num_virtual));
  for (std::size_t a = 0; a < num_virtual; ++a) {
    for (std::size_t i = 0; i < num_occupied; ++i) {
      block.col(static_cast<Eigen::Index>(i + a * num_occupied)) =
          tensor_.col(static_cast<Eigen::Index>(i + (num_occupied + a) * num_mo_));
    }
  }
  return block;
}

const Eigen::MatrixXd& ThreeCenterIntegrals::get_vxc() const {
  if (!vxc_.has_value()) {
    throw std::runtime_error("No exchange-correlation potential available");
  }
  return *vxc_;
}

void ThreeCenterIntegrals::validate_against(const Orbitals& orbitals) const {
  CDGW_LOG_TRACE_ENTERING();
  if (orbitals.get_num_molecular_orbitals() != num_mo_) {
    throw InconsistentInputShapes(
        "orbitals describe " +
        std::to_string(orbitals.get_num_molecular_orbitals()) +
        " molecular orbitals but the three-center integrals describe " +
        std::to_string(num_mo_));
  }
}

std::string ThreeCenterIntegrals::get_summary() const {
  CDGW_LOG_TRACE_ENTERING();
  std::ostringstream oss;
  oss << "ThreeCenterIntegrals Summary:\n";
  oss << "  Molecular orbitals: " << num_mo_ << "\n";
  oss << "  Auxiliary functions: " << get_num_auxiliary_functions() << "\n";
  oss << "  Exchange-correlation potential: "
      << (has_vxc() ? "provided" : "none (Hartree-Fock reference)") << "\n";
  return oss.str();
}

void ThreeCenterIntegrals::to_file(const std::string& filename,
                                   const std::string& type) const {
  CDGW_LOG_TRACE_ENTERING();
  if (type == "json") {
    to_json_file(filename);
  } else if (type == "hdf5") {
    to_hdf5_file(filename);
  } else {
    throw std::invalid_argument("Unsupported file type: " + type +
                                ". Supported types are: json, hdf5");
  }
}

nlohmann::json ThreeCenterIntegrals::to_json() const {
  CDGW_LOG_TRACE_ENTERING();
  nlohmann::json j;
  j["serialization_version"] = SERIALIZATION_VERSION;
  j["type"] = "ThreeCenterIntegrals";
  j["num_molecular_orbitals"] = num_mo_;
  j["tensor"] = matrix_to_json(tensor_);
  if (vxc_.has_value()) {
    j["vxc"] = matrix_to_json(*vxc_);
  }
  return j;
}

std::shared_ptr<ThreeCenterIntegrals> ThreeCenterIntegrals::from_json(
    const nlohmann::json& j) {
  CDGW_LOG_TRACE_ENTERING();
  validate_json_header(j, "ThreeCenterIntegrals", SERIALIZATION_VERSION);
  if (!j.contains("num_molecular_orbitals") || !j.contains("tensor")) {
    throw std::runtime_error(
        "ThreeCenterIntegrals JSON must contain 'num_molecular_orbitals' and "
        "'tensor'");
  }
  const auto num_mo = j["num_molecular_orbitals"].get<std::size_t>();
  Eigen::MatrixXd tensor = json_to_matrix(j["tensor"]);
  // An empty auxiliary basis serializes as an empty array
  if (tensor.size() == 0) {
    tensor.resize(0, static_cast<Eigen::Index>(num_mo * num_mo));
  }
  std::optional<Eigen::MatrixXd> vxc;
  if (j.contains("vxc")) {
    vxc = json_to_matrix(j["vxc"]);
  }
  return std::make_shared<ThreeCenterIntegrals>(std::move(tensor), num_mo,
                                                std::move(vxc));
}

void ThreeCenterIntegrals::to_json_file(const std::string& filename) const {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_write_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(ThreeCenterIntegrals));
  write_json_file(filename, to_json());
}

std::shared_ptr<ThreeCenterIntegrals> ThreeCenterIntegrals::from_json_file(
    const std::string& filename) {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_read_suffix(filename, "three_center_integrals");
  return from_json(read_json_file(filename, "ThreeCenterIntegrals"));
}

void ThreeCenterIntegrals::to_hdf5(H5::Group& group) const {
  CDGW_LOG_TRACE_ENTERING();
  write_hdf5_header(group, "ThreeCenterIntegrals", SERIALIZATION_VERSION);
  write_int_attribute(group, "num_molecular_orbitals",
                      static_cast<int64_t>(num_mo_));
  save_matrix_to_group(group, "tensor", tensor_);
  if (vxc_.has_value()) {
    save_matrix_to_group(group, "vxc", *vxc_);
  }
}

std::shared_ptr<ThreeCenterIntegrals> ThreeCenterIntegrals::from_hdf5(
    H5::Group& group) {
  CDGW_LOG_TRACE_ENTERING();
  validate_hdf5_header(group, "ThreeCenterIntegrals", SERIALIZATION_VERSION);
  const auto num_mo = static_cast<std::size_t>(
      read_int_attribute(group, "num_molecular_orbitals"));
  std::optional<Eigen::MatrixXd> vxc;
  if (dataset_exists_in_group(group, "vxc")) {
    vxc = load_matrix_from_group(group, "vxc");
  }
  return std::make_shared<ThreeCenterIntegrals>(
      load_matrix_from_group(group, "tensor"), num_mo, std::move(vxc));
}

void ThreeCenterIntegrals::to_hdf5_file(const std::string& filename) const {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_write_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(ThreeCenterIntegrals));
  write_hdf5_file(filename, "ThreeCenterIntegrals",
                  [this](H5::H5File& file) { to_hdf5(file); });
}

std::shared_ptr<ThreeCenterIntegrals> ThreeCenterIntegrals::from_hdf5_file(
    const std::string& filename) {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_read_suffix(filename, "three_center_integrals");
  return read_hdf5_file(filename, "ThreeCenterIntegrals",
                        [](H5::H5File& file) { return from_hdf5(file); });
}

std::shared_ptr<ThreeCenterIntegrals> ThreeCenterIntegrals::from_file(
    const std::string& filename, const std::string& type) {
  CDGW_LOG_TRACE_ENTERING();
  if (type == "json") {
    return from_json_file(filename);
  } else if (type == "hdf5") {
    return from_hdf5_file(filename);
  }
  throw std::invalid_argument("Unsupported file type: " + type +
                              ". Supported types are: json, hdf5");
}

}  // namespace cdgw::data
