// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cdgw/constants.hpp>
#include <cdgw/data/errors.hpp>
#include <cdgw/data/orbitals.hpp>
#include <cdgw/utils/logger.hpp>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "filename_utils.hpp"
#include "hdf5_error_handling.hpp"
#include "hdf5_serialization.hpp"
#include "json_serialization.hpp"

namespace cdgw::data {

Orbitals::Orbitals(const Eigen::VectorXd& energies,
                   const Eigen::VectorXd& occupations,
                   std::optional<Eigen::MatrixXd> coefficients)
    : energies_(energies),
      occupations_(occupations),
      coefficients_(std::move(coefficients)) {
  CDGW_LOG_TRACE_ENTERING();
  if (occupations_.size() != energies_.size()) {
    throw InconsistentInputShapes(
        "occupation vector has " + std::to_string(occupations_.size()) +
        " entries but there are " + std::to_string(energies_.size()) +
        " orbital energies");
  }

  // Occupied orbitals form a leading block
  bool seen_virtual = false;
  for (Eigen::Index p = 0; p < occupations_.size(); ++p) {
    if (occupations_(p) > occupation_threshold) {
      if (seen_virtual) {
        throw InconsistentInputShapes(
            "occupied orbital " + std::to_string(p) +
            " follows a virtual orbital; occupied orbitals must come first");
      }
      ++num_occupied_;
    } else {
      seen_virtual = true;
    }
  }
  _validate();
}

Orbitals::Orbitals(const Eigen::VectorXd& energies, std::size_t num_occupied,
                   std::optional<Eigen::MatrixXd> coefficients)
    : energies_(energies),
      occupations_(Eigen::VectorXd::Zero(energies.size())),
      coefficients_(std::move(coefficients)),
      num_occupied_(num_occupied) {
  CDGW_LOG_TRACE_ENTERING();
  if (num_occupied_ > get_num_molecular_orbitals()) {
    throw InconsistentInputShapes(
        std::to_string(num_occupied_) + " occupied orbitals requested but only " +
        std::to_string(get_num_molecular_orbitals()) + " orbitals available");
  }
  occupations_.head(static_cast<Eigen::Index>(num_occupied_))
      .setConstant(constants::closed_shell_occupation);
  _validate();
}

void Orbitals::_validate() const {
  if (coefficients_.has_value() &&
      coefficients_->cols() != energies_.size()) {
    throw InconsistentInputShapes(
        "coefficient matrix has " + std::to_string(coefficients_->cols()) +
        " columns but there are " + std::to_string(energies_.size()) +
        " orbital energies");
  }
}

double Orbitals::get_energy(std::size_t index) const {
  if (index >= get_num_molecular_orbitals()) {
    throw std::out_of_range("Orbital index " + std::to_string(index) +
                            " out of range");
  }
  return energies_(static_cast<Eigen::Index>(index));
}

bool Orbitals::is_occupied(std::size_t index) const {
  if (index >= get_num_molecular_orbitals()) {
    throw std::out_of_range("Orbital index " + std::to_string(index) +
                            " out of range");
  }
  return index < num_occupied_;
}

const Eigen::MatrixXd& Orbitals::get_coefficients() const {
  if (!coefficients_.has_value()) {
    throw std::runtime_error("No orbital coefficients available");
  }
  return *coefficients_;
}

double Orbitals::get_homo_energy() const {
  if (num_occupied_ == 0) {
    throw std::runtime_error("No occupied orbitals: HOMO is undefined");
  }
  return energies_(static_cast<Eigen::Index>(num_occupied_) - 1);
}

double Orbitals::get_lumo_energy() const {
  if (get_num_virtual_orbitals() == 0) {
    throw std::runtime_error("No virtual orbitals: LUMO is undefined");
  }
  return energies_(static_cast<Eigen::Index>(num_occupied_));
}

double Orbitals::get_fermi_level() const {
  return 0.5 * (get_homo_energy() + get_lumo_energy());
}

std::string Orbitals::get_summary() const {
  CDGW_LOG_TRACE_ENTERING();
  std::ostringstream oss;
  oss << "Orbitals Summary:\n";
  oss << "  Molecular orbitals: " << get_num_molecular_orbitals() << "\n";
  oss << "  Occupied / virtual: " << num_occupied_ << " / "
      << get_num_virtual_orbitals() << "\n";
  oss << std::fixed << std::setprecision(6);
  if (num_occupied_ > 0) {
    oss << "  HOMO energy: " << get_homo_energy() << " Ha ("
        << get_homo_energy() * constants::hartree_to_ev << " eV)\n";
  }
  if (get_num_virtual_orbitals() > 0) {
    oss << "  LUMO energy: " << get_lumo_energy() << " Ha ("
        << get_lumo_energy() * constants::hartree_to_ev << " eV)\n";
  }
  oss << "  Coefficients: "
      << (has_coefficients()
              ? std::to_string(coefficients_->rows()) + " x " +
                    std::to_string(coefficients_->cols())
              : std::string("none"))
      << "\n";
  return oss.str();
}

void Orbitals::to_file(const std::string& filename,
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

nlohmann::json Orbitals::to_json() const {
  CDGW_LOG_TRACE_ENTERING();
  nlohmann::json j;
  j["serialization_version"] = SERIALIZATION_VERSION;
  j["type"] = "Orbitals";
  j["energies"] = vector_to_json(energies_);
  j["occupations"] = vector_to_json(occupations_);
  if (coefficients_.has_value()) {
    j["coefficients"] = matrix_to_json(*coefficients_);
  }
  return j;
}

std::shared_ptr<Orbitals> Orbitals::from_json(const nlohmann::json& j) {
  CDGW_LOG_TRACE_ENTERING();
  validate_json_header(j, "Orbitals", SERIALIZATION_VERSION);
  if (!j.contains("energies") || !j.contains("occupations")) {
    throw std::runtime_error(
        "Orbitals JSON must contain 'energies' and 'occupations'");
  }

  std::optional<Eigen::MatrixXd> coefficients;
  if (j.contains("coefficients")) {
    coefficients = json_to_matrix(j["coefficients"]);
  }
  return std::make_shared<Orbitals>(json_to_vector(j["energies"]),
                                    json_to_vector(j["occupations"]),
                                    std::move(coefficients));
}

void Orbitals::to_json_file(const std::string& filename) const {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_write_suffix(filename,
                                          DATACLASS_TO_SNAKE_CASE(Orbitals));
  write_json_file(filename, to_json());
}

std::shared_ptr<Orbitals> Orbitals::from_json_file(
    const std::string& filename) {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_read_suffix(filename, "orbitals");
  return from_json(read_json_file(filename, "Orbitals"));
}

void Orbitals::to_hdf5(H5::Group& group) const {
  CDGW_LOG_TRACE_ENTERING();
  write_hdf5_header(group, "Orbitals", SERIALIZATION_VERSION);
  save_vector_to_group(group, "energies", energies_);
  save_vector_to_group(group, "occupations", occupations_);
  if (coefficients_.has_value()) {
    save_matrix_to_group(group, "coefficients", *coefficients_);
  }
}

std::shared_ptr<Orbitals> Orbitals::from_hdf5(H5::Group& group) {
  CDGW_LOG_TRACE_ENTERING();
  validate_hdf5_header(group, "Orbitals", SERIALIZATION_VERSION);

  std::optional<Eigen::MatrixXd> coefficients;
  if (dataset_exists_in_group(group, "coefficients")) {
    coefficients = load_matrix_from_group(group, "coefficients");
  }
  return std::make_shared<Orbitals>(
      load_vector_from_group(group, "energies"),
      load_vector_from_group(group, "occupations"), std::move(coefficients));
}

void Orbitals::to_hdf5_file(const std::string& filename) const {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_write_suffix(filename,
                                          DATACLASS_TO_SNAKE_CASE(Orbitals));
  write_hdf5_file(filename, "Orbitals",
                  [this](H5::H5File& file) { to_hdf5(file); });
}

std::shared_ptr<Orbitals> Orbitals::from_hdf5_file(
    const std::string& filename) {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_read_suffix(filename, "orbitals");
  return read_hdf5_file(filename, "Orbitals",
                        [](H5::H5File& file) { return from_hdf5(file); });
}

std::shared_ptr<Orbitals> Orbitals::from_file(const std::string& filename,
                                              const std::string& type) {
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
