// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <cdgw/constants.hpp>
#include <cdgw/data/errors.hpp>
#include <cdgw/data/self_energy.hpp>
#include <cdgw/utils/logger.hpp>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "filename_utils.hpp"
#include "hdf5_error_handling.hpp"
#include "hdf5_serialization.hpp"
#include "json_serialization.hpp"

namespace cdgw::data {

SelfEnergy::SelfEnergy(std::vector<std::size_t> orbital_indices,
                       Eigen::VectorXd reference_energies,
                       Eigen::VectorXd exchange, Eigen::VectorXd vxc,
                       Eigen::MatrixXd frequencies,
                       Eigen::MatrixXcd correlation)
    : orbital_indices_(std::move(orbital_indices)),
      reference_energies_(std::move(reference_energies)),
      exchange_(std::move(exchange)),
      vxc_(std::move(vxc)),
      frequencies_(std::move(frequencies)),
      correlation_(std::move(correlation)) {
  CDGW_LOG_TRACE_ENTERING();
  const auto n = static_cast<Eigen::Index>(orbital_indices_.size());
  if (reference_energies_.size() != n || exchange_.size() != n ||
      vxc_.size() != n) {
    throw InconsistentInputShapes(
        "self-energy per-orbital vectors must all have " + std::to_string(n) +
        " entries");
  }
  if (frequencies_.cols() != n || correlation_.cols() != n ||
      correlation_.rows() != frequencies_.rows()) {
    throw InconsistentInputShapes(
        "self-energy samples must be M x " + std::to_string(n) +
        " for both frequencies and correlation values");
  }
}

void SelfEnergy::_check_column(std::size_t i) const {
  if (i >= size()) {
    throw std::out_of_range("Self-energy column " + std::to_string(i) +
                            " out of range");
  }
}

std::size_t SelfEnergy::find_column(std::size_t orbital_index) const {
  auto it = std::find(orbital_indices_.begin(), orbital_indices_.end(),
                      orbital_index);
  if (it == orbital_indices_.end()) {
    throw std::out_of_range("Orbital " + std::to_string(orbital_index) +
                            " is not part of the computed self-energy");
  }
  return static_cast<std::size_t>(std::distance(orbital_indices_.begin(), it));
}

double SelfEnergy::get_static_part(std::size_t i) const {
  _check_column(i);
  const auto col = static_cast<Eigen::Index>(i);
  return exchange_(col) - vxc_(col);
}

Eigen::VectorXcd SelfEnergy::get_total(std::size_t i) const {
  const std::complex<double> static_part(get_static_part(i), 0.0);
  return correlation_.col(static_cast<Eigen::Index>(i)).array() + static_part;
}

std::complex<double> SelfEnergy::interpolate(std::size_t i,
                                             double omega) const {
  _check_column(i);
  const auto col = static_cast<Eigen::Index>(i);
  const Eigen::Index m = frequencies_.rows();
  if (m == 0) {
    throw std::out_of_range("Self-energy has no frequency samples");
  }

  const double lo = frequencies_(0, col);
  const double hi = frequencies_(m - 1, col);
  const double slack = 1e-12 * std::max(1.0, hi - lo);
  if (omega < lo - slack || omega > hi + slack || std::isnan(omega)) {
    throw std::out_of_range("Frequency " + std::to_string(omega) +
                            " outside the sampled range [" +
                            std::to_string(lo) + ", " + std::to_string(hi) +
                            "]");
  }

  const double static_part = exchange_(col) - vxc_(col);
  if (m == 1) {
    return correlation_(0, col) + static_part;
  }

  const double* begin = frequencies_.col(col).data();
  const double* end = begin + m;
  // Index of the left end of the bracketing interval, clamped to [0, m-2]
  Eigen::Index k = std::upper_bound(begin, end, omega) - begin - 1;
  k = std::clamp<Eigen::Index>(k, 0, m - 2);

  const double x0 = frequencies_(k, col);
  const double x1 = frequencies_(k + 1, col);
  const double t = (omega - x0) / (x1 - x0);
  return (1.0 - t) * correlation_(k, col) + t * correlation_(k + 1, col) +
         static_part;
}

std::string SelfEnergy::get_summary() const {
  CDGW_LOG_TRACE_ENTERING();
  std::ostringstream oss;
  oss << "SelfEnergy Summary:\n";
  oss << "  Orbitals: " << size() << ", frequencies per orbital: "
      << get_num_frequencies() << "\n";
  oss << std::fixed << std::setprecision(4);
  oss << "  " << std::setw(6) << "n" << std::setw(14) << "E0 (eV)"
      << std::setw(14) << "Sigma_X (eV)" << std::setw(14) << "Vxc (eV)"
      << "\n";
  for (std::size_t i = 0; i < size(); ++i) {
    const auto col = static_cast<Eigen::Index>(i);
    oss << "  " << std::setw(6) << orbital_indices_[i] << std::setw(14)
        << reference_energies_(col) * constants::hartree_to_ev << std::setw(14)
        << exchange_(col) * constants::hartree_to_ev << std::setw(14)
        << vxc_(col) * constants::hartree_to_ev << "\n";
  }
  return oss.str();
}

void SelfEnergy::to_file(const std::string& filename,
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

nlohmann::json SelfEnergy::to_json() const {
  CDGW_LOG_TRACE_ENTERING();
  nlohmann::json j;
  j["serialization_version"] = SERIALIZATION_VERSION;
  j["type"] = "SelfEnergy";
  j["orbital_indices"] = orbital_indices_;
  j["reference_energies"] = vector_to_json(reference_energies_);
  j["exchange"] = vector_to_json(exchange_);
  j["vxc"] = vector_to_json(vxc_);
  j["frequencies"] = matrix_to_json(frequencies_);
  j["correlation"] = {{"real", matrix_to_json(correlation_.real())},
                      {"imag", matrix_to_json(correlation_.imag())}};
  return j;
}

std::shared_ptr<SelfEnergy> SelfEnergy::from_json(const nlohmann::json& j) {
  CDGW_LOG_TRACE_ENTERING();
  validate_json_header(j, "SelfEnergy", SERIALIZATION_VERSION);

  const auto orbital_indices =
      j.at("orbital_indices").get<std::vector<std::size_t>>();
  Eigen::MatrixXd frequencies = json_to_matrix(j.at("frequencies"));
  const Eigen::MatrixXd real = json_to_matrix(j.at("correlation").at("real"));
  const Eigen::MatrixXd imag = json_to_matrix(j.at("correlation").at("imag"));
  if (real.rows() != imag.rows() || real.cols() != imag.cols()) {
    throw std::runtime_error(
        "Real and imaginary parts of the correlation self-energy differ in "
        "shape");
  }
  Eigen::MatrixXcd correlation(real.rows(), real.cols());
  correlation.real() = real;
  correlation.imag() = imag;

  return std::make_shared<SelfEnergy>(
      orbital_indices, json_to_vector(j.at("reference_energies")),
      json_to_vector(j.at("exchange")), json_to_vector(j.at("vxc")),
      std::move(frequencies), std::move(correlation));
}

void SelfEnergy::to_json_file(const std::string& filename) const {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_write_suffix(filename,
                                          DATACLASS_TO_SNAKE_CASE(SelfEnergy));
  write_json_file(filename, to_json());
}

std::shared_ptr<SelfEnergy> SelfEnergy::from_json_file(
    const std::string& filename) {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_read_suffix(filename, "self_energy");
  return from_json(read_json_file(filename, "SelfEnergy"));
}

void SelfEnergy::to_hdf5(H5::Group& group) const {
  CDGW_LOG_TRACE_ENTERING();
  write_hdf5_header(group, "SelfEnergy", SERIALIZATION_VERSION);
  save_vector_to_group(group, "orbital_indices", orbital_indices_);
  save_vector_to_group(group, "reference_energies", reference_energies_);
  save_vector_to_group(group, "exchange", exchange_);
  save_vector_to_group(group, "vxc", vxc_);
  save_matrix_to_group(group, "frequencies", frequencies_);
  save_complex_matrix_to_group(group, "correlation", correlation_);
}

std::shared_ptr<SelfEnergy> SelfEnergy::from_hdf5(H5::Group& group) {
  CDGW_LOG_TRACE_ENTERING();
  validate_hdf5_header(group, "SelfEnergy", SERIALIZATION_VERSION);
  return std::make_shared<SelfEnergy>(
      load_size_vector_from_group(group, "orbital_indices"),
      load_vector_from_group(group, "reference_energies"),
      load_vector_from_group(group, "exchange"),
      load_vector_from_group(group, "vxc"),
      load_matrix_from_group(group, "frequencies"),
      load_complex_matrix_from_group(group, "correlation"));
}

void SelfEnergy::to_hdf5_file(const std::string& filename) const {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_write_suffix(filename,
                                          DATACLASS_TO_SNAKE_CASE(SelfEnergy));
  write_hdf5_file(filename, "SelfEnergy",
                  [this](H5::H5File& file) { to_hdf5(file); });
}

std::shared_ptr<SelfEnergy> SelfEnergy::from_hdf5_file(
    const std::string& filename) {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_read_suffix(filename, "self_energy");
  return read_hdf5_file(filename, "SelfEnergy",
                        [](H5::H5File& file) { return from_hdf5(file); });
}

std::shared_ptr<SelfEnergy> SelfEnergy::from_file(const std::string& filename,
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
