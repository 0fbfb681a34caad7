// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cdgw/data/errors.hpp>
#include <cdgw/data/frequency_grid.hpp>
#include <cdgw/utils/logger.hpp>
#include <cdgw/utils/quadrature.hpp>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "filename_utils.hpp"
#include "hdf5_error_handling.hpp"
#include "hdf5_serialization.hpp"
#include "json_serialization.hpp"

namespace cdgw::data {

FrequencyGrid::FrequencyGrid(int64_t quadrature_order, int64_t num_real_points,
                             double real_step)
    : real_step_(real_step) {
  CDGW_LOG_TRACE_ENTERING();
  if (quadrature_order < 1) {
    throw InvalidGridParameter("quadrature order must be at least 1, got " +
                               std::to_string(quadrature_order));
  }
  // Three points are the minimum for a centred finite difference
  if (num_real_points < 3) {
    throw InvalidGridParameter(
        "number of real frequency points must be at least 3, got " +
        std::to_string(num_real_points));
  }
  if (!(real_step > 0.0) || !std::isfinite(real_step)) {
    throw InvalidGridParameter("real frequency step must be positive, got " +
                               std::to_string(real_step));
  }

  const auto [nodes, weights] =
      utils::gauss_legendre(static_cast<std::size_t>(quadrature_order));
  imaginary_frequencies_ =
      transform_scale * (1.0 + nodes.array()) / (1.0 - nodes.array());
  imaginary_weights_ = weights.array() * 2.0 * transform_scale /
                       (1.0 - nodes.array()).square();

  const double center = 0.5 * static_cast<double>(num_real_points - 1);
  real_offsets_.resize(num_real_points);
  for (Eigen::Index k = 0; k < num_real_points; ++k) {
    real_offsets_(k) = (static_cast<double>(k) - center) * real_step_;
  }
}

Eigen::VectorXd FrequencyGrid::get_real_frequencies(double center) const {
  return real_offsets_.array() + center;
}

std::string FrequencyGrid::get_summary() const {
  CDGW_LOG_TRACE_ENTERING();
  std::ostringstream oss;
  oss << "FrequencyGrid Summary:\n";
  oss << "  Imaginary-axis quadrature order: " << get_quadrature_order()
      << "\n";
  oss << std::scientific << std::setprecision(3);
  oss << "  Imaginary-axis range: [" << imaginary_frequencies_.minCoeff()
      << ", " << imaginary_frequencies_.maxCoeff() << "] Ha\n";
  oss << "  Real-axis points: " << get_num_real_points() << "\n";
  oss << "  Real-axis step: " << real_step_ << " Ha\n";
  return oss.str();
}

void FrequencyGrid::to_file(const std::string& filename,
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

nlohmann::json FrequencyGrid::to_json() const {
  CDGW_LOG_TRACE_ENTERING();
  // The grid is fully determined by its three parameters
  nlohmann::json j;
  j["serialization_version"] = SERIALIZATION_VERSION;
  j["type"] = "FrequencyGrid";
  j["quadrature_order"] = get_quadrature_order();
  j["num_real_points"] = get_num_real_points();
  j["real_step"] = real_step_;
  return j;
}

std::shared_ptr<FrequencyGrid> FrequencyGrid::from_json(
    const nlohmann::json& j) {
  CDGW_LOG_TRACE_ENTERING();
  validate_json_header(j, "FrequencyGrid", SERIALIZATION_VERSION);
  return std::make_shared<FrequencyGrid>(j.at("quadrature_order").get<int64_t>(),
                                         j.at("num_real_points").get<int64_t>(),
                                         j.at("real_step").get<double>());
}

void FrequencyGrid::to_json_file(const std::string& filename) const {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_write_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(FrequencyGrid));
  write_json_file(filename, to_json());
}

std::shared_ptr<FrequencyGrid> FrequencyGrid::from_json_file(
    const std::string& filename) {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_read_suffix(filename, "frequency_grid");
  return from_json(read_json_file(filename, "FrequencyGrid"));
}

void FrequencyGrid::to_hdf5(H5::Group& group) const {
  CDGW_LOG_TRACE_ENTERING();
  write_hdf5_header(group, "FrequencyGrid", SERIALIZATION_VERSION);
  write_int_attribute(group, "quadrature_order",
                      static_cast<int64_t>(get_quadrature_order()));
  write_int_attribute(group, "num_real_points",
                      static_cast<int64_t>(get_num_real_points()));
  write_double_attribute(group, "real_step", real_step_);
  // Stored for external consumers, rebuilt on load
  save_vector_to_group(group, "imaginary_frequencies", imaginary_frequencies_);
  save_vector_to_group(group, "imaginary_weights", imaginary_weights_);
}

std::shared_ptr<FrequencyGrid> FrequencyGrid::from_hdf5(H5::Group& group) {
  CDGW_LOG_TRACE_ENTERING();
  validate_hdf5_header(group, "FrequencyGrid", SERIALIZATION_VERSION);
  return std::make_shared<FrequencyGrid>(
      read_int_attribute(group, "quadrature_order"),
      read_int_attribute(group, "num_real_points"),
      read_double_attribute(group, "real_step"));
}

void FrequencyGrid::to_hdf5_file(const std::string& filename) const {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_write_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(FrequencyGrid));
  write_hdf5_file(filename, "FrequencyGrid",
                  [this](H5::H5File& file) { to_hdf5(file); });
}

std::shared_ptr<FrequencyGrid> FrequencyGrid::from_hdf5_file(
    const std::string& filename) {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_read_suffix(filename, "frequency_grid");
  return read_hdf5_file(filename, "FrequencyGrid",
                        [](H5::H5File& file) { return from_hdf5(file); });
}

std::shared_ptr<FrequencyGrid> FrequencyGrid::from_file(
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
