// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "json_serialization.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <tuple>

namespace cdgw::data {

nlohmann::json matrix_to_json(const Eigen::MatrixXd& matrix) {
  nlohmann::json j = nlohmann::json::array();
  for (Eigen::Index row = 0; row < matrix.rows(); ++row) {
    nlohmann::json row_array = nlohmann::json::array();
    for (Eigen::Index col = 0; col < matrix.cols(); ++col) {
      row_array.push_back(matrix(row, col));
    }
    j.push_back(row_array);
  }
  return j;
}

nlohmann::json vector_to_json(const Eigen::VectorXd& vector) {
  nlohmann::json j = nlohmann::json::array();
  for (Eigen::Index i = 0; i < vector.size(); ++i) {
    j.push_back(vector(i));
  }
  return j;
}

nlohmann::json complex_vector_to_json(const Eigen::VectorXcd& vector) {
  nlohmann::json j;
  j["real"] = vector_to_json(vector.real());
  j["imag"] = vector_to_json(vector.imag());
  return j;
}

Eigen::MatrixXd json_to_matrix(const nlohmann::json& j) {
  if (!j.is_array()) {
    throw std::invalid_argument("JSON must be an array for matrix conversion");
  }
  if (j.empty()) {
    return Eigen::MatrixXd(0, 0);
  }

  const Eigen::Index rows = static_cast<Eigen::Index>(j.size());
  const Eigen::Index cols = static_cast<Eigen::Index>(j[0].size());

  Eigen::MatrixXd matrix(rows, cols);
  for (Eigen::Index row = 0; row < rows; ++row) {
    const auto& json_row = j[static_cast<size_t>(row)];
    if (!json_row.is_array() ||
        static_cast<Eigen::Index>(json_row.size()) != cols) {
      throw std::invalid_argument(
          "All rows must have the same length for matrix conversion");
    }
    for (Eigen::Index col = 0; col < cols; ++col) {
      matrix(row, col) = json_row[static_cast<size_t>(col)].get<double>();
    }
  }
  return matrix;
}

Eigen::VectorXd json_to_vector(const nlohmann::json& j) {
  if (!j.is_array()) {
    throw std::invalid_argument("JSON must be an array for vector conversion");
  }

  Eigen::VectorXd vector(static_cast<Eigen::Index>(j.size()));
  for (size_t i = 0; i < j.size(); ++i) {
    vector(static_cast<Eigen::Index>(i)) = j[i].get<double>();
  }
  return vector;
}

Eigen::VectorXcd json_to_complex_vector(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("real") || !j.contains("imag")) {
    throw std::invalid_argument(
        "JSON must be an object with 'real' and 'imag' arrays for complex "
        "vector conversion");
  }
  const Eigen::VectorXd real = json_to_vector(j["real"]);
  const Eigen::VectorXd imag = json_to_vector(j["imag"]);
  if (real.size() != imag.size()) {
    throw std::invalid_argument(
        "Real and imaginary parts of a complex vector differ in length");
  }
  Eigen::VectorXcd vector(real.size());
  vector.real() = real;
  vector.imag() = imag;
  return vector;
}

std::tuple<int, int, int> parse_version_string(
    const std::string& version_string) {
  const std::size_t first_dot = version_string.find('.');
  const std::size_t second_dot = first_dot == std::string::npos
                                     ? std::string::npos
                                     : version_string.find('.', first_dot + 1);

  if (first_dot == std::string::npos || second_dot == std::string::npos) {
    throw std::runtime_error(
        "Invalid version string format. Expected 'major.minor.patch', got: " +
        version_string);
  }

  try {
    int major = std::stoi(version_string.substr(0, first_dot));
    int minor = std::stoi(
        version_string.substr(first_dot + 1, second_dot - first_dot - 1));
    int patch = std::stoi(version_string.substr(second_dot + 1));
    return std::make_tuple(major, minor, patch);
  } catch (const std::logic_error&) {
    throw std::runtime_error(
        "Invalid version string format. Expected 'major.minor.patch', got: " +
        version_string);
  }
}

void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version) {
  if (expected_version == found_version) {
    return;
  }

  auto [expected_major, expected_minor, expected_patch] =
      parse_version_string(expected_version);
  auto [found_major, found_minor, found_patch] =
      parse_version_string(found_version);

  if (expected_major != found_major || expected_minor != found_minor) {
    throw std::runtime_error("Serialization version mismatch. Expected: " +
                             expected_version + ", Found: " + found_version +
                             ". Only patch version differences are "
                             "compatible.");
  }
}

void validate_json_header(const nlohmann::json& j, const std::string& type,
                          const std::string& expected_version) {
  if (!j.is_object()) {
    throw std::runtime_error("JSON data for " + type + " must be an object");
  }
  if (j.contains("serialization_version")) {
    validate_serialization_version(
        expected_version, j["serialization_version"].get<std::string>());
  }
  if (j.contains("type") && j["type"].get<std::string>() != type) {
    throw std::runtime_error("Invalid type in JSON data: expected " + type +
                             ", found " + j["type"].get<std::string>());
  }
}

void write_json_file(const std::string& filename, const nlohmann::json& j) {
  std::ofstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file for writing: " + filename);
  }

  file << j.dump(2);
  file.close();

  if (file.fail()) {
    throw std::runtime_error("Failed to write to file: " + filename);
  }
}

nlohmann::json read_json_file(const std::string& filename,
                              const std::string& class_name) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error(
        "Unable to open " + class_name + " JSON file '" + filename +
        "'. Please check that the file exists and you have read permissions.");
  }

  try {
    nlohmann::json j;
    file >> j;
    return j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Unable to parse " + class_name + " JSON file '" +
                             filename + "': " + e.what());
  }
}

}  // namespace cdgw::data
