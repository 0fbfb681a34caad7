// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace cdgw::data {

/**
 * @file json_serialization.hpp
 * @brief JSON helpers shared by the data classes
 */

/**
 * @brief Validate serialization version compatibility
 *
 * Major and minor versions have to match, patch differences are accepted.
 *
 * @param expected_version The version string this code writes
 * @param found_version The version string found in the serialized data
 * @throws std::runtime_error on a major or minor mismatch
 */
void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version);

/**
 * @brief Parse "major.minor.patch"
 * @throws std::runtime_error if the format is invalid
 */
std::tuple<int, int, int> parse_version_string(
    const std::string& version_string);

/**
 * @brief Check the "serialization_version" and "type" entries of a JSON
 * object written by a data class
 *
 * @throws std::runtime_error if the type differs or the version is
 * incompatible
 */
void validate_json_header(const nlohmann::json& j, const std::string& type,
                          const std::string& expected_version);

/// Row-major nested array
nlohmann::json matrix_to_json(const Eigen::MatrixXd& matrix);

nlohmann::json vector_to_json(const Eigen::VectorXd& vector);

/// Object {"real": [...], "imag": [...]}
nlohmann::json complex_vector_to_json(const Eigen::VectorXcd& vector);

Eigen::MatrixXd json_to_matrix(const nlohmann::json& j);

Eigen::VectorXd json_to_vector(const nlohmann::json& j);

Eigen::VectorXcd json_to_complex_vector(const nlohmann::json& j);

/**
 * @brief Write a JSON document to a file
 * @throws std::runtime_error if the file cannot be written
 */
void write_json_file(const std::string& filename, const nlohmann::json& j);

/**
 * @brief Read a JSON document from a file
 * @param class_name Name of the data class, used in error messages
 * @throws std::runtime_error if the file cannot be opened or parsed
 */
nlohmann::json read_json_file(const std::string& filename,
                              const std::string& class_name);

}  // namespace cdgw::data
