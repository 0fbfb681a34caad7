// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

namespace H5 {
class Group;
}

#include <concepts>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>

namespace cdgw::data {

/**
 * @brief Common interface of the CDGW data classes
 *
 * Inputs (orbitals, three-center integrals), intermediates (frequency grid,
 * self-energy) and results (quasiparticle spectrum) all share one
 * serialization surface so that any stage of a calculation can be written
 * out and reloaded. Files follow the `<name>.<data_type>.<json|h5>` naming
 * convention, where `data_type` is the value of get_data_type_name().
 */
class DataClass {
 public:
  virtual ~DataClass() = default;

  /**
   * @brief Data type name used in file names and serialized headers
   *
   * @return snake_case type name, e.g. "self_energy"
   */
  virtual std::string get_data_type_name() const = 0;

  /**
   * @brief Human-readable summary of the object
   */
  virtual std::string get_summary() const = 0;

  /**
   * @brief Save object to file in the specified format
   * @param filename Path to the output file
   * @param type Format type ("json" or "hdf5")
   * @throws std::invalid_argument if format type is not supported
   * @throws std::runtime_error if I/O error occurs
   */
  virtual void to_file(const std::string& filename,
                       const std::string& type) const = 0;

  /**
   * @brief Convert object to JSON representation
   */
  virtual nlohmann::json to_json() const = 0;

  /**
   * @brief Save object to JSON file
   * @throws std::runtime_error if I/O error occurs
   */
  virtual void to_json_file(const std::string& filename) const = 0;

  /**
   * @brief Save object into an open HDF5 group
   * @throws std::runtime_error if I/O error occurs
   */
  virtual void to_hdf5(H5::Group& group) const = 0;

  /**
   * @brief Save object to HDF5 file
   * @throws std::runtime_error if I/O error occurs
   */
  virtual void to_hdf5_file(const std::string& filename) const = 0;

 protected:
  DataClass() = default;
  DataClass(const DataClass& other) = default;
  DataClass& operator=(const DataClass& other) = default;
  DataClass(DataClass&& other) = default;
  DataClass& operator=(DataClass&& other) = default;
};

/**
 * @brief Concept to enforce inheritance of DataClass and presence of
 * static deserialization methods
 */
template <typename T>
concept DataClassCompliant = std::derived_from<T, DataClass> && requires {
  T::from_file(std::declval<std::string>(), std::declval<std::string>());
} && requires { T::from_json_file(std::declval<std::string>()); } && requires {
  T::from_json(std::declval<nlohmann::json>());
} && requires { T::from_hdf5_file(std::declval<std::string>()); } && requires {
  T::from_hdf5(std::declval<H5::Group&>());
};

}  // namespace cdgw::data
