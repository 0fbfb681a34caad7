// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <stdexcept>
#include <string>

namespace cdgw::data {

/**
 * @brief Checks the `<name>.<data_type>.<extension>` file naming convention
 */
class DataTypeFilename {
 public:
  /**
   * @brief Validate filename has the correct data type suffix for writing
   * @param filename Filename to validate (e.g., "h2o.self_energy.h5")
   * @param data_type Expected data type (e.g., "self_energy")
   * @return The original filename if valid
   * @throws std::invalid_argument if the data type suffix is missing or wrong
   */
  static std::string validate_write_suffix(const std::string &filename,
                                           const std::string &data_type) {
    return validate(filename, data_type);
  }

  /**
   * @brief Validate filename has the correct data type suffix for reading
   * @param filename Filename to validate (e.g., "h2o.orbitals.json")
   * @param data_type Expected data type (e.g., "orbitals")
   * @return The original filename if valid
   * @throws std::invalid_argument if the data type suffix is missing or wrong
   */
  static std::string validate_read_suffix(const std::string &filename,
                                          const std::string &data_type) {
    return validate(filename, data_type);
  }

 private:
  static std::string validate(const std::string &filename,
                              const std::string &data_type) {
    const std::string marker = "." + data_type;
    const size_t last_dot = filename.find_last_of('.');
    if (last_dot == std::string::npos) {
      throw std::invalid_argument("Invalid filename: Filename '" + filename +
                                  "' must have '" + marker + "' suffix");
    }

    // "name.data_type" without a file extension
    if (filename.size() >= marker.size() &&
        filename.compare(filename.size() - marker.size(), marker.size(),
                         marker) == 0) {
      return filename;
    }

    const std::string base = filename.substr(0, last_dot);
    const size_t second_last_dot = base.find_last_of('.');
    if (second_last_dot == std::string::npos) {
      throw std::invalid_argument("Invalid filename: Filename '" + filename +
                                  "' must have '" + marker +
                                  ".' before the file extension");
    }

    const std::string file_data_type = base.substr(second_last_dot + 1);
    if (file_data_type != data_type) {
      throw std::invalid_argument("Invalid filename: Filename '" + filename +
                                  "' has wrong data type '" + file_data_type +
                                  "', expected '" + data_type + "'");
    }
    return filename;
  }
};

}  // namespace cdgw::data
