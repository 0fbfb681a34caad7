// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <H5Cpp.h>

#include <cdgw/utils/string_utils.hpp>
#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace cdgw::data {

/**
 * @brief Whether HDF5's own error stack printing should be silenced
 *
 * Set CDGW_PRINT_VERBOSE_HDF5_ERRORS to 1/true/yes/on to see it.
 */
inline bool hdf5_errors_should_be_suppressed() {
  const char* env_value = std::getenv("CDGW_PRINT_VERBOSE_HDF5_ERRORS");
  if (!env_value) {
    return true;
  }
  const std::string normalized = utils::to_lower(env_value);
  return !(normalized == "1" || normalized == "true" || normalized == "yes" ||
           normalized == "on");
}

/**
 * @brief Open an HDF5 file for reading and run a loader on it
 *
 * HDF5 exceptions are converted to std::runtime_error carrying the file name
 * and the class being read.
 *
 * @param filename File to open
 * @param class_name Name of the data class, used in error messages
 * @param loader Callable receiving the open file
 */
template <typename Loader>
auto read_hdf5_file(const std::string& filename, const std::string& class_name,
                    Loader&& loader) {
  if (hdf5_errors_should_be_suppressed()) {
    H5::Exception::dontPrint();
  }

  H5::H5File file;
  try {
    file.openFile(filename, H5F_ACC_RDONLY);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Unable to open " + class_name + " HDF5 file '" +
                             filename +
                             "'. Please check that the file exists, is a "
                             "valid HDF5 file, and you have read permissions.");
  }

  try {
    return std::invoke(std::forward<Loader>(loader), file);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Unable to read " + class_name +
                             " data from HDF5 file '" + filename +
                             "'. HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

/**
 * @brief Create (truncate) an HDF5 file and run a writer on it
 */
template <typename Writer>
void write_hdf5_file(const std::string& filename, const std::string& class_name,
                     Writer&& writer) {
  if (hdf5_errors_should_be_suppressed()) {
    H5::Exception::dontPrint();
  }
  try {
    H5::H5File file(filename, H5F_ACC_TRUNC);
    std::invoke(std::forward<Writer>(writer), file);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Unable to write " + class_name +
                             " HDF5 file '" + filename +
                             "'. HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

}  // namespace cdgw::data
