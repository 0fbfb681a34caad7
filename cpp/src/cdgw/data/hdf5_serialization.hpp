// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>

#include <Eigen/Dense>
#include <cstdint>
#include <string>
#include <vector>

namespace cdgw::data {

/**
 * @file hdf5_serialization.hpp
 * @brief HDF5 helpers shared by the data classes
 *
 * Matrices are written with their Eigen (column-major) storage and read back
 * with the same convention, so a round trip restores the original layout.
 */

template <typename T>
struct h5_pred_type;

#define DECLARE_H5_PRED_TYPE(type, pred_type) \
  template <>                                 \
  struct h5_pred_type<type> {                 \
    static auto value() { return pred_type; } \
  };

DECLARE_H5_PRED_TYPE(int, H5::PredType::NATIVE_INT)
DECLARE_H5_PRED_TYPE(int64_t, H5::PredType::NATIVE_INT64)
DECLARE_H5_PRED_TYPE(uint64_t, H5::PredType::NATIVE_UINT64)
DECLARE_H5_PRED_TYPE(double, H5::PredType::NATIVE_DOUBLE)

#undef DECLARE_H5_PRED_TYPE

// Header attributes written by every data class
void write_hdf5_header(H5::Group& group, const std::string& type,
                       const std::string& version);
void validate_hdf5_header(H5::Group& group, const std::string& type,
                          const std::string& expected_version);

// Scalar attributes
void write_string_attribute(H5::H5Object& object, const std::string& name,
                            const std::string& value);
std::string read_string_attribute(H5::H5Object& object,
                                  const std::string& name);
void write_double_attribute(H5::H5Object& object, const std::string& name,
                            double value);
double read_double_attribute(H5::H5Object& object, const std::string& name);
void write_int_attribute(H5::H5Object& object, const std::string& name,
                         int64_t value);
int64_t read_int_attribute(H5::H5Object& object, const std::string& name);

// Eigen matrix/vector operations with groups
void save_matrix_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::MatrixXd& matrix);
void save_vector_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::VectorXd& vector);
void save_vector_to_group(H5::Group& group, const std::string& dataset_name,
                          const std::vector<size_t>& vector);
void save_complex_matrix_to_group(H5::Group& group,
                                  const std::string& dataset_name,
                                  const Eigen::MatrixXcd& matrix);
Eigen::MatrixXd load_matrix_from_group(H5::Group& group,
                                       const std::string& dataset_name);
Eigen::VectorXd load_vector_from_group(H5::Group& group,
                                       const std::string& dataset_name);
std::vector<size_t> load_size_vector_from_group(
    H5::Group& group, const std::string& dataset_name);
Eigen::MatrixXcd load_complex_matrix_from_group(
    H5::Group& group, const std::string& dataset_name);

// STL container operations with groups
template <typename T>
void save_stl_to_group(H5::Group& group, const std::string& dataset_name,
                       const std::vector<T>& data);
template <typename T>
std::vector<T> load_std_vector_from_group(H5::Group& group,
                                          const std::string& dataset_name);

bool dataset_exists_in_group(H5::Group& group, const std::string& dataset_name);

template <typename T>
void save_stl_to_group(H5::Group& group, const std::string& dataset_name,
                       const std::vector<T>& data) {
  auto data_type = h5_pred_type<T>::value();
  hsize_t dims[1] = {data.size()};
  H5::DataSpace dataspace(1, dims);
  H5::DataSet dataset = group.createDataSet(dataset_name, data_type, dataspace);
  if (!data.empty()) {
    dataset.write(data.data(), data_type);
  }
}

template <typename T>
std::vector<T> load_std_vector_from_group(H5::Group& group,
                                          const std::string& dataset_name) {
  H5::DataSet dataset = group.openDataSet(dataset_name);
  H5::DataSpace dataspace = dataset.getSpace();
  hsize_t dims[1];
  dataspace.getSimpleExtentDims(dims, NULL);
  std::vector<T> data(dims[0]);
  if (dims[0] > 0) {
    dataset.read(data.data(), h5_pred_type<T>::value());
  }
  return data;
}

}  // namespace cdgw::data
