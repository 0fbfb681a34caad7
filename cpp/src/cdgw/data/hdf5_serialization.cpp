// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "hdf5_serialization.hpp"

#include <stdexcept>

#include "json_serialization.hpp"

namespace cdgw::data {

void write_hdf5_header(H5::Group& group, const std::string& type,
                       const std::string& version) {
  write_string_attribute(group, "serialization_version", version);
  write_string_attribute(group, "type", type);
}

void validate_hdf5_header(H5::Group& group, const std::string& type,
                          const std::string& expected_version) {
  if (group.attrExists("serialization_version")) {
    validate_serialization_version(
        expected_version, read_string_attribute(group, "serialization_version"));
  }
  if (group.attrExists("type")) {
    const std::string found = read_string_attribute(group, "type");
    if (found != type) {
      throw std::runtime_error("Invalid type in HDF5 data: expected " + type +
                               ", found " + found);
    }
  }
}

void write_string_attribute(H5::H5Object& object, const std::string& name,
                            const std::string& value) {
  H5::DataSpace attr_space(H5S_SCALAR);
  H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
  H5::Attribute attr = object.createAttribute(name, str_type, attr_space);
  attr.write(str_type, value);
}

std::string read_string_attribute(H5::H5Object& object,
                                  const std::string& name) {
  H5::Attribute attr = object.openAttribute(name);
  H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
  std::string value;
  attr.read(str_type, value);
  return value;
}

void write_double_attribute(H5::H5Object& object, const std::string& name,
                            double value) {
  H5::DataSpace attr_space(H5S_SCALAR);
  H5::Attribute attr =
      object.createAttribute(name, H5::PredType::NATIVE_DOUBLE, attr_space);
  attr.write(H5::PredType::NATIVE_DOUBLE, &value);
}

double read_double_attribute(H5::H5Object& object, const std::string& name) {
  H5::Attribute attr = object.openAttribute(name);
  double value = 0.0;
  attr.read(H5::PredType::NATIVE_DOUBLE, &value);
  return value;
}

void write_int_attribute(H5::H5Object& object, const std::string& name,
                         int64_t value) {
  H5::DataSpace attr_space(H5S_SCALAR);
  H5::Attribute attr =
      object.createAttribute(name, H5::PredType::NATIVE_INT64, attr_space);
  attr.write(H5::PredType::NATIVE_INT64, &value);
}

int64_t read_int_attribute(H5::H5Object& object, const std::string& name) {
  H5::Attribute attr = object.openAttribute(name);
  int64_t value = 0;
  attr.read(H5::PredType::NATIVE_INT64, &value);
  return value;
}

void save_matrix_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::MatrixXd& matrix) {
  hsize_t dims[2] = {static_cast<hsize_t>(matrix.rows()),
                     static_cast<hsize_t>(matrix.cols())};
  H5::DataSpace dataspace(2, dims);
  H5::DataSet dataset =
      group.createDataSet(dataset_name, H5::PredType::NATIVE_DOUBLE, dataspace);
  if (matrix.size() > 0) {
    dataset.write(matrix.data(), H5::PredType::NATIVE_DOUBLE);
  }
}

void save_vector_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::VectorXd& vector) {
  hsize_t dims[1] = {static_cast<hsize_t>(vector.size())};
  H5::DataSpace dataspace(1, dims);
  H5::DataSet dataset =
      group.createDataSet(dataset_name, H5::PredType::NATIVE_DOUBLE, dataspace);
  if (vector.size() > 0) {
    dataset.write(vector.data(), H5::PredType::NATIVE_DOUBLE);
  }
}

void save_vector_to_group(H5::Group& group, const std::string& dataset_name,
                          const std::vector<size_t>& vector) {
  std::vector<uint64_t> widened(vector.begin(), vector.end());
  save_stl_to_group(group, dataset_name, widened);
}

void save_complex_matrix_to_group(H5::Group& group,
                                  const std::string& dataset_name,
                                  const Eigen::MatrixXcd& matrix) {
  H5::Group complex_group = group.createGroup(dataset_name);
  save_matrix_to_group(complex_group, "real", matrix.real());
  save_matrix_to_group(complex_group, "imag", matrix.imag());
}

Eigen::MatrixXd load_matrix_from_group(H5::Group& group,
                                       const std::string& dataset_name) {
  H5::DataSet dataset = group.openDataSet(dataset_name);
  H5::DataSpace dataspace = dataset.getSpace();
  hsize_t dims[2];
  dataspace.getSimpleExtentDims(dims);
  Eigen::MatrixXd matrix(dims[0], dims[1]);
  if (matrix.size() > 0) {
    dataset.read(matrix.data(), H5::PredType::NATIVE_DOUBLE);
  }
  return matrix;
}

Eigen::VectorXd load_vector_from_group(H5::Group& group,
                                       const std::string& dataset_name) {
  H5::DataSet dataset = group.openDataSet(dataset_name);
  H5::DataSpace dataspace = dataset.getSpace();
  hsize_t dims[1];
  dataspace.getSimpleExtentDims(dims);
  Eigen::VectorXd vector(dims[0]);
  if (vector.size() > 0) {
    dataset.read(vector.data(), H5::PredType::NATIVE_DOUBLE);
  }
  return vector;
}

std::vector<size_t> load_size_vector_from_group(
    H5::Group& group, const std::string& dataset_name) {
  const auto widened = load_std_vector_from_group<uint64_t>(group, dataset_name);
  return std::vector<size_t>(widened.begin(), widened.end());
}

Eigen::MatrixXcd load_complex_matrix_from_group(
    H5::Group& group, const std::string& dataset_name) {
  H5::Group complex_group = group.openGroup(dataset_name);
  const Eigen::MatrixXd real = load_matrix_from_group(complex_group, "real");
  const Eigen::MatrixXd imag = load_matrix_from_group(complex_group, "imag");
  if (real.rows() != imag.rows() || real.cols() != imag.cols()) {
    throw std::runtime_error("Real and imaginary parts of '" + dataset_name +
                             "' differ in shape");
  }
  Eigen::MatrixXcd matrix(real.rows(), real.cols());
  matrix.real() = real;
  matrix.imag() = imag;
  return matrix;
}

bool dataset_exists_in_group(H5::Group& group,
                             const std::string& dataset_name) {
  return group.nameExists(dataset_name);
}

}  // namespace cdgw::data
