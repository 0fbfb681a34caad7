// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>

#include <Eigen/Dense>
#include <cdgw/data/data_class.hpp>
#include <cdgw/utils/string_utils.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace cdgw::data {

/**
 * @class FrequencyGrid
 * @brief Imaginary-axis quadrature and real-axis sampling offsets
 *
 * The imaginary-axis part is a Gauss-Legendre rule mapped from [-1, 1] onto
 * [0, inf) by
 *
 *   omega_k = x0 (1 + x_k) / (1 - x_k),  w_k' = w_k 2 x0 / (1 - x_k)^2
 *
 * with x0 = 0.5 Ha. It integrates the screened interaction along the
 * imaginary axis.
 *
 * The real-axis part is a symmetric set of offsets
 * (k - (M - 1) / 2) * step, k = 0..M-1. The self-energy of orbital n is
 * sampled at eps_n plus these offsets.
 */
class FrequencyGrid : public DataClass,
                      public std::enable_shared_from_this<FrequencyGrid> {
 public:
  /// Scale of the compactifying transform (Ha)
  static constexpr double transform_scale = 0.5;

  /**
   * @brief Build both grids
   *
   * @param quadrature_order Number of imaginary-axis points N, at least 1
   * @param num_real_points Number of real-axis samples M, at least 3
   * @param real_step Real-axis sampling step in Hartree, positive
   * @throws InvalidGridParameter for any out-of-range argument
   */
  FrequencyGrid(int64_t quadrature_order, int64_t num_real_points,
                double real_step);

  FrequencyGrid(const FrequencyGrid&) = default;
  FrequencyGrid(FrequencyGrid&&) noexcept = default;
  FrequencyGrid& operator=(const FrequencyGrid&) = default;
  FrequencyGrid& operator=(FrequencyGrid&&) noexcept = default;
  virtual ~FrequencyGrid() = default;

  std::size_t get_quadrature_order() const {
    return static_cast<std::size_t>(imaginary_frequencies_.size());
  }

  /// Imaginary-axis abscissas, strictly increasing and positive
  const Eigen::VectorXd& get_imaginary_frequencies() const {
    return imaginary_frequencies_;
  }

  /// Imaginary-axis weights, strictly positive
  const Eigen::VectorXd& get_imaginary_weights() const {
    return imaginary_weights_;
  }

  std::size_t get_num_real_points() const {
    return static_cast<std::size_t>(real_offsets_.size());
  }

  double get_real_step() const { return real_step_; }

  const Eigen::VectorXd& get_real_offsets() const { return real_offsets_; }

  /**
   * @brief Real sampling frequencies around a centre energy
   */
  Eigen::VectorXd get_real_frequencies(double center) const;

  std::string get_data_type_name() const override {
    return DATACLASS_TO_SNAKE_CASE(FrequencyGrid);
  }

  std::string get_summary() const override;

  void to_file(const std::string& filename,
               const std::string& type) const override;

  nlohmann::json to_json() const override;

  void to_json_file(const std::string& filename) const override;

  void to_hdf5(H5::Group& group) const override;

  void to_hdf5_file(const std::string& filename) const override;

  static std::shared_ptr<FrequencyGrid> from_file(const std::string& filename,
                                                  const std::string& type);

  static std::shared_ptr<FrequencyGrid> from_json(const nlohmann::json& j);

  static std::shared_ptr<FrequencyGrid> from_json_file(
      const std::string& filename);

  static std::shared_ptr<FrequencyGrid> from_hdf5(H5::Group& group);

  static std::shared_ptr<FrequencyGrid> from_hdf5_file(
      const std::string& filename);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  Eigen::VectorXd imaginary_frequencies_;
  Eigen::VectorXd imaginary_weights_;
  Eigen::VectorXd real_offsets_;
  double real_step_;
};

static_assert(DataClassCompliant<FrequencyGrid>,
              "FrequencyGrid must derive from DataClass and implement all "
              "required deserialization methods");

}  // namespace cdgw::data
