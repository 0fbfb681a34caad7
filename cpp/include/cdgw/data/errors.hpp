// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cdgw::data {

/**
 * @brief A frequency grid was requested with a non-positive size, order or
 * step
 *
 * Raised while the grids are built, before any numerical work.
 */
class InvalidGridParameter : public std::invalid_argument {
 public:
  explicit InvalidGridParameter(const std::string& message)
      : std::invalid_argument("Invalid grid parameter: " + message) {}
};

/**
 * @brief Orbital, auxiliary or matrix dimensions of the inputs disagree
 *
 * Raised during input validation, before any numerical work. A calculation
 * that hits this error produces no partial results.
 */
class InconsistentInputShapes : public std::invalid_argument {
 public:
  explicit InconsistentInputShapes(const std::string& message)
      : std::invalid_argument("Inconsistent input shapes: " + message) {}
};

/**
 * @brief The projected peak memory of a GW run exceeds the memory budget
 *
 * In automatic mode a dense representation that does not fit falls back to
 * the on-demand one, and the error is surfaced only when that does not fit
 * either.
 */
class MemoryBudgetExceeded : public std::runtime_error {
 public:
  MemoryBudgetExceeded(std::size_t required_bytes, std::size_t budget_bytes)
      : std::runtime_error(make_message(required_bytes, budget_bytes)),
        required_bytes_(required_bytes),
        budget_bytes_(budget_bytes) {}

  /// Projected peak memory of the rejected representation
  std::size_t required_bytes() const noexcept { return required_bytes_; }

  /// Configured budget
  std::size_t budget_bytes() const noexcept { return budget_bytes_; }

 private:
  static std::string make_message(std::size_t required_bytes,
                                  std::size_t budget_bytes) {
    constexpr double mib = 1024.0 * 1024.0;
    std::ostringstream oss;
    oss << "Screened interaction needs "
        << static_cast<double>(required_bytes) / mib
        << " MB but the memory budget is "
        << static_cast<double>(budget_bytes) / mib << " MB";
    return oss.str();
  }

  std::size_t required_bytes_;
  std::size_t budget_bytes_;
};

}  // namespace cdgw::data
