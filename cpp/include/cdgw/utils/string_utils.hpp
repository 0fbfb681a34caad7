// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <vector>

namespace cdgw::utils {

/**
 * @brief Convert a PascalCase class name to snake_case
 *
 * An underscore is inserted before an uppercase letter that starts a new
 * word, so runs of capitals are kept together:
 * - "SelfEnergy" -> "self_energy"
 * - "ThreeCenterIntegrals" -> "three_center_integrals"
 * - "GWResult" -> "gw_result"
 *
 * @param input Input string in PascalCase or camelCase
 * @return std::string containing the snake_case version
 */
inline std::string to_snake_case(const char* input) {
  std::string source(input);
  std::string result;
  for (std::size_t i = 0; i < source.size(); ++i) {
    const char c = source[i];
    if (std::isupper(static_cast<unsigned char>(c))) {
      const bool after_lower =
          i > 0 && std::islower(static_cast<unsigned char>(source[i - 1]));
      const bool ends_acronym =
          i > 0 && std::isupper(static_cast<unsigned char>(source[i - 1])) &&
          i + 1 < source.size() &&
          std::islower(static_cast<unsigned char>(source[i + 1]));
      if (after_lower || ends_acronym) {
        result += '_';
      }
      result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    } else {
      result += c;
    }
  }
  return result;
}

/**
 * @brief Lowercase copy of a string
 */
inline std::string to_lower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

/**
 * @brief Join strings with a separator
 *
 * Used for the human-readable lists in error messages.
 */
inline std::string join(const std::vector<std::string>& parts,
                        const std::string& separator = ", ") {
  std::string result;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) result += separator;
    result += parts[i];
  }
  return result;
}

/**
 * @def DATACLASS_TO_SNAKE_CASE
 * @brief Snake_case data type name of a class, computed once per call site
 *
 * @code
 * std::string get_data_type_name() const override {
 *   return DATACLASS_TO_SNAKE_CASE(SelfEnergy);  // "self_energy"
 * }
 * @endcode
 */
#define DATACLASS_TO_SNAKE_CASE(ClassName)                                \
  ([]() -> const char* {                                                  \
    static const std::string result = cdgw::utils::to_snake_case(#ClassName); \
    return result.c_str();                                                \
  }())

}  // namespace cdgw::utils
