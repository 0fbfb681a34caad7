// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <H5Cpp.h>

#include <cdgw/data/data_class.hpp>
#include <concepts>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace cdgw::data {

/**
 * @brief Type-safe variant for storing setting values
 *
 * Integral values of any width are stored as int64_t and converted back on
 * retrieval with a range check.
 */
using SettingValue = std::variant<bool, int64_t, double, std::string,
                                  std::vector<int64_t>, std::vector<double>>;

/**
 * @brief Inclusive range a numeric setting has to lie in
 */
template <typename T>
struct BoundConstraint {
  T min = std::numeric_limits<T>::lowest();  ///< Minimum allowed value
  T max = std::numeric_limits<T>::max();     ///< Maximum allowed value
};

/**
 * @brief Explicit list of values a setting may take
 */
template <typename T>
struct ListConstraint {
  std::vector<T> allowed_values;  ///< Allowed values
};

/**
 * @brief Any constraint that can be attached to a setting
 */
using Constraint =
    std::variant<BoundConstraint<int64_t>, ListConstraint<int64_t>,
                 BoundConstraint<double>, ListConstraint<std::string>>;

template <typename T>
concept NonBoolIntegral = std::integral<T> && !std::same_as<T, bool>;

template <typename T, typename Variant>
struct is_variant_member_impl;

template <typename T, typename... Ts>
struct is_variant_member_impl<T, std::variant<Ts...>>
    : std::disjunction<std::is_same<T, Ts>...> {};

template <typename T, typename Variant>
concept VariantMember = is_variant_member_impl<T, Variant>::value;

/**
 * @brief Types accepted by Settings::set / Settings::get
 */
template <typename T>
concept SupportedSettingType =
    VariantMember<T, SettingValue> || NonBoolIntegral<T>;

/**
 * @brief Thrown when a locked Settings object is modified
 */
class SettingsAreLocked : public std::runtime_error {
 public:
  explicit SettingsAreLocked()
      : std::runtime_error("Settings are locked: please modify a copy.") {}
};

/**
 * @brief Thrown when a key is not present in a Settings object
 */
class SettingNotFound : public std::runtime_error {
 public:
  explicit SettingNotFound(const std::string& key)
      : std::runtime_error("Setting not found: " + key) {}
};

/**
 * @brief Thrown when a setting is read or written with the wrong type
 */
class SettingTypeMismatch : public std::runtime_error {
 public:
  explicit SettingTypeMismatch(const std::string& key,
                               const std::string& expected_type)
      : std::runtime_error("Type mismatch for setting '" + key +
                           "'. Expected: " + expected_type) {}
};

/**
 * @class Settings
 * @brief Typed key/value configuration of an algorithm
 *
 * Algorithms derive their own settings class from Settings and declare every
 * recognized key in its constructor with set_default(), together with a
 * description and an optional constraint. Users can afterwards only change
 * existing keys, and only with a value of the declared type that satisfies
 * the constraint:
 *
 * @code
 * auto gw = cdgw::algorithms::GWCalculatorFactory::create();
 * gw->settings().set("quadrature_order", 120);
 * gw->settings().set("low_memory_mode", true);
 * @endcode
 *
 * Settings are locked when the owning algorithm runs; a locked object throws
 * SettingsAreLocked on any modification.
 */
class Settings : public DataClass,
                 public std::enable_shared_from_this<Settings> {
 public:
  Settings() = default;
  virtual ~Settings() = default;
  Settings(const Settings& other) = default;
  Settings(Settings&& other) noexcept = default;
  Settings& operator=(const Settings& other) = delete;
  Settings& operator=(Settings&& other) noexcept = default;

  std::string get_data_type_name() const override { return "settings"; }

  std::string get_summary() const override;

  /**
   * @brief Set an existing setting from a variant value
   *
   * @throws SettingsAreLocked if the settings are locked
   * @throws SettingNotFound if the key has no default
   * @throws SettingTypeMismatch if the value type differs from the default
   * @throws std::invalid_argument if the value violates the constraint
   */
  void set(const std::string& key, const SettingValue& value);

  /**
   * @brief Set an existing setting from a plain C++ value
   *
   * Integral types of any width are accepted for int64_t settings as long as
   * the value is representable.
   */
  template <typename T>
    requires SupportedSettingType<T>
  void set(const std::string& key, const T& value) {
    if constexpr (VariantMember<T, SettingValue>) {
      set(key, SettingValue(value));
    } else {
      set(key, SettingValue(_to_int64(key, value)));
    }
  }

  void set(const std::string& key, const char* value);

  /**
   * @brief Get a setting as a variant
   * @throws SettingNotFound if the key does not exist
   */
  SettingValue get(const std::string& key) const;

  /**
   * @brief Get a setting as a specific type
   *
   * @throws SettingNotFound if the key does not exist
   * @throws SettingTypeMismatch if the stored type does not convert to T
   */
  template <typename T>
    requires SupportedSettingType<T>
  T get(const std::string& key) const {
    const SettingValue& value = _find(key);
    if constexpr (VariantMember<T, SettingValue>) {
      if (const auto* typed = std::get_if<T>(&value)) {
        return *typed;
      }
      throw SettingTypeMismatch(key, _type_name(SettingValue(T{})));
    } else {
      const auto* stored = std::get_if<int64_t>(&value);
      if (stored == nullptr) {
        throw SettingTypeMismatch(key, "int");
      }
      if (!_fits<T>(*stored)) {
        throw SettingTypeMismatch(key, "integer in representable range");
      }
      return static_cast<T>(*stored);
    }
  }

  /**
   * @brief Get a setting, or a fallback when the key is absent or has a
   * different type
   */
  template <typename T>
    requires SupportedSettingType<T>
  T get_or_default(const std::string& key, const T& default_value) const {
    if (!has(key)) {
      return default_value;
    }
    try {
      return get<T>(key);
    } catch (const SettingTypeMismatch&) {
      return default_value;
    }
  }

  bool has(const std::string& key) const;

  std::vector<std::string> keys() const;

  size_t size() const;

  bool empty() const;

  /**
   * @brief String rendering of a value, as used by get_summary()
   */
  std::string get_as_string(const std::string& key) const;

  /**
   * @brief Name of the stored type ("bool", "int", "double", ...)
   */
  std::string get_type_name(const std::string& key) const;

  bool has_description(const std::string& key) const;

  std::string get_description(const std::string& key) const;

  bool has_limits(const std::string& key) const;

  Constraint get_limits(const std::string& key) const;

  /**
   * @brief Update an existing setting, validating it exists first
   */
  template <typename T>
  void update(const std::string& key, const T& value) {
    if (!has(key)) {
      throw SettingNotFound(key);
    }
    set(key, value);
  }

  /**
   * @brief Update several settings from their string representation
   *
   * Strings are parsed according to the type of the existing value, e.g.
   * "true"/"false" for bool and "1e-3" for double. This is how command line
   * options are forwarded to an algorithm.
   *
   * @throws std::invalid_argument if a string cannot be parsed
   */
  void update(const std::map<std::string, std::string>& updates_map);

  /**
   * @brief Copy every key of @p other that also exists here
   */
  void update(const Settings& other_settings);

  /**
   * @brief Lock the settings against further modification
   */
  void lock() const;

  bool is_locked() const { return _locked; }

  /**
   * @brief Render the settings as a fixed-width table
   *
   * @param max_width Total table width in characters
   */
  std::string as_table(size_t max_width = 100) const;

  // === DataClass interface ===

  nlohmann::json to_json() const override;

  static std::shared_ptr<Settings> from_json(const nlohmann::json& json_obj);

  void to_json_file(const std::string& filename) const override;

  static std::shared_ptr<Settings> from_json_file(const std::string& filename);

  void to_hdf5(H5::Group& group) const override;

  void to_hdf5_file(const std::string& filename) const override;

  static std::shared_ptr<Settings> from_hdf5_file(const std::string& filename);

  static std::shared_ptr<Settings> from_hdf5(H5::Group& group);

  void to_file(const std::string& filename,
               const std::string& type) const override;

  static std::shared_ptr<Settings> from_file(const std::string& filename,
                                             const std::string& type);

 protected:
  /**
   * @brief Declare a setting with its default value
   *
   * Only derived classes declare keys. Declaring an existing key is a no-op,
   * so a derived class constructor runs after its base without clobbering.
   *
   * @param key Setting name
   * @param value Default value, also fixes the type of the setting
   * @param description Text shown by as_table()
   * @param limit Constraint checked on every later set()
   */
  void set_default(const std::string& key, const SettingValue& value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt);

  template <typename T>
    requires SupportedSettingType<T>
  void set_default(const std::string& key, const T& value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt) {
    if constexpr (VariantMember<T, SettingValue>) {
      set_default(key, SettingValue(value), std::move(description),
                  std::move(limit));
    } else {
      set_default(key, SettingValue(_to_int64(key, value)),
                  std::move(description), std::move(limit));
    }
  }

  void set_default(const std::string& key, const char* value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt);

 private:
  /// Serialization version
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  template <typename T>
  static bool _fits(int64_t value) {
    if constexpr (std::is_signed_v<T>) {
      return value >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
             value <= static_cast<int64_t>(std::numeric_limits<T>::max());
    } else {
      return value >= 0 &&
             static_cast<uint64_t>(value) <= std::numeric_limits<T>::max();
    }
  }

  template <typename Integer>
  static int64_t _to_int64(const std::string& key, Integer value) {
    if constexpr (std::is_unsigned_v<Integer>) {
      if (static_cast<uint64_t>(value) >
          static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw std::out_of_range("Value for setting '" + key +
                                "' cannot be represented as int64_t.");
      }
    }
    return static_cast<int64_t>(value);
  }

  const SettingValue& _find(const std::string& key) const;

  void _validate_limits(const std::string& key,
                        const SettingValue& value) const;

  static std::string _type_name(const SettingValue& value);

  static std::string _to_string(const SettingValue& value);

  static std::string _limits_to_string(const Constraint& limit);

  static nlohmann::json _value_to_json(const SettingValue& value);

  static SettingValue _value_from_json(const nlohmann::json& j);

  SettingValue _parse_string(const std::string& key,
                             const std::string& text) const;

  static void _value_to_hdf5(H5::Group& group, const std::string& name,
                             const SettingValue& value);

  static SettingValue _value_from_hdf5(H5::Group& group,
                                       const std::string& name);

  void _to_json_file(const std::string& filename) const;

  static std::shared_ptr<Settings> _from_json_file(const std::string& filename);

  void _to_hdf5_file(const std::string& filename) const;

  static std::shared_ptr<Settings> _from_hdf5_file(const std::string& filename);

  /// Storage for all settings
  std::map<std::string, SettingValue> settings_;
  std::map<std::string, std::string> descriptions_;
  std::map<std::string, Constraint> limits_;

  /// Flag to indicate if settings are locked
  mutable bool _locked = false;
};

// Enforce inheritance from base class and presence of required methods.
static_assert(DataClassCompliant<Settings>,
              "Settings must derive from DataClass and implement all required "
              "deserialization methods");

}  // namespace cdgw::data
