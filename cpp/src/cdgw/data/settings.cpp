// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <cdgw/data/settings.hpp>
#include <cdgw/utils/logger.hpp>
#include <cdgw/utils/string_utils.hpp>
#include <iomanip>
#include <sstream>

#include "filename_utils.hpp"
#include "hdf5_error_handling.hpp"
#include "hdf5_serialization.hpp"
#include "json_serialization.hpp"

namespace cdgw::data {

namespace {
constexpr const char* descriptions_key = "_descriptions";
constexpr const char* version_key = "version";
}  // namespace

void Settings::set(const std::string& key, const SettingValue& value) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  auto it = settings_.find(key);
  if (it == settings_.end()) {
    throw SettingNotFound(key);
  }
  if (value.index() != it->second.index()) {
    throw SettingTypeMismatch(key, _type_name(it->second));
  }
  _validate_limits(key, value);
  it->second = value;
}

void Settings::set(const std::string& key, const char* value) {
  set(key, SettingValue(std::string(value)));
}

SettingValue Settings::get(const std::string& key) const { return _find(key); }

bool Settings::has(const std::string& key) const {
  return settings_.find(key) != settings_.end();
}

std::vector<std::string> Settings::keys() const {
  std::vector<std::string> result;
  result.reserve(settings_.size());
  for (const auto& [key, value] : settings_) {
    result.push_back(key);
  }
  return result;
}

size_t Settings::size() const { return settings_.size(); }

bool Settings::empty() const { return settings_.empty(); }

std::string Settings::get_summary() const {
  std::ostringstream oss;
  oss << "Settings Summary:\n";
  if (empty()) {
    oss << "  No settings configured.\n";
    return oss.str();
  }
  for (const auto& [key, value] : settings_) {
    std::string value_str = _to_string(value);
    if (value_str.length() > 50) {
      value_str = value_str.substr(0, 47) + "...";
    }
    oss << "    " << key << " = " << value_str << "\n";
  }
  return oss.str();
}

std::string Settings::get_as_string(const std::string& key) const {
  return _to_string(_find(key));
}

std::string Settings::get_type_name(const std::string& key) const {
  return _type_name(_find(key));
}

bool Settings::has_description(const std::string& key) const {
  return descriptions_.find(key) != descriptions_.end();
}

std::string Settings::get_description(const std::string& key) const {
  auto it = descriptions_.find(key);
  if (it == descriptions_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

bool Settings::has_limits(const std::string& key) const {
  return limits_.find(key) != limits_.end();
}

Constraint Settings::get_limits(const std::string& key) const {
  auto it = limits_.find(key);
  if (it == limits_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

void Settings::update(const std::map<std::string, std::string>& updates_map) {
  // Parse everything first so a bad entry leaves the settings untouched
  std::map<std::string, SettingValue> parsed;
  for (const auto& [key, text] : updates_map) {
    if (!has(key)) {
      throw SettingNotFound(key);
    }
    parsed[key] = _parse_string(key, text);
  }
  for (const auto& [key, value] : parsed) {
    set(key, value);
  }
}

void Settings::update(const Settings& other_settings) {
  for (const auto& [key, value] : other_settings.settings_) {
    if (has(key)) {
      set(key, value);
    }
  }
}

void Settings::lock() const { _locked = true; }

std::string Settings::as_table(size_t max_width) const {
  constexpr size_t key_width = 32;
  constexpr size_t value_width = 14;
  const size_t description_width =
      max_width > key_width + value_width + 6
          ? max_width - key_width - value_width - 6
          : 20;

  auto wrap = [](const std::string& text, size_t width) {
    std::vector<std::string> lines;
    std::istringstream words(text);
    std::string word;
    std::string line;
    while (words >> word) {
      if (!line.empty() && line.size() + 1 + word.size() > width) {
        lines.push_back(line);
        line.clear();
      }
      line += (line.empty() ? "" : " ") + word;
    }
    lines.push_back(line);
    return lines;
  };

  std::ostringstream oss;
  const std::string rule(max_width, '-');
  oss << rule << "\n";
  oss << std::left << std::setw(key_width) << "Key" << " | "
      << std::setw(value_width) << "Value" << " | "
      << "Description\n";
  oss << rule << "\n";

  for (const auto& [key, value] : settings_) {
    std::string value_str = _to_string(value);
    if (value_str.size() > value_width) {
      value_str = value_str.substr(0, value_width - 3) + "...";
    }
    std::string description =
        has_description(key) ? descriptions_.at(key) : "";
    if (has_limits(key)) {
      description += " " + _limits_to_string(limits_.at(key));
    }

    const auto lines = wrap(description, description_width);
    for (size_t i = 0; i < lines.size(); ++i) {
      oss << std::left << std::setw(key_width) << (i == 0 ? key : "")
          << " | " << std::setw(value_width) << (i == 0 ? value_str : "")
          << " | " << lines[i] << "\n";
    }
  }
  oss << rule << "\n";
  return oss.str();
}

void Settings::set_default(const std::string& key, const SettingValue& value,
                           std::optional<std::string> description,
                           std::optional<Constraint> limit) {
  if (has(key)) {
    return;
  }
  if (limit.has_value()) {
    limits_[key] = *limit;
    try {
      _validate_limits(key, value);
    } catch (const std::invalid_argument&) {
      limits_.erase(key);
      throw std::invalid_argument("Default value of setting '" + key +
                                  "' violates its own constraint");
    }
  }
  settings_[key] = value;
  if (description.has_value()) {
    descriptions_[key] = *description;
  }
}

void Settings::set_default(const std::string& key, const char* value,
                           std::optional<std::string> description,
                           std::optional<Constraint> limit) {
  set_default(key, SettingValue(std::string(value)), std::move(description),
              std::move(limit));
}

const SettingValue& Settings::_find(const std::string& key) const {
  auto it = settings_.find(key);
  if (it == settings_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

void Settings::_validate_limits(const std::string& key,
                                const SettingValue& value) const {
  auto it = limits_.find(key);
  if (it == limits_.end()) {
    return;
  }
  const Constraint& limit = it->second;

  auto out_of_range = [&key, &limit]() {
    return std::invalid_argument("Value for setting '" + key +
                                 "' is not allowed. Allowed: " +
                                 _limits_to_string(limit));
  };

  auto check_int = [&](int64_t v) {
    if (const auto* bound = std::get_if<BoundConstraint<int64_t>>(&limit)) {
      if (v < bound->min || v > bound->max) throw out_of_range();
    } else if (const auto* list =
                   std::get_if<ListConstraint<int64_t>>(&limit)) {
      if (std::find(list->allowed_values.begin(), list->allowed_values.end(),
                    v) == list->allowed_values.end()) {
        throw out_of_range();
      }
    }
  };

  auto check_double = [&](double v) {
    if (const auto* bound = std::get_if<BoundConstraint<double>>(&limit)) {
      if (!(v >= bound->min && v <= bound->max)) throw out_of_range();
    }
  };

  std::visit(
      [&](const auto& typed) {
        using ValueType = std::decay_t<decltype(typed)>;
        if constexpr (std::is_same_v<ValueType, int64_t>) {
          check_int(typed);
        } else if constexpr (std::is_same_v<ValueType, double>) {
          check_double(typed);
        } else if constexpr (std::is_same_v<ValueType, std::string>) {
          if (const auto* list =
                  std::get_if<ListConstraint<std::string>>(&limit)) {
            if (std::find(list->allowed_values.begin(),
                          list->allowed_values.end(),
                          typed) == list->allowed_values.end()) {
              throw out_of_range();
            }
          }
        } else if constexpr (std::is_same_v<ValueType, std::vector<int64_t>>) {
          for (auto v : typed) check_int(v);
        } else if constexpr (std::is_same_v<ValueType, std::vector<double>>) {
          for (auto v : typed) check_double(v);
        }
      },
      value);
}

std::string Settings::_type_name(const SettingValue& value) {
  return std::visit(
      [](const auto& typed) -> std::string {
        using ValueType = std::decay_t<decltype(typed)>;
        if constexpr (std::is_same_v<ValueType, bool>) {
          return "bool";
        } else if constexpr (std::is_same_v<ValueType, int64_t>) {
          return "int";
        } else if constexpr (std::is_same_v<ValueType, double>) {
          return "double";
        } else if constexpr (std::is_same_v<ValueType, std::string>) {
          return "string";
        } else if constexpr (std::is_same_v<ValueType, std::vector<int64_t>>) {
          return "vector<int>";
        } else {
          return "vector<double>";
        }
      },
      value);
}

std::string Settings::_to_string(const SettingValue& value) {
  return std::visit(
      [](const auto& typed) -> std::string {
        using ValueType = std::decay_t<decltype(typed)>;
        std::ostringstream oss;
        if constexpr (std::is_same_v<ValueType, bool>) {
          oss << (typed ? "true" : "false");
        } else if constexpr (std::is_same_v<ValueType, int64_t>) {
          oss << typed;
        } else if constexpr (std::is_same_v<ValueType, double>) {
          oss << std::setprecision(6) << typed;
        } else if constexpr (std::is_same_v<ValueType, std::string>) {
          oss << "\"" << typed << "\"";
        } else {
          oss << "[";
          for (size_t i = 0; i < typed.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << typed[i];
          }
          oss << "]";
        }
        return oss.str();
      },
      value);
}

std::string Settings::_limits_to_string(const Constraint& limit) {
  return std::visit(
      [](const auto& typed) -> std::string {
        using LimitType = std::decay_t<decltype(typed)>;
        std::ostringstream oss;
        if constexpr (std::is_same_v<LimitType, BoundConstraint<int64_t>> ||
                      std::is_same_v<LimitType, BoundConstraint<double>>) {
          oss << "[" << typed.min << ", " << typed.max << "]";
        } else {
          oss << "{";
          for (size_t i = 0; i < typed.allowed_values.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << typed.allowed_values[i];
          }
          oss << "}";
        }
        return oss.str();
      },
      limit);
}

nlohmann::json Settings::_value_to_json(const SettingValue& value) {
  return std::visit([](const auto& typed) { return nlohmann::json(typed); },
                    value);
}

SettingValue Settings::_value_from_json(const nlohmann::json& j) {
  if (j.is_boolean()) {
    return j.get<bool>();
  }
  if (j.is_number_integer()) {
    return j.get<int64_t>();
  }
  if (j.is_number_float()) {
    return j.get<double>();
  }
  if (j.is_string()) {
    return j.get<std::string>();
  }
  if (j.is_array()) {
    const bool all_integer =
        std::all_of(j.begin(), j.end(),
                    [](const auto& element) { return element.is_number_integer(); });
    if (all_integer && !j.empty()) {
      return j.get<std::vector<int64_t>>();
    }
    return j.get<std::vector<double>>();
  }
  throw std::runtime_error("Unsupported JSON value in settings: " + j.dump());
}

SettingValue Settings::_parse_string(const std::string& key,
                                     const std::string& text) const {
  const SettingValue& current = _find(key);
  try {
    if (std::holds_alternative<bool>(current)) {
      const std::string lowered = utils::to_lower(text);
      if (lowered == "true" || lowered == "1" || lowered == "yes" ||
          lowered == "on") {
        return true;
      }
      if (lowered == "false" || lowered == "0" || lowered == "no" ||
          lowered == "off") {
        return false;
      }
      throw std::invalid_argument(text);
    }
    if (std::holds_alternative<int64_t>(current)) {
      size_t consumed = 0;
      const int64_t value = std::stoll(text, &consumed);
      if (consumed != text.size()) throw std::invalid_argument(text);
      return value;
    }
    if (std::holds_alternative<double>(current)) {
      size_t consumed = 0;
      const double value = std::stod(text, &consumed);
      if (consumed != text.size()) throw std::invalid_argument(text);
      return value;
    }
    if (std::holds_alternative<std::string>(current)) {
      return text;
    }
    return _value_from_json(nlohmann::json::parse(text));
  } catch (const std::logic_error&) {
    throw std::invalid_argument("Cannot parse '" + text + "' as " +
                                _type_name(current) + " for setting '" + key +
                                "'");
  } catch (const nlohmann::json::exception&) {
    throw std::invalid_argument("Cannot parse '" + text + "' as " +
                                _type_name(current) + " for setting '" + key +
                                "'");
  }
}

nlohmann::json Settings::to_json() const {
  nlohmann::json json_obj;
  json_obj[version_key] = SERIALIZATION_VERSION;
  for (const auto& [key, value] : settings_) {
    json_obj[key] = _value_to_json(value);
  }
  if (!descriptions_.empty()) {
    json_obj[descriptions_key] = descriptions_;
  }
  return json_obj;
}

std::shared_ptr<Settings> Settings::from_json(const nlohmann::json& json_obj) {
  CDGW_LOG_TRACE_ENTERING();
  if (!json_obj.is_object()) {
    throw std::runtime_error("JSON must be an object");
  }
  if (json_obj.contains(version_key)) {
    validate_serialization_version(SERIALIZATION_VERSION,
                                   json_obj[version_key].get<std::string>());
  }

  // Deserialized settings define their own keys, so bypass set()
  auto settings = std::make_shared<Settings>();
  for (const auto& [key, value] : json_obj.items()) {
    if (key == version_key || key == descriptions_key) {
      continue;
    }
    settings->settings_[key] = _value_from_json(value);
  }
  if (json_obj.contains(descriptions_key)) {
    settings->descriptions_ =
        json_obj[descriptions_key].get<std::map<std::string, std::string>>();
  }
  return settings;
}

void Settings::_value_to_hdf5(H5::Group& group, const std::string& name,
                              const SettingValue& value) {
  std::visit(
      [&group, &name](const auto& typed) {
        using ValueType = std::decay_t<decltype(typed)>;
        H5::DataSpace scalar(H5S_SCALAR);
        if constexpr (std::is_same_v<ValueType, bool>) {
          const int flag = typed ? 1 : 0;
          H5::DataSet dataset =
              group.createDataSet(name, H5::PredType::NATIVE_INT, scalar);
          dataset.write(&flag, H5::PredType::NATIVE_INT);
          write_string_attribute(dataset, "type", "bool");
        } else if constexpr (std::is_same_v<ValueType, int64_t>) {
          H5::DataSet dataset =
              group.createDataSet(name, H5::PredType::NATIVE_INT64, scalar);
          dataset.write(&typed, H5::PredType::NATIVE_INT64);
        } else if constexpr (std::is_same_v<ValueType, double>) {
          H5::DataSet dataset =
              group.createDataSet(name, H5::PredType::NATIVE_DOUBLE, scalar);
          dataset.write(&typed, H5::PredType::NATIVE_DOUBLE);
        } else if constexpr (std::is_same_v<ValueType, std::string>) {
          H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
          H5::DataSet dataset = group.createDataSet(name, str_type, scalar);
          dataset.write(typed, str_type);
        } else {
          save_stl_to_group(group, name, typed);
        }
      },
      value);
}

SettingValue Settings::_value_from_hdf5(H5::Group& group,
                                        const std::string& name) {
  H5::DataSet dataset = group.openDataSet(name);
  H5::DataSpace dataspace = dataset.getSpace();
  const H5T_class_t type_class = dataset.getTypeClass();
  const bool scalar = dataspace.getSimpleExtentType() == H5S_SCALAR;

  if (type_class == H5T_STRING) {
    H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
    std::string value;
    dataset.read(value, str_type);
    return value;
  }
  if (type_class == H5T_INTEGER) {
    if (scalar && dataset.attrExists("type") &&
        read_string_attribute(dataset, "type") == "bool") {
      int flag = 0;
      dataset.read(&flag, H5::PredType::NATIVE_INT);
      return flag != 0;
    }
    if (scalar) {
      int64_t value = 0;
      dataset.read(&value, H5::PredType::NATIVE_INT64);
      return value;
    }
    return load_std_vector_from_group<int64_t>(group, name);
  }
  if (type_class == H5T_FLOAT) {
    if (scalar) {
      double value = 0.0;
      dataset.read(&value, H5::PredType::NATIVE_DOUBLE);
      return value;
    }
    return load_std_vector_from_group<double>(group, name);
  }
  throw std::runtime_error("Unsupported HDF5 datatype for setting '" + name +
                           "'");
}

void Settings::to_hdf5(H5::Group& group) const {
  CDGW_LOG_TRACE_ENTERING();
  write_string_attribute(group, version_key, SERIALIZATION_VERSION);
  for (const auto& [key, value] : settings_) {
    _value_to_hdf5(group, key, value);
  }
  if (!descriptions_.empty()) {
    H5::Group desc_group = group.createGroup(descriptions_key);
    for (const auto& [key, description] : descriptions_) {
      write_string_attribute(desc_group, key, description);
    }
  }
}

std::shared_ptr<Settings> Settings::from_hdf5(H5::Group& group) {
  CDGW_LOG_TRACE_ENTERING();
  if (group.attrExists(version_key)) {
    validate_serialization_version(SERIALIZATION_VERSION,
                                   read_string_attribute(group, version_key));
  }

  auto settings = std::make_shared<Settings>();
  for (hsize_t i = 0; i < group.getNumObjs(); ++i) {
    const std::string name = group.getObjnameByIdx(i);
    if (name == descriptions_key) {
      H5::Group desc_group = group.openGroup(name);
      for (int a = 0; a < desc_group.getNumAttrs(); ++a) {
        H5::Attribute attr = desc_group.openAttribute(static_cast<unsigned>(a));
        const std::string key = attr.getName();
        settings->descriptions_[key] = read_string_attribute(desc_group, key);
      }
      continue;
    }
    settings->settings_[name] = _value_from_hdf5(group, name);
  }
  return settings;
}

void Settings::to_file(const std::string& filename,
                       const std::string& type) const {
  if (type == "json") {
    to_json_file(filename);
  } else if (type == "hdf5") {
    to_hdf5_file(filename);
  } else {
    throw std::invalid_argument("Unsupported file type: " + type +
                                ". Supported types are: json, hdf5");
  }
}

std::shared_ptr<Settings> Settings::from_file(const std::string& filename,
                                              const std::string& type) {
  if (type == "json") {
    return from_json_file(filename);
  } else if (type == "hdf5") {
    return from_hdf5_file(filename);
  }
  throw std::invalid_argument("Unsupported file type: " + type +
                              ". Supported types are: json, hdf5");
}

void Settings::to_json_file(const std::string& filename) const {
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_write_suffix(filename, "settings");
  _to_json_file(filename);
}

std::shared_ptr<Settings> Settings::from_json_file(
    const std::string& filename) {
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_read_suffix(filename, "settings");
  return _from_json_file(filename);
}

void Settings::to_hdf5_file(const std::string& filename) const {
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_write_suffix(filename, "settings");
  _to_hdf5_file(filename);
}

std::shared_ptr<Settings> Settings::from_hdf5_file(
    const std::string& filename) {
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_read_suffix(filename, "settings");
  return _from_hdf5_file(filename);
}

void Settings::_to_json_file(const std::string& filename) const {
  write_json_file(filename, to_json());
}

std::shared_ptr<Settings> Settings::_from_json_file(
    const std::string& filename) {
  return from_json(read_json_file(filename, "Settings"));
}

void Settings::_to_hdf5_file(const std::string& filename) const {
  write_hdf5_file(filename, "Settings", [this](H5::H5File& file) {
    H5::Group group = file.createGroup("/settings");
    to_hdf5(group);
  });
}

std::shared_ptr<Settings> Settings::_from_hdf5_file(
    const std::string& filename) {
  return read_hdf5_file(filename, "Settings", [](H5::H5File& file) {
    H5::Group group = file.openGroup("/settings");
    return from_hdf5(group);
  });
}

}  // namespace cdgw::data
