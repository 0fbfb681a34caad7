// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <cdgw/constants.hpp>
#include <cdgw/data/quasiparticle_spectrum.hpp>
#include <cdgw/utils/logger.hpp>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "filename_utils.hpp"
#include "hdf5_error_handling.hpp"
#include "hdf5_serialization.hpp"
#include "json_serialization.hpp"

namespace cdgw::data {

std::string to_string(RootQuality quality) {
  switch (quality) {
    case RootQuality::Physical:
      return "physical";
    case RootQuality::PoleCrossing:
      return "pole_crossing";
    case RootQuality::UnphysicalZ:
      return "unphysical_z";
  }
  throw std::invalid_argument("Unknown RootQuality");
}

RootQuality root_quality_from_string(const std::string& name) {
  if (name == "physical") return RootQuality::Physical;
  if (name == "pole_crossing") return RootQuality::PoleCrossing;
  if (name == "unphysical_z") return RootQuality::UnphysicalZ;
  throw std::invalid_argument("Unknown root quality: " + name);
}

std::string to_string(QuasiparticleIssue issue) {
  switch (issue) {
    case QuasiparticleIssue::DegenerateLinearization:
      return "degenerate_linearization";
    case QuasiparticleIssue::NoRootFound:
      return "no_root_found";
  }
  throw std::invalid_argument("Unknown QuasiparticleIssue");
}

QuasiparticleIssue quasiparticle_issue_from_string(const std::string& name) {
  if (name == "degenerate_linearization") {
    return QuasiparticleIssue::DegenerateLinearization;
  }
  if (name == "no_root_found") return QuasiparticleIssue::NoRootFound;
  throw std::invalid_argument("Unknown quasiparticle issue: " + name);
}

bool QuasiparticleSolution::has_issue(QuasiparticleIssue issue) const {
  return std::find(issues.begin(), issues.end(), issue) != issues.end();
}

const QuasiparticleRoot& QuasiparticleSolution::get_primary_root() const {
  if (!primary_root.has_value()) {
    throw std::runtime_error("Orbital " + std::to_string(orbital_index) +
                             " has no physical quasiparticle root");
  }
  return roots.at(*primary_root);
}

QuasiparticleSpectrum::QuasiparticleSpectrum(
    std::vector<QuasiparticleSolution> solutions,
    std::string screened_interaction_algorithm)
    : solutions_(std::move(solutions)),
      screened_interaction_algorithm_(std::move(screened_interaction_algorithm)) {
  CDGW_LOG_TRACE_ENTERING();
  for (const auto& solution : solutions_) {
    if (solution.primary_root.has_value() &&
        *solution.primary_root >= solution.roots.size()) {
      throw std::invalid_argument("Primary root index of orbital " +
                                  std::to_string(solution.orbital_index) +
                                  " is out of range");
    }
  }
}

const QuasiparticleSolution& QuasiparticleSpectrum::get_solution(
    std::size_t orbital_index) const {
  auto it = std::find_if(solutions_.begin(), solutions_.end(),
                         [orbital_index](const QuasiparticleSolution& s) {
                           return s.orbital_index == orbital_index;
                         });
  if (it == solutions_.end()) {
    throw std::out_of_range("No quasiparticle solution for orbital " +
                            std::to_string(orbital_index));
  }
  return *it;
}

Eigen::VectorXd QuasiparticleSpectrum::get_linearized_energies() const {
  Eigen::VectorXd energies(static_cast<Eigen::Index>(solutions_.size()));
  for (std::size_t i = 0; i < solutions_.size(); ++i) {
    energies(static_cast<Eigen::Index>(i)) = solutions_[i].linearized_energy;
  }
  return energies;
}

Eigen::VectorXd QuasiparticleSpectrum::get_graphical_energies() const {
  Eigen::VectorXd energies(static_cast<Eigen::Index>(solutions_.size()));
  for (std::size_t i = 0; i < solutions_.size(); ++i) {
    const auto& solution = solutions_[i];
    energies(static_cast<Eigen::Index>(i)) =
        solution.primary_root.has_value()
            ? solution.get_primary_root().energy
            : std::numeric_limits<double>::quiet_NaN();
  }
  return energies;
}

bool QuasiparticleSpectrum::has_issues() const {
  return std::any_of(
      solutions_.begin(), solutions_.end(),
      [](const QuasiparticleSolution& s) { return !s.issues.empty(); });
}

std::string QuasiparticleSpectrum::get_summary() const {
  CDGW_LOG_TRACE_ENTERING();
  constexpr double ev = constants::hartree_to_ev;
  std::ostringstream oss;
  oss << "QuasiparticleSpectrum Summary";
  if (!screened_interaction_algorithm_.empty()) {
    oss << " (screened interaction: " << screened_interaction_algorithm_
        << ")";
  }
  oss << "\n";
  oss << "  Energies in eV\n";
  oss << std::right << std::setw(6) << "n" << std::setw(11) << "E0"
      << std::setw(11) << "SigX-Vxc" << std::setw(11) << "ReSigC" << std::setw(8)
      << "Z_lin" << std::setw(11) << "E_lin" << std::setw(11) << "E_qp"
      << std::setw(8) << "Z_qp" << "  notes\n";

  oss << std::fixed;
  for (const auto& s : solutions_) {
    oss << std::setw(6) << s.orbital_index << std::setprecision(3)
        << std::setw(11) << s.reference_energy * ev << std::setw(11)
        << s.exchange_minus_vxc * ev << std::setw(11)
        << s.correlation_at_reference.real() * ev << std::setw(8)
        << s.linearized_z << std::setw(11) << s.linearized_energy * ev;
    if (s.primary_root.has_value()) {
      const auto& root = s.get_primary_root();
      oss << std::setw(11) << root.energy * ev << std::setw(8) << root.z;
    } else {
      oss << std::setw(11) << "-" << std::setw(8) << "-";
    }

    std::vector<std::string> notes;
    for (auto issue : s.issues) {
      notes.push_back(to_string(issue));
    }
    if (s.primary_root.has_value() && !s.primary_root_unique) {
      notes.push_back("ambiguous_primary_root");
    }
    if (s.roots.size() > 1) {
      notes.push_back(std::to_string(s.roots.size()) + " roots");
    }
    oss << "  " << utils::join(notes, ", ") << "\n";
  }
  return oss.str();
}

void QuasiparticleSpectrum::to_file(const std::string& filename,
                                    const std::string& type) const {
  CDGW_LOG_TRACE_ENTERING();
  if (type == "json") {
    to_json_file(filename);
  } else if (type == "hdf5") {
    to_hdf5_file(filename);
  } else {
    throw std::invalid_argument("Unsupported file type: " + type +
                                ". Supported types are: json, hdf5");
  }
}

nlohmann::json QuasiparticleSpectrum::to_json() const {
  CDGW_LOG_TRACE_ENTERING();
  nlohmann::json j;
  j["serialization_version"] = SERIALIZATION_VERSION;
  j["type"] = "QuasiparticleSpectrum";
  j["screened_interaction_algorithm"] = screened_interaction_algorithm_;

  nlohmann::json solutions = nlohmann::json::array();
  for (const auto& s : solutions_) {
    nlohmann::json entry;
    entry["orbital_index"] = s.orbital_index;
    entry["reference_energy"] = s.reference_energy;
    entry["exchange_minus_vxc"] = s.exchange_minus_vxc;
    entry["correlation_at_reference"] = {s.correlation_at_reference.real(),
                                         s.correlation_at_reference.imag()};
    entry["linearized_z"] = s.linearized_z;
    entry["linearized_energy"] = s.linearized_energy;

    nlohmann::json roots = nlohmann::json::array();
    for (const auto& root : s.roots) {
      roots.push_back({{"energy", root.energy},
                       {"z", root.z},
                       {"quality", to_string(root.quality)}});
    }
    entry["roots"] = roots;
    if (s.primary_root.has_value()) {
      entry["primary_root"] = *s.primary_root;
    } else {
      entry["primary_root"] = nullptr;
    }
    entry["primary_root_unique"] = s.primary_root_unique;

    nlohmann::json issues = nlohmann::json::array();
    for (auto issue : s.issues) {
      issues.push_back(to_string(issue));
    }
    entry["issues"] = issues;
    solutions.push_back(entry);
  }
  j["solutions"] = solutions;
  return j;
}

std::shared_ptr<QuasiparticleSpectrum> QuasiparticleSpectrum::from_json(
    const nlohmann::json& j) {
  CDGW_LOG_TRACE_ENTERING();
  validate_json_header(j, "QuasiparticleSpectrum", SERIALIZATION_VERSION);

  std::vector<QuasiparticleSolution> solutions;
  for (const auto& entry : j.at("solutions")) {
    QuasiparticleSolution s;
    s.orbital_index = entry.at("orbital_index").get<std::size_t>();
    s.reference_energy = entry.at("reference_energy").get<double>();
    s.exchange_minus_vxc = entry.at("exchange_minus_vxc").get<double>();
    const auto& sigma = entry.at("correlation_at_reference");
    // Nonfinite values are written as null by nlohmann::json
    auto as_double = [](const nlohmann::json& value) {
      return value.is_null() ? std::numeric_limits<double>::quiet_NaN()
                             : value.get<double>();
    };
    s.correlation_at_reference = {as_double(sigma.at(0)),
                                  as_double(sigma.at(1))};
    s.linearized_z = as_double(entry.at("linearized_z"));
    s.linearized_energy = as_double(entry.at("linearized_energy"));
    for (const auto& root : entry.at("roots")) {
      s.roots.push_back(
          {root.at("energy").get<double>(), as_double(root.at("z")),
           root_quality_from_string(root.at("quality").get<std::string>())});
    }
    if (!entry.at("primary_root").is_null()) {
      s.primary_root = entry.at("primary_root").get<std::size_t>();
    }
    s.primary_root_unique = entry.value("primary_root_unique", true);
    for (const auto& issue : entry.at("issues")) {
      s.issues.push_back(
          quasiparticle_issue_from_string(issue.get<std::string>()));
    }
    solutions.push_back(std::move(s));
  }
  return std::make_shared<QuasiparticleSpectrum>(
      std::move(solutions),
      j.value("screened_interaction_algorithm", std::string()));
}

void QuasiparticleSpectrum::to_json_file(const std::string& filename) const {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_write_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(QuasiparticleSpectrum));
  write_json_file(filename, to_json());
}

std::shared_ptr<QuasiparticleSpectrum> QuasiparticleSpectrum::from_json_file(
    const std::string& filename) {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_read_suffix(filename, "quasiparticle_spectrum");
  return from_json(read_json_file(filename, "QuasiparticleSpectrum"));
}

void QuasiparticleSpectrum::to_hdf5(H5::Group& group) const {
  CDGW_LOG_TRACE_ENTERING();
  write_hdf5_header(group, "QuasiparticleSpectrum", SERIALIZATION_VERSION);
  write_string_attribute(group, "screened_interaction_algorithm",
                         screened_interaction_algorithm_);

  // Per-orbital scalars as flat arrays; roots and issues are concatenated
  // with a count per orbital
  const std::size_t n = solutions_.size();
  std::vector<size_t> orbital_indices(n);
  std::vector<int64_t> primary_root(n), primary_unique(n), root_counts(n),
      issue_counts(n);
  Eigen::VectorXd reference(n), static_part(n), sigma_re(n), sigma_im(n),
      z_lin(n), e_lin(n);
  std::vector<double> root_energy, root_z;
  std::vector<int64_t> root_quality, issues;

  for (std::size_t i = 0; i < n; ++i) {
    const auto& s = solutions_[i];
    const auto k = static_cast<Eigen::Index>(i);
    orbital_indices[i] = s.orbital_index;
    reference(k) = s.reference_energy;
    static_part(k) = s.exchange_minus_vxc;
    sigma_re(k) = s.correlation_at_reference.real();
    sigma_im(k) = s.correlation_at_reference.imag();
    z_lin(k) = s.linearized_z;
    e_lin(k) = s.linearized_energy;
    primary_root[i] =
        s.primary_root.has_value() ? static_cast<int64_t>(*s.primary_root) : -1;
    primary_unique[i] = s.primary_root_unique ? 1 : 0;
    root_counts[i] = static_cast<int64_t>(s.roots.size());
    issue_counts[i] = static_cast<int64_t>(s.issues.size());
    for (const auto& root : s.roots) {
      root_energy.push_back(root.energy);
      root_z.push_back(root.z);
      root_quality.push_back(static_cast<int64_t>(root.quality));
    }
    for (auto issue : s.issues) {
      issues.push_back(static_cast<int64_t>(issue));
    }
  }

  save_vector_to_group(group, "orbital_indices", orbital_indices);
  save_vector_to_group(group, "reference_energies", reference);
  save_vector_to_group(group, "exchange_minus_vxc", static_part);
  save_vector_to_group(group, "correlation_at_reference_real", sigma_re);
  save_vector_to_group(group, "correlation_at_reference_imag", sigma_im);
  save_vector_to_group(group, "linearized_z", z_lin);
  save_vector_to_group(group, "linearized_energies", e_lin);
  save_stl_to_group(group, "primary_root", primary_root);
  save_stl_to_group(group, "primary_root_unique", primary_unique);
  save_stl_to_group(group, "root_counts", root_counts);
  save_stl_to_group(group, "root_energies", root_energy);
  save_stl_to_group(group, "root_z", root_z);
  save_stl_to_group(group, "root_quality", root_quality);
  save_stl_to_group(group, "issue_counts", issue_counts);
  save_stl_to_group(group, "issues", issues);
}

std::shared_ptr<QuasiparticleSpectrum> QuasiparticleSpectrum::from_hdf5(
    H5::Group& group) {
  CDGW_LOG_TRACE_ENTERING();
  validate_hdf5_header(group, "QuasiparticleSpectrum", SERIALIZATION_VERSION);
  std::string algorithm;
  if (group.attrExists("screened_interaction_algorithm")) {
    algorithm = read_string_attribute(group, "screened_interaction_algorithm");
  }

  const auto orbital_indices =
      load_size_vector_from_group(group, "orbital_indices");
  const auto reference = load_vector_from_group(group, "reference_energies");
  const auto static_part = load_vector_from_group(group, "exchange_minus_vxc");
  const auto sigma_re =
      load_vector_from_group(group, "correlation_at_reference_real");
  const auto sigma_im =
      load_vector_from_group(group, "correlation_at_reference_imag");
  const auto z_lin = load_vector_from_group(group, "linearized_z");
  const auto e_lin = load_vector_from_group(group, "linearized_energies");
  const auto primary_root =
      load_std_vector_from_group<int64_t>(group, "primary_root");
  const auto primary_unique =
      load_std_vector_from_group<int64_t>(group, "primary_root_unique");
  const auto root_counts =
      load_std_vector_from_group<int64_t>(group, "root_counts");
  const auto root_energy =
      load_std_vector_from_group<double>(group, "root_energies");
  const auto root_z = load_std_vector_from_group<double>(group, "root_z");
  const auto root_quality =
      load_std_vector_from_group<int64_t>(group, "root_quality");
  const auto issue_counts =
      load_std_vector_from_group<int64_t>(group, "issue_counts");
  const auto issues = load_std_vector_from_group<int64_t>(group, "issues");

  const std::size_t n = orbital_indices.size();
  if (primary_root.size() != n || root_counts.size() != n ||
      issue_counts.size() != n || primary_unique.size() != n ||
      static_cast<std::size_t>(reference.size()) != n) {
    throw std::runtime_error(
        "Inconsistent per-orbital array lengths in QuasiparticleSpectrum HDF5 "
        "data");
  }

  std::vector<QuasiparticleSolution> solutions(n);
  std::size_t root_offset = 0;
  std::size_t issue_offset = 0;
  for (std::size_t i = 0; i < n; ++i) {
    auto& s = solutions[i];
    const auto k = static_cast<Eigen::Index>(i);
    s.orbital_index = orbital_indices[i];
    s.reference_energy = reference(k);
    s.exchange_minus_vxc = static_part(k);
    s.correlation_at_reference = {sigma_re(k), sigma_im(k)};
    s.linearized_z = z_lin(k);
    s.linearized_energy = e_lin(k);
    const auto num_roots = static_cast<std::size_t>(root_counts[i]);
    const auto num_issues = static_cast<std::size_t>(issue_counts[i]);
    if (root_offset + num_roots > root_energy.size() ||
        issue_offset + num_issues > issues.size()) {
      throw std::runtime_error(
          "Root or issue counts exceed the stored QuasiparticleSpectrum data");
    }
    for (std::size_t r = 0; r < num_roots; ++r, ++root_offset) {
      s.roots.push_back({root_energy[root_offset], root_z[root_offset],
                         static_cast<RootQuality>(root_quality[root_offset])});
    }
    for (std::size_t q = 0; q < num_issues; ++q, ++issue_offset) {
      s.issues.push_back(static_cast<QuasiparticleIssue>(issues[issue_offset]));
    }
    if (primary_root[i] >= 0) {
      s.primary_root = static_cast<std::size_t>(primary_root[i]);
    }
    s.primary_root_unique = primary_unique[i] != 0;
  }
  return std::make_shared<QuasiparticleSpectrum>(std::move(solutions),
                                                 algorithm);
}

void QuasiparticleSpectrum::to_hdf5_file(const std::string& filename) const {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_write_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(QuasiparticleSpectrum));
  write_hdf5_file(filename, "QuasiparticleSpectrum",
                  [this](H5::H5File& file) { to_hdf5(file); });
}

std::shared_ptr<QuasiparticleSpectrum> QuasiparticleSpectrum::from_hdf5_file(
    const std::string& filename) {
  CDGW_LOG_TRACE_ENTERING();
  if (filename.empty()) {
    throw std::invalid_argument("Filename cannot be empty");
  }
  DataTypeFilename::validate_read_suffix(filename, "quasiparticle_spectrum");
  return read_hdf5_file(filename, "QuasiparticleSpectrum",
                        [](H5::H5File& file) { return from_hdf5(file); });
}

std::shared_ptr<QuasiparticleSpectrum> QuasiparticleSpectrum::from_file(
    const std::string& filename, const std::string& type) {
  CDGW_LOG_TRACE_ENTERING();
  if (type == "json") {
    return from_json_file(filename);
  } else if (type == "hdf5") {
    return from_hdf5_file(filename);
  }
  throw std::invalid_argument("Unsupported file type: " + type +
                              ". Supported types are: json, hdf5");
}

}  // namespace cdgw::data
