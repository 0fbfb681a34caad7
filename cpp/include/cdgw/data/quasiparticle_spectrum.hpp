// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>

#include <Eigen/Dense>
#include <cdgw/data/data_class.hpp>
#include <cdgw/utils/string_utils.hpp>
#include <complex>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cdgw::data {

/**
 * @brief Classification of a solution of the graphical QP equation
 */
enum class RootQuality {
  /// f(omega) increasing and 0 < Z <= 1: an acceptable quasiparticle
  Physical,
  /// f(omega) decreasing: the sign change comes from a pole of Sigma
  PoleCrossing,
  /// f(omega) increasing but Z outside (0, 1]
  UnphysicalZ
};

std::string to_string(RootQuality quality);

/**
 * @throws std::invalid_argument for an unknown name
 */
RootQuality root_quality_from_string(const std::string& name);

/**
 * @brief Non-fatal problems recorded for a single orbital
 */
enum class QuasiparticleIssue {
  /// Linearized Z outside (0, 1] or not computable
  DegenerateLinearization,
  /// No sign change of the graphical function on the sampled grid
  NoRootFound
};

std::string to_string(QuasiparticleIssue issue);

/**
 * @throws std::invalid_argument for an unknown name
 */
QuasiparticleIssue quasiparticle_issue_from_string(const std::string& name);

/**
 * @brief One solution of omega - eps0 - Re Sigma(omega) = 0
 */
struct QuasiparticleRoot {
  double energy;        ///< Root position (Ha)
  double z;             ///< Renormalization factor at the root
  RootQuality quality;  ///< Classification of the root
};

/**
 * @brief Quasiparticle result of a single orbital
 */
struct QuasiparticleSolution {
  std::size_t orbital_index = 0;
  double reference_energy = 0.0;    ///< eps0 (Ha)
  double exchange_minus_vxc = 0.0;  ///< Sigma_X - V_xc (Ha)
  std::complex<double> correlation_at_reference{0.0, 0.0};  ///< Sigma_c(eps0)
  double linearized_z = 0.0;
  double linearized_energy = 0.0;  ///< E_lin (Ha)
  /// Graphical roots in ascending energy
  std::vector<QuasiparticleRoot> roots;
  /// Position in roots of the physical root with the largest Z
  std::optional<std::size_t> primary_root;
  /// False when another physical root has a Z close to the primary one
  bool primary_root_unique = true;
  std::vector<QuasiparticleIssue> issues;

  bool has_issue(QuasiparticleIssue issue) const;

  /**
   * @brief The primary root
   * @throws std::runtime_error if there is none
   */
  const QuasiparticleRoot& get_primary_root() const;
};

/**
 * @class QuasiparticleSpectrum
 * @brief Per-orbital quasiparticle energies of a GW calculation
 *
 * Collects the linearized and graphical solutions of every computed orbital,
 * in ascending orbital order, together with the tag of the screened
 * interaction representation that produced them. get_summary() renders the
 * familiar table of energies in eV.
 */
class QuasiparticleSpectrum
    : public DataClass,
      public std::enable_shared_from_this<QuasiparticleSpectrum> {
 public:
  /**
   * @param solutions Per-orbital solutions
   * @param screened_interaction_algorithm Name of the screened interaction
   *        representation ("analytic", "low_memory"), empty if unknown
   */
  QuasiparticleSpectrum(std::vector<QuasiparticleSolution> solutions,
                        std::string screened_interaction_algorithm = "");

  QuasiparticleSpectrum(const QuasiparticleSpectrum&) = default;
  QuasiparticleSpectrum(QuasiparticleSpectrum&&) noexcept = default;
  QuasiparticleSpectrum& operator=(const QuasiparticleSpectrum&) = default;
  QuasiparticleSpectrum& operator=(QuasiparticleSpectrum&&) noexcept =
      default;
  virtual ~QuasiparticleSpectrum() = default;

  std::size_t size() const { return solutions_.size(); }

  const std::vector<QuasiparticleSolution>& get_solutions() const {
    return solutions_;
  }

  /**
   * @brief Solution of a given orbital
   * @throws std::out_of_range if the orbital was not computed
   */
  const QuasiparticleSolution& get_solution(std::size_t orbital_index) const;

  const std::string& get_screened_interaction_algorithm() const {
    return screened_interaction_algorithm_;
  }

  /// Linearized energies in solution order
  Eigen::VectorXd get_linearized_energies() const;

  /// Primary graphical energies in solution order, NaN where none exists
  Eigen::VectorXd get_graphical_energies() const;

  /// Whether any orbital recorded an issue
  bool has_issues() const;

  std::string get_data_type_name() const override {
    return DATACLASS_TO_SNAKE_CASE(QuasiparticleSpectrum);
  }

  std::string get_summary() const override;

  void to_file(const std::string& filename,
               const std::string& type) const override;

  nlohmann::json to_json() const override;

  void to_json_file(const std::string& filename) const override;

  void to_hdf5(H5::Group& group) const override;

  void to_hdf5_file(const std::string& filename) const override;

  static std::shared_ptr<QuasiparticleSpectrum> from_file(
      const std::string& filename, const std::string& type);

  static std::shared_ptr<QuasiparticleSpectrum> from_json(
      const nlohmann::json& j);

  static std::shared_ptr<QuasiparticleSpectrum> from_json_file(
      const std::string& filename);

  static std::shared_ptr<QuasiparticleSpectrum> from_hdf5(H5::Group& group);

  static std::shared_ptr<QuasiparticleSpectrum> from_hdf5_file(
      const std::string& filename);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  std::vector<QuasiparticleSolution> solutions_;
  std::string screened_interaction_algorithm_;
};

static_assert(DataClassCompliant<QuasiparticleSpectrum>,
              "QuasiparticleSpectrum must derive from DataClass and implement "
              "all required deserialization methods");

}  // namespace cdgw::data
