// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

/**
 * @file simple_gw.cpp
 * @brief End-to-end G0W0 calculation by contour deformation
 *
 * This example demonstrates the complete workflow:
 * 1. Loading a mean-field reference (orbitals and three-center integrals)
 *    from HDF5 files, or building a small model system when none is given
 * 2. Configuring the GW calculator from key=value pairs
 * 3. Evaluating the self-energy and solving the quasiparticle equation
 * 4. Writing the self-energy and the quasiparticle spectrum to disk
 *
 * Usage:
 *   ./cdgw_simple_gw
 *   ./cdgw_simple_gw h2o.orbitals.h5 h2o.three_center_integrals.h5
 *   ./cdgw_simple_gw h2o.orbitals.h5 h2o.three_center_integrals.h5 \
 *       occupied_count=3 virtual_count_included=2 low_memory_mode=true
 *
 * Results are written to gw.self_energy.h5 and
 * gw.quasiparticle_spectrum.json in the working directory.
 */

// One can also include <cdgw.hpp> to get all components
#include <cdgw/algorithms/gw.hpp>
#include <cdgw/constants.hpp>
#include <cdgw/data/orbitals.hpp>
#include <cdgw/data/three_center_integrals.hpp>

// Standard Library Header Files
#include <iomanip>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <tuple>
#include <utility>

namespace data = cdgw::data;
namespace algorithms = cdgw::algorithms;
namespace constants = cdgw::constants;

namespace {

/**
 * @brief Closed-shell model with four occupied and four virtual orbitals
 *
 * The three-center factors are random but symmetric in the orbital pair, which
 * is all the GW equations require.
 */
std::pair<std::shared_ptr<data::Orbitals>,
          std::shared_ptr<data::ThreeCenterIntegrals>>
build_model_system() {
  constexpr Eigen::Index nmo = 8;
  constexpr Eigen::Index naux = 24;

  Eigen::VectorXd energies(nmo);
  energies << -1.10, -0.72, -0.61, -0.45, 0.08, 0.21, 0.55, 0.93;
  auto orbitals = std::make_shared<data::Orbitals>(energies, std::size_t{4});

  std::mt19937 generator(7);
  std::uniform_real_distribution<double> distribution(-0.15, 0.15);
  Eigen::MatrixXd tensor(naux, nmo * nmo);
  for (Eigen::Index P = 0; P < naux; ++P) {
    for (Eigen::Index q = 0; q < nmo; ++q) {
      for (Eigen::Index p = 0; p <= q; ++p) {
        tensor(P, p + q * nmo) = tensor(P, q + p * nmo) =
            distribution(generator);
      }
    }
  }
  auto integrals = std::make_shared<data::ThreeCenterIntegrals>(
      tensor, static_cast<std::size_t>(nmo));
  return {orbitals, integrals};
}

}  // namespace

int main(int argc, char** argv) {
  // ==========================================================================
  // STEP 1: INPUT
  // ==========================================================================

  std::shared_ptr<data::Orbitals> orbitals;
  std::shared_ptr<data::ThreeCenterIntegrals> integrals;
  int first_option = 1;

  if (argc >= 3 && std::string(argv[1]).find('=') == std::string::npos) {
    orbitals = data::Orbitals::from_file(argv[1], "hdf5");
    integrals = data::ThreeCenterIntegrals::from_file(argv[2], "hdf5");
    first_option = 3;
  } else {
    std::cout << "No input files given, using the built-in model system.\n";
    std::tie(orbitals, integrals) = build_model_system();
  }

  // Remaining arguments are key=value settings of the GW calculator
  std::map<std::string, std::string> options;
  for (int i = first_option; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto eq = arg.find('=');
    if (eq == std::string::npos) {
      std::cerr << "Ignoring argument without '=': " << arg << "\n";
      continue;
    }
    options[arg.substr(0, eq)] = arg.substr(eq + 1);
  }

  std::cout << "\n";
  std::cout << "========================================\n";
  std::cout << "                  CDGW                  \n";
  std::cout << "========================================\n\n";
  std::cout << orbitals->get_summary() << "\n";

  // ==========================================================================
  // STEP 2: GW CALCULATION
  //
  // The default calculator ("contour_deformation", alias "cd") computes the
  // self-energy of a window of orbitals around the Fermi level and solves the
  // quasiparticle equation with the "graphical" solver.
  // ==========================================================================

  auto gw = algorithms::GWCalculatorFactory::create();
  gw->settings().set("occupied_count", 2);
  gw->settings().set("virtual_count_included", 2);
  gw->settings().update(options);

  std::cout << "GW settings:\n" << gw->settings().as_table() << "\n";

  auto [spectrum, self_energy] = gw->run(orbitals, integrals);

  // ==========================================================================
  // STEP 3: RESULTS
  // ==========================================================================

  std::cout << "\n" << spectrum->get_summary() << "\n";

  std::cout << std::fixed << std::setprecision(4);
  std::cout << "Orbital   eps0 (eV)   E_lin (eV)    E_qp (eV)       Z\n";
  std::cout << "-------   ---------   ----------    ---------   ------\n";
  for (const auto& solution : spectrum->get_solutions()) {
    std::cout << std::setw(7) << solution.orbital_index << "   "
              << std::setw(9)
              << solution.reference_energy * constants::hartree_to_ev << "   "
              << std::setw(10)
              << solution.linearized_energy * constants::hartree_to_ev
              << "    ";
    if (solution.primary_root) {
      const auto& root = solution.get_primary_root();
      std::cout << std::setw(9) << root.energy * constants::hartree_to_ev
                << "   " << std::setw(6) << root.z << "\n";
    } else {
      std::cout << "      n/a      n/a\n";
    }
  }

  self_energy->to_file("gw.self_energy.h5", "hdf5");
  spectrum->to_file("gw.quasiparticle_spectrum.json", "json");
  std::cout << "\nWrote gw.self_energy.h5 and gw.quasiparticle_spectrum.json\n";

  return spectrum->has_issues() ? 2 : 0;
}
