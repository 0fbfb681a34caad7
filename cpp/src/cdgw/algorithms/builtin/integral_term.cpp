// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "integral_term.hpp"

#include <cdgw/constants.hpp>
#include <cdgw/data/errors.hpp>
#include <string>

#include "residue_term.hpp"

namespace cdgw::algorithms::builtin {

std::complex<double> integral_term(const data::Orbitals& orbitals,
                                   const Eigen::MatrixXd& w_block,
                                   const Eigen::VectorXcd& w_static,
                                   const data::FrequencyGrid& grid,
                                   double omega, double eta) {
  const auto nmo = orbitals.get_num_molecular_orbitals();
  const auto& freqs = grid.get_imaginary_frequencies();
  const auto& weights = grid.get_imaginary_weights();

  if (static_cast<std::size_t>(w_block.rows()) != nmo ||
      w_block.cols() != freqs.size()) {
    throw data::InconsistentInputShapes(
        "Screened interaction block is " + std::to_string(w_block.rows()) +
        " x " + std::to_string(w_block.cols()) + ", expected " +
        std::to_string(nmo) + " x " + std::to_string(freqs.size()));
  }
  if (static_cast<std::size_t>(w_static.size()) != nmo) {
    throw data::InconsistentInputShapes(
        "Static screened interaction has " +
        std::to_string(w_static.size()) + " entries, expected " +
        std::to_string(nmo));
  }

  const auto& energies = orbitals.get_energies();
  const Eigen::ArrayXd freqs_sq = freqs.array().square();

  std::complex<double> sum(0.0, 0.0);
  std::complex<double> steps(0.0, 0.0);
  for (std::size_t m = 0; m < nmo; ++m) {
    const double eps_m = energies(static_cast<Eigen::Index>(m));
    const std::complex<double> s_m = w_static(static_cast<Eigen::Index>(m));

    const double sgn = orbitals.is_occupied(m) ? -1.0 : 1.0;
    const std::complex<double> z(omega - eps_m, -eta * sgn);
    const std::complex<double> z_sq = z * z;

    const auto w_row = w_block.row(static_cast<Eigen::Index>(m));
    for (Eigen::Index k = 0; k < freqs.size(); ++k) {
      sum += (weights(k) * (w_row(k) - s_m)) * z / (z_sq + freqs_sq(k));
    }

    // int_0^inf z / (z^2 + x^2) dx = pi/2 sign(Re z)
    if (!pole_on_contour(eps_m, omega)) {
      steps += (omega > eps_m ? 0.5 : -0.5) * s_m;
    }
  }
  return -sum / constants::pi - steps;
}

}  // namespace cdgw::algorithms::builtin
