// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "residue_term.hpp"

#include <cdgw/utils/logger.hpp>
#include <cmath>
#include <stdexcept>

namespace cdgw::algorithms::builtin {

std::string to_string(PoleEnclosure enclosure) {
  switch (enclosure) {
    case PoleEnclosure::NotEnclosed:
      return "not_enclosed";
    case PoleEnclosure::EnclosedPositive:
      return "enclosed_positive";
    case PoleEnclosure::EnclosedNegative:
      return "enclosed_negative";
  }
  throw std::invalid_argument("Unknown PoleEnclosure");
}

PoleEnclosure classify_pole(bool occupied, double eps_q, double omega) {
  if (occupied) {
    return omega < eps_q ? PoleEnclosure::EnclosedNegative
                         : PoleEnclosure::NotEnclosed;
  }
  return eps_q < omega ? PoleEnclosure::EnclosedPositive
                       : PoleEnclosure::NotEnclosed;
}

int enclosure_sign(PoleEnclosure enclosure) {
  switch (enclosure) {
    case PoleEnclosure::EnclosedPositive:
      return 1;
    case PoleEnclosure::EnclosedNegative:
      return -1;
    case PoleEnclosure::NotEnclosed:
      return 0;
  }
  return 0;
}

bool pole_on_contour(double eps_q, double omega) {
  return std::abs(eps_q - omega) < contour_tie_tolerance;
}

std::complex<double> residue_term(
    const ScreenedInteraction& screened_interaction, std::size_t n,
    double omega) {
  const auto& orbitals = screened_interaction.orbitals();
  const auto& energies = orbitals.get_energies();

  std::complex<double> sum(0.0, 0.0);
  for (std::size_t q = 0; q < orbitals.get_num_molecular_orbitals(); ++q) {
    const double eps_q = energies(static_cast<Eigen::Index>(q));
    const bool occupied = orbitals.is_occupied(q);

    if (pole_on_contour(eps_q, omega)) {
      const double half_sign = occupied ? -0.5 : 0.5;
      sum += half_sign * screened_interaction.real_axis(q, n, 0.0);
      continue;
    }

    const int sign = enclosure_sign(classify_pole(occupied, eps_q, omega));
    if (sign == 0) {
      continue;
    }
    sum += static_cast<double>(sign) *
           screened_interaction.real_axis(q, n, std::abs(eps_q - omega));
  }
  return sum;
}

}  // namespace cdgw::algorithms::builtin
