// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <complex>
#include <cstddef>
#include <string>

#include "screened_interaction.hpp"

namespace cdgw::algorithms::builtin {

/**
 * @brief Position of a Green's function pole relative to the deformed contour
 */
enum class PoleEnclosure {
  /// Pole outside the contour, no residue
  NotEnclosed,
  /// Virtual pole inside the counter-clockwise loop, residue enters with +1
  EnclosedPositive,
  /// Occupied pole inside the clockwise loop, residue enters with -1
  EnclosedNegative
};

std::string to_string(PoleEnclosure enclosure);

/// Poles closer than this to the sampling frequency lie on the contour (Ha)
inline constexpr double contour_tie_tolerance = 1e-10;

/**
 * @brief Classify the pole of orbital q for a sampling frequency omega
 *
 * An occupied pole is enclosed when omega < eps_q, a virtual pole when
 * eps_q < omega. Both comparisons are strict, so a pole exactly at omega is
 * never enclosed.
 *
 * @param occupied Whether orbital q is occupied
 * @param eps_q Orbital energy of q
 * @param omega Real sampling frequency
 */
PoleEnclosure classify_pole(bool occupied, double eps_q, double omega);

/**
 * @brief Sign with which an enclosed residue enters the self-energy
 *
 * @return +1, -1, or 0 for NotEnclosed
 */
int enclosure_sign(PoleEnclosure enclosure);

/**
 * @brief Whether the pole at eps_q lies on the contour for omega
 */
bool pole_on_contour(double eps_q, double omega);

/**
 * @brief Residue contribution to Sigma_c(omega) of target orbital n
 *
 * Sums sign * W_c(qn, |eps_q - omega|) over the enclosed poles q, with W_c
 * evaluated on the real axis. A pole on the contour contributes half its
 * residue, 0.5 * sign_q * W_c(qn, 0), where sign_q is -1 for occupied and +1
 * for virtual orbitals.
 *
 * @param screened_interaction Screened interaction of the system
 * @param n Target orbital
 * @param omega Real sampling frequency (Ha)
 */
std::complex<double> residue_term(
    const ScreenedInteraction& screened_interaction, std::size_t n,
    double omega);

}  // namespace cdgw::algorithms::builtin
