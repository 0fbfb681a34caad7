// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cdgw/data/frequency_grid.hpp>
#include <cdgw/data/orbitals.hpp>
#include <complex>

namespace cdgw::algorithms::builtin {

/**
 * @brief Imaginary-axis contribution to Sigma_c(omega) of one target orbital
 *
 *   I(omega) = -1/pi sum_m sum_k w_k [W_c(mn, i omega_k) - s_m]
 *              * z_m / (z_m^2 + omega_k^2)
 *              - sum_m s_m / 2 * sign(omega - eps_m)
 *
 * with z_m = omega - eps_m - i eta sgn_m, sgn_m = -1 for occupied and +1 for
 * virtual m, and s_m = W_c(mn, 0) on the real axis. The constant s_m is
 * integrated exactly, so the step of -s_m at omega = eps_m cancels the
 * residue that switches on or off there, and Sigma_c stays continuous through
 * every pole. A pole on the contour has sign 0.
 *
 * @param orbitals Reference orbitals
 * @param w_block W_c(mn, i omega_k) of the target n, n_mo x N
 * @param w_static W_c(mn, 0) of the target n on the real axis, n_mo values
 * @param grid Frequency grid that @p w_block was sampled on
 * @param omega Real sampling frequency (Ha)
 * @param eta Broadening (Ha)
 * @throws data::InconsistentInputShapes if the block or the static column do
 * not match the orbitals and the grid
 */
std::complex<double> integral_term(const data::Orbitals& orbitals,
                                   const Eigen::MatrixXd& w_block,
                                   const Eigen::VectorXcd& w_static,
                                   const data::FrequencyGrid& grid,
                                   double omega, double eta);

}  // namespace cdgw::algorithms::builtin
