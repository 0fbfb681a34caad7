// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <utility>

namespace cdgw::utils {

/**
 * @brief Gauss-Legendre quadrature rule on [-1, 1]
 *
 * Nodes and weights are obtained with the Golub-Welsch method: the nodes
 * are the eigenvalues of the symmetric tridiagonal Jacobi matrix of the
 * Legendre recurrence and each weight is twice the squared first component
 * of the corresponding normalized eigenvector.
 *
 * @param order Number of quadrature points, must be at least 1
 * @return Pair of (nodes, weights), nodes in strictly increasing order
 * @throws std::invalid_argument if order is zero
 */
std::pair<Eigen::VectorXd, Eigen::VectorXd> gauss_legendre(std::size_t order);

}  // namespace cdgw::utils
