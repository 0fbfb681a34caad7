// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <Eigen/Eigenvalues>
#include <cdgw/utils/logger.hpp>
#include <cdgw/utils/quadrature.hpp>
#include <cmath>
#include <stdexcept>

namespace cdgw::utils {

std::pair<Eigen::VectorXd, Eigen::VectorXd> gauss_legendre(std::size_t order) {
  CDGW_LOG_TRACE_ENTERING();
  if (order == 0) {
    throw std::invalid_argument(
        "Gauss-Legendre quadrature requires at least one point");
  }

  const Eigen::Index n = static_cast<Eigen::Index>(order);
  Eigen::MatrixXd jacobi = Eigen::MatrixXd::Zero(n, n);
  for (Eigen::Index k = 1; k < n; ++k) {
    const double kk = static_cast<double>(k);
    const double beta = kk / std::sqrt(4.0 * kk * kk - 1.0);
    jacobi(k, k - 1) = beta;
    jacobi(k - 1, k) = beta;
  }

  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(jacobi);
  if (solver.info() != Eigen::Success) {
    throw std::runtime_error(
        "Eigen decomposition of the Legendre Jacobi matrix failed");
  }

  Eigen::VectorXd nodes = solver.eigenvalues();
  Eigen::VectorXd weights =
      2.0 * solver.eigenvectors().row(0).transpose().array().square();
  return {nodes, weights};
}

}  // namespace cdgw::utils
