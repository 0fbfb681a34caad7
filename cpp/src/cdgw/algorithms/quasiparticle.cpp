// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "builtin/graphical_quasiparticle_solver.hpp"

#include <cdgw/algorithms/quasiparticle.hpp>
#include <cdgw/config.hpp>

namespace cdgw::algorithms {

std::unique_ptr<QuasiparticleSolver> make_graphical_quasiparticle_solver() {
  return std::make_unique<
      cdgw::algorithms::builtin::GraphicalQuasiparticleSolver>();
}

void QuasiparticleSolverFactory::register_default_instances() {
  QuasiparticleSolverFactory::register_instance(
      &make_graphical_quasiparticle_solver);
}

}  // namespace cdgw::algorithms
