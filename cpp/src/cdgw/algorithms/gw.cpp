// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "builtin/contour_deformation_gw.hpp"

#include <cdgw/algorithms/gw.hpp>
#include <cdgw/config.hpp>

namespace cdgw::algorithms {

std::unique_ptr<GWCalculator> make_contour_deformation_gw() {
  return std::make_unique<cdgw::algorithms::builtin::ContourDeformationGW>();
}

void GWCalculatorFactory::register_default_instances() {
  GWCalculatorFactory::register_instance(&make_contour_deformation_gw);
}

}  // namespace cdgw::algorithms
