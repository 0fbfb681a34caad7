// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cdgw/algorithms/gw.hpp>
#include <cdgw/algorithms/quasiparticle.hpp>
#include <cdgw/constants.hpp>
#include <cdgw/data/errors.hpp>
#include <cdgw/data/frequency_grid.hpp>
#include <cdgw/data/orbitals.hpp>
#include <cdgw/data/quasiparticle_spectrum.hpp>
#include <cdgw/data/self_energy.hpp>
#include <cdgw/data/settings.hpp>
#include <cdgw/data/three_center_integrals.hpp>
#include <cdgw/utils/logger.hpp>
