// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <numbers>

// Define CODATA version constants
#define CDGW_CODATA_2022 2022
#define CDGW_CODATA_2018 2018

// Set default CODATA version if not specified
#ifndef CDGW_CODATA_VERSION
#define CDGW_CODATA_VERSION CDGW_CODATA_2022
#endif

/**
 * @file constants.hpp
 * @brief Physical constants and unit conversions used by CDGW
 *
 * All quantities inside the library are kept in Hartree atomic units. The
 * conversions below are only used when results are rendered for humans.
 *
 * The default namespace (cdgw::constants) uses the most recent CODATA
 * version. Define CDGW_CODATA_VERSION to select the 2018 values instead.
 */

namespace cdgw::constants {

/**
 * @namespace cdgw::constants::codata_2022
 * @brief CODATA 2022 recommended values
 */
namespace codata_2022 {
static constexpr double hartree_to_ev =
    27.211386245981;  // 1 Hartree in electron volts
static constexpr double ev_to_hartree = 1.0 / hartree_to_ev;
}  // namespace codata_2022

/**
 * @namespace cdgw::constants::codata_2018
 * @brief CODATA 2018 recommended values
 */
namespace codata_2018 {
static constexpr double hartree_to_ev =
    27.211386245988;  // 1 Hartree in electron volts
static constexpr double ev_to_hartree = 1.0 / hartree_to_ev;
}  // namespace codata_2018

#if CDGW_CODATA_VERSION == CDGW_CODATA_2022
using namespace codata_2022;
#elif CDGW_CODATA_VERSION == CDGW_CODATA_2018
using namespace codata_2018;
#else
#error "Unsupported CDGW_CODATA_VERSION"
#endif

/// Closed-shell occupation of a doubly occupied spatial orbital
static constexpr double closed_shell_occupation = 2.0;

static constexpr double pi = std::numbers::pi;

}  // namespace cdgw::constants
