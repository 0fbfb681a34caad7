// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cdgw/config.hpp>
#include <cdgw/utils/omp_utils.hpp>

#ifndef CDGW_ENABLE_OPENMP

extern "C" {

int omp_get_max_threads() { return 1; }
}

#endif
