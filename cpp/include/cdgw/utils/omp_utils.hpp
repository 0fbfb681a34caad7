// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cdgw/config.hpp>
#include <cstdint>

#ifdef CDGW_ENABLE_OPENMP
#include <omp.h>
#else

extern "C" {

/**
 * @brief Serial stand-in for `omp_get_max_threads` when CDGW is built without
 * OpenMP
 *
 * @returns 1
 */
int omp_get_max_threads();
}

#endif  // CDGW_ENABLE_OPENMP

namespace cdgw::utils {

/**
 * @brief Resolve the size of the thread team for a parallel region
 *
 * @param requested Requested number of threads, 0 or negative selects the
 * OpenMP runtime default
 * @return Number of threads to use, at least 1
 */
inline int resolve_num_threads(int64_t requested) {
  if (requested > 0) {
    return static_cast<int>(requested);
  }
  const int available = omp_get_max_threads();
  return available > 0 ? available : 1;
}

}  // namespace cdgw::utils
