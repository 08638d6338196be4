/* Copyright (c) 2003-2024 by Mike Jarvis
 *
 * GridPairs is free software: redistribution and use in source and binary forms,
 * with or without modification, are permitted provided that the following
 * conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice, this
 *    list of conditions, and the disclaimer given in the accompanying LICENSE
 *    file.
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions, and the disclaimer given in the documentation
 *    and/or other materials provided with the distribution.
 */

#ifndef GridPairs_CountPairs_H
#define GridPairs_CountPairs_H

#include <vector>

#include "BinType.h"

// Count the pairs between sample 1 and sample 2 (which may be the same sample, in which
// case each pair is counted twice and each point is paired with itself) and return the
// cumulative counts as a row-major nbins1 x nbins2 array:
//     result[k*nbins2 + g] = number of pairs with v1 <= bins1[k] and v2 <= bins2[g]
//
// With pbc = true, all points must lie in [0,xperiod] x [0,yperiod] x [0,zperiod], and the
// search lengths may not exceed a third of the period.  With pbc = false, the periods are
// ignored, and the samples are enclosed in a box large enough that nothing wraps.
//
// approx_cell1_size and approx_cell2_size set the approximate sizes of the cells in the
// two meshes.  Values <= 0 mean to use the search length along each axis.
// num_threads <= 0 means to use the current OpenMP setting.
std::vector<long long> CountPairs(
    BinType bin_type,
    const std::vector<double>& x1, const std::vector<double>& y1, const std::vector<double>& z1,
    const std::vector<double>& x2, const std::vector<double>& y2, const std::vector<double>& z2,
    const std::vector<double>& bins1, const std::vector<double>& bins2,
    double xperiod, double yperiod, double zperiod, bool pbc,
    double approx_cell1_size=0., double approx_cell2_size=0., int num_threads=0);

#endif
