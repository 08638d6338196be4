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

//#define DEBUGLOGGING

#include <algorithm>

#include "dbg.h"
#include "CountPairs.h"
#include "Mesh.h"
#include "PairCounts.h"

static double ChooseCellSize(double approx_cell_size, double search, double period)
{
    if (approx_cell_size > 0.) return approx_cell_size;
    else if (search > 0.) return search;
    else return period / 3.;
}

std::vector<long long> CountPairs(
    BinType bin_type,
    const std::vector<double>& x1, const std::vector<double>& y1, const std::vector<double>& z1,
    const std::vector<double>& x2, const std::vector<double>& y2, const std::vector<double>& z2,
    const std::vector<double>& bins1, const std::vector<double>& bins2,
    double xperiod, double yperiod, double zperiod, bool pbc,
    double approx_cell1_size, double approx_cell2_size, int num_threads)
{
    dbg<<"Start CountPairs: n1 = "<<x1.size()<<", n2 = "<<x2.size()<<", pbc = "<<pbc<<std::endl;
    Require(x1.size() == y1.size() && x1.size() == z1.size(),
            "Sample 1 coordinate arrays must have the same length");
    Require(x2.size() == y2.size() && x2.size() == z2.size(),
            "Sample 2 coordinate arrays must have the same length");
    Require(!bins1.empty() && !bins2.empty(), "Bin edges must not be empty");

    PairCounts counts(bin_type, &bins1[0], int(bins1.size()), &bins2[0], int(bins2.size()));

    const double max1 = *std::max_element(bins1.begin(), bins1.end());
    const double max2 = *std::max_element(bins2.begin(), bins2.end());
    double xs, ys, zs;
    GetSearchLengths(bin_type, max1, max2, xs, ys, zs);

    // The mesh needs all coordinates to be in the box, so non-periodic samples are moved
    // into one.  Periodic samples are used as they are.
    std::vector<double> sx1, sy1, sz1, sx2, sy2, sz2;
    const std::vector<double>* px1 = &x1;
    const std::vector<double>* py1 = &y1;
    const std::vector<double>* pz1 = &z1;
    const std::vector<double>* px2 = &x2;
    const std::vector<double>* py2 = &y2;
    const std::vector<double>* pz2 = &z2;
    if (!pbc) {
        sx1 = x1; sy1 = y1; sz1 = z1;
        sx2 = x2; sy2 = y2; sz2 = z2;
        const double min_size = 3. * std::max(xs, std::max(ys, zs));
        xperiod = yperiod = zperiod = EncloseInBox(sx1, sy1, sz1, sx2, sy2, sz2, min_size);
        px1 = &sx1; py1 = &sy1; pz1 = &sz1;
        px2 = &sx2; py2 = &sy2; pz2 = &sz2;
    }

    const double* nil = 0;
    RectangularDoubleMesh mesh(
        px1->empty() ? nil : &(*px1)[0], py1->empty() ? nil : &(*py1)[0],
        pz1->empty() ? nil : &(*pz1)[0], long(px1->size()),
        px2->empty() ? nil : &(*px2)[0], py2->empty() ? nil : &(*py2)[0],
        pz2->empty() ? nil : &(*pz2)[0], long(px2->size()),
        ChooseCellSize(approx_cell1_size, xs, xperiod),
        ChooseCellSize(approx_cell1_size, ys, yperiod),
        ChooseCellSize(approx_cell1_size, zs, zperiod),
        ChooseCellSize(approx_cell2_size, xs, xperiod),
        ChooseCellSize(approx_cell2_size, ys, yperiod),
        ChooseCellSize(approx_cell2_size, zs, zperiod),
        xs, ys, zs, xperiod, yperiod, zperiod, pbc);

    // Use the requested number of threads for this call only.
    const int old_num_threads = GetOMPThreads();
    if (num_threads > 0) SetOMPThreads(num_threads);
    Process(counts, mesh.getDoubleMesh(), 0, mesh.getNCells1(), false);
    if (num_threads > 0) SetOMPThreads(old_num_threads);

    std::vector<long long> cum(bins1.size() * bins2.size());
    counts.getCumulative(&cum[0]);
    dbg<<"Done CountPairs: total = "<<counts.getTotal()<<std::endl;
    return cum;
}
