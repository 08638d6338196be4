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

#ifndef GridPairs_PairCounts_H
#define GridPairs_PairCounts_H

#include <vector>

#include "BinType.h"
#include "Grid.h"

// PairCounts accumulates a raw (not cumulative) two-dimensional histogram of pair counts.
// The two separations (v1,v2) of each pair depend on the BinType.  Given ascending edges
// bins1 and bins2, the count at (k,g) is the number of pairs with
//     bins1[k-1] < v1 <= bins1[k]  and  bins2[g-1] < v2 <= bins2[g]
// where bins[-1] is taken to be -infinity.  Pairs with v1 > bins1[nbins1-1] or
// v2 > bins2[nbins2-1] are not counted.
//
// The counts are stored row-major, counts[k*nbins2 + g].
class PairCounts
{
public:

    // If counts is given, the results are accumulated there (usually a numpy array from the
    // Python layer).  Otherwise, PairCounts allocates and owns its own array.
    PairCounts(BinType bin_type, const double* bins1, int nbins1,
               const double* bins2, int nbins2, long long* counts=0);
    PairCounts(const PairCounts& rhs, bool copy_data=true);
    ~PairCounts();

    BinType getBinType() const { return _bin_type; }
    int getNBins1() const { return _nbins1; }
    int getNBins2() const { return _nbins2; }
    const std::vector<double>& getBins1() const { return _bins1; }
    const std::vector<double>& getBins2() const { return _bins2; }

    const long long* getCounts() const { return _counts; }
    long long getCount(int k, int g) const { return _counts[k*_nbins2 + g]; }
    long long getTotal() const;

    void clear();  // Set all counts to 0.

    // Write the cumulative counts into cum, which needs nbins1*nbins2 entries.
    // Only do this once all the work ranges have been added together.
    void getCumulative(long long* cum) const;

    // Count the pairs whose first point is in a primary cell in [first_cell, last_cell).
    template <int B>
    void processRange(const DoubleMesh& mesh, long first_cell, long last_cell);

    // The same thing, but with the cells split up among OpenMP threads.
    template <int B>
    void process(const DoubleMesh& mesh, long first_cell, long last_cell, bool dots);

    // Count all pairs directly, without any mesh.  With periodic boundary conditions, each
    // separation is wrapped to the nearest image, and all points must be inside the box.
    template <int B>
    void processBrute(const double* x1, const double* y1, const double* z1, long n1,
                      const double* x2, const double* y2, const double* z2, long n2,
                      const PeriodicBox& box, bool dots);

    // Note: op= only copies the counts.  Not the bins.
    void operator=(const PairCounts& rhs);
    void operator+=(const PairCounts& rhs);

protected:

    template <int B>
    void checkMesh(const DoubleMesh& mesh, long first_cell, long last_cell) const;

    template <int B>
    void doProcessRange(const DoubleMesh& mesh, long first_cell, long last_cell);

    template <int B>
    void directProcess(double dx, double dy, double dz)
    {
        double v1, v2;
        BinTypeHelper<B>::calculateCoords(dx, dy, dz, v1, v2);
        if (v1 > _max1 || v2 > _max2) return;
        const int k = FindBin(v1, &_bins1[0], _nbins1);
        const int g = FindBin(v2, &_bins2[0], _nbins2);
        XAssert(k+1 >= 0 && k+1 < _nbins1);
        XAssert(g+1 >= 0 && g+1 < _nbins2);
        ++_counts[(k+1)*_nbins2 + (g+1)];
    }

    BinType _bin_type;
    std::vector<double> _bins1;
    std::vector<double> _bins2;
    int _nbins1;
    int _nbins2;
    double _max1;
    double _max2;

    // The counts are usually allocated in the python layer and just built up here.
    // But for the OpenMP stuff, we create copies that we need to delete.
    // So keep track of whether we own the data and need to delete the memory ourselves.
    bool _owns_data;
    long long* _counts;
};

// The two-dimensional prefix sum of raw: cum[k,g] = sum of raw[0..k, 0..g].
void CumulateCounts(const long long* raw, long long* cum, int nbins1, int nbins2);

// Runtime dispatch to the templated versions above based on counts.getBinType().
void ProcessRange(PairCounts& counts, const DoubleMesh& mesh, long first_cell, long last_cell);
void Process(PairCounts& counts, const DoubleMesh& mesh, long first_cell, long last_cell,
             bool dots);
void ProcessBrute(PairCounts& counts,
                  const double* x1, const double* y1, const double* z1, long n1,
                  const double* x2, const double* y2, const double* z2, long n2,
                  const PeriodicBox& box, bool dots);

int SetOMPThreads(int num_threads);
int GetOMPThreads();

#endif
