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

#ifndef GridPairs_BinType_H
#define GridPairs_BinType_H

#include <cmath>
#include "dbg.h"

// We use a code for the pair of separations used for the two axes of the histogram:
// SMu is the 3-d separation s and mu = |dz|/s, the cosine of the angle to the line of sight.
// RpPi is the separation rp perpendicular to the line of sight and pi = |dz| along it.
// Radial is s alone.  The second axis is degenerate, with a single edge at 0.
//
// In all cases, the line of sight is taken to be the z axis.

enum BinType { SMu, RpPi, Radial };

// Find the bin for a value v given ascending edges.  The return value is the largest k such
// that v > bins[k] (considering only k <= nbins-2), or -1 if v <= bins[0].
// The count for v then belongs in index k+1, so a value exactly equal to an edge is
// counted with the bin below that edge.
inline int FindBin(double v, const double* bins, int nbins)
{
    int k = nbins-2;
    while (k >= 0 && !(v > bins[k])) --k;
    return k;
}

template <int B>
struct BinTypeHelper;

template <>
struct BinTypeHelper<SMu>
{
    static const char* name() { return "SMu"; }

    // How far along each axis we need to look to find all pairs with v1 <= max1, v2 <= max2.
    static void getSearchLengths(double max1, double , double& xs, double& ys, double& zs)
    { xs = ys = zs = max1; }

    static void checkBins2(const double* bins2, int nbins2)
    { Require(bins2[0] >= 0., "mu_bins must be non-negative, got "<<bins2[0]); }

    static void calculateCoords(double dx, double dy, double dz, double& s, double& mu)
    {
        const double perpsq = dx*dx + dy*dy;
        const double lossq = dz*dz;
        s = std::sqrt(lossq + perpsq);
        // Coincident points have no direction.  Call it mu = 0.
        mu = s != 0. ? std::sqrt(lossq) / s : 0.;
    }
};

template <>
struct BinTypeHelper<RpPi>
{
    static const char* name() { return "RpPi"; }

    static void getSearchLengths(double max1, double max2, double& xs, double& ys, double& zs)
    { xs = ys = max1; zs = max2; }

    static void checkBins2(const double* bins2, int nbins2)
    { Require(bins2[0] >= 0., "pi_bins must be non-negative, got "<<bins2[0]); }

    static void calculateCoords(double dx, double dy, double dz, double& rp, double& pi)
    {
        rp = std::sqrt(dx*dx + dy*dy);
        pi = std::abs(dz);
    }
};

template <>
struct BinTypeHelper<Radial>
{
    static const char* name() { return "Radial"; }

    static void getSearchLengths(double max1, double , double& xs, double& ys, double& zs)
    { xs = ys = zs = max1; }

    static void checkBins2(const double* bins2, int nbins2)
    {
        Require(nbins2 == 1 && bins2[0] == 0.,
                "Radial binning takes a single second bin edge at 0");
    }

    static void calculateCoords(double dx, double dy, double dz, double& s, double& zero)
    {
        s = std::sqrt(dz*dz + (dx*dx + dy*dy));
        zero = 0.;
    }
};

// Runtime dispatch of BinTypeHelper<B>::getSearchLengths.
inline void GetSearchLengths(BinType bin_type, double max1, double max2,
                             double& xs, double& ys, double& zs)
{
    switch(bin_type) {
      case SMu:
           BinTypeHelper<SMu>::getSearchLengths(max1, max2, xs, ys, zs);
           break;
      case RpPi:
           BinTypeHelper<RpPi>::getSearchLengths(max1, max2, xs, ys, zs);
           break;
      case Radial:
           BinTypeHelper<Radial>::getSearchLengths(max1, max2, xs, ys, zs);
           break;
      default:
           Require(false, "Invalid bin_type "<<bin_type);
    }
}

#endif
