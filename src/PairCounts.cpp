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

// Uncomment this to enable xassert, usually more time-consuming assert statements
// Also to turn on dbg<< messages.
//#define DEBUGLOGGING

#include <cmath>
#include <algorithm>

#include "dbg.h"
#include "PairCounts.h"

#ifdef _OPENMP
#include "omp.h"
#endif

static void CheckBins(const double* bins, int nbins, const char* name)
{
    Require(nbins >= 1, name<<" must have at least one edge");
    Require(bins, "Missing "<<name);
    for (int i=1; i<nbins; ++i) {
        Require(bins[i] > bins[i-1],
                name<<" must be strictly ascending, but "<<name<<"["<<i<<"] = "<<bins[i]<<
                " <= "<<bins[i-1]);
    }
}

PairCounts::PairCounts(BinType bin_type, const double* bins1, int nbins1,
                       const double* bins2, int nbins2, long long* counts) :
    _bin_type(bin_type), _nbins1(nbins1), _nbins2(nbins2),
    _owns_data(counts == 0), _counts(counts)
{
    dbg<<"PairCounts constructor: bin_type = "<<bin_type<<std::endl;
    CheckBins(bins1, nbins1, "bins1");
    CheckBins(bins2, nbins2, "bins2");
    switch(bin_type) {
      case SMu:
           BinTypeHelper<SMu>::checkBins2(bins2, nbins2);
           break;
      case RpPi:
           BinTypeHelper<RpPi>::checkBins2(bins2, nbins2);
           break;
      case Radial:
           BinTypeHelper<Radial>::checkBins2(bins2, nbins2);
           break;
      default:
           Require(false, "Invalid bin_type "<<bin_type);
    }

    _bins1.assign(bins1, bins1+nbins1);
    _bins2.assign(bins2, bins2+nbins2);
    _max1 = *std::max_element(_bins1.begin(), _bins1.end());
    _max2 = *std::max_element(_bins2.begin(), _bins2.end());
    dbg<<"nbins = "<<_nbins1<<" x "<<_nbins2<<std::endl;
    dbg<<"max1, max2 = "<<_max1<<"  "<<_max2<<std::endl;

    if (_owns_data) {
        _counts = new long long[long(_nbins1)*_nbins2];
        clear();
    }
}

PairCounts::PairCounts(const PairCounts& rhs, bool copy_data) :
    _bin_type(rhs._bin_type), _bins1(rhs._bins1), _bins2(rhs._bins2),
    _nbins1(rhs._nbins1), _nbins2(rhs._nbins2), _max1(rhs._max1), _max2(rhs._max2),
    _owns_data(true), _counts(0)
{
    xdbg<<"PairCounts copy constructor\n";
    _counts = new long long[long(_nbins1)*_nbins2];
    if (copy_data) *this = rhs;
    else clear();
}

PairCounts::~PairCounts()
{
    xdbg<<"PairCounts destructor\n";
    if (_owns_data) {
        delete [] _counts; _counts = 0;
    }
}

void PairCounts::clear()
{
    const long n = long(_nbins1)*_nbins2;
    for (long i=0; i<n; ++i) _counts[i] = 0;
}

long long PairCounts::getTotal() const
{
    const long n = long(_nbins1)*_nbins2;
    long long total = 0;
    for (long i=0; i<n; ++i) total += _counts[i];
    return total;
}

void PairCounts::operator=(const PairCounts& rhs)
{
    Assert(rhs._nbins1 == _nbins1 && rhs._nbins2 == _nbins2);
    const long n = long(_nbins1)*_nbins2;
    for (long i=0; i<n; ++i) _counts[i] = rhs._counts[i];
}

void PairCounts::operator+=(const PairCounts& rhs)
{
    Assert(rhs._nbins1 == _nbins1 && rhs._nbins2 == _nbins2);
    const long n = long(_nbins1)*_nbins2;
    for (long i=0; i<n; ++i) _counts[i] += rhs._counts[i];
}

void PairCounts::getCumulative(long long* cum) const
{ CumulateCounts(_counts, cum, _nbins1, _nbins2); }

// This works in place too, with cum == raw, since each raw value is read before the
// same location is written, and only cumulative values from the previous row are used.
void CumulateCounts(const long long* raw, long long* cum, int nbins1, int nbins2)
{
    for (int k=0; k<nbins1; ++k) {
        long long rowsum = 0;
        for (int g=0; g<nbins2; ++g) {
            rowsum += raw[k*nbins2 + g];
            cum[k*nbins2 + g] = rowsum + (k > 0 ? cum[(k-1)*nbins2 + g] : 0);
        }
    }
}

template <int B>
void PairCounts::checkMesh(const DoubleMesh& mesh, long first_cell, long last_cell) const
{
    const long ncells1 = mesh.getMesh1().getNCells();
    Require(first_cell >= 0 && first_cell <= last_cell && last_cell <= ncells1,
            "Invalid cell range ["<<first_cell<<", "<<last_cell<<") for a mesh with "<<
            ncells1<<" cells");

    // If the mesh doesn't search far enough, we would silently miss pairs.
    double xs, ys, zs;
    BinTypeHelper<B>::getSearchLengths(_max1, _max2, xs, ys, zs);
    Require(mesh.getXSearch() >= xs && mesh.getYSearch() >= ys && mesh.getZSearch() >= zs,
            "Mesh search lengths ("<<mesh.getXSearch()<<", "<<mesh.getYSearch()<<", "<<
            mesh.getZSearch()<<") are too small for "<<BinTypeHelper<B>::name()<<
            " bins, which need ("<<xs<<", "<<ys<<", "<<zs<<")");
}

template <int B>
void PairCounts::processRange(const DoubleMesh& mesh, long first_cell, long last_cell)
{
    dbg<<"Start processRange: bin_type = "<<BinTypeHelper<B>::name()<<
        ", cells = ["<<first_cell<<", "<<last_cell<<")\n";
    checkMesh<B>(mesh, first_cell, last_cell);
    doProcessRange<B>(mesh, first_cell, last_cell);
}

template <int B>
void PairCounts::doProcessRange(const DoubleMesh& mesh, long first_cell, long last_cell)
{
    const GriddedSample& mesh1 = mesh.getMesh1();
    const GriddedSample& mesh2 = mesh.getMesh2();
    const GridGeometry& geom1 = mesh1.getGeometry();
    const GridGeometry& geom2 = mesh2.getGeometry();
    const PeriodicBox& box = mesh.getBox();

    const double* x1 = mesh1.getX();
    const double* y1 = mesh1.getY();
    const double* z1 = mesh1.getZ();
    const double* x2 = mesh2.getX();
    const double* y2 = mesh2.getY();
    const double* z2 = mesh2.getZ();

    const int nx2 = geom2.getNXDivs();
    const int ny2 = geom2.getNYDivs();
    const int nz2 = geom2.getNZDivs();
    const int xratio = mesh.getXRatio();
    const int yratio = mesh.getYRatio();
    const int zratio = mesh.getZRatio();
    const int nxcover = mesh.getNXCovering();
    const int nycover = mesh.getNYCovering();
    const int nzcover = mesh.getNZCovering();

    // These are 0 when the box isn't periodic, so wrapped cells are compared in place.
    const double xperiod = box.getXShift();
    const double yperiod = box.getYShift();
    const double zperiod = box.getZShift();

    for (long icell1=first_cell; icell1<last_cell; ++icell1) {
        const long ifirst1 = mesh1.getCellStart(icell1);
        const long ilast1 = mesh1.getCellEnd(icell1);
        if (ifirst1 == ilast1) continue;

        int ix1, iy1, iz1;
        geom1.cellTuple(icell1, ix1, iy1, iz1);
        xxdbg<<"cell1 "<<icell1<<" = ("<<ix1<<","<<iy1<<","<<iz1<<") has "<<
            ilast1-ifirst1<<" points\n";

        // The range of secondary cells to search, before wrapping around the box.
        const int leftmost_ix2 = ix1*xratio - nxcover;
        const int rightmost_ix2 = (ix1+1)*xratio + nxcover;
        const int leftmost_iy2 = iy1*yratio - nycover;
        const int rightmost_iy2 = (iy1+1)*yratio + nycover;
        const int leftmost_iz2 = iz1*zratio - nzcover;
        const int rightmost_iz2 = (iz1+1)*zratio + nzcover;

        for (int nonwrapped_ix2=leftmost_ix2; nonwrapped_ix2<rightmost_ix2; ++nonwrapped_ix2) {
            double xshift;
            const int ix2 = WrapCellIndex(nonwrapped_ix2, nx2, xperiod, xshift);

            for (int nonwrapped_iy2=leftmost_iy2; nonwrapped_iy2<rightmost_iy2; ++nonwrapped_iy2) {
                double yshift;
                const int iy2 = WrapCellIndex(nonwrapped_iy2, ny2, yperiod, yshift);

                for (int nonwrapped_iz2=leftmost_iz2; nonwrapped_iz2<rightmost_iz2;
                     ++nonwrapped_iz2) {
                    double zshift;
                    const int iz2 = WrapCellIndex(nonwrapped_iz2, nz2, zperiod, zshift);

                    const long icell2 = geom2.cellId(ix2, iy2, iz2);
                    const long ifirst2 = mesh2.getCellStart(icell2);
                    const long ilast2 = mesh2.getCellEnd(icell2);
                    if (ifirst2 == ilast2) continue;

                    for (long i=ifirst1; i<ilast1; ++i) {
                        // Move the primary point by the opposite of the image shift, rather
                        // than moving every secondary point.
                        const double x1i = x1[i] - xshift;
                        const double y1i = y1[i] - yshift;
                        const double z1i = z1[i] - zshift;
                        for (long j=ifirst2; j<ilast2; ++j) {
                            directProcess<B>(x1i - x2[j], y1i - y2[j], z1i - z2[j]);
                        }
                    }
                }
            }
        }
    }
}

template <int B>
void PairCounts::process(const DoubleMesh& mesh, long first_cell, long last_cell, bool dots)
{
    dbg<<"Start process: bin_type = "<<BinTypeHelper<B>::name()<<
        ", cells = ["<<first_cell<<", "<<last_cell<<")\n";
    checkMesh<B>(mesh, first_cell, last_cell);

    // Let the progress dots happen every sqrt(n) cells.
    const long sqrtn = std::max(1L, long(std::sqrt(double(last_cell - first_cell))));

#ifdef _OPENMP
#pragma omp parallel
    {
        // Give each thread their own copy of the counts to fill in.
        PairCounts pc(*this, false);
#else
        PairCounts& pc = *this;
#endif

#ifdef _OPENMP
#pragma omp for schedule(dynamic)
#endif
        for (long icell1=first_cell; icell1<last_cell; ++icell1) {
            if (dots && ((icell1 - first_cell) % sqrtn == 0)) {
#ifdef _OPENMP
#pragma omp critical
#endif
                {
#ifdef _OPENMP
                    xdbg<<omp_get_thread_num()<<" "<<icell1<<std::endl;
#endif
                    std::cout<<'.'<<std::flush;
                }
            }
            pc.doProcessRange<B>(mesh, icell1, icell1+1);
        }
#ifdef _OPENMP
        // Accumulate the results
#pragma omp critical
        {
            *this += pc;
        }
    }
#endif
    if (dots) std::cout<<std::endl;
}

// The separation along one axis to the nearest periodic image.  Points are inside the box,
// so at most one period is needed.  As in doProcessRange, the first point is the one moved.
static double WrapSep(double x1, double x2, double period)
{
    const double d = x1 - x2;
    if (d > period/2.) return (x1 - period) - x2;
    else if (d < -period/2.) return (x1 + period) - x2;
    else return d;
}

static void CheckInBox(const double* x, const double* y, const double* z, long n,
                       const PeriodicBox& box, const char* name)
{
    for (long i=0; i<n; ++i) {
        Require(x[i] >= 0. && x[i] <= box.xp &&
                y[i] >= 0. && y[i] <= box.yp &&
                z[i] >= 0. && z[i] <= box.zp,
                name<<" point "<<i<<" = ("<<x[i]<<", "<<y[i]<<", "<<z[i]<<
                ") is outside the periodic box ("<<box.xp<<", "<<box.yp<<", "<<box.zp<<")");
    }
}

template <int B>
void PairCounts::processBrute(const double* x1, const double* y1, const double* z1, long n1,
                              const double* x2, const double* y2, const double* z2, long n2,
                              const PeriodicBox& box, bool dots)
{
    dbg<<"Start processBrute: bin_type = "<<BinTypeHelper<B>::name()<<
        ", n1 = "<<n1<<", n2 = "<<n2<<", pbc = "<<box.pbc<<std::endl;
    Require(n1 >= 0 && n2 >= 0, "Number of points must be non-negative");
    Require((n1 == 0 || (x1 && y1 && z1)) && (n2 == 0 || (x2 && y2 && z2)),
            "Missing coordinate arrays");
    if (box.pbc) {
        CheckInBox(x1, y1, z1, n1, box, "Sample 1");
        CheckInBox(x2, y2, z2, n2, box, "Sample 2");
    }

    const long sqrtn = std::max(1L, long(std::sqrt(double(n1))));

#ifdef _OPENMP
#pragma omp parallel
    {
        PairCounts pc(*this, false);
#else
        PairCounts& pc = *this;
#endif

#ifdef _OPENMP
#pragma omp for schedule(static)
#endif
        for (long i=0; i<n1; ++i) {
            if (dots && (i % sqrtn == 0)) {
#ifdef _OPENMP
#pragma omp critical
#endif
                {
                    std::cout<<'.'<<std::flush;
                }
            }
            for (long j=0; j<n2; ++j) {
                if (box.pbc) {
                    pc.directProcess<B>(WrapSep(x1[i], x2[j], box.xp),
                                        WrapSep(y1[i], y2[j], box.yp),
                                        WrapSep(z1[i], z2[j], box.zp));
                } else {
                    pc.directProcess<B>(x1[i] - x2[j], y1[i] - y2[j], z1[i] - z2[j]);
                }
            }
        }
#ifdef _OPENMP
#pragma omp critical
        {
            *this += pc;
        }
    }
#endif
    if (dots) std::cout<<std::endl;
}

void ProcessRange(PairCounts& counts, const DoubleMesh& mesh, long first_cell, long last_cell)
{
    switch(counts.getBinType()) {
      case SMu:
           counts.processRange<SMu>(mesh, first_cell, last_cell);
           break;
      case RpPi:
           counts.processRange<RpPi>(mesh, first_cell, last_cell);
           break;
      case Radial:
           counts.processRange<Radial>(mesh, first_cell, last_cell);
           break;
      default:
           Assert(false);
    }
}

void Process(PairCounts& counts, const DoubleMesh& mesh, long first_cell, long last_cell,
             bool dots)
{
    switch(counts.getBinType()) {
      case SMu:
           counts.process<SMu>(mesh, first_cell, last_cell, dots);
           break;
      case RpPi:
           counts.process<RpPi>(mesh, first_cell, last_cell, dots);
           break;
      case Radial:
           counts.process<Radial>(mesh, first_cell, last_cell, dots);
           break;
      default:
           Assert(false);
    }
}

void ProcessBrute(PairCounts& counts,
                  const double* x1, const double* y1, const double* z1, long n1,
                  const double* x2, const double* y2, const double* z2, long n2,
                  const PeriodicBox& box, bool dots)
{
    switch(counts.getBinType()) {
      case SMu:
           counts.processBrute<SMu>(x1, y1, z1, n1, x2, y2, z2, n2, box, dots);
           break;
      case RpPi:
           counts.processBrute<RpPi>(x1, y1, z1, n1, x2, y2, z2, n2, box, dots);
           break;
      case Radial:
           counts.processBrute<Radial>(x1, y1, z1, n1, x2, y2, z2, n2, box, dots);
           break;
      default:
           Assert(false);
    }
}

int SetOMPThreads(int num_threads)
{
#ifdef _OPENMP
    omp_set_num_threads(num_threads);
    return omp_get_max_threads();
#else
    return 1;
#endif
}

int GetOMPThreads()
{
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}
