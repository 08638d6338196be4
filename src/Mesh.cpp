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

#include <cmath>
#include <algorithm>
#include <limits>

#include "Mesh.h"
#include "dbg.h"

double CalculateSample1CellSize(double period, double search_length, double approx_cell_size,
                                int max_cells_per_dim)
{
    Require(period > 0., "period must be positive, got "<<period);
    Require(approx_cell_size > 0., "approx_cell_size must be positive, got "<<approx_cell_size);
    Require(max_cells_per_dim >= 1,
            "max_cells_per_dim must be at least 1, got "<<max_cells_per_dim);
    Require(search_length >= 0. && search_length <= period/3.,
            "search_length = "<<search_length<<" must be between 0 and period/3 = "<<
            period/3.);

    // Work in double until we know the number is small enough to fit in an int.
    double ndivs = std::floor(period / approx_cell_size);
    ndivs = std::min(ndivs, double(max_cells_per_dim));
    if (search_length > 0.) ndivs = std::min(ndivs, std::floor(period / search_length));
    ndivs = std::max(ndivs, 3.);
    xdbg<<"Sample1 cell size: period = "<<period<<", search = "<<search_length<<
        ", ndivs = "<<ndivs<<std::endl;
    return period / ndivs;
}

double CalculateSample2CellSize(double period, double cell1_size, double approx_cell_size,
                                int max_cells_per_dim)
{
    Require(period > 0., "period must be positive, got "<<period);
    Require(cell1_size > 0. && cell1_size <= period,
            "cell1_size must be in (0, period], got "<<cell1_size);
    Require(approx_cell_size > 0., "approx_cell_size must be positive, got "<<approx_cell_size);
    Require(max_cells_per_dim >= 1,
            "max_cells_per_dim must be at least 1, got "<<max_cells_per_dim);

    const int ndivs1 = int(std::floor(period / cell1_size + 0.5));
    double ratio = std::floor(cell1_size / approx_cell_size + 0.5);
    ratio = std::max(1., std::min(ratio, double(max_cells_per_dim)));
    int ndivs2 = ndivs1 * int(ratio);
    if (ndivs2 > max_cells_per_dim) {
        // Keep the refinement an integer multiple of the primary grid.
        ndivs2 = ndivs1 * std::max(1, max_cells_per_dim / ndivs1);
    }
    xdbg<<"Sample2 cell size: ndivs1 = "<<ndivs1<<", ndivs2 = "<<ndivs2<<std::endl;
    return period / ndivs2;
}

static void UpdateRange(const std::vector<double>& v, double& lo, double& hi)
{
    for (size_t i=0; i<v.size(); ++i) {
        if (v[i] < lo) lo = v[i];
        if (v[i] > hi) hi = v[i];
    }
}

static void ShiftAll(std::vector<double>& v, double shift)
{
    for (size_t i=0; i<v.size(); ++i) v[i] -= shift;
}

double EncloseInBox(std::vector<double>& x1, std::vector<double>& y1, std::vector<double>& z1,
                    std::vector<double>& x2, std::vector<double>& y2, std::vector<double>& z2,
                    double min_size)
{
    Require(x1.size() == y1.size() && x1.size() == z1.size(),
            "Sample 1 coordinate arrays must have the same length");
    Require(x2.size() == y2.size() && x2.size() == z2.size(),
            "Sample 2 coordinate arrays must have the same length");

    double lo = std::numeric_limits<double>::max();
    double hi = -std::numeric_limits<double>::max();
    UpdateRange(x1, lo, hi);
    UpdateRange(y1, lo, hi);
    UpdateRange(z1, lo, hi);
    UpdateRange(x2, lo, hi);
    UpdateRange(y2, lo, hi);
    UpdateRange(z2, lo, hi);

    double size = min_size;
    if (hi >= lo) {
        ShiftAll(x1, lo);
        ShiftAll(y1, lo);
        ShiftAll(z1, lo);
        ShiftAll(x2, lo);
        ShiftAll(y2, lo);
        ShiftAll(z2, lo);
        size = std::max(hi - lo, min_size);
    }
    dbg<<"EncloseInBox: min = "<<lo<<", box size = "<<size<<std::endl;
    Require(size > 0., "Cannot enclose the samples in a box of zero size");
    return size;
}

static int CalculateNDivs(double period, double approx_cell_size)
{
    Require(period > 0., "period must be positive, got "<<period);
    Require(approx_cell_size > 0., "approx_cell_size must be positive, got "<<approx_cell_size);
    const double ndivs = std::floor(period / approx_cell_size + 0.5);
    Require(ndivs <= double(std::numeric_limits<int>::max()),
            "Too many cells: period/approx_cell_size = "<<period / approx_cell_size);
    return ndivs < 1. ? 1 : int(ndivs);
}

static GridGeometry BuildGeometry(double xperiod, double yperiod, double zperiod,
                                  double approx_xcell_size, double approx_ycell_size,
                                  double approx_zcell_size)
{
    const int nx = CalculateNDivs(xperiod, approx_xcell_size);
    const int ny = CalculateNDivs(yperiod, approx_ycell_size);
    const int nz = CalculateNDivs(zperiod, approx_zcell_size);
    return GridGeometry(nx, ny, nz, xperiod/nx, yperiod/ny, zperiod/nz);
}

// Points exactly on the upper edge of the box go into the last cell.
static int Digitize(double x, double cell_size, int ndivs)
{
    const int i = int(std::floor(x / cell_size));
    return i >= ndivs ? ndivs-1 : i;
}

RectangularMesh::RectangularMesh(
    const double* x, const double* y, const double* z, long npts,
    double xperiod, double yperiod, double zperiod,
    double approx_xcell_size, double approx_ycell_size, double approx_zcell_size) :
    _geom(BuildGeometry(xperiod, yperiod, zperiod,
                        approx_xcell_size, approx_ycell_size, approx_zcell_size))
{
    dbg<<"Start RectangularMesh: npts = "<<npts<<std::endl;
    dbg<<"divs = "<<_geom.getNXDivs()<<" "<<_geom.getNYDivs()<<" "<<_geom.getNZDivs()<<std::endl;
    Require(npts >= 0, "Number of points must be non-negative, got "<<npts);
    Require(npts == 0 || (x && y && z), "Missing coordinate arrays");

    const long ncells = _geom.getNCells();
    std::vector<long> cell_id(npts);
    _cell_indices.assign(ncells+1, 0);

    // Count the number of points in each cell, offset by one so the prefix sum below
    // turns these into the starting index of each cell.
    for (long i=0; i<npts; ++i) {
        Require(x[i] >= 0. && x[i] <= xperiod &&
                y[i] >= 0. && y[i] <= yperiod &&
                z[i] >= 0. && z[i] <= zperiod,
                "Point "<<i<<" = ("<<x[i]<<", "<<y[i]<<", "<<z[i]<<
                ") is outside the box ("<<xperiod<<", "<<yperiod<<", "<<zperiod<<")");
        const int ix = Digitize(x[i], _geom.getXCellSize(), _geom.getNXDivs());
        const int iy = Digitize(y[i], _geom.getYCellSize(), _geom.getNYDivs());
        const int iz = Digitize(z[i], _geom.getZCellSize(), _geom.getNZDivs());
        cell_id[i] = _geom.cellId(ix, iy, iz);
        ++_cell_indices[cell_id[i]+1];
    }
    for (long c=0; c<ncells; ++c) _cell_indices[c+1] += _cell_indices[c];
    Assert(_cell_indices[ncells] == npts);

    // Counting sort.  Points within a cell keep their input order.
    std::vector<long> next(_cell_indices.begin(), _cell_indices.end()-1);
    _idx_sorted.resize(npts);
    _x.resize(npts);
    _y.resize(npts);
    _z.resize(npts);
    for (long i=0; i<npts; ++i) {
        const long j = next[cell_id[i]]++;
        _idx_sorted[j] = i;
        _x[j] = x[i];
        _y[j] = y[i];
        _z[j] = z[i];
    }
    xdbg<<"Done RectangularMesh\n";
}

GriddedSample RectangularMesh::getSample() const
{
    const double* x = _x.empty() ? 0 : &_x[0];
    const double* y = _y.empty() ? 0 : &_y[0];
    const double* z = _z.empty() ? 0 : &_z[0];
    return GriddedSample(x, y, z, getNPts(), &_cell_indices[0], long(_cell_indices.size()),
                         _geom);
}

RectangularDoubleMesh::RectangularDoubleMesh(
    const double* x1, const double* y1, const double* z1, long n1,
    const double* x2, const double* y2, const double* z2, long n2,
    double approx_x1cell_size, double approx_y1cell_size, double approx_z1cell_size,
    double approx_x2cell_size, double approx_y2cell_size, double approx_z2cell_size,
    double xsearch, double ysearch, double zsearch,
    double xperiod, double yperiod, double zperiod, bool pbc,
    int max_cells_per_dim1, int max_cells_per_dim2) :
    _box(xperiod, yperiod, zperiod, pbc),
    _xsearch(std::min(xsearch, xperiod)),
    _ysearch(std::min(ysearch, yperiod)),
    _zsearch(std::min(zsearch, zperiod)),
    _mesh1(x1, y1, z1, n1, xperiod, yperiod, zperiod,
           CalculateSample1CellSize(xperiod, _xsearch, approx_x1cell_size, max_cells_per_dim1),
           CalculateSample1CellSize(yperiod, _ysearch, approx_y1cell_size, max_cells_per_dim1),
           CalculateSample1CellSize(zperiod, _zsearch, approx_z1cell_size, max_cells_per_dim1)),
    _mesh2(x2, y2, z2, n2, xperiod, yperiod, zperiod,
           CalculateSample2CellSize(xperiod, _mesh1.getGeometry().getXCellSize(),
                                    approx_x2cell_size, max_cells_per_dim2),
           CalculateSample2CellSize(yperiod, _mesh1.getGeometry().getYCellSize(),
                                    approx_y2cell_size, max_cells_per_dim2),
           CalculateSample2CellSize(zperiod, _mesh1.getGeometry().getZCellSize(),
                                    approx_z2cell_size, max_cells_per_dim2))
{
    dbg<<"Built RectangularDoubleMesh: ncells1 = "<<_mesh1.getNCells()<<
        ", ncells2 = "<<_mesh2.getNCells()<<std::endl;
}

DoubleMesh RectangularDoubleMesh::getDoubleMesh() const
{
    return DoubleMesh(_mesh1.getSample(), _mesh2.getSample(), _box,
                      _xsearch, _ysearch, _zsearch);
}
