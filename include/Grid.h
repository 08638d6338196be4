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

#ifndef GridPairs_Grid_H
#define GridPairs_Grid_H

#include "dbg.h"

// GridGeometry describes a regular grid of rectangular cells covering a box.
// Cells are numbered in row-major order, so the linear id of cell (ix,iy,iz) is
//     icell = ix*(ny*nz) + iy*nz + iz
class GridGeometry
{
public:
    GridGeometry(int nxdivs, int nydivs, int nzdivs,
                 double xcell_size, double ycell_size, double zcell_size);

    int getNXDivs() const { return _nxdivs; }
    int getNYDivs() const { return _nydivs; }
    int getNZDivs() const { return _nzdivs; }
    double getXCellSize() const { return _xcell_size; }
    double getYCellSize() const { return _ycell_size; }
    double getZCellSize() const { return _zcell_size; }
    long getNCells() const { return _ncells; }

    long cellId(int ix, int iy, int iz) const
    {
        XAssert(ix >= 0 && ix < _nxdivs);
        XAssert(iy >= 0 && iy < _nydivs);
        XAssert(iz >= 0 && iz < _nzdivs);
        return (long(ix)*_nydivs + iy)*_nzdivs + iz;
    }

    void cellTuple(long icell, int& ix, int& iy, int& iz) const
    {
        XAssert(icell >= 0 && icell < _ncells);
        const long nyz = long(_nydivs)*_nzdivs;
        ix = int(icell / nyz);
        iy = int((icell - ix*nyz) / _nzdivs);
        iz = int(icell - ix*nyz - long(iy)*_nzdivs);
    }

private:
    int _nxdivs, _nydivs, _nzdivs;
    double _xcell_size, _ycell_size, _zcell_size;
    long _ncells;
};

// The periods of the box in each direction, and whether the box actually wraps around.
// When pbc is false, the periods are only used to lay out the grid, and the shifts
// applied to wrapped cells are all zero.
struct PeriodicBox
{
    PeriodicBox(double _xp, double _yp, double _zp, bool _pbc);

    double getXShift() const { return pbc ? xp : 0.; }
    double getYShift() const { return pbc ? yp : 0.; }
    double getZShift() const { return pbc ? zp : 0.; }

    const double xp, yp, zp;
    const bool pbc;
};

// GriddedSample is a read-only view of a sample of points that has already been sorted
// into the cells of a grid.  The points in cell icell are those with indices in
// [cell_indices[icell], cell_indices[icell+1]).
// Nothing is copied.  The caller keeps the arrays alive as long as the view is used.
class GriddedSample
{
public:
    GriddedSample(const double* x, const double* y, const double* z, long npts,
                  const long* cell_indices, long nindices, const GridGeometry& geom);

    const GridGeometry& getGeometry() const { return _geom; }
    long getNPts() const { return _npts; }
    long getNCells() const { return _geom.getNCells(); }

    const double* getX() const { return _x; }
    const double* getY() const { return _y; }
    const double* getZ() const { return _z; }

    long getCellStart(long icell) const
    {
        XAssert(icell >= 0 && icell < getNCells());
        return _cell_indices[icell];
    }
    long getCellEnd(long icell) const
    {
        XAssert(icell >= 0 && icell < getNCells());
        return _cell_indices[icell+1];
    }

private:
    const double* _x;
    const double* _y;
    const double* _z;
    long _npts;
    const long* _cell_indices;
    GridGeometry _geom;
};

// DoubleMesh pairs the primary (mesh1) and secondary (mesh2) samples with the box they
// live in and the distance along each axis that the pair search needs to reach.
// The secondary grid must be a refinement of the primary grid by an integer factor along
// each axis.
class DoubleMesh
{
public:
    DoubleMesh(const GriddedSample& mesh1, const GriddedSample& mesh2, const PeriodicBox& box,
               double xsearch, double ysearch, double zsearch);

    const GriddedSample& getMesh1() const { return _mesh1; }
    const GriddedSample& getMesh2() const { return _mesh2; }
    const PeriodicBox& getBox() const { return _box; }

    double getXSearch() const { return _xsearch; }
    double getYSearch() const { return _ysearch; }
    double getZSearch() const { return _zsearch; }

    // The number of secondary cells per primary cell along each axis.
    int getXRatio() const { return _xratio; }
    int getYRatio() const { return _yratio; }
    int getZRatio() const { return _zratio; }

    // The number of secondary cells to search on either side of a primary cell.
    int getNXCovering() const { return _nxcover; }
    int getNYCovering() const { return _nycover; }
    int getNZCovering() const { return _nzcover; }

private:
    GriddedSample _mesh1;
    GriddedSample _mesh2;
    PeriodicBox _box;
    double _xsearch, _ysearch, _zsearch;
    int _xratio, _yratio, _zratio;
    int _nxcover, _nycover, _nzcover;
};

// Map a secondary cell index that may lie outside [0,ndivs) back into the grid, and
// return the shift to subtract from the primary coordinates to compare with points in
// the wrapped cell.  period is the shift for one full wrap (0 if not periodic).
inline int WrapCellIndex(int i, int ndivs, double period, double& shift)
{
    if (i < 0) {
        shift = -period;
        return ((i % ndivs) + ndivs) % ndivs;
    } else if (i >= ndivs) {
        shift = period;
        return i % ndivs;
    } else {
        shift = 0.;
        return i;
    }
}

#endif
