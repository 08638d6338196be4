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
#include "Grid.h"
#include "dbg.h"

GridGeometry::GridGeometry(int nxdivs, int nydivs, int nzdivs,
                           double xcell_size, double ycell_size, double zcell_size) :
    _nxdivs(nxdivs), _nydivs(nydivs), _nzdivs(nzdivs),
    _xcell_size(xcell_size), _ycell_size(ycell_size), _zcell_size(zcell_size),
    _ncells(long(nxdivs)*nydivs*nzdivs)
{
    Require(nxdivs >= 1 && nydivs >= 1 && nzdivs >= 1,
            "Number of divisions must be at least 1 along each axis, got "<<
            nxdivs<<", "<<nydivs<<", "<<nzdivs);
    Require(xcell_size > 0. && ycell_size > 0. && zcell_size > 0.,
            "Cell sizes must be positive, got "<<
            xcell_size<<", "<<ycell_size<<", "<<zcell_size);
}

PeriodicBox::PeriodicBox(double _xp, double _yp, double _zp, bool _pbc) :
    xp(_xp), yp(_yp), zp(_zp), pbc(_pbc)
{
    Require(xp > 0. && yp > 0. && zp > 0.,
            "Box periods must be positive, got "<<xp<<", "<<yp<<", "<<zp);
}

GriddedSample::GriddedSample(const double* x, const double* y, const double* z, long npts,
                             const long* cell_indices, long nindices,
                             const GridGeometry& geom) :
    _x(x), _y(y), _z(z), _npts(npts), _cell_indices(cell_indices), _geom(geom)
{
    xdbg<<"GriddedSample: npts = "<<npts<<", ncells = "<<geom.getNCells()<<std::endl;
    Require(npts >= 0, "Number of points must be non-negative, got "<<npts);
    Require(npts == 0 || (x && y && z), "Missing coordinate arrays");
    Require(cell_indices, "Missing cell index table");
    Require(nindices == geom.getNCells() + 1,
            "Cell index table must have NumCells+1 = "<<geom.getNCells()+1<<
            " entries, got "<<nindices);
    Require(cell_indices[0] >= 0, "Cell index table must start at >= 0");
    for (long i=1; i<nindices; ++i) {
        Require(cell_indices[i] >= cell_indices[i-1],
                "Cell index table must be non-decreasing (entry "<<i<<")");
    }
    Require(cell_indices[nindices-1] <= npts,
            "Cell index table refers past the end of the sample: "<<
            cell_indices[nindices-1]<<" > "<<npts);
}

// Returns the number of secondary cells in each direction needed to reach search from
// any point in a primary cell.
static int CoveringSteps(double search, double cell2_size)
{ return int(std::ceil(search / cell2_size)); }

DoubleMesh::DoubleMesh(const GriddedSample& mesh1, const GriddedSample& mesh2,
                       const PeriodicBox& box,
                       double xsearch, double ysearch, double zsearch) :
    _mesh1(mesh1), _mesh2(mesh2), _box(box),
    _xsearch(xsearch), _ysearch(ysearch), _zsearch(zsearch)
{
    const GridGeometry& g1 = mesh1.getGeometry();
    const GridGeometry& g2 = mesh2.getGeometry();
    dbg<<"DoubleMesh: mesh1 divs = "<<g1.getNXDivs()<<" "<<g1.getNYDivs()<<" "<<
        g1.getNZDivs()<<std::endl;
    dbg<<"            mesh2 divs = "<<g2.getNXDivs()<<" "<<g2.getNYDivs()<<" "<<
        g2.getNZDivs()<<std::endl;
    dbg<<"search = "<<xsearch<<"  "<<ysearch<<"  "<<zsearch<<std::endl;
    dbg<<"period = "<<box.xp<<"  "<<box.yp<<"  "<<box.zp<<"  pbc = "<<box.pbc<<std::endl;

    Require(xsearch >= 0. && ysearch >= 0. && zsearch >= 0.,
            "Search lengths must be non-negative, got "<<
            xsearch<<", "<<ysearch<<", "<<zsearch);
    Require(g2.getNXDivs() % g1.getNXDivs() == 0 &&
            g2.getNYDivs() % g1.getNYDivs() == 0 &&
            g2.getNZDivs() % g1.getNZDivs() == 0,
            "Secondary grid divisions must be integer multiples of the primary grid divisions");

    _xratio = g2.getNXDivs() / g1.getNXDivs();
    _yratio = g2.getNYDivs() / g1.getNYDivs();
    _zratio = g2.getNZDivs() / g1.getNZDivs();

    _nxcover = CoveringSteps(xsearch, g2.getXCellSize());
    _nycover = CoveringSteps(ysearch, g2.getYCellSize());
    _nzcover = CoveringSteps(zsearch, g2.getZCellSize());
    dbg<<"ratio = "<<_xratio<<" "<<_yratio<<" "<<_zratio<<std::endl;
    dbg<<"covering steps = "<<_nxcover<<" "<<_nycover<<" "<<_nzcover<<std::endl;

    // If the range of secondary cells around a primary cell is wider than the grid,
    // some cells would be visited twice after wrapping, and their pairs double counted.
    Require(_xratio + 2*_nxcover <= g2.getNXDivs() &&
            _yratio + 2*_nycover <= g2.getNYDivs() &&
            _zratio + 2*_nzcover <= g2.getNZDivs(),
            "Search range wraps more than once around the box.  "
            "Use a larger box or a smaller search length.");
}
