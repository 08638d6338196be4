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

#ifndef GridPairs_Mesh_H
#define GridPairs_Mesh_H

#include <vector>

#include "Grid.h"

// The default maximum number of cells along each dimension of a mesh.
const int DEFAULT_MAX_CELLS_PER_DIM = 50;

// Choose the size of the primary cells along one axis.
// The primary cells are never smaller than the search length, and there are at least
// 3 of them, so that the search around a cell never wraps more than once.
// search_length must not exceed period/3.
double CalculateSample1CellSize(double period, double search_length, double approx_cell_size,
                                int max_cells_per_dim=DEFAULT_MAX_CELLS_PER_DIM);

// Choose the size of the secondary cells along one axis, such that each primary cell
// is split into an integer number of secondary cells.
double CalculateSample2CellSize(double period, double cell1_size, double approx_cell_size,
                                int max_cells_per_dim=DEFAULT_MAX_CELLS_PER_DIM);

// Shift both samples in place so that all coordinates are >= 0, and return the side of
// a cube (of at least min_size) that contains them.  This is how non-periodic samples
// are given a box to lay a grid over.
double EncloseInBox(std::vector<double>& x1, std::vector<double>& y1, std::vector<double>& z1,
                    std::vector<double>& x2, std::vector<double>& y2, std::vector<double>& z2,
                    double min_size);

// RectangularMesh sorts a sample of points in the box [0,xp] x [0,yp] x [0,zp] into a
// grid of cells, keeping its own copy of the sorted coordinates.
//
// The number of divisions along each axis is period/approx_cell_size, rounded, and the
// actual cell size is then period/ndivs.
class RectangularMesh
{
public:
    RectangularMesh(const double* x, const double* y, const double* z, long npts,
                    double xperiod, double yperiod, double zperiod,
                    double approx_xcell_size, double approx_ycell_size, double approx_zcell_size);

    const GridGeometry& getGeometry() const { return _geom; }
    long getNPts() const { return long(_x.size()); }
    long getNCells() const { return _geom.getNCells(); }

    const std::vector<double>& getX() const { return _x; }
    const std::vector<double>& getY() const { return _y; }
    const std::vector<double>& getZ() const { return _z; }

    // cell_indices[icell] .. cell_indices[icell+1] is the range of points in cell icell.
    const std::vector<long>& getCellIndices() const { return _cell_indices; }

    // The sorted point i is the input point idx_sorted[i].
    const std::vector<long>& getIdxSorted() const { return _idx_sorted; }

    // A view of the sorted sample.  Only valid for the lifetime of this mesh.
    GriddedSample getSample() const;

private:
    GridGeometry _geom;
    std::vector<double> _x, _y, _z;
    std::vector<long> _cell_indices;
    std::vector<long> _idx_sorted;
};

// RectangularDoubleMesh builds the pair of meshes used for counting pairs between
// sample 1 (the primary sample) and sample 2 (the secondary sample).
// The mesh for sample 2 is a refinement of the mesh for sample 1.
class RectangularDoubleMesh
{
public:
    RectangularDoubleMesh(
        const double* x1, const double* y1, const double* z1, long n1,
        const double* x2, const double* y2, const double* z2, long n2,
        double approx_x1cell_size, double approx_y1cell_size, double approx_z1cell_size,
        double approx_x2cell_size, double approx_y2cell_size, double approx_z2cell_size,
        double xsearch, double ysearch, double zsearch,
        double xperiod, double yperiod, double zperiod, bool pbc,
        int max_cells_per_dim1=DEFAULT_MAX_CELLS_PER_DIM,
        int max_cells_per_dim2=DEFAULT_MAX_CELLS_PER_DIM);

    const RectangularMesh& getMesh1() const { return _mesh1; }
    const RectangularMesh& getMesh2() const { return _mesh2; }
    const PeriodicBox& getBox() const { return _box; }
    long getNCells1() const { return _mesh1.getNCells(); }

    // The view used by PairCounts.  Only valid for the lifetime of this object.
    DoubleMesh getDoubleMesh() const;

private:
    PeriodicBox _box;
    double _xsearch, _ysearch, _zsearch;
    RectangularMesh _mesh1;
    RectangularMesh _mesh2;
};

#endif
