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

#include "PyBind11Helper.h"

#include "dbg.h"
#include "Grid.h"
#include "Mesh.h"

RectangularDoubleMesh* BuildRectangularDoubleMesh(
    DArray& x1p, DArray& y1p, DArray& z1p, DArray& x2p, DArray& y2p, DArray& z2p,
    double approx_x1cell_size, double approx_y1cell_size, double approx_z1cell_size,
    double approx_x2cell_size, double approx_y2cell_size, double approx_z2cell_size,
    double xsearch, double ysearch, double zsearch,
    double xperiod, double yperiod, double zperiod, bool pbc,
    int max_cells_per_dim1, int max_cells_per_dim2)
{
    CheckCoords(x1p, y1p, z1p, "Sample 1");
    CheckCoords(x2p, y2p, z2p, "Sample 2");
    return new RectangularDoubleMesh(
        x1p.data(), y1p.data(), z1p.data(), long(x1p.size()),
        x2p.data(), y2p.data(), z2p.data(), long(x2p.size()),
        approx_x1cell_size, approx_y1cell_size, approx_z1cell_size,
        approx_x2cell_size, approx_y2cell_size, approx_z2cell_size,
        xsearch, ysearch, zsearch, xperiod, yperiod, zperiod, pbc,
        max_cells_per_dim1, max_cells_per_dim2);
}

py::tuple GetDivs(const RectangularMesh& mesh)
{
    const GridGeometry& geom = mesh.getGeometry();
    return py::make_tuple(geom.getNXDivs(), geom.getNYDivs(), geom.getNZDivs());
}

py::tuple GetCellSizes(const RectangularMesh& mesh)
{
    const GridGeometry& geom = mesh.getGeometry();
    return py::make_tuple(geom.getXCellSize(), geom.getYCellSize(), geom.getZCellSize());
}

py::array_t<long> GetCellIndices(const RectangularMesh& mesh)
{ return VectorToNumpy(mesh.getCellIndices()); }

py::array_t<long> GetIdxSorted(const RectangularMesh& mesh)
{ return VectorToNumpy(mesh.getIdxSorted()); }

py::tuple GetSortedCoords(const RectangularMesh& mesh)
{
    return py::make_tuple(VectorToNumpy(mesh.getX()), VectorToNumpy(mesh.getY()),
                          VectorToNumpy(mesh.getZ()));
}

py::tuple GetMeshSearchLengths(const RectangularDoubleMesh& mesh)
{
    DoubleMesh dm = mesh.getDoubleMesh();
    return py::make_tuple(dm.getXSearch(), dm.getYSearch(), dm.getZSearch());
}

py::tuple GetRatios(const RectangularDoubleMesh& mesh)
{
    DoubleMesh dm = mesh.getDoubleMesh();
    return py::make_tuple(dm.getXRatio(), dm.getYRatio(), dm.getZRatio());
}

py::tuple GetCovering(const RectangularDoubleMesh& mesh)
{
    DoubleMesh dm = mesh.getDoubleMesh();
    return py::make_tuple(dm.getNXCovering(), dm.getNYCovering(), dm.getNZCovering());
}

py::tuple PyEncloseInBox(DArray& x1p, DArray& y1p, DArray& z1p,
                         DArray& x2p, DArray& y2p, DArray& z2p, double min_size)
{
    CheckCoords(x1p, y1p, z1p, "Sample 1");
    CheckCoords(x2p, y2p, z2p, "Sample 2");
    std::vector<double> x1(x1p.data(), x1p.data() + x1p.size());
    std::vector<double> y1(y1p.data(), y1p.data() + y1p.size());
    std::vector<double> z1(z1p.data(), z1p.data() + z1p.size());
    std::vector<double> x2(x2p.data(), x2p.data() + x2p.size());
    std::vector<double> y2(y2p.data(), y2p.data() + y2p.size());
    std::vector<double> z2(z2p.data(), z2p.data() + z2p.size());
    double size = EncloseInBox(x1, y1, z1, x2, y2, z2, min_size);
    return py::make_tuple(VectorToNumpy(x1), VectorToNumpy(y1), VectorToNumpy(z1),
                          VectorToNumpy(x2), VectorToNumpy(y2), VectorToNumpy(z2), size);
}

void pyExportMesh(py::module& _gridpairs)
{
    py::class_<RectangularMesh> mesh(_gridpairs, "RectangularMesh");
    mesh.def_property_readonly("npts", &RectangularMesh::getNPts)
        .def_property_readonly("ncells", &RectangularMesh::getNCells)
        .def_property_readonly("divs", &GetDivs)
        .def_property_readonly("cell_sizes", &GetCellSizes)
        .def_property_readonly("cell_indices", &GetCellIndices)
        .def_property_readonly("idx_sorted", &GetIdxSorted)
        .def_property_readonly("sorted_coords", &GetSortedCoords);

    py::class_<RectangularDoubleMesh> double_mesh(_gridpairs, "RectangularDoubleMesh");
    double_mesh.def(py::init(&BuildRectangularDoubleMesh),
                    py::arg("x1"), py::arg("y1"), py::arg("z1"),
                    py::arg("x2"), py::arg("y2"), py::arg("z2"),
                    py::arg("approx_x1cell_size"), py::arg("approx_y1cell_size"),
                    py::arg("approx_z1cell_size"),
                    py::arg("approx_x2cell_size"), py::arg("approx_y2cell_size"),
                    py::arg("approx_z2cell_size"),
                    py::arg("xsearch"), py::arg("ysearch"), py::arg("zsearch"),
                    py::arg("xperiod"), py::arg("yperiod"), py::arg("zperiod"),
                    py::arg("pbc"),
                    py::arg("max_cells_per_dim1")=DEFAULT_MAX_CELLS_PER_DIM,
                    py::arg("max_cells_per_dim2")=DEFAULT_MAX_CELLS_PER_DIM)
        .def_property_readonly("mesh1", &RectangularDoubleMesh::getMesh1,
                               py::return_value_policy::reference_internal)
        .def_property_readonly("mesh2", &RectangularDoubleMesh::getMesh2,
                               py::return_value_policy::reference_internal)
        .def_property_readonly("ncells1", &RectangularDoubleMesh::getNCells1)
        .def_property_readonly("search_lengths", &GetMeshSearchLengths)
        .def_property_readonly("ratios", &GetRatios)
        .def_property_readonly("covering", &GetCovering);

    _gridpairs.def("CalculateSample1CellSize", &CalculateSample1CellSize,
                   py::arg("period"), py::arg("search_length"), py::arg("approx_cell_size"),
                   py::arg("max_cells_per_dim")=DEFAULT_MAX_CELLS_PER_DIM);
    _gridpairs.def("CalculateSample2CellSize", &CalculateSample2CellSize,
                   py::arg("period"), py::arg("cell1_size"), py::arg("approx_cell_size"),
                   py::arg("max_cells_per_dim")=DEFAULT_MAX_CELLS_PER_DIM);
    _gridpairs.def("EncloseInBox", &PyEncloseInBox);
}
