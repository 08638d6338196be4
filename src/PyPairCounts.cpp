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
#include "BinType.h"
#include "Grid.h"
#include "Mesh.h"
#include "PairCounts.h"
#include "CountPairs.h"

PairCounts* BuildPairCounts(BinType bin_type, DArray& bins1p, DArray& bins2p, LLArray& countsp)
{
    Require(bins1p.ndim() == 1 && bins2p.ndim() == 1, "Bin edges must be 1-d arrays");
    Require(countsp.size() == bins1p.size() * bins2p.size(),
            "counts must have "<<bins1p.size()<<" x "<<bins2p.size()<<" entries, got "<<
            countsp.size());
    long long* counts = static_cast<long long*>(countsp.mutable_data());
    return new PairCounts(bin_type, bins1p.data(), int(bins1p.size()),
                          bins2p.data(), int(bins2p.size()), counts);
}

void PyProcessRange(PairCounts& counts, const RectangularDoubleMesh& mesh,
                    long first_cell, long last_cell)
{
    ProcessRange(counts, mesh.getDoubleMesh(), first_cell, last_cell);
}

void PyProcess(PairCounts& counts, const RectangularDoubleMesh& mesh, bool dots)
{
    Process(counts, mesh.getDoubleMesh(), 0, mesh.getNCells1(), dots);
}

void PyProcessBrute(PairCounts& counts, DArray& x1p, DArray& y1p, DArray& z1p,
                    DArray& x2p, DArray& y2p, DArray& z2p,
                    double xperiod, double yperiod, double zperiod, bool pbc, bool dots)
{
    CheckCoords(x1p, y1p, z1p, "Sample 1");
    CheckCoords(x2p, y2p, z2p, "Sample 2");
    PeriodicBox box(xperiod, yperiod, zperiod, pbc);
    ProcessBrute(counts, x1p.data(), y1p.data(), z1p.data(), long(x1p.size()),
                 x2p.data(), y2p.data(), z2p.data(), long(x2p.size()), box, dots);
}

// Count pairs from samples that were already sorted into cells elsewhere, e.g. by a
// different process.  cell_indices has ncells+1 entries for each sample.
void PyProcessPreSorted(
    PairCounts& counts,
    DArray& x1p, DArray& y1p, DArray& z1p, LArray& cell_indices1p,
    int nx1divs, int ny1divs, int nz1divs,
    DArray& x2p, DArray& y2p, DArray& z2p, LArray& cell_indices2p,
    int nx2divs, int ny2divs, int nz2divs,
    double xperiod, double yperiod, double zperiod, bool pbc,
    double xsearch, double ysearch, double zsearch,
    long first_cell, long last_cell)
{
    CheckCoords(x1p, y1p, z1p, "Sample 1");
    CheckCoords(x2p, y2p, z2p, "Sample 2");
    Require(nx1divs >= 1 && ny1divs >= 1 && nz1divs >= 1 &&
            nx2divs >= 1 && ny2divs >= 1 && nz2divs >= 1,
            "Number of cell divisions must be at least 1");
    CheckCellIndices(cell_indices1p, "Sample 1");
    CheckCellIndices(cell_indices2p, "Sample 2");

    GridGeometry geom1(nx1divs, ny1divs, nz1divs,
                       xperiod/nx1divs, yperiod/ny1divs, zperiod/nz1divs);
    GridGeometry geom2(nx2divs, ny2divs, nz2divs,
                       xperiod/nx2divs, yperiod/ny2divs, zperiod/nz2divs);
    GriddedSample mesh1(x1p.data(), y1p.data(), z1p.data(), long(x1p.size()),
                        cell_indices1p.data(), long(cell_indices1p.size()), geom1);
    GriddedSample mesh2(x2p.data(), y2p.data(), z2p.data(), long(x2p.size()),
                        cell_indices2p.data(), long(cell_indices2p.size()), geom2);
    PeriodicBox box(xperiod, yperiod, zperiod, pbc);
    DoubleMesh mesh(mesh1, mesh2, box, xsearch, ysearch, zsearch);
    ProcessRange(counts, mesh, first_cell, last_cell);
}

void PyCumulateCounts(LLArray& rawp, LLArray& cump, int nbins1, int nbins2)
{
    Require(nbins1 >= 1 && nbins2 >= 1, "Number of bins must be at least 1");
    Require(rawp.size() == long(nbins1)*nbins2 && cump.size() == long(nbins1)*nbins2,
            "Counts arrays must have "<<nbins1<<" x "<<nbins2<<" entries");
    CumulateCounts(rawp.data(), static_cast<long long*>(cump.mutable_data()), nbins1, nbins2);
}

py::array_t<long long> PyCountPairs(
    BinType bin_type,
    const std::vector<double>& x1, const std::vector<double>& y1, const std::vector<double>& z1,
    const std::vector<double>& x2, const std::vector<double>& y2, const std::vector<double>& z2,
    const std::vector<double>& bins1, const std::vector<double>& bins2,
    double xperiod, double yperiod, double zperiod, bool pbc,
    double approx_cell1_size, double approx_cell2_size, int num_threads)
{
    std::vector<long long> cum = CountPairs(bin_type, x1, y1, z1, x2, y2, z2, bins1, bins2,
                                            xperiod, yperiod, zperiod, pbc,
                                            approx_cell1_size, approx_cell2_size, num_threads);
    py::array_t<long long> ret({py::ssize_t(bins1.size()), py::ssize_t(bins2.size())});
    long long* data = static_cast<long long*>(ret.mutable_data());
    for (size_t i=0; i<cum.size(); ++i) data[i] = cum[i];
    return ret;
}

py::array_t<long long> GetCountsArray(const PairCounts& counts)
{
    py::array_t<long long> ret({py::ssize_t(counts.getNBins1()),
                                py::ssize_t(counts.getNBins2())});
    long long* data = static_cast<long long*>(ret.mutable_data());
    const long n = long(counts.getNBins1()) * counts.getNBins2();
    for (long i=0; i<n; ++i) data[i] = counts.getCounts()[i];
    return ret;
}

void pyExportPairCounts(py::module& _gridpairs)
{
    py::enum_<BinType>(_gridpairs, "BinType")
        .value("SMu", SMu)
        .value("RpPi", RpPi)
        .value("Radial", Radial)
        .export_values();

    py::class_<PairCounts> pair_counts(_gridpairs, "PairCounts");
    // The counts array has to outlive this object, since we write directly into it.
    pair_counts.def(py::init(&BuildPairCounts), py::keep_alive<1,5>(),
                    py::arg("bin_type"), py::arg("bins1"), py::arg("bins2"),
                    py::arg("counts").noconvert())
        .def_property_readonly("bin_type", &PairCounts::getBinType)
        .def_property_readonly("nbins1", &PairCounts::getNBins1)
        .def_property_readonly("nbins2", &PairCounts::getNBins2)
        .def_property_readonly("total", &PairCounts::getTotal)
        .def("getCounts", &GetCountsArray)
        .def("clear", &PairCounts::clear)
        .def("processRange", &PyProcessRange,
             py::arg("mesh"), py::arg("first_cell"), py::arg("last_cell"))
        .def("process", &PyProcess, py::arg("mesh"), py::arg("dots")=false)
        .def("processBrute", &PyProcessBrute,
             py::arg("x1"), py::arg("y1"), py::arg("z1"),
             py::arg("x2"), py::arg("y2"), py::arg("z2"),
             py::arg("xperiod"), py::arg("yperiod"), py::arg("zperiod"), py::arg("pbc"),
             py::arg("dots")=false);

    _gridpairs.def("ProcessPreSorted", &PyProcessPreSorted);
    _gridpairs.def("CumulateCounts", &PyCumulateCounts,
                   py::arg("raw"), py::arg("cum").noconvert(),
                   py::arg("nbins1"), py::arg("nbins2"));
    _gridpairs.def("CountPairs", &PyCountPairs,
                   py::arg("bin_type"),
                   py::arg("x1"), py::arg("y1"), py::arg("z1"),
                   py::arg("x2"), py::arg("y2"), py::arg("z2"),
                   py::arg("bins1"), py::arg("bins2"),
                   py::arg("xperiod"), py::arg("yperiod"), py::arg("zperiod"), py::arg("pbc"),
                   py::arg("approx_cell1_size")=0., py::arg("approx_cell2_size")=0.,
                   py::arg("num_threads")=0);
    _gridpairs.def("SetOMPThreads", &SetOMPThreads);
    _gridpairs.def("GetOMPThreads", &GetOMPThreads);
}
