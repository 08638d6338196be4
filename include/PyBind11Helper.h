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

#ifndef GridPairs_PyBind11Helper_H
#define GridPairs_PyBind11Helper_H

#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "dbg.h"

namespace py = pybind11;

// Input arrays are converted to contiguous double arrays if necessary.
typedef py::array_t<double, py::array::c_style | py::array::forcecast> DArray;
typedef py::array_t<long, py::array::c_style | py::array::forcecast> LArray;

// Output arrays must already be the right type, since we write directly into them.
typedef py::array_t<long long, py::array::c_style> LLArray;

inline void CheckCoords(const DArray& xp, const DArray& yp, const DArray& zp, const char* name)
{
    Require(xp.ndim() == 1 && yp.ndim() == 1 && zp.ndim() == 1,
            name<<" coordinate arrays must be 1-d");
    Require(xp.size() == yp.size() && xp.size() == zp.size(),
            name<<" coordinate arrays must have the same length");
}

inline void CheckCellIndices(const LArray& cell_indicesp, const char* name)
{
    Require(cell_indicesp.ndim() == 1, name<<" cell index table must be 1-d");
}

template <typename T>
inline py::array_t<T> VectorToNumpy(const std::vector<T>& v)
{ return py::array_t<T>(py::ssize_t(v.size()), v.data()); }

#endif
