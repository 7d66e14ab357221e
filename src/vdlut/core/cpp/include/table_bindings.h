#pragma once
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include "vdlut_interpolators/vdlut.h"

namespace py = pybind11;

using DoubleArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

/**
 * Build a 1D table from NumPy arrays
 *
 * @param axis Breakpoints (strictly increasing)
 * @param values Dependent values, same length as axis
 * @return Validated table
 * @throws vdlut::LutError on any construction failure
 */
vdlut::Table1D table1d_from_arrays(const DoubleArray& axis, const DoubleArray& values);

/**
 * Build a 2D table from NumPy arrays. grid is either flat or shaped
 * (len(x_axis), len(y_axis)); any other shape is a grid size mismatch.
 */
vdlut::Table2D table2d_from_arrays(
    const DoubleArray& x_axis,
    const DoubleArray& y_axis,
    const DoubleArray& grid);

/**
 * Build a 3D table from NumPy arrays. grid is either flat or shaped
 * (len(x_axis), len(y_axis), len(z_axis)).
 */
vdlut::Table3D table3d_from_arrays(
    const DoubleArray& x_axis,
    const DoubleArray& y_axis,
    const DoubleArray& z_axis,
    const DoubleArray& grid);

py::array_t<double> lookup_many_1d(const vdlut::Table1D& table, const DoubleArray& x);

py::array_t<double> lookup_many_2d(
    const vdlut::Table2D& table,
    const DoubleArray& x,
    const DoubleArray& y);

py::array_t<double> lookup_many_3d(
    const vdlut::Table3D& table,
    const DoubleArray& x,
    const DoubleArray& y,
    const DoubleArray& z);

/// Copy a std::vector into a new 1-D NumPy array.
py::array_t<double> to_numpy(const std::vector<double>& values);
