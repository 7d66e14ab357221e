#include "include/table_bindings.h"
#include <stdexcept>
#include <string>
#include <vector>


namespace {

std::vector<double> axis_to_vector(const DoubleArray& axis, const char* name) {
    if (axis.ndim() != 1) {
        throw std::invalid_argument(std::string(name) + " must be a one-dimensional array");
    }
    const auto arr = axis.unchecked<1>();
    const size_t n = arr.shape(0);

    std::vector<double> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = arr(i);
    }
    return out;
}

// A shaped grid must match the axis lengths exactly; flat grids are size-checked by the table.
std::vector<double> grid_to_vector(const DoubleArray& grid, const std::vector<size_t>& axis_sizes) {
    if (grid.ndim() > 1) {
        bool shape_ok = static_cast<size_t>(grid.ndim()) == axis_sizes.size();
        for (size_t d = 0; shape_ok && d < axis_sizes.size(); ++d) {
            shape_ok = static_cast<size_t>(grid.shape(d)) == axis_sizes[d];
        }
        if (!shape_ok) {
            size_t expected = 1;
            for (const size_t n : axis_sizes) {
                expected *= n;
            }
            throw vdlut::LutError::grid_size_mismatch(expected, static_cast<size_t>(grid.size()));
        }
    }

    const double* data = grid.data();
    return std::vector<double>(data, data + grid.size());
}

void require_same_length(const DoubleArray& a, const DoubleArray& b) {
    if (a.ndim() != 1 || b.ndim() != 1 || a.shape(0) != b.shape(0)) {
        throw std::invalid_argument("Coordinate arrays must be one-dimensional and of equal length");
    }
}

} // namespace


vdlut::Table1D table1d_from_arrays(const DoubleArray& axis, const DoubleArray& values) {
    return vdlut::Table1D::build(
        axis_to_vector(axis, "axis"),
        axis_to_vector(values, "values"));
}

vdlut::Table2D table2d_from_arrays(
    const DoubleArray& x_axis,
    const DoubleArray& y_axis,
    const DoubleArray& grid) {

    const std::vector<double> x = axis_to_vector(x_axis, "x_axis");
    const std::vector<double> y = axis_to_vector(y_axis, "y_axis");
    const std::vector<double> flat = grid_to_vector(grid, {x.size(), y.size()});
    return vdlut::Table2D::build(x, y, flat);
}

vdlut::Table3D table3d_from_arrays(
    const DoubleArray& x_axis,
    const DoubleArray& y_axis,
    const DoubleArray& z_axis,
    const DoubleArray& grid) {

    const std::vector<double> x = axis_to_vector(x_axis, "x_axis");
    const std::vector<double> y = axis_to_vector(y_axis, "y_axis");
    const std::vector<double> z = axis_to_vector(z_axis, "z_axis");
    const std::vector<double> flat = grid_to_vector(grid, {x.size(), y.size(), z.size()});
    return vdlut::Table3D::build(x, y, z, flat);
}

py::array_t<double> lookup_many_1d(const vdlut::Table1D& table, const DoubleArray& x) {
    if (x.ndim() != 1) {
        throw std::invalid_argument("Coordinate array must be one-dimensional");
    }
    const auto x_arr = x.unchecked<1>();
    const size_t n = x_arr.shape(0);

    py::array_t<double> result(static_cast<py::ssize_t>(n));
    auto out = result.mutable_unchecked<1>();
    for (size_t i = 0; i < n; ++i) {
        out(i) = table.lookup(x_arr(i));
    }
    return result;
}

py::array_t<double> lookup_many_2d(
    const vdlut::Table2D& table,
    const DoubleArray& x,
    const DoubleArray& y) {

    require_same_length(x, y);
    const auto x_arr = x.unchecked<1>();
    const auto y_arr = y.unchecked<1>();
    const size_t n = x_arr.shape(0);

    py::array_t<double> result(static_cast<py::ssize_t>(n));
    auto out = result.mutable_unchecked<1>();
    for (size_t i = 0; i < n; ++i) {
        out(i) = table.lookup(x_arr(i), y_arr(i));
    }
    return result;
}

py::array_t<double> lookup_many_3d(
    const vdlut::Table3D& table,
    const DoubleArray& x,
    const DoubleArray& y,
    const DoubleArray& z) {

    require_same_length(x, y);
    require_same_length(x, z);
    const auto x_arr = x.unchecked<1>();
    const auto y_arr = y.unchecked<1>();
    const auto z_arr = z.unchecked<1>();
    const size_t n = x_arr.shape(0);

    py::array_t<double> result(static_cast<py::ssize_t>(n));
    auto out = result.mutable_unchecked<1>();
    for (size_t i = 0; i < n; ++i) {
        out(i) = table.lookup(x_arr(i), y_arr(i), z_arr(i));
    }
    return result;
}

py::array_t<double> to_numpy(const std::vector<double>& values) {
    py::array_t<double> result(static_cast<py::ssize_t>(values.size()));
    auto out = result.mutable_unchecked<1>();
    for (size_t i = 0; i < values.size(); ++i) {
        out(i) = values[i];
    }
    return result;
}
