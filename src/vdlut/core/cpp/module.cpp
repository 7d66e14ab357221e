#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include "include/table_bindings.h"

namespace py = pybind11;

PYBIND11_MODULE(fast_lut, m) {
    m.doc() = "Lookup tables with clamped linear, bilinear and trilinear interpolation";

    py::register_exception<vdlut::LutError>(m, "LutError", PyExc_ValueError);

    py::class_<vdlut::Table1D>(m, "Table1D")
        .def(py::init(&table1d_from_arrays),
             "Build a 1D table from strictly increasing breakpoints and matching values",
             py::arg("axis"),
             py::arg("values"))
        .def("lookup",
             [](const vdlut::Table1D& t, double x) { return t.lookup(x); },
             "Linearly interpolated value, clamped at the axis ends",
             py::arg("x"))
        .def("lookup_many",
             &lookup_many_1d,
             "Interpolate every element of a coordinate array",
             py::arg("x"))
        .def_property_readonly("axis",
             [](const vdlut::Table1D& t) { return to_numpy(t.axis().breakpoints()); })
        .def_property_readonly("values",
             [](const vdlut::Table1D& t) { return to_numpy(t.values()); })
        .def("__len__", [](const vdlut::Table1D& t) { return t.size(); });

    py::class_<vdlut::Table2D>(m, "Table2D")
        .def(py::init(&table2d_from_arrays),
             "Build a 2D table; grid is flat or shaped (len(x_axis), len(y_axis))",
             py::arg("x_axis"),
             py::arg("y_axis"),
             py::arg("grid"))
        .def("lookup",
             [](const vdlut::Table2D& t, double x, double y) { return t.lookup(x, y); },
             "Bilinearly interpolated value, clamped at the axis ends",
             py::arg("x"),
             py::arg("y"))
        .def("lookup_many",
             &lookup_many_2d,
             "Interpolate element-wise over equal-length coordinate arrays",
             py::arg("x"),
             py::arg("y"))
        .def_property_readonly("x_axis",
             [](const vdlut::Table2D& t) { return to_numpy(t.x_axis().breakpoints()); })
        .def_property_readonly("y_axis",
             [](const vdlut::Table2D& t) { return to_numpy(t.y_axis().breakpoints()); })
        .def_property_readonly("values",
             [](const vdlut::Table2D& t) { return to_numpy(t.values()); });

    py::class_<vdlut::Table3D>(m, "Table3D")
        .def(py::init(&table3d_from_arrays),
             "Build a 3D table; grid is flat or shaped (len(x_axis), len(y_axis), len(z_axis))",
             py::arg("x_axis"),
             py::arg("y_axis"),
             py::arg("z_axis"),
             py::arg("grid"))
        .def("lookup",
             [](const vdlut::Table3D& t, double x, double y, double z) { return t.lookup(x, y, z); },
             "Trilinearly interpolated value, clamped at the axis ends",
             py::arg("x"),
             py::arg("y"),
             py::arg("z"))
        .def("lookup_many",
             &lookup_many_3d,
             "Interpolate element-wise over equal-length coordinate arrays",
             py::arg("x"),
             py::arg("y"),
             py::arg("z"))
        .def_property_readonly("x_axis",
             [](const vdlut::Table3D& t) { return to_numpy(t.x_axis().breakpoints()); })
        .def_property_readonly("y_axis",
             [](const vdlut::Table3D& t) { return to_numpy(t.y_axis().breakpoints()); })
        .def_property_readonly("z_axis",
             [](const vdlut::Table3D& t) { return to_numpy(t.z_axis().breakpoints()); })
        .def_property_readonly("values",
             [](const vdlut::Table3D& t) { return to_numpy(t.values()); });
}
