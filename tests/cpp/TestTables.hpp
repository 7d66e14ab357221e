#pragma once
#include <array>
#include <cmath>
#include <vector>
#include "vdlut_interpolators/vdlut.h"

// Helper function to compare floating point numbers
inline bool is_equal(const double a, const double b, double tolerance = 1e-10) {
    return std::abs(a - b) < tolerance;
}

// Engine torque curve: rpm -> Nm
struct TorqueCurve {
    static constexpr std::array<double, 4> rpm = {1000.0, 3000.0, 5000.0, 7000.0};
    static constexpr std::array<double, 4> torque = {180.0, 320.0, 290.0, 220.0};

    static vdlut::Table1D table() {
        return vdlut::Table1D::build(rpm, torque);
    }
};

// Tire grip surface: slip angle (deg) x vertical load (N) -> friction coefficient.
// Rows follow slip angle, columns follow load.
struct GripSurface {
    static constexpr std::array<double, 3> slip_angle = {0.0, 4.0, 8.0};
    static constexpr std::array<double, 2> load = {2000.0, 4000.0};
    static constexpr std::array<double, 6> mu = {
        1.00, 0.90,
        1.60, 1.40,
        1.30, 1.20,
    };

    static vdlut::Table2D table() {
        return vdlut::Table2D::build(slip_angle, load, mu);
    }
};

// Drag coefficient cube: speed (m/s) x yaw (deg) x ride height (m).
// Sampled from an affine function so interior points have a closed-form answer.
struct DragCube {
    static constexpr std::array<double, 3> speed = {0.0, 40.0, 100.0};
    static constexpr std::array<double, 2> yaw = {0.0, 10.0};
    static constexpr std::array<double, 3> ride_height = {0.04, 0.07, 0.12};

    static double cd(double v, double psi, double h) {
        return 0.30 + 0.0002 * v + 0.004 * psi - 0.5 * h;
    }

    static std::vector<double> grid() {
        std::vector<double> values;
        for (const double v : speed) {
            for (const double psi : yaw) {
                for (const double h : ride_height) {
                    values.push_back(cd(v, psi, h));
                }
            }
        }
        return values;
    }

    static vdlut::Table3D table() {
        return vdlut::Table3D::build(speed, yaw, ride_height, grid());
    }
};
