#pragma once
#include <cstddef>
#include <utility>
#include <vector>

#include "axis.h"
#include "lookup_observer.h"

namespace vdlut {

/**
 * Sampled field w = f(x, y, z) with trilinear interpolation.
 *
 * Values are stored with x outermost and z innermost: the value at
 * (x_axis[i], y_axis[j], z_axis[k]) lives at
 * values()[(i * y_axis.size() + j) * z_axis.size() + k].
 */
class Table3D {
public:
    /**
     * @param x_axis First independent axis
     * @param y_axis Second independent axis
     * @param z_axis Third independent axis
     * @param grid Flat grid of x_axis.size() * y_axis.size() * z_axis.size() values
     * @throws LutError InvalidAxis, GridSizeMismatch or InvalidValue
     */
    template<typename XContainer, typename YContainer, typename ZContainer, typename GridContainer>
    static Table3D build(const XContainer& x_axis, const YContainer& y_axis,
                         const ZContainer& z_axis, const GridContainer& grid) {
        Axis x = Axis::build(x_axis, "x");
        Axis y = Axis::build(y_axis, "y");
        Axis z = Axis::build(z_axis, "z");
        std::vector<double> data =
            detail::copy_values(grid, x.size() * y.size() * z.size(), LutErrorKind::GridSizeMismatch);
        return Table3D(std::move(x), std::move(y), std::move(z), std::move(data));
    }

    double lookup(double x, double y, double z) const noexcept {
        const auto [ix, fx] = x_axis_.locate(x);
        const auto [iy, fy] = y_axis_.locate(y);
        const auto [iz, fz] = z_axis_.locate(z);

        const double gx = 1.0 - fx;
        const double gy = 1.0 - fy;
        const double gz = 1.0 - fz;

        // Eight corners of the enclosing cell, each weighted by its per-axis factors
        return at(ix,     iy,     iz    ) * gx * gy * gz
             + at(ix + 1, iy,     iz    ) * fx * gy * gz
             + at(ix,     iy + 1, iz    ) * gx * fy * gz
             + at(ix + 1, iy + 1, iz    ) * fx * fy * gz
             + at(ix,     iy,     iz + 1) * gx * gy * fz
             + at(ix + 1, iy,     iz + 1) * fx * gy * fz
             + at(ix,     iy + 1, iz + 1) * gx * fy * fz
             + at(ix + 1, iy + 1, iz + 1) * fx * fy * fz;
    }

    template<typename Observer>
    double lookup(double x, double y, double z, Observer& observer) const noexcept {
        const double result = lookup(x, y, z);
        observer.on_lookup(LookupSample{3, {x, y, z}, result});
        return result;
    }

    double at(size_t i, size_t j, size_t k) const noexcept {
        return values_[(i * y_axis_.size() + j) * z_axis_.size() + k];
    }

    const Axis& x_axis() const noexcept { return x_axis_; }
    const Axis& y_axis() const noexcept { return y_axis_; }
    const Axis& z_axis() const noexcept { return z_axis_; }
    const std::vector<double>& values() const noexcept { return values_; }

private:
    Table3D(Axis x_axis, Axis y_axis, Axis z_axis, std::vector<double> values)
        : x_axis_(std::move(x_axis)),
          y_axis_(std::move(y_axis)),
          z_axis_(std::move(z_axis)),
          values_(std::move(values)) {}

    Axis x_axis_;
    Axis y_axis_;
    Axis z_axis_;
    std::vector<double> values_;
};

} // namespace vdlut
