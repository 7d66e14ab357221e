#pragma once
#include <cstddef>
#include <utility>
#include <vector>

#include "axis.h"
#include "lookup_observer.h"

namespace vdlut {

/**
 * Sampled surface z = f(x, y) with bilinear interpolation.
 *
 * Values are stored row-major with x outermost: the value at
 * (x_axis[i], y_axis[j]) lives at values()[i * y_axis.size() + j].
 */
class Table2D {
public:
    /**
     * @param x_axis First independent axis
     * @param y_axis Second independent axis
     * @param grid Flat row-major grid of x_axis.size() * y_axis.size() values
     * @throws LutError InvalidAxis, GridSizeMismatch or InvalidValue
     */
    template<typename XContainer, typename YContainer, typename GridContainer>
    static Table2D build(const XContainer& x_axis, const YContainer& y_axis, const GridContainer& grid) {
        Axis x = Axis::build(x_axis, "x");
        Axis y = Axis::build(y_axis, "y");
        std::vector<double> data =
            detail::copy_values(grid, x.size() * y.size(), LutErrorKind::GridSizeMismatch);
        return Table2D(std::move(x), std::move(y), std::move(data));
    }

    /**
     * Nested-row form: rows[i] holds the values along y at x_axis[i]. A wrong
     * row count or row length is a GridSizeMismatch.
     */
    template<typename XContainer, typename YContainer>
    static Table2D build(const XContainer& x_axis, const YContainer& y_axis,
                         const std::vector<std::vector<double>>& rows) {
        Axis x = Axis::build(x_axis, "x");
        Axis y = Axis::build(y_axis, "y");

        const size_t expected = x.size() * y.size();
        size_t actual = 0;
        bool ragged = rows.size() != x.size();
        for (const auto& row : rows) {
            actual += row.size();
            ragged = ragged || row.size() != y.size();
        }
        if (ragged) {
            throw LutError::grid_size_mismatch(expected, actual);
        }

        std::vector<double> flat;
        flat.reserve(expected);
        for (const auto& row : rows) {
            flat.insert(flat.end(), row.begin(), row.end());
        }
        std::vector<double> data = detail::copy_values(flat, expected, LutErrorKind::GridSizeMismatch);
        return Table2D(std::move(x), std::move(y), std::move(data));
    }

    double lookup(double x, double y) const noexcept {
        const auto [ix, fx] = x_axis_.locate(x);
        const auto [iy, fy] = y_axis_.locate(y);

        // Get the four corner values
        const double v00 = at(ix, iy);
        const double v10 = at(ix + 1, iy);
        const double v01 = at(ix, iy + 1);
        const double v11 = at(ix + 1, iy + 1);

        const double gx = 1.0 - fx;
        const double gy = 1.0 - fy;
        return v00 * gx * gy + v10 * fx * gy + v01 * gx * fy + v11 * fx * fy;
    }

    template<typename Observer>
    double lookup(double x, double y, Observer& observer) const noexcept {
        const double result = lookup(x, y);
        observer.on_lookup(LookupSample{2, {x, y, 0.0}, result});
        return result;
    }

    double at(size_t i, size_t j) const noexcept {
        return values_[i * y_axis_.size() + j];
    }

    const Axis& x_axis() const noexcept { return x_axis_; }
    const Axis& y_axis() const noexcept { return y_axis_; }
    const std::vector<double>& values() const noexcept { return values_; }

private:
    Table2D(Axis x_axis, Axis y_axis, std::vector<double> values)
        : x_axis_(std::move(x_axis)), y_axis_(std::move(y_axis)), values_(std::move(values)) {}

    Axis x_axis_;
    Axis y_axis_;
    std::vector<double> values_;
};

} // namespace vdlut
