#pragma once
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "lut_error.h"
#include "search_index.h"

namespace vdlut {

/**
 * Immutable, strictly increasing sequence of breakpoints.
 *
 * Built once through Axis::build, which rejects fewer than two points,
 * non-finite points and any pair that is not strictly increasing.
 */
class Axis {
public:
    /**
     * @param breakpoints Indexable container of breakpoints (size() and operator[])
     * @param name Axis label used in error messages
     * @throws LutError with kind InvalidAxis
     */
    template<typename Container>
    static Axis build(const Container& breakpoints, const std::string& name = "x") {
        const size_t n = breakpoints.size();
        if (n < 2) {
            throw LutError::invalid_axis(name, AxisDefect::TooFewPoints, n);
        }

        std::vector<double> points;
        points.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            const double value = static_cast<double>(breakpoints[i]);
            if (!std::isfinite(value)) {
                throw LutError::invalid_axis(name, AxisDefect::NonFinite, i);
            }
            if (i > 0 && value <= points.back()) {
                throw LutError::invalid_axis(name, AxisDefect::NotStrictlyIncreasing, i);
            }
            points.push_back(value);
        }
        return Axis(std::move(points), name);
    }

    SearchIndex locate(double query) const noexcept {
        return find_interval(points_.data(), points_.size(), query);
    }

    size_t size() const noexcept { return points_.size(); }
    double operator[](size_t i) const noexcept { return points_[i]; }
    double front() const noexcept { return points_.front(); }
    double back() const noexcept { return points_.back(); }

    const std::vector<double>& breakpoints() const noexcept { return points_; }
    const std::string& name() const noexcept { return name_; }

private:
    Axis(std::vector<double> points, std::string name)
        : points_(std::move(points)), name_(std::move(name)) {}

    std::vector<double> points_;
    std::string name_;
};

namespace detail {

    /// Copy table values after checking the count; non-finite entries are rejected.
    template<typename Container>
    std::vector<double> copy_values(const Container& values, size_t expected, LutErrorKind mismatch) {
        const size_t n = values.size();
        if (n != expected) {
            if (mismatch == LutErrorKind::LengthMismatch) {
                throw LutError::length_mismatch(expected, n);
            }
            throw LutError::grid_size_mismatch(expected, n);
        }

        std::vector<double> out;
        out.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            const double value = static_cast<double>(values[i]);
            if (!std::isfinite(value)) {
                throw LutError::invalid_value(i);
            }
            out.push_back(value);
        }
        return out;
    }

} // namespace detail

} // namespace vdlut
