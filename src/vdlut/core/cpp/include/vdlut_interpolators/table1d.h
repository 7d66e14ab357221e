#pragma once
#include <cstddef>
#include <utility>
#include <vector>

#include "axis.h"
#include "lookup_observer.h"

namespace vdlut {

/**
 * Sampled function y = f(x) with linear interpolation between knots.
 *
 * Queries outside the axis are clamped to the first or last value.
 * lookup() is O(log n), allocation free and never throws.
 */
class Table1D {
public:
    /**
     * @param axis Breakpoints, at least 2, strictly increasing and finite
     * @param values Dependent values, one per breakpoint
     * @throws LutError InvalidAxis, LengthMismatch or InvalidValue
     */
    template<typename AxisContainer, typename ValueContainer>
    static Table1D build(const AxisContainer& axis, const ValueContainer& values) {
        Axis x = Axis::build(axis, "x");
        std::vector<double> data = detail::copy_values(values, x.size(), LutErrorKind::LengthMismatch);
        return Table1D(std::move(x), std::move(data));
    }

    double lookup(double x) const noexcept {
        const auto [i, f] = axis_.locate(x);
        return lerp(values_[i], values_[i + 1], f);
    }

    template<typename Observer>
    double lookup(double x, Observer& observer) const noexcept {
        const double result = lookup(x);
        observer.on_lookup(LookupSample{1, {x, 0.0, 0.0}, result});
        return result;
    }

    const Axis& axis() const noexcept { return axis_; }
    const std::vector<double>& values() const noexcept { return values_; }
    size_t size() const noexcept { return values_.size(); }

private:
    Table1D(Axis axis, std::vector<double> values)
        : axis_(std::move(axis)), values_(std::move(values)) {}

    Axis axis_;
    std::vector<double> values_;
};

} // namespace vdlut
