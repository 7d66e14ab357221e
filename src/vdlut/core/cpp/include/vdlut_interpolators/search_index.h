#pragma once
#include <cmath>
#include <cstddef>

namespace vdlut {

/// Enclosing interval of a query: left endpoint index and position within it.
struct SearchIndex {
    size_t lower;
    double fraction;
};

/**
 * Locate a query on a strictly increasing breakpoint array.
 *
 * Returns the largest index i with axis[i] <= query together with the
 * normalized position of query inside [axis[i], axis[i+1]]. Queries below the
 * first breakpoint clamp to (0, 0.0), queries at or above the last clamp to
 * (n-2, 1.0). A NaN query yields (0, NaN).
 *
 * @param axis Breakpoints, at least 2, strictly increasing and finite
 * @param n Number of breakpoints
 * @param query Value to locate
 * @return Interval index in [0, n-2] and fraction in [0, 1]
 */
inline SearchIndex find_interval(const double* axis, size_t n, double query) noexcept {

    // Quick boundary checks
    if (query < axis[0]) return {0, 0.0};
    if (query >= axis[n - 1]) return {n - 2, 1.0};

    // Binary search
    size_t left = 0;
    size_t right = n - 1;

    while (right - left > 1) {
        const size_t mid = left + (right - left) / 2;

        if (axis[mid] <= query) {
            left = mid;
        } else {
            right = mid;
        }
    }

    const double x1 = axis[left];
    const double x2 = axis[right];
    return {left, (query - x1) / (x2 - x1)};
}

/**
 * Linear blend of a and b at position t.
 *
 * Exact at the ends (t == 0 gives a, t == 1 gives b) and monotonic in t, so a
 * lookup on a monotonic value sequence never steps backwards between
 * neighbouring queries. Same construction as C++20 std::lerp. A NaN t
 * propagates.
 */
inline double lerp(double a, double b, double t) noexcept {
    if (std::isnan(t)) return t;

    // Opposite signs: the weighted sum cannot cancel
    if ((a <= 0.0 && b >= 0.0) || (a >= 0.0 && b <= 0.0)) {
        return t * b + (1.0 - t) * a;
    }

    if (t == 1.0) return b;

    // a + t*(b-a) is monotonic in t but may round past b, clamp it
    const double x = a + t * (b - a);
    if ((t > 1.0) == (b > a)) {
        return b < x ? x : b;
    }
    return b > x ? x : b;
}

} // namespace vdlut
