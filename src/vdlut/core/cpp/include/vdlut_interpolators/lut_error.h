#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace vdlut {

enum class LutErrorKind {
    InvalidAxis,
    LengthMismatch,
    GridSizeMismatch,
    InvalidValue
};

enum class AxisDefect {
    None,
    TooFewPoints,
    NotStrictlyIncreasing,
    NonFinite
};

/**
 * Construction-time failure of an Axis or a lookup table.
 *
 * Thrown only by the build functions; lookups never throw. kind() tells the
 * caller which invariant was violated, the remaining accessors carry the
 * details relevant to that kind (unused fields are empty or zero).
 */
class LutError : public std::runtime_error {
public:
    static LutError invalid_axis(const std::string& axis_name, AxisDefect defect, size_t index);
    static LutError length_mismatch(size_t expected, size_t actual);
    static LutError grid_size_mismatch(size_t expected, size_t actual);
    static LutError invalid_value(size_t index);

    LutErrorKind kind() const noexcept { return kind_; }
    AxisDefect axis_defect() const noexcept { return defect_; }
    const std::string& axis_name() const noexcept { return axis_name_; }
    size_t index() const noexcept { return index_; }
    size_t expected() const noexcept { return expected_; }
    size_t actual() const noexcept { return actual_; }

private:
    LutError(LutErrorKind kind, const std::string& message);

    LutErrorKind kind_;
    AxisDefect defect_ = AxisDefect::None;
    std::string axis_name_;
    size_t index_ = 0;
    size_t expected_ = 0;
    size_t actual_ = 0;
};

const char* to_string(LutErrorKind kind) noexcept;
const char* to_string(AxisDefect defect) noexcept;

} // namespace vdlut
