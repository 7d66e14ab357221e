#include "include/vdlut_interpolators/lut_error.h"

namespace vdlut {

LutError::LutError(LutErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

LutError LutError::invalid_axis(
    const std::string& axis_name,
    AxisDefect defect,
    size_t index) {

    std::string message = "Invalid " + axis_name + " axis: ";
    switch (defect) {
        case AxisDefect::TooFewPoints:
            message += "needs at least 2 breakpoints, got " + std::to_string(index);
            break;
        case AxisDefect::NotStrictlyIncreasing:
            message += "not strictly increasing at index " + std::to_string(index);
            break;
        case AxisDefect::NonFinite:
            message += "non-finite breakpoint at index " + std::to_string(index);
            break;
        case AxisDefect::None:
            break;
    }

    LutError error(LutErrorKind::InvalidAxis, message);
    error.defect_ = defect;
    error.axis_name_ = axis_name;
    error.index_ = index;
    return error;
}

LutError LutError::length_mismatch(size_t expected, size_t actual) {
    LutError error(LutErrorKind::LengthMismatch,
                   "Value length mismatch: expected " + std::to_string(expected) +
                   ", got " + std::to_string(actual));
    error.expected_ = expected;
    error.actual_ = actual;
    return error;
}

LutError LutError::grid_size_mismatch(size_t expected, size_t actual) {
    LutError error(LutErrorKind::GridSizeMismatch,
                   "Grid size mismatch: expected " + std::to_string(expected) +
                   " values, got " + std::to_string(actual));
    error.expected_ = expected;
    error.actual_ = actual;
    return error;
}

LutError LutError::invalid_value(size_t index) {
    LutError error(LutErrorKind::InvalidValue,
                   "Non-finite table value at index " + std::to_string(index));
    error.index_ = index;
    return error;
}

const char* to_string(LutErrorKind kind) noexcept {
    switch (kind) {
        case LutErrorKind::InvalidAxis: return "InvalidAxis";
        case LutErrorKind::LengthMismatch: return "LengthMismatch";
        case LutErrorKind::GridSizeMismatch: return "GridSizeMismatch";
        case LutErrorKind::InvalidValue: return "InvalidValue";
    }
    return "Unknown";
}

const char* to_string(AxisDefect defect) noexcept {
    switch (defect) {
        case AxisDefect::None: return "None";
        case AxisDefect::TooFewPoints: return "TooFewPoints";
        case AxisDefect::NotStrictlyIncreasing: return "NotStrictlyIncreasing";
        case AxisDefect::NonFinite: return "NonFinite";
    }
    return "Unknown";
}

} // namespace vdlut
