#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace vdlut {

/// One observed lookup: the query coordinates (unused ones are 0) and its result.
struct LookupSample {
    unsigned dimensions;
    std::array<double, 3> coordinates;
    double value;
};

/// Default observer, compiles down to nothing once inlined.
struct NullLookupObserver {
    void on_lookup(const LookupSample&) noexcept {}
};

/**
 * Fixed-capacity ring buffer of the most recent lookups.
 *
 * Storage lives inside the object, so recording never allocates or blocks.
 * When full, the oldest sample is overwritten and counted in dropped().
 * Not synchronized: use one recorder per thread.
 */
template<size_t Capacity>
class LookupRecorder {
    static_assert(Capacity > 0, "LookupRecorder needs a non-zero capacity");

public:
    void on_lookup(const LookupSample& sample) noexcept {
        samples_[head_] = sample;
        head_ = (head_ + 1) % Capacity;
        ++total_;
    }

    size_t size() const noexcept {
        return total_ < Capacity ? static_cast<size_t>(total_) : Capacity;
    }
    static constexpr size_t capacity() noexcept { return Capacity; }
    std::uint64_t total() const noexcept { return total_; }
    std::uint64_t dropped() const noexcept { return total_ - size(); }
    bool empty() const noexcept { return total_ == 0; }

    // Index 0 is the oldest retained sample
    const LookupSample& operator[](size_t i) const noexcept {
        const size_t oldest = total_ < Capacity ? 0 : head_;
        return samples_[(oldest + i) % Capacity];
    }

    // Must not be called on an empty recorder
    const LookupSample& latest() const noexcept {
        return samples_[(head_ + Capacity - 1) % Capacity];
    }

    void clear() noexcept {
        head_ = 0;
        total_ = 0;
    }

private:
    std::array<LookupSample, Capacity> samples_{};
    size_t head_ = 0;
    std::uint64_t total_ = 0;
};

} // namespace vdlut
