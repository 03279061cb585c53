#pragma once

#include <cstdint>
#include <limits>

namespace ud {

// Deterministic fixed-point quotes. Settlement amounts never pass through
// here; they stay in whole stake units.
class Fixed64 {
public:
    static constexpr std::int64_t kScale = 1'000'000; // microunits

    Fixed64() : raw_(0) {}

    // numerator / denominator truncated toward zero; a zero denominator yields zero.
    static Fixed64 fromRatio(std::uint64_t numerator, std::uint64_t denominator) {
        if (denominator == 0) {
            return Fixed64();
        }
        unsigned __int128 wide = static_cast<unsigned __int128>(numerator) * kScale;
        wide /= denominator;
        if (wide > static_cast<unsigned __int128>(std::numeric_limits<std::int64_t>::max())) {
            return Fixed64(std::numeric_limits<std::int64_t>::max());
        }
        return Fixed64(static_cast<std::int64_t>(wide));
    }

    double toDouble() const { return static_cast<double>(raw_) / static_cast<double>(kScale); }
    std::int64_t raw() const { return raw_; }

    bool operator<(Fixed64 other) const { return raw_ < other.raw_; }
    bool operator==(Fixed64 other) const { return raw_ == other.raw_; }
    bool operator!=(Fixed64 other) const { return raw_ != other.raw_; }

private:
    explicit Fixed64(std::int64_t raw) : raw_(raw) {}

    std::int64_t raw_;
};

} // namespace ud
