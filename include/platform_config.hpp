#pragma once

#include <cstdint>

#include "identity.hpp"

namespace ud {

constexpr std::uint32_t kBasisPointsDenominator = 10'000;
constexpr std::uint32_t kMaxPlatformFeeBasisPoints = 1'000; // 10%

struct PlatformConfig {
    Identity administratorIdentity;
    Identity oracleIdentity;
    std::uint64_t minimumStake = 1'000'000;
    std::uint32_t platformFeeBasisPoints = 200;
};

// Throws MarketError(InvalidParameters) describing the first bad field.
void validatePlatformConfig(const PlatformConfig& cfg);

// Overlays UD_ADMIN_ID, UD_ORACLE_ID, UD_MIN_STAKE and UD_FEE_BPS on base and
// validates the result.
PlatformConfig loadPlatformConfigFromEnv(PlatformConfig base);

} // namespace ud
