#pragma once

#include <cstdint>
#include <string>

#include "market.hpp"

namespace ud {

struct OracleObservation {
    std::uint64_t settlementPrice = 0;
    std::string evidence;
    std::string signature;
};

class OracleBackend {
public:
    virtual ~OracleBackend() = default;
    virtual OracleObservation fetchObservation(MarketId marketId) = 0;
};

} // namespace ud
