#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>

#include "identity.hpp"
#include "market.hpp"
#include "platform_config.hpp"

namespace ud {

// Owns every market record. Markets are never removed. Not synchronized;
// PredictionMarket serializes access.
class MarketRegistry {
public:
    MarketId createMarket(std::uint64_t referencePrice,
                          Timestamp openAt,
                          Timestamp closeAt,
                          const Identity& caller,
                          const PlatformConfig& cfg,
                          Timestamp now);

    void resolveMarket(MarketId marketId,
                       std::uint64_t settlementPrice,
                       const Identity& caller,
                       const PlatformConfig& cfg,
                       Timestamp now);

    std::optional<Market> getMarket(MarketId marketId) const;

    // Throws MarketError(NotFound).
    Market& at(MarketId marketId);
    const Market& at(MarketId marketId) const;

    bool contains(MarketId marketId) const { return markets_.count(marketId) != 0; }
    std::size_t size() const { return markets_.size(); }
    MarketId nextMarketId() const { return nextId_; }

private:
    std::map<MarketId, Market> markets_;
    MarketId nextId_ = 1;
};

} // namespace ud
