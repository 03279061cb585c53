#include "market_registry.hpp"

#include "market_error.hpp"

#include <string>

namespace ud {

MarketId MarketRegistry::createMarket(std::uint64_t referencePrice,
                                      Timestamp openAt,
                                      Timestamp closeAt,
                                      const Identity& caller,
                                      const PlatformConfig& cfg,
                                      Timestamp now) {
    if (!identitiesMatch(caller, cfg.administratorIdentity)) {
        throw MarketError(ErrorCode::Unauthorized, "only the administrator may create markets");
    }
    if (closeAt <= openAt) {
        throw MarketError(ErrorCode::InvalidParameters, "closeAt must be after openAt");
    }
    if (referencePrice == 0) {
        throw MarketError(ErrorCode::InvalidParameters, "reference price must be positive");
    }
    if (closeAt <= now) {
        throw MarketError(ErrorCode::InvalidParameters, "closeAt must be in the future");
    }

    Market market;
    market.id = nextId_;
    market.referencePrice = referencePrice;
    market.openAt = openAt;
    market.closeAt = closeAt;
    market.createdAt = now;
    markets_.emplace(market.id, market);
    ++nextId_;
    return market.id;
}

void MarketRegistry::resolveMarket(MarketId marketId,
                                   std::uint64_t settlementPrice,
                                   const Identity& caller,
                                   const PlatformConfig& cfg,
                                   Timestamp now) {
    Market& market = at(marketId);
    if (!identitiesMatch(caller, cfg.oracleIdentity)) {
        throw MarketError(ErrorCode::Unauthorized, "only the oracle may resolve markets");
    }
    if (market.resolved) {
        throw MarketError(ErrorCode::MarketInactive,
                          "market " + std::to_string(marketId) + " is already resolved");
    }
    if (now < market.closeAt) {
        throw MarketError(ErrorCode::MarketInactive,
                          "market " + std::to_string(marketId) + " has not closed");
    }
    if (settlementPrice == 0) {
        throw MarketError(ErrorCode::InvalidParameters, "settlement price must be positive");
    }
    market.settlementPrice = settlementPrice;
    market.resolved = true;
}

std::optional<Market> MarketRegistry::getMarket(MarketId marketId) const {
    auto it = markets_.find(marketId);
    if (it == markets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Market& MarketRegistry::at(MarketId marketId) {
    auto it = markets_.find(marketId);
    if (it == markets_.end()) {
        throw MarketError(ErrorCode::NotFound, "market " + std::to_string(marketId) + " does not exist");
    }
    return it->second;
}

const Market& MarketRegistry::at(MarketId marketId) const {
    auto it = markets_.find(marketId);
    if (it == markets_.end()) {
        throw MarketError(ErrorCode::NotFound, "market " + std::to_string(marketId) + " does not exist");
    }
    return it->second;
}

} // namespace ud
