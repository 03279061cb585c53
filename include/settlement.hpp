#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "fixed_point.hpp"
#include "identity.hpp"
#include "market.hpp"
#include "market_registry.hpp"
#include "platform_config.hpp"
#include "position_ledger.hpp"

namespace ud {

// A settlement price equal to the reference price is not a tie: the market
// resolves to this side. Changing it changes who gets paid.
constexpr Direction kTieResolvesTo = Direction::Down;

Direction winningDirection(const Market& market);

struct PayoutBreakdown {
    std::uint64_t grossShare = 0;
    std::uint64_t fee = 0;
    std::uint64_t netPayout = 0;
};

// grossShare = floor(stake * totalPool / winningPool)
// fee        = floor(grossShare * feeBps / 10000)
// Throws MarketError(InvalidState) unless the market is resolved, the position
// is on the winning side and that side holds stake.
PayoutBreakdown computePayout(const Market& market, const Position& position, std::uint32_t feeBps);

inline std::uint64_t payout(const Market& market, const Position& position, std::uint32_t feeBps) {
    return computePayout(market, position, feeBps).netPayout;
}

// Marks the caller's position claimed, then credits the net payout through
// escrow. If the credit throws the claim flag is restored and the exception
// propagates.
std::uint64_t claimRewards(const MarketRegistry& registry,
                           PositionLedger& ledger,
                           MarketId marketId,
                           const Identity& caller,
                           const PlatformConfig& cfg,
                           Escrow& escrow);

// Net pool after fee divided by the stake on direction; zero for an empty side.
Fixed64 impliedOdds(const Market& market, Direction direction, std::uint32_t feeBps);

struct LiabilitySnapshot {
    MarketId marketId = 0;
    Direction winner = kTieResolvesTo;
    std::uint64_t totalPool = 0;
    std::uint64_t winningPool = 0;
    std::uint64_t paidOut = 0;
    std::uint64_t outstanding = 0;
    std::size_t unclaimedWinners = 0;
    std::string merkleRoot; // over every position of the market, empty if none
};

// Requires a resolved market; throws MarketError(MarketUnresolved) otherwise.
LiabilitySnapshot snapshotLiabilities(const Market& market,
                                      const std::vector<Position>& positions,
                                      std::uint32_t feeBps);

} // namespace ud
