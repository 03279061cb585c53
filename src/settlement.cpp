#include "settlement.hpp"

#include "market_error.hpp"
#include "transcript_log.hpp"

#include <sstream>
#include <string>

namespace ud {

namespace {

std::uint64_t applyBasisPoints(std::uint64_t amount, std::uint32_t bps) {
    unsigned __int128 wide = static_cast<unsigned __int128>(amount) * bps;
    return static_cast<std::uint64_t>(wide / kBasisPointsDenominator);
}

std::string positionLeaf(const Position& position) {
    std::ostringstream oss;
    oss << position.marketId << "|" << position.participant << "|" << toString(position.direction) << "|"
        << position.stakeAmount << "|" << position.placedAt << "|" << (position.claimed ? 1 : 0);
    return hashHex(oss.str());
}

} // namespace

Direction winningDirection(const Market& market) {
    if (market.settlementPrice > market.referencePrice) {
        return Direction::Up;
    }
    return kTieResolvesTo;
}

PayoutBreakdown computePayout(const Market& market, const Position& position, std::uint32_t feeBps) {
    if (!market.resolved) {
        throw MarketError(ErrorCode::InvalidState, "payout requested for an unresolved market");
    }
    if (feeBps > kBasisPointsDenominator) {
        throw MarketError(ErrorCode::InvalidParameters, "fee exceeds 100%");
    }
    Direction winner = winningDirection(market);
    if (position.direction != winner) {
        throw MarketError(ErrorCode::InvalidState, "payout requested for a losing position");
    }
    std::uint64_t winningPool = market.stakeOn(winner);
    if (winningPool == 0) {
        throw MarketError(ErrorCode::InvalidState,
                          "market " + std::to_string(market.id) + " has no stake on the winning side");
    }

    // stake <= winningPool, so the quotient never exceeds totalPool.
    unsigned __int128 scaled =
        static_cast<unsigned __int128>(position.stakeAmount) * market.totalPool();
    PayoutBreakdown out;
    out.grossShare = static_cast<std::uint64_t>(scaled / winningPool);
    out.fee = applyBasisPoints(out.grossShare, feeBps);
    out.netPayout = out.grossShare - out.fee;
    return out;
}

std::uint64_t claimRewards(const MarketRegistry& registry,
                           PositionLedger& ledger,
                           MarketId marketId,
                           const Identity& caller,
                           const PlatformConfig& cfg,
                           Escrow& escrow) {
    const Market& market = registry.at(marketId);
    if (!market.resolved) {
        throw MarketError(ErrorCode::MarketUnresolved,
                          "market " + std::to_string(marketId) + " is not resolved yet");
    }
    Position* position = ledger.find(marketId, caller);
    if (position == nullptr) {
        throw MarketError(ErrorCode::NotFound,
                          "no position for caller in market " + std::to_string(marketId));
    }
    if (position->claimed) {
        throw MarketError(ErrorCode::AlreadyClaimed, "rewards already claimed");
    }
    Direction winner = winningDirection(market);
    if (market.stakeOn(winner) == 0) {
        throw MarketError(ErrorCode::InvalidState,
                          "market " + std::to_string(marketId) + " has no stake on the winning side");
    }
    if (position->direction != winner) {
        throw MarketError(ErrorCode::InvalidPrediction, "position is on the losing side");
    }

    PayoutBreakdown amounts = computePayout(market, *position, cfg.platformFeeBasisPoints);

    position->claimed = true;
    position->paidOut = amounts.netPayout;
    try {
        escrow.credit(caller, amounts.netPayout);
    } catch (...) {
        position->claimed = false;
        position->paidOut = 0;
        throw;
    }
    return amounts.netPayout;
}

Fixed64 impliedOdds(const Market& market, Direction direction, std::uint32_t feeBps) {
    if (!isValidDirection(direction)) {
        return Fixed64();
    }
    std::uint64_t sideStake = market.stakeOn(direction);
    if (sideStake == 0) {
        return Fixed64();
    }
    std::uint64_t pool = market.totalPool();
    std::uint64_t netPool = pool - applyBasisPoints(pool, feeBps);
    return Fixed64::fromRatio(netPool, sideStake);
}

LiabilitySnapshot snapshotLiabilities(const Market& market,
                                      const std::vector<Position>& positions,
                                      std::uint32_t feeBps) {
    if (!market.resolved) {
        throw MarketError(ErrorCode::MarketUnresolved,
                          "market " + std::to_string(market.id) + " is not resolved yet");
    }

    LiabilitySnapshot snapshot;
    snapshot.marketId = market.id;
    snapshot.winner = winningDirection(market);
    snapshot.totalPool = market.totalPool();
    snapshot.winningPool = market.stakeOn(snapshot.winner);

    std::vector<std::string> leaves;
    leaves.reserve(positions.size());
    for (const auto& position : positions) {
        leaves.push_back(positionLeaf(position));
        if (position.direction != snapshot.winner || snapshot.winningPool == 0) {
            continue;
        }
        if (position.claimed) {
            snapshot.paidOut += position.paidOut;
        } else {
            snapshot.outstanding += computePayout(market, position, feeBps).netPayout;
            ++snapshot.unclaimedWinners;
        }
    }
    if (!leaves.empty()) {
        snapshot.merkleRoot = merkleRootOf(std::move(leaves));
    }
    return snapshot;
}

} // namespace ud
