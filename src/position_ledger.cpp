#include "position_ledger.hpp"

#include "market_error.hpp"

#include <limits>
#include <string>

namespace ud {

void PositionLedger::openBook(MarketId marketId) {
    books_.emplace(marketId, Book{});
}

const Position& PositionLedger::placePosition(Market& market,
                                              Direction direction,
                                              std::uint64_t stakeAmount,
                                              const Identity& caller,
                                              const PlatformConfig& cfg,
                                              Timestamp now,
                                              Escrow& escrow) {
    if (phase(market, now) != MarketPhase::Open) {
        throw MarketError(ErrorCode::MarketInactive,
                          "market " + std::to_string(market.id) + " is not accepting positions");
    }
    if (!isValidDirection(direction)) {
        throw MarketError(ErrorCode::InvalidPrediction, "unrecognized direction");
    }
    if (stakeAmount < cfg.minimumStake) {
        throw MarketError(ErrorCode::InvalidParameters,
                          "stake " + std::to_string(stakeAmount) + " is below the minimum of " +
                              std::to_string(cfg.minimumStake));
    }

    Book& positions = book(market.id);
    if (positions.count(caller) != 0) {
        throw MarketError(ErrorCode::PositionExists,
                          "participant already holds a position in market " + std::to_string(market.id));
    }

    constexpr std::uint64_t maxPool = std::numeric_limits<std::uint64_t>::max();
    if (market.totalPool() > maxPool - stakeAmount) {
        throw MarketError(ErrorCode::InvalidParameters, "total pool capacity exceeded");
    }

    if (escrow.debit(caller, stakeAmount) != EscrowResult::Ok) {
        throw MarketError(ErrorCode::InsufficientFunds,
                          "escrow could not debit " + std::to_string(stakeAmount));
    }

    Position position;
    position.marketId = market.id;
    position.participant = caller;
    position.direction = direction;
    position.stakeAmount = stakeAmount;
    position.placedAt = now;
    auto inserted = positions.emplace(caller, std::move(position)).first;

    if (direction == Direction::Up) {
        market.totalUpStake += stakeAmount;
    } else {
        market.totalDownStake += stakeAmount;
    }
    return inserted->second;
}

std::optional<Position> PositionLedger::getPosition(MarketId marketId, const Identity& participant) const {
    const Book* positions = findBook(marketId);
    if (positions == nullptr) {
        return std::nullopt;
    }
    auto it = positions->find(participant);
    if (it == positions->end()) {
        return std::nullopt;
    }
    return it->second;
}

Position* PositionLedger::find(MarketId marketId, const Identity& participant) {
    auto bookIt = books_.find(marketId);
    if (bookIt == books_.end()) {
        return nullptr;
    }
    auto it = bookIt->second.find(participant);
    if (it == bookIt->second.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<Position> PositionLedger::positionsFor(MarketId marketId) const {
    std::vector<Position> out;
    const Book* positions = findBook(marketId);
    if (positions == nullptr) {
        return out;
    }
    out.reserve(positions->size());
    for (const auto& entry : *positions) {
        out.push_back(entry.second);
    }
    return out;
}

std::uint64_t PositionLedger::stakeSum(MarketId marketId) const {
    std::uint64_t sum = 0;
    const Book* positions = findBook(marketId);
    if (positions == nullptr) {
        return sum;
    }
    for (const auto& entry : *positions) {
        sum += entry.second.stakeAmount;
    }
    return sum;
}

PositionLedger::Book& PositionLedger::book(MarketId marketId) {
    auto it = books_.find(marketId);
    if (it == books_.end()) {
        throw MarketError(ErrorCode::NotFound, "no position book for market " + std::to_string(marketId));
    }
    return it->second;
}

const PositionLedger::Book* PositionLedger::findBook(MarketId marketId) const {
    auto it = books_.find(marketId);
    return it == books_.end() ? nullptr : &it->second;
}

} // namespace ud
