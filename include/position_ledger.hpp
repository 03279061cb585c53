#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "collaborators.hpp"
#include "identity.hpp"
#include "market.hpp"
#include "platform_config.hpp"

namespace ud {

// Owns every position, one book per market. Books are created together with
// their market; afterwards a book is only touched under its market's lock.
class PositionLedger {
public:
    void openBook(MarketId marketId);

    // Secures the stake through escrow.debit before recording anything, and
    // bumps the matching accumulator on market.
    const Position& placePosition(Market& market,
                                  Direction direction,
                                  std::uint64_t stakeAmount,
                                  const Identity& caller,
                                  const PlatformConfig& cfg,
                                  Timestamp now,
                                  Escrow& escrow);

    std::optional<Position> getPosition(MarketId marketId, const Identity& participant) const;

    // nullptr when absent.
    Position* find(MarketId marketId, const Identity& participant);

    std::vector<Position> positionsFor(MarketId marketId) const;
    std::uint64_t stakeSum(MarketId marketId) const;

private:
    using Book = std::map<Identity, Position>;

    Book& book(MarketId marketId);
    const Book* findBook(MarketId marketId) const;

    std::map<MarketId, Book> books_;
};

} // namespace ud
