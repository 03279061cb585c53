#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "identity.hpp"

namespace ud {

using MarketId = std::uint64_t;
using Timestamp = std::uint64_t; // block height or wall time, caller's convention

enum class Direction : std::uint8_t {
    Up = 1,
    Down = 2,
};

bool isValidDirection(Direction direction);
const char* toString(Direction direction);

// External encodings: 1 = Up, 2 = Down; "up" / "down" (case-insensitive).
std::optional<Direction> directionFromCode(std::uint8_t code);
std::optional<Direction> directionFromString(const std::string& text);

struct Market {
    MarketId id = 0;
    std::uint64_t referencePrice = 0;
    std::uint64_t settlementPrice = 0; // 0 while unresolved
    std::uint64_t totalUpStake = 0;
    std::uint64_t totalDownStake = 0;
    Timestamp openAt = 0;
    Timestamp closeAt = 0;
    Timestamp createdAt = 0;
    bool resolved = false;

    std::uint64_t totalPool() const { return totalUpStake + totalDownStake; }
    std::uint64_t stakeOn(Direction direction) const {
        return direction == Direction::Up ? totalUpStake : totalDownStake;
    }
};

struct Position {
    MarketId marketId = 0;
    Identity participant;
    Direction direction = Direction::Up;
    std::uint64_t stakeAmount = 0;
    Timestamp placedAt = 0;
    bool claimed = false;
    std::uint64_t paidOut = 0; // net amount credited by the claim
};

enum class MarketPhase {
    Pending,  // now < openAt
    Open,     // openAt <= now < closeAt
    Closed,   // closeAt <= now, awaiting resolution
    Resolved, // terminal
};

const char* toString(MarketPhase phase);

// The only place lifecycle state is derived from the clock.
MarketPhase phase(const Market& market, Timestamp now);

} // namespace ud
