#include "market.hpp"

#include <algorithm>
#include <cctype>

namespace ud {

bool isValidDirection(Direction direction) {
    return direction == Direction::Up || direction == Direction::Down;
}

const char* toString(Direction direction) {
    switch (direction) {
    case Direction::Up:
        return "up";
    case Direction::Down:
        return "down";
    }
    return "invalid";
}

std::optional<Direction> directionFromCode(std::uint8_t code) {
    if (code == static_cast<std::uint8_t>(Direction::Up)) {
        return Direction::Up;
    }
    if (code == static_cast<std::uint8_t>(Direction::Down)) {
        return Direction::Down;
    }
    return std::nullopt;
}

std::optional<Direction> directionFromString(const std::string& text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "up") {
        return Direction::Up;
    }
    if (lowered == "down") {
        return Direction::Down;
    }
    return std::nullopt;
}

const char* toString(MarketPhase phase) {
    switch (phase) {
    case MarketPhase::Pending:
        return "pending";
    case MarketPhase::Open:
        return "open";
    case MarketPhase::Closed:
        return "closed";
    case MarketPhase::Resolved:
        return "resolved";
    }
    return "invalid";
}

MarketPhase phase(const Market& market, Timestamp now) {
    if (market.resolved) {
        return MarketPhase::Resolved;
    }
    if (now < market.openAt) {
        return MarketPhase::Pending;
    }
    if (now < market.closeAt) {
        return MarketPhase::Open;
    }
    return MarketPhase::Closed;
}

} // namespace ud
