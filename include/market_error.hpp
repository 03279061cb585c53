#pragma once

#include <stdexcept>
#include <string>

namespace ud {

enum class ErrorCode {
    Unauthorized,
    NotFound,
    InvalidPrediction,
    MarketInactive,
    AlreadyClaimed,
    InsufficientFunds,
    InvalidParameters,
    MarketUnresolved,
    PositionExists,
    InvalidState,
};

const char* toString(ErrorCode code);

// Every rejected market operation throws exactly one of these. No state has
// been changed when it reaches the caller.
class MarketError : public std::runtime_error {
public:
    MarketError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(toString(code)) + ": " + message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace ud
