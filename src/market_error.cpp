#include "market_error.hpp"

namespace ud {

const char* toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::Unauthorized:
        return "unauthorized";
    case ErrorCode::NotFound:
        return "not_found";
    case ErrorCode::InvalidPrediction:
        return "invalid_prediction";
    case ErrorCode::MarketInactive:
        return "market_inactive";
    case ErrorCode::AlreadyClaimed:
        return "already_claimed";
    case ErrorCode::InsufficientFunds:
        return "insufficient_funds";
    case ErrorCode::InvalidParameters:
        return "invalid_parameters";
    case ErrorCode::MarketUnresolved:
        return "market_unresolved";
    case ErrorCode::PositionExists:
        return "position_exists";
    case ErrorCode::InvalidState:
        return "invalid_state";
    }
    return "unknown";
}

} // namespace ud
