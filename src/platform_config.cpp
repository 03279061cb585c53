#include "platform_config.hpp"

#include "market_error.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace ud {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::optional<std::string> readEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return std::nullopt;
    }
    return trim(env);
}

std::uint64_t parseUnsigned(const char* name, const std::string& text) {
    if (text.empty()) {
        throw MarketError(ErrorCode::InvalidParameters, std::string(name) + " is empty");
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw MarketError(ErrorCode::InvalidParameters,
                              std::string(name) + " must be an unsigned integer, got \"" + text + "\"");
        }
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw MarketError(ErrorCode::InvalidParameters, std::string(name) + " is out of range");
    }
}

} // namespace

void validatePlatformConfig(const PlatformConfig& cfg) {
    if (cfg.administratorIdentity.empty()) {
        throw MarketError(ErrorCode::InvalidParameters, "administrator identity must be set");
    }
    if (cfg.oracleIdentity.empty()) {
        throw MarketError(ErrorCode::InvalidParameters, "oracle identity must be set");
    }
    if (cfg.minimumStake == 0) {
        throw MarketError(ErrorCode::InvalidParameters, "minimum stake must be positive");
    }
    if (cfg.platformFeeBasisPoints > kMaxPlatformFeeBasisPoints) {
        throw MarketError(ErrorCode::InvalidParameters,
                          "platform fee exceeds " + std::to_string(kMaxPlatformFeeBasisPoints) +
                              " basis points");
    }
}

PlatformConfig loadPlatformConfigFromEnv(PlatformConfig base) {
    if (auto admin = readEnv("UD_ADMIN_ID")) {
        base.administratorIdentity = *admin;
    }
    if (auto oracle = readEnv("UD_ORACLE_ID")) {
        base.oracleIdentity = *oracle;
    }
    if (auto minStake = readEnv("UD_MIN_STAKE")) {
        base.minimumStake = parseUnsigned("UD_MIN_STAKE", *minStake);
    }
    if (auto fee = readEnv("UD_FEE_BPS")) {
        std::uint64_t bps = parseUnsigned("UD_FEE_BPS", *fee);
        if (bps > std::numeric_limits<std::uint32_t>::max()) {
            throw MarketError(ErrorCode::InvalidParameters, "UD_FEE_BPS is out of range");
        }
        base.platformFeeBasisPoints = static_cast<std::uint32_t>(bps);
    }
    validatePlatformConfig(base);
    return base;
}

} // namespace ud
