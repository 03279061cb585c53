#include "prediction_market.hpp"

#include "market_error.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace ud {

PredictionMarket::PredictionMarket(PlatformConfig cfg, ClockPtr clock, EscrowPtr escrow)
    : clock_(std::move(clock)), escrow_(std::move(escrow)), config_(std::move(cfg)) {
    if (!clock_) {
        throw std::runtime_error("Clock not configured");
    }
    if (!escrow_) {
        throw std::runtime_error("Escrow not configured");
    }
    validatePlatformConfig(config_);
}

MarketId PredictionMarket::createMarket(std::uint64_t referencePrice,
                                        Timestamp openAt,
                                        Timestamp closeAt,
                                        const Identity& caller) {
    PlatformConfig cfg = config();
    std::unique_lock<std::shared_mutex> lock(registryMutex_);
    Timestamp now = clock_->now();
    MarketId id = registry_.createMarket(referencePrice, openAt, closeAt, caller, cfg, now);
    ledger_.openBook(id);
    marketLocks_.emplace(id, std::make_unique<std::mutex>());

    std::ostringstream event;
    event << "market-created:" << id << ":" << referencePrice << ":" << openAt << ":" << closeAt << ":"
          << now;
    record(event.str());
    return id;
}

void PredictionMarket::placePosition(MarketId marketId,
                                     Direction direction,
                                     std::uint64_t stakeAmount,
                                     const Identity& caller) {
    PlatformConfig cfg = config();
    SharedLock registryLock(registryMutex_);
    MarketLock marketLock(marketMutex(marketId));
    Timestamp now = clock_->now();
    Market& market = registry_.at(marketId);
    const Position& position =
        ledger_.placePosition(market, direction, stakeAmount, caller, cfg, now, *escrow_);

    std::ostringstream event;
    event << "position-placed:" << marketId << ":" << caller << ":" << toString(position.direction) << ":"
          << position.stakeAmount << ":" << position.placedAt;
    record(event.str());
}

void PredictionMarket::resolveMarket(MarketId marketId,
                                     std::uint64_t settlementPrice,
                                     const Identity& caller) {
    resolveWithEvidence(marketId, settlementPrice, caller, {});
}

std::uint64_t PredictionMarket::claimRewards(MarketId marketId, const Identity& caller) {
    PlatformConfig cfg = config();
    SharedLock registryLock(registryMutex_);
    MarketLock marketLock(marketMutex(marketId));
    std::uint64_t amount = ud::claimRewards(registry_, ledger_, marketId, caller, cfg, *escrow_);

    std::ostringstream event;
    event << "reward-claimed:" << marketId << ":" << caller << ":" << amount;
    record(event.str());
    return amount;
}

std::optional<Market> PredictionMarket::getMarket(MarketId marketId) const {
    SharedLock registryLock(registryMutex_);
    if (!registry_.contains(marketId)) {
        return std::nullopt;
    }
    MarketLock marketLock(marketMutex(marketId));
    return registry_.getMarket(marketId);
}

std::optional<Position> PredictionMarket::getPosition(MarketId marketId, const Identity& participant) const {
    SharedLock registryLock(registryMutex_);
    if (!registry_.contains(marketId)) {
        return std::nullopt;
    }
    MarketLock marketLock(marketMutex(marketId));
    return ledger_.getPosition(marketId, participant);
}

MarketPhase PredictionMarket::getPhase(MarketId marketId) const {
    SharedLock registryLock(registryMutex_);
    MarketLock marketLock(marketMutex(marketId));
    return phase(registry_.at(marketId), clock_->now());
}

void PredictionMarket::setMinimumStake(const Identity& caller, std::uint64_t minimumStake) {
    std::lock_guard<std::mutex> lock(configMutex_);
    requireAdministrator(config_, caller);
    PlatformConfig candidate = config_;
    candidate.minimumStake = minimumStake;
    validatePlatformConfig(candidate);
    config_ = std::move(candidate);
    record("config-updated:minimum-stake:" + std::to_string(minimumStake));
}

void PredictionMarket::setPlatformFee(const Identity& caller, std::uint32_t feeBasisPoints) {
    std::lock_guard<std::mutex> lock(configMutex_);
    requireAdministrator(config_, caller);
    PlatformConfig candidate = config_;
    candidate.platformFeeBasisPoints = feeBasisPoints;
    validatePlatformConfig(candidate);
    config_ = std::move(candidate);
    record("config-updated:platform-fee-bps:" + std::to_string(feeBasisPoints));
}

void PredictionMarket::setOracle(const Identity& caller, const Identity& oracle) {
    std::lock_guard<std::mutex> lock(configMutex_);
    requireAdministrator(config_, caller);
    PlatformConfig candidate = config_;
    candidate.oracleIdentity = oracle;
    validatePlatformConfig(candidate);
    config_ = std::move(candidate);
    record("config-updated:oracle:" + oracle);
}

void PredictionMarket::transferAdministration(const Identity& caller, const Identity& administrator) {
    std::lock_guard<std::mutex> lock(configMutex_);
    requireAdministrator(config_, caller);
    PlatformConfig candidate = config_;
    candidate.administratorIdentity = administrator;
    validatePlatformConfig(candidate);
    config_ = std::move(candidate);
    record("config-updated:administrator:" + administrator);
}

PlatformConfig PredictionMarket::config() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

OracleObservation PredictionMarket::settleFromOracle(MarketId marketId, OracleBackend& oracle) {
    MarketPhase current = getPhase(marketId);
    if (current != MarketPhase::Closed) {
        throw MarketError(ErrorCode::MarketInactive,
                          "market " + std::to_string(marketId) + " is " + toString(current) +
                              ", not awaiting resolution");
    }
    OracleObservation observation = oracle.fetchObservation(marketId);
    std::string attestation = observation.evidence;
    if (!observation.signature.empty()) {
        attestation += "|" + observation.signature;
    }
    resolveWithEvidence(marketId, observation.settlementPrice, config().oracleIdentity, attestation);
    return observation;
}

Fixed64 PredictionMarket::impliedOdds(MarketId marketId, Direction direction) const {
    PlatformConfig cfg = config();
    SharedLock registryLock(registryMutex_);
    MarketLock marketLock(marketMutex(marketId));
    return ud::impliedOdds(registry_.at(marketId), direction, cfg.platformFeeBasisPoints);
}

LiabilitySnapshot PredictionMarket::snapshotLiabilities(MarketId marketId) const {
    PlatformConfig cfg = config();
    SharedLock registryLock(registryMutex_);
    MarketLock marketLock(marketMutex(marketId));
    return ud::snapshotLiabilities(
        registry_.at(marketId), ledger_.positionsFor(marketId), cfg.platformFeeBasisPoints);
}

std::size_t PredictionMarket::marketCount() const {
    SharedLock registryLock(registryMutex_);
    return registry_.size();
}

std::string PredictionMarket::getTranscriptRoot() const {
    std::lock_guard<std::mutex> lock(transcriptMutex_);
    return auditLog_.merkleRoot();
}

TranscriptLog PredictionMarket::getTranscript() const {
    std::lock_guard<std::mutex> lock(transcriptMutex_);
    return auditLog_;
}

std::mutex& PredictionMarket::marketMutex(MarketId marketId) const {
    auto it = marketLocks_.find(marketId);
    if (it == marketLocks_.end()) {
        throw MarketError(ErrorCode::NotFound, "market " + std::to_string(marketId) + " does not exist");
    }
    return *it->second;
}

void PredictionMarket::resolveWithEvidence(MarketId marketId,
                                           std::uint64_t settlementPrice,
                                           const Identity& caller,
                                           const std::string& evidence) {
    PlatformConfig cfg = config();
    SharedLock registryLock(registryMutex_);
    MarketLock marketLock(marketMutex(marketId));
    Timestamp now = clock_->now();
    registry_.resolveMarket(marketId, settlementPrice, caller, cfg, now);

    std::ostringstream event;
    event << "market-resolved:" << marketId << ":" << settlementPrice << ":"
          << toString(winningDirection(registry_.at(marketId))) << ":" << now;
    if (!evidence.empty()) {
        event << ":" << hashHex(evidence);
    }
    record(event.str());
}

void PredictionMarket::requireAdministrator(const PlatformConfig& cfg, const Identity& caller) const {
    if (!identitiesMatch(caller, cfg.administratorIdentity)) {
        throw MarketError(ErrorCode::Unauthorized, "only the administrator may change configuration");
    }
}

void PredictionMarket::record(const std::string& event) {
    std::lock_guard<std::mutex> lock(transcriptMutex_);
    auditLog_.append(event);
}

} // namespace ud
