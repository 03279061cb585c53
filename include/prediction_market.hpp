#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#include "collaborators.hpp"
#include "fixed_point.hpp"
#include "identity.hpp"
#include "market.hpp"
#include "market_registry.hpp"
#include "oracle.hpp"
#include "platform_config.hpp"
#include "position_ledger.hpp"
#include "settlement.hpp"
#include "transcript_log.hpp"

namespace ud {

// Ties the registry, the ledger and the settlement rules to the clock and
// escrow collaborators. Every operation is atomic: operations on one market
// are serialized, operations on different markets may run in parallel.
class PredictionMarket {
public:
    PredictionMarket(PlatformConfig cfg, ClockPtr clock, EscrowPtr escrow);

    MarketId createMarket(std::uint64_t referencePrice,
                          Timestamp openAt,
                          Timestamp closeAt,
                          const Identity& caller);
    void placePosition(MarketId marketId,
                       Direction direction,
                       std::uint64_t stakeAmount,
                       const Identity& caller);
    void resolveMarket(MarketId marketId, std::uint64_t settlementPrice, const Identity& caller);
    std::uint64_t claimRewards(MarketId marketId, const Identity& caller);

    std::optional<Market> getMarket(MarketId marketId) const;
    std::optional<Position> getPosition(MarketId marketId, const Identity& participant) const;
    MarketPhase getPhase(MarketId marketId) const;

    void setMinimumStake(const Identity& caller, std::uint64_t minimumStake);
    void setPlatformFee(const Identity& caller, std::uint32_t feeBasisPoints);
    void setOracle(const Identity& caller, const Identity& oracle);
    void transferAdministration(const Identity& caller, const Identity& administrator);
    PlatformConfig config() const;

    // Resolves with the backend's observed price on behalf of the configured
    // oracle identity.
    OracleObservation settleFromOracle(MarketId marketId, OracleBackend& oracle);

    Fixed64 impliedOdds(MarketId marketId, Direction direction) const;
    LiabilitySnapshot snapshotLiabilities(MarketId marketId) const;
    std::size_t marketCount() const;

    std::string getTranscriptRoot() const;
    TranscriptLog getTranscript() const;

private:
    using SharedLock = std::shared_lock<std::shared_mutex>;
    using MarketLock = std::unique_lock<std::mutex>;

    std::mutex& marketMutex(MarketId marketId) const;
    void resolveWithEvidence(MarketId marketId,
                             std::uint64_t settlementPrice,
                             const Identity& caller,
                             const std::string& evidence);
    void requireAdministrator(const PlatformConfig& cfg, const Identity& caller) const;
    void record(const std::string& event);

    ClockPtr clock_;
    EscrowPtr escrow_;

    mutable std::mutex configMutex_;
    PlatformConfig config_;

    // Exclusive for market creation, shared for everything else.
    mutable std::shared_mutex registryMutex_;
    MarketRegistry registry_;
    PositionLedger ledger_;
    std::map<MarketId, std::unique_ptr<std::mutex>> marketLocks_;

    mutable std::mutex transcriptMutex_;
    TranscriptLog auditLog_;
};

} // namespace ud
