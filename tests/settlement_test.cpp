#include "market_error.hpp"
#include "settlement.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "settlement_test failure: " << msg << std::endl;
    std::exit(1);
}

template <typename Fn>
void expectError(ud::ErrorCode expected, Fn&& fn, const std::string& what) {
    try {
        fn();
    } catch (const ud::MarketError& err) {
        if (err.code() != expected) {
            fail(what + ": expected " + ud::toString(expected) + ", got " + ud::toString(err.code()));
        }
        return;
    }
    fail(what + ": expected " + ud::toString(expected) + ", nothing thrown");
}

ud::Market resolvedMarket(std::uint64_t reference,
                          std::uint64_t settlement,
                          std::uint64_t up,
                          std::uint64_t down) {
    ud::Market market;
    market.id = 1;
    market.referencePrice = reference;
    market.settlementPrice = settlement;
    market.totalUpStake = up;
    market.totalDownStake = down;
    market.openAt = 1000;
    market.closeAt = 2000;
    market.resolved = true;
    return market;
}

ud::Position position(ud::Direction direction, std::uint64_t stake) {
    ud::Position out;
    out.marketId = 1;
    out.participant = "p";
    out.direction = direction;
    out.stakeAmount = stake;
    out.placedAt = 1500;
    return out;
}

} // namespace

int main() {
    using namespace ud;

    // Equal prices fall to the named tie rule, which must stay Down.
    if (kTieResolvesTo != Direction::Down) {
        fail("tie rule changed");
    }
    if (winningDirection(resolvedMarket(100, 101, 0, 0)) != Direction::Up) {
        fail("higher settlement should win Up");
    }
    if (winningDirection(resolvedMarket(100, 99, 0, 0)) != Direction::Down) {
        fail("lower settlement should win Down");
    }
    if (winningDirection(resolvedMarket(100, 100, 0, 0)) != kTieResolvesTo) {
        fail("equal settlement should follow the tie rule");
    }

    // 10M up against 20M down, BTC-style fixed-point prices, 2% fee.
    auto scenario = resolvedMarket(45'000'000'000, 47'000'000'000, 10'000'000, 20'000'000);
    auto breakdown = computePayout(scenario, position(Direction::Up, 10'000'000), 200);
    if (breakdown.grossShare != 30'000'000 || breakdown.fee != 600'000 ||
        breakdown.netPayout != 29'400'000) {
        fail("scenario payout mismatch: net " + std::to_string(breakdown.netPayout));
    }
    if (payout(scenario, position(Direction::Up, 10'000'000), 200) != 29'400'000) {
        fail("payout shortcut disagrees with breakdown");
    }
    if (payout(scenario, position(Direction::Up, 10'000'000), 0) != 30'000'000) {
        fail("zero fee should pay the whole gross share");
    }

    // Three equal winners over an indivisible pool: shares truncate, never round up.
    auto uneven = resolvedMarket(100, 150, 3'000'000, 1'000'001);
    std::uint64_t grossSum = 0;
    std::uint64_t netSum = 0;
    for (int i = 0; i < 3; ++i) {
        auto share = computePayout(uneven, position(Direction::Up, 1'000'000), 200);
        if (share.grossShare != 1'333'333) {
            fail("gross share should truncate toward zero");
        }
        if (share.fee != 26'666) {
            fail("fee should truncate toward zero");
        }
        grossSum += share.grossShare;
        netSum += share.netPayout;
    }
    if (grossSum > uneven.totalPool() || netSum > uneven.totalPool()) {
        fail("payouts overdraw the pool");
    }
    // Fee truncation leaves at most one unit per claimant above the exact net bound.
    unsigned __int128 exactNetBound =
        static_cast<unsigned __int128>(uneven.totalPool()) * (kBasisPointsDenominator - 200);
    if (static_cast<unsigned __int128>(netSum) * kBasisPointsDenominator >
        exactNetBound + 3 * static_cast<unsigned __int128>(kBasisPointsDenominator)) {
        fail("net payouts exceed the fee-adjusted pool");
    }

    // Large stakes go through 128-bit intermediates.
    auto large = resolvedMarket(1, 2, 9'000'000'000'000'000'000ULL, 9'000'000'000'000'000'000ULL);
    auto big = computePayout(large, position(Direction::Up, 9'000'000'000'000'000'000ULL), 0);
    if (big.grossShare != 18'000'000'000'000'000'000ULL) {
        fail("wide arithmetic lost precision");
    }

    auto unresolved = scenario;
    unresolved.resolved = false;
    expectError(ErrorCode::InvalidState,
                [&] { computePayout(unresolved, position(Direction::Up, 10'000'000), 200); },
                "unresolved payout");
    expectError(ErrorCode::InvalidState,
                [&] { computePayout(scenario, position(Direction::Down, 20'000'000), 200); },
                "losing payout");
    auto emptyWinner = resolvedMarket(100, 200, 0, 5'000'000);
    expectError(ErrorCode::InvalidState,
                [&] { computePayout(emptyWinner, position(Direction::Up, 1'000'000), 200); },
                "empty winning side");

    // Odds quote: 29.4M net pool over 10M up stake.
    if (impliedOdds(scenario, Direction::Up, 200).raw() != 2'940'000) {
        fail("implied up odds mismatch");
    }
    if (impliedOdds(scenario, Direction::Down, 200).raw() != 1'470'000) {
        fail("implied down odds mismatch");
    }
    if (!(impliedOdds(scenario, Direction::Down, 200) < impliedOdds(scenario, Direction::Up, 200))) {
        fail("minority side should quote longer odds");
    }
    if (std::abs(impliedOdds(scenario, Direction::Up, 200).toDouble() - 2.94) > 1e-9) {
        fail("odds quote should read as 2.94");
    }
    if (impliedOdds(emptyWinner, Direction::Up, 200) != Fixed64()) {
        fail("empty side should quote zero");
    }

    std::vector<Position> positions{ position(Direction::Up, 10'000'000),
                                     position(Direction::Down, 20'000'000) };
    positions[1].participant = "q";
    auto snapshot = snapshotLiabilities(scenario, positions, 200);
    if (snapshot.winner != Direction::Up || snapshot.outstanding != 29'400'000 ||
        snapshot.unclaimedWinners != 1 || snapshot.paidOut != 0) {
        fail("liability snapshot mismatch");
    }
    if (snapshot.merkleRoot.size() != 64) {
        fail("liability snapshot missing merkle root");
    }
    positions[0].claimed = true;
    positions[0].paidOut = 29'400'000;
    auto afterClaim = snapshotLiabilities(scenario, positions, 200);
    if (afterClaim.paidOut != 29'400'000 || afterClaim.outstanding != 0) {
        fail("claimed position should move to paid out");
    }
    if (afterClaim.merkleRoot == snapshot.merkleRoot) {
        fail("claim flag should change the position commitment");
    }
    expectError(ErrorCode::MarketUnresolved,
                [&] { snapshotLiabilities(unresolved, positions, 200); },
                "snapshot before resolution");

    std::cout << "settlement_test passed" << std::endl;
    return 0;
}
