#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "identity.hpp"
#include "market.hpp"

namespace ud {

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

enum class EscrowResult { Ok, InsufficientFunds };

// Custody primitive. debit moves value from the participant into escrow,
// credit moves it back out.
class Escrow {
public:
    virtual ~Escrow() = default;
    virtual EscrowResult debit(const Identity& account, std::uint64_t amount) = 0;
    virtual void credit(const Identity& account, std::uint64_t amount) = 0;
};

using ClockPtr = std::shared_ptr<Clock>;
using EscrowPtr = std::shared_ptr<Escrow>;

class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override;
    void set(Timestamp value);
    void advance(Timestamp delta);

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

// In-memory balances with a single custody account.
class LedgerEscrow : public Escrow {
public:
    EscrowResult debit(const Identity& account, std::uint64_t amount) override;
    void credit(const Identity& account, std::uint64_t amount) override;

    void deposit(const Identity& account, std::uint64_t amount);
    std::uint64_t balanceOf(const Identity& account) const;
    std::uint64_t custodyBalance() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<Identity, std::uint64_t> balances_;
    std::uint64_t custody_ = 0;
};

} // namespace ud
