#include "collaborators.hpp"

#include <limits>
#include <stdexcept>

namespace ud {

Timestamp ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::set(Timestamp value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (value < now_) {
        throw std::runtime_error("Clock cannot move backwards");
    }
    now_ = value;
}

void ManualClock::advance(Timestamp delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (now_ > std::numeric_limits<Timestamp>::max() - delta) {
        throw std::runtime_error("Clock overflow");
    }
    now_ += delta;
}

EscrowResult LedgerEscrow::debit(const Identity& account, std::uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    if (it == balances_.end() || it->second < amount) {
        return EscrowResult::InsufficientFunds;
    }
    if (custody_ > std::numeric_limits<std::uint64_t>::max() - amount) {
        throw std::runtime_error("Escrow custody capacity exceeded");
    }
    it->second -= amount;
    custody_ += amount;
    return EscrowResult::Ok;
}

void LedgerEscrow::credit(const Identity& account, std::uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount > custody_) {
        throw std::runtime_error("Escrow custody cannot cover credit");
    }
    auto& balance = balances_[account];
    if (balance > std::numeric_limits<std::uint64_t>::max() - amount) {
        throw std::runtime_error("Account balance overflow");
    }
    custody_ -= amount;
    balance += amount;
}

void LedgerEscrow::deposit(const Identity& account, std::uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& balance = balances_[account];
    if (balance > std::numeric_limits<std::uint64_t>::max() - amount) {
        throw std::runtime_error("Account balance overflow");
    }
    balance += amount;
}

std::uint64_t LedgerEscrow::balanceOf(const Identity& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

std::uint64_t LedgerEscrow::custodyBalance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return custody_;
}

} // namespace ud
