#include "identity.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace ud {

namespace {

constexpr std::size_t kIdentityBytes = 32;

bool ensureSodium() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

} // namespace

bool identitiesMatch(const Identity& a, const Identity& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

Identity mintIdentity() {
    if (!ensureSodium()) {
        throw std::runtime_error("Unable to initialize libsodium RNG");
    }
    std::vector<std::uint8_t> buffer(kIdentityBytes);
    randombytes_buf(buffer.data(), buffer.size());

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : buffer) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    sodium_memzero(buffer.data(), buffer.size());
    return oss.str();
}

} // namespace ud
