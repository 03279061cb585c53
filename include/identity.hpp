#pragma once

#include <string>

namespace ud {

// Opaque caller token supplied by the host runtime on every call.
using Identity = std::string;

// Constant-time comparison; tokens of different length never match.
bool identitiesMatch(const Identity& a, const Identity& b);

// Fresh 32-byte random token, hex encoded.
Identity mintIdentity();

} // namespace ud
