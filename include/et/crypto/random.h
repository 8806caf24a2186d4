#pragma once

#include <cstdint>
#include <span>

namespace et::crypto {

// Fills `out` from the operating system CSPRNG. Throws et::Error on failure.
void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace et::crypto
