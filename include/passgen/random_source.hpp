#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "cryptlib.h"

#include "passgen/pass_status.hpp"

namespace passgen {

class RandomSource {
public:
    // Without a seed the source is OS-seeded; with one it is a deterministic
    // AES-256 OFB keystream, so identical seeds replay identical draws.
    static std::unique_ptr<CryptoPP::RandomNumberGenerator> Create(
        const std::optional<std::uint64_t>& seed,
        PassStatus& out_status);

    // Uniform in [0, bound). bound must be non-zero.
    static PassStatus Index(CryptoPP::RandomNumberGenerator& rng, std::size_t bound, std::size_t& out_index);
    static PassStatus Range(CryptoPP::RandomNumberGenerator& rng, std::size_t min, std::size_t max, std::size_t& out_value);
    static PassStatus CoinFlip(CryptoPP::RandomNumberGenerator& rng, bool& out_heads);

    static void SecureWipeString(std::string& value);
};

}  // namespace passgen
