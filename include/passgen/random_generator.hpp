#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "cryptlib.h"

#include "passgen/character_pool.hpp"
#include "passgen/pass_status.hpp"

namespace passgen {

constexpr std::size_t kMinRandomLength = 4;
constexpr std::size_t kMaxRandomLength = 128;
constexpr std::size_t kDefaultRandomLength = 16;

class RandomGenerator {
public:
    static PassStatus Generate(
        std::size_t length,
        const CharacterClasses& classes,
        std::string_view excluded,
        CryptoPP::RandomNumberGenerator& rng,
        std::string& out_password);
};

}  // namespace passgen
