#include "passgen/random_source.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <memory>

#include "aes.h"
#include "misc.h"
#include "modes.h"
#include "osrng.h"

namespace passgen {

namespace {

constexpr std::size_t kSeedKeySize = 32;
constexpr std::size_t kSeedIvSize = 16;

std::array<std::uint8_t, kSeedKeySize> KeyFromSeed(const std::uint64_t seed) {
    std::array<std::uint8_t, kSeedKeySize> key{};
    for (std::size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<std::uint8_t>((seed >> ((i % 8U) * 8U)) & 0xFFU);
    }
    return key;
}

}  // namespace

std::unique_ptr<CryptoPP::RandomNumberGenerator> RandomSource::Create(
    const std::optional<std::uint64_t>& seed,
    PassStatus& out_status) {
    try {
        if (!seed.has_value()) {
            auto rng = std::make_unique<CryptoPP::AutoSeededRandomPool>();
            out_status = PassStatus::Ok;
            return rng;
        }

        std::array<std::uint8_t, kSeedKeySize> key = KeyFromSeed(*seed);
        const std::array<std::uint8_t, kSeedIvSize> iv{};
        auto rng = std::make_unique<CryptoPP::OFB_Mode<CryptoPP::AES>::Encryption>();
        rng->SetKeyWithIV(key.data(), key.size(), iv.data(), iv.size());
        CryptoPP::memset_z(key.data(), 0, key.size());
        out_status = PassStatus::Ok;
        return rng;
    } catch (const CryptoPP::Exception&) {
        out_status = PassStatus::MissingRngBytes;
        return nullptr;
    }
}

PassStatus RandomSource::Index(CryptoPP::RandomNumberGenerator& rng, const std::size_t bound, std::size_t& out_index) {
    if (bound == 0) {
        return PassStatus::InvalidArgument;
    }
    return Range(rng, 0, bound - 1, out_index);
}

PassStatus RandomSource::Range(
    CryptoPP::RandomNumberGenerator& rng,
    const std::size_t min,
    const std::size_t max,
    std::size_t& out_value) {
    if (min > max || max > static_cast<std::size_t>(std::numeric_limits<CryptoPP::word32>::max())) {
        return PassStatus::InvalidArgument;
    }
    try {
        out_value = static_cast<std::size_t>(
            rng.GenerateWord32(static_cast<CryptoPP::word32>(min), static_cast<CryptoPP::word32>(max)));
    } catch (const CryptoPP::Exception&) {
        return PassStatus::MissingRngBytes;
    }
    return PassStatus::Ok;
}

PassStatus RandomSource::CoinFlip(CryptoPP::RandomNumberGenerator& rng, bool& out_heads) {
    try {
        out_heads = rng.GenerateBit() != 0U;
    } catch (const CryptoPP::Exception&) {
        return PassStatus::MissingRngBytes;
    }
    return PassStatus::Ok;
}

void RandomSource::SecureWipeString(std::string& value) {
    if (!value.empty()) {
        CryptoPP::memset_z(&value[0], 0, value.size());
    }
    value.clear();
}

}  // namespace passgen
