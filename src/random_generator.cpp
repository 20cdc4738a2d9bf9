#include "passgen/random_generator.hpp"

#include <utility>

#include "passgen/random_source.hpp"

namespace passgen {

PassStatus RandomGenerator::Generate(
    const std::size_t length,
    const CharacterClasses& classes,
    const std::string_view excluded,
    CryptoPP::RandomNumberGenerator& rng,
    std::string& out_password) {
    out_password.clear();
    if (length < kMinRandomLength || length > kMaxRandomLength) {
        return PassStatus::InvalidArgument;
    }

    std::string pool;
    const PassStatus pool_status = CharacterPool::Build(classes, excluded, pool);
    if (pool_status != PassStatus::Ok) {
        return pool_status;
    }

    std::string password;
    password.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        std::size_t index = 0;
        const PassStatus status = RandomSource::Index(rng, pool.size(), index);
        if (status != PassStatus::Ok) {
            RandomSource::SecureWipeString(password);
            return status;
        }
        password.push_back(pool[index]);
    }
    out_password = std::move(password);
    return PassStatus::Ok;
}

}  // namespace passgen
