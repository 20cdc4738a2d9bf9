#include "passgen/character_pool.hpp"

#include <utility>

namespace passgen {

PassStatus CharacterPool::Build(const CharacterClasses& classes, const std::string_view excluded, std::string& out_pool) {
    out_pool.clear();

    std::string candidates;
    if (classes.lower) {
        candidates += Lowercase();
    }
    if (classes.upper) {
        candidates += Uppercase();
    }
    if (classes.digits) {
        candidates += Digits();
    }
    if (classes.punct) {
        candidates += Punctuation();
    }

    std::string pool;
    pool.reserve(candidates.size());
    for (const char ch : candidates) {
        if (excluded.find(ch) == std::string_view::npos) {
            pool.push_back(ch);
        }
    }

    if (pool.empty()) {
        return PassStatus::EmptyPool;
    }
    out_pool = std::move(pool);
    return PassStatus::Ok;
}

const std::string& CharacterPool::Lowercase() {
    static const std::string chars = "abcdefghijklmnopqrstuvwxyz";
    return chars;
}

const std::string& CharacterPool::Uppercase() {
    static const std::string chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    return chars;
}

const std::string& CharacterPool::Digits() {
    static const std::string chars = "0123456789";
    return chars;
}

const std::string& CharacterPool::Punctuation() {
    static const std::string chars = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";
    return chars;
}

}  // namespace passgen
