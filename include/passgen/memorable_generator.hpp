#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "cryptlib.h"

#include "passgen/case_style.hpp"
#include "passgen/pass_status.hpp"

namespace passgen {

constexpr std::size_t kMinMemorableWords = 2;
constexpr std::size_t kMaxMemorableWords = 10;
constexpr std::size_t kDefaultMemorableWords = 3;
constexpr const char* kDefaultCaseStyle = "title";

class MemorableGenerator {
public:
    // Loads the word list at wordlist_path, then composes num_words distinct
    // words, each styled and suffixed with one digit, joined by '-'.
    static PassStatus Generate(
        std::size_t num_words,
        std::string_view case_style,
        const std::string& wordlist_path,
        CryptoPP::RandomNumberGenerator& rng,
        std::string& out_password);

    static PassStatus GenerateFromWords(
        std::size_t num_words,
        CaseStyle style,
        const std::vector<std::string>& words,
        CryptoPP::RandomNumberGenerator& rng,
        std::string& out_password);

    // Partial Fisher-Yates; chosen words keep draw order.
    static PassStatus SampleDistinct(
        const std::vector<std::string>& words,
        std::size_t count,
        CryptoPP::RandomNumberGenerator& rng,
        std::vector<std::string>& out_words);
};

}  // namespace passgen
