#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "passgen/pass_status.hpp"

namespace passgen {

constexpr const char* kDefaultWordListFilename = "top_english_nouns_lower_100000.txt";
constexpr std::size_t kMinimumWordCount = 100;

class WordSource {
public:
    // Re-reads the file on every call. Lines are trimmed and blank lines dropped.
    static PassStatus LoadWords(const std::string& path, std::vector<std::string>& out_words);
    static std::string Trim(const std::string& line);
};

}  // namespace passgen
