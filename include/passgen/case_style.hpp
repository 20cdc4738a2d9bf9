#pragma once

#include <string>
#include <string_view>

#include "cryptlib.h"

#include "passgen/pass_status.hpp"

namespace passgen {

enum class CaseStyle {
    Lower,
    Upper,
    Title,
    Random
};

std::string_view ToString(CaseStyle style);

class CaseStyler {
public:
    // Accepts lower, upper, title, capitalize and random in any letter case.
    static PassStatus Parse(std::string_view name, CaseStyle& out_style);

    static PassStatus Apply(
        std::string_view word,
        CaseStyle style,
        CryptoPP::RandomNumberGenerator& rng,
        std::string& out_word);

    static PassStatus Apply(
        std::string_view word,
        std::string_view style_name,
        CryptoPP::RandomNumberGenerator& rng,
        std::string& out_word);
};

}  // namespace passgen
