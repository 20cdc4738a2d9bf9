#pragma once

#include <string>
#include <string_view>

#include "passgen/pass_status.hpp"

namespace passgen {

struct CharacterClasses {
    bool lower = true;
    bool upper = true;
    bool digits = true;
    bool punct = false;
};

class CharacterPool {
public:
    static PassStatus Build(const CharacterClasses& classes, std::string_view excluded, std::string& out_pool);

    static const std::string& Lowercase();
    static const std::string& Uppercase();
    static const std::string& Digits();
    static const std::string& Punctuation();
};

}  // namespace passgen
