#include "passgen/case_style.hpp"

#include <cctype>
#include <utility>

#include "passgen/random_source.hpp"

namespace passgen {

namespace {

char Upper(const char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

char Lower(const char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

}  // namespace

std::string_view ToString(const CaseStyle style) {
    switch (style) {
        case CaseStyle::Lower:
            return "lower";
        case CaseStyle::Upper:
            return "upper";
        case CaseStyle::Title:
            return "title";
        case CaseStyle::Random:
            return "random";
    }
    return "unknown";
}

PassStatus CaseStyler::Parse(const std::string_view name, CaseStyle& out_style) {
    std::string normalized(name);
    for (char& ch : normalized) {
        ch = Lower(ch);
    }

    if (normalized == "lower") {
        out_style = CaseStyle::Lower;
    } else if (normalized == "upper") {
        out_style = CaseStyle::Upper;
    } else if (normalized == "title" || normalized == "capitalize") {
        out_style = CaseStyle::Title;
    } else if (normalized == "random") {
        out_style = CaseStyle::Random;
    } else {
        return PassStatus::InvalidArgument;
    }
    return PassStatus::Ok;
}

PassStatus CaseStyler::Apply(
    const std::string_view word,
    const CaseStyle style,
    CryptoPP::RandomNumberGenerator& rng,
    std::string& out_word) {
    std::string styled(word);
    switch (style) {
        case CaseStyle::Lower:
            for (char& ch : styled) {
                ch = Lower(ch);
            }
            break;
        case CaseStyle::Upper:
            for (char& ch : styled) {
                ch = Upper(ch);
            }
            break;
        case CaseStyle::Title:
            for (std::size_t i = 0; i < styled.size(); ++i) {
                styled[i] = i == 0 ? Upper(styled[i]) : Lower(styled[i]);
            }
            break;
        case CaseStyle::Random:
            // One flip per character; non-letters consume a flip and pass through.
            for (char& ch : styled) {
                bool upper = false;
                const PassStatus status = RandomSource::CoinFlip(rng, upper);
                if (status != PassStatus::Ok) {
                    return status;
                }
                ch = upper ? Upper(ch) : Lower(ch);
            }
            break;
        default:
            return PassStatus::InvalidArgument;
    }
    out_word = std::move(styled);
    return PassStatus::Ok;
}

PassStatus CaseStyler::Apply(
    const std::string_view word,
    const std::string_view style_name,
    CryptoPP::RandomNumberGenerator& rng,
    std::string& out_word) {
    CaseStyle style = CaseStyle::Lower;
    const PassStatus status = Parse(style_name, style);
    if (status != PassStatus::Ok) {
        return status;
    }
    return Apply(word, style, rng, out_word);
}

}  // namespace passgen
