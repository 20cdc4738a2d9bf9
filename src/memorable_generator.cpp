#include "passgen/memorable_generator.hpp"

#include <numeric>
#include <utility>

#include "passgen/random_source.hpp"
#include "passgen/word_source.hpp"

namespace passgen {

PassStatus MemorableGenerator::Generate(
    const std::size_t num_words,
    const std::string_view case_style,
    const std::string& wordlist_path,
    CryptoPP::RandomNumberGenerator& rng,
    std::string& out_password) {
    out_password.clear();
    if (num_words < kMinMemorableWords || num_words > kMaxMemorableWords) {
        return PassStatus::InvalidArgument;
    }

    CaseStyle style = CaseStyle::Title;
    const PassStatus style_status = CaseStyler::Parse(case_style, style);
    if (style_status != PassStatus::Ok) {
        return style_status;
    }

    std::vector<std::string> words;
    const PassStatus load_status = WordSource::LoadWords(wordlist_path, words);
    if (load_status != PassStatus::Ok) {
        return load_status;
    }
    return GenerateFromWords(num_words, style, words, rng, out_password);
}

PassStatus MemorableGenerator::GenerateFromWords(
    const std::size_t num_words,
    const CaseStyle style,
    const std::vector<std::string>& words,
    CryptoPP::RandomNumberGenerator& rng,
    std::string& out_password) {
    out_password.clear();
    if (num_words < kMinMemorableWords || num_words > kMaxMemorableWords) {
        return PassStatus::InvalidArgument;
    }

    std::vector<std::string> chosen;
    const PassStatus sample_status = SampleDistinct(words, num_words, rng, chosen);
    if (sample_status != PassStatus::Ok) {
        return sample_status;
    }

    std::string password;
    for (std::size_t i = 0; i < chosen.size(); ++i) {
        std::string styled;
        const PassStatus case_status = CaseStyler::Apply(chosen[i], style, rng, styled);
        if (case_status != PassStatus::Ok) {
            RandomSource::SecureWipeString(password);
            return case_status;
        }

        std::size_t digit = 0;
        const PassStatus digit_status = RandomSource::Index(rng, 10, digit);
        if (digit_status != PassStatus::Ok) {
            RandomSource::SecureWipeString(password);
            return digit_status;
        }

        if (i > 0) {
            password.push_back('-');
        }
        password += styled;
        password.push_back(static_cast<char>('0' + digit));
    }
    out_password = std::move(password);
    return PassStatus::Ok;
}

PassStatus MemorableGenerator::SampleDistinct(
    const std::vector<std::string>& words,
    const std::size_t count,
    CryptoPP::RandomNumberGenerator& rng,
    std::vector<std::string>& out_words) {
    out_words.clear();
    if (words.size() < count) {
        return PassStatus::InsufficientData;
    }

    std::vector<std::size_t> indices(words.size());
    std::iota(indices.begin(), indices.end(), 0U);

    std::vector<std::string> chosen;
    chosen.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        std::size_t pick = 0;
        const PassStatus status = RandomSource::Range(rng, i, indices.size() - 1, pick);
        if (status != PassStatus::Ok) {
            return status;
        }
        std::swap(indices[i], indices[pick]);
        chosen.push_back(words[indices[i]]);
    }
    out_words = std::move(chosen);
    return PassStatus::Ok;
}

}  // namespace passgen
