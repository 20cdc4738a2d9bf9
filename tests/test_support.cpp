#include "test_support.hpp"

#include <array>
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "passgen/random_source.hpp"

namespace passgen::testing {

namespace {

constexpr std::array<const char*, 6> kGreekWords = {"alpha", "beta", "gamma", "delta", "epsilon", "zeta"};

}  // namespace

TempDir::TempDir() {
    const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = "passgen_test";
    if (info != nullptr) {
        name += std::string("_") + info->test_suite_name() + "_" + info->name();
    }
    path_ = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::string TempDir::File(const std::string& name) const {
    return (path_ / name).string();
}

std::vector<std::string> MakeWords(const std::size_t count) {
    std::vector<std::string> words;
    words.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        if (i < kGreekWords.size()) {
            words.emplace_back(kGreekWords[i]);
            continue;
        }
        const std::size_t n = i - kGreekWords.size();
        std::string word = "word";
        word.push_back(static_cast<char>('a' + (n / 26) % 26));
        word.push_back(static_cast<char>('a' + n % 26));
        words.push_back(word);
    }
    return words;
}

void WriteLines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    for (const auto& line : lines) {
        out << line << "\n";
    }
}

std::vector<std::string> ReadLines(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> Split(const std::string& text, const char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(text);
    while (std::getline(stream, part, sep)) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == sep) {
        parts.emplace_back();
    }
    return parts;
}

std::unique_ptr<CryptoPP::RandomNumberGenerator> SeededRng(const std::uint64_t seed) {
    PassStatus status = PassStatus::Ok;
    auto rng = RandomSource::Create(seed, status);
    EXPECT_EQ(status, PassStatus::Ok);
    return rng;
}

}  // namespace passgen::testing
