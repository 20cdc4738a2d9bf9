#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "cryptlib.h"

namespace passgen::testing {

// Per-test directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }
    std::string File(const std::string& name) const;

private:
    std::filesystem::path path_;
};

// alpha, beta, gamma, ... then wordaa, wordab, ... all lowercase letters.
std::vector<std::string> MakeWords(std::size_t count);

void WriteLines(const std::string& path, const std::vector<std::string>& lines);

std::vector<std::string> ReadLines(const std::string& path);

std::vector<std::string> Split(const std::string& text, char sep);

std::unique_ptr<CryptoPP::RandomNumberGenerator> SeededRng(std::uint64_t seed);

}  // namespace passgen::testing
