#include "passgen/word_source.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <utility>

namespace passgen {

PassStatus WordSource::LoadWords(const std::string& path, std::vector<std::string>& out_words) {
    out_words.clear();

    std::error_code ec;
    const std::filesystem::path target(path);
    if (!std::filesystem::is_regular_file(target, ec) || ec) {
        return PassStatus::NotFound;
    }

    std::ifstream in(target, std::ios::binary);
    if (!in) {
        return PassStatus::NotFound;
    }

    std::vector<std::string> words;
    std::string line;
    while (std::getline(in, line)) {
        std::string word = Trim(line);
        if (!word.empty()) {
            words.push_back(std::move(word));
        }
    }
    if (in.bad()) {
        return PassStatus::InvalidData;
    }

    if (words.size() < kMinimumWordCount) {
        return PassStatus::InvalidData;
    }
    out_words = std::move(words);
    return PassStatus::Ok;
}

std::string WordSource::Trim(const std::string& line) {
    std::size_t begin = 0;
    std::size_t end = line.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(line[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(line[end - 1])) != 0) {
        --end;
    }
    return line.substr(begin, end - begin);
}

}  // namespace passgen
