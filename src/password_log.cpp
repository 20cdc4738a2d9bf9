#include "passgen/password_log.hpp"

#include <array>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <utility>

namespace passgen {

std::string_view ModeDirectory(const PasswordMode mode) {
    switch (mode) {
        case PasswordMode::Memorable:
            return "Memorable";
        case PasswordMode::Random:
            return "Random";
    }
    return "Unknown";
}

FilePasswordLog::FilePasswordLog(std::string root_dir) : root_dir_(std::move(root_dir)) {}

PassStatus FilePasswordLog::EnsureDirectories() const {
    for (const PasswordMode mode : {PasswordMode::Memorable, PasswordMode::Random}) {
        std::error_code ec;
        const std::filesystem::path dir = std::filesystem::path(root_dir_) / std::string(ModeDirectory(mode));
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return PassStatus::FileIOError;
        }
    }
    return PassStatus::Ok;
}

std::string FilePasswordLog::PathFor(const PasswordMode mode) const {
    const std::filesystem::path path =
        std::filesystem::path(root_dir_) / std::string(ModeDirectory(mode)) / kPasswordLogFilename;
    return path.string();
}

PassStatus FilePasswordLog::Append(
    const PasswordMode mode,
    const std::string_view password,
    const std::chrono::system_clock::time_point timestamp) {
    const PassStatus dir_status = EnsureDirectories();
    if (dir_status != PassStatus::Ok) {
        return dir_status;
    }

    std::ofstream out(PathFor(mode), std::ios::binary | std::ios::app);
    if (!out) {
        return PassStatus::FileIOError;
    }
    out << FormatTimestamp(timestamp) << " | " << password << "\n";
    out.flush();
    if (!out) {
        return PassStatus::FileIOError;
    }
    return PassStatus::Ok;
}

std::string FilePasswordLog::FormatTimestamp(const std::chrono::system_clock::time_point timestamp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    std::array<char, 64> buffer{};
    const std::size_t written = std::strftime(buffer.data(), buffer.size(), "%a %Y-%m-%d %H:%M:%S", &local);
    return std::string(buffer.data(), written);
}

}  // namespace passgen
