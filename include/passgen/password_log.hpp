#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "passgen/pass_status.hpp"

namespace passgen {

constexpr const char* kPasswordLogFilename = "Generated_Passwords.txt";

enum class PasswordMode {
    Memorable,
    Random
};

std::string_view ModeDirectory(PasswordMode mode);

class IPasswordLog {
public:
    virtual ~IPasswordLog() = default;

    virtual PassStatus Append(
        PasswordMode mode,
        std::string_view password,
        std::chrono::system_clock::time_point timestamp) = 0;
};

class FilePasswordLog final : public IPasswordLog {
public:
    explicit FilePasswordLog(std::string root_dir);

    PassStatus Append(
        PasswordMode mode,
        std::string_view password,
        std::chrono::system_clock::time_point timestamp) override;

    PassStatus EnsureDirectories() const;
    std::string PathFor(PasswordMode mode) const;

    // "Mon 2024-01-15 09:30:00", local time.
    static std::string FormatTimestamp(std::chrono::system_clock::time_point timestamp);

private:
    std::string root_dir_;
};

}  // namespace passgen
