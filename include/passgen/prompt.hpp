#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>

#include "passgen/case_style.hpp"
#include "passgen/pass_status.hpp"

namespace passgen {

constexpr std::size_t kDefaultPromptAttempts = 5;

struct PromptStreams {
    std::istream& in;
    std::ostream& out;
};

class Prompt {
public:
    using Validator = std::function<bool(const std::string&)>;

    // Asks until validator accepts the trimmed reply, printing error_message on
    // each rejection. Fails with InvalidArgument after max_attempts or at EOF.
    static PassStatus UntilValid(
        const PromptStreams& io,
        const std::string& message,
        const Validator& validator,
        const std::string& error_message,
        std::string& out_reply,
        std::size_t max_attempts = kDefaultPromptAttempts);

    static PassStatus Int(
        const PromptStreams& io,
        const std::string& message,
        std::size_t min,
        std::size_t max,
        std::size_t& out_value);

    static PassStatus YesNo(const PromptStreams& io, const std::string& message, bool& out_value);

    static PassStatus Case(const PromptStreams& io, const std::string& message, CaseStyle& out_style);

    // Raw line, untrimmed; EOF yields an empty string.
    static std::string Line(const PromptStreams& io, const std::string& message);
};

}  // namespace passgen
