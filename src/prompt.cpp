#include "passgen/prompt.hpp"

#include <cctype>
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>

#include "passgen/word_source.hpp"

namespace passgen {

namespace {

bool ReadLine(const PromptStreams& io, const std::string& message, std::string& out_line) {
    io.out << message << std::flush;
    if (!std::getline(io.in, out_line)) {
        io.out << "\n";
        return false;
    }
    return true;
}

bool ParseSize(const std::string& text, std::size_t& out_value) {
    if (text.empty()) {
        return false;
    }
    for (const char ch : text) {
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            return false;
        }
    }
    std::size_t idx = 0;
    try {
        const unsigned long long parsed = std::stoull(text, &idx);
        if (idx != text.size() || parsed > static_cast<unsigned long long>(std::numeric_limits<std::size_t>::max())) {
            return false;
        }
        out_value = static_cast<std::size_t>(parsed);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

std::string ToLower(std::string text) {
    for (char& ch : text) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return text;
}

}  // namespace

PassStatus Prompt::UntilValid(
    const PromptStreams& io,
    const std::string& message,
    const Validator& validator,
    const std::string& error_message,
    std::string& out_reply,
    const std::size_t max_attempts) {
    for (std::size_t attempt = 0; attempt < max_attempts; ++attempt) {
        std::string line;
        if (!ReadLine(io, message, line)) {
            return PassStatus::InvalidArgument;
        }
        const std::string reply = WordSource::Trim(line);
        if (validator(reply)) {
            out_reply = reply;
            return PassStatus::Ok;
        }
        io.out << error_message << "\n";
    }
    return PassStatus::InvalidArgument;
}

PassStatus Prompt::Int(
    const PromptStreams& io,
    const std::string& message,
    const std::size_t min,
    const std::size_t max,
    std::size_t& out_value) {
    std::size_t value = 0;
    const auto in_range = [&](const std::string& reply) {
        return ParseSize(reply, value) && value >= min && value <= max;
    };
    const std::string error =
        "Enter a number between " + std::to_string(min) + " and " + std::to_string(max) + ".";

    std::string reply;
    const PassStatus status = UntilValid(io, message, in_range, error, reply);
    if (status != PassStatus::Ok) {
        return status;
    }
    out_value = value;
    return PassStatus::Ok;
}

PassStatus Prompt::YesNo(const PromptStreams& io, const std::string& message, bool& out_value) {
    const auto is_answer = [](const std::string& reply) {
        const std::string lowered = ToLower(reply);
        return lowered == "y" || lowered == "yes" || lowered == "n" || lowered == "no";
    };

    std::string reply;
    const PassStatus status = UntilValid(io, message + " (y/n): ", is_answer, "Please enter y or n.", reply);
    if (status != PassStatus::Ok) {
        return status;
    }
    const std::string lowered = ToLower(reply);
    out_value = lowered == "y" || lowered == "yes";
    return PassStatus::Ok;
}

PassStatus Prompt::Case(const PromptStreams& io, const std::string& message, CaseStyle& out_style) {
    CaseStyle style = CaseStyle::Title;
    const auto is_style = [&](const std::string& reply) {
        return CaseStyler::Parse(reply, style) == PassStatus::Ok;
    };

    std::string reply;
    const PassStatus status =
        UntilValid(io, message, is_style, "Case must be: lower, upper, title, or random", reply);
    if (status != PassStatus::Ok) {
        return status;
    }
    out_style = style;
    return PassStatus::Ok;
}

std::string Prompt::Line(const PromptStreams& io, const std::string& message) {
    std::string line;
    if (!ReadLine(io, message, line)) {
        return {};
    }
    return line;
}

}  // namespace passgen
