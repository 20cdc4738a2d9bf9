#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "cryptlib.h"

#include "passgen/password_log.hpp"
#include "passgen/pass_status.hpp"
#include "passgen/prompt.hpp"
#include "passgen/word_source.hpp"

namespace passgen {

constexpr std::size_t kDefaultVerificationTotal = 1000;
constexpr std::size_t kVerificationProgressStep = 200;

struct GeneratorConfig {
    std::string wordlist_path = kDefaultWordListFilename;
    std::string log_dir = ".";
    std::optional<std::uint64_t> seed;
};

struct SessionContext {
    PromptStreams io;
    CryptoPP::RandomNumberGenerator& rng;
    IPasswordLog& log;
    std::string wordlist_path;
    std::function<void(const std::string&)> diag;
};

class Session {
public:
    // Memorable or Random submenu, parameter prompts, print and log one password.
    static PassStatus RunInteractive(const SessionContext& ctx);

    // Generates and logs total passwords of randomly chosen modes.
    static PassStatus RunVerification(const SessionContext& ctx, std::size_t total = kDefaultVerificationTotal);
};

}  // namespace passgen
