#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "passgen/character_pool.hpp"
#include "passgen/memorable_generator.hpp"
#include "passgen/pass_status.hpp"
#include "passgen/password_log.hpp"
#include "passgen/random_generator.hpp"
#include "passgen/random_source.hpp"
#include "passgen/session.hpp"

namespace {

struct CliOptions {
    bool help = false;
    bool log = false;
    std::string command = "interactive";
    passgen::GeneratorConfig config;
    std::size_t word_count = passgen::kDefaultMemorableWords;
    std::string case_style = passgen::kDefaultCaseStyle;
    std::size_t length = passgen::kDefaultRandomLength;
    passgen::CharacterClasses classes;
    std::string excluded;
    std::size_t total = passgen::kDefaultVerificationTotal;
    bool saw_memorable_flag = false;
    bool saw_random_flag = false;
    bool saw_total = false;
};

void CliLog(const CliOptions& opts, const std::string& message) {
    if (!opts.log) {
        return;
    }
    std::cerr << "[log] " << message << "\n";
}

void ReportError(const passgen::PassStatus status) {
    std::cerr << passgen::ToString(status) << ": " << passgen::Describe(status) << "\n";
    if (status == passgen::PassStatus::NotFound || status == passgen::PassStatus::InvalidData) {
        std::cerr << "Check your word list file name/location (--wordlist)\n";
    }
}

bool ParseUnsigned(const std::string& value, std::uint64_t& out) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](const unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        return false;
    }
    std::size_t idx = 0;
    try {
        out = std::stoull(value, &idx);
    } catch (const std::out_of_range&) {
        return false;
    }
    return idx == value.size();
}

bool ParseArgs(const int argc, char* argv[], CliOptions& opts, std::string& error) {
    int start = 1;
    if (argc >= 2 && argv[1][0] != '-') {
        std::string command(argv[1]);
        std::transform(command.begin(), command.end(), command.begin(), [](const unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (command != "interactive" && command != "memorable" && command != "random" && command != "verify") {
            error = "Unknown command: " + std::string(argv[1]);
            return false;
        }
        opts.command = std::move(command);
        start = 2;
    }

    for (int i = start; i < argc; ++i) {
        const std::string arg(argv[i]);
        auto require_value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            dst = argv[++i];
            return true;
        };
        auto parse_size = [&](const std::string& value, std::size_t& out) -> bool {
            std::uint64_t parsed = 0;
            if (!ParseUnsigned(value, parsed) ||
                parsed > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())) {
                error = "Invalid value for " + arg;
                return false;
            }
            out = static_cast<std::size_t>(parsed);
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--log") {
            opts.log = true;
        } else if (arg == "--wordlist") {
            if (!require_value(opts.config.wordlist_path)) {
                return false;
            }
        } else if (arg == "--log-dir") {
            if (!require_value(opts.config.log_dir)) {
                return false;
            }
        } else if (arg == "--seed") {
            std::uint64_t seed = 0;
            if (!require_value(value)) {
                return false;
            }
            if (!ParseUnsigned(value, seed)) {
                error = "Invalid value for --seed";
                return false;
            }
            opts.config.seed = seed;
        } else if (arg == "--count") {
            if (!require_value(value) || !parse_size(value, opts.word_count)) {
                return false;
            }
            opts.saw_memorable_flag = true;
        } else if (arg == "--case") {
            if (!require_value(opts.case_style)) {
                return false;
            }
            opts.saw_memorable_flag = true;
        } else if (arg == "--length") {
            if (!require_value(value) || !parse_size(value, opts.length)) {
                return false;
            }
            opts.saw_random_flag = true;
        } else if (arg == "--no-lower") {
            opts.classes.lower = false;
            opts.saw_random_flag = true;
        } else if (arg == "--no-upper") {
            opts.classes.upper = false;
            opts.saw_random_flag = true;
        } else if (arg == "--no-digits") {
            opts.classes.digits = false;
            opts.saw_random_flag = true;
        } else if (arg == "--punct") {
            opts.classes.punct = true;
            opts.saw_random_flag = true;
        } else if (arg == "--exclude") {
            if (!require_value(opts.excluded)) {
                return false;
            }
            opts.saw_random_flag = true;
        } else if (arg == "--total") {
            if (!require_value(value) || !parse_size(value, opts.total)) {
                return false;
            }
            opts.saw_total = true;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }

    if (opts.help) {
        return true;
    }
    if (opts.saw_memorable_flag && opts.command != "memorable") {
        error = "--count and --case are only valid with memorable";
        return false;
    }
    if (opts.saw_random_flag && opts.command != "random") {
        error = "--length, --no-*, --punct and --exclude are only valid with random";
        return false;
    }
    if (opts.saw_total && opts.command != "verify") {
        error = "--total is only valid with verify";
        return false;
    }
    return true;
}

void PrintHelp(std::ostream& out) {
    out << "passgen - memorable and random password generator\n\n";
    out << "Usage:\n";
    out << "  passgen [interactive] [common options]\n";
    out << "  passgen memorable [--count N] [--case lower|upper|title|random] [common options]\n";
    out << "  passgen random [--length N] [--no-lower] [--no-upper] [--no-digits] [--punct]\n";
    out << "                 [--exclude CHARS] [common options]\n";
    out << "  passgen verify [--total N] [common options]\n\n";

    out << "Options:\n";
    out << "  --count <N>          Number of words, 2-10 (default 3)\n";
    out << "  --case <style>       lower, upper, title (alias capitalize) or random (default title)\n";
    out << "  --length <N>         Password length, 4-128 (default 16)\n";
    out << "  --no-lower           Drop lowercase letters from the pool\n";
    out << "  --no-upper           Drop uppercase letters from the pool\n";
    out << "  --no-digits          Drop digits from the pool\n";
    out << "  --punct              Add ASCII punctuation to the pool\n";
    out << "  --exclude <chars>    Characters removed from the pool\n";
    out << "  --total <N>          Passwords generated by verify (default 1000)\n\n";

    out << "Common options:\n";
    out << "  --wordlist <path>    Word list file (default " << passgen::kDefaultWordListFilename << ")\n";
    out << "  --log-dir <dir>      Root of Memorable/ and Random/ password logs (default .)\n";
    out << "  --seed <N>           Deterministic random source for reproducible output\n";
    out << "  --log                Show minimal runtime logs\n";
    out << "  --help, -h           Show this help\n\n";

    out << "Examples:\n";
    out << "  passgen memorable --count 4 --case random\n";
    out << "  passgen random --length 24 --punct --exclude \"O0Il1\"\n";
    out << "  passgen verify --log-dir /tmp/passgen\n";
}

int MemorableFlow(const CliOptions& opts, CryptoPP::RandomNumberGenerator& rng, passgen::IPasswordLog& log) {
    CliLog(opts, "Loading word list: " + opts.config.wordlist_path);
    std::string password;
    passgen::PassStatus status = passgen::MemorableGenerator::Generate(
        opts.word_count, opts.case_style, opts.config.wordlist_path, rng, password);
    if (status != passgen::PassStatus::Ok) {
        ReportError(status);
        return 1;
    }

    std::cout << password << "\n";
    status = log.Append(passgen::PasswordMode::Memorable, password, std::chrono::system_clock::now());
    passgen::RandomSource::SecureWipeString(password);
    if (status != passgen::PassStatus::Ok) {
        ReportError(status);
        return 1;
    }
    return 0;
}

int RandomFlow(const CliOptions& opts, CryptoPP::RandomNumberGenerator& rng, passgen::IPasswordLog& log) {
    std::string password;
    passgen::PassStatus status =
        passgen::RandomGenerator::Generate(opts.length, opts.classes, opts.excluded, rng, password);
    if (status != passgen::PassStatus::Ok) {
        ReportError(status);
        return 1;
    }

    std::cout << password << "\n";
    status = log.Append(passgen::PasswordMode::Random, password, std::chrono::system_clock::now());
    passgen::RandomSource::SecureWipeString(password);
    if (status != passgen::PassStatus::Ok) {
        ReportError(status);
        return 1;
    }
    return 0;
}

int SessionFlow(const CliOptions& opts, CryptoPP::RandomNumberGenerator& rng, passgen::IPasswordLog& log) {
    const passgen::SessionContext ctx{
        passgen::PromptStreams{std::cin, std::cout},
        rng,
        log,
        opts.config.wordlist_path,
        [&opts](const std::string& message) { CliLog(opts, message); }};

    passgen::PassStatus status = passgen::PassStatus::Ok;
    if (opts.command == "verify") {
        status = passgen::Session::RunVerification(ctx, opts.total);
    } else {
        std::cout << "=== passgen ===\n";
        std::cout << "1) Interactive mode\n";
        std::cout << "2) Generate " << passgen::kDefaultVerificationTotal << " passwords (verification)\n";
        std::string mode;
        status = passgen::Prompt::UntilValid(
            ctx.io,
            "Choose 1 or 2: ",
            [](const std::string& reply) { return reply == "1" || reply == "2"; },
            "Invalid option.",
            mode);
        if (status == passgen::PassStatus::Ok) {
            status = mode == "1" ? passgen::Session::RunInteractive(ctx)
                                 : passgen::Session::RunVerification(ctx, passgen::kDefaultVerificationTotal);
        }
    }

    if (status != passgen::PassStatus::Ok) {
        ReportError(status);
        return 1;
    }
    return 0;
}

}  // namespace

int RunCliMain(const int argc, char* argv[]) {
    CliOptions opts;
    std::string error;
    if (!ParseArgs(argc, argv, opts, error)) {
        std::cerr << error << "\n";
        return 1;
    }
    if (opts.help) {
        PrintHelp(std::cout);
        return 0;
    }

    passgen::PassStatus rng_status = passgen::PassStatus::Ok;
    const std::unique_ptr<CryptoPP::RandomNumberGenerator> rng =
        passgen::RandomSource::Create(opts.config.seed, rng_status);
    if (rng_status != passgen::PassStatus::Ok || !rng) {
        ReportError(rng_status == passgen::PassStatus::Ok ? passgen::PassStatus::MissingRngBytes : rng_status);
        return 1;
    }
    CliLog(opts, opts.config.seed.has_value() ? "Using seeded random source" : "Using OS-seeded random source");

    passgen::FilePasswordLog log(opts.config.log_dir);
    CliLog(opts, "Password logs under: " + opts.config.log_dir);

    if (opts.command == "memorable") {
        return MemorableFlow(opts, *rng, log);
    }
    if (opts.command == "random") {
        return RandomFlow(opts, *rng, log);
    }
    return SessionFlow(opts, *rng, log);
}

int main(const int argc, char* argv[]) {
    return RunCliMain(argc, argv);
}
