#include "passgen/session.hpp"

#include <array>
#include <chrono>
#include <ostream>
#include <string>
#include <utility>

#include "passgen/case_style.hpp"
#include "passgen/memorable_generator.hpp"
#include "passgen/random_generator.hpp"
#include "passgen/random_source.hpp"

namespace passgen {

namespace {

constexpr std::array<CaseStyle, 4> kAllCaseStyles = {
    CaseStyle::Lower, CaseStyle::Upper, CaseStyle::Title, CaseStyle::Random};

constexpr std::size_t kVerifyMinWords = 2;
constexpr std::size_t kVerifyMaxWords = 5;
constexpr std::size_t kVerifyMinLength = 10;
constexpr std::size_t kVerifyMaxLength = 24;

void Diag(const SessionContext& ctx, const std::string& message) {
    if (ctx.diag) {
        ctx.diag(message);
    }
}

PassStatus LogAndWipe(const SessionContext& ctx, const PasswordMode mode, std::string& password) {
    const PassStatus status = ctx.log.Append(mode, password, std::chrono::system_clock::now());
    RandomSource::SecureWipeString(password);
    return status;
}

PassStatus InteractiveMemorable(const SessionContext& ctx) {
    std::size_t num_words = 0;
    PassStatus status = Prompt::Int(
        ctx.io,
        "How many words (" + std::to_string(kMinMemorableWords) + "-" + std::to_string(kMaxMemorableWords) + "): ",
        kMinMemorableWords,
        kMaxMemorableWords,
        num_words);
    if (status != PassStatus::Ok) {
        return status;
    }

    ctx.io.out << "Case options: lower, upper, title, random\n";
    CaseStyle style = CaseStyle::Title;
    status = Prompt::Case(ctx.io, "Case style: ", style);
    if (status != PassStatus::Ok) {
        return status;
    }

    Diag(ctx, "Loading word list: " + ctx.wordlist_path);
    std::string password;
    status = MemorableGenerator::Generate(num_words, ToString(style), ctx.wordlist_path, ctx.rng, password);
    if (status != PassStatus::Ok) {
        return status;
    }

    ctx.io.out << "\nGenerated memorable password: " << password << "\n";
    return LogAndWipe(ctx, PasswordMode::Memorable, password);
}

PassStatus InteractiveRandom(const SessionContext& ctx) {
    std::size_t length = 0;
    PassStatus status = Prompt::Int(
        ctx.io,
        "Password length (" + std::to_string(kMinRandomLength) + "-" + std::to_string(kMaxRandomLength) + "): ",
        kMinRandomLength,
        kMaxRandomLength,
        length);
    if (status != PassStatus::Ok) {
        return status;
    }

    CharacterClasses classes;
    const std::array<std::pair<const char*, bool*>, 4> toggles = {{
        {"Include lowercase letters?", &classes.lower},
        {"Include uppercase letters?", &classes.upper},
        {"Include digits?", &classes.digits},
        {"Include punctuation?", &classes.punct},
    }};
    for (const auto& toggle : toggles) {
        status = Prompt::YesNo(ctx.io, toggle.first, *toggle.second);
        if (status != PassStatus::Ok) {
            return status;
        }
    }
    const std::string excluded = Prompt::Line(ctx.io, "Characters to exclude (Enter for none): ");

    std::string password;
    status = RandomGenerator::Generate(length, classes, excluded, ctx.rng, password);
    if (status != PassStatus::Ok) {
        return status;
    }

    ctx.io.out << "\nGenerated random password: " << password << "\n";
    return LogAndWipe(ctx, PasswordMode::Random, password);
}

PassStatus VerifyOne(const SessionContext& ctx) {
    bool memorable = false;
    PassStatus status = RandomSource::CoinFlip(ctx.rng, memorable);
    if (status != PassStatus::Ok) {
        return status;
    }

    std::string password;
    if (memorable) {
        std::size_t num_words = 0;
        std::size_t style_index = 0;
        status = RandomSource::Range(ctx.rng, kVerifyMinWords, kVerifyMaxWords, num_words);
        if (status == PassStatus::Ok) {
            status = RandomSource::Index(ctx.rng, kAllCaseStyles.size(), style_index);
        }
        if (status == PassStatus::Ok) {
            status = MemorableGenerator::Generate(
                num_words, ToString(kAllCaseStyles[style_index]), ctx.wordlist_path, ctx.rng, password);
        }
        if (status != PassStatus::Ok) {
            return status;
        }
        return LogAndWipe(ctx, PasswordMode::Memorable, password);
    }

    std::size_t length = 0;
    CharacterClasses classes;
    status = RandomSource::Range(ctx.rng, kVerifyMinLength, kVerifyMaxLength, length);
    if (status == PassStatus::Ok) {
        status = RandomSource::CoinFlip(ctx.rng, classes.punct);
    }
    if (status == PassStatus::Ok) {
        status = RandomGenerator::Generate(length, classes, "", ctx.rng, password);
    }
    if (status != PassStatus::Ok) {
        return status;
    }
    return LogAndWipe(ctx, PasswordMode::Random, password);
}

}  // namespace

PassStatus Session::RunInteractive(const SessionContext& ctx) {
    ctx.io.out << "\n=== Password Generator ===\n";
    ctx.io.out << "1) Memorable\n";
    ctx.io.out << "2) Random\n";

    std::string choice;
    const PassStatus status = Prompt::UntilValid(
        ctx.io,
        "Choose 1 or 2: ",
        [](const std::string& reply) { return reply == "1" || reply == "2"; },
        "Invalid choice.",
        choice);
    if (status != PassStatus::Ok) {
        return status;
    }

    if (choice == "1") {
        return InteractiveMemorable(ctx);
    }
    return InteractiveRandom(ctx);
}

PassStatus Session::RunVerification(const SessionContext& ctx, const std::size_t total) {
    if (total == 0) {
        return PassStatus::InvalidArgument;
    }

    ctx.io.out << "\nGenerating " << total << " passwords to verify logging...\n";
    for (std::size_t i = 1; i <= total; ++i) {
        const PassStatus status = VerifyOne(ctx);
        if (status != PassStatus::Ok) {
            Diag(ctx, "Verification stopped at password " + std::to_string(i));
            return status;
        }
        if (i % kVerificationProgressStep == 0) {
            ctx.io.out << i << "/" << total << " complete\n";
        }
    }
    ctx.io.out << "Done! All passwords logged successfully.\n";
    return PassStatus::Ok;
}

}  // namespace passgen
