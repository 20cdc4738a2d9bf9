#include <cctype>

#include <gtest/gtest.h>

#include "passgen/case_style.hpp"
#include "test_support.hpp"

namespace passgen {
namespace {

std::string Styled(const std::string& word, const std::string& style) {
    auto rng = testing::SeededRng(7);
    std::string out;
    EXPECT_EQ(CaseStyler::Apply(word, style, *rng, out), PassStatus::Ok);
    return out;
}

TEST(CaseStylerTest, LowerAndUpper) {
    EXPECT_EQ(Styled("OcEaN", "lower"), "ocean");
    EXPECT_EQ(Styled("OcEaN", "upper"), "OCEAN");
}

TEST(CaseStylerTest, TitleAndCapitalizeAlias) {
    EXPECT_EQ(Styled("rIVER", "title"), "River");
    EXPECT_EQ(Styled("rIVER", "capitalize"), "River");
    EXPECT_EQ(Styled("x", "title"), "X");
    EXPECT_EQ(Styled("", "title"), "");
}

TEST(CaseStylerTest, StyleNamesAreCaseInsensitive) {
    EXPECT_EQ(Styled("stone", "UPPER"), "STONE");
    EXPECT_EQ(Styled("STONE", "Title"), "Stone");

    CaseStyle style = CaseStyle::Lower;
    EXPECT_EQ(CaseStyler::Parse("RaNdOm", style), PassStatus::Ok);
    EXPECT_EQ(style, CaseStyle::Random);
}

TEST(CaseStylerTest, UnknownStyleIsInvalidArgument) {
    auto rng = testing::SeededRng(1);
    std::string out = "untouched";
    EXPECT_EQ(CaseStyler::Apply("word", "sentence", *rng, out), PassStatus::InvalidArgument);
    EXPECT_EQ(out, "untouched");

    CaseStyle style = CaseStyle::Lower;
    EXPECT_EQ(CaseStyler::Parse("", style), PassStatus::InvalidArgument);
    EXPECT_EQ(CaseStyler::Parse(" lower", style), PassStatus::InvalidArgument);
}

TEST(CaseStylerTest, RandomFlipsEachCharacterIndependently) {
    const std::string word(64, 'q');
    auto rng = testing::SeededRng(42);
    std::string out;
    ASSERT_EQ(CaseStyler::Apply(word, CaseStyle::Random, *rng, out), PassStatus::Ok);
    ASSERT_EQ(out.size(), word.size());

    std::size_t upper = 0;
    for (const char ch : out) {
        ASSERT_TRUE(ch == 'q' || ch == 'Q');
        if (ch == 'Q') {
            ++upper;
        }
    }
    EXPECT_GT(upper, 0U);
    EXPECT_LT(upper, word.size());
}

TEST(CaseStylerTest, RandomLeavesNonLettersUntouched) {
    auto rng = testing::SeededRng(3);
    std::string out;
    ASSERT_EQ(CaseStyler::Apply("a-1'b_2", CaseStyle::Random, *rng, out), PassStatus::Ok);
    ASSERT_EQ(out.size(), 7U);
    EXPECT_EQ(out[1], '-');
    EXPECT_EQ(out[2], '1');
    EXPECT_EQ(out[3], '\'');
    EXPECT_EQ(out[5], '_');
    EXPECT_EQ(out[6], '2');
    EXPECT_EQ(std::tolower(static_cast<unsigned char>(out[0])), 'a');
    EXPECT_EQ(std::tolower(static_cast<unsigned char>(out[4])), 'b');
}

TEST(CaseStylerTest, RandomIsReproducibleWithSameSeed) {
    auto first = testing::SeededRng(99);
    auto second = testing::SeededRng(99);
    std::string a;
    std::string b;
    ASSERT_EQ(CaseStyler::Apply("reproducible", CaseStyle::Random, *first, a), PassStatus::Ok);
    ASSERT_EQ(CaseStyler::Apply("reproducible", CaseStyle::Random, *second, b), PassStatus::Ok);
    EXPECT_EQ(a, b);
}

TEST(CaseStylerTest, StyleNames) {
    EXPECT_EQ(ToString(CaseStyle::Lower), "lower");
    EXPECT_EQ(ToString(CaseStyle::Upper), "upper");
    EXPECT_EQ(ToString(CaseStyle::Title), "title");
    EXPECT_EQ(ToString(CaseStyle::Random), "random");
}

}  // namespace
}  // namespace passgen
