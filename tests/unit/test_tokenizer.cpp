#include <gtest/gtest.h>
#include "tokenizer.h"

// =============================================================================
// EstimatingTokenizer tests
// =============================================================================

TEST(TokenizerTest, EstimateEmptyIsZero) {
    EstimatingTokenizer tok;
    EXPECT_EQ(tok.count_tokens(""), 0);
}

TEST(TokenizerTest, EstimateRoundsUp) {
    EstimatingTokenizer tok;
    EXPECT_EQ(tok.count_tokens("a"), 1);
    EXPECT_EQ(tok.count_tokens("abcd"), 1);
    EXPECT_EQ(tok.count_tokens("abcde"), 2);
    EXPECT_EQ(tok.count_tokens(std::string(40, 'x')), 10);
}

TEST(TokenizerTest, EstimateCustomRatio) {
    EstimatingTokenizer tok(1);
    EXPECT_EQ(tok.count_tokens("hello"), 5);
    EXPECT_EQ(tok.get_chars_per_token(), 1);
}

TEST(TokenizerTest, EstimateRejectsZeroRatio) {
    EXPECT_THROW({ EstimatingTokenizer tok(0); }, TokenizerError);
}

// =============================================================================
// WordTokenizer tests
// =============================================================================

TEST(TokenizerTest, WordsCountsWhitespaceSeparated) {
    WordTokenizer tok;
    EXPECT_EQ(tok.count_tokens(""), 0);
    EXPECT_EQ(tok.count_tokens("   "), 0);
    EXPECT_EQ(tok.count_tokens("one"), 1);
    EXPECT_EQ(tok.count_tokens("  the quick\tbrown\nfox  "), 4);
}

// =============================================================================
// CallbackTokenizer tests
// =============================================================================

TEST(TokenizerTest, CallbackDelegates) {
    CallbackTokenizer tok([](const std::string& s) { return static_cast<int>(s.length()) * 2; }, "double");
    EXPECT_EQ(tok.count_tokens("abc"), 6);
    EXPECT_EQ(tok.get_tokenizer_name(), "double");
}

TEST(TokenizerTest, CallbackRequiresFunction) {
    CallbackTokenizer::CountFunction empty;
    EXPECT_THROW({ CallbackTokenizer tok(empty); }, TokenizerError);
}

TEST(TokenizerTest, ErrorMessagePrefix) {
    TokenizerError err("bad input");
    EXPECT_EQ(std::string(err.what()), "Tokenizer: bad input");
}
