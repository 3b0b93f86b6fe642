// =============================================================================
// Tokenizer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "ipaseg/error.hpp"
#include "ipaseg/logging.hpp"
#include "ipaseg/tokenizer.hpp"
#include "test_symbols.hpp"

#include <optional>
#include <sstream>

using namespace ipaseg;

class TokenizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        table_ = test::make_test_table();
    }

    std::string debug(const std::string& text) {
        return Tokenizer(table_).tokenize(text).debug_string();
    }

    SymbolTable table_;
};

// =============================================================================
// Normalization
// =============================================================================

TEST_F(TokenizerTest, NormalizeStripsDelimiters) {
    EXPECT_EQ(normalize_transcription("[pat]"), U"pat");
    EXPECT_EQ(normalize_transcription("/pat/"), U"pat");
    EXPECT_EQ(normalize_transcription("\\pa\\t"), U"pa t");
    EXPECT_EQ(normalize_transcription("  \tpat\r\n"), U"pat");
    EXPECT_EQ(normalize_transcription(""), U"");
}

TEST_F(TokenizerTest, RoleSwitcherUnsupported) {
    Tokenizer tokenizer(table_);
    try {
        tokenizer.tokenize("ʰ\u0335p");
        FAIL() << "Expected UnsupportedFeatureError";
    } catch (const UnsupportedFeatureError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_FEATURE);
    }
}

// =============================================================================
// Grouping
// =============================================================================

TEST_F(TokenizerTest, EmptyInput) {
    Transcript t = Tokenizer(table_).tokenize("");
    ASSERT_EQ(t.size(), 1u);
    EXPECT_TRUE(t[0].empty());

    Transcript blank = Tokenizer(table_).tokenize(" \t\n ");
    ASSERT_EQ(blank.size(), 1u);
    EXPECT_TRUE(blank[0].empty());
}

TEST_F(TokenizerTest, LeftAndRightDiacriticsWithStress) {
    EXPECT_EQ(debug("ⁿaˈʧ\u0325ukʰⁿaˈʧ\u0325"),
              "[ⁿ a] [ˈ] [ʧ \u0325] [u] [k ʰ] [ⁿ a] [ˈ] [ʧ \u0325]");
}

TEST_F(TokenizerTest, BoundariesAndStressStandAlone) {
    EXPECT_EQ(debug("ˌ‖|ᶬhi.toˡˈ|ᵐtə\u0303"),
              "[] [ˌ] [] [‖] [] [|] [ᶬ h] [i] [.] [t] [o ˡ] [ˈ] [] [|] [ᵐ t] [ə \u0303]");
}

TEST_F(TokenizerTest, WhitespaceCoalescesAndTrims) {
    EXPECT_EQ(debug(" \tpʰæt kːaʧ\n suto \r\n  "),
              "[p ʰ] [æ] [t] [ ] [k ː] [a] [ʧ] [ ] [s] [u] [t] [o]");
}

TEST_F(TokenizerTest, WordBoundaries) {
    Transcript t = Tokenizer(table_).tokenize("pʰæt kʰaʧ suto");
    ASSERT_EQ(t.size(), 12u);

    size_t boundaries = 0;
    for (const auto& entry : t) {
        if (entry.size() == 1 && entry[0].is_word_boundary()) {
            ++boundaries;
        }
    }
    EXPECT_EQ(boundaries, 2u);
    EXPECT_TRUE(t[3][0].is_word_boundary());
    EXPECT_TRUE(t[7][0].is_word_boundary());
}

TEST_F(TokenizerTest, DelimitedInput) {
    EXPECT_EQ(debug("[pʰæt]"), "[p ʰ] [æ] [t]");
    EXPECT_EQ(debug("/pa/ /to/"), "[p] [a] [ ] [t] [o]");
}

TEST_F(TokenizerTest, TieBarStaysWithPrecedingBase) {
    EXPECT_EQ(debug("t\u0361ʃ"), "[t \u0361] [ʃ]");
}

TEST_F(TokenizerTest, TrailingLeftDiacritic) {
    EXPECT_EQ(debug("pⁿ"), "[p] [ⁿ]");
}

TEST_F(TokenizerTest, LeadingRightDiacriticJoinsNextBase) {
    EXPECT_EQ(debug("ʰp"), "[ʰ p]");
}

TEST_F(TokenizerTest, TrailingBoundaryLeavesEmptyEntry) {
    EXPECT_EQ(debug("a."), "[a] [.] []");
}

TEST_F(TokenizerTest, UnclassifiedElementAppended) {
    // Unknown role is not a segment ender
    EXPECT_EQ(debug("a↓"), "[a ↓]");
}

// =============================================================================
// Properties
// =============================================================================

TEST_F(TokenizerTest, RoundTripPreservesSymbols) {
    Tokenizer tokenizer(table_);
    for (const char* text : {"ⁿaˈʧ\u0325ukʰⁿaˈʧ\u0325", "ˌ‖|ᶬhi.toˡˈ|ᵐtə\u0303", "pʰæt", "t\u0361ʃ", "a."}) {
        EXPECT_EQ(tokenizer.tokenize(text).to_string(), text) << text;
    }
}

TEST_F(TokenizerTest, RoundTripAfterWhitespaceCollapse) {
    Tokenizer tokenizer(table_);
    EXPECT_EQ(tokenizer.tokenize("pa \t\n to").to_string(), "pa to");
}

TEST_F(TokenizerTest, OneBasePerSegmentEntry) {
    Transcript t = Tokenizer(table_).tokenize("ⁿaˈʧ\u0325ukʰⁿaˈʧ\u0325 pʰæt");
    for (const auto& entry : t) {
        size_t base_count = 0;
        for (const auto& element : entry) {
            if (element.role() == Role::Base) ++base_count;
        }
        EXPECT_LE(base_count, 1u);
    }
}

TEST_F(TokenizerTest, SameInputSameOutput) {
    Tokenizer tokenizer(table_);
    EXPECT_EQ(tokenizer.tokenize("ˈpʰæt.to"), tokenizer.tokenize("ˈpʰæt.to"));
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(TokenizerTest, UnknownSymbol) {
    Tokenizer tokenizer(table_);
    try {
        tokenizer.tokenize("A€");
        FAIL() << "Expected UnknownSymbolError";
    } catch (const UnknownSymbolError& e) {
        EXPECT_EQ(e.symbol(), U'€');
        EXPECT_NE(e.message().find("€"), std::string::npos);
    }
}

TEST_F(TokenizerTest, UnknownSymbolReportsFirstOffender) {
    try {
        Tokenizer(table_).tokenize("pa€x");
        FAIL() << "Expected UnknownSymbolError";
    } catch (const UnknownSymbolError& e) {
        EXPECT_EQ(e.symbol(), U'€');
    }
}

// =============================================================================
// Logging
// =============================================================================

TEST_F(TokenizerTest, DebugTraceLogged) {
    std::ostringstream log;
    set_log_output(log);
    set_log_level(LogLevel::DEBUG);

    Tokenizer(table_).tokenize("pa");

    set_log_level(LogLevel::WARN);
    set_log_output(std::clog);

    EXPECT_NE(log.str().find("Parsing character 0: 'p' (U+0070)"), std::string::npos);
    EXPECT_NE(log.str().find("Transcript: [p] [a]"), std::string::npos);
}

// =============================================================================
// Shipped symbol table
// =============================================================================

class ShippedTableTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        table_.emplace(
            SymbolTable::load_csv(std::string(IPASEG_TEST_DATA_DIR) + "/ipa_symbol_table.csv"));
    }

    static void TearDownTestSuite() {
        table_.reset();
    }

    static std::optional<SymbolTable> table_;
};

std::optional<SymbolTable> ShippedTableTest::table_;

TEST_F(ShippedTableTest, EndToEnd) {
    Tokenizer tokenizer(*table_);
    Transcript t = tokenizer.tokenize("k\u032Aʰⁿaˈʧ\u0325uᵊ.a\u0303\u032C\u031Dˡː pʰæt");

    ASSERT_EQ(t.size(), 11u);
    std::vector<std::string> expected = {
        "k\u032Aʰ", "ⁿa", "ˈ", "ʧ\u0325", "uᵊ", ".", "a\u0303\u032C\u031Dˡː", " ", "pʰ", "æ", "t"};
    for (size_t i = 0; i < expected.size(); ++i) {
        std::string joined;
        for (const auto& element : t[i]) {
            joined += element.symbol();
        }
        EXPECT_EQ(joined, expected[i]) << "entry " << i;
    }

    EXPECT_EQ(bases_string(t), "kaʧuapæt");
}

TEST_F(ShippedTableTest, RhoticVowel) {
    Transcript t = Tokenizer(*table_).tokenize("ɚ");
    ASSERT_EQ(t.size(), 1u);
    const Vowel* v = t[0][0].as<Vowel>();
    ASSERT_NE(v, nullptr);
    EXPECT_TRUE(v->rhotic);
}
