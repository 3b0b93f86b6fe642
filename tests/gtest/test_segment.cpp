// =============================================================================
// Segment Tests
// =============================================================================

#include <gtest/gtest.h>
#include "ipaseg/error.hpp"
#include "ipaseg/segment.hpp"
#include "test_symbols.hpp"

#include <sstream>
#include <unordered_set>

using namespace ipaseg;

class SegmentTest : public ::testing::Test {
protected:
    void SetUp() override {
        table_ = test::make_test_table();
    }

    std::vector<PhoElement> elements(const std::string& utf8) {
        ElementClassifier classifier(table_);
        std::vector<PhoElement> out;
        for (char32_t c : util::decode_utf8(utf8)) {
            out.push_back(classifier.classify(c));
        }
        return out;
    }

    Segment segment(const std::string& utf8) {
        return Segment(elements(utf8));
    }

    SymbolTable table_;
};

TEST_F(SegmentTest, LeftDiacriticAndBase) {
    Segment s = segment("ᵐt");
    EXPECT_EQ(s.string(), "ᵐt");
    ASSERT_EQ(s.base().size(), 1u);
    EXPECT_EQ(s.base()[0].symbol(), "t");
    ASSERT_EQ(s.left_diacritics().size(), 1u);
    EXPECT_EQ(s.left_diacritics()[0].symbol(), "ᵐ");
    EXPECT_TRUE(s.right_diacritics().empty());
    EXPECT_EQ(s.repr(), "Segment(string='ᵐt', base=['t'], diacritics=['ᵐ'])");
}

TEST_F(SegmentTest, RightDiacritics) {
    Segment s = segment("kʰː");
    EXPECT_EQ(s.base_string(), "k");
    EXPECT_EQ(s.base_element().symbol(), "k");
    ASSERT_EQ(s.right_diacritics().size(), 2u);
    EXPECT_EQ(s.right_diacritics()[0].symbol(), "ʰ");
    EXPECT_EQ(s.right_diacritics()[1].symbol(), "ː");
    EXPECT_EQ(s.size(), 3u);
    EXPECT_FALSE(s.is_compound());
}

TEST_F(SegmentTest, ComponentsKeepOrder) {
    Segment s = segment("ⁿaˡ");
    std::string joined;
    for (const auto& component : s) {
        joined += component.symbol();
    }
    EXPECT_EQ(joined, "ⁿaˡ");
    EXPECT_EQ(s[0].symbol(), "ⁿ");
    EXPECT_EQ(s[2].symbol(), "ˡ");
    EXPECT_EQ(s.repr(), "Segment(string='ⁿaˡ', base=['a'], diacritics=['ˡ', 'ⁿ'])");
}

TEST_F(SegmentTest, NoBaseRejected) {
    EXPECT_THROW(segment("ʰ"), ValidationError);
    EXPECT_THROW(segment("ⁿ"), ValidationError);
    EXPECT_THROW(segment("."), ValidationError);
    EXPECT_THROW(Segment(std::vector<PhoElement>{}), ValidationError);
}

TEST_F(SegmentTest, ValidationErrorCode) {
    try {
        segment("ˈ");
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::VALIDATION_FAILED);
    }
}

TEST_F(SegmentTest, CompoundBase) {
    // Two bases in one group
    Segment s = segment("t\u0361ʃ");
    EXPECT_TRUE(s.is_compound());
    ASSERT_EQ(s.base().size(), 2u);
    EXPECT_EQ(s.base_string(), "t\u0361ʃ");
    EXPECT_THROW(s.base_element(), NotImplementedError);
}

TEST_F(SegmentTest, Contains) {
    Segment s = segment("pʰ");
    EXPECT_TRUE(s.contains(test::element(table_, "ʰ")));
    EXPECT_FALSE(s.contains(test::element(table_, "ː")));
    EXPECT_TRUE(s.contains("ʰ"));
    EXPECT_TRUE(s.contains("pʰ"));
    EXPECT_FALSE(s.contains("t"));
}

TEST_F(SegmentTest, EqualityAndHash) {
    Segment a = segment("pʰ");
    Segment b = segment("pʰ");
    Segment c = segment("p");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(std::hash<Segment>{}(a), std::hash<Segment>{}(b));

    std::unordered_set<Segment> inventory{a, b, c};
    EXPECT_EQ(inventory.size(), 2u);
}

TEST_F(SegmentTest, StreamOutput) {
    std::ostringstream os;
    os << segment("pʰ");
    EXPECT_EQ(os.str(), "Segment(string='pʰ', base=['p'], diacritics=['ʰ'])");
}
