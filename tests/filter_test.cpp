// filter_test.cpp — base filter safety, parsing and three-valued evaluation

#include <gtest/gtest.h>

#include "diagnostics.hpp"
#include "filter/filter_expression.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace test_helpers;

namespace {

constexpr double NA = std::numeric_limits<double>::quiet_NaN();

// AGE 25, 40, NA, 61, 33 and GENDER M, F, F, NA, M.
RespondentTable people() {
    RespondentTable t(5);
    t.add_column(numbers("AGE", {25.0, 40.0, NA, 61.0, 33.0}));
    t.add_column(texts("GENDER", {"M", "F", "F", "", "M"}));
    t.add_column(texts("REGION", {"North", "South", "North", "East", "South"}));
    return t;
}

std::vector<size_t> rows_for(const std::string& expr) {
    Diagnostics diag;
    return filter::apply_base_filter(people(), expr, "Q1", diag);
}

ErrorCode error_for(const std::string& expr) {
    try {
        filter::evaluate_mask(expr, people());
    } catch (const CrosstabError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected CrosstabError for " << expr;
    return ErrorCode::CFG_INVALID_VALUE;
}

}  // namespace

// ===========================================================================
// Safety
// ===========================================================================
class FilterSafetyTest : public ::testing::Test {};

TEST_F(FilterSafetyTest, PlainComparisonsPass) {
    EXPECT_NO_THROW(filter::check_safety("AGE >= 18 & GENDER == 'F'"));
    EXPECT_NO_THROW(filter::check_safety("AGE > -1"));
}

TEST_F(FilterSafetyTest, DisallowedCharactersAreUnsafe) {
    EXPECT_EQ(error_for("AGE > 18; x"), ErrorCode::ARG_UNSAFE_FILTER);
    EXPECT_EQ(error_for("AGE > `18`"), ErrorCode::ARG_UNSAFE_FILTER);
    EXPECT_EQ(error_for("{AGE}"), ErrorCode::ARG_UNSAFE_FILTER);
}

TEST_F(FilterSafetyTest, CodePatternsAreDangerous) {
    EXPECT_EQ(error_for("system('ls') == 1"), ErrorCode::ARG_DANGEROUS_FILTER);
    EXPECT_EQ(error_for("AGE <- 3"), ErrorCode::ARG_DANGEROUS_FILTER);
    EXPECT_EQ(error_for("base::AGE > 3"), ErrorCode::ARG_DANGEROUS_FILTER);
    EXPECT_EQ(error_for("get('AGE') > 3"), ErrorCode::ARG_DANGEROUS_FILTER);
}

// ===========================================================================
// Parsing
// ===========================================================================
class FilterParseTest : public ::testing::Test {};

TEST_F(FilterParseTest, TokenizesOperators) {
    auto tokens = filter::tokenize("AGE >= -2.5 && !(X %in% c('a'))");
    std::vector<filter::TokenKind> kinds;
    for (const auto& t : tokens) kinds.push_back(t.kind);
    using K = filter::TokenKind;
    EXPECT_EQ(kinds, (std::vector<K>{K::IDENT, K::GE, K::NUMBER, K::AND, K::NOT, K::LPAREN,
                                     K::IDENT, K::IN, K::IDENT, K::LPAREN, K::STRING,
                                     K::RPAREN, K::RPAREN, K::END}));
    EXPECT_DOUBLE_EQ(tokens[2].number, -2.5);
}

TEST_F(FilterParseTest, MalformedExpressionsFailEvaluation) {
    EXPECT_EQ(error_for("AGE = 3"), ErrorCode::DATA_FILTER_EVAL_FAILED);
    EXPECT_EQ(error_for("AGE >"), ErrorCode::DATA_FILTER_EVAL_FAILED);
    EXPECT_EQ(error_for("(AGE > 3"), ErrorCode::DATA_FILTER_EVAL_FAILED);
    EXPECT_EQ(error_for("GENDER == 'F"), ErrorCode::DATA_FILTER_EVAL_FAILED);
    EXPECT_EQ(error_for("AGE"), ErrorCode::DATA_FILTER_EVAL_FAILED);
}

TEST_F(FilterParseTest, UnknownColumnFailsEvaluation) {
    EXPECT_EQ(error_for("INCOME > 3"), ErrorCode::DATA_FILTER_EVAL_FAILED);
}

// ===========================================================================
// Evaluation
// ===========================================================================
class FilterEvalTest : public ::testing::Test {};

TEST_F(FilterEvalTest, EmptyExpressionKeepsEveryRow) {
    EXPECT_EQ(rows_for(""), (std::vector<size_t>{0, 1, 2, 3, 4}));
    EXPECT_EQ(rows_for("   "), (std::vector<size_t>{0, 1, 2, 3, 4}));
}

TEST_F(FilterEvalTest, NumericComparisonDropsMissing) {
    EXPECT_EQ(rows_for("AGE >= 33"), (std::vector<size_t>{1, 3, 4}));
    EXPECT_EQ(rows_for("AGE != 40"), (std::vector<size_t>{0, 3, 4}));
}

TEST_F(FilterEvalTest, TextComparison) {
    EXPECT_EQ(rows_for("GENDER == \"F\""), (std::vector<size_t>{1, 2}));
    EXPECT_EQ(rows_for("GENDER != 'F'"), (std::vector<size_t>{0, 4}));
}

TEST_F(FilterEvalTest, BooleanCombinators) {
    EXPECT_EQ(rows_for("GENDER == 'M' & AGE > 30"), (std::vector<size_t>{4}));
    EXPECT_EQ(rows_for("GENDER == 'F' | AGE > 60"), (std::vector<size_t>{1, 2, 3}));
    EXPECT_EQ(rows_for("!(REGION == 'North')"), (std::vector<size_t>{1, 3, 4}));
}

TEST_F(FilterEvalTest, NaIsAbsorbedByShortCircuit) {
    // Row 2 has AGE NA: FALSE & NA is FALSE, TRUE | NA is TRUE.
    EXPECT_EQ(rows_for("REGION == 'North' | AGE > 100"), (std::vector<size_t>{0, 2}));
    EXPECT_EQ(rows_for("REGION == 'North' & AGE > 0"), (std::vector<size_t>{0}));
}

TEST_F(FilterEvalTest, InSetNeverYieldsNa) {
    EXPECT_EQ(rows_for("REGION %in% c('South', 'East')"), (std::vector<size_t>{1, 3, 4}));
    EXPECT_EQ(rows_for("!(GENDER %in% c('F'))"), (std::vector<size_t>{0, 3, 4}));
    EXPECT_EQ(rows_for("AGE %in% c(25, 61)"), (std::vector<size_t>{0, 3}));
}

TEST_F(FilterEvalTest, IsNaAndConstants) {
    EXPECT_EQ(rows_for("is.na(AGE)"), (std::vector<size_t>{2}));
    EXPECT_EQ(rows_for("!is.na(GENDER) & TRUE"), (std::vector<size_t>{0, 1, 2, 4}));
    EXPECT_TRUE(rows_for("FALSE").empty());
}

TEST_F(FilterEvalTest, EmptyResultWarns) {
    Diagnostics diag;
    auto rows = filter::apply_base_filter(people(), "AGE > 100", "Q9", diag);
    EXPECT_TRUE(rows.empty());
    ASSERT_EQ(diag.warnings().size(), 1u);
    EXPECT_EQ(diag.warnings()[0].source, "filter:Q9");
    EXPECT_NE(diag.warnings()[0].message.find("retains 0 of 5 rows"), std::string::npos);
}

TEST_F(FilterEvalTest, MaskHasOneEntryPerRow) {
    std::vector<bool> mask = filter::evaluate_mask("AGE < 30", people());
    EXPECT_EQ(mask, (std::vector<bool>{true, false, false, false, false}));
}
