// composite_test.cpp — composite definition checks, per-respondent values, tables

#include <gtest/gtest.h>

#include "banner/banner_structure.hpp"
#include "banner/row_index_map.hpp"
#include "composite/composite.hpp"
#include "diagnostics.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <string>
#include <variant>
#include <vector>

using namespace test_helpers;

namespace {

constexpr double NA = std::numeric_limits<double>::quiet_NaN();

// Two ratings R1, R2 and an open end OE over four respondents.
struct Sources {
    RespondentTable table{4};
    SurveyStructure survey;
};

Sources sources() {
    Sources s;
    s.table.add_column(numbers("R1", {4.0, 2.0, NA, NA}));
    s.table.add_column(numbers("R2", {2.0, 4.0, 5.0, NA}));
    s.table.add_column(texts("OE", {"a", "b", "c", "d"}));
    s.survey.add_question(question("R1", VariableType::RATING));
    s.survey.add_question(question("R2", VariableType::RATING));
    s.survey.add_question(question("OE", VariableType::OPEN_END));
    return s;
}

CompositeDefinition composite_of(const std::string& code, std::vector<std::string> srcs,
                                 const std::string& calc = "Mean",
                                 const std::string& weights = "") {
    CompositeDefinition d;
    d.code = code;
    d.label = code + " score";
    d.calculation_type = calc;
    d.sources = std::move(srcs);
    d.weights_text = weights;
    return d;
}

bool has_error(const CompositeValidation& v, ErrorCode code, const std::string& needle) {
    for (const auto& e : v.errors) {
        if (e.code == code && e.message.find(needle) != std::string::npos) return true;
    }
    return false;
}

}  // namespace

// ===========================================================================
// Parsing helpers
// ===========================================================================
class CompositeParseTest : public ::testing::Test {};

TEST_F(CompositeParseTest, CalculationTypes) {
    EXPECT_EQ(composite::parse_calculation("Mean"), CompositeCalculation::MEAN);
    EXPECT_EQ(composite::parse_calculation(" Sum "), CompositeCalculation::SUM);
    EXPECT_EQ(composite::parse_calculation("WeightedMean"), CompositeCalculation::WEIGHTED_MEAN);
    EXPECT_FALSE(composite::parse_calculation("Median").has_value());
}

TEST_F(CompositeParseTest, Weights) {
    auto w = composite::parse_weights("1, 2.5,3");
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(*w, (std::vector<double>{1.0, 2.5, 3.0}));
    EXPECT_FALSE(composite::parse_weights("1,heavy").has_value());
}

// ===========================================================================
// Validation
// ===========================================================================
class CompositeValidationTest : public ::testing::Test {};

TEST_F(CompositeValidationTest, ValidDefinitionPasses) {
    Sources s = sources();
    auto v = composite::validate_definitions({composite_of("C1", {"R1", "R2"})}, s.survey,
                                             s.table);
    EXPECT_TRUE(v.ok());
    EXPECT_TRUE(v.warnings.empty());
    EXPECT_NO_THROW(composite::require_valid(v));
}

TEST_F(CompositeValidationTest, SingleSourceWarns) {
    Sources s = sources();
    auto v = composite::validate_definitions({composite_of("C1", {"R1"})}, s.survey, s.table);
    EXPECT_TRUE(v.ok());
    ASSERT_EQ(v.warnings.size(), 1u);
    EXPECT_NE(v.warnings[0].find("only one source"), std::string::npos);
}

TEST_F(CompositeValidationTest, ReportsEveryProblem) {
    Sources s = sources();
    std::vector<CompositeDefinition> defs = {
        composite_of("R1", {"R1", "R2"}),
        composite_of("C2", {"R1", "NOPE"}),
        composite_of("C3", {"R1", "OE"}),
        composite_of("C4", {"R1", "R2"}, "Median"),
        composite_of("C4", {}),
    };
    auto v = composite::validate_definitions(defs, s.survey, s.table);
    EXPECT_FALSE(v.ok());
    EXPECT_TRUE(has_error(v, ErrorCode::CFG_COMPOSITE_INVALID, "conflicts with an existing"));
    EXPECT_TRUE(has_error(v, ErrorCode::CFG_COMPOSITE_INVALID, "non-existent question(s): NOPE"));
    EXPECT_TRUE(has_error(v, ErrorCode::CFG_COMPOSITE_INVALID, "mixes question types"));
    EXPECT_TRUE(has_error(v, ErrorCode::CFG_COMPOSITE_INVALID, "unsupported question type"));
    EXPECT_TRUE(has_error(v, ErrorCode::CFG_COMPOSITE_INVALID, "invalid CalculationType"));
    EXPECT_TRUE(has_error(v, ErrorCode::CFG_COMPOSITE_INVALID, "Duplicate CompositeCode(s): C4"));
    EXPECT_TRUE(has_error(v, ErrorCode::CFG_COMPOSITE_INVALID, "has no SourceQuestions"));
}

TEST_F(CompositeValidationTest, WeightedMeanWeightsAreChecked) {
    Sources s = sources();
    std::vector<CompositeDefinition> defs = {
        composite_of("W1", {"R1", "R2"}, "WeightedMean"),
        composite_of("W2", {"R1", "R2"}, "WeightedMean", "1"),
        composite_of("W3", {"R1", "R2"}, "WeightedMean", "1,0"),
        composite_of("W4", {"R1", "R2"}, "WeightedMean", "1,x"),
    };
    auto v = composite::validate_definitions(defs, s.survey, s.table);
    EXPECT_TRUE(has_error(v, ErrorCode::CFG_COMPOSITE_WEIGHTS, "Weights is empty"));
    EXPECT_TRUE(has_error(v, ErrorCode::CFG_COMPOSITE_WEIGHTS, "2 source questions but 1"));
    EXPECT_TRUE(has_error(v, ErrorCode::CFG_COMPOSITE_WEIGHTS, "non-positive weights"));
    EXPECT_TRUE(has_error(v, ErrorCode::CFG_COMPOSITE_WEIGHTS, "non-numeric weights"));
}

TEST_F(CompositeValidationTest, RequireValidThrowsFirstCode) {
    Sources s = sources();
    auto v = composite::validate_definitions({composite_of("W", {"R1", "R2"}, "WeightedMean")},
                                             s.survey, s.table);
    try {
        composite::require_valid(v);
        FAIL() << "expected CrosstabError";
    } catch (const CrosstabError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CFG_COMPOSITE_WEIGHTS);
    }
}

// ===========================================================================
// Per-respondent values
// ===========================================================================
class CompositeValuesTest : public ::testing::Test {};

TEST_F(CompositeValuesTest, MeanSkipsMissingSources) {
    Sources s = sources();
    auto v = composite::compute_values(s.table, composite_of("C", {"R1", "R2"}));
    ASSERT_EQ(v.size(), 4u);
    EXPECT_DOUBLE_EQ(v[0], 3.0);
    EXPECT_DOUBLE_EQ(v[1], 3.0);
    EXPECT_DOUBLE_EQ(v[2], 5.0);
    EXPECT_TRUE(std::isnan(v[3]));
}

TEST_F(CompositeValuesTest, SumAddsPresentSources) {
    Sources s = sources();
    auto v = composite::compute_values(s.table, composite_of("C", {"R1", "R2"}, "Sum"));
    EXPECT_DOUBLE_EQ(v[0], 6.0);
    EXPECT_DOUBLE_EQ(v[2], 5.0);
    EXPECT_TRUE(std::isnan(v[3]));
}

TEST_F(CompositeValuesTest, WeightedMeanRenormalisesOverPresentSources) {
    Sources s = sources();
    auto v = composite::compute_values(s.table,
                                       composite_of("C", {"R1", "R2"}, "WeightedMean", "3,1"));
    EXPECT_DOUBLE_EQ(v[0], (3.0 * 4.0 + 2.0) / 4.0);
    EXPECT_DOUBLE_EQ(v[1], (3.0 * 2.0 + 4.0) / 4.0);
    EXPECT_DOUBLE_EQ(v[2], 5.0);
}

TEST_F(CompositeValuesTest, WeightedMeanDropsMissingSourceWeight) {
    RespondentTable t(2);
    t.add_column(numbers("A", {4.0, NA}));
    t.add_column(numbers("B", {NA, NA}));
    t.add_column(numbers("C", {8.0, NA}));
    auto v = composite::compute_values(t, composite_of("W", {"A", "B", "C"}, "WeightedMean",
                                                       "1,1,2"));
    EXPECT_DOUBLE_EQ(v[0], 20.0 / 3.0);
    EXPECT_TRUE(std::isnan(v[1]));
}

// ===========================================================================
// Composite tables
// ===========================================================================
class CompositeTableTest : public ::testing::Test {
protected:
    Diagnostics diag;
};

TEST_F(CompositeTableTest, SummaryAndStdDevRows) {
    Sources s = sources();
    BannerStructure structure = banner::build_structure(s.survey, {});
    RowIndexMap map = banner::build_row_index_map(s.table, s.table.all_rows(), structure);
    CrosstabConfig cfg = plain_config();
    cfg.show_standard_deviation = true;

    QuestionTable t = composite::build_composite_table(
        s.table, s.survey, composite_of("C", {"R1", "R2"}), structure, map,
        weighting::unit_weights(4), cfg, diag);
    EXPECT_EQ(t.question_code, "C");
    EXPECT_EQ(t.question_text, "C score");
    EXPECT_EQ(t.type, VariableType::RATING);
    ASSERT_EQ(t.rows.size(), 3u);
    EXPECT_EQ(t.rows[0].kind, RowKind::AVERAGE);
    // values 3, 3, 5
    EXPECT_NEAR(std::get<double>(t.rows[0].cells[0]), 11.0 / 3.0, 1e-12);
    EXPECT_EQ(t.rows[1].kind, RowKind::STD_DEV);
    EXPECT_NEAR(std::get<double>(t.rows[1].cells[0]), std::sqrt(4.0 / 3.0), 1e-12);
    EXPECT_EQ(t.rows[2].kind, RowKind::SIG);
}

TEST_F(CompositeTableTest, AllMissingIsFatal) {
    Sources s = sources();
    RespondentTable empty(2);
    empty.add_column(numbers("R1", {NA, NA}));
    empty.add_column(numbers("R2", {NA, NA}));
    BannerStructure structure = banner::build_structure(s.survey, {});
    RowIndexMap map = banner::build_row_index_map(empty, empty.all_rows(), structure);
    try {
        composite::build_composite_table(empty, s.survey, composite_of("C", {"R1", "R2"}),
                                         structure, map, weighting::unit_weights(2),
                                         plain_config(), diag);
        FAIL() << "expected CrosstabError";
    } catch (const CrosstabError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DATA_COMPOSITE_ALL_MISSING);
    }
}
