// ranking_test.cpp — ranking extraction, direction, validation and tables

#include <gtest/gtest.h>

#include "banner/banner_structure.hpp"
#include "banner/row_index_map.hpp"
#include "config/crosstab_config.hpp"
#include "diagnostics.hpp"
#include "ranking/ranking_context.hpp"
#include "ranking/ranking_extraction.hpp"
#include "ranking/ranking_matrix.hpp"
#include "ranking/ranking_metrics.hpp"
#include "ranking/ranking_tables.hpp"
#include "ranking/ranking_validation.hpp"
#include "test_helpers.hpp"

#include <string>
#include <variant>
#include <vector>

using namespace test_helpers;

namespace {

// Item-format ranking of three fruits by four respondents; the last one
// ranked only Cherry.
struct FruitRanking {
    RespondentTable table{4};
    SurveyStructure survey;
    QuestionDef q;
};

FruitRanking fruit_ranking(const std::string& direction = "") {
    FruitRanking f;
    f.table.add_column(texts("Q7_Rank1", {"Apple", "Apple", "Banana", "Cherry"}));
    f.table.add_column(texts("Q7_Rank2", {"Banana", "Cherry", "Apple", ""}));
    f.table.add_column(texts("Q7_Rank3", {"Cherry", "Banana", "Cherry", ""}));

    f.q = question("Q7", VariableType::RANKING, "Favourite fruit");
    f.q.ranking_format = "Item";
    f.q.ranking_positions = 3;
    f.q.ranking_direction = direction;
    f.survey.add_question(f.q);
    f.survey.add_option("Q7", option("Apple", 1.0));
    f.survey.add_option("Q7", option("Banana", 2.0));
    f.survey.add_option("Q7", option("Cherry", 3.0));
    return f;
}

double number(const Cell& c) {
    EXPECT_TRUE(std::holds_alternative<double>(c));
    return std::holds_alternative<double>(c) ? std::get<double>(c) : -1.0;
}

}  // namespace

// ===========================================================================
// Extraction
// ===========================================================================
class RankingExtractionTest : public ::testing::Test {};

TEST_F(RankingExtractionTest, ItemFormatPlacesRanks) {
    FruitRanking f = fruit_ranking();
    RankingMatrix m = ranking::extract(f.table, f.survey, f.q);

    ASSERT_EQ(m.item_count(), 3u);
    EXPECT_EQ(m.items()[0], "Apple");
    EXPECT_EQ(m.num_positions(), 3);
    EXPECT_EQ(m.at(0, m.item_index("Apple")), 1.0);
    EXPECT_EQ(m.at(1, m.item_index("Banana")), 3.0);
    EXPECT_EQ(m.at(2, m.item_index("Apple")), 2.0);
    EXPECT_FALSE(m.at(3, m.item_index("Apple")).has_value());
    EXPECT_EQ(m.at(3, m.item_index("Cherry")), 1.0);
}

TEST_F(RankingExtractionTest, PositionFormatReadsItemColumns) {
    RespondentTable t(2);
    t.add_column(numbers("Q8_Tea", {1.0, 2.0}));
    t.add_column(numbers("Q8_Coffee", {2.0, 1.0}));
    SurveyStructure s;
    QuestionDef q = question("Q8", VariableType::RANKING);
    q.ranking_format = "Position";
    q.columns = 2;
    s.add_question(q);
    s.add_option("Q8", option("Tea", 1.0));
    s.add_option("Q8", option("Coffee", 2.0));

    RankingMatrix m = ranking::extract(t, s, q);
    EXPECT_EQ(m.at(0, m.item_index("Tea")), 1.0);
    EXPECT_EQ(m.at(1, m.item_index("Coffee")), 1.0);
}

TEST_F(RankingExtractionTest, WorstToBestIsNormalized) {
    FruitRanking f = fruit_ranking("WorstToBest");
    RankingMatrix m = ranking::extract(f.table, f.survey, f.q);
    // Apple was in Rank1 for respondent 0; with worst-to-best that is worst.
    EXPECT_EQ(m.at(0, m.item_index("Apple")), 3.0);
    EXPECT_EQ(m.at(0, m.item_index("Cherry")), 1.0);
}

TEST_F(RankingExtractionTest, DoubleFlipRestoresMatrix) {
    RankingMatrix m(2, {"a", "b", "c", "d", "e"}, 5);
    m.set(0, 0, 1.0);
    m.set(0, 1, 5.0);
    m.set(1, 2, 3.0);
    m.set(1, 4, 2.0);
    RankingMatrix once = ranking::flip_direction(m);
    EXPECT_EQ(once.at(0, 0), 5.0);
    EXPECT_EQ(once.at(1, 2), 3.0);
    EXPECT_FALSE(once.at(0, 2).has_value());
    EXPECT_TRUE(ranking::flip_direction(once) == m);
}

TEST_F(RankingExtractionTest, InvalidFormatIsRejected) {
    FruitRanking f = fruit_ranking();
    f.q.ranking_format = "Grid";
    try {
        ranking::extract(f.table, f.survey, f.q);
        FAIL() << "expected CrosstabError";
    } catch (const CrosstabError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CFG_INVALID_RANKING_FORMAT);
    }
}

TEST_F(RankingExtractionTest, MissingColumnsAreRejected) {
    FruitRanking f = fruit_ranking();
    f.q.code = "Q9";
    f.survey.add_question(f.q);
    f.survey.add_option("Q9", option("Apple", 1.0));
    try {
        ranking::extract(f.table, f.survey, f.q);
        FAIL() << "expected CrosstabError";
    } catch (const CrosstabError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DATA_COLUMN_NOT_FOUND);
    }
}

// ===========================================================================
// Validation
// ===========================================================================
class RankingValidationTest : public ::testing::Test {};

TEST_F(RankingValidationTest, CleanDataHasNoIssues) {
    FruitRanking f = fruit_ranking();
    RankingMatrix m = ranking::extract(f.table, f.survey, f.q);
    RankingQuality q = ranking::validate(m, RankingThresholds{});
    EXPECT_FALSE(q.has_issues);
    EXPECT_EQ(q.missing, 2u);
    EXPECT_NEAR(q.pct_complete, 100.0 * 10.0 / 12.0, 1e-9);
}

TEST_F(RankingValidationTest, DetectsTiesGapsAndRange) {
    RankingMatrix m(2, {"a", "b", "c"}, 3);
    m.set(0, 0, 1.0);
    m.set(0, 1, 1.0);
    m.set(0, 2, 2.0);
    m.set(1, 0, 1.0);
    m.set(1, 1, 3.0);
    m.set(1, 2, 7.0);
    RankingQuality q = ranking::validate(m, RankingThresholds{});
    EXPECT_EQ(q.respondents_with_ties, 1u);
    EXPECT_EQ(q.respondents_with_gaps, 2u);
    EXPECT_EQ(q.out_of_range, 1u);
    EXPECT_TRUE(q.has_issues);
    EXPECT_NE(q.summary().find("out of valid range"), std::string::npos);
}

TEST_F(RankingValidationTest, EmptyMatrixIsFatal) {
    RankingMatrix m(0, {"a"}, 1);
    try {
        ranking::validate(m, RankingThresholds{});
        FAIL() << "expected CrosstabError";
    } catch (const CrosstabError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DATA_EMPTY_RANKING);
    }
}

// ===========================================================================
// Metrics
// ===========================================================================
class RankingMetricsTest : public ::testing::Test {};

TEST_F(RankingMetricsTest, SharesUseRespondentsWhoRankedTheItem) {
    FruitRanking f = fruit_ranking();
    RankingMatrix m = ranking::extract(f.table, f.survey, f.q);
    WeightSequence w = weighting::unit_weights(4);
    auto rows = f.table.all_rows();

    RankShare apple = ranking::pct_first(m, m.item_index("Apple"), w, rows);
    EXPECT_DOUBLE_EQ(apple.base, 3.0);
    EXPECT_DOUBLE_EQ(apple.count, 2.0);
    EXPECT_NEAR(*apple.percentage(), 200.0 / 3.0, 1e-9);

    RankShare cherry = ranking::pct_first(m, m.item_index("Cherry"), w, rows);
    EXPECT_DOUBLE_EQ(cherry.base, 4.0);
    EXPECT_NEAR(*cherry.percentage(), 25.0, 1e-9);

    RankShare top2 = ranking::pct_top_n(m, m.item_index("Banana"), 2, w, rows);
    EXPECT_NEAR(*top2.percentage(), 200.0 / 3.0, 1e-9);
}

TEST_F(RankingMetricsTest, MeanRankAndVariance) {
    FruitRanking f = fruit_ranking();
    RankingMatrix m = ranking::extract(f.table, f.survey, f.q);
    WeightSequence w = weighting::unit_weights(4);
    auto rows = f.table.all_rows();

    auto apple = ranking::mean_rank(m, m.item_index("Apple"), w, rows);
    ASSERT_TRUE(apple.has_value());
    EXPECT_NEAR(*apple, 4.0 / 3.0, 1e-12);
    auto cherry = ranking::mean_rank(m, m.item_index("Cherry"), w, rows);
    EXPECT_NEAR(*cherry, 9.0 / 4.0, 1e-12);

    auto var = ranking::rank_variance(m, m.item_index("Banana"), w, rows);
    ASSERT_TRUE(var.has_value());
    // ranks 2, 3, 1
    EXPECT_NEAR(*var, 2.0 / 3.0, 1e-12);
}

TEST_F(RankingMetricsTest, NobodyRankedGivesUndefinedMean) {
    RankingMatrix m(3, {"a"}, 1);
    WeightSequence w = weighting::unit_weights(3);
    std::vector<size_t> rows = {0, 1, 2};
    EXPECT_FALSE(ranking::mean_rank(m, 0, w, rows).has_value());
    EXPECT_FALSE(ranking::pct_first(m, 0, w, rows).percentage().has_value());
}

// ===========================================================================
// Tables
// ===========================================================================
class RankingTablesTest : public ::testing::Test {
protected:
    Diagnostics diag;
};

TEST_F(RankingTablesTest, TopNIsClampedWithWarning) {
    RankingContext ctx("Q7", diag);
    EXPECT_EQ(ranking::effective_top_n(5, 3, ctx), 3);
    EXPECT_EQ(ranking::effective_top_n(2, 3, ctx), 2);
    ASSERT_EQ(diag.warnings().size(), 1u);
    EXPECT_EQ(diag.warnings()[0].source, "ranking:Q7");
    EXPECT_NE(diag.warnings()[0].message.find("clamping to 3"), std::string::npos);
}

TEST_F(RankingTablesTest, RowsPerItemInOrder) {
    FruitRanking f = fruit_ranking();
    BannerStructure structure = banner::build_structure(f.survey, {});
    RowIndexMap map = banner::build_row_index_map(f.table, f.table.all_rows(), structure);
    WeightSequence w = weighting::unit_weights(4);
    CrosstabConfig cfg = plain_config();
    cfg.enable_significance_testing = false;
    cfg.ranking_top_n = 2;

    RankingContext ctx("Q7", diag);
    auto rows = ranking::process(f.table, f.survey, f.q, structure, map, w, cfg, ctx);
    ASSERT_EQ(rows.size(), 9u);
    EXPECT_EQ(rows[0].label, "Apple - % Ranked 1st");
    EXPECT_EQ(rows[0].kind, RowKind::COLUMN_PCT);
    EXPECT_EQ(rows[1].label, "Apple - Mean Rank (Lower = Better)");
    EXPECT_EQ(rows[1].kind, RowKind::AVERAGE);
    EXPECT_EQ(rows[2].label, "Apple - % Top 2");
    EXPECT_EQ(rows[3].label, "Banana - % Ranked 1st");
    EXPECT_NEAR(number(rows[1].cells[0]), 4.0 / 3.0, 1e-12);
    EXPECT_NEAR(number(rows[6].cells[0]), 25.0, 1e-9);
    EXPECT_TRUE(ctx.failed_items.empty());
}

TEST_F(RankingTablesTest, SigRowsFollowTestedRows) {
    FruitRanking f = fruit_ranking();
    BannerStructure structure = banner::build_structure(f.survey, {});
    RowIndexMap map = banner::build_row_index_map(f.table, f.table.all_rows(), structure);
    WeightSequence w = weighting::unit_weights(4);
    CrosstabConfig cfg = plain_config();
    cfg.ranking_show_top_n = false;

    RankingContext ctx("Q7", diag);
    auto rows = ranking::process(f.table, f.survey, f.q, structure, map, w, cfg, ctx);
    ASSERT_EQ(rows.size(), 12u);
    EXPECT_EQ(rows[1].kind, RowKind::SIG);
    EXPECT_EQ(rows[1].label, rows[0].label);
    EXPECT_EQ(rows[3].kind, RowKind::SIG);
    EXPECT_EQ(std::get<std::string>(rows[3].cells[0]), "-");
}
