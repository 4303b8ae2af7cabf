// banner_test.cpp — segment keys, banner structure and row index maps

#include <gtest/gtest.h>

#include "banner/banner_structure.hpp"
#include "banner/row_index_map.hpp"
#include "data/segment_key.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using namespace test_helpers;

namespace {

ErrorCode build_error(const SurveyStructure& survey, const std::vector<BannerRequest>& reqs) {
    try {
        banner::build_structure(survey, reqs);
    } catch (const CrosstabError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected CrosstabError";
    return ErrorCode::CFG_INVALID_VALUE;
}

// Region with box categories North (N1, N2) and South (S1).
SurveyStructure region_survey() {
    SurveyStructure s;
    s.add_question(question("REGION", VariableType::SINGLE_RESPONSE, "Region"));
    s.add_option("REGION", option("S1", 3.0, "South"));
    s.add_option("REGION", option("N1", 1.0, "North"));
    s.add_option("REGION", option("N2", 2.0, "North"));
    return s;
}

}  // namespace

// ===========================================================================
// SegmentKey
// ===========================================================================
class SegmentKeyTest : public ::testing::Test {};

TEST_F(SegmentKeyTest, TextForms) {
    EXPECT_EQ(SegmentKey::total().str(), "TOTAL::Total");
    EXPECT_EQ(SegmentKey::standard("Q1", "Male").str(), "Q1::Male");
    EXPECT_EQ(SegmentKey::box_category("Q1", "Top").str(), "Q1::BOXCAT::Top");
}

TEST_F(SegmentKeyTest, ParseRestoresEveryKind) {
    EXPECT_TRUE(SegmentKey::parse("TOTAL::Total").is_total());
    SegmentKey s = SegmentKey::parse("Q1::Male");
    EXPECT_EQ(s.kind(), SegmentKey::Kind::STANDARD);
    EXPECT_EQ(s.question(), "Q1");
    EXPECT_EQ(s.value(), "Male");
    SegmentKey b = SegmentKey::parse("Q1::BOXCAT::Top 2");
    EXPECT_EQ(b.kind(), SegmentKey::Kind::BOX_CATEGORY);
    EXPECT_EQ(b.value(), "Top 2");
}

TEST_F(SegmentKeyTest, OptionMayContainSeparator) {
    SegmentKey s = SegmentKey::parse("Q1::a::b");
    EXPECT_EQ(s.question(), "Q1");
    EXPECT_EQ(s.value(), "a::b");
}

TEST_F(SegmentKeyTest, RejectsMalformedKeys) {
    EXPECT_THROW(SegmentKey::parse("no separator"), std::invalid_argument);
    EXPECT_THROW(SegmentKey::parse("::Male"), std::invalid_argument);
    EXPECT_THROW(SegmentKey::parse("Q1::"), std::invalid_argument);
    EXPECT_THROW(SegmentKey::parse("TOTAL::All"), std::invalid_argument);
    EXPECT_THROW(SegmentKey::standard("TOTAL", "x"), std::invalid_argument);
    EXPECT_THROW(SegmentKey::box_category("TOTAL", "x"), std::invalid_argument);
}

TEST_F(SegmentKeyTest, StandardOptionCannotLookLikeBoxCategory) {
    EXPECT_THROW(SegmentKey::standard("Q1", "BOXCAT::Top"), std::invalid_argument);
    EXPECT_EQ(SegmentKey::standard("Q1", "BOXCAT").str(), "Q1::BOXCAT");
    EXPECT_EQ(SegmentKey::parse("Q1::BOXCAT").kind(), SegmentKey::Kind::STANDARD);
}

// ===========================================================================
// Column letters
// ===========================================================================
class ColumnLetterTest : public ::testing::Test {};

TEST_F(ColumnLetterTest, ExcelStyleSequence) {
    EXPECT_EQ(banner::column_letter(0), "A");
    EXPECT_EQ(banner::column_letter(25), "Z");
    EXPECT_EQ(banner::column_letter(26), "AA");
    EXPECT_EQ(banner::column_letter(27), "AB");
    EXPECT_EQ(banner::column_letter(701), "ZZ");
    EXPECT_EQ(banner::column_letter(702), "AAA");
}

// ===========================================================================
// Banner structure
// ===========================================================================
class BannerStructureTest : public ::testing::Test {};

TEST_F(BannerStructureTest, TotalFirstThenOptionsInDisplayOrder) {
    SurveyStructure s;
    s.add_question(question("GENDER", VariableType::SINGLE_RESPONSE, "Gender"));
    s.add_option("GENDER", option("Female", 2.0));
    s.add_option("GENDER", option("Male", 1.0));

    BannerStructure b = banner::build_structure(s, {banner_on("GENDER")});
    ASSERT_EQ(b.size(), 3u);
    EXPECT_TRUE(b.columns()[0].key.is_total());
    EXPECT_EQ(b.columns()[0].letter, "-");
    EXPECT_EQ(b.columns()[1].label, "Male");
    EXPECT_EQ(b.columns()[1].letter, "A");
    EXPECT_EQ(b.columns()[2].label, "Female");
    EXPECT_EQ(b.columns()[2].letter, "B");

    ASSERT_EQ(b.groups().size(), 1u);
    EXPECT_EQ(b.groups()[0].label, "Gender");
    EXPECT_EQ(b.groups()[0].columns, (std::vector<size_t>{1, 2}));
}

TEST_F(BannerStructureTest, HiddenOptionsAreNotSegments) {
    SurveyStructure s;
    s.add_question(question("AGE", VariableType::SINGLE_RESPONSE));
    s.add_option("AGE", option("Young", 1.0));
    OptionDef hidden = option("Refused", 2.0);
    hidden.show_in_output = false;
    s.add_option("AGE", hidden);

    BannerStructure b = banner::build_structure(s, {banner_on("AGE")});
    EXPECT_EQ(b.size(), 2u);
}

TEST_F(BannerStructureTest, BoxCategoriesGroupOptions) {
    BannerRequest req = banner_on("REGION");
    req.use_box_category = true;
    BannerStructure b = banner::build_structure(region_survey(), {req});

    ASSERT_EQ(b.size(), 3u);
    EXPECT_EQ(b.columns()[1].key.str(), "REGION::BOXCAT::North");
    EXPECT_EQ(b.columns()[1].match_values, (std::vector<std::string>{"N1", "N2"}));
    EXPECT_EQ(b.columns()[2].key.str(), "REGION::BOXCAT::South");
}

TEST_F(BannerStructureTest, GroupsFollowBannerDisplayOrder) {
    SurveyStructure s = region_survey();
    s.add_question(question("GENDER", VariableType::SINGLE_RESPONSE));
    s.add_option("GENDER", option("M", 1.0));

    BannerRequest region = banner_on("REGION");
    region.display_order = 2.0;
    BannerRequest gender = banner_on("GENDER");
    gender.display_order = 1.0;
    gender.banner_label = "Sex";

    BannerStructure b = banner::build_structure(s, {region, gender});
    ASSERT_EQ(b.groups().size(), 2u);
    EXPECT_EQ(b.groups()[0].code, "GENDER");
    EXPECT_EQ(b.groups()[0].label, "Sex");
    EXPECT_EQ(b.groups()[1].code, "REGION");
    // Letters restart in each group
    EXPECT_EQ(b.columns()[b.groups()[1].columns[0]].letter, "A");
}

TEST_F(BannerStructureTest, ReservedNamesAreConfigurationErrors) {
    SurveyStructure s;
    s.add_question(question("TOTAL", VariableType::SINGLE_RESPONSE));
    s.add_option("TOTAL", option("x", 1.0));
    EXPECT_EQ(build_error(s, {banner_on("TOTAL")}), ErrorCode::CFG_INVALID_VALUE);

    SurveyStructure t;
    t.add_question(question("G", VariableType::SINGLE_RESPONSE));
    t.add_option("G", option("BOXCAT::odd", 1.0));
    EXPECT_EQ(build_error(t, {banner_on("G")}), ErrorCode::CFG_INVALID_VALUE);
}

TEST_F(BannerStructureTest, UnknownQuestionIsRejected) {
    EXPECT_EQ(build_error(region_survey(), {banner_on("NOPE")}),
              ErrorCode::CFG_BANNER_QUESTION_NOT_FOUND);
}

TEST_F(BannerStructureTest, QuestionWithoutOptionsIsRejected) {
    SurveyStructure s;
    s.add_question(question("EMPTY", VariableType::SINGLE_RESPONSE));
    EXPECT_EQ(build_error(s, {banner_on("EMPTY")}), ErrorCode::CFG_BANNER_NO_OPTIONS);
}

TEST_F(BannerStructureTest, BoxCategoryRequestWithoutCategoriesIsRejected) {
    SurveyStructure s;
    s.add_question(question("Q", VariableType::SINGLE_RESPONSE));
    s.add_option("Q", option("x", 1.0));
    BannerRequest req = banner_on("Q");
    req.use_box_category = true;
    EXPECT_EQ(build_error(s, {req}), ErrorCode::CFG_BANNER_NO_BOXCATEGORY);
}

// ===========================================================================
// Row index map
// ===========================================================================
class RowIndexMapTest : public ::testing::Test {};

TEST_F(RowIndexMapTest, SegmentsSingleResponseRows) {
    Scenario sc = two_segment_scenario();
    BannerStructure b = banner::build_structure(sc.survey, sc.banner);
    RowIndexMap map = banner::build_row_index_map(sc.table, sc.table.all_rows(), b);

    ASSERT_EQ(map.size(), 3u);
    EXPECT_EQ(map.at(0).size(), 100u);
    EXPECT_EQ(map.at(1).size(), 60u);
    EXPECT_EQ(map.at(2).size(), 40u);
    EXPECT_EQ(map.at(2).front(), 60u);
}

TEST_F(RowIndexMapTest, RespectsBaseRowSubset) {
    Scenario sc = two_segment_scenario();
    BannerStructure b = banner::build_structure(sc.survey, sc.banner);
    std::vector<size_t> base = {0, 1, 59, 60, 99};
    RowIndexMap map = banner::build_row_index_map(sc.table, base, b);

    EXPECT_EQ(map.at(0), base);
    EXPECT_EQ(map.at(1), (std::vector<size_t>{0, 1, 59}));
    EXPECT_EQ(map.at(2), (std::vector<size_t>{60, 99}));
}

TEST_F(RowIndexMapTest, NumericDataMatchesTextOptions) {
    RespondentTable t(4);
    t.add_column(numbers("G", {1.0, 2.0, 1.0, NAN}));
    SurveyStructure s;
    s.add_question(question("G", VariableType::SINGLE_RESPONSE));
    s.add_option("G", option("1", 1.0));
    s.add_option("G", option("2", 2.0));

    BannerStructure b = banner::build_structure(s, {banner_on("G")});
    RowIndexMap map = banner::build_row_index_map(t, t.all_rows(), b);
    EXPECT_EQ(map.at(1), (std::vector<size_t>{0, 2}));
    EXPECT_EQ(map.at(2), (std::vector<size_t>{1}));
}

TEST_F(RowIndexMapTest, MultiMentionRowAppearsOnceInEachSegment) {
    RespondentTable t(3);
    t.add_column(texts("M_1", {"Red", "Blue", ""}));
    t.add_column(texts("M_2", {"Blue", "Blue", "Red"}));
    SurveyStructure s;
    QuestionDef q = question("M", VariableType::MULTI_MENTION);
    q.columns = 2;
    s.add_question(q);
    s.add_option("M", option("Red", 1.0));
    s.add_option("M", option("Blue", 2.0));

    BannerStructure b = banner::build_structure(s, {banner_on("M")});
    RowIndexMap map = banner::build_row_index_map(t, t.all_rows(), b);
    EXPECT_EQ(map.at(1), (std::vector<size_t>{0, 2}));
    EXPECT_EQ(map.at(2), (std::vector<size_t>{0, 1}));
}

TEST_F(RowIndexMapTest, BoxCategoryIsUnionOfMemberOptions) {
    RespondentTable t(5);
    t.add_column(texts("REGION", {"N1", "S1", "N2", "N1", "S1"}));
    SurveyStructure s = region_survey();

    BannerStructure by_option = banner::build_structure(s, {banner_on("REGION")});
    RowIndexMap options = banner::build_row_index_map(t, t.all_rows(), by_option);
    // N1, N2, S1 in display order
    std::vector<size_t> north_union = options.at(1);
    north_union.insert(north_union.end(), options.at(2).begin(), options.at(2).end());
    std::sort(north_union.begin(), north_union.end());

    BannerRequest req = banner_on("REGION");
    req.use_box_category = true;
    BannerStructure boxed = banner::build_structure(s, {req});
    RowIndexMap map = banner::build_row_index_map(t, t.all_rows(), boxed);
    ASSERT_EQ(map.size(), 3u);
    EXPECT_EQ(map.at(1), north_union);
    EXPECT_EQ(map.at(1), (std::vector<size_t>{0, 2, 3}));
    EXPECT_EQ(map.at(2), (std::vector<size_t>{1, 4}));
}

TEST_F(RowIndexMapTest, MultiMentionBoxCategoryCountsRespondentOnce) {
    RespondentTable t(4);
    t.add_column(texts("MR_1", {"N1", "S1", "S1", "N2"}));
    t.add_column(texts("MR_2", {"N2", "N1", "", ""}));
    SurveyStructure s;
    QuestionDef q = question("MR", VariableType::MULTI_MENTION);
    q.columns = 2;
    s.add_question(q);
    s.add_option("MR", option("N1", 1.0, "North"));
    s.add_option("MR", option("N2", 2.0, "North"));
    s.add_option("MR", option("S1", 3.0, "South"));

    BannerRequest req = banner_on("MR");
    req.use_box_category = true;
    BannerStructure b = banner::build_structure(s, {req});
    RowIndexMap map = banner::build_row_index_map(t, t.all_rows(), b);
    ASSERT_EQ(map.size(), 3u);
    EXPECT_EQ(b.columns()[1].key.str(), "MR::BOXCAT::North");
    // Row 0 holds both North options and appears once
    EXPECT_EQ(map.at(1), (std::vector<size_t>{0, 1, 3}));
    EXPECT_EQ(map.at(2), (std::vector<size_t>{1, 2}));
}

TEST_F(RowIndexMapTest, MissingSourceColumnIsRejected) {
    RespondentTable t(2);
    t.add_column(numbers("Q1", {1.0, 2.0}));
    SurveyStructure s = region_survey();
    BannerStructure b = banner::build_structure(s, {banner_on("REGION")});
    try {
        banner::build_row_index_map(t, t.all_rows(), b);
        FAIL() << "expected CrosstabError";
    } catch (const CrosstabError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CFG_BANNER_COLUMN_NOT_FOUND);
    }
}
