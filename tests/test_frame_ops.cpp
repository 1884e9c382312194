#include <gtest/gtest.h>

#include "FrameOps.h"
#include "TabulaExceptions.h"
#include "TestHelpers.h"

#include <cmath>
#include <functional>

using namespace Tabula;

namespace {
std::string errorCategory(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ScriptError& e) {
        return e.category();
    }
    return "";
}
} // namespace

TEST(FrameOpsTest, ScalarArithmeticFollowsPythonRules) {
    EXPECT_EQ(std::get<int64_t>(FrameOps::arith(ArithOp::ADD, int64_t{2}, int64_t{3})), 5);
    EXPECT_DOUBLE_EQ(std::get<double>(FrameOps::arith(ArithOp::DIV, int64_t{7}, int64_t{2})), 3.5);
    EXPECT_EQ(std::get<int64_t>(FrameOps::arith(ArithOp::FLOOR_DIV, int64_t{-7}, int64_t{2})), -4);
    EXPECT_EQ(std::get<int64_t>(FrameOps::arith(ArithOp::MOD, int64_t{-7}, int64_t{3})), 2);
    EXPECT_EQ(std::get<std::string>(FrameOps::arith(ArithOp::ADD, std::string("ab"), std::string("c"))), "abc");
    EXPECT_EQ(std::get<std::string>(FrameOps::arith(ArithOp::MUL, std::string("ab"), int64_t{3})), "ababab");

    EXPECT_EQ(errorCategory([] { FrameOps::arith(ArithOp::DIV, int64_t{1}, int64_t{0}); }), "ZeroDivisionError");
    EXPECT_EQ(errorCategory([] { FrameOps::arith(ArithOp::MOD, 1.5, 0.0); }), "ZeroDivisionError");
    EXPECT_EQ(errorCategory([] { FrameOps::arith(ArithOp::SUB, std::string("a"), int64_t{1}); }), "TypeError");
}

TEST(FrameOpsTest, ScalarComparisonRejectsMixedOrdering) {
    EXPECT_TRUE(FrameOps::compare(CompareOp::LT, int64_t{1}, 2.5));
    EXPECT_TRUE(FrameOps::compare(CompareOp::EQ, std::string("x"), std::string("x")));
    EXPECT_FALSE(FrameOps::compare(CompareOp::EQ, int64_t{1}, std::string("1")));
    EXPECT_EQ(errorCategory([] { FrameOps::compare(CompareOp::GT, int64_t{1}, std::string("a")); }), "TypeError");
}

TEST(FrameOpsTest, ColumnDivisionByZeroIsIeee) {
    const Column a = Column::fromDoubles("a", {1.0, 0.0, -2.0});
    const Column b = Column::fromInts("b", {0, 0, 4});
    const Column out = FrameOps::arithColumns(ArithOp::DIV, a, b);
    ASSERT_EQ(out.type, ColumnType::NUMERIC);
    EXPECT_TRUE(std::isinf(out.numberAt(0)));
    EXPECT_TRUE(std::isnan(out.numberAt(1)));
    EXPECT_DOUBLE_EQ(out.numberAt(2), -0.5);
}

TEST(FrameOpsTest, IntegerColumnsStayIntegral) {
    const Column a = Column::fromInts("a", {1, 2, 3});
    const Column sum = FrameOps::arithColumnScalar(ArithOp::ADD, a, int64_t{10}, false);
    EXPECT_EQ(sum.type, ColumnType::INTEGER);
    EXPECT_EQ(std::get<int64_t>(sum.at(2)), 13);

    const Column halves = FrameOps::arithColumnScalar(ArithOp::DIV, a, int64_t{2}, false);
    EXPECT_EQ(halves.type, ColumnType::NUMERIC);

    const Column reversed = FrameOps::arithColumnScalar(ArithOp::SUB, a, int64_t{10}, true);
    EXPECT_EQ(std::get<int64_t>(reversed.at(0)), 9);

    EXPECT_THROW(FrameOps::arithColumns(ArithOp::ADD, a, Column::fromInts("b", {1})), ScriptError);
}

TEST(FrameOpsTest, MissingCellsPropagateAndCompareFalse) {
    Column a = Column::fromDoubles("a", {1.0, 2.0, 3.0});
    a.missing[1] = 1;
    const Column plus = FrameOps::arithColumnScalar(ArithOp::ADD, a, 1.0, false);
    EXPECT_TRUE(std::isnan(plus.numberAt(1)));

    const Column gt = FrameOps::compareColumnScalar(CompareOp::GT, a, 0.0, false);
    EXPECT_EQ(FrameOps::rowsWhere(gt), (std::vector<size_t>{0, 2}));
    const Column ne = FrameOps::compareColumnScalar(CompareOp::NE, a, 0.0, false);
    EXPECT_EQ(FrameOps::rowsWhere(ne).size(), 3u);
}

TEST(FrameOpsTest, BooleanMasksCombineAndInvert) {
    const Column x = Column::fromBools("", {1, 1, 0, 0});
    const Column y = Column::fromBools("", {1, 0, 1, 0});
    EXPECT_EQ(FrameOps::rowsWhere(FrameOps::arithColumns(ArithOp::BIT_AND, x, y)), (std::vector<size_t>{0}));
    EXPECT_EQ(FrameOps::rowsWhere(FrameOps::arithColumns(ArithOp::BIT_OR, x, y)), (std::vector<size_t>{0, 1, 2}));
    EXPECT_EQ(FrameOps::rowsWhere(FrameOps::invert(x)), (std::vector<size_t>{2, 3}));
    EXPECT_EQ(errorCategory([] { FrameOps::rowsWhere(Column::fromInts("n", {1})); }), "TypeError");
}

TEST(FrameOpsTest, ReductionsMatchPandas) {
    const DataFrame df = TabulaTest::scoresFrame();
    const Column& score = df.column("score");
    EXPECT_NEAR(std::get<double>(FrameOps::reduce(score, Reduction::MEAN)), 77.1, 1e-9);
    EXPECT_DOUBLE_EQ(std::get<double>(FrameOps::reduce(score, Reduction::MEDIAN)), 80.0);
    EXPECT_DOUBLE_EQ(std::get<double>(FrameOps::reduce(score, Reduction::MAX)), 90.0);
    EXPECT_EQ(std::get<int64_t>(FrameOps::reduce(df.column("level"), Reduction::SUM)), 9);
    EXPECT_EQ(std::get<int64_t>(FrameOps::reduce(df.column("course_name"), Reduction::NUNIQUE)), 3);
    EXPECT_EQ(std::get<std::string>(FrameOps::reduce(df.column("student"), Reduction::MIN)), "Ana");

    const Column pair = Column::fromDoubles("p", {1.0, 3.0});
    EXPECT_DOUBLE_EQ(std::get<double>(FrameOps::reduce(pair, Reduction::VAR)), 2.0);
    EXPECT_DOUBLE_EQ(std::get<double>(FrameOps::reduce(pair, Reduction::VAR, 0)), 1.0);

    EXPECT_EQ(errorCategory([&] { FrameOps::reduce(df.column("student"), Reduction::MEAN); }), "TypeError");
}

TEST(FrameOpsTest, EmptyNumericReductionsAreNaN) {
    const Column empty = Column::fromDoubles("e", {});
    EXPECT_TRUE(std::isnan(std::get<double>(FrameOps::reduce(empty, Reduction::MEAN))));
    EXPECT_TRUE(std::isnan(std::get<double>(FrameOps::reduce(empty, Reduction::MAX))));
    EXPECT_EQ(std::get<int64_t>(FrameOps::reduce(empty, Reduction::COUNT)), 0);
}

TEST(FrameOpsTest, HeadAndTailHandleNegativeCounts) {
    EXPECT_EQ(FrameOps::headRows(5, 2), (std::vector<size_t>{0, 1}));
    EXPECT_EQ(FrameOps::headRows(5, -3), (std::vector<size_t>{0, 1}));
    EXPECT_EQ(FrameOps::tailRows(5, 2), (std::vector<size_t>{3, 4}));
    EXPECT_TRUE(FrameOps::tailRows(5, -9).empty());
    EXPECT_EQ(FrameOps::headRows(2, 10).size(), 2u);
}

TEST(FrameOpsTest, SortIsStableWithMissingLast) {
    Column key = Column::fromDoubles("k", {3.0, 1.0, 2.0, 1.0});
    key.missing[2] = 1;
    EXPECT_EQ(FrameOps::sortOrder({&key}, {true}), (std::vector<size_t>{1, 3, 0, 2}));
    EXPECT_EQ(FrameOps::sortOrder({&key}, {false}), (std::vector<size_t>{0, 1, 3, 2}));
}

TEST(FrameOpsTest, GroupRowsSortsKeysAndAggregates) {
    const DataFrame df = TabulaTest::scoresFrame();
    const FrameOps::Groups groups = FrameOps::groupRows({&df.column("course_name")}, true, true);
    ASSERT_EQ(groups.members.size(), 3u);
    EXPECT_EQ(std::get<std::string>(groups.keys.labelAt(0)), "Art");
    EXPECT_EQ(std::get<std::string>(groups.keys.labelAt(1)), "Bio");
    EXPECT_EQ(std::get<std::string>(groups.keys.labelAt(2)), "Math");
    EXPECT_EQ(groups.keys.names().at(0), "course_name");

    const Column means = FrameOps::aggregateGroups(df.column("score"), groups, Reduction::MEAN);
    EXPECT_DOUBLE_EQ(means.numberAt(0), 65.0);
    EXPECT_DOUBLE_EQ(means.numberAt(1), 85.5);
    EXPECT_DOUBLE_EQ(means.numberAt(2), 85.0);

    const FrameOps::Groups unsorted = FrameOps::groupRows({&df.column("course_name")}, false, true);
    EXPECT_EQ(std::get<std::string>(unsorted.keys.labelAt(0)), "Math");
}

TEST(FrameOpsTest, ValueCountsOrdersByFrequency) {
    const DataFrame df = TabulaTest::scoresFrame();
    const Series counts = FrameOps::valueCounts(df.column("level"), false, false, true);
    ASSERT_EQ(counts.size(), 3u);
    EXPECT_EQ(counts.name(), "count");
    EXPECT_EQ(std::get<int64_t>(counts.index.labelAt(0)), 1);
    EXPECT_EQ(std::get<int64_t>(counts.values.at(0)), 2);
    EXPECT_EQ(std::get<int64_t>(counts.index.labelAt(2)), 3);

    const Series shares = FrameOps::valueCounts(df.column("level"), true, false, true);
    EXPECT_EQ(shares.name(), "proportion");
    EXPECT_DOUBLE_EQ(shares.values.numberAt(0), 0.4);
}

TEST(FrameOpsTest, UniqueKeepsFirstAppearance) {
    const DataFrame df = TabulaTest::scoresFrame();
    const auto uniques = FrameOps::uniqueValues(df.column("course_name"));
    ASSERT_EQ(uniques.size(), 3u);
    EXPECT_EQ(std::get<std::string>(uniques[0]), "Math");
    EXPECT_EQ(std::get<std::string>(uniques[1]), "Art");

    Column withGap = Column::fromDoubles("g", {1.0, 1.0, 2.0});
    withGap.missing[2] = 1;
    EXPECT_EQ(FrameOps::countUnique(withGap), 1u);
    EXPECT_EQ(FrameOps::countUnique(withGap, false), 2u);
}

TEST(FrameOpsTest, DescribeSummarizesNumericColumns) {
    const DataFrame summary = FrameOps::describe(TabulaTest::scoresFrame());
    ASSERT_EQ(summary.cols(), 2u);
    EXPECT_EQ(summary.columns[0].name, "score");
    EXPECT_EQ(summary.rows(), 8u);
    EXPECT_EQ(std::get<std::string>(summary.index.labelAt(1)), "mean");
    EXPECT_DOUBLE_EQ(summary.columns[0].numberAt(0), 5.0);
    EXPECT_DOUBLE_EQ(summary.columns[0].numberAt(3), 60.0);
}

TEST(FrameOpsTest, MergeJoinsOnSharedKeys) {
    DataFrame right;
    right.columns.push_back(Column::fromStrings("course_name", {"Math", "Art", "Chem"}));
    right.columns.push_back(Column::fromStrings("teacher", {"Kim", "Lee", "Ng"}));
    right.index = Index::range(3);

    const DataFrame inner = FrameOps::merge(TabulaTest::scoresFrame(), right, {}, "inner");
    EXPECT_EQ(inner.rows(), 4u);
    EXPECT_EQ(std::get<std::string>(inner.column("teacher").at(0)), "Kim");

    const DataFrame outer = FrameOps::merge(TabulaTest::scoresFrame(), right, {"course_name"}, "outer");
    EXPECT_EQ(outer.rows(), 6u);
    EXPECT_TRUE(outer.column("teacher").isMissing(4));
    EXPECT_EQ(std::get<std::string>(outer.column("course_name").at(5)), "Chem");

    EXPECT_THROW(FrameOps::merge(TabulaTest::scoresFrame(), right, {}, "cross"), ScriptError);
}

TEST(FrameOpsTest, PivotTableSpreadsColumnValues) {
    const DataFrame df = TabulaTest::scoresFrame();
    const DataFrame pivot = FrameOps::pivotTable(df, {"score"}, {"course_name"}, "level", Reduction::MEAN);
    ASSERT_EQ(pivot.rows(), 3u);
    ASSERT_EQ(pivot.cols(), 3u);
    EXPECT_EQ(pivot.columns[0].name, "1");
    EXPECT_DOUBLE_EQ(pivot.columns[0].numberAt(0), 70.0);
    EXPECT_TRUE(pivot.columns[0].isMissing(1));
}

TEST(FrameOpsTest, RoundHalfEven) {
    EXPECT_DOUBLE_EQ(FrameOps::roundHalfEven(2.5, 0), 2.0);
    EXPECT_DOUBLE_EQ(FrameOps::roundHalfEven(3.5, 0), 4.0);
    EXPECT_DOUBLE_EQ(FrameOps::roundHalfEven(3.14159, 4), 3.1416);
    EXPECT_TRUE(std::isnan(FrameOps::roundHalfEven(std::nan(""), 2)));
    // Rounds the stored binary value, which sits just above or below the written decimal.
    EXPECT_DOUBLE_EQ(FrameOps::roundHalfEven(0.12345, 4), 0.1235);
    EXPECT_DOUBLE_EQ(FrameOps::roundHalfEven(2.675, 2), 2.67);
    EXPECT_DOUBLE_EQ(FrameOps::roundHalfEven(0.125, 2), 0.12);
    EXPECT_DOUBLE_EQ(FrameOps::roundHalfEven(1250.0, -2), 1200.0);
}

TEST(FrameOpsTest, CumulativeSumAndDistinctRows) {
    const Column cs = FrameOps::cumulativeSum(Column::fromInts("c", {1, 2, 3}));
    EXPECT_EQ(cs.type, ColumnType::INTEGER);
    EXPECT_EQ(std::get<int64_t>(cs.at(2)), 6);

    const DataFrame df = TabulaTest::scoresFrame();
    EXPECT_EQ(FrameOps::distinctRows(df, {"course_name"}, true), (std::vector<size_t>{0, 2, 4}));
    EXPECT_EQ(FrameOps::distinctRows(df, {"course_name"}, false), (std::vector<size_t>{1, 3, 4}));
}

TEST(ColumnTest, StringsConvertToIntegers) {
    Column codes = Column::fromStrings("code", {" 12", "-7 ", "40"});
    codes.convertTo(ColumnType::INTEGER);
    EXPECT_EQ(std::get<int64_t>(codes.at(0)), 12);
    EXPECT_EQ(std::get<int64_t>(codes.at(1)), -7);

    Column bad = Column::fromStrings("code", {"12", "12.5"});
    try {
        bad.convertTo(ColumnType::INTEGER);
        FAIL() << "expected ValueError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.category(), "ValueError");
        EXPECT_EQ(e.message(), "invalid literal for int() with base 10: '12.5'");
    }
}
