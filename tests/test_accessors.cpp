#include <gtest/gtest.h>

#include "TabulaExceptions.h"
#include "TestHelpers.h"

#include <cmath>

using namespace Tabula;
using TabulaTest::runScript;

namespace {
DataFrame eventsFrame() {
    DataFrame df;
    df.columns.push_back(Column::fromStrings("title", {"  Alpha launch", "beta review ", "Gamma"}));
    df.columns.push_back(Column::fromScalars("when", {Scalar(*parseTimestamp("2024-03-15 08:30:00")),
                                                      Scalar(*parseTimestamp("2023-12-31")),
                                                      Scalar(std::monostate{})}));
    df.index = Index::range(3);
    return df;
}

std::vector<Value> listItems(const Value& v) {
    return v.as<std::shared_ptr<ListValue>>()->items;
}

std::string categoryOf(const std::string& code, DataFrame df) {
    try {
        runScript(code, std::move(df));
    } catch (const ScriptError& e) {
        return e.category();
    }
    return "";
}
} // namespace

TEST(StringAccessorTest, CaseAndWhitespace) {
    const auto items = listItems(runScript("df['title'].str.strip().str.upper().tolist()", eventsFrame()));
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].as<std::string>(), "ALPHA LAUNCH");
    EXPECT_EQ(items[1].as<std::string>(), "BETA REVIEW");

    const auto titled = listItems(runScript("df['title'].str.strip().str.title().tolist()", eventsFrame()));
    EXPECT_EQ(titled[1].as<std::string>(), "Beta Review");
}

TEST(StringAccessorTest, PredicatesFilterRows) {
    const Value v = runScript("df[df['course_name'].str.contains('a', case=False)]['student'].tolist()");
    const auto items = listItems(v);
    ASSERT_EQ(items.size(), 4u);
    EXPECT_EQ(items[2].as<std::string>(), "Cy");

    const Value starts = runScript("df['student'].str.startswith('D').sum()");
    EXPECT_EQ(starts.as<int64_t>(), 1);
}

TEST(StringAccessorTest, LengthSliceAndReplace) {
    EXPECT_EQ(runScript("df['student'].str.len().max()").as<int64_t>(), 3);
    EXPECT_EQ(runScript("df['course_name'].str[:2].iloc[0]").as<std::string>(), "Ma");
    EXPECT_EQ(runScript("df['course_name'].str.replace('Math', 'Maths').iloc[1]").as<std::string>(), "Maths");
    EXPECT_EQ(runScript("df['course_name'].str[-1].iloc[4]").as<std::string>(), "o");
}

TEST(StringAccessorTest, RequiresTextColumn) {
    EXPECT_EQ(categoryOf("df['score'].str.upper()", TabulaTest::scoresFrame()), "AttributeError");
    EXPECT_EQ(categoryOf("df['student'].str.contains('[')", TabulaTest::scoresFrame()), "ValueError");
}

TEST(DatetimeAccessorTest, FieldsAndFormatting) {
    // The missing third timestamp widens the year column to float, as in pandas.
    const auto years = listItems(runScript("df['when'].dt.year.tolist()", eventsFrame()));
    ASSERT_EQ(years.size(), 3u);
    EXPECT_DOUBLE_EQ(toDouble(years[0], "year"), 2024.0);
    EXPECT_DOUBLE_EQ(toDouble(years[1], "year"), 2023.0);
    EXPECT_TRUE(std::isnan(toDouble(years[2], "year")));

    EXPECT_DOUBLE_EQ(toDouble(runScript("df['when'].dt.month.iloc[1]", eventsFrame()), "month"), 12.0);
    EXPECT_EQ(runScript("df['when'].dt.day_name().iloc[0]", eventsFrame()).as<std::string>(), "Friday");
    EXPECT_EQ(runScript("df['when'].dt.strftime('%Y/%m').iloc[0]", eventsFrame()).as<std::string>(), "2024/03");
    EXPECT_DOUBLE_EQ(toDouble(runScript("df['when'].dt.quarter.iloc[0]", eventsFrame()), "quarter"), 1.0);
}

TEST(DatetimeAccessorTest, RequiresDatetimeColumn) {
    EXPECT_EQ(categoryOf("df['title'].dt.year", eventsFrame()), "AttributeError");
}

TEST(LocatorTest, IlocPositions) {
    EXPECT_EQ(runScript("df.iloc[0, 0]").as<std::string>(), "Ana");
    EXPECT_EQ(runScript("df.iloc[-1]['student']").as<std::string>(), "Eve");
    const Value slice = runScript("df.iloc[1:3]");
    ASSERT_TRUE(slice.isFrame());
    EXPECT_EQ(slice.frame().rows(), 2u);
    EXPECT_EQ(categoryOf("df.iloc[10]", TabulaTest::scoresFrame()), "IndexError");
}

TEST(LocatorTest, LocByLabelMaskAndColumns) {
    EXPECT_DOUBLE_EQ(runScript("df.set_index('student').loc['Cy', 'score']").as<double>(), 70.0);

    const Value masked = runScript("df.loc[df['score'] > 80, ['student', 'level']]");
    ASSERT_TRUE(masked.isFrame());
    EXPECT_EQ(masked.frame().rows(), 2u);
    EXPECT_EQ(masked.frame().cols(), 2u);

    const Value inclusive = runScript("df.loc[1:3, 'student']");
    ASSERT_TRUE(inclusive.isSeries());
    EXPECT_EQ(inclusive.series().size(), 3u);

    EXPECT_EQ(categoryOf("df.loc[99, 'student']", TabulaTest::scoresFrame()), "KeyError");
}

TEST(LocatorTest, LocAssignmentUpdatesAndCreatesColumns) {
    const Value v = runScript(
        "df.loc[df['level'] == 1, 'tier'] = 'intro'\n"
        "df.loc[0, 'score'] = 99.0\n"
        "df");
    ASSERT_TRUE(v.isFrame());
    const DataFrame& df = v.frame();
    const Column& tier = df.column("tier");
    EXPECT_EQ(std::get<std::string>(tier.at(0)), "intro");
    EXPECT_TRUE(tier.isMissing(1));
    EXPECT_DOUBLE_EQ(df.column("score").numberAt(0), 99.0);
}
