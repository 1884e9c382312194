#include <gtest/gtest.h>

#include "FrameFormat.h"
#include "ResultClassifier.h"
#include "TestHelpers.h"

#include <cmath>
#include <sstream>

using namespace Tabula;

namespace {
std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}
} // namespace

TEST(ResultClassifierTest, SmallFrameIsAFullTable) {
    const ClassifiedResult r = ResultClassifier::classify(makeFrame(TabulaTest::scoresFrame()));
    EXPECT_EQ(r.typeTag, "table");
    const auto rows = lines(r.displayText);
    ASSERT_EQ(rows.size(), 6u);
    EXPECT_EQ(rows[0], "   student  course_name  score  level");
    EXPECT_EQ(rows[1], "0      Ana         Math   80.0      1");
    EXPECT_EQ(rows[5], "4      Eve          Bio   85.5      2");
}

TEST(ResultClassifierTest, LongFrameShowsHeadAndTail) {
    const ClassifiedResult r = ResultClassifier::classify(makeFrame(TabulaTest::sequenceFrame(57)));
    EXPECT_EQ(r.typeTag, "table");
    const auto rows = lines(r.displayText);
    ASSERT_EQ(rows.size(), 22u);
    EXPECT_EQ(rows[0], "Showing first 10 and last 10 of 57 rows:");
    EXPECT_EQ(rows[2].substr(0, 2), "0 ");
    EXPECT_EQ(rows[11].substr(0, 2), "9 ");
    EXPECT_EQ(rows[12].substr(0, 3), "47 ");
    EXPECT_EQ(rows[21].substr(0, 3), "56 ");
    EXPECT_NE(rows[21].find("84.0"), std::string::npos);
}

TEST(ResultClassifierTest, TwentyRowsAreNotTruncated) {
    const ClassifiedResult r = ResultClassifier::classify(makeFrame(TabulaTest::sequenceFrame(20)));
    EXPECT_EQ(r.displayText.find("Showing"), std::string::npos);
    EXPECT_EQ(lines(r.displayText).size(), 21u);
}

TEST(ResultClassifierTest, SeriesUsesItemsWording) {
    const Value grouped = TabulaTest::runScript("df.groupby('course_name')['score'].mean()");
    const ClassifiedResult r = ResultClassifier::classify(grouped);
    EXPECT_EQ(r.typeTag, "series");
    const auto rows = lines(r.displayText);
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0].substr(0, 11), "course_name");
    EXPECT_EQ(rows[1], "Art            65.0");

    const Value longSeries = TabulaTest::runScript("df['value']", TabulaTest::sequenceFrame(30));
    const ClassifiedResult truncated = ResultClassifier::classify(longSeries);
    EXPECT_EQ(lines(truncated.displayText).front(), "Showing first 10 and last 10 of 30 items:");
    EXPECT_EQ(lines(truncated.displayText).size(), 21u);
}

TEST(ResultClassifierTest, ScalarsAreRoundedForDisplay) {
    EXPECT_EQ(ResultClassifier::classify(Value(2.0)).displayText, "2.0");
    EXPECT_EQ(ResultClassifier::classify(Value(3.14159265)).displayText, "3.1416");
    EXPECT_EQ(ResultClassifier::classify(Value(0.00001)).displayText, "0.0");
    EXPECT_EQ(ResultClassifier::classify(Value(0.12345)).displayText, "0.1235");
    EXPECT_EQ(ResultClassifier::classify(Value(1.00005)).displayText, "1.0001");
    EXPECT_EQ(ResultClassifier::classify(Value(std::nan(""))).displayText, "nan");

    const ClassifiedResult i = ResultClassifier::classify(Value(int64_t{42}));
    EXPECT_EQ(i.displayText, "42");
    EXPECT_EQ(i.typeTag, "scalar");
}

TEST(ResultClassifierTest, ListsAndTuplesUseLiteralSyntax) {
    const ClassifiedResult list = ResultClassifier::classify(TabulaTest::runScript("[1, 'a', 2.5, None]"));
    EXPECT_EQ(list.typeTag, "list");
    EXPECT_EQ(list.displayText, "[1, 'a', 2.5, None]");

    const ClassifiedResult shape = ResultClassifier::classify(TabulaTest::runScript("df.shape"));
    EXPECT_EQ(shape.typeTag, "list");
    EXPECT_EQ(shape.displayText, "(5, 4)");
}

TEST(ResultClassifierTest, FiguresAndOtherValues) {
    const ClassifiedResult fig =
        ResultClassifier::classify(TabulaTest::runScript("px.histogram(df, x='score', title='Spread')"));
    EXPECT_EQ(fig.typeTag, "figure");
    EXPECT_EQ(fig.displayText, "Figure: Spread (1 data series)");

    const ClassifiedResult none = ResultClassifier::classify(Value());
    EXPECT_EQ(none.displayText, "");
    EXPECT_EQ(none.typeTag, "other");

    const ClassifiedResult flag = ResultClassifier::classify(Value(true));
    EXPECT_EQ(flag.displayText, "True");
    EXPECT_EQ(flag.typeTag, "scalar");
    const ClassifiedResult compared = ResultClassifier::classify(TabulaTest::runScript("df['score'].max() < 50"));
    EXPECT_EQ(compared.displayText, "False");
    EXPECT_EQ(compared.typeTag, "scalar");

    EXPECT_EQ(ResultClassifier::classify(Value(std::string("done"))).displayText, "done");
}

TEST(ResultClassifierTest, HasDataTags) {
    EXPECT_TRUE(ResultClassifier::hasData("table"));
    EXPECT_TRUE(ResultClassifier::hasData("series"));
    EXPECT_TRUE(ResultClassifier::hasData("list"));
    EXPECT_FALSE(ResultClassifier::hasData("scalar"));
    EXPECT_FALSE(ResultClassifier::hasData("figure"));
    EXPECT_FALSE(ResultClassifier::hasData("other"));
}

TEST(FrameFormatTest, FloatReprMatchesPython) {
    EXPECT_EQ(FrameFormat::floatRepr(2.0), "2.0");
    EXPECT_EQ(FrameFormat::floatRepr(0.1), "0.1");
    EXPECT_EQ(FrameFormat::floatRepr(1e16), "1e+16");
    EXPECT_EQ(FrameFormat::floatRepr(1.5e-05), "1.5e-05");
    EXPECT_EQ(FrameFormat::floatRepr(123456.789), "123456.789");
    EXPECT_EQ(FrameFormat::floatRepr(-0.0), "-0.0");
}

TEST(FrameFormatTest, TimestampsAndQuoting) {
    EXPECT_EQ(FrameFormat::timestampText(Timestamp{0}, true), "1970-01-01");
    EXPECT_EQ(FrameFormat::timestampText(Timestamp{-1}, false), "1969-12-31 23:59:59");
    EXPECT_EQ(FrameFormat::quoteString("it's"), "\"it's\"");
    EXPECT_EQ(FrameFormat::quoteString("plain"), "'plain'");
}

TEST(FrameFormatTest, EmptyFrameAndSeries) {
    DataFrame df;
    df.columns.push_back(Column::fromInts("a", {}));
    df.index = Index::range(0);
    EXPECT_EQ(FrameFormat::frameToString(df), "Empty DataFrame\nColumns: [a]\nIndex: []");
    EXPECT_EQ(FrameFormat::seriesToString(Series(Column::fromDoubles("x", {}), Index::range(0))),
              "Series([], dtype: float64)");
}
