#include <gtest/gtest.h>

#include "TabulaExceptions.h"
#include "TestHelpers.h"

using namespace Tabula;
using TabulaTest::runScript;

namespace {
const Figure& figureOf(const Value& v) {
    return *v.as<std::shared_ptr<Figure>>();
}
} // namespace

TEST(PlotFacadeTest, ExpressBarFromGroupedFrame) {
    const Value v = runScript(
        "avg = df.groupby('course_name')['score'].mean().reset_index()\n"
        "fig = px.bar(avg, x='course_name', y='score', title='Average score by course')");
    ASSERT_TRUE(v.is<std::shared_ptr<Figure>>());
    const Figure& fig = figureOf(v);
    EXPECT_EQ(fig.title, "Average score by course");
    ASSERT_EQ(fig.data.size(), 1u);
    EXPECT_EQ(fig.data[0].type, "bar");
    ASSERT_EQ(fig.data[0].x.size(), 3u);
    EXPECT_EQ(std::get<std::string>(fig.data[0].x[0]), "Art");
    EXPECT_DOUBLE_EQ(std::get<double>(fig.data[0].y[0]), 65.0);
    EXPECT_EQ(fig.describe(), "Figure: Average score by course (1 data series)");
}

TEST(PlotFacadeTest, ColorSplitsTracesInFirstAppearanceOrder) {
    const Value scattered = runScript("px.scatter(df, x='level', y='score', color='course_name')");
    const Figure& fig = figureOf(scattered);
    ASSERT_EQ(fig.data.size(), 3u);
    EXPECT_EQ(fig.data[0].name, "Math");
    EXPECT_EQ(fig.data[1].name, "Art");
    EXPECT_EQ(fig.data[2].name, "Bio");
    EXPECT_EQ(fig.data[0].mode, "markers");
    EXPECT_EQ(fig.data[0].pointCount(), 2u);
}

TEST(PlotFacadeTest, LineAndPieFromSeries) {
    const Value lineValue = runScript("px.line(df['score'], markers=True)");
    const Figure& line = figureOf(lineValue);
    ASSERT_EQ(line.data.size(), 1u);
    EXPECT_EQ(line.data[0].mode, "lines+markers");
    EXPECT_EQ(line.data[0].x.size(), 5u);

    const Value pieValue = runScript("px.pie(df['course_name'].value_counts())");
    const Figure& pie = figureOf(pieValue);
    ASSERT_EQ(pie.data.size(), 1u);
    EXPECT_EQ(pie.data[0].type, "pie");
    EXPECT_EQ(std::get<std::string>(pie.data[0].labels[0]), "Math");
    EXPECT_EQ(std::get<int64_t>(pie.data[0].values[0]), 2);
}

TEST(PlotFacadeTest, GraphObjectsFigureWithTracesAndLayout) {
    const Value v = runScript(
        "fig = go.Figure(data=[go.Bar(x=df['student'], y=df['score'], name='Score')])\n"
        "fig.add_trace(go.Scatter(x=[1, 2], y=[3, 4], mode='lines'))\n"
        "fig.update_layout(title='Scores', xaxis_title='Student')\n"
        "fig");
    const Figure& fig = figureOf(v);
    EXPECT_EQ(fig.title, "Scores");
    ASSERT_EQ(fig.data.size(), 2u);
    EXPECT_EQ(fig.data[0].type, "bar");
    EXPECT_EQ(fig.data[0].name, "Score");
    EXPECT_EQ(fig.data[1].type, "scatter");
    EXPECT_EQ(fig.layout.at("xaxis_title"), "Student");
    EXPECT_EQ(fig.describe(), "Figure: Scores (2 data series)");
}

TEST(PlotFacadeTest, UntitledFigureDescription) {
    Figure fig;
    EXPECT_EQ(fig.describe(), "Figure: Untitled (0 data series)");
}

TEST(PlotFacadeTest, UnknownColumnIsValueError) {
    try {
        runScript("px.bar(df, x='nope', y='score')");
        FAIL() << "expected ValueError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.category(), "ValueError");
        EXPECT_NE(e.message().find("'student'"), std::string::npos);
    }
}

TEST(PlotFacadeTest, UnknownChartKindIsAttributeError) {
    try {
        runScript("px.sunburst(df)");
        FAIL() << "expected AttributeError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.category(), "AttributeError");
    }
}
