#include <gtest/gtest.h>

#include "ResultCodec.h"
#include "TabulaExceptions.h"
#include "TestHelpers.h"

#include <cmath>
#include <limits>

using namespace Tabula;

namespace {
Value roundTrip(const Value& v) {
    return ResultCodec::decodeValue(ResultCodec::encodeValue(v));
}
} // namespace

TEST(ResultCodecTest, IntegersAndFloatsStayDistinct) {
    EXPECT_EQ(ResultCodec::encodeValue(Value(int64_t{2})), "2");
    EXPECT_EQ(ResultCodec::encodeValue(Value(2.0)), "2.0");
    EXPECT_TRUE(roundTrip(Value(int64_t{2})).is<int64_t>());
    EXPECT_TRUE(roundTrip(Value(2.0)).is<double>());
    EXPECT_DOUBLE_EQ(roundTrip(Value(0.1)).as<double>(), 0.1);
}

TEST(ResultCodecTest, NonFiniteNumbersUseExtendedTokens) {
    EXPECT_EQ(ResultCodec::encodeValue(Value(std::numeric_limits<double>::infinity())), "Infinity");
    EXPECT_TRUE(std::isnan(roundTrip(Value(std::nan(""))).as<double>()));
    EXPECT_EQ(roundTrip(Value(-std::numeric_limits<double>::infinity())).as<double>(),
              -std::numeric_limits<double>::infinity());
}

TEST(ResultCodecTest, StringsWithControlCharactersSurvive) {
    const std::string text = "line1\nline2\t\"quoted\" \\ caf\xc3\xa9";
    EXPECT_EQ(roundTrip(Value(text)).as<std::string>(), text);
}

TEST(ResultCodecTest, FramePreservesTypesMissingCellsAndIndex) {
    DataFrame df = TabulaTest::scoresFrame();
    df.column("score").missing[1] = 1;
    std::get<std::vector<double>>(df.column("score").values)[1] = std::nan("");
    df.column("student").missing[2] = 1;
    df.columns.push_back(Column::fromScalars("joined", {Scalar(Timestamp{0}), Scalar(Timestamp{86400}),
                                                        Scalar(Timestamp{172800}), Scalar(std::monostate{}),
                                                        Scalar(Timestamp{-86400})}));

    const Value back = roundTrip(makeFrame(df));
    ASSERT_TRUE(back.isFrame());
    const DataFrame& out = back.frame();
    ASSERT_EQ(out.cols(), 5u);
    ASSERT_EQ(out.rows(), 5u);
    EXPECT_TRUE(out.index.isRange());
    EXPECT_EQ(out.column("score").type, ColumnType::NUMERIC);
    EXPECT_TRUE(out.column("score").isMissing(1));
    EXPECT_EQ(out.column("level").type, ColumnType::INTEGER);
    EXPECT_EQ(std::get<int64_t>(out.column("level").at(3)), 3);
    EXPECT_TRUE(out.column("student").isMissing(2));
    EXPECT_EQ(std::get<std::string>(out.column("student").at(4)), "Eve");
    EXPECT_EQ(out.column("joined").type, ColumnType::DATETIME);
    EXPECT_TRUE(out.column("joined").isMissing(3));
    EXPECT_EQ(std::get<Timestamp>(out.column("joined").at(4)).seconds, -86400);
}

TEST(ResultCodecTest, GroupedSeriesKeepsMultiLevelIndex) {
    const Value grouped = TabulaTest::runScript("df.groupby(['course_name', 'level'])['score'].sum()");
    const Value back = roundTrip(grouped);
    ASSERT_TRUE(back.isSeries());
    const Series& s = back.series();
    EXPECT_EQ(s.name(), "score");
    ASSERT_EQ(s.index.levels.size(), 2u);
    EXPECT_EQ(s.index.names().at(0), "course_name");
    EXPECT_EQ(s.index.names().at(1), "level");
    EXPECT_EQ(s.size(), grouped.series().size());
    EXPECT_EQ(std::get<std::string>(s.index.labelAt(0, 0)), "Art");
    EXPECT_EQ(std::get<int64_t>(s.index.labelAt(0, 1)), 1);
}

TEST(ResultCodecTest, ContainersAndFigures) {
    const Value list = roundTrip(TabulaTest::runScript("[1, 2.5, 'a', None, (True, 'x')]"));
    const auto& items = list.as<std::shared_ptr<ListValue>>()->items;
    ASSERT_EQ(items.size(), 5u);
    EXPECT_TRUE(items[3].isNone());
    EXPECT_TRUE(items[4].is<std::shared_ptr<TupleValue>>());

    const Value dict = roundTrip(TabulaTest::runScript("{'b': 1, 'a': [2]}"));
    const auto& entries = dict.as<std::shared_ptr<DictValue>>()->items;
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first.as<std::string>(), "b");

    const Value fig = roundTrip(TabulaTest::runScript("px.pie(df, names='student', values='score', title='Share')"));
    const Figure& figure = *fig.as<std::shared_ptr<Figure>>();
    EXPECT_EQ(figure.title, "Share");
    ASSERT_EQ(figure.data.size(), 1u);
    EXPECT_EQ(figure.data[0].labels.size(), 5u);
}

TEST(ResultCodecTest, UnshippableValuesTravelAsRepr) {
    const Value v = roundTrip(TabulaTest::runScript("len"));
    ASSERT_TRUE(v.is<std::string>());
    EXPECT_NE(v.as<std::string>().find("len"), std::string::npos);
}

TEST(ResultCodecTest, ReplyEnvelope) {
    const WorkerReply ok = ResultCodec::decodeReply(ResultCodec::encodeSuccess(Value(int64_t{7}), "filter skipped"));
    EXPECT_TRUE(ok.ok);
    EXPECT_EQ(ok.value.as<int64_t>(), 7);
    EXPECT_EQ(ok.note, "filter skipped");

    const WorkerReply failed = ResultCodec::decodeReply(ResultCodec::encodeFailure("KeyError", "'x'"));
    EXPECT_FALSE(failed.ok);
    EXPECT_EQ(failed.category, "KeyError");
    EXPECT_EQ(failed.message, "'x'");
}

TEST(ResultCodecTest, MalformedPayloadsAreExecutionErrors) {
    for (const char* text : {"", "{", "{\"ok\":true}", "{\"ok\":1,\"value\":2}", "[1,2]x",
                             "{\"ok\":true,\"value\":{\"$t\":\"alien\"}}",
                             "{\"ok\":true,\"value\":{\"$t\":\"series\",\"index\":{\"length\":3,\"levels\":[]},"
                             "\"values\":{\"name\":\"a\",\"type\":\"int64\",\"values\":[1]}}}"}) {
        try {
            ResultCodec::decodeReply(text);
            ADD_FAILURE() << "accepted: " << text;
        } catch (const CodeExecutionError& e) {
            EXPECT_EQ(e.code(), ErrorCode::EXECUTION_FAILED);
        }
    }
}

TEST(ResultCodecTest, RejectsRunawayNesting) {
    const std::string deep = std::string(300, '[') + std::string(300, ']');
    EXPECT_THROW(ResultCodec::decodeValue(deep), CodeExecutionError);
}
