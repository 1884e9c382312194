#include <gtest/gtest.h>

#include "TabulaExceptions.h"
#include "TestHelpers.h"

#include <cmath>

using namespace Tabula;
using TabulaTest::runScript;

namespace {
std::string categoryOf(const std::string& code) {
    try {
        runScript(code);
    } catch (const ScriptError& e) {
        return e.category();
    }
    return "";
}
} // namespace

TEST(ScriptInterpreterTest, GroupbyMeanYieldsLabelledSeries) {
    const Value v = runScript("grouped = data.groupby('course_name')['score'].mean(); grouped");
    ASSERT_TRUE(v.isSeries());
    const Series& s = v.series();
    ASSERT_EQ(s.size(), 3u);
    EXPECT_EQ(s.name(), "score");
    EXPECT_EQ(s.index.names().at(0), "course_name");
    EXPECT_EQ(std::get<std::string>(s.index.labelAt(0)), "Art");
    EXPECT_DOUBLE_EQ(s.values.numberAt(0), 65.0);
    EXPECT_DOUBLE_EQ(s.values.numberAt(2), 85.0);
}

TEST(ScriptInterpreterTest, FinalPrintIsUnwrapped) {
    const Value v = runScript("total = df['level'].sum()\nprint(total)");
    ASSERT_TRUE(v.is<int64_t>());
    EXPECT_EQ(v.as<int64_t>(), 9);

    const Value joined = runScript("print('n =', len(df))");
    EXPECT_EQ(joined.as<std::string>(), "n = 5");
}

TEST(ScriptInterpreterTest, FallsBackToConventionalResultName) {
    const Value v = runScript("result = df['score'].max()\nx = 1");
    ASSERT_TRUE(v.is<double>());
    EXPECT_DOUBLE_EQ(v.as<double>(), 90.0);

    EXPECT_TRUE(runScript("x = 1\ny = 2").isNone());
}

TEST(ScriptInterpreterTest, BooleanFilteringAndColumnAssignment) {
    const Value v = runScript(
        "df['passed'] = df['score'] >= 75\n"
        "top = df[(df['passed']) & (df['level'] < 3)]\n"
        "top['student'].tolist()");
    ASSERT_TRUE(v.is<std::shared_ptr<ListValue>>());
    const auto& items = v.as<std::shared_ptr<ListValue>>()->items;
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].as<std::string>(), "Ana");
    EXPECT_EQ(items[1].as<std::string>(), "Ben");
    EXPECT_EQ(items[2].as<std::string>(), "Eve");
}

TEST(ScriptInterpreterTest, SortHeadAndShape) {
    const Value v = runScript("best = df.sort_values('score', ascending=False).head(2)\nbest['student'].iloc[1]");
    EXPECT_EQ(v.as<std::string>(), "Eve");

    const Value shape = runScript("df.shape");
    ASSERT_TRUE(shape.is<std::shared_ptr<TupleValue>>());
    EXPECT_EQ(shape.as<std::shared_ptr<TupleValue>>()->items.at(0).as<int64_t>(), 5);
}

TEST(ScriptInterpreterTest, ControlFlowAndContainers) {
    EXPECT_EQ(runScript("n = 0\nwhile n < 5:\n    n += 2\nn").as<int64_t>(), 6);
    EXPECT_EQ(runScript("a, b = 1, 2\na * 10 + b").as<int64_t>(), 12);
    EXPECT_EQ(runScript("d = {'a': 1}\nd['b'] = 2\nlen(d)").as<int64_t>(), 2);
    EXPECT_EQ(runScript("total = 0\nfor i in range(10):\n    if i % 2:\n        continue\n    if i > 6:\n"
                        "        break\n    total += i\ntotal")
                  .as<int64_t>(),
              12);
    EXPECT_EQ(runScript("sum([x * x for x in range(4) if x != 2])").as<int64_t>(), 10);
    EXPECT_EQ(runScript("'big' if df['score'].mean() > 70 else 'small'").as<std::string>(), "big");
}

TEST(ScriptInterpreterTest, ComprehensionVariablesDoNotLeak) {
    EXPECT_EQ(runScript("x = 5\nys = [x for x in range(3)]\nx").as<int64_t>(), 5);
    EXPECT_EQ(categoryOf("ys = [k for k in range(3)]\nk"), "NameError");
}

TEST(ScriptInterpreterTest, FormatsFStrings) {
    EXPECT_EQ(runScript("avg = df['score'].mean()\nf'Average: {avg:.2f}'").as<std::string>(), "Average: 77.10");
    EXPECT_EQ(runScript("f'{len(df)} rows'").as<std::string>(), "5 rows");
}

TEST(ScriptInterpreterTest, NumpyReductionsMatchSeriesMethods) {
    EXPECT_TRUE(runScript("np.mean(df['score']) == df['score'].mean()").as<bool>());
    EXPECT_TRUE(runScript("np.nanmax(df['level']) == 3").as<bool>());
    EXPECT_TRUE(runScript("np.sum(df['level']) == df['level'].sum()").as<bool>());
}

TEST(ScriptInterpreterTest, PythonRoundingRules) {
    EXPECT_EQ(runScript("round(2.5)").as<int64_t>(), 2);
    EXPECT_DOUBLE_EQ(runScript("round(3.14159, 2)").as<double>(), 3.14);
    EXPECT_DOUBLE_EQ(runScript("round(0.12345, 4)").as<double>(), 0.1235);
    EXPECT_DOUBLE_EQ(runScript("7 / 2").as<double>(), 3.5);
    EXPECT_EQ(runScript("-7 // 2").as<int64_t>(), -4);
}

TEST(ScriptInterpreterTest, SeriesMembershipChecksLabels) {
    EXPECT_FALSE(runScript("'Math' in df['course_name']").as<bool>());
    EXPECT_TRUE(runScript("2 in df['course_name']").as<bool>());
    EXPECT_TRUE(runScript("'Math' in df['course_name'].values").as<bool>());
}

TEST(ScriptInterpreterTest, RuntimeFailuresCarryPythonCategories) {
    EXPECT_EQ(categoryOf("df['nonexistent']"), "KeyError");
    EXPECT_EQ(categoryOf("undefined_name + 1"), "NameError");
    EXPECT_EQ(categoryOf("1 / 0"), "ZeroDivisionError");
    EXPECT_EQ(categoryOf("'a' + 1"), "TypeError");
    EXPECT_EQ(categoryOf("[1, 2][5]"), "IndexError");
    EXPECT_EQ(categoryOf("df.no_such_method()"), "AttributeError");
    EXPECT_EQ(categoryOf("df.foo = 1"), "AttributeError");
    EXPECT_EQ(categoryOf("if df['score'] > 50:\n    pass"), "ValueError");
    EXPECT_EQ(categoryOf("int('abc')"), "ValueError");
}

TEST(ScriptInterpreterTest, KeyErrorNamesTheColumn) {
    try {
        runScript("df['nonexistent']");
        FAIL() << "expected KeyError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(std::string(e.what()), "KeyError: 'nonexistent'");
    }
}

TEST(ScriptInterpreterTest, DatasetAliasesShareOneFrame) {
    const Value v = runScript("data['bonus'] = 1\n'bonus' in df.columns");
    EXPECT_TRUE(v.as<bool>());
}

TEST(ScriptInterpreterTest, NoEscapeHatchesAreBound) {
    for (const char* name : {"open", "eval", "exec", "__import__", "getattr", "globals", "compile"}) {
        EXPECT_EQ(categoryOf(std::string(name) + "('x')"), "NameError") << name;
    }
}
