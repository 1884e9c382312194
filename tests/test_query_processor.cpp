#include <gtest/gtest.h>

#include "QueryProcessor.h"
#include "TestHelpers.h"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace Tabula;

namespace {
const char* kScoresCsv =
    "student,course_name,score,level\n"
    "Ana,Math,80,1\n"
    "Ben,Math,90,2\n"
    "Cy,Art,70,1\n"
    "Dee,Art,60,3\n"
    "Eve,Bio,85.5,2\n";

class ScriptedGenerator : public CodeGenerator {
public:
    explicit ScriptedGenerator(std::string code) : code_(std::move(code)) {}

    GenerationResult generate(const std::string& question, const std::string& schema) override {
        ++calls;
        lastQuestion = question;
        lastSchema = schema;
        GenerationResult out;
        out.success = succeed;
        out.code = code_;
        out.generationTimeMs = 12.5;
        if (!succeed) out.error = "model returned no code";
        return out;
    }

    bool checkConnection() override { return connected; }

    int calls = 0;
    bool succeed = true;
    bool connected = true;
    std::string lastQuestion;
    std::string lastSchema;

private:
    std::string code_;
};

class ThrowingGenerator : public CodeGenerator {
public:
    GenerationResult generate(const std::string&, const std::string&) override {
        throw CodeGenerationError("connection refused", ErrorCode::LLM_CONNECTION_ERROR);
    }
};

class EchoResponder : public ResponseGenerator {
public:
    std::string generateResponse(const std::string& question,
                                 const std::string& displayText,
                                 const std::string&) override {
        return "Q: " + question + " A: " + displayText;
    }
};

class BrokenResponder : public ResponseGenerator {
public:
    std::string generateResponse(const std::string&, const std::string&, const std::string&) override {
        throw std::runtime_error("summarizer offline");
    }
};

SecurityPolicy testPolicy() {
    SecurityPolicy policy = SecurityPolicy::defaults();
    policy.executionTimeoutSeconds = 2.0;
    policy.maxMemoryMb = 128;
    return policy;
}
} // namespace

class QueryProcessorTest : public ::testing::Test {
protected:
    QueryProcessorTest() : csv_(".csv", kScoresCsv), policy_(testPolicy()), data_(csv_.path()) {}

    TabulaTest::TempFile csv_;
    SecurityPolicy policy_;
    DataManager data_;
};

TEST_F(QueryProcessorTest, AnswersAQuestionEndToEnd) {
    ScriptedGenerator generator("avg = df.groupby('course_name')['score'].mean()\navg");
    EchoResponder responder;
    const QueryProcessor processor(policy_, data_, &generator, &responder);

    const QueryResult r = processor.processQuestion("  Average score per course?  ");
    ASSERT_TRUE(r.success) << r.error.value_or("");
    EXPECT_EQ(r.question, "Average score per course?");
    EXPECT_EQ(generator.lastQuestion, "Average score per course?");
    EXPECT_NE(generator.lastSchema.find("Shape: 5 rows"), std::string::npos);
    EXPECT_EQ(r.dataType, "series");
    EXPECT_TRUE(r.hasData());
    EXPECT_FALSE(r.hasVisualization());
    EXPECT_EQ(r.answer.rfind("Q: Average score per course? A: course_name", 0), 0u);
    EXPECT_DOUBLE_EQ(r.generationTimeMs, 12.5);
    EXPECT_GE(r.totalTimeMs, r.executionTimeMs);
    EXPECT_FALSE(r.errorCode.has_value());
}

TEST_F(QueryProcessorTest, FigureResultIsAVisualization) {
    const QueryProcessor processor(policy_, data_);
    const QueryResult r = processor.runCandidate("fig = px.bar(df, x='student', y='score', title='Scores')", 0.0, "chart");
    ASSERT_TRUE(r.success) << r.error.value_or("");
    EXPECT_EQ(r.dataType, "figure");
    EXPECT_TRUE(r.hasVisualization());
    EXPECT_EQ(r.answer, "Figure: Scores (1 data series)");
}

TEST_F(QueryProcessorTest, ScalarResultsCarryNoTableData) {
    const QueryProcessor processor(policy_, data_);
    const QueryResult r = processor.runCandidate("df['score'].mean()", 0.0, "mean");
    ASSERT_TRUE(r.success) << r.error.value_or("");
    EXPECT_EQ(r.dataType, "scalar");
    EXPECT_EQ(r.displayText, "77.1");
}

TEST_F(QueryProcessorTest, InputChecks) {
    EXPECT_EQ(QueryProcessor::checkInput("  hi  ", 10), "hi");
    try {
        QueryProcessor::checkInput(std::string(11, 'a'), 10);
        FAIL() << "expected INPUT_TOO_LONG";
    } catch (const InputValidationError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INPUT_TOO_LONG);
        EXPECT_EQ(e.userMessage(), "Input too long. Maximum 10 characters allowed.");
    }

    ScriptedGenerator generator("1");
    const QueryProcessor processor(policy_, data_, &generator);
    for (const char* question : {"please import os", "show __class__", "run eval(x)", "what is os.environ"}) {
        const QueryResult r = processor.processQuestion(question);
        EXPECT_FALSE(r.success);
        EXPECT_EQ(r.errorCode, ErrorCode::INJECTION_ATTEMPT) << question;
    }
    EXPECT_EQ(processor.processQuestion(std::string(1001, 'q')).errorCode, ErrorCode::INPUT_TOO_LONG);
    EXPECT_EQ(generator.calls, 0);
}

TEST_F(QueryProcessorTest, OverlongCandidateNeverRuns) {
    const QueryProcessor processor(policy_, data_);
    const QueryResult r = processor.runCandidate("x = 1\n" + std::string(1200, ' ') + "x", 3.0, "long");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, ErrorCode::INPUT_TOO_LONG);
    EXPECT_DOUBLE_EQ(r.generationTimeMs, 3.0);
    EXPECT_DOUBLE_EQ(r.executionTimeMs, 0.0);
}

TEST_F(QueryProcessorTest, ValidationFailuresReportViolations) {
    const QueryProcessor processor(policy_, data_);
    const QueryResult r = processor.runCandidate("import os\nimport subprocess\nresult = 1", 0.0, "q");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, ErrorCode::SECURITY_VIOLATION);
    EXPECT_EQ(r.violationType, "import");
    ASSERT_EQ(r.violations.size(), 2u);
    EXPECT_EQ(r.violations[0], "import: os");
    EXPECT_EQ(r.violations[1], "import: subprocess");
    EXPECT_EQ(r.error.value_or("").rfind("Import statements are not allowed (attempted: os, subprocess)", 0), 0u);
    EXPECT_EQ(r.answer, "Error: " + r.error.value_or(""));

    const QueryResult syntax = processor.runCandidate("df[", 0.0, "q");
    EXPECT_EQ(syntax.errorCode, ErrorCode::SYNTAX_ERROR);
    EXPECT_EQ(syntax.error.value_or("").rfind("Syntax error in generated code", 0), 0u);
    EXPECT_TRUE(syntax.violationType.empty());
}

TEST_F(QueryProcessorTest, ExecutionFailuresKeepTheCode) {
    const QueryProcessor processor(policy_, data_);
    const QueryResult r = processor.runCandidate("df['nonexistent']", 0.0, "q");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, ErrorCode::EXECUTION_FAILED);
    EXPECT_EQ(r.error.value_or(""), "KeyError: 'nonexistent'");
    EXPECT_EQ(r.code, "df['nonexistent']");
    EXPECT_FALSE(r.hasData());
}

TEST_F(QueryProcessorTest, SummarizerFailureFallsBackToDisplayText) {
    BrokenResponder responder;
    const QueryProcessor processor(policy_, data_, nullptr, &responder);
    const QueryResult r = processor.runCandidate("len(df)", 0.0, "how many rows");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.answer, "Here are the results:\n\n5");
}

TEST_F(QueryProcessorTest, GenerationFailures) {
    ScriptedGenerator refusing("");
    refusing.succeed = false;
    const QueryResult failed = QueryProcessor(policy_, data_, &refusing).processQuestion("anything");
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.errorCode, ErrorCode::LLM_INVALID_RESPONSE);
    EXPECT_EQ(failed.error.value_or(""), "Could not generate analysis code");
    EXPECT_DOUBLE_EQ(failed.generationTimeMs, 12.5);

    ThrowingGenerator throwing;
    EXPECT_EQ(QueryProcessor(policy_, data_, &throwing).processQuestion("anything").errorCode,
              ErrorCode::LLM_CONNECTION_ERROR);

    EXPECT_EQ(QueryProcessor(policy_, data_).processQuestion("anything").errorCode, ErrorCode::LLM_CONNECTION_ERROR);
}

TEST_F(QueryProcessorTest, MissingDatasetStopsBeforeGeneration) {
    DataManager missing("/nonexistent/tabula/scores.csv");
    ScriptedGenerator generator("1");
    const QueryResult r = QueryProcessor(policy_, missing, &generator).processQuestion("average score");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, ErrorCode::DATA_LOAD_ERROR);
    EXPECT_EQ(r.error.value_or(""), "Could not load the data file. Please check if it exists.");
    EXPECT_EQ(generator.calls, 0);
}

TEST_F(QueryProcessorTest, CheckSystemReportsReadiness) {
    ScriptedGenerator generator("1");
    const SystemStatus ready = QueryProcessor(policy_, data_, &generator).checkSystem();
    EXPECT_TRUE(ready.dataLoaded);
    EXPECT_TRUE(ready.generatorConnected);
    EXPECT_TRUE(ready.ready);

    generator.connected = false;
    EXPECT_FALSE(QueryProcessor(policy_, data_, &generator).checkSystem().ready);

    DataManager missing("/nonexistent/tabula/scores.csv");
    const SystemStatus noData = QueryProcessor(policy_, missing, &generator).checkSystem();
    EXPECT_FALSE(noData.dataLoaded);
    EXPECT_FALSE(noData.ready);
}

TEST_F(QueryProcessorTest, ConcurrentQueriesDoNotShareMutations) {
    const QueryProcessor processor(policy_, data_);
    std::atomic<int> correct{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&, i] {
            const std::string code = "df['extra'] = " + std::to_string(i) + "\ndf = df[df['level'] > 1]\n"
                                     "(len(df), len(df.columns), int(df['extra'].sum()))";
            const QueryResult r = processor.runCandidate(code, 0.0, "q" + std::to_string(i));
            if (r.success && r.displayText == "(3, 5, " + std::to_string(3 * i) + ")") ++correct;
        });
    }
    for (auto& t : workers) t.join();
    EXPECT_EQ(correct.load(), 4);
    EXPECT_EQ(data_.frame()->cols(), 4u);
    EXPECT_EQ(data_.frame()->rows(), 5u);
}
