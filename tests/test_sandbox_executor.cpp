#include <gtest/gtest.h>

#include "ResultClassifier.h"
#include "SandboxExecutor.h"
#include "SyscallFilter.h"
#include "TestHelpers.h"

#include <algorithm>
#include <sys/syscall.h>

using namespace Tabula;

namespace {
SecurityPolicy quickPolicy() {
    SecurityPolicy policy = SecurityPolicy::defaults();
    policy.executionTimeoutSeconds = 1.0;
    policy.maxMemoryMb = 64;
    return policy;
}
} // namespace

TEST(SandboxExecutorTest, ReturnsTheScriptResult) {
    const SecurityPolicy policy = quickPolicy();
    const SandboxExecutor executor(policy);
    const ExecutionResult r =
        executor.execute("result = df.groupby('course_name')['score'].mean()", TabulaTest::scoresFrame());
    ASSERT_TRUE(r.success) << r.error.value_or("");
    ASSERT_TRUE(r.result.has_value());
    ASSERT_TRUE(r.result->isSeries());
    EXPECT_DOUBLE_EQ(r.result->series().values.numberAt(1), 85.5);
    EXPECT_FALSE(r.error.has_value());
    EXPECT_FALSE(r.errorCode.has_value());
    EXPECT_GE(r.executionTimeMs, 0.0);
}

TEST(SandboxExecutorTest, WorkerMutationsStayInTheWorker) {
    const SecurityPolicy policy = quickPolicy();
    const SandboxExecutor executor(policy);
    const DataFrame dataset = TabulaTest::scoresFrame();
    const ExecutionResult r = executor.execute("df['bonus'] = df['score'] + 5\nlen(df.columns)", dataset);
    ASSERT_TRUE(r.success) << r.error.value_or("");
    EXPECT_EQ(r.result->as<int64_t>(), 5);
    EXPECT_EQ(dataset.cols(), 4u);
}

TEST(SandboxExecutorTest, RuntimeErrorsAreReportedWithCategory) {
    const SecurityPolicy policy = quickPolicy();
    const SandboxExecutor executor(policy);
    const ExecutionResult r = executor.execute("df['missing_column'].sum()", TabulaTest::scoresFrame());
    EXPECT_FALSE(r.success);
    EXPECT_FALSE(r.result.has_value());
    ASSERT_TRUE(r.errorCode.has_value());
    EXPECT_EQ(*r.errorCode, ErrorCode::EXECUTION_FAILED);
    EXPECT_EQ(r.error.value_or(""), "KeyError: 'missing_column'");
}

TEST(SandboxExecutorTest, InfiniteLoopHitsTheDeadline) {
    const SecurityPolicy policy = quickPolicy();
    const SandboxExecutor executor(policy);
    const ExecutionResult r = executor.execute("while True:\n    pass", TabulaTest::scoresFrame());
    EXPECT_FALSE(r.success);
    ASSERT_TRUE(r.errorCode.has_value());
    EXPECT_EQ(*r.errorCode, ErrorCode::EXECUTION_TIMEOUT);
    EXPECT_NE(r.error.value_or("").find("timed out"), std::string::npos);
    EXPECT_LT(r.executionTimeMs, 5000.0);
}

TEST(SandboxExecutorTest, RunawayAllocationHitsTheMemoryLimit) {
    const SecurityPolicy policy = quickPolicy();
    const SandboxExecutor executor(policy);
    const ExecutionResult r = executor.execute("big = [0] * 200000000\nlen(big)", TabulaTest::scoresFrame());
    EXPECT_FALSE(r.success);
    ASSERT_TRUE(r.errorCode.has_value());
    EXPECT_EQ(*r.errorCode, ErrorCode::MEMORY_LIMIT);
}

TEST(SandboxExecutorTest, ConsecutiveRunsAreIndependent) {
    const SecurityPolicy policy = quickPolicy();
    const SandboxExecutor executor(policy);
    ASSERT_TRUE(executor.execute("counter = 41", TabulaTest::scoresFrame()).success);
    const ExecutionResult r = executor.execute("counter + 1", TabulaTest::scoresFrame());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error.value_or("").rfind("NameError", 0), 0u);
}

TEST(SandboxExecutorTest, RepeatedRunsClassifyIdentically) {
    const SecurityPolicy policy = quickPolicy();
    const SandboxExecutor executor(policy);
    const DataFrame dataset = TabulaTest::scoresFrame();
    for (const char* code : {"df.groupby('course_name')['score'].mean()", "df[df['level'] > 1]",
                             "df['score'].std()", "px.bar(df, x='student', y='score')"}) {
        const ExecutionResult first = executor.execute(code, dataset);
        const ExecutionResult second = executor.execute(code, dataset);
        ASSERT_TRUE(first.success && second.success) << code;
        const ClassifiedResult a = ResultClassifier::classify(*first.result);
        const ClassifiedResult b = ResultClassifier::classify(*second.result);
        EXPECT_EQ(a.displayText, b.displayText) << code;
        EXPECT_EQ(a.typeTag, b.typeTag) << code;
    }
}

TEST(SandboxExecutorTest, ScrubsHostDetailsFromErrors) {
    EXPECT_EQ(SandboxExecutor::scrubErrorMessage("ValueError: bad value in /home/user/data/file.csv"),
              "ValueError: bad value in <path>");
    EXPECT_EQ(SandboxExecutor::scrubErrorMessage("TypeError: <Frame object at 0x7ffd1234> is odd"),
              "TypeError: <Frame object> is odd");
    EXPECT_EQ(SandboxExecutor::scrubErrorMessage("Traceback (most recent call last):\n  line 3\nKeyError: 'x'\n"),
              "KeyError: 'x'");
    EXPECT_EQ(SandboxExecutor::scrubErrorMessage("ZeroDivisionError: division by zero"),
              "ZeroDivisionError: division by zero");
}

TEST(SyscallFilterTest, AllowlistExcludesProcessAndNetworkCalls) {
    const std::vector<int> allowed = SyscallFilter::allowedSyscalls();
    ASSERT_FALSE(allowed.empty());
    const auto has = [&](long nr) { return std::find(allowed.begin(), allowed.end(), nr) != allowed.end(); };
    EXPECT_TRUE(has(SYS_write));
    EXPECT_TRUE(has(SYS_exit_group));
    EXPECT_FALSE(has(SYS_execve));
    EXPECT_FALSE(has(SYS_socket));
    EXPECT_FALSE(has(SYS_clone));
    EXPECT_FALSE(has(SYS_openat));
}
