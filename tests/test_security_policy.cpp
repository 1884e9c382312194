#include <gtest/gtest.h>

#include "SecurityPolicy.h"
#include "TabulaExceptions.h"
#include "TestHelpers.h"

using Tabula::ConfigurationException;
using Tabula::SecurityPolicy;
using Tabula::SyscallFilterMode;
using TabulaTest::TempFile;

TEST(SecurityPolicyTest, DefaultsAreConsistent) {
    const SecurityPolicy policy = SecurityPolicy::defaults();
    EXPECT_NO_THROW(policy.validate());
    EXPECT_EQ(policy.maxInputLength, 1000u);
    EXPECT_DOUBLE_EQ(policy.executionTimeoutSeconds, 10.0);
    EXPECT_EQ(policy.maxMemoryMb, 512u);
    EXPECT_EQ(policy.datasetName, "df");
    EXPECT_EQ(policy.syscallFilter, SyscallFilterMode::BEST_EFFORT);

    EXPECT_TRUE(policy.isAllowedOperation("groupby"));
    EXPECT_TRUE(policy.isBlockedOperation("eval"));
    EXPECT_TRUE(policy.isBlockedModule("os"));
    EXPECT_TRUE(policy.isAllowedVariable("result"));
}

TEST(SecurityPolicyTest, DatasetBindingsListNameThenAliases) {
    SecurityPolicy policy = SecurityPolicy::defaults();
    policy.datasetAliases = {"data", "df", "students"};
    const auto bindings = policy.datasetBindings();
    ASSERT_EQ(bindings.size(), 3u);
    EXPECT_EQ(bindings[0], "df");
    EXPECT_EQ(bindings[1], "data");
    EXPECT_EQ(bindings[2], "students");
}

TEST(SecurityPolicyTest, DeniedIdentifiersIncludeDunders) {
    const SecurityPolicy policy = SecurityPolicy::defaults();
    EXPECT_TRUE(policy.isDeniedIdentifier("__class__"));
    EXPECT_TRUE(policy.isDeniedIdentifier("__anything__"));
    EXPECT_TRUE(policy.isDeniedIdentifier("subprocess"));
    EXPECT_FALSE(policy.isDeniedIdentifier("mean"));
    EXPECT_FALSE(policy.isDeniedIdentifier("_private"));
}

TEST(SecurityPolicyTest, FileOverridesLimitsAndLists) {
    TempFile file(".yaml",
                  "# sandbox tuning\n"
                  "max_input_length: 500\n"
                  "execution_timeout: 2.5\n"
                  "max-memory-mb: 128\n"
                  "syscall_filter: strict\n"
                  "log_level: debug\n"
                  "blocked_modules: [os, sys]\n"
                  "blocked_operations+: \"pivot_longer\", drop_everything\n"
                  "dataset_name: students\n"
                  "dataset_aliases: data\n");

    const SecurityPolicy policy = SecurityPolicy::fromFile(file.path(), SecurityPolicy::defaults());
    EXPECT_EQ(policy.maxInputLength, 500u);
    EXPECT_DOUBLE_EQ(policy.executionTimeoutSeconds, 2.5);
    EXPECT_EQ(policy.maxMemoryMb, 128u);
    EXPECT_EQ(policy.syscallFilter, SyscallFilterMode::STRICT);
    EXPECT_EQ(policy.logLevel, Tabula::LogLevel::DEBUG);
    EXPECT_EQ(policy.blockedModules.size(), 2u);
    EXPECT_TRUE(policy.isBlockedModule("sys"));
    EXPECT_FALSE(policy.isBlockedModule("pickle"));
    EXPECT_TRUE(policy.isBlockedOperation("pivot_longer"));
    EXPECT_TRUE(policy.isBlockedOperation("drop_everything"));
    EXPECT_TRUE(policy.isBlockedOperation("eval"));
    EXPECT_EQ(policy.datasetName, "students");
}

TEST(SecurityPolicyTest, JsonStyleFileIsAccepted) {
    TempFile file(".json",
                  "{\n"
                  "  \"max_input_length\": 42,\n"
                  "  \"result_names\": [\"answer\", \"result\"]\n"
                  "}\n");
    const SecurityPolicy policy = SecurityPolicy::fromFile(file.path(), SecurityPolicy::defaults());
    EXPECT_EQ(policy.maxInputLength, 42u);
    ASSERT_EQ(policy.resultNames.size(), 2u);
    EXPECT_EQ(policy.resultNames[0], "answer");
}

TEST(SecurityPolicyTest, UnknownKeyReportsLineNumber) {
    TempFile file(".yaml", "max_input_length: 10\n\nnot_a_key: 1\n");
    try {
        SecurityPolicy::fromFile(file.path(), SecurityPolicy::defaults());
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("not_a_key"), std::string::npos);
    }
}

TEST(SecurityPolicyTest, InvalidValuesAreRejected) {
    TempFile negative(".yaml", "max_memory_mb: -5\n");
    EXPECT_THROW(SecurityPolicy::fromFile(negative.path(), SecurityPolicy::defaults()), ConfigurationException);

    TempFile zeroTimeout(".yaml", "execution_timeout: 0\n");
    EXPECT_THROW(SecurityPolicy::fromFile(zeroTimeout.path(), SecurityPolicy::defaults()), ConfigurationException);

    TempFile badMode(".yaml", "syscall_filter: sometimes\n");
    EXPECT_THROW(SecurityPolicy::fromFile(badMode.path(), SecurityPolicy::defaults()), ConfigurationException);

    TempFile extendScalar(".yaml", "max_input_length+: 5\n");
    EXPECT_THROW(SecurityPolicy::fromFile(extendScalar.path(), SecurityPolicy::defaults()), ConfigurationException);

    TempFile noSeparator(".yaml", "just some words\n");
    EXPECT_THROW(SecurityPolicy::fromFile(noSeparator.path(), SecurityPolicy::defaults()), ConfigurationException);
}

TEST(SecurityPolicyTest, ValidateRejectsInconsistentPolicies) {
    SecurityPolicy overlap = SecurityPolicy::defaults();
    overlap.allowedOperations.insert("eval");
    EXPECT_THROW(overlap.validate(), ConfigurationException);

    SecurityPolicy blockedName = SecurityPolicy::defaults();
    blockedName.datasetName = "os";
    EXPECT_THROW(blockedName.validate(), ConfigurationException);

    SecurityPolicy emptyName = SecurityPolicy::defaults();
    emptyName.datasetName.clear();
    EXPECT_THROW(emptyName.validate(), ConfigurationException);

    SecurityPolicy noMemory = SecurityPolicy::defaults();
    noMemory.maxMemoryMb = 0;
    EXPECT_THROW(noMemory.validate(), ConfigurationException);
}

TEST(SecurityPolicyTest, MissingFileThrows) {
    EXPECT_THROW(SecurityPolicy::fromFile("/nonexistent/tabula/policy.yaml", SecurityPolicy::defaults()),
                 ConfigurationException);
}
