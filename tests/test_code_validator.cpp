#include <gtest/gtest.h>

#include "CodeValidator.h"
#include "ScriptParser.h"
#include "TabulaExceptions.h"
#include "TestHelpers.h"

#include <algorithm>

using namespace Tabula;

namespace {
CodeValidationError rejectionOf(const std::string& code) {
    CodeValidator validator(TabulaTest::defaultPolicy());
    try {
        validator.validate(code);
    } catch (const CodeValidationError& e) {
        return e;
    }
    ADD_FAILURE() << "validation unexpectedly passed: " << code;
    return CodeValidationError(ValidationKind::SecurityViolation, "none");
}

bool hasWarning(const ValidationResult& r, const std::string& text) {
    return std::find(r.warnings.begin(), r.warnings.end(), text) != r.warnings.end();
}
} // namespace

TEST(CodeValidatorTest, AcceptsGroupbyMean) {
    CodeValidator validator(TabulaTest::defaultPolicy());
    const ValidationResult r = validator.validate("grouped = data.groupby('course_name')['score'].mean(); grouped");
    EXPECT_NE(r.sanitizedCode.find("groupby"), std::string::npos);
    EXPECT_TRUE(r.warnings.empty());
}

TEST(CodeValidatorTest, RejectsImportWithBlockedCall) {
    const CodeValidationError e = rejectionOf("import os\nos.system('rm -rf /')");
    EXPECT_EQ(e.kind(), ValidationKind::SecurityViolation);
    EXPECT_EQ(e.code(), ErrorCode::SECURITY_VIOLATION);
    EXPECT_EQ(e.violationType(), "import");
    const auto items = e.itemsOfType("import");
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0], "os");
    EXPECT_NE(e.userMessage().find("All libraries (px, go, pd, np, df) are already imported"), std::string::npos);
}

TEST(CodeValidatorTest, ListsEveryImportedModuleRoot) {
    const CodeValidationError e = rejectionOf("import pandas as pd2\nfrom collections.abc import Mapping\nimport math");
    EXPECT_EQ(e.violationType(), "import");
    const auto items = e.itemsOfType("import");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0], "pandas");
    EXPECT_EQ(items[1], "collections");
    EXPECT_EQ(items[2], "math");
}

TEST(CodeValidatorTest, BlockedModuleAttributeWithoutImport) {
    const CodeValidationError e = rejectionOf("result = os.listdir('.')");
    EXPECT_EQ(e.violationType(), "import");
    EXPECT_EQ(e.itemsOfType("import").at(0), "os");
}

TEST(CodeValidatorTest, RejectsLambdaAnywhere) {
    const CodeValidationError e = rejectionOf("df['x'] = df['score'].apply(lambda x: x + 1)");
    EXPECT_EQ(e.violationType(), "lambda");
    EXPECT_NE(e.userMessage().find("Lambda"), std::string::npos);

    const CodeValidationError nested = rejectionOf("vals = [ (lambda v: v)(i) for i in range(3) ]");
    EXPECT_EQ(nested.violationType(), "lambda");
}

TEST(CodeValidatorTest, ImportOutranksLambdaAndOperation) {
    const CodeValidationError e = rejectionOf("eval('1')\nf = lambda: 0\nimport sys");
    EXPECT_EQ(e.violationType(), "import");
    EXPECT_EQ(e.violations().size(), 3u);
    EXPECT_EQ(e.violations()[0].type, "operation");
    EXPECT_EQ(e.violations()[1].type, "lambda");
}

TEST(CodeValidatorTest, RejectsBlockedOperationsInEveryPosition) {
    for (const char* code : {"eval('1+1')", "x = df.__class__", "open('/etc/passwd')", "df.to_csv(exec=1)",
                             "getattr(df, 'mean')", "x = [exec for exec in range(2)]"}) {
        const CodeValidationError e = rejectionOf(code);
        EXPECT_EQ(e.violationType(), "operation") << code;
    }
}

TEST(CodeValidatorTest, DeduplicatesViolations) {
    const CodeValidationError e = rejectionOf("eval('1')\neval('2')\nexec('3')");
    const auto items = e.itemsOfType("operation");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], "eval");
    EXPECT_EQ(items[1], "exec");
    EXPECT_NE(e.userMessage().find("Security block: eval, exec"), std::string::npos);
}

TEST(CodeValidatorTest, SyntaxErrorsAreReportedWithCode204) {
    const CodeValidationError e = rejectionOf("result = df[");
    EXPECT_EQ(e.kind(), ValidationKind::SyntaxError);
    EXPECT_EQ(e.code(), ErrorCode::SYNTAX_ERROR);
    EXPECT_TRUE(e.violationType().empty());
    EXPECT_NE(e.userMessage().find("Syntax error"), std::string::npos);

    EXPECT_EQ(rejectionOf("def f():\n    return 1\n").code(), ErrorCode::SYNTAX_ERROR);
}

TEST(CodeValidatorTest, UnknownOperationsAndNamesAreOnlyWarnings) {
    CodeValidator validator(TabulaTest::defaultPolicy());
    const ValidationResult r = validator.validate("result = df.frobnicate()\nmystery_total + 1\nresult");
    EXPECT_TRUE(hasWarning(r, "Unknown operation: frobnicate"));
    EXPECT_TRUE(hasWarning(r, "Unknown variable: mystery_total"));
}

TEST(CodeValidatorTest, UnknownCallTargetWarnsOnce) {
    CodeValidator validator(TabulaTest::defaultPolicy());
    const ValidationResult r = validator.validate("foo()");
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0], "Unknown operation: foo");
}

TEST(CodeValidatorTest, EveryBlockedNameIsASecurityViolation) {
    const SecurityPolicy& policy = TabulaTest::defaultPolicy();
    for (const auto& op : policy.blockedOperations) {
        for (const std::string& code : {"df." + op, "x = " + op, op + "(1)"}) {
            EXPECT_EQ(rejectionOf(code).kind(), ValidationKind::SecurityViolation) << code;
        }
    }
    for (const auto& module : policy.blockedModules) {
        for (const std::string& code : {"import " + module, module + ".x()", "from " + module + " import y"}) {
            const CodeValidationError e = rejectionOf(code);
            EXPECT_EQ(e.kind(), ValidationKind::SecurityViolation) << code;
            EXPECT_EQ(e.violationType(), "import") << code;
        }
    }
}

TEST(CodeValidatorTest, EveryAllowedOperationPasses) {
    const SecurityPolicy& policy = TabulaTest::defaultPolicy();
    CodeValidator validator(policy);
    for (const auto& op : policy.allowedOperations) {
        if (policy.isBlockedOperation(op) || policy.isBlockedModule(op) || ScriptParser::isKeyword(op)) continue;
        for (const std::string& code : {"df." + op, "df." + op + "()", op + "(df)"}) {
            EXPECT_NO_THROW(validator.validate(code)) << code;
        }
    }
}

TEST(CodeValidatorTest, AssignedAndLoopNamesAreKnown) {
    CodeValidator validator(TabulaTest::defaultPolicy());
    const ValidationResult r = validator.validate(
        "best_course = df.groupby('course_name')['score'].mean().idxmax()\n"
        "pairs = [(k, v) for k, v in zip([1], [2])]\n"
        "best_course");
    EXPECT_FALSE(hasWarning(r, "Unknown variable: best_course"));
    EXPECT_FALSE(hasWarning(r, "Unknown variable: k"));
}

TEST(CodeValidatorTest, CleansMarkdownFencesBeforeParsing) {
    CodeValidator validator(TabulaTest::defaultPolicy());
    const ValidationResult r = validator.validate("```python\nresult = df.head()\n```");
    EXPECT_EQ(r.sanitizedCode.find("```"), std::string::npos);
    EXPECT_NE(r.sanitizedCode.find("result = df.head()"), std::string::npos);
}

TEST(CodeValidatorTest, StripsLongAndDeniedComments) {
    CodeValidator validator(TabulaTest::defaultPolicy());
    const std::string code =
        "# short\n"
        "# this is a very long explanatory comment that goes well past fifty characters\n"
        "result = df['score'].mean()  # avoid calling eval here\n"
        "label = '# not a comment'\n";
    const ValidationResult r = validator.validate(code);
    EXPECT_NE(r.sanitizedCode.find("# short"), std::string::npos);
    EXPECT_EQ(r.sanitizedCode.find("explanatory"), std::string::npos);
    EXPECT_EQ(r.sanitizedCode.find("eval"), std::string::npos);
    EXPECT_NE(r.sanitizedCode.find("'# not a comment'"), std::string::npos);
}

TEST(CodeValidatorTest, ValidationIsDeterministic) {
    CodeValidator validator(TabulaTest::defaultPolicy());
    const std::string code = "x = df.nothing_known()\nresult = df.describe()";
    const ValidationResult a = validator.validate(code);
    const ValidationResult b = validator.validate(code);
    EXPECT_EQ(a.sanitizedCode, b.sanitizedCode);
    EXPECT_EQ(a.warnings, b.warnings);
}

TEST(CodeValidatorTest, CustomPolicyDatasetNameIsKnown) {
    SecurityPolicy policy = SecurityPolicy::defaults();
    policy.datasetName = "students";
    CodeValidator validator(policy);
    const ValidationResult r = validator.validate("students.head()");
    EXPECT_FALSE(hasWarning(r, "Unknown variable: students"));
}
