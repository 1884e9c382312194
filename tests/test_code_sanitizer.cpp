#include <gtest/gtest.h>

#include "CodeSanitizer.h"
#include "ScriptLexer.h"

using Tabula::ScriptLexer;

TEST(CodeSanitizerTest, PreCleanDropsFencesAndCodeMarker) {
    EXPECT_EQ(CodeSanitizer::preClean("```python\nresult = df.head()\n```"), "result = df.head()");
    EXPECT_EQ(CodeSanitizer::preClean("CODE: result = df.head()"), "result = df.head()");
    EXPECT_EQ(CodeSanitizer::preClean("CODE:\nx = 1\n\n\n"), "x = 1");
}

TEST(CodeSanitizerTest, PreCleanDropsProseButKeepsCodeLookalikes) {
    const std::string cleaned = CodeSanitizer::preClean(
        "Here is the answer\n"
        "result = df['score'].mean()\n"
        "the_total = 3\n"
        "This uses the mean");
    EXPECT_EQ(cleaned, "result = df['score'].mean()\nthe_total = 3");
}

TEST(CodeSanitizerTest, StripCommentsRemovesOnlyFlaggedSpans) {
    const std::string code =
        "x = 1  # ok\n"
        "# a very long full line comment that explains far too much about nothing\n"
        "y = 2  # please run exec here\n";
    ScriptLexer lexer(code);
    lexer.tokenize();
    const std::string out = CodeSanitizer::stripComments(
        code, lexer.comments(), [](const std::string& text) { return text.find("exec") != std::string::npos; });
    EXPECT_EQ(out, "x = 1  # ok\ny = 2");
}

TEST(CodeSanitizerTest, ExtractTakesFirstFencedBlockAndUnwrapsPrint) {
    const std::string response =
        "Here's the code:\n"
        "```python\n"
        "result = df['score'].mean()\n"
        "print(result)\n"
        "```\n"
        "```python\nignored = 1\n```\n";
    EXPECT_EQ(CodeSanitizer::extractFromResponse(response), "result = df['score'].mean()\nresult");
}

TEST(CodeSanitizerTest, ExtractFallsBackToCodeLikeLines) {
    const std::string response =
        "The answer groups by course\n"
        "df.groupby('course_name')['score'].sum()\n"
        "Hope that helps";
    EXPECT_EQ(CodeSanitizer::extractFromResponse(response), "df.groupby('course_name')['score'].sum()");
}

TEST(CodeSanitizerTest, CleanCodeDropsLongTrailingComments) {
    const std::string out =
        CodeSanitizer::cleanCode("total = df['score'].sum()  # summing all the scores across every student\nt = 1");
    EXPECT_EQ(out, "total = df['score'].sum()\nt = 1");
}

TEST(CodeSanitizerTest, CleanCodeLeavesUnparseableTextForValidation) {
    EXPECT_EQ(CodeSanitizer::cleanCode("x = 'unterminated"), "x = 'unterminated");
}
