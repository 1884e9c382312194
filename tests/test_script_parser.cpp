#include <gtest/gtest.h>

#include "ScriptLexer.h"
#include "ScriptParser.h"
#include "TabulaExceptions.h"

#include <string>

using namespace Tabula;

namespace {
template <typename Node>
const Node& stmtAs(const Ast::Module& m, size_t i) {
    return std::get<Node>(m.body.at(i)->node);
}
} // namespace

TEST(ScriptLexerTest, RecordsCommentSpansOutsideStrings) {
    ScriptLexer lexer("x = df['a#b']  # trailing note\n# full line\ny = 1\n");
    const auto tokens = lexer.tokenize();
    ASSERT_EQ(lexer.comments().size(), 2u);
    EXPECT_EQ(lexer.comments()[0].text, "# trailing note");
    EXPECT_FALSE(lexer.comments()[0].fullLine);
    EXPECT_EQ(lexer.comments()[1].text, "# full line");
    EXPECT_TRUE(lexer.comments()[1].fullLine);

    bool sawString = false;
    for (const auto& tok : tokens) {
        if (tok.kind == TokenKind::STRING) {
            EXPECT_EQ(tok.text, "a#b");
            sawString = true;
        }
    }
    EXPECT_TRUE(sawString);
    EXPECT_EQ(tokens.back().kind, TokenKind::END);
}

TEST(ScriptLexerTest, EmitsIndentAndDedent) {
    ScriptLexer lexer("if x:\n    y = 1\nz = 2\n");
    const auto tokens = lexer.tokenize();
    int indents = 0;
    int dedents = 0;
    for (const auto& tok : tokens) {
        if (tok.kind == TokenKind::INDENT) ++indents;
        if (tok.kind == TokenKind::DEDENT) ++dedents;
    }
    EXPECT_EQ(indents, 1);
    EXPECT_EQ(dedents, 1);
}

TEST(ScriptLexerTest, RejectsUnterminatedString) {
    ScriptLexer lexer("x = 'abc\n");
    EXPECT_THROW(lexer.tokenize(), ScriptSyntaxError);
}

TEST(ScriptLexerTest, RejectsBadDedent) {
    ScriptLexer lexer("if x:\n    y = 1\n  z = 2\n");
    EXPECT_THROW(lexer.tokenize(), ScriptSyntaxError);
}

TEST(ScriptParserTest, ParsesGroupbyChainWithSemicolon) {
    const Ast::Module m = ScriptParser::parse("grouped = data.groupby('course_name')['score'].mean(); grouped");
    ASSERT_EQ(m.body.size(), 2u);
    const auto& assign = stmtAs<Ast::Assign>(m, 0);
    ASSERT_EQ(assign.targets.size(), 1u);
    EXPECT_EQ(std::get<Ast::Name>(assign.targets[0]->node).id, "grouped");
    const auto& call = std::get<Ast::Call>(assign.value->node);
    EXPECT_EQ(std::get<Ast::Attribute>(call.func->node).attr, "mean");
    EXPECT_TRUE(std::holds_alternative<Ast::ExprStmt>(m.body[1]->node));
}

TEST(ScriptParserTest, ParsesControlFlowAndComprehensions) {
    const std::string code =
        "total = 0\n"
        "for i, v in enumerate([1, 2, 3]):\n"
        "    if v > 1 and not v == 3:\n"
        "        total += v\n"
        "    elif v < 0:\n"
        "        continue\n"
        "    else:\n"
        "        pass\n"
        "while total > 100:\n"
        "    break\n"
        "squares = {k: k ** 2 for k in range(4) if k % 2 == 0}\n"
        "label = 'big' if total > 1 else 'small'\n"
        "text = f\"{total:.2f} items\"\n";
    const Ast::Module m = ScriptParser::parse(code);
    ASSERT_EQ(m.body.size(), 6u);
    const auto& loop = stmtAs<Ast::For>(m, 1);
    EXPECT_TRUE(std::holds_alternative<Ast::TupleExpr>(loop.target->node));
    const auto& branch = std::get<Ast::If>(loop.body.at(0)->node);
    EXPECT_EQ(branch.orelse.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<Ast::While>(m.body[2]->node));
    const auto& dc = stmtAs<Ast::Assign>(m, 3);
    EXPECT_TRUE(std::holds_alternative<Ast::DictComp>(dc.value->node));
    EXPECT_TRUE(std::holds_alternative<Ast::IfExp>(stmtAs<Ast::Assign>(m, 4).value->node));
    EXPECT_TRUE(std::holds_alternative<Ast::FString>(stmtAs<Ast::Assign>(m, 5).value->node));
}

TEST(ScriptParserTest, ParsesChainedComparisonsAndMasks) {
    const Ast::Module m = ScriptParser::parse("df[(df['score'] > 50) & ~df['level'].isin([3])]\n1 < x <= 5");
    ASSERT_EQ(m.body.size(), 2u);
    const auto& cmp = std::get<Ast::Compare>(stmtAs<Ast::ExprStmt>(m, 1).value->node);
    EXPECT_EQ(cmp.ops.size(), 2u);
}

TEST(ScriptParserTest, ImportAndLambdaParseForValidation) {
    const Ast::Module m = ScriptParser::parse("import os.path as p\nfrom sys import argv\nf = lambda x: x + 1\n");
    ASSERT_EQ(m.body.size(), 3u);
    const auto& imp = stmtAs<Ast::Import>(m, 0);
    EXPECT_FALSE(imp.from);
    ASSERT_EQ(imp.modules.size(), 1u);
    EXPECT_EQ(imp.modules[0], "os.path");
    EXPECT_TRUE(stmtAs<Ast::Import>(m, 1).from);
    EXPECT_TRUE(std::holds_alternative<Ast::Lambda>(stmtAs<Ast::Assign>(m, 2).value->node));
}

TEST(ScriptParserTest, RejectsUnsupportedStatements) {
    for (const char* code : {"def f():\n    pass\n", "class A:\n    pass\n", "with open('x') as f:\n    pass\n",
                             "try:\n    x = 1\nexcept:\n    pass\n", "return 1\n", "del x\n", "global x\n",
                             "raise ValueError\n", "assert x\n"}) {
        EXPECT_THROW(ScriptParser::parse(code), ScriptSyntaxError) << code;
    }
}

TEST(ScriptParserTest, SyntaxErrorCarriesPosition) {
    try {
        ScriptParser::parse("x = 1\ny = (2 +\n");
        FAIL() << "expected ScriptSyntaxError";
    } catch (const ScriptSyntaxError& e) {
        EXPECT_GE(e.line(), 2);
        EXPECT_GE(e.column(), 1);
    }
}

TEST(ScriptParserTest, RejectsInvalidAssignmentTargets) {
    EXPECT_THROW(ScriptParser::parse("f(x) = 1\n"), ScriptSyntaxError);
    EXPECT_THROW(ScriptParser::parse("1 += 2\n"), ScriptSyntaxError);
}

TEST(ScriptParserTest, BoundsNestingDepth) {
    std::string deep(ScriptParser::kMaxDepth + 5, '(');
    deep += "1";
    deep += std::string(ScriptParser::kMaxDepth + 5, ')');
    EXPECT_THROW(ScriptParser::parse(deep), ScriptSyntaxError);

    std::string shallow(10, '(');
    shallow += "1";
    shallow += std::string(10, ')');
    EXPECT_NO_THROW(ScriptParser::parse(shallow));
}
