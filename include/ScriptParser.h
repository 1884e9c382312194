#pragma once

#include "ScriptAst.h"
#include "ScriptLexer.h"

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Tabula {

/**
 * @brief Recursive-descent parser for the analysis-script language.
 * @details Statements outside the supported subset (`def`, `class`, `with`,
 * `try`, `return`, ...) are rejected as syntax errors. `import` and `lambda`
 * parse normally so that validation can report them precisely.
 */
class ScriptParser {
public:
    static constexpr int kMaxDepth = 100;

    explicit ScriptParser(std::vector<Token> tokens);

    /**
     * @brief Parses a whole script.
     * @throws Tabula::ScriptSyntaxError with the offending line and column.
     */
    Ast::Module parseModule();

    /**
     * @brief Tokenizes and parses `source` in one step.
     * @throws Tabula::ScriptSyntaxError
     */
    static Ast::Module parse(std::string_view source);

    static bool isKeyword(const std::string& word);

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    int depth_ = 0;

    friend struct DepthGuard;

    const Token& cur() const noexcept { return tokens_[pos_]; }
    const Token& peekToken(size_t ahead) const noexcept;
    const Token& advance();
    bool atOp(const char* op) const noexcept;
    bool atKeyword(const char* word) const noexcept;
    bool acceptOp(const char* op);
    bool acceptKeyword(const char* word);
    void expectOp(const char* op, const char* context);
    void expectKeyword(const char* word);
    std::string expectName();
    [[noreturn]] void fail(const std::string& message) const;
    [[noreturn]] void failAt(const std::string& message, const Token& tok) const;

    void parseStatement(Ast::Block& out);
    void parseSimpleStatements(Ast::Block& out);
    Ast::StmtPtr parseSmallStatement();
    Ast::StmtPtr parseImport();
    Ast::StmtPtr parseExpressionStatement();
    Ast::StmtPtr parseIf();
    Ast::StmtPtr parseFor();
    Ast::StmtPtr parseWhile();
    Ast::Block parseBlock();

    Ast::ExprPtr parseTestList();
    Ast::ExprPtr parseTargetList();
    Ast::ExprPtr parseTest();
    Ast::ExprPtr parseLambda();
    Ast::ExprPtr parseOrTest();
    Ast::ExprPtr parseAndTest();
    Ast::ExprPtr parseNotTest();
    Ast::ExprPtr parseComparison();
    Ast::ExprPtr parseBinary(Ast::ExprPtr (ScriptParser::*next)(),
                             std::initializer_list<std::pair<const char*, ArithOp>> ops);
    Ast::ExprPtr parseBitOr();
    Ast::ExprPtr parseBitXor();
    Ast::ExprPtr parseBitAnd();
    Ast::ExprPtr parseShift();
    Ast::ExprPtr parseArith();
    Ast::ExprPtr parseTerm();
    Ast::ExprPtr parseFactor();
    Ast::ExprPtr parsePower();
    Ast::ExprPtr parsePrimary();
    Ast::ExprPtr parseAtom();
    Ast::ExprPtr parseParenthesized(const Token& open);
    Ast::ExprPtr parseListDisplay(const Token& open);
    Ast::ExprPtr parseBraceDisplay(const Token& open);
    Ast::ExprPtr parseCall(Ast::ExprPtr func, const Token& open);
    Ast::ExprPtr parseSubscript(Ast::ExprPtr value, const Token& open);
    Ast::ExprPtr parseSliceItem();
    Ast::ExprPtr parseNumber(const Token& tok);
    Ast::ExprPtr parseStrings();
    std::vector<Ast::Comprehension> parseComprehensionClauses();
    void parseFStringBody(const Token& tok, std::vector<Ast::FStringPart>& parts);

    void checkAssignable(const Ast::Expr& target, bool augmented) const;
};

} // namespace Tabula
