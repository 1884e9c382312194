#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace Tabula {

enum class TokenKind { NAME, NUMBER, STRING, FSTRING, OP, NEWLINE, INDENT, DEDENT, END };

/**
 * @brief One lexical token. STRING and FSTRING carry the decoded body in `text`
 * (f-string bodies keep their braces for the parser to split).
 */
struct Token {
    TokenKind kind = TokenKind::END;
    std::string text;
    int line = 1;
    int column = 1;
    size_t offset = 0;
    bool rawString = false;
};

/**
 * @brief Location of a `#` comment in the source, used to strip comments
 * without touching `#` characters inside string literals.
 */
struct CommentSpan {
    int line = 1;
    int column = 1;
    size_t offset = 0;
    size_t length = 0;
    std::string text;
    bool fullLine = false;
};

/**
 * @brief Indentation-aware tokenizer for the analysis-script language.
 * @throws Tabula::ScriptSyntaxError on unterminated strings, bad indentation
 * and characters outside the language.
 */
class ScriptLexer {
public:
    explicit ScriptLexer(std::string_view source);

    std::vector<Token> tokenize();
    const std::vector<CommentSpan>& comments() const noexcept { return comments_; }

private:
    std::string_view src_;
    size_t pos_ = 0;
    int line_ = 1;
    size_t lineStart_ = 0;
    int bracketDepth_ = 0;
    std::vector<int> indents_{0};
    std::vector<Token> tokens_;
    std::vector<CommentSpan> comments_;

    char peek(size_t ahead = 0) const noexcept;
    int column() const noexcept { return static_cast<int>(pos_ - lineStart_) + 1; }
    [[noreturn]] void fail(const std::string& message) const;

    void emit(TokenKind kind, std::string text, size_t start, int startColumn, bool raw = false);
    bool handleLineStart();
    void readComment(bool fullLine);
    void readName();
    void readNumber();
    void readString(size_t prefixLength, bool raw, bool formatted);
    void readOperator();
    void newline();
};

} // namespace Tabula
