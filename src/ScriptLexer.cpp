#include "ScriptLexer.h"

#include "TabulaExceptions.h"

#include <cctype>
#include <cstring>

namespace Tabula {

namespace {
bool isNameStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || (static_cast<unsigned char>(c) & 0x80) != 0;
}

bool isNameChar(char c) {
    return isNameStart(c) || std::isdigit(static_cast<unsigned char>(c));
}

void appendUtf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Longest operators first so that `**=` wins over `**` and `*`.
const char* const kOperators[] = {
    "**=", "//=", ">>=", "<<=", "...",
    "**", "//", "==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "->", "<<", ">>", ":=",
    "+", "-", "*", "/", "%", "(", ")", "[", "]", "{", "}", ",", ":", ".", ";", "=", "<", ">", "&", "|", "^", "~", "@"
};
} // namespace

ScriptLexer::ScriptLexer(std::string_view source) : src_(source) {}

char ScriptLexer::peek(size_t ahead) const noexcept {
    return (pos_ + ahead < src_.size()) ? src_[pos_ + ahead] : '\0';
}

void ScriptLexer::fail(const std::string& message) const {
    throw ScriptSyntaxError(message, line_, column());
}

void ScriptLexer::emit(TokenKind kind, std::string text, size_t start, int startColumn, bool raw) {
    Token tok;
    tok.kind = kind;
    tok.text = std::move(text);
    tok.line = line_;
    tok.column = startColumn;
    tok.offset = start;
    tok.rawString = raw;
    tokens_.push_back(std::move(tok));
}

void ScriptLexer::newline() {
    ++pos_;
    ++line_;
    lineStart_ = pos_;
}

std::vector<Token> ScriptLexer::tokenize() {
    tokens_.clear();
    comments_.clear();
    bool atLineStart = true;

    while (pos_ < src_.size()) {
        if (atLineStart && bracketDepth_ == 0) {
            if (!handleLineStart()) continue;
            atLineStart = false;
        }

        const char c = peek();
        if (c == '\n') {
            if (bracketDepth_ == 0 && !tokens_.empty() && tokens_.back().kind != TokenKind::NEWLINE) {
                emit(TokenKind::NEWLINE, "", pos_, column());
            }
            newline();
            if (bracketDepth_ == 0) atLineStart = true;
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
            ++pos_;
            continue;
        }
        if (c == '#') {
            readComment(false);
            continue;
        }
        if (c == '\\') {
            size_t ahead = 1;
            if (peek(ahead) == '\r') ++ahead;
            if (peek(ahead) != '\n') fail("unexpected character after line continuation character");
            pos_ += ahead;
            newline();
            continue;
        }
        if (isNameStart(c)) {
            size_t prefix = 0;
            bool raw = false;
            bool formatted = false;
            while (prefix < 2 && peek(prefix) != '\0' && std::strchr("rRfFbBuU", peek(prefix)) != nullptr) {
                const char p = static_cast<char>(std::tolower(static_cast<unsigned char>(peek(prefix))));
                raw = raw || p == 'r';
                formatted = formatted || p == 'f';
                ++prefix;
            }
            if (prefix > 0 && (peek(prefix) == '\'' || peek(prefix) == '"')) {
                readString(prefix, raw, formatted);
            } else {
                readName();
            }
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
            readNumber();
            continue;
        }
        if (c == '\'' || c == '"') {
            readString(0, false, false);
            continue;
        }
        readOperator();
    }

    if (!tokens_.empty() && tokens_.back().kind != TokenKind::NEWLINE) emit(TokenKind::NEWLINE, "", pos_, column());
    while (indents_.size() > 1) {
        indents_.pop_back();
        emit(TokenKind::DEDENT, "", pos_, column());
    }
    emit(TokenKind::END, "", pos_, column());
    return tokens_;
}

bool ScriptLexer::handleLineStart() {
    int width = 0;
    while (pos_ < src_.size()) {
        const char c = peek();
        if (c == ' ') width += 1;
        else if (c == '\t') width = (width / 8 + 1) * 8;
        else if (c != '\f' && c != '\r') break;
        ++pos_;
    }

    const char c = peek();
    if (pos_ >= src_.size()) return false;
    if (c == '\n' || c == '#') {
        if (c == '#') readComment(true);
        if (peek() == '\n') newline();
        return false;
    }

    if (width > indents_.back()) {
        indents_.push_back(width);
        emit(TokenKind::INDENT, "", pos_, column());
    } else {
        while (width < indents_.back()) {
            indents_.pop_back();
            emit(TokenKind::DEDENT, "", pos_, column());
        }
        if (width != indents_.back()) fail("unindent does not match any outer indentation level");
    }
    return true;
}

void ScriptLexer::readComment(bool fullLine) {
    CommentSpan span;
    span.line = line_;
    span.column = column();
    span.offset = pos_;
    span.fullLine = fullLine;
    while (pos_ < src_.size() && peek() != '\n') ++pos_;
    span.length = pos_ - span.offset;
    span.text = std::string(src_.substr(span.offset, span.length));
    if (!span.text.empty() && span.text.back() == '\r') span.text.pop_back();
    comments_.push_back(std::move(span));
}

void ScriptLexer::readName() {
    const size_t start = pos_;
    const int startColumn = column();
    while (pos_ < src_.size() && isNameChar(peek())) ++pos_;
    emit(TokenKind::NAME, std::string(src_.substr(start, pos_ - start)), start, startColumn);
}

void ScriptLexer::readNumber() {
    const size_t start = pos_;
    const int startColumn = column();
    std::string text;
    const auto take = [&]() {
        if (peek() != '_') text.push_back(peek());
        ++pos_;
    };

    if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X' || peek(1) == 'o' || peek(1) == 'O' ||
                          peek(1) == 'b' || peek(1) == 'B')) {
        take();
        take();
        while (std::isxdigit(static_cast<unsigned char>(peek())) || peek() == '_') take();
    } else {
        while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_') take();
        if (peek() == '.' && peek(1) != '.') {
            take();
            while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_') take();
        }
        if (peek() == 'e' || peek() == 'E') {
            const char sign = peek(1);
            const bool hasSign = sign == '+' || sign == '-';
            if (std::isdigit(static_cast<unsigned char>(peek(hasSign ? 2 : 1)))) {
                take();
                if (hasSign) take();
                while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_') take();
            }
        }
    }
    if (peek() == 'j' || peek() == 'J') fail("complex literals are not supported");
    if (isNameStart(peek())) fail("invalid decimal literal");
    emit(TokenKind::NUMBER, std::move(text), start, startColumn);
}

void ScriptLexer::readString(size_t prefixLength, bool raw, bool formatted) {
    const size_t start = pos_;
    const int startColumn = column();
    const int startLine = line_;
    pos_ += prefixLength;
    const char quote = peek();
    const bool triple = peek(1) == quote && peek(2) == quote;
    pos_ += triple ? 3 : 1;

    std::string body;
    while (true) {
        if (pos_ >= src_.size()) {
            throw ScriptSyntaxError(triple ? "unterminated triple-quoted string literal" : "unterminated string literal",
                                    startLine, startColumn);
        }
        const char c = peek();
        if (c == quote && (!triple || (peek(1) == quote && peek(2) == quote))) {
            pos_ += triple ? 3 : 1;
            break;
        }
        if (c == '\n') {
            if (!triple) throw ScriptSyntaxError("unterminated string literal", startLine, startColumn);
            body.push_back('\n');
            newline();
            continue;
        }
        if (c != '\\') {
            body.push_back(c);
            ++pos_;
            continue;
        }

        const char e = peek(1);
        if (raw) {
            body.push_back('\\');
            if (e != '\0' && e != '\n') body.push_back(e);
            pos_ += (e != '\0' && e != '\n') ? 2 : 1;
            continue;
        }
        pos_ += 2;
        switch (e) {
            case '\n':
                ++line_;
                lineStart_ = pos_;
                break;
            case 'n': body.push_back('\n'); break;
            case 't': body.push_back('\t'); break;
            case 'r': body.push_back('\r'); break;
            case '0': body.push_back('\0'); break;
            case 'a': body.push_back('\a'); break;
            case 'b': body.push_back('\b'); break;
            case 'f': body.push_back('\f'); break;
            case 'v': body.push_back('\v'); break;
            case '\\': body.push_back('\\'); break;
            case '\'': body.push_back('\''); break;
            case '"': body.push_back('"'); break;
            case 'x':
            case 'u':
            case 'U': {
                const size_t digits = (e == 'x') ? 2 : (e == 'u' ? 4 : 8);
                unsigned long cp = 0;
                for (size_t i = 0; i < digits; ++i) {
                    const char h = peek();
                    if (!std::isxdigit(static_cast<unsigned char>(h))) fail("truncated \\" + std::string(1, e) + " escape");
                    cp = cp * 16 + static_cast<unsigned long>(std::isdigit(static_cast<unsigned char>(h))
                                                                  ? h - '0'
                                                                  : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
                    ++pos_;
                }
                appendUtf8(body, cp);
                break;
            }
            default:
                body.push_back('\\');
                if (e != '\0') body.push_back(e);
                break;
        }
    }
    Token tok;
    tok.kind = formatted ? TokenKind::FSTRING : TokenKind::STRING;
    tok.text = std::move(body);
    tok.line = startLine;
    tok.column = startColumn;
    tok.offset = start;
    tok.rawString = raw;
    tokens_.push_back(std::move(tok));
}

void ScriptLexer::readOperator() {
    const size_t start = pos_;
    const int startColumn = column();
    for (const char* op : kOperators) {
        const size_t len = std::strlen(op);
        if (src_.compare(pos_, len, op) == 0) {
            pos_ += len;
            if (len == 1) {
                const char c = op[0];
                if (c == '(' || c == '[' || c == '{') ++bracketDepth_;
                else if ((c == ')' || c == ']' || c == '}') && bracketDepth_ > 0) --bracketDepth_;
            }
            emit(TokenKind::OP, op, start, startColumn);
            return;
        }
    }
    fail(std::string("invalid character '") + peek() + "'");
}

} // namespace Tabula
