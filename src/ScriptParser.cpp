#include "ScriptParser.h"

#include "TabulaExceptions.h"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <initializer_list>
#include <optional>
#include <unordered_set>

namespace Tabula {

using namespace Ast;

struct DepthGuard {
    ScriptParser& parser;
    explicit DepthGuard(ScriptParser& p) : parser(p) {
        if (++parser.depth_ > ScriptParser::kMaxDepth) {
            --parser.depth_;
            parser.fail("too many nested expressions or blocks");
        }
    }
    ~DepthGuard() { --parser.depth_; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;
};

namespace {
template <typename T>
ExprPtr makeExpr(T node, int line, int column) {
    auto e = std::make_unique<Expr>();
    e->node = std::move(node);
    e->line = line;
    e->column = column;
    return e;
}

template <typename T>
ExprPtr makeExpr(T node, const Token& at) {
    return makeExpr(std::move(node), at.line, at.column);
}

template <typename T>
StmtPtr makeStmt(T node, const Token& at) {
    auto s = std::make_unique<Stmt>();
    s->node = std::move(node);
    s->line = at.line;
    s->column = at.column;
    return s;
}

const std::unordered_set<std::string>& unsupportedStatements() {
    static const std::unordered_set<std::string> words = {
        "def", "class", "with", "try", "except", "finally", "global", "nonlocal", "del", "return",
        "yield", "async", "await", "raise", "assert"
    };
    return words;
}

std::optional<ArithOp> augmentedOperator(const std::string& op) {
    if (op == "+=") return ArithOp::ADD;
    if (op == "-=") return ArithOp::SUB;
    if (op == "*=") return ArithOp::MUL;
    if (op == "/=") return ArithOp::DIV;
    if (op == "//=") return ArithOp::FLOOR_DIV;
    if (op == "%=") return ArithOp::MOD;
    if (op == "**=") return ArithOp::POW;
    if (op == "&=") return ArithOp::BIT_AND;
    if (op == "|=") return ArithOp::BIT_OR;
    if (op == "^=") return ArithOp::BIT_XOR;
    if (op == ">>=") return ArithOp::RSHIFT;
    if (op == "<<=") return ArithOp::LSHIFT;
    return std::nullopt;
}
} // namespace

const char* Ast::compareOperatorSymbol(CompareOperator op) noexcept {
    switch (op) {
        case CompareOperator::EQ: return "==";
        case CompareOperator::NE: return "!=";
        case CompareOperator::LT: return "<";
        case CompareOperator::LE: return "<=";
        case CompareOperator::GT: return ">";
        case CompareOperator::GE: return ">=";
        case CompareOperator::IN: return "in";
        case CompareOperator::NOT_IN: return "not in";
        case CompareOperator::IS: return "is";
        case CompareOperator::IS_NOT: return "is not";
    }
    return "?";
}

bool ScriptParser::isKeyword(const std::string& word) {
    static const std::unordered_set<std::string> keywords = {
        "False", "None", "True", "and", "as", "assert", "async", "await", "break", "class", "continue",
        "def", "del", "elif", "else", "except", "finally", "for", "from", "global", "if", "import",
        "in", "is", "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try", "while",
        "with", "yield"
    };
    return keywords.count(word) > 0;
}

ScriptParser::ScriptParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().kind != TokenKind::END) {
        Token end;
        end.kind = TokenKind::END;
        if (!tokens_.empty()) end.line = tokens_.back().line;
        tokens_.push_back(end);
    }
}

Module ScriptParser::parse(std::string_view source) {
    ScriptLexer lexer(source);
    ScriptParser parser(lexer.tokenize());
    return parser.parseModule();
}

const Token& ScriptParser::peekToken(size_t ahead) const noexcept {
    const size_t idx = std::min(pos_ + ahead, tokens_.size() - 1);
    return tokens_[idx];
}

const Token& ScriptParser::advance() {
    const Token& tok = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) ++pos_;
    return tok;
}

bool ScriptParser::atOp(const char* op) const noexcept {
    return cur().kind == TokenKind::OP && cur().text == op;
}

bool ScriptParser::atKeyword(const char* word) const noexcept {
    return cur().kind == TokenKind::NAME && cur().text == word;
}

bool ScriptParser::acceptOp(const char* op) {
    if (!atOp(op)) return false;
    advance();
    return true;
}

bool ScriptParser::acceptKeyword(const char* word) {
    if (!atKeyword(word)) return false;
    advance();
    return true;
}

void ScriptParser::expectOp(const char* op, const char* context) {
    if (!acceptOp(op)) fail(std::string("expected '") + op + "'" + (context[0] ? std::string(" ") + context : ""));
}

void ScriptParser::expectKeyword(const char* word) {
    if (!acceptKeyword(word)) fail(std::string("expected '") + word + "'");
}

std::string ScriptParser::expectName() {
    if (cur().kind != TokenKind::NAME || isKeyword(cur().text)) fail("expected a name");
    return advance().text;
}

void ScriptParser::fail(const std::string& message) const {
    failAt(message, cur());
}

void ScriptParser::failAt(const std::string& message, const Token& tok) const {
    throw ScriptSyntaxError(message, tok.line, tok.column);
}

Module ScriptParser::parseModule() {
    Module module;
    while (cur().kind != TokenKind::END) {
        if (cur().kind == TokenKind::NEWLINE) {
            advance();
            continue;
        }
        if (cur().kind == TokenKind::INDENT) fail("unexpected indent");
        if (cur().kind == TokenKind::DEDENT) {
            advance();
            continue;
        }
        parseStatement(module.body);
    }
    return module;
}

void ScriptParser::parseStatement(Block& out) {
    if (cur().kind == TokenKind::NAME) {
        const std::string& word = cur().text;
        if (word == "if") {
            out.push_back(parseIf());
            return;
        }
        if (word == "for") {
            out.push_back(parseFor());
            return;
        }
        if (word == "while") {
            out.push_back(parseWhile());
            return;
        }
        if (unsupportedStatements().count(word) > 0) fail("'" + word + "' statements are not supported");
        if (word == "elif" || word == "else") fail("invalid syntax");
    }
    parseSimpleStatements(out);
}

void ScriptParser::parseSimpleStatements(Block& out) {
    out.push_back(parseSmallStatement());
    while (acceptOp(";")) {
        if (cur().kind == TokenKind::NEWLINE || cur().kind == TokenKind::END) break;
        out.push_back(parseSmallStatement());
    }
    if (cur().kind == TokenKind::END) return;
    if (cur().kind != TokenKind::NEWLINE) fail("invalid syntax");
    advance();
}

StmtPtr ScriptParser::parseSmallStatement() {
    const Token start = cur();
    if (start.kind == TokenKind::NAME) {
        if (unsupportedStatements().count(start.text) > 0) fail("'" + start.text + "' statements are not supported");
        if (start.text == "pass") {
            advance();
            return makeStmt(Pass{}, start);
        }
        if (start.text == "break") {
            advance();
            return makeStmt(Break{}, start);
        }
        if (start.text == "continue") {
            advance();
            return makeStmt(Continue{}, start);
        }
        if (start.text == "import" || start.text == "from") return parseImport();
    }
    return parseExpressionStatement();
}

StmtPtr ScriptParser::parseImport() {
    const Token start = advance();
    Import node;
    node.from = start.text == "from";

    const auto dottedName = [&]() {
        std::string name;
        while (atOp(".")) {
            advance();
            name += '.';
        }
        if (cur().kind == TokenKind::NAME) {
            name += expectName();
            while (acceptOp(".")) name += "." + expectName();
        }
        if (name.empty()) fail("expected a module name");
        return name;
    };

    if (node.from) {
        node.modules.push_back(dottedName());
        expectKeyword("import");
        const bool paren = acceptOp("(");
        if (acceptOp("*")) {
            node.names.push_back("*");
            node.aliases.emplace_back();
        } else {
            do {
                if (paren && atOp(")")) break;
                node.names.push_back(expectName());
                node.aliases.push_back(acceptKeyword("as") ? expectName() : std::string());
            } while (acceptOp(","));
        }
        if (paren) expectOp(")", "to close the import list");
    } else {
        do {
            node.modules.push_back(dottedName());
            node.aliases.push_back(acceptKeyword("as") ? expectName() : std::string());
        } while (acceptOp(","));
    }
    return makeStmt(std::move(node), start);
}

StmtPtr ScriptParser::parseExpressionStatement() {
    const Token start = cur();
    ExprPtr first = parseTestList();

    if (cur().kind == TokenKind::OP) {
        if (auto op = augmentedOperator(cur().text)) {
            checkAssignable(*first, true);
            advance();
            AugAssign node;
            node.target = std::move(first);
            node.op = *op;
            node.value = parseTestList();
            return makeStmt(std::move(node), start);
        }
        if (atOp("=")) {
            Assign node;
            ExprPtr value = std::move(first);
            while (acceptOp("=")) {
                checkAssignable(*value, false);
                node.targets.push_back(std::move(value));
                value = parseTestList();
            }
            node.value = std::move(value);
            return makeStmt(std::move(node), start);
        }
        if (atOp(":")) fail("annotated assignments are not supported");
    }
    ExprStmt node;
    node.value = std::move(first);
    return makeStmt(std::move(node), start);
}

void ScriptParser::checkAssignable(const Expr& target, bool augmented) const {
    const bool ok = std::visit(Overloaded{
        [](const Name&) { return true; },
        [](const Attribute&) { return true; },
        [](const Subscript&) { return true; },
        [&](const TupleExpr& t) {
            if (augmented) return false;
            for (const auto& e : t.elts) checkAssignable(*e, false);
            return true;
        },
        [&](const ListExpr& l) {
            if (augmented) return false;
            for (const auto& e : l.elts) checkAssignable(*e, false);
            return true;
        },
        [](const auto&) { return false; }
    }, target.node);
    if (!ok) {
        throw ScriptSyntaxError(augmented ? "illegal expression for augmented assignment" : "cannot assign to expression",
                                target.line, target.column);
    }
}

Block ScriptParser::parseBlock() {
    DepthGuard guard(*this);
    expectOp(":", "");
    Block body;
    if (cur().kind != TokenKind::NEWLINE) {
        parseSimpleStatements(body);
        return body;
    }
    advance();
    while (cur().kind == TokenKind::NEWLINE) advance();
    if (cur().kind != TokenKind::INDENT) fail("expected an indented block");
    advance();
    while (cur().kind != TokenKind::DEDENT && cur().kind != TokenKind::END) {
        if (cur().kind == TokenKind::NEWLINE) {
            advance();
            continue;
        }
        if (cur().kind == TokenKind::INDENT) fail("unexpected indent");
        parseStatement(body);
    }
    if (cur().kind == TokenKind::DEDENT) advance();
    return body;
}

StmtPtr ScriptParser::parseIf() {
    const Token start = advance();
    If node;
    node.test = parseTest();
    node.body = parseBlock();
    if (atKeyword("elif")) {
        node.orelse.push_back(parseIf());
    } else if (acceptKeyword("else")) {
        node.orelse = parseBlock();
    }
    return makeStmt(std::move(node), start);
}

StmtPtr ScriptParser::parseFor() {
    const Token start = advance();
    For node;
    node.target = parseTargetList();
    checkAssignable(*node.target, false);
    expectKeyword("in");
    node.iter = parseTestList();
    node.body = parseBlock();
    if (acceptKeyword("else")) node.orelse = parseBlock();
    return makeStmt(std::move(node), start);
}

StmtPtr ScriptParser::parseWhile() {
    const Token start = advance();
    While node;
    node.test = parseTest();
    node.body = parseBlock();
    if (acceptKeyword("else")) node.orelse = parseBlock();
    return makeStmt(std::move(node), start);
}

ExprPtr ScriptParser::parseTestList() {
    const Token start = cur();
    ExprPtr first = parseTest();
    if (!atOp(",")) return first;
    TupleExpr tuple;
    tuple.elts.push_back(std::move(first));
    while (acceptOp(",")) {
        if (cur().kind == TokenKind::NEWLINE || cur().kind == TokenKind::END || atOp("=") || atOp(")") ||
            atOp(";") || atOp(":") || (cur().kind == TokenKind::OP && augmentedOperator(cur().text))) {
            break;
        }
        tuple.elts.push_back(parseTest());
    }
    return makeExpr(std::move(tuple), start);
}

ExprPtr ScriptParser::parseTargetList() {
    const Token start = cur();
    ExprPtr first = parseBitOr();
    if (!atOp(",")) return first;
    TupleExpr tuple;
    tuple.elts.push_back(std::move(first));
    while (acceptOp(",")) {
        if (atKeyword("in")) break;
        tuple.elts.push_back(parseBitOr());
    }
    return makeExpr(std::move(tuple), start);
}

ExprPtr ScriptParser::parseTest() {
    DepthGuard guard(*this);
    if (atKeyword("lambda")) return parseLambda();
    const Token start = cur();
    ExprPtr body = parseOrTest();
    if (!atKeyword("if")) return body;
    advance();
    IfExp node;
    node.body = std::move(body);
    node.test = parseOrTest();
    expectKeyword("else");
    node.orelse = parseTest();
    return makeExpr(std::move(node), start);
}

ExprPtr ScriptParser::parseLambda() {
    const Token start = advance();
    Lambda node;
    while (!atOp(":")) {
        if (acceptOp("*") || acceptOp("**")) {
            node.params.push_back(expectName());
        } else {
            node.params.push_back(expectName());
            if (acceptOp("=")) parseTest();
        }
        if (!acceptOp(",")) break;
    }
    expectOp(":", "after lambda parameters");
    node.body = parseTest();
    return makeExpr(std::move(node), start);
}

ExprPtr ScriptParser::parseOrTest() {
    const Token start = cur();
    ExprPtr first = parseAndTest();
    if (!atKeyword("or")) return first;
    BoolOp node;
    node.isAnd = false;
    node.values.push_back(std::move(first));
    while (acceptKeyword("or")) node.values.push_back(parseAndTest());
    return makeExpr(std::move(node), start);
}

ExprPtr ScriptParser::parseAndTest() {
    const Token start = cur();
    ExprPtr first = parseNotTest();
    if (!atKeyword("and")) return first;
    BoolOp node;
    node.isAnd = true;
    node.values.push_back(std::move(first));
    while (acceptKeyword("and")) node.values.push_back(parseNotTest());
    return makeExpr(std::move(node), start);
}

ExprPtr ScriptParser::parseNotTest() {
    if (atKeyword("not")) {
        DepthGuard guard(*this);
        const Token start = advance();
        UnaryOp node;
        node.op = UnaryOperator::NOT;
        node.operand = parseNotTest();
        return makeExpr(std::move(node), start);
    }
    return parseComparison();
}

ExprPtr ScriptParser::parseComparison() {
    const Token start = cur();
    ExprPtr left = parseBitOr();
    Compare node;
    while (true) {
        std::optional<CompareOperator> op;
        if (cur().kind == TokenKind::OP) {
            const std::string& t = cur().text;
            if (t == "==") op = CompareOperator::EQ;
            else if (t == "!=") op = CompareOperator::NE;
            else if (t == "<") op = CompareOperator::LT;
            else if (t == "<=") op = CompareOperator::LE;
            else if (t == ">") op = CompareOperator::GT;
            else if (t == ">=") op = CompareOperator::GE;
            if (op) advance();
        } else if (atKeyword("in")) {
            advance();
            op = CompareOperator::IN;
        } else if (atKeyword("not") && peekToken(1).kind == TokenKind::NAME && peekToken(1).text == "in") {
            advance();
            advance();
            op = CompareOperator::NOT_IN;
        } else if (atKeyword("is")) {
            advance();
            op = acceptKeyword("not") ? CompareOperator::IS_NOT : CompareOperator::IS;
        }
        if (!op) break;
        node.ops.push_back(*op);
        node.comparators.push_back(parseBitOr());
    }
    if (node.ops.empty()) return left;
    node.left = std::move(left);
    return makeExpr(std::move(node), start);
}

ExprPtr ScriptParser::parseBinary(ExprPtr (ScriptParser::*next)(),
                                  std::initializer_list<std::pair<const char*, ArithOp>> ops) {
    const Token start = cur();
    ExprPtr left = (this->*next)();
    while (cur().kind == TokenKind::OP) {
        const ArithOp* matched = nullptr;
        for (const auto& entry : ops) {
            if (cur().text == entry.first) {
                matched = &entry.second;
                break;
            }
        }
        if (matched == nullptr) break;
        advance();
        BinOp node;
        node.op = *matched;
        node.left = std::move(left);
        node.right = (this->*next)();
        left = makeExpr(std::move(node), start);
    }
    return left;
}

ExprPtr ScriptParser::parseBitOr() {
    return parseBinary(&ScriptParser::parseBitXor, {{"|", ArithOp::BIT_OR}});
}

ExprPtr ScriptParser::parseBitXor() {
    return parseBinary(&ScriptParser::parseBitAnd, {{"^", ArithOp::BIT_XOR}});
}

ExprPtr ScriptParser::parseBitAnd() {
    return parseBinary(&ScriptParser::parseShift, {{"&", ArithOp::BIT_AND}});
}

ExprPtr ScriptParser::parseShift() {
    return parseBinary(&ScriptParser::parseArith, {{"<<", ArithOp::LSHIFT}, {">>", ArithOp::RSHIFT}});
}

ExprPtr ScriptParser::parseArith() {
    return parseBinary(&ScriptParser::parseTerm, {{"+", ArithOp::ADD}, {"-", ArithOp::SUB}});
}

ExprPtr ScriptParser::parseTerm() {
    ExprPtr left = parseBinary(&ScriptParser::parseFactor, {{"*", ArithOp::MUL},
                                                            {"/", ArithOp::DIV},
                                                            {"//", ArithOp::FLOOR_DIV},
                                                            {"%", ArithOp::MOD}});
    if (atOp("@")) fail("matrix multiplication is not supported");
    return left;
}

ExprPtr ScriptParser::parseFactor() {
    DepthGuard guard(*this);
    if (atOp("-") || atOp("+") || atOp("~")) {
        const Token start = advance();
        UnaryOp node;
        node.op = start.text == "-" ? UnaryOperator::NEG : (start.text == "+" ? UnaryOperator::POS : UnaryOperator::INVERT);
        node.operand = parseFactor();
        return makeExpr(std::move(node), start);
    }
    return parsePower();
}

ExprPtr ScriptParser::parsePower() {
    const Token start = cur();
    ExprPtr base = parsePrimary();
    if (!acceptOp("**")) return base;
    BinOp node;
    node.op = ArithOp::POW;
    node.left = std::move(base);
    node.right = parseFactor();
    return makeExpr(std::move(node), start);
}

ExprPtr ScriptParser::parsePrimary() {
    ExprPtr value = parseAtom();
    while (true) {
        if (atOp("(")) {
            const Token open = advance();
            value = parseCall(std::move(value), open);
        } else if (atOp("[")) {
            const Token open = advance();
            value = parseSubscript(std::move(value), open);
        } else if (atOp(".")) {
            const Token dot = advance();
            if (cur().kind != TokenKind::NAME) fail("expected an attribute name");
            Attribute node;
            node.attr = advance().text;
            node.value = std::move(value);
            value = makeExpr(std::move(node), dot);
        } else {
            return value;
        }
    }
}

ExprPtr ScriptParser::parseCall(ExprPtr func, const Token& open) {
    DepthGuard guard(*this);
    Call node;
    node.func = std::move(func);
    while (!atOp(")")) {
        if (atOp("*") || atOp("**")) fail("argument unpacking is not supported");
        if (cur().kind == TokenKind::NAME && !isKeyword(cur().text) && peekToken(1).kind == TokenKind::OP &&
            peekToken(1).text == "=") {
            Keyword kw;
            kw.line = cur().line;
            kw.column = cur().column;
            kw.name = advance().text;
            advance();
            kw.value = parseTest();
            for (const auto& existing : node.keywords) {
                if (existing.name == kw.name) failAt("keyword argument repeated: " + kw.name, open);
            }
            node.keywords.push_back(std::move(kw));
        } else {
            if (!node.keywords.empty()) fail("positional argument follows keyword argument");
            const Token argStart = cur();
            ExprPtr arg = parseTest();
            if (atKeyword("for")) {
                Comp gen;
                gen.kind = ComprehensionKind::GENERATOR;
                gen.elt = std::move(arg);
                gen.generators = parseComprehensionClauses();
                arg = makeExpr(std::move(gen), argStart);
            }
            node.args.push_back(std::move(arg));
        }
        if (!acceptOp(",")) break;
    }
    expectOp(")", "to close the call");
    const int line = node.func->line;
    const int column = node.func->column;
    return makeExpr(std::move(node), line, column);
}

ExprPtr ScriptParser::parseSubscript(ExprPtr value, const Token& open) {
    DepthGuard guard(*this);
    const Token start = cur();
    ExprPtr index = parseSliceItem();
    if (atOp(",")) {
        TupleExpr tuple;
        tuple.elts.push_back(std::move(index));
        while (acceptOp(",")) {
            if (atOp("]")) break;
            tuple.elts.push_back(parseSliceItem());
        }
        index = makeExpr(std::move(tuple), start);
    }
    expectOp("]", "to close the subscript");
    Subscript node;
    node.value = std::move(value);
    node.index = std::move(index);
    return makeExpr(std::move(node), open);
}

ExprPtr ScriptParser::parseSliceItem() {
    const Token start = cur();
    ExprPtr lower;
    if (!atOp(":")) {
        lower = parseTest();
        if (!atOp(":")) return lower;
    }
    advance();
    Slice node;
    node.lower = std::move(lower);
    if (!atOp("]") && !atOp(",") && !atOp(":")) node.upper = parseTest();
    if (acceptOp(":")) {
        if (!atOp("]") && !atOp(",")) node.step = parseTest();
    }
    return makeExpr(std::move(node), start);
}

std::vector<Comprehension> ScriptParser::parseComprehensionClauses() {
    std::vector<Comprehension> clauses;
    while (atKeyword("for")) {
        advance();
        Comprehension clause;
        clause.target = parseTargetList();
        checkAssignable(*clause.target, false);
        expectKeyword("in");
        clause.iter = parseOrTest();
        while (atKeyword("if")) {
            advance();
            clause.ifs.push_back(parseOrTest());
        }
        clauses.push_back(std::move(clause));
    }
    return clauses;
}

ExprPtr ScriptParser::parseAtom() {
    const Token& tok = cur();
    switch (tok.kind) {
        case TokenKind::NUMBER: {
            const Token t = advance();
            return parseNumber(t);
        }
        case TokenKind::STRING:
        case TokenKind::FSTRING:
            return parseStrings();
        case TokenKind::NAME: {
            const Token t = advance();
            if (t.text == "None") return makeExpr(NoneLiteral{}, t);
            if (t.text == "True") return makeExpr(BoolLiteral{true}, t);
            if (t.text == "False") return makeExpr(BoolLiteral{false}, t);
            if (isKeyword(t.text)) failAt("invalid syntax", t);
            return makeExpr(Name{t.text}, t);
        }
        case TokenKind::OP: {
            if (tok.text == "(") {
                const Token open = advance();
                return parseParenthesized(open);
            }
            if (tok.text == "[") {
                const Token open = advance();
                return parseListDisplay(open);
            }
            if (tok.text == "{") {
                const Token open = advance();
                return parseBraceDisplay(open);
            }
            if (tok.text == "@") fail("decorators are not supported");
            if (tok.text == "...") fail("Ellipsis is not supported");
            fail("invalid syntax");
        }
        case TokenKind::INDENT:
            fail("unexpected indent");
        case TokenKind::NEWLINE:
        case TokenKind::END:
        case TokenKind::DEDENT:
            fail("unexpected end of statement");
    }
    fail("invalid syntax");
}

ExprPtr ScriptParser::parseParenthesized(const Token& open) {
    DepthGuard guard(*this);
    if (acceptOp(")")) return makeExpr(TupleExpr{}, open);
    ExprPtr first = parseTest();
    if (atKeyword("for")) {
        Comp gen;
        gen.kind = ComprehensionKind::GENERATOR;
        gen.elt = std::move(first);
        gen.generators = parseComprehensionClauses();
        expectOp(")", "to close the generator expression");
        return makeExpr(std::move(gen), open);
    }
    if (acceptOp(")")) return first;
    TupleExpr tuple;
    tuple.elts.push_back(std::move(first));
    while (acceptOp(",")) {
        if (atOp(")")) break;
        tuple.elts.push_back(parseTest());
    }
    expectOp(")", "to close the parenthesis");
    return makeExpr(std::move(tuple), open);
}

ExprPtr ScriptParser::parseListDisplay(const Token& open) {
    DepthGuard guard(*this);
    ListExpr list;
    if (acceptOp("]")) return makeExpr(std::move(list), open);
    ExprPtr first = parseTest();
    if (atKeyword("for")) {
        Comp comp;
        comp.kind = ComprehensionKind::LIST;
        comp.elt = std::move(first);
        comp.generators = parseComprehensionClauses();
        expectOp("]", "to close the list comprehension");
        return makeExpr(std::move(comp), open);
    }
    list.elts.push_back(std::move(first));
    while (acceptOp(",")) {
        if (atOp("]")) break;
        list.elts.push_back(parseTest());
    }
    expectOp("]", "to close the list");
    return makeExpr(std::move(list), open);
}

ExprPtr ScriptParser::parseBraceDisplay(const Token& open) {
    DepthGuard guard(*this);
    if (acceptOp("}")) return makeExpr(DictExpr{}, open);
    if (atOp("**")) fail("dictionary unpacking is not supported");

    ExprPtr first = parseTest();
    if (acceptOp(":")) {
        ExprPtr firstValue = parseTest();
        if (atKeyword("for")) {
            DictComp comp;
            comp.key = std::move(first);
            comp.value = std::move(firstValue);
            comp.generators = parseComprehensionClauses();
            expectOp("}", "to close the dict comprehension");
            return makeExpr(std::move(comp), open);
        }
        DictExpr dict;
        dict.keys.push_back(std::move(first));
        dict.values.push_back(std::move(firstValue));
        while (acceptOp(",")) {
            if (atOp("}")) break;
            dict.keys.push_back(parseTest());
            expectOp(":", "in dict literal");
            dict.values.push_back(parseTest());
        }
        expectOp("}", "to close the dict");
        return makeExpr(std::move(dict), open);
    }

    if (atKeyword("for")) {
        Comp comp;
        comp.kind = ComprehensionKind::SET;
        comp.elt = std::move(first);
        comp.generators = parseComprehensionClauses();
        expectOp("}", "to close the set comprehension");
        return makeExpr(std::move(comp), open);
    }
    SetExpr set;
    set.elts.push_back(std::move(first));
    while (acceptOp(",")) {
        if (atOp("}")) break;
        set.elts.push_back(parseTest());
    }
    expectOp("}", "to close the set");
    return makeExpr(std::move(set), open);
}

ExprPtr ScriptParser::parseNumber(const Token& tok) {
    const std::string& text = tok.text;
    const bool isFloat = text.find_first_of(".eE") != std::string::npos &&
                         !(text.size() > 1 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'));
    if (!isFloat) {
        int base = 10;
        size_t skip = 0;
        if (text.size() > 1 && text[0] == '0') {
            const char p = text[1];
            if (p == 'x' || p == 'X') base = 16;
            else if (p == 'o' || p == 'O') base = 8;
            else if (p == 'b' || p == 'B') base = 2;
            if (base != 10) skip = 2;
        }
        if (base == 10 && text.size() > 1 && text[0] == '0' && text.find_first_not_of('0') != std::string::npos) {
            failAt("leading zeros in decimal integer literals are not permitted", tok);
        }
        int64_t value = 0;
        auto res = std::from_chars(text.data() + skip, text.data() + text.size(), value, base);
        if (res.ec == std::errc{} && res.ptr == text.data() + text.size()) return makeExpr(IntLiteral{value}, tok);
        if (res.ec != std::errc::result_out_of_range || base != 10) failAt("invalid number literal", tok);
        // Beyond int64: keep the magnitude as a float.
    }
    std::string digits = text;
    if (!digits.empty() && digits.back() == '.') digits.push_back('0');
    if (!digits.empty() && digits.front() == '.') digits.insert(digits.begin(), '0');
    double value = 0.0;
    auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (res.ptr != digits.data() + digits.size()) failAt("invalid number literal", tok);
    return makeExpr(FloatLiteral{value}, tok);
}

ExprPtr ScriptParser::parseStrings() {
    const Token start = cur();
    bool formatted = false;
    std::vector<FStringPart> parts;
    std::string plain;
    while (cur().kind == TokenKind::STRING || cur().kind == TokenKind::FSTRING) {
        const Token tok = advance();
        if (tok.kind == TokenKind::FSTRING) {
            formatted = true;
            parseFStringBody(tok, parts);
        } else {
            FStringPart part;
            part.literal = tok.text;
            parts.push_back(std::move(part));
            plain += tok.text;
        }
    }
    if (!formatted) return makeExpr(StringLiteral{plain}, start);
    FString node;
    node.parts = std::move(parts);
    return makeExpr(std::move(node), start);
}

void ScriptParser::parseFStringBody(const Token& tok, std::vector<FStringPart>& parts) {
    const std::string& body = tok.text;
    std::string literal;
    size_t i = 0;
    const auto flushLiteral = [&]() {
        if (literal.empty()) return;
        FStringPart part;
        part.literal = std::move(literal);
        parts.push_back(std::move(part));
        literal.clear();
    };

    while (i < body.size()) {
        const char c = body[i];
        if (c == '{' && i + 1 < body.size() && body[i + 1] == '{') {
            literal.push_back('{');
            i += 2;
            continue;
        }
        if (c == '}' && i + 1 < body.size() && body[i + 1] == '}') {
            literal.push_back('}');
            i += 2;
            continue;
        }
        if (c == '}') failAt("f-string: single '}' is not allowed", tok);
        if (c != '{') {
            literal.push_back(c);
            ++i;
            continue;
        }

        // Find the end of the replacement field, honouring nested brackets and quotes.
        size_t j = i + 1;
        int nesting = 0;
        char quote = 0;
        size_t exprEnd = std::string::npos;
        size_t specStart = std::string::npos;
        size_t bangPos = std::string::npos;
        for (; j < body.size(); ++j) {
            const char d = body[j];
            if (quote != 0) {
                if (d == quote) quote = 0;
                continue;
            }
            if (d == '\'' || d == '"') {
                quote = d;
            } else if (d == '(' || d == '[' || d == '{') {
                ++nesting;
            } else if ((d == ')' || d == ']') && nesting > 0) {
                --nesting;
            } else if (d == '}') {
                if (nesting == 0) break;
                --nesting;
            } else if (nesting == 0 && d == '!' && j + 1 < body.size() && body[j + 1] != '=' &&
                       bangPos == std::string::npos && specStart == std::string::npos) {
                bangPos = j;
            } else if (nesting == 0 && d == ':' && specStart == std::string::npos) {
                specStart = j;
            }
        }
        if (j >= body.size()) failAt("f-string: expecting '}'", tok);

        exprEnd = std::min({bangPos, specStart, j});
        std::string exprText = body.substr(i + 1, exprEnd - i - 1);

        FStringPart part;
        if (bangPos != std::string::npos) {
            const size_t convEnd = std::min(specStart, j);
            const std::string conv = body.substr(bangPos + 1, convEnd - bangPos - 1);
            if (conv != "r" && conv != "s" && conv != "a") failAt("f-string: invalid conversion character", tok);
            part.conversion = conv[0];
        }
        if (specStart != std::string::npos) part.formatSpec = body.substr(specStart + 1, j - specStart - 1);

        // `{expr=}` echoes the expression text before its value.
        std::string trimmed = exprText;
        while (!trimmed.empty() && (trimmed.back() == ' ')) trimmed.pop_back();
        if (!trimmed.empty() && trimmed.back() == '=' &&
            (trimmed.size() < 2 || std::strchr("=!<>", trimmed[trimmed.size() - 2]) == nullptr)) {
            literal += exprText;
            trimmed.pop_back();
            exprText = trimmed;
            if (part.conversion == 0 && part.formatSpec.empty()) part.conversion = 'r';
        }
        flushLiteral();

        if (exprText.find_first_not_of(" \t") == std::string::npos) failAt("f-string: empty expression not allowed", tok);
        try {
            ScriptLexer lexer(exprText);
            ScriptParser inner(lexer.tokenize());
            inner.depth_ = depth_;
            while (inner.cur().kind == TokenKind::INDENT) inner.advance();
            part.expr = inner.parseTestList();
            if (inner.cur().kind != TokenKind::NEWLINE && inner.cur().kind != TokenKind::END) {
                inner.fail("f-string: invalid syntax");
            }
        } catch (const ScriptSyntaxError& e) {
            throw ScriptSyntaxError(e.message(), tok.line, tok.column);
        }
        parts.push_back(std::move(part));
        i = j + 1;
    }
    flushLiteral();
}

} // namespace Tabula
