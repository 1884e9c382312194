#pragma once

#include "FrameOps.h"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace Tabula {

/**
 * @brief Syntax tree of the analysis-script language.
 * @details Every node kind is an alternative of Expr::Node or Stmt::Node, so
 * consumers visit a closed set with std::visit.
 */
namespace Ast {

struct Expr;
struct Stmt;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using Block = std::vector<StmtPtr>;

struct NoneLiteral {};
struct BoolLiteral {
    bool value = false;
};
struct IntLiteral {
    int64_t value = 0;
};
struct FloatLiteral {
    double value = 0.0;
};
struct StringLiteral {
    std::string value;
};

struct FStringPart {
    std::string literal;
    ExprPtr expr;
    std::string formatSpec;
    char conversion = 0;
};
struct FString {
    std::vector<FStringPart> parts;
};

struct Name {
    std::string id;
};
struct Attribute {
    ExprPtr value;
    std::string attr;
};
struct Subscript {
    ExprPtr value;
    ExprPtr index;
};
struct Slice {
    ExprPtr lower;
    ExprPtr upper;
    ExprPtr step;
};

struct Keyword {
    std::string name;
    ExprPtr value;
    int line = 0;
    int column = 0;
};
struct Call {
    ExprPtr func;
    std::vector<ExprPtr> args;
    std::vector<Keyword> keywords;
};

enum class UnaryOperator { NEG, POS, NOT, INVERT };
struct UnaryOp {
    UnaryOperator op = UnaryOperator::NEG;
    ExprPtr operand;
};
struct BinOp {
    ArithOp op = ArithOp::ADD;
    ExprPtr left;
    ExprPtr right;
};
struct BoolOp {
    bool isAnd = true;
    std::vector<ExprPtr> values;
};

enum class CompareOperator { EQ, NE, LT, LE, GT, GE, IN, NOT_IN, IS, IS_NOT };
struct Compare {
    ExprPtr left;
    std::vector<CompareOperator> ops;
    std::vector<ExprPtr> comparators;
};

struct IfExp {
    ExprPtr test;
    ExprPtr body;
    ExprPtr orelse;
};
struct Lambda {
    std::vector<std::string> params;
    ExprPtr body;
};

struct ListExpr {
    std::vector<ExprPtr> elts;
};
struct TupleExpr {
    std::vector<ExprPtr> elts;
};
struct SetExpr {
    std::vector<ExprPtr> elts;
};
struct DictExpr {
    std::vector<ExprPtr> keys;
    std::vector<ExprPtr> values;
};

struct Comprehension {
    ExprPtr target;
    ExprPtr iter;
    std::vector<ExprPtr> ifs;
};
enum class ComprehensionKind { LIST, SET, GENERATOR };
struct Comp {
    ComprehensionKind kind = ComprehensionKind::LIST;
    ExprPtr elt;
    std::vector<Comprehension> generators;
};
struct DictComp {
    ExprPtr key;
    ExprPtr value;
    std::vector<Comprehension> generators;
};

struct Expr {
    using Node = std::variant<NoneLiteral, BoolLiteral, IntLiteral, FloatLiteral, StringLiteral, FString, Name,
                              Attribute, Subscript, Slice, Call, UnaryOp, BinOp, BoolOp, Compare, IfExp, Lambda,
                              ListExpr, TupleExpr, SetExpr, DictExpr, Comp, DictComp>;
    Node node;
    int line = 0;
    int column = 0;
};

struct ExprStmt {
    ExprPtr value;
};
/// `a = b = value` keeps every target in source order.
struct Assign {
    std::vector<ExprPtr> targets;
    ExprPtr value;
};
struct AugAssign {
    ExprPtr target;
    ArithOp op = ArithOp::ADD;
    ExprPtr value;
};
struct If {
    ExprPtr test;
    Block body;
    Block orelse;
};
struct For {
    ExprPtr target;
    ExprPtr iter;
    Block body;
    Block orelse;
};
struct While {
    ExprPtr test;
    Block body;
    Block orelse;
};
struct Break {};
struct Continue {};
struct Pass {};

/// `import a.b as c` or `from a import b as c`; always rejected by validation.
struct Import {
    bool from = false;
    std::vector<std::string> modules;
    std::vector<std::string> names;
    std::vector<std::string> aliases;
};

struct Stmt {
    using Node = std::variant<ExprStmt, Assign, AugAssign, If, For, While, Break, Continue, Pass, Import>;
    Node node;
    int line = 0;
    int column = 0;
};

struct Module {
    Block body;
};

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

const char* compareOperatorSymbol(CompareOperator op) noexcept;

} // namespace Ast
} // namespace Tabula
