#include "FrameOps.h"

#include "CommonUtils.h"
#include "StatsUtils.h"
#include "TabulaExceptions.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>
#include <map>
#include <numeric>
#include <unordered_map>

namespace Tabula {

const char* arithSymbol(ArithOp op) noexcept {
    switch (op) {
        case ArithOp::ADD: return "+";
        case ArithOp::SUB: return "-";
        case ArithOp::MUL: return "*";
        case ArithOp::DIV: return "/";
        case ArithOp::FLOOR_DIV: return "//";
        case ArithOp::MOD: return "%";
        case ArithOp::POW: return "**";
        case ArithOp::BIT_AND: return "&";
        case ArithOp::BIT_OR: return "|";
        case ArithOp::BIT_XOR: return "^";
        case ArithOp::LSHIFT: return "<<";
        case ArithOp::RSHIFT: return ">>";
    }
    return "?";
}

const char* compareSymbol(CompareOp op) noexcept {
    switch (op) {
        case CompareOp::EQ: return "==";
        case CompareOp::NE: return "!=";
        case CompareOp::LT: return "<";
        case CompareOp::LE: return "<=";
        case CompareOp::GT: return ">";
        case CompareOp::GE: return ">=";
    }
    return "?";
}

namespace FrameOps {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

const char* scalarTypeName(const Scalar& s) {
    if (std::holds_alternative<std::monostate>(s)) return "NoneType";
    if (std::holds_alternative<bool>(s)) return "bool";
    if (std::holds_alternative<int64_t>(s)) return "int";
    if (std::holds_alternative<double>(s)) return "float";
    if (std::holds_alternative<std::string>(s)) return "str";
    return "Timestamp";
}

[[noreturn]] void unsupportedOperands(const char* symbol, const Scalar& a, const Scalar& b) {
    throw ScriptError("TypeError", std::string("unsupported operand type(s) for ") + symbol + ": '" +
                                       scalarTypeName(a) + "' and '" + scalarTypeName(b) + "'");
}

bool isIntegral(const Scalar& s) {
    return std::holds_alternative<int64_t>(s) || std::holds_alternative<bool>(s);
}

int64_t integralOf(const Scalar& s) {
    if (const auto* b = std::get_if<bool>(&s)) return *b ? 1 : 0;
    return std::get<int64_t>(s);
}

double pythonMod(double x, double y) {
    double r = std::fmod(x, y);
    if (r != 0.0 && ((r < 0.0) != (y < 0.0))) r += y;
    return r;
}

double applyDouble(ArithOp op, double x, double y) {
    switch (op) {
        case ArithOp::ADD: return x + y;
        case ArithOp::SUB: return x - y;
        case ArithOp::MUL: return x * y;
        case ArithOp::DIV: return x / y;
        case ArithOp::FLOOR_DIV: return std::floor(x / y);
        case ArithOp::MOD: return (y == 0.0) ? kNaN : pythonMod(x, y);
        case ArithOp::POW: return std::pow(x, y);
        default: return kNaN;
    }
}

std::optional<int64_t> applyInt(ArithOp op, int64_t x, int64_t y) {
    int64_t out = 0;
    switch (op) {
        case ArithOp::ADD:
            if (__builtin_add_overflow(x, y, &out)) return std::nullopt;
            return out;
        case ArithOp::SUB:
            if (__builtin_sub_overflow(x, y, &out)) return std::nullopt;
            return out;
        case ArithOp::MUL:
            if (__builtin_mul_overflow(x, y, &out)) return std::nullopt;
            return out;
        case ArithOp::FLOOR_DIV: {
            if (y == 0 || (x == std::numeric_limits<int64_t>::min() && y == -1)) return std::nullopt;
            int64_t q = x / y;
            if ((x % y != 0) && ((x < 0) != (y < 0))) --q;
            return q;
        }
        case ArithOp::MOD: {
            if (y == 0) return std::nullopt;
            int64_t r = x % y;
            if (r != 0 && ((r < 0) != (y < 0))) r += y;
            return r;
        }
        case ArithOp::POW: {
            if (y < 0) return std::nullopt;
            int64_t result = 1;
            int64_t base = x;
            int64_t e = y;
            while (e > 0) {
                if (e & 1) {
                    if (__builtin_mul_overflow(result, base, &result)) return std::nullopt;
                }
                e >>= 1;
                if (e > 0 && __builtin_mul_overflow(base, base, &base)) return std::nullopt;
            }
            return result;
        }
        case ArithOp::BIT_AND: return x & y;
        case ArithOp::BIT_OR: return x | y;
        case ArithOp::BIT_XOR: return x ^ y;
        case ArithOp::LSHIFT:
            if (y < 0 || y >= 63) return std::nullopt;
            if (__builtin_mul_overflow(x, static_cast<int64_t>(1) << y, &out)) return std::nullopt;
            return out;
        case ArithOp::RSHIFT:
            if (y < 0) return std::nullopt;
            return (y >= 63) ? (x < 0 ? -1 : 0) : (x >> y);
        default:
            return std::nullopt;
    }
}

bool isBitwise(ArithOp op) {
    return op == ArithOp::BIT_AND || op == ArithOp::BIT_OR || op == ArithOp::BIT_XOR ||
           op == ArithOp::LSHIFT || op == ArithOp::RSHIFT;
}

bool orderResult(CompareOp op, int cmp) {
    switch (op) {
        case CompareOp::EQ: return cmp == 0;
        case CompareOp::NE: return cmp != 0;
        case CompareOp::LT: return cmp < 0;
        case CompareOp::LE: return cmp <= 0;
        case CompareOp::GT: return cmp > 0;
        case CompareOp::GE: return cmp >= 0;
    }
    return false;
}

// Same elementwise arithmetic as `arith`, but with IEEE division semantics.
Scalar vectorArith(ArithOp op, const Scalar& a, const Scalar& b) {
    if (scalarIsMissing(a) || scalarIsMissing(b)) return std::monostate{};
    const bool numericPair = scalarToNumber(a).has_value() && scalarToNumber(b).has_value();
    if (numericPair && (op == ArithOp::DIV || op == ArithOp::FLOOR_DIV || op == ArithOp::MOD) &&
        *scalarToNumber(b) == 0.0) {
        return applyDouble(op, *scalarToNumber(a), *scalarToNumber(b));
    }
    return arith(op, a, b);
}

// Returns nullopt when a missing cell makes the comparison false (or true for !=).
std::optional<int> vectorCompare(const Scalar& a, const Scalar& b) {
    if (scalarIsMissing(a) || scalarIsMissing(b)) return std::nullopt;
    if (auto x = scalarToNumber(a)) {
        if (auto y = scalarToNumber(b)) return (*x < *y) ? -1 : (*x > *y ? 1 : 0);
    }
    if (std::holds_alternative<std::string>(a) && std::holds_alternative<std::string>(b)) {
        return std::get<std::string>(a).compare(std::get<std::string>(b)) < 0 ? -1
               : (std::get<std::string>(a) == std::get<std::string>(b) ? 0 : 1);
    }
    if (std::holds_alternative<Timestamp>(a) && std::holds_alternative<Timestamp>(b)) {
        const int64_t x = std::get<Timestamp>(a).seconds;
        const int64_t y = std::get<Timestamp>(b).seconds;
        return (x < y) ? -1 : (x > y ? 1 : 0);
    }
    return std::optional<int>(2);
}

std::string keyText(const Scalar& s) {
    if (std::holds_alternative<std::monostate>(s)) return std::string("\x01");
    if (const auto* str = std::get_if<std::string>(&s)) return "s" + *str;
    if (const auto* t = std::get_if<Timestamp>(&s)) return "t" + std::to_string(t->seconds);
    if (auto num = scalarToNumber(s)) {
        if (std::isnan(*num)) return std::string("\x01");
        char buf[64];
        const int len = std::snprintf(buf, sizeof(buf), "n%.17g", *num);
        return std::string(buf, static_cast<size_t>(std::max(0, len)));
    }
    return std::string();
}

std::string rowKey(const std::vector<const Column*>& cols, size_t row) {
    std::string key;
    for (const Column* c : cols) {
        key += keyText(c->at(row));
        key.push_back('\x1f');
    }
    return key;
}

struct KeyLess {
    bool operator()(const std::vector<Scalar>& a, const std::vector<Scalar>& b) const {
        for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
            if (scalarLess(a[i], b[i])) return true;
            if (scalarLess(b[i], a[i])) return false;
        }
        return a.size() < b.size();
    }
};

std::string labelText(const Scalar& s) {
    if (const auto* str = std::get_if<std::string>(&s)) return *str;
    Column tmp = Column::fromScalars("", {s});
    tmp.convertTo(ColumnType::CATEGORICAL);
    return tmp.isMissing(0) ? std::string("NaN") : std::get<std::vector<std::string>>(tmp.values)[0];
}
} // namespace

Scalar arith(ArithOp op, const Scalar& a, const Scalar& b) {
    const char* sym = arithSymbol(op);
    if (std::holds_alternative<std::monostate>(a) || std::holds_alternative<std::monostate>(b)) {
        unsupportedOperands(sym, a, b);
    }

    if (std::holds_alternative<std::string>(a) || std::holds_alternative<std::string>(b)) {
        if (op == ArithOp::ADD && std::holds_alternative<std::string>(a) && std::holds_alternative<std::string>(b)) {
            return std::get<std::string>(a) + std::get<std::string>(b);
        }
        if (op == ArithOp::MUL) {
            const Scalar& text = std::holds_alternative<std::string>(a) ? a : b;
            const Scalar& count = std::holds_alternative<std::string>(a) ? b : a;
            if (isIntegral(count)) {
                const int64_t n = integralOf(count);
                std::string out;
                if (n > 0) {
                    const std::string& piece = std::get<std::string>(text);
                    out.reserve(piece.size() * static_cast<size_t>(n));
                    for (int64_t i = 0; i < n; ++i) out += piece;
                }
                return out;
            }
        }
        unsupportedOperands(sym, a, b);
    }

    if (std::holds_alternative<Timestamp>(a) || std::holds_alternative<Timestamp>(b)) {
        unsupportedOperands(sym, a, b);
    }

    if (isBitwise(op)) {
        if (std::holds_alternative<bool>(a) && std::holds_alternative<bool>(b) &&
            (op == ArithOp::BIT_AND || op == ArithOp::BIT_OR || op == ArithOp::BIT_XOR)) {
            const bool x = std::get<bool>(a);
            const bool y = std::get<bool>(b);
            if (op == ArithOp::BIT_AND) return x && y;
            if (op == ArithOp::BIT_OR) return x || y;
            return x != y;
        }
        if (!isIntegral(a) || !isIntegral(b)) unsupportedOperands(sym, a, b);
        if ((op == ArithOp::LSHIFT || op == ArithOp::RSHIFT) && integralOf(b) < 0) {
            throw ScriptError("ValueError", "negative shift count");
        }
        if (auto r = applyInt(op, integralOf(a), integralOf(b))) return *r;
        throw ScriptError("OverflowError", "integer result out of range");
    }

    if (isIntegral(a) && isIntegral(b)) {
        const int64_t x = integralOf(a);
        const int64_t y = integralOf(b);
        if ((op == ArithOp::FLOOR_DIV || op == ArithOp::MOD) && y == 0) {
            throw ScriptError("ZeroDivisionError", "integer division or modulo by zero");
        }
        if (op == ArithOp::DIV) {
            if (y == 0) throw ScriptError("ZeroDivisionError", "division by zero");
            return static_cast<double>(x) / static_cast<double>(y);
        }
        if (op == ArithOp::POW && y < 0) {
            if (x == 0) throw ScriptError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
            return std::pow(static_cast<double>(x), static_cast<double>(y));
        }
        if (auto r = applyInt(op, x, y)) return *r;
        // Out of int64 range: continue in floating point.
        return applyDouble(op, static_cast<double>(x), static_cast<double>(y));
    }

    const double x = *scalarToNumber(a);
    const double y = *scalarToNumber(b);
    if ((op == ArithOp::DIV || op == ArithOp::FLOOR_DIV || op == ArithOp::MOD) && y == 0.0) {
        throw ScriptError("ZeroDivisionError", "float division by zero");
    }
    if (op == ArithOp::POW && x == 0.0 && y < 0.0) {
        throw ScriptError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
    }
    return applyDouble(op, x, y);
}

bool compare(CompareOp op, const Scalar& a, const Scalar& b) {
    if (op == CompareOp::EQ) return scalarsEqual(a, b) && !scalarIsMissing(a);
    if (op == CompareOp::NE) return !(scalarsEqual(a, b) && !scalarIsMissing(a));
    if (auto x = scalarToNumber(a)) {
        if (auto y = scalarToNumber(b)) return orderResult(op, (*x < *y) ? -1 : (*x > *y ? 1 : 0)) && !std::isnan(*x) && !std::isnan(*y);
    }
    if (std::holds_alternative<std::string>(a) && std::holds_alternative<std::string>(b)) {
        const int c = std::get<std::string>(a).compare(std::get<std::string>(b));
        return orderResult(op, c < 0 ? -1 : (c > 0 ? 1 : 0));
    }
    if (std::holds_alternative<Timestamp>(a) && std::holds_alternative<Timestamp>(b)) {
        const int64_t x = std::get<Timestamp>(a).seconds;
        const int64_t y = std::get<Timestamp>(b).seconds;
        return orderResult(op, (x < y) ? -1 : (x > y ? 1 : 0));
    }
    throw ScriptError("TypeError", std::string("'") + compareSymbol(op) + "' not supported between instances of '" +
                                       scalarTypeName(a) + "' and '" + scalarTypeName(b) + "'");
}

Column arithColumns(ArithOp op, const Column& a, const Column& b) {
    if (a.size() != b.size()) {
        throw ScriptError("ValueError", "operands could not be broadcast together with lengths " +
                                            std::to_string(a.size()) + " and " + std::to_string(b.size()));
    }
    const size_t n = a.size();
    const std::string name = (a.name == b.name) ? a.name : std::string();

    if (isBitwise(op) && a.type == ColumnType::BOOLEAN && b.type == ColumnType::BOOLEAN &&
        op != ArithOp::LSHIFT && op != ArithOp::RSHIFT) {
        std::vector<uint8_t> out(n, 0);
        const auto& x = std::get<std::vector<uint8_t>>(a.values);
        const auto& y = std::get<std::vector<uint8_t>>(b.values);
        for (size_t i = 0; i < n; ++i) {
            const bool l = !a.isMissing(i) && x[i];
            const bool r = !b.isMissing(i) && y[i];
            out[i] = (op == ArithOp::BIT_AND) ? (l && r) : (op == ArithOp::BIT_OR ? (l || r) : (l != r));
        }
        return Column::fromBools(name, std::move(out));
    }

    const bool intLike = (a.type == ColumnType::INTEGER || a.type == ColumnType::BOOLEAN) &&
                         (b.type == ColumnType::INTEGER || b.type == ColumnType::BOOLEAN);
    if (a.isNumericLike() && b.isNumericLike() && !isBitwise(op)) {
        if (intLike && op != ArithOp::DIV) {
            std::vector<int64_t> out(n, 0);
            bool ok = true;
            for (size_t i = 0; i < n && ok; ++i) {
                auto r = applyInt(op, static_cast<int64_t>(a.numberAt(i)), static_cast<int64_t>(b.numberAt(i)));
                if (!r) ok = false;
                else out[i] = *r;
            }
            if (ok) return Column::fromInts(name, std::move(out));
        }
        std::vector<double> out(n, kNaN);
        for (size_t i = 0; i < n; ++i) {
            if (a.isMissing(i) || b.isMissing(i)) continue;
            out[i] = applyDouble(op, a.numberAt(i), b.numberAt(i));
        }
        Column col = Column::fromDoubles(name, std::move(out));
        return col;
    }

    std::vector<Scalar> cells(n);
    for (size_t i = 0; i < n; ++i) cells[i] = vectorArith(op, a.at(i), b.at(i));
    return Column::fromScalars(name, cells);
}

Column arithColumnScalar(ArithOp op, const Column& a, const Scalar& b, bool scalarOnLeft) {
    const size_t n = a.size();
    if (std::holds_alternative<std::monostate>(b)) {
        throw ScriptError("TypeError", std::string("unsupported operand type(s) for ") + arithSymbol(op) +
                                           ": column of dtype " + columnTypeName(a.type) + " and 'NoneType'");
    }
    if (a.isNumericLike() && scalarToNumber(b) && !isBitwise(op)) {
        const double s = *scalarToNumber(b);
        const bool intLike = (a.type == ColumnType::INTEGER || a.type == ColumnType::BOOLEAN) && isIntegral(b);
        if (intLike && op != ArithOp::DIV) {
            std::vector<int64_t> out(n, 0);
            bool ok = true;
            const int64_t si = integralOf(b);
            for (size_t i = 0; i < n && ok; ++i) {
                const int64_t v = static_cast<int64_t>(a.numberAt(i));
                auto r = scalarOnLeft ? applyInt(op, si, v) : applyInt(op, v, si);
                if (!r) ok = false;
                else out[i] = *r;
            }
            if (ok) return Column::fromInts(a.name, std::move(out));
        }
        std::vector<double> out(n, kNaN);
        for (size_t i = 0; i < n; ++i) {
            if (a.isMissing(i)) continue;
            const double v = a.numberAt(i);
            out[i] = scalarOnLeft ? applyDouble(op, s, v) : applyDouble(op, v, s);
        }
        return Column::fromDoubles(a.name, std::move(out));
    }

    if (isBitwise(op) && a.type == ColumnType::BOOLEAN && std::holds_alternative<bool>(b)) {
        Column other = Column::fromBools("", std::vector<uint8_t>(n, std::get<bool>(b) ? 1 : 0));
        Column out = scalarOnLeft ? arithColumns(op, other, a) : arithColumns(op, a, other);
        out.name = a.name;
        return out;
    }

    std::vector<Scalar> cells(n);
    for (size_t i = 0; i < n; ++i) {
        cells[i] = scalarOnLeft ? vectorArith(op, b, a.at(i)) : vectorArith(op, a.at(i), b);
    }
    return Column::fromScalars(a.name, cells);
}

Column compareColumns(CompareOp op, const Column& a, const Column& b) {
    if (a.size() != b.size()) {
        throw ScriptError("ValueError", "Can only compare identically-labeled Series objects");
    }
    const size_t n = a.size();
    std::vector<uint8_t> out(n, 0);
    for (size_t i = 0; i < n; ++i) {
        auto cmp = vectorCompare(a.at(i), b.at(i));
        if (!cmp) {
            out[i] = (op == CompareOp::NE);
        } else if (*cmp == 2) {
            if (op == CompareOp::EQ || op == CompareOp::NE) out[i] = (op == CompareOp::NE);
            else compare(op, a.at(i), b.at(i));
        } else {
            out[i] = orderResult(op, *cmp);
        }
    }
    return Column::fromBools(a.name == b.name ? a.name : std::string(), std::move(out));
}

Column compareColumnScalar(CompareOp op, const Column& a, const Scalar& b, bool scalarOnLeft) {
    Scalar rhs = b;
    if (a.type == ColumnType::DATETIME && std::holds_alternative<std::string>(b)) {
        if (auto ts = parseTimestamp(std::get<std::string>(b))) rhs = *ts;
    }
    const size_t n = a.size();
    std::vector<uint8_t> out(n, 0);
    for (size_t i = 0; i < n; ++i) {
        const Scalar cell = a.at(i);
        auto cmp = scalarOnLeft ? vectorCompare(rhs, cell) : vectorCompare(cell, rhs);
        if (!cmp) {
            out[i] = (op == CompareOp::NE);
        } else if (*cmp == 2) {
            if (op == CompareOp::EQ || op == CompareOp::NE) out[i] = (op == CompareOp::NE);
            else if (scalarOnLeft) compare(op, rhs, cell);
            else compare(op, cell, rhs);
        } else {
            out[i] = orderResult(op, *cmp);
        }
    }
    return Column::fromBools(a.name, std::move(out));
}

Column negate(const Column& a) {
    if (!a.isNumericLike()) throw ScriptError("TypeError", "bad operand type for unary -: 'str'");
    return arithColumnScalar(ArithOp::MUL, a, static_cast<int64_t>(-1), false);
}

Column invert(const Column& a) {
    if (a.type == ColumnType::BOOLEAN) {
        std::vector<uint8_t> out(a.size(), 0);
        const auto& v = std::get<std::vector<uint8_t>>(a.values);
        for (size_t i = 0; i < a.size(); ++i) out[i] = a.isMissing(i) ? 1 : !v[i];
        return Column::fromBools(a.name, std::move(out));
    }
    if (a.type == ColumnType::INTEGER) {
        std::vector<int64_t> out = std::get<std::vector<int64_t>>(a.values);
        for (auto& v : out) v = ~v;
        return Column::fromInts(a.name, std::move(out));
    }
    throw ScriptError("TypeError", "bad operand type for unary ~");
}

Column absolute(const Column& a) {
    if (a.type == ColumnType::INTEGER) {
        std::vector<int64_t> out = std::get<std::vector<int64_t>>(a.values);
        for (auto& v : out) v = (v < 0) ? -v : v;
        return Column::fromInts(a.name, std::move(out));
    }
    if (!a.isNumericLike()) throw ScriptError("TypeError", "bad operand type for abs(): 'str'");
    std::vector<double> out(a.size(), kNaN);
    for (size_t i = 0; i < a.size(); ++i) {
        if (!a.isMissing(i)) out[i] = std::fabs(a.numberAt(i));
    }
    return Column::fromDoubles(a.name, std::move(out));
}

std::vector<size_t> rowsWhere(const Column& mask) {
    if (mask.type != ColumnType::BOOLEAN) {
        throw ScriptError("TypeError", "boolean mask expected, got dtype " + std::string(columnTypeName(mask.type)));
    }
    const auto& v = std::get<std::vector<uint8_t>>(mask.values);
    std::vector<size_t> rows;
    for (size_t i = 0; i < mask.size(); ++i) {
        if (!mask.isMissing(i) && v[i]) rows.push_back(i);
    }
    return rows;
}

std::pair<Series, Series> align(const Series& a, const Series& b) {
    if (a.index.sameLabels(b.index) || (a.size() == b.size() && (a.index.isRange() || b.index.isRange()))) {
        return {a, b};
    }
    if (a.index.nlevels() != 1 || b.index.nlevels() != 1) {
        if (a.size() == b.size()) return {a, b};
        throw ScriptError("ValueError", "cannot align series with different multi-level indexes");
    }

    std::vector<Scalar> labels;
    std::map<std::vector<Scalar>, std::pair<long, long>, KeyLess> positions;
    std::vector<std::vector<Scalar>> order;
    for (size_t i = 0; i < a.size(); ++i) {
        std::vector<Scalar> key{a.index.labelAt(i)};
        auto it = positions.find(key);
        if (it == positions.end()) {
            positions.emplace(key, std::make_pair(static_cast<long>(i), -1L));
            order.push_back(key);
        }
    }
    for (size_t i = 0; i < b.size(); ++i) {
        std::vector<Scalar> key{b.index.labelAt(i)};
        auto it = positions.find(key);
        if (it == positions.end()) {
            positions.emplace(key, std::make_pair(-1L, static_cast<long>(i)));
            order.push_back(key);
        } else if (it->second.second < 0) {
            it->second.second = static_cast<long>(i);
        }
    }
    std::sort(order.begin(), order.end(), KeyLess());

    std::vector<Scalar> av;
    std::vector<Scalar> bv;
    for (const auto& key : order) {
        const auto& pos = positions[key];
        labels.push_back(key.front());
        av.push_back(pos.first >= 0 ? a.values.at(static_cast<size_t>(pos.first)) : Scalar(std::monostate{}));
        bv.push_back(pos.second >= 0 ? b.values.at(static_cast<size_t>(pos.second)) : Scalar(std::monostate{}));
    }
    Column labelCol = Column::fromScalars(a.index.levels.empty() ? std::string() : a.index.levels.front().name, labels);
    Index idx = Index::fromColumn(labelCol);
    Series left(Column::fromScalars(a.name(), av), idx);
    Series right(Column::fromScalars(b.name(), bv), idx);
    return {left, right};
}

std::optional<Reduction> parseReduction(const std::string& name) {
    static const std::unordered_map<std::string, Reduction> kNames = {
        {"mean", Reduction::MEAN}, {"average", Reduction::MEAN}, {"sum", Reduction::SUM},
        {"count", Reduction::COUNT}, {"min", Reduction::MIN}, {"max", Reduction::MAX},
        {"median", Reduction::MEDIAN}, {"std", Reduction::STD}, {"var", Reduction::VAR},
        {"size", Reduction::SIZE}, {"nunique", Reduction::NUNIQUE}, {"first", Reduction::FIRST},
        {"last", Reduction::LAST}, {"prod", Reduction::PROD}
    };
    auto it = kNames.find(name);
    if (it == kNames.end()) return std::nullopt;
    return it->second;
}

const char* reductionName(Reduction r) noexcept {
    switch (r) {
        case Reduction::MEAN: return "mean";
        case Reduction::SUM: return "sum";
        case Reduction::COUNT: return "count";
        case Reduction::MIN: return "min";
        case Reduction::MAX: return "max";
        case Reduction::MEDIAN: return "median";
        case Reduction::STD: return "std";
        case Reduction::VAR: return "var";
        case Reduction::SIZE: return "size";
        case Reduction::NUNIQUE: return "nunique";
        case Reduction::FIRST: return "first";
        case Reduction::LAST: return "last";
        case Reduction::PROD: return "prod";
    }
    return "?";
}

bool reductionApplies(const Column& col, Reduction r) {
    switch (r) {
        case Reduction::MEAN:
        case Reduction::MEDIAN:
        case Reduction::STD:
        case Reduction::VAR:
        case Reduction::PROD:
        case Reduction::SUM:
            return col.isNumericLike();
        default:
            return true;
    }
}

Scalar reduce(const Column& col, Reduction r, int ddof) {
    const size_t n = col.size();
    switch (r) {
        case Reduction::SIZE:
            return static_cast<int64_t>(n);
        case Reduction::COUNT:
            return static_cast<int64_t>(col.countPresent());
        case Reduction::NUNIQUE:
            return static_cast<int64_t>(countUnique(col, true));
        case Reduction::FIRST:
            for (size_t i = 0; i < n; ++i) {
                if (!col.isMissing(i)) return col.at(i);
            }
            return std::monostate{};
        case Reduction::LAST:
            for (size_t i = n; i > 0; --i) {
                if (!col.isMissing(i - 1)) return col.at(i - 1);
            }
            return std::monostate{};
        case Reduction::MIN:
        case Reduction::MAX: {
            Scalar best = std::monostate{};
            for (size_t i = 0; i < n; ++i) {
                if (col.isMissing(i)) continue;
                Scalar v = col.at(i);
                if (scalarIsMissing(best) ||
                    (r == Reduction::MIN ? scalarLess(v, best) : scalarLess(best, v))) {
                    best = std::move(v);
                }
            }
            if (scalarIsMissing(best) && col.isNumericLike()) return kNaN;
            return best;
        }
        default:
            break;
    }

    if (r == Reduction::SUM && col.type == ColumnType::CATEGORICAL) {
        std::string out;
        for (size_t i = 0; i < n; ++i) {
            if (!col.isMissing(i)) out += std::get<std::vector<std::string>>(col.values)[i];
        }
        return out;
    }
    if (!col.isNumericLike()) {
        throw ScriptError("TypeError", std::string("could not compute ") + reductionName(r) +
                                           " of non-numeric column '" + col.name + "'");
    }

    if (r == Reduction::SUM && (col.type == ColumnType::INTEGER || col.type == ColumnType::BOOLEAN)) {
        int64_t total = 0;
        for (size_t i = 0; i < n; ++i) {
            if (col.isMissing(i)) continue;
            if (__builtin_add_overflow(total, static_cast<int64_t>(col.numberAt(i)), &total)) {
                throw ScriptError("OverflowError", "integer sum out of range");
            }
        }
        return total;
    }

    const std::vector<double> vals = col.presentNumbers();
    switch (r) {
        case Reduction::SUM: {
            long double total = 0.0L;
            for (double v : vals) total += v;
            return static_cast<double>(total);
        }
        case Reduction::PROD: {
            long double total = 1.0L;
            for (double v : vals) total *= v;
            return static_cast<double>(total);
        }
        case Reduction::MEAN:
            if (vals.empty()) return kNaN;
            return StatsUtils::runningMean(vals);
        case Reduction::MEDIAN:
            return CommonUtils::medianByNth(vals);
        case Reduction::VAR:
            return StatsUtils::variance(vals, ddof);
        case Reduction::STD:
            return std::sqrt(StatsUtils::variance(vals, ddof));
        default:
            return kNaN;
    }
}

double quantile(const Column& col, double q) {
    if (!col.isNumericLike()) {
        throw ScriptError("TypeError", "quantile requires a numeric column, got '" + col.name + "'");
    }
    if (q < 0.0 || q > 1.0) throw ScriptError("ValueError", "percentiles should all be in the interval [0, 1]");
    return CommonUtils::quantileByNth(col.presentNumbers(), q);
}

std::vector<size_t> headRows(size_t n, int64_t k) {
    size_t count = 0;
    if (k >= 0) count = std::min<size_t>(n, static_cast<size_t>(k));
    else count = (static_cast<size_t>(-k) >= n) ? 0 : n - static_cast<size_t>(-k);
    std::vector<size_t> rows(count);
    std::iota(rows.begin(), rows.end(), 0);
    return rows;
}

std::vector<size_t> tailRows(size_t n, int64_t k) {
    size_t count = 0;
    if (k >= 0) count = std::min<size_t>(n, static_cast<size_t>(k));
    else count = (static_cast<size_t>(-k) >= n) ? 0 : n - static_cast<size_t>(-k);
    std::vector<size_t> rows(count);
    std::iota(rows.begin(), rows.end(), n - count);
    return rows;
}

std::vector<size_t> sortOrder(const std::vector<const Column*>& keys, const std::vector<bool>& ascending) {
    const size_t n = keys.empty() ? 0 : keys.front()->size();
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t x, size_t y) {
        for (size_t k = 0; k < keys.size(); ++k) {
            const Column& c = *keys[k];
            const bool xm = c.isMissing(x);
            const bool ym = c.isMissing(y);
            if (xm || ym) {
                if (xm && ym) continue;
                return ym;
            }
            const Scalar a = c.at(x);
            const Scalar b = c.at(y);
            const bool asc = ascending.empty() ? true : ascending[std::min(k, ascending.size() - 1)];
            if (scalarLess(a, b)) return asc;
            if (scalarLess(b, a)) return !asc;
        }
        return false;
    });
    return order;
}

std::vector<size_t> indexSortOrder(const Index& index, bool ascending) {
    std::vector<size_t> order(index.size());
    std::iota(order.begin(), order.end(), 0);
    if (index.isRange()) {
        if (!ascending) std::reverse(order.begin(), order.end());
        return order;
    }
    std::vector<const Column*> keys;
    for (const auto& level : index.levels) keys.push_back(&level);
    return sortOrder(keys, std::vector<bool>(keys.size(), ascending));
}

Groups groupRows(const std::vector<const Column*>& keys, bool sort, bool dropna) {
    Groups groups;
    const size_t n = keys.empty() ? 0 : keys.front()->size();
    std::map<std::vector<Scalar>, size_t, KeyLess> sortedIds;
    std::unordered_map<std::string, size_t> hashedIds;
    std::vector<std::vector<Scalar>> groupKeys;

    for (size_t row = 0; row < n; ++row) {
        std::vector<Scalar> key;
        key.reserve(keys.size());
        bool hasMissing = false;
        for (const Column* c : keys) {
            key.push_back(c->at(row));
            hasMissing = hasMissing || c->isMissing(row);
        }
        if (dropna && hasMissing) continue;

        size_t id = 0;
        const std::string text = rowKey(keys, row);
        auto it = hashedIds.find(text);
        if (it == hashedIds.end()) {
            id = groupKeys.size();
            hashedIds.emplace(text, id);
            groupKeys.push_back(key);
            groups.members.emplace_back();
            if (sort) sortedIds.emplace(std::move(key), id);
        } else {
            id = it->second;
        }
        groups.members[id].push_back(row);
    }

    std::vector<size_t> order;
    if (sort) {
        for (const auto& kv : sortedIds) order.push_back(kv.second);
    } else {
        order.resize(groupKeys.size());
        std::iota(order.begin(), order.end(), 0);
    }

    std::vector<std::vector<size_t>> members;
    members.reserve(order.size());
    std::vector<Column> levels;
    for (size_t k = 0; k < keys.size(); ++k) {
        std::vector<Scalar> labels;
        labels.reserve(order.size());
        for (size_t id : order) labels.push_back(groupKeys[id][k]);
        Column level = labels.empty() ? Column(keys[k]->name, keys[k]->type, 0)
                                      : Column::fromScalars(keys[k]->name, labels);
        levels.push_back(std::move(level));
    }
    for (size_t id : order) members.push_back(std::move(groups.members[id]));
    groups.members = std::move(members);
    groups.keys = Index::fromLevels(std::move(levels));
    groups.keys.length = groups.members.size();
    return groups;
}

Column aggregateGroups(const Column& values, const Groups& groups, Reduction r) {
    std::vector<Scalar> out;
    out.reserve(groups.members.size());
    for (const auto& rows : groups.members) out.push_back(reduce(values.take(rows), r));
    Column col = Column::fromScalars(values.name, out);
    if (out.empty() && (r == Reduction::COUNT || r == Reduction::SIZE || r == Reduction::NUNIQUE)) {
        col = Column::fromInts(values.name, {});
    }
    return col;
}

Series valueCounts(const Column& col, bool normalize, bool ascending, bool dropna) {
    Groups groups = groupRows({&col}, false, dropna);
    std::vector<size_t> order(groups.members.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        const size_t ca = groups.members[a].size();
        const size_t cb = groups.members[b].size();
        return ascending ? ca < cb : ca > cb;
    });

    size_t total = 0;
    for (const auto& m : groups.members) total += m.size();

    std::vector<Scalar> labels;
    std::vector<int64_t> counts;
    std::vector<double> shares;
    for (size_t id : order) {
        labels.push_back(groups.keys.labelAt(id));
        counts.push_back(static_cast<int64_t>(groups.members[id].size()));
        shares.push_back(total == 0 ? kNaN : static_cast<double>(groups.members[id].size()) / static_cast<double>(total));
    }
    Column labelCol = Column::fromScalars(col.name, labels);
    if (labels.empty()) labelCol = Column(col.name, col.type, 0);
    Column values = normalize ? Column::fromDoubles("proportion", std::move(shares))
                              : Column::fromInts("count", std::move(counts));
    return Series(std::move(values), Index::fromColumn(std::move(labelCol)));
}

std::vector<Scalar> uniqueValues(const Column& col) {
    std::vector<Scalar> out;
    std::unordered_map<std::string, bool> seen;
    for (size_t i = 0; i < col.size(); ++i) {
        const Scalar v = col.at(i);
        const std::string key = keyText(v);
        if (seen.emplace(key, true).second) out.push_back(v);
    }
    return out;
}

size_t countUnique(const Column& col, bool dropna) {
    std::unordered_map<std::string, bool> seen;
    for (size_t i = 0; i < col.size(); ++i) {
        if (dropna && col.isMissing(i)) continue;
        seen.emplace(keyText(col.at(i)), true);
    }
    return seen.size();
}

namespace {
std::vector<Scalar> numericSummary(const Column& col) {
    const std::vector<double> vals = col.presentNumbers();
    std::vector<double> sorted = vals;
    std::sort(sorted.begin(), sorted.end());
    const double mean = vals.empty() ? kNaN : StatsUtils::runningMean(vals);
    const double sd = std::sqrt(StatsUtils::variance(vals, 1));
    const auto pct = [&](double q) { return sorted.empty() ? kNaN : StatsUtils::percentileSorted(sorted, q); };
    return {static_cast<double>(vals.size()), mean, sd,
            sorted.empty() ? kNaN : sorted.front(), pct(0.25), pct(0.5), pct(0.75),
            sorted.empty() ? kNaN : sorted.back()};
}

std::vector<Scalar> categoricalSummary(const Column& col) {
    Series counts = valueCounts(col, false, false, true);
    Scalar top = std::monostate{};
    Scalar freq = std::monostate{};
    if (counts.size() > 0) {
        top = counts.index.labelAt(0);
        freq = counts.values.at(0);
    }
    return {static_cast<int64_t>(col.countPresent()), static_cast<int64_t>(countUnique(col, true)), top, freq};
}

const std::vector<std::string>& numericSummaryLabels() {
    static const std::vector<std::string> labels = {"count", "mean", "std", "min", "25%", "50%", "75%", "max"};
    return labels;
}

const std::vector<std::string>& categoricalSummaryLabels() {
    static const std::vector<std::string> labels = {"count", "unique", "top", "freq"};
    return labels;
}
} // namespace

DataFrame describe(const DataFrame& df) {
    std::vector<const Column*> numeric;
    for (const auto& c : df.columns) {
        if (c.isNumericLike() && c.type != ColumnType::BOOLEAN) numeric.push_back(&c);
    }
    DataFrame out;
    if (!numeric.empty()) {
        out.index = Index::fromColumn(Column::fromStrings("", numericSummaryLabels()));
        for (const Column* c : numeric) out.columns.push_back(Column::fromScalars(c->name, numericSummary(*c)));
        return out;
    }
    out.index = Index::fromColumn(Column::fromStrings("", categoricalSummaryLabels()));
    for (const auto& c : df.columns) {
        Column col = Column::fromScalars(c.name, categoricalSummary(c));
        col.convertTo(ColumnType::CATEGORICAL);
        out.columns.push_back(std::move(col));
    }
    return out;
}

Series describe(const Series& s) {
    if (s.values.isNumericLike() && s.values.type != ColumnType::BOOLEAN) {
        return Series(Column::fromScalars(s.name(), numericSummary(s.values)),
                      Index::fromColumn(Column::fromStrings("", numericSummaryLabels())));
    }
    Column col = Column::fromScalars(s.name(), categoricalSummary(s.values));
    col.convertTo(ColumnType::CATEGORICAL);
    return Series(std::move(col), Index::fromColumn(Column::fromStrings("", categoricalSummaryLabels())));
}

double pearson(const Column& a, const Column& b) {
    std::vector<double> x;
    std::vector<double> y;
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        const double xv = a.numberAt(i);
        const double yv = b.numberAt(i);
        if (std::isnan(xv) || std::isnan(yv)) continue;
        x.push_back(xv);
        y.push_back(yv);
    }
    return StatsUtils::pearson(x, y);
}

DataFrame correlation(const DataFrame& df) {
    std::vector<const Column*> numeric;
    std::vector<std::string> names;
    for (const auto& c : df.columns) {
        if (c.isNumericLike()) {
            numeric.push_back(&c);
            names.push_back(c.name);
        }
    }
    DataFrame out;
    out.index = Index::fromColumn(Column::fromStrings("", names));
    for (size_t j = 0; j < numeric.size(); ++j) {
        std::vector<double> col(numeric.size(), kNaN);
        for (size_t i = 0; i < numeric.size(); ++i) {
            col[i] = (i == j) ? 1.0 : pearson(*numeric[i], *numeric[j]);
        }
        out.columns.push_back(Column::fromDoubles(names[j], std::move(col)));
    }
    return out;
}

DataFrame concatRows(const std::vector<DataFrame>& frames, bool ignoreIndex) {
    std::vector<std::string> names;
    for (const auto& f : frames) {
        for (const auto& c : f.columns) {
            if (std::find(names.begin(), names.end(), c.name) == names.end()) names.push_back(c.name);
        }
    }

    DataFrame out;
    size_t total = 0;
    for (const auto& f : frames) total += f.rows();

    for (const auto& name : names) {
        std::vector<Scalar> cells;
        cells.reserve(total);
        const Column* prototype = nullptr;
        for (const auto& f : frames) {
            const int idx = f.findColumn(name);
            if (idx < 0) {
                cells.insert(cells.end(), f.rows(), Scalar(std::monostate{}));
                continue;
            }
            const Column& c = f.columns[static_cast<size_t>(idx)];
            if (prototype == nullptr) prototype = &c;
            for (size_t r = 0; r < c.size(); ++r) cells.push_back(c.at(r));
        }
        Column col = Column::fromScalars(name, cells);
        if (cells.empty() && prototype != nullptr) col = Column(name, prototype->type, 0);
        out.columns.push_back(std::move(col));
    }

    bool allRange = true;
    size_t nlevels = 1;
    for (const auto& f : frames) {
        allRange = allRange && f.index.isRange();
        nlevels = std::max(nlevels, f.index.nlevels());
    }
    if (ignoreIndex || (allRange && frames.size() <= 1)) {
        out.index = Index::range(total);
        return out;
    }
    std::vector<Column> levels;
    for (size_t l = 0; l < nlevels; ++l) {
        std::vector<Scalar> labels;
        labels.reserve(total);
        std::string levelName;
        for (const auto& f : frames) {
            if (l < f.index.levels.size() && levelName.empty()) levelName = f.index.levels[l].name;
            for (size_t r = 0; r < f.rows(); ++r) {
                labels.push_back(l < f.index.nlevels() ? f.index.labelAt(r, l) : Scalar(std::monostate{}));
            }
        }
        levels.push_back(Column::fromScalars(levelName, labels));
    }
    out.index = Index::fromLevels(std::move(levels));
    out.index.length = total;
    return out;
}

DataFrame concatColumns(const std::vector<DataFrame>& frames) {
    DataFrame out;
    if (frames.empty()) return out;
    out.index = frames.front().index;
    for (const auto& f : frames) {
        if (f.rows() != out.rows()) {
            throw ScriptError("ValueError", "all frames must have the same number of rows for axis=1 concat");
        }
        for (const auto& c : f.columns) out.columns.push_back(c);
    }
    return out;
}

DataFrame resetIndex(const DataFrame& df, bool drop) {
    DataFrame out;
    out.index = Index::range(df.rows());
    if (!drop) {
        if (df.index.isRange()) {
            std::vector<int64_t> labels(df.rows());
            std::iota(labels.begin(), labels.end(), 0);
            out.columns.push_back(Column::fromInts(df.findColumn("index") < 0 ? "index" : "level_0", std::move(labels)));
        } else {
            for (size_t l = 0; l < df.index.levels.size(); ++l) {
                Column level = df.index.levels[l];
                if (level.name.empty()) {
                    level.name = df.index.levels.size() == 1 ? "index" : "level_" + std::to_string(l);
                }
                out.columns.push_back(std::move(level));
            }
        }
    }
    for (const auto& c : df.columns) out.columns.push_back(c);
    return out;
}

DataFrame seriesToFrame(const Series& s, bool withIndexColumns) {
    DataFrame frame;
    frame.index = s.index;
    Column values = s.values;
    if (values.name.empty()) values.name = "0";
    frame.columns.push_back(std::move(values));
    if (!withIndexColumns) return frame;
    return resetIndex(frame, false);
}

DataFrame setIndex(const DataFrame& df, const std::vector<std::string>& cols, bool drop) {
    DataFrame out;
    std::vector<Column> levels;
    for (const auto& name : cols) levels.push_back(df.column(name));
    out.index = Index::fromLevels(std::move(levels));
    out.index.length = df.rows();
    for (const auto& c : df.columns) {
        if (drop && std::find(cols.begin(), cols.end(), c.name) != cols.end()) continue;
        out.columns.push_back(c);
    }
    return out;
}

DataFrame pivotTable(const DataFrame& df,
                     const std::vector<std::string>& values,
                     const std::vector<std::string>& index,
                     const std::string& columns,
                     Reduction aggfunc) {
    if (index.empty()) throw ScriptError("ValueError", "pivot_table requires at least one index column");
    std::vector<std::string> valueCols = values;
    if (valueCols.empty()) {
        for (const auto& c : df.columns) {
            if (!c.isNumericLike()) continue;
            if (std::find(index.begin(), index.end(), c.name) != index.end() || c.name == columns) continue;
            valueCols.push_back(c.name);
        }
    }

    std::vector<const Column*> keyCols;
    for (const auto& name : index) keyCols.push_back(&df.column(name));
    Groups rowsByKey = groupRows(keyCols, true, true);

    DataFrame out;
    out.index = rowsByKey.keys;
    if (columns.empty()) {
        for (const auto& v : valueCols) out.columns.push_back(aggregateGroups(df.column(v), rowsByKey, aggfunc));
        return out;
    }

    const Column& pivotCol = df.column(columns);
    Groups pivots = groupRows({&pivotCol}, true, true);
    for (const auto& v : valueCols) {
        const Column& source = df.column(v);
        for (size_t p = 0; p < pivots.members.size(); ++p) {
            std::vector<char> inPivot(df.rows(), 0);
            for (size_t r : pivots.members[p]) inPivot[r] = 1;
            std::vector<Scalar> cells;
            cells.reserve(rowsByKey.members.size());
            for (const auto& rows : rowsByKey.members) {
                std::vector<size_t> selected;
                for (size_t r : rows) {
                    if (inPivot[r]) selected.push_back(r);
                }
                if (selected.empty()) {
                    cells.emplace_back(std::monostate{});
                } else {
                    cells.push_back(reduce(source.take(selected), aggfunc));
                }
            }
            std::string name = labelText(pivots.keys.labelAt(p));
            if (valueCols.size() > 1) name = v + "_" + name;
            out.columns.push_back(Column::fromScalars(name, cells));
        }
    }
    return out;
}

DataFrame merge(const DataFrame& left,
                const DataFrame& right,
                const std::vector<std::string>& on,
                const std::string& how) {
    if (how != "inner" && how != "left" && how != "right" && how != "outer") {
        throw ScriptError("ValueError", "how must be one of: inner, left, right, outer");
    }
    std::vector<std::string> keys = on;
    if (keys.empty()) {
        for (const auto& c : left.columns) {
            if (right.findColumn(c.name) >= 0) keys.push_back(c.name);
        }
    }
    if (keys.empty()) throw ScriptError("ValueError", "No common columns to perform merge on");

    std::vector<const Column*> lk;
    std::vector<const Column*> rk;
    for (const auto& k : keys) {
        lk.push_back(&left.column(k));
        rk.push_back(&right.column(k));
    }

    std::unordered_map<std::string, std::vector<size_t>> rightRows;
    for (size_t r = 0; r < right.rows(); ++r) rightRows[rowKey(rk, r)].push_back(r);

    std::vector<long> li;
    std::vector<long> ri;
    std::vector<char> rightUsed(right.rows(), 0);
    for (size_t l = 0; l < left.rows(); ++l) {
        auto it = rightRows.find(rowKey(lk, l));
        if (it == rightRows.end()) {
            if (how == "left" || how == "outer") {
                li.push_back(static_cast<long>(l));
                ri.push_back(-1);
            }
            continue;
        }
        for (size_t r : it->second) {
            li.push_back(static_cast<long>(l));
            ri.push_back(static_cast<long>(r));
            rightUsed[r] = 1;
        }
    }
    if (how == "right" || how == "outer") {
        for (size_t r = 0; r < right.rows(); ++r) {
            if (rightUsed[r]) continue;
            li.push_back(-1);
            ri.push_back(static_cast<long>(r));
        }
    }

    const auto isKey = [&](const std::string& name) {
        return std::find(keys.begin(), keys.end(), name) != keys.end();
    };
    const auto pick = [](const Column& c, const std::vector<long>& rows, const std::string& name) {
        std::vector<Scalar> cells;
        cells.reserve(rows.size());
        for (long r : rows) cells.push_back(r < 0 ? Scalar(std::monostate{}) : c.at(static_cast<size_t>(r)));
        Column out = Column::fromScalars(name, cells);
        if (cells.empty()) out = Column(name, c.type, 0);
        return out;
    };

    DataFrame out;
    out.index = Index::range(li.size());
    for (const auto& c : left.columns) {
        if (isKey(c.name)) {
            std::vector<Scalar> cells;
            cells.reserve(li.size());
            const Column& rc = right.column(c.name);
            for (size_t i = 0; i < li.size(); ++i) {
                cells.push_back(li[i] >= 0 ? c.at(static_cast<size_t>(li[i])) : rc.at(static_cast<size_t>(ri[i])));
            }
            Column keyCol = Column::fromScalars(c.name, cells);
            if (cells.empty()) keyCol = Column(c.name, c.type, 0);
            out.columns.push_back(std::move(keyCol));
            continue;
        }
        const std::string name = right.findColumn(c.name) >= 0 ? c.name + "_x" : c.name;
        out.columns.push_back(pick(c, li, name));
    }
    for (const auto& c : right.columns) {
        if (isKey(c.name)) continue;
        const std::string name = left.findColumn(c.name) >= 0 ? c.name + "_y" : c.name;
        out.columns.push_back(pick(c, ri, name));
    }
    return out;
}

std::vector<size_t> distinctRows(const DataFrame& df, const std::vector<std::string>& subset, bool keepFirst) {
    std::vector<const Column*> cols;
    if (subset.empty()) {
        for (const auto& c : df.columns) cols.push_back(&c);
    } else {
        for (const auto& name : subset) cols.push_back(&df.column(name));
    }
    std::unordered_map<std::string, size_t> chosen;
    std::vector<std::string> keys(df.rows());
    for (size_t r = 0; r < df.rows(); ++r) {
        keys[r] = rowKey(cols, r);
        auto it = chosen.find(keys[r]);
        if (it == chosen.end()) chosen.emplace(keys[r], r);
        else if (!keepFirst) it->second = r;
    }
    std::vector<size_t> rows;
    for (size_t r = 0; r < df.rows(); ++r) {
        if (chosen[keys[r]] == r) rows.push_back(r);
    }
    return rows;
}

Column cumulativeSum(const Column& col) {
    if (!col.isNumericLike()) throw ScriptError("TypeError", "cumsum requires a numeric column");
    if (col.type != ColumnType::NUMERIC && col.countPresent() == col.size()) {
        std::vector<int64_t> out(col.size(), 0);
        int64_t running = 0;
        for (size_t i = 0; i < col.size(); ++i) {
            running += static_cast<int64_t>(col.numberAt(i));
            out[i] = running;
        }
        return Column::fromInts(col.name, std::move(out));
    }
    std::vector<double> out(col.size(), kNaN);
    double running = 0.0;
    for (size_t i = 0; i < col.size(); ++i) {
        if (col.isMissing(i)) continue;
        running += col.numberAt(i);
        out[i] = running;
    }
    return Column::fromDoubles(col.name, std::move(out));
}

// Non-negative digit counts round the exact binary value through to_chars, so
// 0.12345 (stored slightly above the tie) becomes 0.1235 and only true ties go to even.
double roundHalfEven(double value, int decimals) noexcept {
    if (!std::isfinite(value) || decimals > 323) return value;
    if (decimals < 0) {
        const double scale = std::pow(10.0, -decimals);
        const double rounded = std::nearbyint(value / scale) * scale;
        return std::isfinite(rounded) ? rounded : value;
    }
    char buf[700];
    const auto written = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed, decimals);
    if (written.ec != std::errc{}) return value;
    double out = value;
    const auto parsed = std::from_chars(buf, written.ptr, out);
    if (parsed.ec != std::errc{}) return value;
    return out;
}

Column roundColumn(const Column& col, int decimals) {
    if (col.type != ColumnType::NUMERIC) return col;
    Column out = col;
    auto& v = std::get<std::vector<double>>(out.values);
    for (size_t i = 0; i < v.size(); ++i) {
        if (!out.isMissing(i)) v[i] = roundHalfEven(v[i], decimals);
    }
    return out;
}

Column fillMissing(const Column& col, const Scalar& value) {
    Column out = col;
    for (size_t i = 0; i < out.size(); ++i) {
        if (out.isMissing(i)) out.set(i, value);
    }
    return out;
}

Column missingFlags(const Column& col, bool wantMissing) {
    std::vector<uint8_t> out(col.size(), 0);
    for (size_t i = 0; i < col.size(); ++i) out[i] = (col.isMissing(i) == wantMissing) ? 1 : 0;
    return Column::fromBools(col.name, std::move(out));
}

} // namespace FrameOps
} // namespace Tabula
