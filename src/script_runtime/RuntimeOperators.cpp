#include "ScriptRuntime.h"

#include "CommonUtils.h"
#include "FrameFormat.h"
#include "TabulaExceptions.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>
#include <type_traits>

namespace Tabula {
namespace Runtime {

namespace {

using ListPtr = std::shared_ptr<ListValue>;
using TuplePtr = std::shared_ptr<TupleValue>;
using DictPtr = std::shared_ptr<DictValue>;
using SetPtr = std::shared_ptr<SetValue>;
using SlicePtr = std::shared_ptr<SliceValue>;

CompareOp toCompareOp(Ast::CompareOperator op) {
    switch (op) {
        case Ast::CompareOperator::EQ: return CompareOp::EQ;
        case Ast::CompareOperator::NE: return CompareOp::NE;
        case Ast::CompareOperator::LT: return CompareOp::LT;
        case Ast::CompareOperator::LE: return CompareOp::LE;
        case Ast::CompareOperator::GT: return CompareOp::GT;
        case Ast::CompareOperator::GE: return CompareOp::GE;
        default: break;
    }
    throw ScriptError("TypeError", std::string("operator ") + Ast::compareOperatorSymbol(op) + " is not elementwise");
}

[[noreturn]] void unsupported(const char* symbol, const Value& a, const Value& b) {
    throw ScriptError("TypeError", std::string("unsupported operand type(s) for ") + symbol + ": '" + typeName(a) +
                                       "' and '" + typeName(b) + "'");
}

bool isSequence(const Value& v) {
    return v.is<ListPtr>() || v.is<TuplePtr>();
}

Value seriesArith(ArithOp op, const Value& a, const Value& b) {
    if (a.isSeries() && b.isSeries()) {
        auto aligned = FrameOps::align(a.series(), b.series());
        Column out = FrameOps::arithColumns(op, aligned.first.values, aligned.second.values);
        out.name = (a.series().name() == b.series().name()) ? a.series().name() : std::string();
        return makeSeries(Series(std::move(out), aligned.first.index));
    }
    const bool seriesLeft = a.isSeries();
    const Series& s = seriesLeft ? a.series() : b.series();
    const Value& other = seriesLeft ? b : a;
    if (isSequence(other)) {
        const Series o = toSeries(other, arithSymbol(op));
        Column out = seriesLeft ? FrameOps::arithColumns(op, s.values, o.values)
                                : FrameOps::arithColumns(op, o.values, s.values);
        out.name = s.name();
        return makeSeries(Series(std::move(out), s.index));
    }
    const auto scalar = toScalar(other);
    if (!scalar) unsupported(arithSymbol(op), a, b);
    return makeSeries(Series(FrameOps::arithColumnScalar(op, s.values, *scalar, !seriesLeft), s.index));
}

Value frameArith(ArithOp op, const Value& a, const Value& b) {
    if (a.isFrame() && b.isFrame()) {
        const DataFrame& x = a.frame();
        const DataFrame& y = b.frame();
        if (x.rows() != y.rows()) {
            throw ScriptError("ValueError", "Unable to combine frames with different row counts");
        }
        DataFrame out;
        out.index = x.index;
        for (const auto& col : x.columns) {
            const int j = y.findColumn(col.name);
            if (j < 0) {
                Column missing(col.name, ColumnType::NUMERIC, x.rows());
                missing.missing.assign(x.rows(), 1);
                out.columns.push_back(std::move(missing));
                continue;
            }
            Column c = FrameOps::arithColumns(op, col, y.columns[static_cast<size_t>(j)]);
            c.name = col.name;
            out.columns.push_back(std::move(c));
        }
        return makeFrame(std::move(out));
    }
    const bool frameLeft = a.isFrame();
    const DataFrame& df = frameLeft ? a.frame() : b.frame();
    const Value& other = frameLeft ? b : a;
    const auto scalar = toScalar(other);
    if (!scalar) unsupported(arithSymbol(op), a, b);
    DataFrame out;
    out.index = df.index;
    for (const auto& col : df.columns) {
        out.columns.push_back(FrameOps::arithColumnScalar(op, col, *scalar, !frameLeft));
    }
    return makeFrame(std::move(out));
}

Value repeatItems(const std::vector<Value>& items, int64_t times, bool tuple) {
    std::vector<Value> out;
    if (times > 0) {
        out.reserve(items.size() * static_cast<size_t>(times));
        for (int64_t i = 0; i < times; ++i) out.insert(out.end(), items.begin(), items.end());
    }
    return tuple ? makeTuple(std::move(out)) : makeList(std::move(out));
}

template <typename T>
struct IsShared : std::false_type {};
template <typename T>
struct IsShared<std::shared_ptr<T>> : std::true_type {};

bool isIdentical(const Value& a, const Value& b) {
    if (a.isNone() || b.isNone()) return a.isNone() && b.isNone();
    if (a.data.index() != b.data.index()) return false;
    if (a.is<bool>()) return a.as<bool>() == b.as<bool>();
    if (a.is<int64_t>() || a.is<double>() || a.is<std::string>() || a.is<Timestamp>() || a.is<ModuleRef>()) {
        return valuesEqual(a, b);
    }
    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        if constexpr (IsShared<T>::value) {
            return lhs == std::get<T>(b.data);
        } else {
            return false;
        }
    }, a.data);
}

Column frameCompareColumn(CompareOp op, const Column& col, const Scalar& rhs) {
    return FrameOps::compareColumnScalar(op, col, rhs, false);
}

Scalar coerceForCompare(const Scalar& value, const Scalar& other) {
    if (std::holds_alternative<Timestamp>(other)) {
        if (const auto* s = std::get_if<std::string>(&value)) {
            if (auto ts = parseTimestamp(*s)) return *ts;
        }
    }
    return value;
}

std::string groupDigits(const std::string& digits, char sep) {
    std::string out;
    const size_t n = digits.size();
    for (size_t i = 0; i < n; ++i) {
        out.push_back(digits[i]);
        const size_t remaining = n - i - 1;
        if (remaining > 0 && remaining % 3 == 0) out.push_back(sep);
    }
    return out;
}

struct FormatSpec {
    char fill = ' ';
    char align = 0;
    char sign = '-';
    bool alternate = false;
    size_t width = 0;
    char grouping = 0;
    int precision = -1;
    char type = 0;
};

FormatSpec parseSpec(const std::string& spec) {
    FormatSpec fs;
    size_t i = 0;
    const auto isAlign = [](char c) { return c == '<' || c == '>' || c == '^' || c == '='; };
    if (spec.size() >= 2 && isAlign(spec[1])) {
        fs.fill = spec[0];
        fs.align = spec[1];
        i = 2;
    } else if (!spec.empty() && isAlign(spec[0])) {
        fs.align = spec[0];
        i = 1;
    }
    if (i < spec.size() && (spec[i] == '+' || spec[i] == '-' || spec[i] == ' ')) fs.sign = spec[i++];
    if (i < spec.size() && spec[i] == '#') {
        fs.alternate = true;
        ++i;
    }
    if (i < spec.size() && spec[i] == '0') {
        if (fs.align == 0) {
            fs.fill = '0';
            fs.align = '=';
        }
        ++i;
    }
    while (i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) {
        fs.width = fs.width * 10 + static_cast<size_t>(spec[i++] - '0');
    }
    if (i < spec.size() && (spec[i] == ',' || spec[i] == '_')) fs.grouping = spec[i++];
    if (i < spec.size() && spec[i] == '.') {
        ++i;
        int p = 0;
        bool any = false;
        while (i < spec.size() && std::isdigit(static_cast<unsigned char>(spec[i]))) {
            p = p * 10 + (spec[i++] - '0');
            any = true;
        }
        if (!any) throw ScriptError("ValueError", "Format specifier missing precision");
        fs.precision = p;
    }
    if (i < spec.size()) fs.type = spec[i++];
    if (i != spec.size()) throw ScriptError("ValueError", "Invalid format specifier '" + spec + "'");
    return fs;
}

std::string pad(const std::string& body, const FormatSpec& fs, char defaultAlign) {
    // UTF-8 continuation bytes do not take a column.
    size_t visible = 0;
    for (char c : body) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++visible;
    }
    if (visible >= fs.width) return body;
    const size_t gap = fs.width - visible;
    const char align = fs.align == 0 ? defaultAlign : fs.align;
    if (align == '<') return body + std::string(gap, fs.fill);
    if (align == '^') return std::string(gap / 2, fs.fill) + body + std::string(gap - gap / 2, fs.fill);
    if (align == '=') {
        const size_t signLen = (!body.empty() && (body[0] == '-' || body[0] == '+' || body[0] == ' ')) ? 1 : 0;
        return body.substr(0, signLen) + std::string(gap, fs.fill) + body.substr(signLen);
    }
    return std::string(gap, fs.fill) + body;
}

std::string withSign(bool negative, const std::string& magnitude, char sign) {
    if (negative) return "-" + magnitude;
    if (sign == '+') return "+" + magnitude;
    if (sign == ' ') return " " + magnitude;
    return magnitude;
}

std::string applyGrouping(const std::string& magnitude, char grouping) {
    if (grouping == 0) return magnitude;
    size_t end = 0;
    while (end < magnitude.size() && std::isdigit(static_cast<unsigned char>(magnitude[end]))) ++end;
    return groupDigits(magnitude.substr(0, end), grouping) + magnitude.substr(end);
}

std::string formatFloat(double value, const FormatSpec& fs) {
    const bool negative = std::signbit(value) && !std::isnan(value);
    const double mag = std::fabs(value);
    std::string body;
    if (std::isnan(value)) {
        body = (fs.type == 'F' || fs.type == 'E' || fs.type == 'G') ? "NAN" : "nan";
    } else if (std::isinf(value)) {
        body = (fs.type == 'F' || fs.type == 'E' || fs.type == 'G') ? "INF" : "inf";
    } else {
        char buf[512];
        char type = fs.type;
        double shown = mag;
        if (type == '%') shown = mag * 100.0;
        if (type == 0 && fs.precision < 0) {
            body = FrameFormat::floatRepr(mag);
        } else {
            const int precision = fs.precision < 0 ? 6 : fs.precision;
            const char* pattern = "%.*f";
            if (type == 'e') pattern = "%.*e";
            else if (type == 'E') pattern = "%.*E";
            else if (type == 'g' || type == 'n' || type == 0) pattern = fs.alternate ? "%#.*g" : "%.*g";
            else if (type == 'G') pattern = fs.alternate ? "%#.*G" : "%.*G";
            const int p = (type == 0 || type == 'g' || type == 'G' || type == 'n') ? std::max(precision, 1) : precision;
            std::snprintf(buf, sizeof(buf), pattern, p, shown);
            body = buf;
            if (type == 0 && body.find_first_of(".e") == std::string::npos) body += ".0";
        }
        if (type == '%') body += '%';
        body = applyGrouping(body, fs.grouping);
    }
    return pad(withSign(negative, body, fs.sign), fs, '>');
}

std::string formatInt(int64_t value, const FormatSpec& fs) {
    const bool negative = value < 0;
    const uint64_t mag = negative ? static_cast<uint64_t>(-(value + 1)) + 1 : static_cast<uint64_t>(value);
    std::string digits;
    switch (fs.type) {
        case 'x':
        case 'X': {
            char buf[32];
            std::snprintf(buf, sizeof(buf), fs.type == 'x' ? "%llx" : "%llX", static_cast<unsigned long long>(mag));
            digits = std::string(fs.alternate ? (fs.type == 'x' ? "0x" : "0X") : "") + buf;
            break;
        }
        case 'b': {
            uint64_t m = mag;
            do {
                digits.insert(digits.begin(), static_cast<char>('0' + (m & 1)));
                m >>= 1;
            } while (m != 0);
            if (fs.alternate) digits = "0b" + digits;
            break;
        }
        case 'o': {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%llo", static_cast<unsigned long long>(mag));
            digits = std::string(fs.alternate ? "0o" : "") + buf;
            break;
        }
        default:
            digits = applyGrouping(std::to_string(mag), fs.grouping);
            break;
    }
    return pad(withSign(negative, digits, fs.sign), fs, '>');
}

} // namespace

// ---------------------------------------------------------------------------
// Conversions

Value scalarValue(const Scalar& s, ColumnType type) {
    if (std::holds_alternative<std::monostate>(s) &&
        (type == ColumnType::NUMERIC || type == ColumnType::INTEGER)) {
        return Value(std::numeric_limits<double>::quiet_NaN());
    }
    return fromScalar(s);
}

Series toSeries(const Value& v, const std::string& context) {
    if (v.isSeries()) return v.series();
    if (v.is<ListPtr>() || v.is<TuplePtr>() || v.is<SetPtr>()) return Series(columnFromValues("", iterate(v)));
    throw ScriptError("TypeError", context + ": expected a Series or list, got '" + typeName(v) + "'");
}

Scalar requireScalar(const Value& v, const std::string& context) {
    auto s = toScalar(v);
    if (!s) throw ScriptError("TypeError", context + ": expected a scalar value, got '" + typeName(v) + "'");
    return *s;
}

std::vector<size_t> slicePositions(const SliceValue& slice, size_t length) {
    const int64_t n = static_cast<int64_t>(length);
    const int64_t step = slice.step.isNone() ? 1 : toInt(slice.step, "slice step");
    if (step == 0) throw ScriptError("ValueError", "slice step cannot be zero");

    const auto clamp = [&](const Value& bound, int64_t fallback) {
        if (bound.isNone()) return fallback;
        int64_t i = toInt(bound, "slice index");
        if (i < 0) i += n;
        if (step > 0) return std::min<int64_t>(std::max<int64_t>(i, 0), n);
        return std::min<int64_t>(std::max<int64_t>(i, -1), n - 1);
    };
    const int64_t start = clamp(slice.start, step > 0 ? 0 : n - 1);
    const int64_t stop = clamp(slice.stop, step > 0 ? n : -1);

    std::vector<size_t> out;
    if (step > 0) {
        for (int64_t i = start; i < stop; i += step) out.push_back(static_cast<size_t>(i));
    } else {
        for (int64_t i = start; i > stop; i += step) out.push_back(static_cast<size_t>(i));
    }
    return out;
}

size_t normalizeIndex(int64_t pos, size_t length, const std::string& what) {
    const int64_t n = static_cast<int64_t>(length);
    const int64_t i = pos < 0 ? pos + n : pos;
    if (i < 0 || i >= n) throw ScriptError("IndexError", what + " index out of range");
    return static_cast<size_t>(i);
}

std::string formatTimestamp(Timestamp ts, const std::string& pattern) {
    static const char* const months[] = {"January", "February", "March", "April", "May", "June", "July",
                                         "August", "September", "October", "November", "December"};
    static const char* const weekdays[] = {"Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday",
                                           "Sunday"};
    int64_t days = ts.seconds / 86400;
    int64_t secs = ts.seconds % 86400;
    if (secs < 0) {
        secs += 86400;
        --days;
    }
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civilFromDays(days, y, m, d);
    const int64_t weekday = ((days % 7) + 7 + 3) % 7;  // 1970-01-01 was a Thursday
    const int64_t dayOfYear = days - daysFromCivil(y, 1, 1) + 1;

    const auto two = [](int64_t v) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "%02d", static_cast<int>(v));
        return std::string(buf);
    };

    std::string out;
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] != '%' || i + 1 >= pattern.size()) {
            out.push_back(pattern[i]);
            continue;
        }
        const char c = pattern[++i];
        switch (c) {
            case 'Y': out += std::to_string(y); break;
            case 'y': out += two(y % 100); break;
            case 'm': out += two(m); break;
            case 'd': out += two(d); break;
            case 'H': out += two(secs / 3600); break;
            case 'M': out += two((secs / 60) % 60); break;
            case 'S': out += two(secs % 60); break;
            case 'j': {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "%03d", static_cast<int>(dayOfYear));
                out += buf;
                break;
            }
            case 'B': out += months[m - 1]; break;
            case 'b': out += std::string(months[m - 1]).substr(0, 3); break;
            case 'A': out += weekdays[weekday]; break;
            case 'a': out += std::string(weekdays[weekday]).substr(0, 3); break;
            case '%': out.push_back('%'); break;
            default:
                out.push_back('%');
                out.push_back(c);
                break;
        }
    }
    return out;
}

bool boolArg(const CallArgs& args, size_t pos, const std::string& name, bool fallback) {
    const Value* v = args.get(pos, name);
    return (v == nullptr || v->isNone()) ? fallback : truthy(*v);
}

int64_t intArg(const CallArgs& args, size_t pos, const std::string& name, int64_t fallback) {
    const Value* v = args.get(pos, name);
    return (v == nullptr || v->isNone()) ? fallback : toInt(*v, name);
}

std::string textArg(const CallArgs& args, size_t pos, const std::string& name, const std::string& fallback) {
    const Value* v = args.get(pos, name);
    return (v == nullptr || v->isNone()) ? fallback : toText(*v, name);
}

// ---------------------------------------------------------------------------
// Operators

Value binary(ArithOp op, const Value& a, const Value& b) {
    if (a.isFrame() || b.isFrame()) return frameArith(op, a, b);
    if (a.isSeries() || b.isSeries()) return seriesArith(op, a, b);

    if (op == ArithOp::ADD) {
        if (a.is<ListPtr>() && b.is<ListPtr>()) {
            std::vector<Value> items = a.as<ListPtr>()->items;
            const auto& more = b.as<ListPtr>()->items;
            items.insert(items.end(), more.begin(), more.end());
            return makeList(std::move(items));
        }
        if (a.is<TuplePtr>() && b.is<TuplePtr>()) {
            std::vector<Value> items = a.as<TuplePtr>()->items;
            const auto& more = b.as<TuplePtr>()->items;
            items.insert(items.end(), more.begin(), more.end());
            return makeTuple(std::move(items));
        }
    }
    if (op == ArithOp::MUL) {
        const Value& seq = isSequence(a) ? a : b;
        const Value& count = isSequence(a) ? b : a;
        if (isSequence(seq) && (count.is<int64_t>() || count.is<bool>())) {
            const bool tuple = seq.is<TuplePtr>();
            return repeatItems(iterate(seq), toInt(count, "*"), tuple);
        }
    }
    if (op == ArithOp::BIT_OR && a.is<DictPtr>() && b.is<DictPtr>()) {
        auto merged = std::make_shared<DictValue>(*a.as<DictPtr>());
        for (const auto& kv : b.as<DictPtr>()->items) merged->set(kv.first, kv.second);
        return Value(merged);
    }

    const auto x = toScalar(a);
    const auto y = toScalar(b);
    if (!x || !y) unsupported(arithSymbol(op), a, b);
    return fromScalar(FrameOps::arith(op, *x, *y));
}

Value unary(Ast::UnaryOperator op, const Value& v) {
    if (v.isSeries()) {
        const Series& s = v.series();
        switch (op) {
            case Ast::UnaryOperator::NEG: return makeSeries(Series(FrameOps::negate(s.values), s.index));
            case Ast::UnaryOperator::INVERT: return makeSeries(Series(FrameOps::invert(s.values), s.index));
            case Ast::UnaryOperator::POS: return v;
            case Ast::UnaryOperator::NOT: return Value(!truthy(v));
        }
    }
    if (v.isFrame()) {
        DataFrame out;
        out.index = v.frame().index;
        for (const auto& col : v.frame().columns) {
            if (op == Ast::UnaryOperator::NEG) out.columns.push_back(FrameOps::negate(col));
            else if (op == Ast::UnaryOperator::INVERT) out.columns.push_back(FrameOps::invert(col));
            else out.columns.push_back(col);
        }
        return makeFrame(std::move(out));
    }

    switch (op) {
        case Ast::UnaryOperator::NOT:
            return Value(!truthy(v));
        case Ast::UnaryOperator::POS:
            if (const auto* b = v.ptr<bool>()) return Value(static_cast<int64_t>(*b ? 1 : 0));
            if (v.is<int64_t>() || v.is<double>()) return v;
            break;
        case Ast::UnaryOperator::NEG:
            if (const auto* b = v.ptr<bool>()) return Value(static_cast<int64_t>(*b ? -1 : 0));
            if (const auto* i = v.ptr<int64_t>()) {
                if (*i == std::numeric_limits<int64_t>::min()) return Value(-static_cast<double>(*i));
                return Value(-*i);
            }
            if (const auto* d = v.ptr<double>()) return Value(-*d);
            break;
        case Ast::UnaryOperator::INVERT:
            if (const auto* b = v.ptr<bool>()) return Value(static_cast<int64_t>(~static_cast<int64_t>(*b ? 1 : 0)));
            if (const auto* i = v.ptr<int64_t>()) return Value(~*i);
            break;
    }
    const char* symbol = op == Ast::UnaryOperator::NEG ? "-" : (op == Ast::UnaryOperator::POS ? "+" : "~");
    throw ScriptError("TypeError", std::string("bad operand type for unary ") + symbol + ": '" + typeName(v) + "'");
}

bool contains(const Value& container, const Value& item) {
    if (const auto* s = container.ptr<std::string>()) {
        const auto* needle = item.ptr<std::string>();
        if (needle == nullptr) {
            throw ScriptError("TypeError", "'in <string>' requires string as left operand, not " + typeName(item));
        }
        return s->find(*needle) != std::string::npos;
    }
    if (const auto* d = container.ptr<DictPtr>()) return (*d)->find(item) != nullptr;
    if (const auto* s = container.ptr<SetPtr>()) return (*s)->contains(item);
    if (container.is<ListPtr>() || container.is<TuplePtr>()) {
        for (const auto& v : iterate(container)) {
            if (valuesEqual(v, item)) return true;
        }
        return false;
    }
    if (container.isSeries()) {
        const auto label = toScalar(item);
        return label && container.series().index.find(*label).has_value();
    }
    if (container.isFrame()) {
        const auto* name = item.ptr<std::string>();
        return name != nullptr && container.frame().findColumn(*name) >= 0;
    }
    throw ScriptError("TypeError", "argument of type '" + typeName(container) + "' is not iterable");
}

Value compare(Ast::CompareOperator op, const Value& a, const Value& b) {
    switch (op) {
        case Ast::CompareOperator::IN: return Value(contains(b, a));
        case Ast::CompareOperator::NOT_IN: return Value(!contains(b, a));
        case Ast::CompareOperator::IS: return Value(isIdentical(a, b));
        case Ast::CompareOperator::IS_NOT: return Value(!isIdentical(a, b));
        default: break;
    }
    const CompareOp cop = toCompareOp(op);

    if (a.isSeries() || b.isSeries()) {
        if (a.isSeries() && b.isSeries()) {
            const Series& x = a.series();
            const Series& y = b.series();
            if (!x.index.sameLabels(y.index) && x.size() != y.size()) {
                throw ScriptError("ValueError", "Can only compare identically-labeled Series objects");
            }
            return makeSeries(Series(FrameOps::compareColumns(cop, x.values, y.values), x.index));
        }
        const bool seriesLeft = a.isSeries();
        const Series& s = seriesLeft ? a.series() : b.series();
        const Value& other = seriesLeft ? b : a;
        if (isSequence(other)) {
            const Series o = toSeries(other, compareSymbol(cop));
            if (o.size() != s.size()) throw ScriptError("ValueError", "Lengths must match to compare");
            Column out = seriesLeft ? FrameOps::compareColumns(cop, s.values, o.values)
                                    : FrameOps::compareColumns(cop, o.values, s.values);
            out.name = s.name();
            return makeSeries(Series(std::move(out), s.index));
        }
        const Scalar rhs = requireScalar(other, compareSymbol(cop));
        return makeSeries(Series(FrameOps::compareColumnScalar(cop, s.values, rhs, !seriesLeft), s.index));
    }
    if (a.isFrame() || b.isFrame()) {
        if (!a.isFrame()) throw ScriptError("TypeError", "frame comparison needs the frame on the left");
        const Scalar rhs = requireScalar(b, compareSymbol(cop));
        DataFrame out;
        out.index = a.frame().index;
        for (const auto& col : a.frame().columns) out.columns.push_back(frameCompareColumn(cop, col, rhs));
        return makeFrame(std::move(out));
    }

    if (cop == CompareOp::EQ || cop == CompareOp::NE) {
        const auto x = toScalar(a);
        const auto y = toScalar(b);
        bool equal = valuesEqual(a, b);
        if (x && y && !equal) {
            const Scalar lx = coerceForCompare(*x, *y);
            const Scalar ly = coerceForCompare(*y, *x);
            equal = std::holds_alternative<Timestamp>(lx) && std::holds_alternative<Timestamp>(ly) &&
                    std::get<Timestamp>(lx) == std::get<Timestamp>(ly);
        }
        return Value(cop == CompareOp::EQ ? equal : !equal);
    }

    const auto x = toScalar(a);
    const auto y = toScalar(b);
    if (x && y) {
        return Value(FrameOps::compare(cop, coerceForCompare(*x, *y), coerceForCompare(*y, *x)));
    }
    // Sequences order lexicographically.
    const bool less = valueLess(a, b);
    const bool greater = valueLess(b, a);
    switch (cop) {
        case CompareOp::LT: return Value(less);
        case CompareOp::LE: return Value(!greater);
        case CompareOp::GT: return Value(greater);
        case CompareOp::GE: return Value(!less);
        default: return Value(false);
    }
}

Value getItem(const Value& obj, const Value& key) {
    if (obj.isFrame()) return frameGetItem(obj, key);
    if (obj.isSeries()) return seriesGetItem(obj, key);
    if (obj.is<std::shared_ptr<GroupByValue>>()) return groupByGetItem(obj, key);
    if (obj.is<std::shared_ptr<Accessor>>()) return accessorGetItem(obj, key);

    if (const auto* d = obj.ptr<DictPtr>()) {
        if (const Value* v = (*d)->find(key)) return *v;
        throw ScriptError("KeyError", repr(key));
    }

    if (const auto* s = obj.ptr<std::string>()) {
        if (const auto* slice = key.ptr<SlicePtr>()) {
            std::string out;
            for (size_t i : slicePositions(**slice, s->size())) out.push_back((*s)[i]);
            return Value(out);
        }
        return Value(std::string(1, (*s)[normalizeIndex(toInt(key, "string index"), s->size(), "string")]));
    }

    if (obj.is<ListPtr>() || obj.is<TuplePtr>()) {
        const bool tuple = obj.is<TuplePtr>();
        const std::vector<Value>& items = tuple ? obj.as<TuplePtr>()->items : obj.as<ListPtr>()->items;
        if (const auto* slice = key.ptr<SlicePtr>()) {
            std::vector<Value> out;
            for (size_t i : slicePositions(**slice, items.size())) out.push_back(items[i]);
            return tuple ? makeTuple(std::move(out)) : makeList(std::move(out));
        }
        if (!key.is<int64_t>() && !key.is<bool>()) {
            throw ScriptError("TypeError", std::string(tuple ? "tuple" : "list") +
                                               " indices must be integers or slices, not " + typeName(key));
        }
        return items[normalizeIndex(toInt(key, "index"), items.size(), tuple ? "tuple" : "list")];
    }
    throw ScriptError("TypeError", "'" + typeName(obj) + "' object is not subscriptable");
}

void setItem(const Value& obj, const Value& key, const Value& value) {
    if (obj.isFrame()) {
        frameSetItem(obj, key, value);
        return;
    }
    if (obj.isSeries()) {
        seriesSetItem(obj, key, value);
        return;
    }
    if (obj.is<std::shared_ptr<Accessor>>()) {
        accessorSetItem(obj, key, value);
        return;
    }
    if (const auto* d = obj.ptr<DictPtr>()) {
        (*d)->set(key, value);
        return;
    }
    if (const auto* l = obj.ptr<ListPtr>()) {
        auto& items = (*l)->items;
        items[normalizeIndex(toInt(key, "list index"), items.size(), "list assignment")] = value;
        return;
    }
    throw ScriptError("TypeError", "'" + typeName(obj) + "' object does not support item assignment");
}

std::string formatValue(const Value& v, const std::string& spec) {
    if (spec.empty()) return str(v);
    if (v.isFrame() || v.isSeries()) {
        throw ScriptError("TypeError", "unsupported format string passed to " + typeName(v) + ".__format__");
    }
    if (const auto* ts = v.ptr<Timestamp>()) return formatTimestamp(*ts, spec);

    const FormatSpec fs = parseSpec(spec);
    if (const auto* s = v.ptr<std::string>()) {
        if (fs.type != 0 && fs.type != 's') {
            throw ScriptError("ValueError", std::string("Unknown format code '") + fs.type + "' for object of type 'str'");
        }
        std::string body = *s;
        if (fs.precision >= 0 && body.size() > static_cast<size_t>(fs.precision)) body.resize(static_cast<size_t>(fs.precision));
        return pad(body, fs, '<');
    }

    const bool floatType = fs.type == 'f' || fs.type == 'F' || fs.type == 'e' || fs.type == 'E' ||
                           fs.type == 'g' || fs.type == 'G' || fs.type == '%' || fs.type == 'n';
    if (const auto* b = v.ptr<bool>()) {
        if (fs.type == 0) return pad(*b ? "True" : "False", fs, '<');
        if (floatType) return formatFloat(*b ? 1.0 : 0.0, fs);
        return formatInt(*b ? 1 : 0, fs);
    }
    if (const auto* i = v.ptr<int64_t>()) {
        if (floatType) return formatFloat(static_cast<double>(*i), fs);
        if (fs.type == 0 || fs.type == 'd' || fs.type == 'x' || fs.type == 'X' || fs.type == 'b' || fs.type == 'o') {
            return formatInt(*i, fs);
        }
        throw ScriptError("ValueError", std::string("Unknown format code '") + fs.type + "' for object of type 'int'");
    }
    if (const auto* d = v.ptr<double>()) {
        if (fs.type == 0 || floatType) return formatFloat(*d, fs);
        throw ScriptError("ValueError", std::string("Unknown format code '") + fs.type + "' for object of type 'float'");
    }
    if (fs.type != 0 && fs.type != 's') {
        throw ScriptError("TypeError", "unsupported format string passed to " + typeName(v) + ".__format__");
    }
    return pad(str(v), fs, '<');
}

} // namespace Runtime
} // namespace Tabula
