#include "ScriptRuntime.h"

#include "CommonUtils.h"
#include "FrameFormat.h"
#include "TabulaExceptions.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <unordered_map>
#include <unordered_set>

namespace Tabula {
namespace Runtime {

namespace {

using ListPtr = std::shared_ptr<ListValue>;
using TuplePtr = std::shared_ptr<TupleValue>;
using DictPtr = std::shared_ptr<DictValue>;
using SetPtr = std::shared_ptr<SetValue>;
using CallablePtr = std::shared_ptr<Callable>;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

const char* moduleName(ModuleKind kind) {
    switch (kind) {
        case ModuleKind::PANDAS: return "pandas";
        case ModuleKind::NUMPY: return "numpy";
        case ModuleKind::PLOTLY_EXPRESS: return "plotly.express";
        case ModuleKind::GRAPH_OBJECTS: return "plotly.graph_objects";
    }
    return "module";
}

[[noreturn]] void noAttribute(const Value& obj, const std::string& name) {
    throw ScriptError("AttributeError", "'" + typeName(obj) + "' object has no attribute '" + name + "'");
}

size_t utf8Length(const std::string& s) {
    size_t n = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
    }
    return n;
}

bool hasMethod(const Value& obj, const std::string& name) {
    static const std::unordered_set<std::string> stringMethods = {
        "lower", "upper", "strip", "lstrip", "rstrip", "title", "capitalize", "split", "join", "replace",
        "startswith", "endswith", "find", "count", "format", "isdigit", "isalpha", "isnumeric", "isalnum",
        "zfill", "center", "ljust", "rjust", "splitlines"
    };
    static const std::unordered_set<std::string> listMethods = {
        "append", "extend", "insert", "pop", "remove", "index", "count", "sort", "reverse", "copy", "clear"
    };
    static const std::unordered_set<std::string> dictMethods = {
        "keys", "values", "items", "get", "update", "pop", "setdefault", "copy"
    };
    static const std::unordered_set<std::string> setMethods = {
        "add", "update", "discard", "remove", "union", "intersection", "difference", "copy"
    };
    static const std::unordered_set<std::string> timestampMethods = {"strftime", "isoformat", "date", "day_name",
                                                                     "month_name"};
    if (obj.is<std::string>()) return stringMethods.count(name) != 0;
    if (obj.is<ListPtr>()) return listMethods.count(name) != 0;
    if (obj.is<TuplePtr>()) return name == "index" || name == "count";
    if (obj.is<DictPtr>()) return dictMethods.count(name) != 0;
    if (obj.is<SetPtr>()) return setMethods.count(name) != 0;
    if (obj.is<Timestamp>()) return timestampMethods.count(name) != 0;
    if (obj.is<double>()) return name == "is_integer";
    return false;
}

std::optional<Value> timestampAttribute(Timestamp ts, const std::string& name) {
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
    if (name == "year") return Value(static_cast<int64_t>(y));
    if (name == "month") return Value(static_cast<int64_t>(m));
    if (name == "day") return Value(static_cast<int64_t>(d));
    if (name == "hour") return Value(secs / 3600);
    if (name == "minute") return Value((secs / 60) % 60);
    if (name == "second") return Value(secs % 60);
    if (name == "dayofweek" || name == "weekday") return Value(((days % 7) + 7 + 3) % 7);
    if (name == "quarter") return Value(static_cast<int64_t>((m - 1) / 3 + 1));
    return std::nullopt;
}

std::vector<Value> argItems(const CallArgs& args, const std::string& function) {
    if (args.positional.size() == 1) return iterate(args.positional.front());
    if (args.positional.empty()) throw ScriptError("TypeError", function + " expected at least 1 argument, got 0");
    return args.positional;
}

Value keyOf(const Value& item, const Value* key) {
    if (key == nullptr || key->isNone()) return item;
    CallArgs one;
    one.positional.push_back(item);
    return call(*key, one);
}

Value extreme(const CallArgs& args, bool wantMax) {
    const std::string function = wantMax ? "max" : "min";
    if (args.positional.size() == 1 && args.positional.front().isSeries()) {
        const Column& col = args.positional.front().series().values;
        return scalarValue(FrameOps::reduce(col, wantMax ? Reduction::MAX : Reduction::MIN), col.type);
    }
    const std::vector<Value> items = argItems(args, function + "()");
    const Value* key = args.keyword("key");
    if (items.empty()) {
        if (const Value* fallback = args.keyword("default")) return *fallback;
        throw ScriptError("ValueError", function + "() arg is an empty sequence");
    }
    size_t best = 0;
    Value bestKey = keyOf(items[0], key);
    for (size_t i = 1; i < items.size(); ++i) {
        Value k = keyOf(items[i], key);
        const bool better = wantMax ? valueLess(bestKey, k) : valueLess(k, bestKey);
        if (better) {
            best = i;
            bestKey = std::move(k);
        }
    }
    return items[best];
}

Value roundValue(const Value& v, const Value* digits) {
    const bool hasDigits = digits != nullptr && !digits->isNone();
    const int n = hasDigits ? static_cast<int>(toInt(*digits, "round")) : 0;
    if (v.isSeries()) return makeSeries(Series(FrameOps::roundColumn(v.series().values, n), v.series().index));
    if (v.isFrame()) {
        DataFrame out = v.frame();
        for (auto& col : out.columns) {
            if (col.isNumericLike()) col = FrameOps::roundColumn(col, n);
        }
        return makeFrame(std::move(out));
    }
    if (v.is<int64_t>() || v.is<bool>()) {
        const int64_t i = toInt(v, "round");
        if (n >= 0) return Value(i);
        const double scale = std::pow(10.0, -n);
        return Value(static_cast<int64_t>(std::nearbyint(static_cast<double>(i) / scale) * scale));
    }
    const double d = toDouble(v, "round");
    if (hasDigits) return Value(FrameOps::roundHalfEven(d, n));
    if (std::isnan(d)) throw ScriptError("ValueError", "cannot convert float NaN to integer");
    if (std::isinf(d)) throw ScriptError("OverflowError", "cannot convert float infinity to integer");
    return Value(static_cast<int64_t>(std::nearbyint(d)));
}

Value absValue(const Value& v) {
    if (v.isSeries()) return makeSeries(Series(FrameOps::absolute(v.series().values), v.series().index));
    if (v.isFrame()) {
        DataFrame out;
        out.index = v.frame().index;
        for (const auto& col : v.frame().columns) out.columns.push_back(FrameOps::absolute(col));
        return makeFrame(std::move(out));
    }
    if (const auto* i = v.ptr<int64_t>()) {
        if (*i == std::numeric_limits<int64_t>::min()) return Value(-static_cast<double>(*i));
        return Value(*i < 0 ? -*i : *i);
    }
    if (const auto* b = v.ptr<bool>()) return Value(static_cast<int64_t>(*b ? 1 : 0));
    if (const auto* d = v.ptr<double>()) return Value(std::fabs(*d));
    throw ScriptError("TypeError", "bad operand type for abs(): '" + typeName(v) + "'");
}

Value intFrom(const Value& v, const Value* base) {
    if (const auto* s = v.ptr<std::string>()) {
        const int radix = (base == nullptr || base->isNone()) ? 10 : static_cast<int>(toInt(*base, "int"));
        std::string text = CommonUtils::trim(*s);
        text.erase(std::remove(text.begin(), text.end(), '_'), text.end());
        try {
            size_t pos = 0;
            const long long parsed = std::stoll(text, &pos, radix);
            if (pos == text.size() && !text.empty()) return Value(static_cast<int64_t>(parsed));
        } catch (const std::exception&) {
            // Reported below with Python's wording.
        }
        throw ScriptError("ValueError", "invalid literal for int() with base " + std::to_string(radix) + ": " +
                                            FrameFormat::quoteString(*s));
    }
    if (const auto* d = v.ptr<double>()) {
        if (std::isnan(*d)) throw ScriptError("ValueError", "cannot convert float NaN to integer");
        if (std::isinf(*d)) throw ScriptError("OverflowError", "cannot convert float infinity to integer");
        if (std::fabs(*d) >= 9.2e18) throw ScriptError("OverflowError", "int too large to convert");
        return Value(static_cast<int64_t>(std::trunc(*d)));
    }
    if (v.is<int64_t>() || v.is<bool>()) return Value(toInt(v, "int"));
    throw ScriptError("TypeError", "int() argument must be a string or a real number, not '" + typeName(v) + "'");
}

Value floatFrom(const Value& v) {
    if (const auto* s = v.ptr<std::string>()) {
        const std::string text = CommonUtils::toLower(CommonUtils::trim(*s));
        if (text == "nan" || text == "+nan" || text == "-nan") return Value(kNaN);
        if (text == "inf" || text == "+inf" || text == "infinity") return Value(std::numeric_limits<double>::infinity());
        if (text == "-inf" || text == "-infinity") return Value(-std::numeric_limits<double>::infinity());
        try {
            size_t pos = 0;
            const double parsed = std::stod(text, &pos);
            if (pos == text.size()) return Value(parsed);
        } catch (const std::exception&) {
            // Reported below with Python's wording.
        }
        throw ScriptError("ValueError", "could not convert string to float: " + FrameFormat::quoteString(*s));
    }
    if (v.isNumber()) return Value(toDouble(v, "float"));
    throw ScriptError("TypeError", "float() argument must be a string or a real number, not '" + typeName(v) + "'");
}

Value dictFrom(const CallArgs& args) {
    auto dict = std::make_shared<DictValue>();
    if (!args.positional.empty()) {
        const Value& source = args.positional.front();
        if (const auto* d = source.ptr<DictPtr>()) {
            dict->items = (*d)->items;
        } else {
            for (const auto& pair : iterate(source)) {
                const std::vector<Value> kv = iterate(pair);
                if (kv.size() != 2) {
                    throw ScriptError("ValueError", "dictionary update sequence element has length " +
                                                        std::to_string(kv.size()) + "; 2 is required");
                }
                dict->set(kv[0], kv[1]);
            }
        }
    }
    for (const auto& kw : args.keywords) dict->set(Value(kw.first), kw.second);
    return Value(dict);
}

Value rangeOf(const CallArgs& args) {
    args.expectAtMost(3, "range");
    int64_t start = 0;
    int64_t stop = 0;
    int64_t step = 1;
    if (args.positional.size() == 1) {
        stop = toInt(args.positional[0], "range");
    } else if (args.positional.size() >= 2) {
        start = toInt(args.positional[0], "range");
        stop = toInt(args.positional[1], "range");
        if (args.positional.size() == 3) step = toInt(args.positional[2], "range");
    } else {
        throw ScriptError("TypeError", "range expected at least 1 argument, got 0");
    }
    if (step == 0) throw ScriptError("ValueError", "range() arg 3 must not be zero");
    std::vector<Value> items;
    if (step > 0) {
        for (int64_t i = start; i < stop; i += step) items.emplace_back(i);
    } else {
        for (int64_t i = start; i > stop; i += step) items.emplace_back(i);
    }
    return makeList(std::move(items));
}

bool isInstance(const Value& obj, const Value& cls) {
    if (const auto* t = cls.ptr<TuplePtr>()) {
        for (const auto& c : (*t)->items) {
            if (isInstance(obj, c)) return true;
        }
        return false;
    }
    const auto* fn = cls.ptr<CallablePtr>();
    if (fn == nullptr) throw ScriptError("TypeError", "isinstance() arg 2 must be a type or tuple of types");
    const std::string& name = (*fn)->name;
    if ((*fn)->kind == Callable::Kind::METHOD) {
        if (name == "DataFrame") return obj.isFrame();
        if (name == "Series") return obj.isSeries();
        if (name == "Timestamp") return obj.is<Timestamp>();
        throw ScriptError("TypeError", "isinstance() arg 2 must be a type or tuple of types");
    }
    if (name == "int") return obj.is<int64_t>() || obj.is<bool>();
    if (name == "float") return obj.is<double>();
    if (name == "str") return obj.is<std::string>();
    if (name == "bool") return obj.is<bool>();
    if (name == "list") return obj.is<ListPtr>();
    if (name == "tuple") return obj.is<TuplePtr>();
    if (name == "dict") return obj.is<DictPtr>();
    if (name == "set") return obj.is<SetPtr>();
    throw ScriptError("TypeError", "isinstance() arg 2 must be a type or tuple of types");
}

std::vector<std::string> splitText(const std::string& s, const Value* sep, int64_t maxsplit) {
    std::vector<std::string> parts;
    if (sep == nullptr || sep->isNone()) {
        size_t i = 0;
        while (i < s.size()) {
            while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
            if (i >= s.size()) break;
            if (maxsplit >= 0 && static_cast<int64_t>(parts.size()) == maxsplit) {
                std::string rest = s.substr(i);
                while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.back()))) rest.pop_back();
                parts.push_back(rest);
                break;
            }
            size_t j = i;
            while (j < s.size() && !std::isspace(static_cast<unsigned char>(s[j]))) ++j;
            parts.push_back(s.substr(i, j - i));
            i = j;
        }
        return parts;
    }
    const std::string& delim = toText(*sep, "split");
    if (delim.empty()) throw ScriptError("ValueError", "empty separator");
    size_t start = 0;
    while (true) {
        if (maxsplit >= 0 && static_cast<int64_t>(parts.size()) == maxsplit) break;
        const size_t pos = s.find(delim, start);
        if (pos == std::string::npos) break;
        parts.push_back(s.substr(start, pos - start));
        start = pos + delim.size();
    }
    parts.push_back(s.substr(start));
    return parts;
}

std::string stripChars(const std::string& s, const Value* chars, bool left, bool right) {
    const std::string set = (chars == nullptr || chars->isNone()) ? std::string(" \t\n\r\f\v") : toText(*chars, "strip");
    size_t begin = 0;
    size_t end = s.size();
    if (left) {
        while (begin < end && set.find(s[begin]) != std::string::npos) ++begin;
    }
    if (right) {
        while (end > begin && set.find(s[end - 1]) != std::string::npos) --end;
    }
    return s.substr(begin, end - begin);
}

std::string titleCase(const std::string& s) {
    std::string out = s;
    bool startOfWord = true;
    for (char& c : out) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (std::isalpha(u)) {
            c = static_cast<char>(startOfWord ? std::toupper(u) : std::tolower(u));
            startOfWord = false;
        } else {
            startOfWord = true;
        }
    }
    return out;
}

std::string formatTemplate(const std::string& pattern, const CallArgs& args) {
    std::string out;
    size_t autoIndex = 0;
    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '}') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '}') ++i;
            out.push_back('}');
            continue;
        }
        if (c != '{') {
            out.push_back(c);
            continue;
        }
        if (i + 1 < pattern.size() && pattern[i + 1] == '{') {
            out.push_back('{');
            ++i;
            continue;
        }
        const size_t close = pattern.find('}', i);
        if (close == std::string::npos) throw ScriptError("ValueError", "Single '{' encountered in format string");
        std::string field = pattern.substr(i + 1, close - i - 1);
        i = close;

        std::string spec;
        const size_t colon = field.find(':');
        if (colon != std::string::npos) {
            spec = field.substr(colon + 1);
            field = field.substr(0, colon);
        }
        char conversion = 0;
        const size_t bang = field.find('!');
        if (bang != std::string::npos && bang + 1 < field.size()) {
            conversion = field[bang + 1];
            field = field.substr(0, bang);
        }

        const Value* arg = nullptr;
        if (field.empty()) {
            if (autoIndex >= args.positional.size()) {
                throw ScriptError("IndexError", "Replacement index " + std::to_string(autoIndex) +
                                                    " out of range for positional args tuple");
            }
            arg = &args.positional[autoIndex++];
        } else if (std::all_of(field.begin(), field.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
            const size_t idx = static_cast<size_t>(std::stoul(field));
            if (idx >= args.positional.size()) {
                throw ScriptError("IndexError", "Replacement index " + field + " out of range for positional args tuple");
            }
            arg = &args.positional[idx];
        } else {
            arg = args.keyword(field);
            if (arg == nullptr) throw ScriptError("KeyError", FrameFormat::quoteString(field));
        }
        Value v = *arg;
        if (conversion == 'r' || conversion == 'a') v = Value(repr(v));
        else if (conversion == 's') v = Value(str(v));
        out += formatValue(v, spec);
    }
    return out;
}

Value stringMethod(const std::string& s, const std::string& name, const CallArgs& args) {
    if (name == "lower") return Value(CommonUtils::toLower(s));
    if (name == "upper") return Value(CommonUtils::toUpper(s));
    if (name == "strip") return Value(stripChars(s, args.get(0, "chars"), true, true));
    if (name == "lstrip") return Value(stripChars(s, args.get(0, "chars"), true, false));
    if (name == "rstrip") return Value(stripChars(s, args.get(0, "chars"), false, true));
    if (name == "title") return Value(titleCase(s));
    if (name == "capitalize") {
        std::string out = CommonUtils::toLower(s);
        if (!out.empty()) out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
        return Value(out);
    }
    if (name == "split") {
        std::vector<Value> parts;
        for (auto& p : splitText(s, args.get(0, "sep"), intArg(args, 1, "maxsplit", -1))) parts.emplace_back(std::move(p));
        return makeList(std::move(parts));
    }
    if (name == "splitlines") {
        std::vector<Value> parts;
        for (auto& p : CommonUtils::splitLines(s)) parts.emplace_back(std::move(p));
        return makeList(std::move(parts));
    }
    if (name == "join") {
        std::vector<std::string> pieces;
        for (const auto& item : iterate(args.required(0, "iterable", "join"))) {
            if (!item.is<std::string>()) {
                throw ScriptError("TypeError", "sequence item: expected str instance, " + typeName(item) + " found");
            }
            pieces.push_back(item.as<std::string>());
        }
        return Value(CommonUtils::join(pieces, s));
    }
    if (name == "replace") {
        const std::string& from = toText(args.required(0, "old", "replace"), "replace");
        const std::string& to = toText(args.required(1, "new", "replace"), "replace");
        if (from.empty()) return Value(s);
        return Value(CommonUtils::replaceAll(s, from, to));
    }
    if (name == "startswith" || name == "endswith") {
        const Value& arg = args.required(0, "prefix", name);
        std::vector<Value> options = arg.is<TuplePtr>() ? iterate(arg) : std::vector<Value>{arg};
        for (const auto& opt : options) {
            const std::string& text = toText(opt, name);
            if (name == "startswith" ? CommonUtils::startsWith(s, text) : CommonUtils::endsWith(s, text)) {
                return Value(true);
            }
        }
        return Value(false);
    }
    if (name == "find") {
        const size_t pos = s.find(toText(args.required(0, "sub", "find"), "find"));
        return Value(pos == std::string::npos ? static_cast<int64_t>(-1) : static_cast<int64_t>(pos));
    }
    if (name == "count") {
        const std::string& sub = toText(args.required(0, "sub", "count"), "count");
        if (sub.empty()) return Value(static_cast<int64_t>(utf8Length(s) + 1));
        int64_t n = 0;
        for (size_t pos = s.find(sub); pos != std::string::npos; pos = s.find(sub, pos + sub.size())) ++n;
        return Value(n);
    }
    if (name == "format") return Value(formatTemplate(s, args));
    const auto allOf = [&](int (*pred)(int)) {
        return !s.empty() && std::all_of(s.begin(), s.end(), [&](unsigned char c) { return pred(c) != 0; });
    };
    if (name == "isdigit" || name == "isnumeric") return Value(allOf(std::isdigit));
    if (name == "isalpha") return Value(allOf(std::isalpha));
    if (name == "isalnum") return Value(allOf(std::isalnum));
    if (name == "zfill") {
        const size_t width = static_cast<size_t>(std::max<int64_t>(0, toInt(args.required(0, "width", "zfill"), "zfill")));
        if (s.size() >= width) return Value(s);
        const size_t signLen = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
        return Value(s.substr(0, signLen) + std::string(width - s.size(), '0') + s.substr(signLen));
    }
    if (name == "center" || name == "ljust" || name == "rjust") {
        const int64_t width = toInt(args.required(0, "width", name), name);
        const std::string fill = textArg(args, 1, "fillchar", " ");
        const size_t len = utf8Length(s);
        if (width <= 0 || static_cast<size_t>(width) <= len || fill.empty()) return Value(s);
        const size_t gap = static_cast<size_t>(width) - len;
        const char f = fill[0];
        if (name == "ljust") return Value(s + std::string(gap, f));
        if (name == "rjust") return Value(std::string(gap, f) + s);
        const size_t left = gap / 2 + (gap % 2 != 0 && len % 2 != 0 ? 1 : 0);
        return Value(std::string(left, f) + s + std::string(gap - left, f));
    }
    throw ScriptError("AttributeError", "'str' object has no attribute '" + name + "'");
}

Value listMethod(const Value& self, const std::string& name, const CallArgs& args) {
    const bool tuple = self.is<TuplePtr>();
    std::vector<Value>& items = tuple ? self.as<TuplePtr>()->items : self.as<ListPtr>()->items;
    if (name == "index") {
        const Value& needle = args.required(0, "value", "index");
        for (size_t i = 0; i < items.size(); ++i) {
            if (valuesEqual(items[i], needle)) return Value(static_cast<int64_t>(i));
        }
        throw ScriptError("ValueError", repr(needle) + " is not in " + (tuple ? "tuple" : "list"));
    }
    if (name == "count") {
        const Value& needle = args.required(0, "value", "count");
        return Value(static_cast<int64_t>(
            std::count_if(items.begin(), items.end(), [&](const Value& v) { return valuesEqual(v, needle); })));
    }
    if (name == "append") {
        items.push_back(args.required(0, "object", "append"));
        return Value();
    }
    if (name == "extend") {
        for (auto& v : iterate(args.required(0, "iterable", "extend"))) items.push_back(std::move(v));
        return Value();
    }
    if (name == "insert") {
        int64_t pos = toInt(args.required(0, "index", "insert"), "insert");
        const int64_t n = static_cast<int64_t>(items.size());
        if (pos < 0) pos = std::max<int64_t>(0, pos + n);
        pos = std::min(pos, n);
        items.insert(items.begin() + pos, args.required(1, "object", "insert"));
        return Value();
    }
    if (name == "pop") {
        if (items.empty()) throw ScriptError("IndexError", "pop from empty list");
        const size_t pos = normalizeIndex(intArg(args, 0, "index", -1), items.size(), "pop");
        Value out = items[pos];
        items.erase(items.begin() + static_cast<std::ptrdiff_t>(pos));
        return out;
    }
    if (name == "remove") {
        const Value& needle = args.required(0, "value", "remove");
        for (auto it = items.begin(); it != items.end(); ++it) {
            if (valuesEqual(*it, needle)) {
                items.erase(it);
                return Value();
            }
        }
        throw ScriptError("ValueError", "list.remove(x): x not in list");
    }
    if (name == "sort") {
        const Value* key = args.keyword("key");
        const bool reverse = boolArg(args, 99, "reverse", false);
        std::vector<std::pair<Value, Value>> keyed;
        keyed.reserve(items.size());
        for (auto& v : items) keyed.emplace_back(keyOf(v, key), v);
        std::stable_sort(keyed.begin(), keyed.end(), [&](const auto& a, const auto& b) {
            return reverse ? valueLess(b.first, a.first) : valueLess(a.first, b.first);
        });
        for (size_t i = 0; i < items.size(); ++i) items[i] = std::move(keyed[i].second);
        return Value();
    }
    if (name == "reverse") {
        std::reverse(items.begin(), items.end());
        return Value();
    }
    if (name == "copy") return makeList(items);
    if (name == "clear") {
        items.clear();
        return Value();
    }
    noAttribute(self, name);
}

Value dictMethod(const Value& self, const std::string& name, const CallArgs& args) {
    DictValue& dict = *self.as<DictPtr>();
    if (name == "keys" || name == "values" || name == "items") {
        std::vector<Value> out;
        out.reserve(dict.items.size());
        for (const auto& kv : dict.items) {
            if (name == "keys") out.push_back(kv.first);
            else if (name == "values") out.push_back(kv.second);
            else out.push_back(makeTuple({kv.first, kv.second}));
        }
        return makeList(std::move(out));
    }
    if (name == "get") {
        const Value* v = dict.find(args.required(0, "key", "get"));
        if (v != nullptr) return *v;
        const Value* fallback = args.get(1, "default");
        return fallback == nullptr ? Value() : *fallback;
    }
    if (name == "update") {
        if (!args.positional.empty()) {
            const Value merged = dictFrom(args);
            for (const auto& kv : merged.as<DictPtr>()->items) dict.set(kv.first, kv.second);
        } else {
            for (const auto& kw : args.keywords) dict.set(Value(kw.first), kw.second);
        }
        return Value();
    }
    if (name == "pop") {
        const Value& key = args.required(0, "key", "pop");
        for (auto it = dict.items.begin(); it != dict.items.end(); ++it) {
            if (valuesEqual(it->first, key)) {
                Value out = it->second;
                dict.items.erase(it);
                return out;
            }
        }
        if (const Value* fallback = args.get(1, "default")) return *fallback;
        throw ScriptError("KeyError", repr(key));
    }
    if (name == "setdefault") {
        const Value& key = args.required(0, "key", "setdefault");
        if (const Value* v = dict.find(key)) return *v;
        const Value* fallback = args.get(1, "default");
        Value v = fallback == nullptr ? Value() : *fallback;
        dict.set(key, v);
        return v;
    }
    if (name == "copy") return Value(std::make_shared<DictValue>(dict));
    noAttribute(self, name);
}

Value setMethod(const Value& self, const std::string& name, const CallArgs& args) {
    SetValue& set = *self.as<SetPtr>();
    if (name == "add") {
        set.add(args.required(0, "elem", "add"));
        return Value();
    }
    if (name == "update") {
        for (const auto& arg : args.positional) {
            for (const auto& v : iterate(arg)) set.add(v);
        }
        return Value();
    }
    if (name == "discard" || name == "remove") {
        const Value& needle = args.required(0, "elem", name);
        for (auto it = set.items.begin(); it != set.items.end(); ++it) {
            if (valuesEqual(*it, needle)) {
                set.items.erase(it);
                return Value();
            }
        }
        if (name == "remove") throw ScriptError("KeyError", repr(needle));
        return Value();
    }
    auto out = std::make_shared<SetValue>();
    if (name == "copy") {
        out->items = set.items;
        return Value(out);
    }
    if (name == "union") {
        out->items = set.items;
        for (const auto& arg : args.positional) {
            for (const auto& v : iterate(arg)) out->add(v);
        }
        return Value(out);
    }
    if (name == "intersection" || name == "difference") {
        SetValue other;
        for (const auto& arg : args.positional) {
            for (const auto& v : iterate(arg)) other.add(v);
        }
        for (const auto& v : set.items) {
            if (other.contains(v) == (name == "intersection")) out->add(v);
        }
        return Value(out);
    }
    noAttribute(self, name);
}

Value timestampMethod(Timestamp ts, const std::string& name, const CallArgs& args) {
    static const char* const months[] = {"January", "February", "March", "April", "May", "June", "July",
                                         "August", "September", "October", "November", "December"};
    if (name == "strftime") return Value(formatTimestamp(ts, toText(args.required(0, "format", "strftime"), "strftime")));
    if (name == "isoformat") return Value(formatTimestamp(ts, "%Y-%m-%dT%H:%M:%S"));
    if (name == "day_name") return Value(formatTimestamp(ts, "%A"));
    if (name == "month_name") {
        const int64_t m = timestampAttribute(ts, "month")->as<int64_t>();
        return Value(std::string(months[m - 1]));
    }
    int64_t days = ts.seconds / 86400;
    if (ts.seconds % 86400 < 0) --days;
    return Value(Timestamp{days * 86400});
}

// Elementwise float function over a scalar, list or series (NaN passes through).
Value mapNumeric(const Value& v, double (*fn)(double), const std::string& name) {
    if (v.isSeries()) {
        const Series& s = v.series();
        if (!s.values.isNumericLike()) {
            throw ScriptError("TypeError", "ufunc '" + name + "' not supported for the input types");
        }
        std::vector<double> out(s.size(), kNaN);
        for (size_t i = 0; i < s.size(); ++i) {
            if (!s.values.isMissing(i)) out[i] = fn(s.values.numberAt(i));
        }
        return makeSeries(Series(Column::fromDoubles(s.name(), std::move(out)), s.index));
    }
    if (v.is<ListPtr>() || v.is<TuplePtr>()) {
        std::vector<Value> out;
        for (const auto& item : iterate(v)) out.emplace_back(fn(toDouble(item, name)));
        return makeList(std::move(out));
    }
    return Value(fn(toDouble(v, name)));
}

Value reduceValue(const Value& v, Reduction r, int ddof) {
    const Column col = toSeries(v, std::string("np.") + FrameOps::reductionName(r)).values;
    return scalarValue(FrameOps::reduce(col, r, ddof), col.type);
}

Value whereValue(const CallArgs& args) {
    const Value& cond = args.required(0, "condition", "where");
    const Value& a = args.required(1, "x", "where");
    const Value& b = args.required(2, "y", "where");
    const Series mask = toSeries(cond, "np.where");
    const auto pick = [&](const Value& side, size_t i) -> Scalar {
        if (side.isSeries() || side.is<ListPtr>() || side.is<TuplePtr>()) {
            const Series s = toSeries(side, "np.where");
            if (s.size() != mask.size()) throw ScriptError("ValueError", "operands could not be broadcast together");
            return s.values.at(i);
        }
        return requireScalar(side, "np.where");
    };
    const Series sa = (a.isSeries() || a.is<ListPtr>() || a.is<TuplePtr>()) ? toSeries(a, "np.where") : Series();
    const Series sb = (b.isSeries() || b.is<ListPtr>() || b.is<TuplePtr>()) ? toSeries(b, "np.where") : Series();
    std::vector<Scalar> cells;
    cells.reserve(mask.size());
    for (size_t i = 0; i < mask.size(); ++i) {
        const Scalar flag = mask.values.at(i);
        const bool yes = !scalarIsMissing(flag) && scalarToNumber(flag).value_or(0.0) != 0.0;
        if (yes) cells.push_back(sa.size() == mask.size() ? sa.values.at(i) : pick(a, i));
        else cells.push_back(sb.size() == mask.size() ? sb.values.at(i) : pick(b, i));
    }
    Column out = Column::fromScalars("", cells);
    if (cond.isSeries()) return makeSeries(Series(std::move(out), cond.series().index));
    return makeSeries(Series(std::move(out)));
}

} // namespace

// ---------------------------------------------------------------------------
// Attribute lookup

Value getAttribute(const Value& obj, const std::string& name) {
    if (const auto* m = obj.ptr<ModuleRef>()) {
        bool found = false;
        switch (m->kind) {
            case ModuleKind::PANDAS:
                if (name == "NA" || name == "NaT") return Value();
                found = pandasHas(name);
                break;
            case ModuleKind::NUMPY:
                if (name == "nan" || name == "NaN" || name == "NAN") return Value(kNaN);
                if (name == "inf" || name == "Inf") return Value(std::numeric_limits<double>::infinity());
                if (name == "pi") return Value(3.141592653589793);
                if (name == "e") return Value(2.718281828459045);
                found = numpyHas(name);
                break;
            case ModuleKind::PLOTLY_EXPRESS:
                found = plotExpressHas(name);
                break;
            case ModuleKind::GRAPH_OBJECTS:
                found = graphObjectsHas(name);
                break;
        }
        if (!found) {
            throw ScriptError("AttributeError", std::string("module '") + moduleName(m->kind) +
                                                    "' has no attribute '" + name + "'");
        }
        return boundMethod(obj, name);
    }

    std::optional<Value> found;
    if (obj.isFrame()) found = frameAttribute(obj, name);
    else if (obj.isSeries()) found = seriesAttribute(obj, name);
    else if (obj.is<std::shared_ptr<GroupByValue>>()) found = groupByAttribute(obj, name);
    else if (obj.is<std::shared_ptr<Accessor>>()) found = accessorAttribute(obj, name);
    else if (obj.is<std::shared_ptr<Figure>>() || obj.is<std::shared_ptr<Trace>>()) found = figureAttribute(obj, name);
    else if (const auto* ts = obj.ptr<Timestamp>()) found = timestampAttribute(*ts, name);
    if (found) return *found;

    if (hasMethod(obj, name)) return boundMethod(obj, name);
    noAttribute(obj, name);
}

// ---------------------------------------------------------------------------
// Calls

Value call(const Value& fn, const CallArgs& args) {
    const auto* callable = fn.ptr<CallablePtr>();
    if (callable == nullptr) throw ScriptError("TypeError", "'" + typeName(fn) + "' object is not callable");
    const Callable& c = **callable;
    if (c.kind == Callable::Kind::BUILTIN) return callBuiltin(c.name, args);

    const Value& self = c.receiver;
    if (const auto* m = self.ptr<ModuleRef>()) {
        switch (m->kind) {
            case ModuleKind::PANDAS: return pandasFunction(c.name, args);
            case ModuleKind::NUMPY: return numpyFunction(c.name, args);
            case ModuleKind::PLOTLY_EXPRESS: return plotExpress(c.name, args);
            case ModuleKind::GRAPH_OBJECTS: return graphObjects(c.name, args);
        }
    }
    if (self.isFrame()) return callFrameMethod(self, c.name, args);
    if (self.isSeries()) return callSeriesMethod(self, c.name, args);
    if (self.is<std::shared_ptr<GroupByValue>>()) return callGroupByMethod(self, c.name, args);
    if (self.is<std::shared_ptr<Accessor>>()) return callAccessorMethod(self, c.name, args);
    if (self.is<std::shared_ptr<Figure>>() || self.is<std::shared_ptr<Trace>>()) return callFigureMethod(self, c.name, args);
    return callPlainMethod(self, c.name, args);
}

Value callPlainMethod(const Value& self, const std::string& name, const CallArgs& args) {
    if (const auto* s = self.ptr<std::string>()) return stringMethod(*s, name, args);
    if (self.is<ListPtr>() || self.is<TuplePtr>()) return listMethod(self, name, args);
    if (self.is<DictPtr>()) return dictMethod(self, name, args);
    if (self.is<SetPtr>()) return setMethod(self, name, args);
    if (const auto* ts = self.ptr<Timestamp>()) return timestampMethod(*ts, name, args);
    if (const auto* d = self.ptr<double>()) {
        if (name == "is_integer") return Value(std::isfinite(*d) && std::trunc(*d) == *d);
    }
    noAttribute(self, name);
}

Value callBuiltin(const std::string& name, const CallArgs& args) {
    if (name == "print") return Value();
    if (name == "len") {
        const Value& v = args.required(0, "obj", "len");
        if (const auto* s = v.ptr<std::string>()) return Value(utf8Length(*s));
        if (v.isFrame()) return Value(v.frame().rows());
        if (v.isSeries()) return Value(v.series().size());
        if (const auto* g = v.ptr<std::shared_ptr<GroupByValue>>()) {
            std::vector<const Column*> keys;
            for (const auto& k : (*g)->keys) keys.push_back(&k);
            return Value(FrameOps::groupRows(keys, false, (*g)->dropna).members.size());
        }
        if (const auto* f = v.ptr<std::shared_ptr<Figure>>()) return Value((*f)->data.size());
        if (v.is<ListPtr>() || v.is<TuplePtr>() || v.is<DictPtr>() || v.is<SetPtr>()) return Value(iterate(v).size());
        throw ScriptError("TypeError", "object of type '" + typeName(v) + "' has no len()");
    }
    if (name == "sum") {
        const Value& v = args.required(0, "iterable", "sum");
        if (v.isSeries()) return scalarValue(FrameOps::reduce(v.series().values, Reduction::SUM), v.series().values.type);
        const Value* start = args.get(1, "start");
        Value total = start == nullptr ? Value(static_cast<int64_t>(0)) : *start;
        for (const auto& item : iterate(v)) total = binary(ArithOp::ADD, total, item);
        return total;
    }
    if (name == "min") return extreme(args, false);
    if (name == "max") return extreme(args, true);
    if (name == "round") return roundValue(args.required(0, "number", "round"), args.get(1, "ndigits"));
    if (name == "abs") return absValue(args.required(0, "x", "abs"));
    if (name == "sorted") {
        std::vector<Value> items = iterate(args.required(0, "iterable", "sorted"));
        const Value* key = args.keyword("key");
        const bool reverse = boolArg(args, 99, "reverse", false);
        std::vector<std::pair<Value, Value>> keyed;
        keyed.reserve(items.size());
        for (auto& v : items) keyed.emplace_back(keyOf(v, key), v);
        std::stable_sort(keyed.begin(), keyed.end(), [&](const auto& a, const auto& b) {
            return reverse ? valueLess(b.first, a.first) : valueLess(a.first, b.first);
        });
        std::vector<Value> out;
        out.reserve(keyed.size());
        for (auto& kv : keyed) out.push_back(std::move(kv.second));
        return makeList(std::move(out));
    }
    if (name == "reversed") {
        std::vector<Value> items = iterate(args.required(0, "sequence", "reversed"));
        std::reverse(items.begin(), items.end());
        return makeList(std::move(items));
    }
    if (name == "list") return makeList(args.positional.empty() ? std::vector<Value>{} : iterate(args.positional[0]));
    if (name == "tuple") return makeTuple(args.positional.empty() ? std::vector<Value>{} : iterate(args.positional[0]));
    if (name == "set") {
        auto set = std::make_shared<SetValue>();
        if (!args.positional.empty()) {
            for (const auto& v : iterate(args.positional[0])) set->add(v);
        }
        return Value(set);
    }
    if (name == "dict") return dictFrom(args);
    if (name == "range") return rangeOf(args);
    if (name == "enumerate") {
        int64_t i = intArg(args, 1, "start", 0);
        std::vector<Value> out;
        for (auto& v : iterate(args.required(0, "iterable", "enumerate"))) out.push_back(makeTuple({Value(i++), v}));
        return makeList(std::move(out));
    }
    if (name == "zip") {
        std::vector<std::vector<Value>> columns;
        size_t n = std::numeric_limits<size_t>::max();
        for (const auto& arg : args.positional) {
            columns.push_back(iterate(arg));
            n = std::min(n, columns.back().size());
        }
        if (columns.empty()) n = 0;
        std::vector<Value> out;
        for (size_t i = 0; i < n; ++i) {
            std::vector<Value> row;
            for (const auto& c : columns) row.push_back(c[i]);
            out.push_back(makeTuple(std::move(row)));
        }
        return makeList(std::move(out));
    }
    if (name == "str") return Value(args.positional.empty() ? std::string() : str(args.positional[0]));
    if (name == "int") {
        if (args.positional.empty()) return Value(static_cast<int64_t>(0));
        return intFrom(args.positional[0], args.get(1, "base"));
    }
    if (name == "float") return args.positional.empty() ? Value(0.0) : floatFrom(args.positional[0]);
    if (name == "bool") return Value(!args.positional.empty() && truthy(args.positional[0]));
    if (name == "any" || name == "all") {
        const bool wantAny = name == "any";
        for (const auto& v : iterate(args.required(0, "iterable", name))) {
            if (truthy(v) == wantAny) return Value(wantAny);
        }
        return Value(!wantAny);
    }
    if (name == "isinstance") {
        return Value(isInstance(args.required(0, "obj", "isinstance"), args.required(1, "class_or_tuple", "isinstance")));
    }
    if (name == "format") return Value(formatValue(args.required(0, "value", "format"), textArg(args, 1, "format_spec", "")));
    throw ScriptError("NameError", "name '" + name + "' is not defined");
}

// ---------------------------------------------------------------------------
// numpy facade

bool numpyHas(const std::string& name) {
    static const std::unordered_set<std::string> names = {
        "mean", "average", "sum", "min", "max", "median", "std", "var", "round", "around", "abs", "absolute",
        "sqrt", "log", "log10", "log2", "exp", "floor", "ceil", "isnan", "where", "arange", "array", "percentile",
        "quantile", "unique", "cumsum", "prod", "nanmean", "nansum", "nanmax", "nanmin"
    };
    return names.count(name) != 0;
}

Value numpyFunction(const std::string& name, const CallArgs& args) {
    static const std::unordered_map<std::string, Reduction> reductions = {
        {"mean", Reduction::MEAN}, {"average", Reduction::MEAN}, {"nanmean", Reduction::MEAN},
        {"sum", Reduction::SUM}, {"nansum", Reduction::SUM}, {"min", Reduction::MIN}, {"nanmin", Reduction::MIN},
        {"max", Reduction::MAX}, {"nanmax", Reduction::MAX}, {"median", Reduction::MEDIAN},
        {"std", Reduction::STD}, {"var", Reduction::VAR}, {"prod", Reduction::PROD}
    };
    auto red = reductions.find(name);
    if (red != reductions.end()) {
        const Value& v = args.required(0, "a", "np." + name);
        if (v.isFrame()) {
            CallArgs forwarded;
            forwarded.keywords = args.keywords;
            return callFrameMethod(v, FrameOps::reductionName(red->second), forwarded);
        }
        return reduceValue(v, red->second, static_cast<int>(intArg(args, 99, "ddof", 0)));
    }

    if (name == "round" || name == "around") return roundValue(args.required(0, "a", "np.round"), args.get(1, "decimals"));
    if (name == "abs" || name == "absolute") return absValue(args.required(0, "x", "np.abs"));
    if (name == "sqrt") return mapNumeric(args.required(0, "x", name), [](double x) { return std::sqrt(x); }, name);
    if (name == "log") return mapNumeric(args.required(0, "x", name), [](double x) { return std::log(x); }, name);
    if (name == "log10") return mapNumeric(args.required(0, "x", name), [](double x) { return std::log10(x); }, name);
    if (name == "log2") return mapNumeric(args.required(0, "x", name), [](double x) { return std::log2(x); }, name);
    if (name == "exp") return mapNumeric(args.required(0, "x", name), [](double x) { return std::exp(x); }, name);
    if (name == "floor") return mapNumeric(args.required(0, "x", name), [](double x) { return std::floor(x); }, name);
    if (name == "ceil") return mapNumeric(args.required(0, "x", name), [](double x) { return std::ceil(x); }, name);
    if (name == "isnan") {
        const Value& v = args.required(0, "x", name);
        if (v.isSeries()) {
            return makeSeries(Series(FrameOps::missingFlags(v.series().values, true), v.series().index));
        }
        if (v.isNone()) return Value(false);
        return Value(std::isnan(toDouble(v, "np.isnan")));
    }
    if (name == "where") return whereValue(args);
    if (name == "arange") {
        const Value& first = args.required(0, "start", "np.arange");
        const Value* second = args.get(1, "stop");
        const Value* third = args.get(2, "step");
        const bool integral = first.is<int64_t>() && (second == nullptr || second->is<int64_t>()) &&
                              (third == nullptr || third->is<int64_t>());
        if (integral) return rangeOf(args);
        const double start = second == nullptr ? 0.0 : toDouble(first, "np.arange");
        const double stop = second == nullptr ? toDouble(first, "np.arange") : toDouble(*second, "np.arange");
        const double step = third == nullptr ? 1.0 : toDouble(*third, "np.arange");
        if (step == 0.0) throw ScriptError("ZeroDivisionError", "division by zero");
        const double count = std::ceil((stop - start) / step);
        std::vector<Value> out;
        for (int64_t i = 0; i < static_cast<int64_t>(count); ++i) out.emplace_back(start + static_cast<double>(i) * step);
        return makeList(std::move(out));
    }
    if (name == "array") {
        const Value& v = args.required(0, "object", "np.array");
        if (v.isSeries()) return makeList(iterate(v));
        return makeList(iterate(v));
    }
    if (name == "percentile" || name == "quantile") {
        const Column col = toSeries(args.required(0, "a", "np." + name), "np." + name).values;
        const Value& q = args.required(1, "q", "np." + name);
        const double scale = name == "percentile" ? 100.0 : 1.0;
        if (q.is<ListPtr>() || q.is<TuplePtr>()) {
            std::vector<Value> out;
            for (const auto& item : iterate(q)) out.emplace_back(FrameOps::quantile(col, toDouble(item, name) / scale));
            return makeList(std::move(out));
        }
        return Value(FrameOps::quantile(col, toDouble(q, name) / scale));
    }
    if (name == "unique") {
        const Column col = toSeries(args.required(0, "ar", "np.unique"), "np.unique").values;
        std::vector<Scalar> values = FrameOps::uniqueValues(col);
        std::sort(values.begin(), values.end(), scalarLess);
        std::vector<Value> out;
        for (const auto& s : values) out.push_back(scalarValue(s, col.type));
        return makeList(std::move(out));
    }
    if (name == "cumsum") {
        const Value& v = args.required(0, "a", "np.cumsum");
        const Series s = toSeries(v, "np.cumsum");
        Series out(FrameOps::cumulativeSum(s.values), s.index);
        if (v.isSeries()) return makeSeries(std::move(out));
        return makeList(iterate(makeSeries(std::move(out))));
    }
    throw ScriptError("AttributeError", "module 'numpy' has no attribute '" + name + "'");
}

} // namespace Runtime
} // namespace Tabula
