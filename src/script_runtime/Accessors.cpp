#include "ScriptRuntime.h"

#include "CommonUtils.h"
#include "TabulaExceptions.h"

#include <algorithm>
#include <functional>
#include <regex>
#include <unordered_set>

namespace Tabula {
namespace Runtime {

namespace {

using ListPtr = std::shared_ptr<ListValue>;
using TuplePtr = std::shared_ptr<TupleValue>;
using SlicePtr = std::shared_ptr<SliceValue>;
using AccessorPtr = std::shared_ptr<Accessor>;

struct Selection {
    std::vector<size_t> positions;
    bool scalar = false;
};

const std::unordered_set<std::string>& stringAccessorMethods() {
    static const std::unordered_set<std::string> names = {
        "lower", "upper", "strip", "lstrip", "rstrip", "title", "capitalize", "len", "contains", "startswith",
        "endswith", "replace", "slice", "count", "isdigit", "isnumeric", "isalpha", "zfill", "cat"
    };
    return names;
}

// Applies `fn` to every present cell; missing cells stay missing.
Series mapText(const Series& s, const std::function<Scalar(const std::string&)>& fn) {
    std::vector<Scalar> cells;
    cells.reserve(s.size());
    const auto& text = std::get<std::vector<std::string>>(s.values.values);
    for (size_t r = 0; r < s.size(); ++r) {
        if (s.values.isMissing(r)) cells.emplace_back(std::monostate{});
        else cells.push_back(fn(text[r]));
    }
    Column out = cells.empty() ? Column(s.name(), ColumnType::CATEGORICAL, 0) : Column::fromScalars(s.name(), cells);
    return Series(std::move(out), s.index);
}

// Fills missing flags of a predicate result with the `na=` argument when given.
Series fillPredicate(Series result, const CallArgs& args) {
    const Value* na = args.keyword("na");
    if (na == nullptr || na->isNone()) return result;
    result.values = FrameOps::fillMissing(result.values, Scalar(truthy(*na)));
    return result;
}

std::string pythonReplacement(const std::string& repl) {
    static const std::regex group(R"(\\(\d))");
    return std::regex_replace(repl, group, "$$$1");
}

std::regex compilePattern(const std::string& pattern, bool caseSensitive) {
    try {
        auto flags = std::regex::ECMAScript;
        if (!caseSensitive) flags |= std::regex::icase;
        return std::regex(pattern, flags);
    } catch (const std::regex_error& ex) {
        throw ScriptError("ValueError", "invalid regular expression '" + pattern + "': " + ex.what());
    }
}

std::string titleText(const std::string& s) {
    std::string out = s;
    bool start = true;
    for (char& c : out) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (std::isalpha(u)) {
            c = static_cast<char>(start ? std::toupper(u) : std::tolower(u));
            start = false;
        } else {
            start = true;
        }
    }
    return out;
}

Value stringAccessor(const Series& s, const std::string& name, const CallArgs& args) {
    if (name == "lower") return makeSeries(mapText(s, [](const std::string& t) { return Scalar(CommonUtils::toLower(t)); }));
    if (name == "upper") return makeSeries(mapText(s, [](const std::string& t) { return Scalar(CommonUtils::toUpper(t)); }));
    if (name == "strip" || name == "lstrip" || name == "rstrip") {
        const std::string chars = textArg(args, 0, "to_strip", " \t\n\r\f\v");
        const bool left = name != "rstrip";
        const bool right = name != "lstrip";
        return makeSeries(mapText(s, [&](const std::string& t) {
            size_t b = 0;
            size_t e = t.size();
            if (left) {
                while (b < e && chars.find(t[b]) != std::string::npos) ++b;
            }
            if (right) {
                while (e > b && chars.find(t[e - 1]) != std::string::npos) --e;
            }
            return Scalar(t.substr(b, e - b));
        }));
    }
    if (name == "title") return makeSeries(mapText(s, [](const std::string& t) { return Scalar(titleText(t)); }));
    if (name == "capitalize") {
        return makeSeries(mapText(s, [](const std::string& t) {
            std::string out = CommonUtils::toLower(t);
            if (!out.empty()) out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
            return Scalar(out);
        }));
    }
    if (name == "len") {
        return makeSeries(mapText(s, [](const std::string& t) {
            int64_t n = 0;
            for (char c : t) n += ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ? 1 : 0;
            return Scalar(n);
        }));
    }
    if (name == "contains") {
        const std::string pattern = toText(args.required(0, "pat", "str.contains"), "str.contains");
        const bool caseSensitive = boolArg(args, 1, "case", true);
        const bool useRegex = boolArg(args, 99, "regex", true);
        if (useRegex) {
            const std::regex re = compilePattern(pattern, caseSensitive);
            return makeSeries(fillPredicate(mapText(s, [&](const std::string& t) { return Scalar(std::regex_search(t, re)); }), args));
        }
        const std::string needle = caseSensitive ? pattern : CommonUtils::toLower(pattern);
        return makeSeries(fillPredicate(mapText(s, [&](const std::string& t) {
            const std::string hay = caseSensitive ? t : CommonUtils::toLower(t);
            return Scalar(hay.find(needle) != std::string::npos);
        }), args));
    }
    if (name == "startswith" || name == "endswith") {
        const std::string pattern = toText(args.required(0, "pat", "str." + name), "str." + name);
        const bool prefix = name == "startswith";
        return makeSeries(fillPredicate(mapText(s, [&](const std::string& t) {
            return Scalar(prefix ? CommonUtils::startsWith(t, pattern) : CommonUtils::endsWith(t, pattern));
        }), args));
    }
    if (name == "replace") {
        const std::string pattern = toText(args.required(0, "pat", "str.replace"), "str.replace");
        const std::string repl = toText(args.required(1, "repl", "str.replace"), "str.replace");
        const bool caseSensitive = boolArg(args, 99, "case", true);
        if (boolArg(args, 99, "regex", false)) {
            const std::regex re = compilePattern(pattern, caseSensitive);
            const std::string format = pythonReplacement(repl);
            return makeSeries(mapText(s, [&](const std::string& t) { return Scalar(std::regex_replace(t, re, format)); }));
        }
        return makeSeries(mapText(s, [&](const std::string& t) { return Scalar(CommonUtils::replaceAll(t, pattern, repl)); }));
    }
    if (name == "slice") {
        auto slice = std::make_shared<SliceValue>();
        if (const Value* v = args.get(0, "start")) slice->start = *v;
        if (const Value* v = args.get(1, "stop")) slice->stop = *v;
        if (const Value* v = args.get(2, "step")) slice->step = *v;
        return accessorGetItem(Value(std::make_shared<Accessor>(Accessor{Accessor::Kind::STR, makeSeries(s)})), Value(slice));
    }
    if (name == "count") {
        const std::regex re = compilePattern(toText(args.required(0, "pat", "str.count"), "str.count"), true);
        return makeSeries(mapText(s, [&](const std::string& t) {
            return Scalar(static_cast<int64_t>(std::distance(std::sregex_iterator(t.begin(), t.end(), re), std::sregex_iterator())));
        }));
    }
    if (name == "isdigit" || name == "isnumeric" || name == "isalpha") {
        const bool digits = name != "isalpha";
        return makeSeries(mapText(s, [&](const std::string& t) {
            return Scalar(!t.empty() && std::all_of(t.begin(), t.end(), [&](unsigned char c) {
                return digits ? std::isdigit(c) != 0 : std::isalpha(c) != 0;
            }));
        }));
    }
    if (name == "zfill") {
        const size_t width = static_cast<size_t>(std::max<int64_t>(0, toInt(args.required(0, "width", "str.zfill"), "width")));
        return makeSeries(mapText(s, [&](const std::string& t) {
            return Scalar(t.size() >= width ? t : std::string(width - t.size(), '0') + t);
        }));
    }
    if (name == "cat") {
        const std::string sep = textArg(args, 99, "sep", "");
        std::vector<std::string> parts;
        for (size_t r = 0; r < s.size(); ++r) {
            if (!s.values.isMissing(r)) parts.push_back(std::get<std::vector<std::string>>(s.values.values)[r]);
        }
        return Value(CommonUtils::join(parts, sep));
    }
    throw ScriptError("AttributeError", "'StringMethods' object has no attribute '" + name + "'");
}

Series mapTimes(const Series& s, const std::function<Scalar(Timestamp)>& fn, ColumnType emptyType) {
    std::vector<Scalar> cells;
    cells.reserve(s.size());
    const auto& seconds = std::get<std::vector<int64_t>>(s.values.values);
    for (size_t r = 0; r < s.size(); ++r) {
        if (s.values.isMissing(r)) cells.emplace_back(std::monostate{});
        else cells.push_back(fn(Timestamp{seconds[r]}));
    }
    Column out = cells.empty() ? Column(s.name(), emptyType, 0) : Column::fromScalars(s.name(), cells);
    return Series(std::move(out), s.index);
}

std::optional<Value> datetimeField(const Series& s, const std::string& name) {
    static const std::unordered_set<std::string> fields = {
        "year", "month", "day", "hour", "minute", "second", "dayofweek", "weekday", "quarter"
    };
    if (fields.count(name) != 0) {
        return makeSeries(mapTimes(s, [&](Timestamp ts) {
            const Value field = getAttribute(Value(ts), name);
            return Scalar(field.as<int64_t>());
        }, ColumnType::INTEGER));
    }
    if (name == "dayofyear") {
        return makeSeries(mapTimes(s, [](Timestamp ts) {
            return Scalar(static_cast<int64_t>(std::stoll(formatTimestamp(ts, "%j"))));
        }, ColumnType::INTEGER));
    }
    if (name == "date") {
        return makeSeries(mapTimes(s, [](Timestamp ts) {
            int64_t days = ts.seconds / 86400;
            if (ts.seconds % 86400 < 0) --days;
            return Scalar(Timestamp{days * 86400});
        }, ColumnType::DATETIME));
    }
    return std::nullopt;
}

Value datetimeAccessor(const Series& s, const std::string& name, const CallArgs& args) {
    std::string pattern;
    if (name == "day_name") pattern = "%A";
    else if (name == "month_name") pattern = "%B";
    else if (name == "strftime") pattern = toText(args.required(0, "date_format", "dt.strftime"), "dt.strftime");
    else if (name == "normalize") return *datetimeField(s, "date");
    else throw ScriptError("AttributeError", "'DatetimeProperties' object has no attribute '" + name + "'");
    return makeSeries(mapTimes(s, [&](Timestamp ts) { return Scalar(formatTimestamp(ts, pattern)); }, ColumnType::CATEGORICAL));
}

Value stringItem(const Series& s, const Value& key) {
    if (const auto* slice = key.ptr<SlicePtr>()) {
        return makeSeries(mapText(s, [&](const std::string& t) {
            std::string out;
            for (size_t i : slicePositions(**slice, t.size())) out.push_back(t[i]);
            return Scalar(out);
        }));
    }
    const int64_t pos = toInt(key, "str index");
    return makeSeries(mapText(s, [&](const std::string& t) {
        const int64_t n = static_cast<int64_t>(t.size());
        const int64_t i = pos < 0 ? pos + n : pos;
        if (i < 0 || i >= n) return Scalar(std::monostate{});
        return Scalar(std::string(1, t[static_cast<size_t>(i)]));
    }));
}

// ---------------------------------------------------------------------------
// loc / iloc

Selection maskSelection(const Column& mask, size_t length) {
    if (mask.size() != length) {
        throw ScriptError("IndexError", "Boolean index has wrong length: " + std::to_string(mask.size()) +
                                            " instead of " + std::to_string(length));
    }
    return Selection{FrameOps::rowsWhere(mask), false};
}

Selection rowSelection(const Index& index, size_t rows, const Value& key, bool byLabel) {
    if (key.isSeries()) return maskSelection(key.series().values, rows);
    if (key.is<ListPtr>()) {
        const std::vector<Value> items = iterate(key);
        if (!items.empty() && std::all_of(items.begin(), items.end(), [](const Value& v) { return v.is<bool>(); })) {
            return maskSelection(columnFromValues("", items), rows);
        }
        Selection out;
        for (const auto& item : items) {
            if (!byLabel) {
                out.positions.push_back(normalizeIndex(toInt(item, "iloc"), rows, "positional indexer"));
                continue;
            }
            const std::vector<size_t> hits = labelRows(index, requireScalar(item, "loc"));
            if (hits.empty()) throw ScriptError("KeyError", "\"[" + repr(item) + "] not in index\"");
            out.positions.insert(out.positions.end(), hits.begin(), hits.end());
        }
        return out;
    }
    if (const auto* slice = key.ptr<SlicePtr>()) {
        if (!byLabel) return Selection{slicePositions(**slice, rows), false};
        const SliceValue& sl = **slice;
        if (!sl.step.isNone() && toInt(sl.step, "slice step") != 1) {
            throw ScriptError("ValueError", "label slices only support a step of 1");
        }
        size_t first = 0;
        size_t last = rows;
        if (!sl.start.isNone()) {
            const auto hits = labelRows(index, requireScalar(sl.start, "loc"));
            if (hits.empty()) throw ScriptError("KeyError", repr(sl.start));
            first = hits.front();
        }
        if (!sl.stop.isNone()) {
            const auto hits = labelRows(index, requireScalar(sl.stop, "loc"));
            if (hits.empty()) throw ScriptError("KeyError", repr(sl.stop));
            last = hits.back() + 1;
        }
        Selection out;
        for (size_t r = first; r < last; ++r) out.positions.push_back(r);
        return out;
    }
    if (!byLabel) {
        if (!key.is<int64_t>() && !key.is<bool>()) {
            throw ScriptError("TypeError", "Cannot index by location index with a non-integer key");
        }
        return Selection{{normalizeIndex(toInt(key, "iloc"), rows, "single positional indexer")}, true};
    }
    const std::vector<size_t> hits = labelRows(index, requireScalar(key, "loc"));
    if (hits.empty()) throw ScriptError("KeyError", repr(key));
    return Selection{hits, hits.size() == 1 && index.levels.size() <= 1};
}

Selection columnSelection(const DataFrame& df, const Value& key, bool byLabel) {
    const size_t cols = df.cols();
    if (const auto* slice = key.ptr<SlicePtr>()) {
        if (!byLabel) return Selection{slicePositions(**slice, cols), false};
        const SliceValue& sl = **slice;
        size_t first = 0;
        size_t last = cols;
        if (!sl.start.isNone()) {
            const int idx = df.findColumn(toText(sl.start, "loc"));
            if (idx < 0) throw ScriptError("KeyError", repr(sl.start));
            first = static_cast<size_t>(idx);
        }
        if (!sl.stop.isNone()) {
            const int idx = df.findColumn(toText(sl.stop, "loc"));
            if (idx < 0) throw ScriptError("KeyError", repr(sl.stop));
            last = static_cast<size_t>(idx) + 1;
        }
        Selection out;
        for (size_t c = first; c < last; ++c) out.positions.push_back(c);
        return out;
    }
    if (key.is<ListPtr>() || key.isSeries()) {
        const std::vector<Value> items = iterate(key);
        if (!items.empty() && std::all_of(items.begin(), items.end(), [](const Value& v) { return v.is<bool>(); })) {
            return maskSelection(columnFromValues("", items), cols);
        }
        Selection out;
        for (const auto& item : items) {
            if (byLabel) {
                const int idx = df.findColumn(toText(item, "loc"));
                if (idx < 0) throw ScriptError("KeyError", "\"['" + toText(item, "loc") + "'] not in index\"");
                out.positions.push_back(static_cast<size_t>(idx));
            } else {
                out.positions.push_back(normalizeIndex(toInt(item, "iloc"), cols, "positional indexer"));
            }
        }
        return out;
    }
    if (byLabel) {
        const int idx = df.findColumn(toText(key, "loc"));
        if (idx < 0) throw ScriptError("KeyError", repr(key));
        return Selection{{static_cast<size_t>(idx)}, true};
    }
    return Selection{{normalizeIndex(toInt(key, "iloc"), cols, "single positional indexer")}, true};
}

Selection allColumns(const DataFrame& df) {
    Selection out;
    for (size_t c = 0; c < df.cols(); ++c) out.positions.push_back(c);
    return out;
}

void splitKey(const Value& key, Value& rowKey, Value& colKey, bool& hasColumns) {
    hasColumns = false;
    rowKey = key;
    if (const auto* tuple = key.ptr<TuplePtr>()) {
        if ((*tuple)->items.size() != 2) throw ScriptError("IndexError", "Too many indexers");
        rowKey = (*tuple)->items[0];
        colKey = (*tuple)->items[1];
        hasColumns = true;
    }
}

Value frameLocate(const DataFrame& df, const Value& key, bool byLabel) {
    Value rowKey;
    Value colKey;
    bool hasColumns = false;
    splitKey(key, rowKey, colKey, hasColumns);
    const Selection rows = rowSelection(df.index, df.rows(), rowKey, byLabel);
    const Selection cols = hasColumns ? columnSelection(df, colKey, byLabel) : allColumns(df);

    if (rows.scalar && cols.scalar) return cellValue(df.columns[cols.positions.front()], rows.positions.front());
    DataFrame picked;
    picked.index = df.index;
    for (size_t c : cols.positions) picked.columns.push_back(df.columns[c]);
    if (rows.scalar) return makeSeries(picked.row(rows.positions.front()));
    if (cols.scalar) {
        const Column& col = picked.columns.front();
        return makeSeries(Series(col.take(rows.positions), df.index.take(rows.positions)));
    }
    return makeFrame(picked.take(rows.positions));
}

// Per-cell values for an assignment into `count` selected cells.
std::vector<Scalar> assignedCells(const Value& value, size_t count, const Index* rowIndex,
                                  const std::vector<size_t>* rows) {
    if (value.isSeries() && rowIndex != nullptr && rows != nullptr) {
        const Series& s = value.series();
        std::vector<Scalar> cells;
        for (size_t r : *rows) {
            const std::vector<Scalar> key = rowIndex->key(r);
            std::optional<size_t> pos;
            if (s.index.nlevels() == key.size()) {
                for (size_t i = 0; i < s.size() && !pos; ++i) {
                    bool same = true;
                    for (size_t l = 0; l < key.size() && same; ++l) same = scalarsEqual(s.index.labelAt(i, l), key[l]);
                    if (same) pos = i;
                }
            }
            cells.push_back(pos ? s.values.at(*pos) : Scalar(std::monostate{}));
        }
        return cells;
    }
    if (value.is<ListPtr>() || value.is<TuplePtr>() || value.isSeries()) {
        const std::vector<Value> items = iterate(value);
        if (items.size() != count) {
            throw ScriptError("ValueError", "Must have equal len keys and value when setting with an iterable");
        }
        std::vector<Scalar> cells;
        for (const auto& item : items) cells.push_back(requireScalar(item, "assignment"));
        return cells;
    }
    return std::vector<Scalar>(count, requireScalar(value, "assignment"));
}

void appendRow(DataFrame& df, const Scalar& label, const Value& value) {
    const std::vector<Scalar> cells = assignedCells(value, df.cols(), nullptr, nullptr);
    if (df.index.isRange()) {
        const auto* next = std::get_if<int64_t>(&label);
        if (next == nullptr || *next != static_cast<int64_t>(df.rows())) {
            std::vector<int64_t> positions(df.rows());
            for (size_t r = 0; r < df.rows(); ++r) positions[r] = static_cast<int64_t>(r);
            df.index = Index::fromColumn(Column::fromInts("", std::move(positions)));
        }
    }
    if (df.index.levels.size() > 1) throw ScriptError("KeyError", repr(fromScalar(label)));
    if (!df.index.isRange()) df.index.levels.front().push(label);
    df.index.length += 1;
    for (size_t c = 0; c < df.cols(); ++c) df.columns[c].push(cells[c]);
}

void frameAssign(DataFrame& df, const Value& key, const Value& value, bool byLabel) {
    Value rowKey;
    Value colKey;
    bool hasColumns = false;
    splitKey(key, rowKey, colKey, hasColumns);

    if (byLabel && hasColumns) {
        for (const auto& name : (colKey.is<std::string>() || colKey.is<ListPtr>()) ? toNameList(colKey)
                                                                                  : std::vector<std::string>{}) {
            if (df.findColumn(name) >= 0) continue;
            Column added(name, ColumnType::NUMERIC, df.rows());
            added.missing.assign(df.rows(), 1);
            df.columns.push_back(std::move(added));
        }
    }
    const bool scalarRowKey = !rowKey.isSeries() && !rowKey.is<ListPtr>() && !rowKey.is<SlicePtr>();
    if (byLabel && !hasColumns && scalarRowKey) {
        const Scalar label = requireScalar(rowKey, "loc");
        if (labelRows(df.index, label).empty()) {
            appendRow(df, label, value);
            return;
        }
    }

    const Selection rows = rowSelection(df.index, df.rows(), rowKey, byLabel);
    const Selection cols = hasColumns ? columnSelection(df, colKey, byLabel) : allColumns(df);
    if (value.isFrame()) throw ScriptError("TypeError", "assigning a DataFrame through loc/iloc is not supported");

    if (cols.positions.size() == 1) {
        const std::vector<Scalar> cells = assignedCells(value, rows.positions.size(), &df.index, &rows.positions);
        Column& col = df.columns[cols.positions.front()];
        for (size_t i = 0; i < rows.positions.size(); ++i) col.set(rows.positions[i], cells[i]);
        return;
    }
    if (rows.positions.size() == 1 && !value.isSeries()) {
        const std::vector<Scalar> cells = assignedCells(value, cols.positions.size(), nullptr, nullptr);
        for (size_t i = 0; i < cols.positions.size(); ++i) df.columns[cols.positions[i]].set(rows.positions.front(), cells[i]);
        return;
    }
    const Scalar cell = requireScalar(value, "assignment");
    for (size_t c : cols.positions) {
        for (size_t r : rows.positions) df.columns[c].set(r, cell);
    }
}

} // namespace

std::optional<Value> accessorAttribute(const Value& self, const std::string& name) {
    const Accessor& accessor = *self.as<AccessorPtr>();
    switch (accessor.kind) {
        case Accessor::Kind::STR:
            if (stringAccessorMethods().count(name) != 0) return boundMethod(self, name);
            return std::nullopt;
        case Accessor::Kind::DT:
            if (name == "day_name" || name == "month_name" || name == "strftime" || name == "normalize") {
                return boundMethod(self, name);
            }
            return datetimeField(accessor.target.series(), name);
        default:
            return std::nullopt;
    }
}

Value callAccessorMethod(const Value& self, const std::string& name, const CallArgs& args) {
    const Accessor& accessor = *self.as<AccessorPtr>();
    if (accessor.kind == Accessor::Kind::STR) return stringAccessor(accessor.target.series(), name, args);
    if (accessor.kind == Accessor::Kind::DT) return datetimeAccessor(accessor.target.series(), name, args);
    throw ScriptError("TypeError", "'_LocIndexer' object is not callable");
}

Value accessorGetItem(const Value& self, const Value& key) {
    const Accessor& accessor = *self.as<AccessorPtr>();
    switch (accessor.kind) {
        case Accessor::Kind::STR:
            return stringItem(accessor.target.series(), key);
        case Accessor::Kind::DT:
            throw ScriptError("TypeError", "'DatetimeProperties' object is not subscriptable");
        case Accessor::Kind::LOC:
        case Accessor::Kind::ILOC:
            break;
    }
    const bool byLabel = accessor.kind == Accessor::Kind::LOC;
    if (accessor.target.isFrame()) return frameLocate(accessor.target.frame(), key, byLabel);
    const Series& s = accessor.target.series();
    const Selection rows = rowSelection(s.index, s.size(), key, byLabel);
    if (rows.scalar) return cellValue(s.values, rows.positions.front());
    return makeSeries(s.take(rows.positions));
}

void accessorSetItem(const Value& self, const Value& key, const Value& value) {
    const Accessor& accessor = *self.as<AccessorPtr>();
    if (accessor.kind != Accessor::Kind::LOC && accessor.kind != Accessor::Kind::ILOC) {
        throw ScriptError("TypeError", "'StringMethods' object does not support item assignment");
    }
    const bool byLabel = accessor.kind == Accessor::Kind::LOC;
    if (accessor.target.isFrame()) {
        frameAssign(accessor.target.frame(), key, value, byLabel);
        return;
    }
    Series& s = accessor.target.series();
    const Selection rows = rowSelection(s.index, s.size(), key, byLabel);
    const std::vector<Scalar> cells = assignedCells(value, rows.positions.size(), &s.index, &rows.positions);
    for (size_t i = 0; i < rows.positions.size(); ++i) s.values.set(rows.positions[i], cells[i]);
}

} // namespace Runtime
} // namespace Tabula
