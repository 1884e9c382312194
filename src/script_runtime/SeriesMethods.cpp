#include "ScriptRuntime.h"

#include "FrameFormat.h"
#include "TabulaExceptions.h"

#include <algorithm>
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
using SlicePtr = std::shared_ptr<SliceValue>;
using CallablePtr = std::shared_ptr<Callable>;
using GroupByPtr = std::shared_ptr<GroupByValue>;

const std::unordered_set<std::string>& seriesMethods() {
    static const std::unordered_set<std::string> names = {
        "head", "tail", "sort_values", "sort_index", "mean", "sum", "count", "min", "max", "median", "std", "var",
        "prod", "nunique", "unique", "value_counts", "describe", "isna", "isnull", "notna", "notnull", "dropna",
        "fillna", "isin", "between", "astype", "round", "abs", "cumsum", "quantile", "idxmax", "idxmin",
        "reset_index", "to_frame", "tolist", "to_list", "to_dict", "nlargest", "nsmallest", "drop_duplicates",
        "duplicated", "copy", "map", "apply", "any", "all", "corr", "replace", "unstack", "mode", "items", "get",
        "clip", "where", "eq", "ne", "lt", "le", "gt", "ge", "to_string", "agg", "aggregate"
    };
    return names;
}

const std::unordered_set<std::string>& groupByMethods() {
    static const std::unordered_set<std::string> names = {
        "mean", "sum", "count", "min", "max", "median", "std", "var", "prod", "size", "nunique", "first", "last",
        "agg", "aggregate", "transform"
    };
    return names;
}

bool isSequence(const Value& v) {
    return v.is<ListPtr>() || v.is<TuplePtr>();
}

Value reduceSeries(const Series& s, Reduction r, const CallArgs& args) {
    const int ddof = static_cast<int>(intArg(args, 99, "ddof", 1));
    return scalarValue(FrameOps::reduce(s.values, r, ddof), s.values.type);
}

Series withValues(const Series& s, Column values) {
    values.name = s.name();
    return Series(std::move(values), s.index);
}

std::vector<size_t> maskPositions(const Column& mask, size_t length) {
    if (mask.size() != length) {
        throw ScriptError("IndexError", "boolean index did not match indexed array; dimension is " +
                                            std::to_string(length) + " but corresponding boolean dimension is " +
                                            std::to_string(mask.size()));
    }
    return FrameOps::rowsWhere(mask);
}

// Remaining levels after selecting on the outermost label of a multi-level index.
Series dropOuterLevel(const Series& s, const std::vector<size_t>& rows) {
    Series picked = s.take(rows);
    std::vector<Column> levels(picked.index.levels.begin() + 1, picked.index.levels.end());
    Index inner = Index::fromLevels(std::move(levels));
    inner.length = rows.size();
    return Series(std::move(picked.values), std::move(inner));
}

std::optional<size_t> positionalFallback(const Series& s, const Value& key) {
    if (!key.is<int64_t>() || s.index.isRange()) return std::nullopt;
    const ColumnType labelType = s.index.levels.front().type;
    if (labelType == ColumnType::INTEGER || labelType == ColumnType::NUMERIC) return std::nullopt;
    return normalizeIndex(key.as<int64_t>(), s.size(), "index");
}

Value sortSeries(const Series& s, const CallArgs& args) {
    const bool ascending = boolArg(args, 0, "ascending", true);
    return makeSeries(s.take(FrameOps::sortOrder({&s.values}, {ascending})));
}

Value seriesExtremes(const Series& s, const CallArgs& args, bool largest) {
    if (!s.values.isNumericLike()) {
        throw ScriptError("TypeError", std::string("Cannot use method '") + (largest ? "nlargest" : "nsmallest") +
                                           "' with dtype object");
    }
    const int64_t n = intArg(args, 0, "n", 5);
    std::vector<size_t> order = FrameOps::sortOrder({&s.values}, {!largest});
    std::vector<size_t> present;
    for (size_t r : order) {
        if (!s.values.isMissing(r)) present.push_back(r);
    }
    const std::vector<size_t> head = FrameOps::headRows(present.size(), n);
    std::vector<size_t> rows;
    for (size_t i : head) rows.push_back(present[i]);
    return makeSeries(s.take(rows));
}

Value extremeLabel(const Series& s, bool wantMax) {
    if (!s.values.isNumericLike()) {
        throw ScriptError("TypeError", std::string("reduction operation '") + (wantMax ? "argmax" : "argmin") +
                                           "' not allowed for this dtype");
    }
    std::optional<size_t> best;
    for (size_t r = 0; r < s.size(); ++r) {
        if (s.values.isMissing(r)) continue;
        if (!best || (wantMax ? s.values.numberAt(r) > s.values.numberAt(*best)
                              : s.values.numberAt(r) < s.values.numberAt(*best))) {
            best = r;
        }
    }
    if (!best) throw ScriptError("ValueError", "attempt to get argmax of an empty sequence");
    return labelValue(s.index, *best);
}

Value isinSeries(const Series& s, const Value& values) {
    if (values.is<std::string>()) {
        throw ScriptError("TypeError", "only list-like objects are allowed to be passed to isin(), you passed a `str`");
    }
    std::vector<Scalar> wanted;
    for (const auto& v : iterate(values)) wanted.push_back(requireScalar(v, "isin"));
    std::vector<uint8_t> flags(s.size(), 0);
    for (size_t r = 0; r < s.size(); ++r) {
        const Scalar cell = s.values.at(r);
        for (const auto& w : wanted) {
            if (scalarsEqual(cell, w)) {
                flags[r] = 1;
                break;
            }
        }
    }
    return makeSeries(withValues(s, Column::fromBools("", std::move(flags))));
}

Value betweenSeries(const Series& s, const CallArgs& args) {
    const Scalar lo = requireScalar(args.required(0, "left", "between"), "between");
    const Scalar hi = requireScalar(args.required(1, "right", "between"), "between");
    const std::string inclusive = textArg(args, 2, "inclusive", "both");
    if (inclusive != "both" && inclusive != "neither" && inclusive != "left" && inclusive != "right") {
        throw ScriptError("ValueError", "Inclusive has to be either string of 'both','left', 'right', or 'neither'.");
    }
    const bool closedLeft = inclusive == "both" || inclusive == "left";
    const bool closedRight = inclusive == "both" || inclusive == "right";
    Column lower = FrameOps::compareColumnScalar(closedLeft ? CompareOp::GE : CompareOp::GT, s.values, lo, false);
    Column upper = FrameOps::compareColumnScalar(closedRight ? CompareOp::LE : CompareOp::LT, s.values, hi, false);
    std::vector<uint8_t> flags(s.size(), 0);
    for (size_t r = 0; r < s.size(); ++r) {
        flags[r] = (!lower.isMissing(r) && !upper.isMissing(r) && lower.numberAt(r) != 0.0 && upper.numberAt(r) != 0.0) ? 1 : 0;
    }
    return makeSeries(withValues(s, Column::fromBools("", std::move(flags))));
}

Value mapSeries(const Series& s, const Value& mapper, bool passMissing) {
    std::vector<Scalar> cells;
    cells.reserve(s.size());
    const auto* mapping = mapper.ptr<DictPtr>();
    if (mapping == nullptr && mapper.isSeries()) {
        const Series& lookup = mapper.series();
        for (size_t r = 0; r < s.size(); ++r) {
            const auto rows = labelRows(lookup.index, s.values.at(r));
            cells.push_back(rows.empty() ? Scalar(std::monostate{}) : lookup.values.at(rows.front()));
        }
    } else {
        for (size_t r = 0; r < s.size(); ++r) {
            if (mapping != nullptr) {
                const Value* hit = (*mapping)->find(cellValue(s.values, r));
                cells.push_back(hit == nullptr ? Scalar(std::monostate{}) : requireScalar(*hit, "map"));
                continue;
            }
            if (s.values.isMissing(r) && !passMissing) {
                cells.emplace_back(std::monostate{});
                continue;
            }
            CallArgs one;
            one.positional.push_back(cellValue(s.values, r));
            cells.push_back(requireScalar(call(mapper, one), "map"));
        }
    }
    Column out = cells.empty() ? Column(s.name(), ColumnType::NUMERIC, 0) : Column::fromScalars(s.name(), cells);
    return makeSeries(Series(std::move(out), s.index));
}

Value replaceSeries(const Series& s, const CallArgs& args) {
    std::vector<std::pair<Scalar, Scalar>> pairs;
    const Value& what = args.required(0, "to_replace", "replace");
    if (const auto* mapping = what.ptr<DictPtr>()) {
        for (const auto& kv : (*mapping)->items) {
            pairs.emplace_back(requireScalar(kv.first, "replace"), requireScalar(kv.second, "replace"));
        }
    } else {
        const Scalar to = requireScalar(args.required(1, "value", "replace"), "replace");
        const std::vector<Value> from = isSequence(what) ? iterate(what) : std::vector<Value>{what};
        for (const auto& f : from) pairs.emplace_back(requireScalar(f, "replace"), to);
    }
    std::vector<Scalar> cells;
    cells.reserve(s.size());
    for (size_t r = 0; r < s.size(); ++r) {
        Scalar cell = s.values.at(r);
        for (const auto& p : pairs) {
            if (scalarsEqual(cell, p.first)) {
                cell = p.second;
                break;
            }
        }
        cells.push_back(std::move(cell));
    }
    Column out = cells.empty() ? s.values : Column::fromScalars(s.name(), cells);
    return makeSeries(Series(std::move(out), s.index));
}

Value unstack(const Series& s) {
    const Index& index = s.index;
    if (index.levels.size() < 2) throw ScriptError("ValueError", "index must be a MultiIndex to unstack");
    std::vector<const Column*> outer;
    for (size_t l = 0; l + 1 < index.levels.size(); ++l) outer.push_back(&index.levels[l]);
    const FrameOps::Groups rows = FrameOps::groupRows(outer, true, false);
    const FrameOps::Groups cols = FrameOps::groupRows({&index.levels.back()}, true, false);

    std::vector<size_t> columnOf(s.size(), 0);
    for (size_t c = 0; c < cols.members.size(); ++c) {
        for (size_t r : cols.members[c]) columnOf[r] = c;
    }
    std::vector<std::vector<Scalar>> cells(cols.members.size(),
                                           std::vector<Scalar>(rows.members.size(), Scalar(std::monostate{})));
    for (size_t g = 0; g < rows.members.size(); ++g) {
        for (size_t r : rows.members[g]) cells[columnOf[r]][g] = s.values.at(r);
    }
    DataFrame out;
    out.index = rows.keys;
    for (size_t c = 0; c < cols.members.size(); ++c) {
        out.columns.push_back(Column::fromScalars(FrameFormat::scalarStr(cols.keys.labelAt(c)), cells[c]));
    }
    return makeFrame(std::move(out));
}

Value modeSeries(const Series& s) {
    const Series counts = FrameOps::valueCounts(s.values, false, false, true);
    std::vector<Scalar> modes;
    int64_t best = -1;
    for (size_t i = 0; i < counts.size(); ++i) {
        const int64_t n = static_cast<int64_t>(counts.values.numberAt(i));
        if (best < 0) best = n;
        if (n != best) break;
        modes.push_back(counts.index.labelAt(i));
    }
    std::sort(modes.begin(), modes.end(), scalarLess);
    Column out = modes.empty() ? Column(s.name(), s.values.type, 0) : Column::fromScalars(s.name(), modes);
    return makeSeries(Series(std::move(out)));
}

Value clipSeries(const Series& s, const CallArgs& args) {
    const Value* lower = args.get(0, "lower");
    const Value* upper = args.get(1, "upper");
    if (!s.values.isNumericLike()) throw ScriptError("TypeError", "clip requires numeric values");
    const bool hasLower = lower != nullptr && !lower->isNone();
    const bool hasUpper = upper != nullptr && !upper->isNone();
    const double lo = hasLower ? toDouble(*lower, "clip") : 0.0;
    const double hi = hasUpper ? toDouble(*upper, "clip") : 0.0;
    std::vector<Scalar> cells;
    cells.reserve(s.size());
    for (size_t r = 0; r < s.size(); ++r) {
        Scalar cell = s.values.at(r);
        if (!scalarIsMissing(cell)) {
            const double v = s.values.numberAt(r);
            if (hasLower && v < lo) cell = lower->is<int64_t>() ? Scalar(lower->as<int64_t>()) : Scalar(lo);
            else if (hasUpper && v > hi) cell = upper->is<int64_t>() ? Scalar(upper->as<int64_t>()) : Scalar(hi);
        }
        cells.push_back(std::move(cell));
    }
    Column out = cells.empty() ? s.values : Column::fromScalars(s.name(), cells);
    return makeSeries(Series(std::move(out), s.index));
}

Value whereSeries(const Series& s, const CallArgs& args) {
    const Series cond = toSeries(args.required(0, "cond", "where"), "where");
    if (cond.size() != s.size()) throw ScriptError("ValueError", "Array conditional must be same shape as self");
    const Value* other = args.get(1, "other");
    const Scalar fill = (other == nullptr) ? Scalar(std::monostate{}) : requireScalar(*other, "where");
    std::vector<Scalar> cells;
    cells.reserve(s.size());
    for (size_t r = 0; r < s.size(); ++r) {
        const bool keep = !cond.values.isMissing(r) && cond.values.numberAt(r) != 0.0;
        cells.push_back(keep ? s.values.at(r) : fill);
    }
    Column out = cells.empty() ? s.values : Column::fromScalars(s.name(), cells);
    return makeSeries(Series(std::move(out), s.index));
}

Value compareMethod(const Value& self, const std::string& name, const CallArgs& args) {
    static const std::unordered_map<std::string, Ast::CompareOperator> ops = {
        {"eq", Ast::CompareOperator::EQ}, {"ne", Ast::CompareOperator::NE}, {"lt", Ast::CompareOperator::LT},
        {"le", Ast::CompareOperator::LE}, {"gt", Ast::CompareOperator::GT}, {"ge", Ast::CompareOperator::GE}
    };
    return compare(ops.at(name), self, args.required(0, "other", name));
}

std::string functionName(const Value& f) {
    if (const auto* fn = f.ptr<CallablePtr>()) return (*fn)->name;
    return toText(f, "aggregation");
}

Reduction reductionOf(const Value& f) {
    const std::string name = functionName(f);
    if (name == "len") return Reduction::SIZE;
    auto r = FrameOps::parseReduction(name);
    if (!r) throw ScriptError("AttributeError", "'SeriesGroupBy' object has no attribute '" + name + "'");
    return *r;
}

Value aggSeries(const Series& s, const CallArgs& args) {
    const Value& funcs = args.required(0, "func", "agg");
    if (!isSequence(funcs)) return reduceSeries(s, reductionOf(funcs), CallArgs());
    std::vector<std::string> labels;
    std::vector<Scalar> cells;
    for (const auto& f : iterate(funcs)) {
        labels.push_back(functionName(f));
        cells.push_back(FrameOps::reduce(s.values, reductionOf(f)));
    }
    return makeSeries(Series(Column::fromScalars(s.name(), cells), Index::fromColumn(Column::fromStrings("", labels))));
}

// ---------------------------------------------------------------------------
// Group-by helpers

FrameOps::Groups groupsOf(const GroupByValue& g) {
    std::vector<const Column*> keys;
    for (const auto& k : g.keys) keys.push_back(&k);
    return FrameOps::groupRows(keys, g.sort, g.dropna);
}

std::vector<std::string> selectedColumns(const GroupByValue& g) {
    if (!g.selection.empty()) return g.selection;
    std::vector<std::string> names;
    for (const auto& c : g.frame->columns) {
        const bool isKey = std::any_of(g.keys.begin(), g.keys.end(), [&](const Column& k) { return k.name == c.name; });
        if (!isKey) names.push_back(c.name);
    }
    return names;
}

Value finishFrame(const GroupByValue& g, DataFrame out) {
    if (!g.asIndex) return makeFrame(FrameOps::resetIndex(out, false));
    return makeFrame(std::move(out));
}

Value finishSeries(const GroupByValue& g, Series out) {
    if (!g.asIndex) return makeFrame(FrameOps::seriesToFrame(out, true));
    return makeSeries(std::move(out));
}

Value groupReduce(const GroupByValue& g, Reduction r, const CallArgs& args) {
    const FrameOps::Groups groups = groupsOf(g);
    if (r == Reduction::SIZE) {
        std::vector<int64_t> sizes;
        for (const auto& m : groups.members) sizes.push_back(static_cast<int64_t>(m.size()));
        Series out(Column::fromInts(g.asIndex ? "" : "size", std::move(sizes)), groups.keys);
        if (g.seriesSelection && g.asIndex) out.values.name = g.selection.front();
        return finishSeries(g, std::move(out));
    }
    if (g.seriesSelection) {
        const Column& col = g.frame->column(g.selection.front());
        return finishSeries(g, Series(FrameOps::aggregateGroups(col, groups, r), groups.keys));
    }
    const bool numericOnly = boolArg(args, 99, "numeric_only", false);
    DataFrame out;
    out.index = groups.keys;
    for (const auto& name : selectedColumns(g)) {
        const Column& col = g.frame->column(name);
        if (numericOnly && !col.isNumericLike()) continue;
        out.columns.push_back(FrameOps::aggregateGroups(col, groups, r));
    }
    return finishFrame(g, std::move(out));
}

Column namedAggregate(const Column& col, const FrameOps::Groups& groups, Reduction r, const std::string& name) {
    Column out = FrameOps::aggregateGroups(col, groups, r);
    out.name = name;
    return out;
}

Value groupAgg(const GroupByValue& g, const CallArgs& args) {
    const FrameOps::Groups groups = groupsOf(g);
    DataFrame out;
    out.index = groups.keys;

    if (args.positional.empty()) {
        if (args.keywords.empty()) throw ScriptError("TypeError", "Must provide 'func' or tuples of '(column, aggfunc).");
        for (const auto& kw : args.keywords) {
            if (g.seriesSelection) {
                const Column& col = g.frame->column(g.selection.front());
                out.columns.push_back(namedAggregate(col, groups, reductionOf(kw.second), kw.first));
                continue;
            }
            const std::vector<Value> spec = iterate(kw.second);
            if (spec.size() != 2) throw ScriptError("TypeError", "Must provide 'func' or tuples of '(column, aggfunc).");
            const Column& col = g.frame->column(toText(spec[0], "agg"));
            out.columns.push_back(namedAggregate(col, groups, reductionOf(spec[1]), kw.first));
        }
        return finishFrame(g, std::move(out));
    }

    const Value& funcs = args.positional.front();
    if (const auto* mapping = funcs.ptr<DictPtr>()) {
        for (const auto& kv : (*mapping)->items) {
            const std::string name = toText(kv.first, "agg");
            const Column& col = g.frame->column(name);
            if (isSequence(kv.second)) {
                for (const auto& f : iterate(kv.second)) {
                    out.columns.push_back(namedAggregate(col, groups, reductionOf(f), name + "_" + functionName(f)));
                }
            } else {
                out.columns.push_back(namedAggregate(col, groups, reductionOf(kv.second), name));
            }
        }
        return finishFrame(g, std::move(out));
    }
    if (!isSequence(funcs)) return groupReduce(g, reductionOf(funcs), CallArgs());

    const std::vector<Value> list = iterate(funcs);
    if (g.seriesSelection) {
        const Column& col = g.frame->column(g.selection.front());
        for (const auto& f : list) out.columns.push_back(namedAggregate(col, groups, reductionOf(f), functionName(f)));
        return finishFrame(g, std::move(out));
    }
    for (const auto& name : selectedColumns(g)) {
        const Column& col = g.frame->column(name);
        for (const auto& f : list) {
            out.columns.push_back(namedAggregate(col, groups, reductionOf(f), name + "_" + functionName(f)));
        }
    }
    return finishFrame(g, std::move(out));
}

// Broadcasts one aggregate per group back onto the member rows.
Column broadcastGroups(const Column& col, const FrameOps::Groups& groups, Reduction r, size_t rows) {
    std::vector<Scalar> cells(rows, Scalar(std::monostate{}));
    for (const auto& members : groups.members) {
        const Scalar v = FrameOps::reduce(col.take(members), r);
        for (size_t row : members) cells[row] = v;
    }
    if (cells.empty()) return Column(col.name, ColumnType::NUMERIC, 0);
    return Column::fromScalars(col.name, cells);
}

Value groupTransform(const GroupByValue& g, const CallArgs& args) {
    const Reduction r = reductionOf(args.required(0, "func", "transform"));
    const FrameOps::Groups groups = groupsOf(g);
    const DataFrame& df = *g.frame;
    if (g.seriesSelection) {
        return makeSeries(Series(broadcastGroups(df.column(g.selection.front()), groups, r, df.rows()), df.index));
    }
    DataFrame out;
    out.index = df.index;
    for (const auto& name : selectedColumns(g)) {
        out.columns.push_back(broadcastGroups(df.column(name), groups, r, df.rows()));
    }
    return makeFrame(std::move(out));
}

} // namespace

// ---------------------------------------------------------------------------
// Series

std::optional<Value> seriesAttribute(const Value& self, const std::string& name) {
    const Series& s = self.series();
    if (seriesMethods().count(name) != 0) return boundMethod(self, name);
    if (name == "values" || name == "array") return makeList(iterate(self));
    if (name == "index") {
        if (s.index.levels.size() > 1) {
            std::vector<Value> keys;
            for (size_t r = 0; r < s.size(); ++r) keys.push_back(labelValue(s.index, r));
            return makeList(std::move(keys));
        }
        std::vector<Scalar> labels;
        for (size_t r = 0; r < s.size(); ++r) labels.push_back(s.index.labelAt(r));
        const std::string indexName = s.index.isRange() ? std::string() : s.index.levels.front().name;
        Column values = labels.empty() ? Column(indexName, ColumnType::INTEGER, 0) : Column::fromScalars(indexName, labels);
        return makeSeries(Series(std::move(values), s.index));
    }
    if (name == "name") return s.name().empty() ? Value() : Value(s.name());
    if (name == "dtype") return Value(std::string(columnTypeName(s.values.type)));
    if (name == "shape") return makeTuple({Value(s.size())});
    if (name == "size") return Value(s.size());
    if (name == "ndim") return Value(static_cast<int64_t>(1));
    if (name == "empty") return Value(s.size() == 0);
    if (name == "is_unique") return Value(FrameOps::countUnique(s.values, false) == s.size());
    if (name == "hasnans") return Value(s.values.countPresent() < s.size());
    if (name == "str" || name == "dt" || name == "loc" || name == "iloc") {
        if (name == "str" && s.values.type != ColumnType::CATEGORICAL) {
            throw ScriptError("AttributeError", "Can only use .str accessor with string values!");
        }
        if (name == "dt" && s.values.type != ColumnType::DATETIME) {
            throw ScriptError("AttributeError", "Can only use .dt accessor with datetimelike values");
        }
        auto accessor = std::make_shared<Accessor>();
        if (name == "str") accessor->kind = Accessor::Kind::STR;
        else if (name == "dt") accessor->kind = Accessor::Kind::DT;
        else if (name == "loc") accessor->kind = Accessor::Kind::LOC;
        else accessor->kind = Accessor::Kind::ILOC;
        accessor->target = self;
        return Value(accessor);
    }
    return std::nullopt;
}

Value seriesGetItem(const Value& self, const Value& key) {
    const Series& s = self.series();
    if (key.isSeries()) return makeSeries(s.take(maskPositions(key.series().values, s.size())));
    if (const auto* slice = key.ptr<SlicePtr>()) return makeSeries(s.take(slicePositions(**slice, s.size())));
    if (key.is<ListPtr>()) {
        const std::vector<Value> items = iterate(key);
        const bool mask = !items.empty() && std::all_of(items.begin(), items.end(), [](const Value& v) { return v.is<bool>(); });
        if (mask) return makeSeries(s.take(maskPositions(columnFromValues("", items), s.size())));
        std::vector<size_t> rows;
        for (const auto& item : items) {
            const std::vector<size_t> hits = labelRows(s.index, requireScalar(item, "Series index"));
            if (hits.empty()) throw ScriptError("KeyError", "\"[" + repr(item) + "] not in index\"");
            rows.insert(rows.end(), hits.begin(), hits.end());
        }
        return makeSeries(s.take(rows));
    }
    if (const auto* tuple = key.ptr<TuplePtr>()) {
        if (s.index.levels.size() < 2) throw ScriptError("KeyError", repr(key));
        for (size_t r = 0; r < s.size(); ++r) {
            const std::vector<Scalar> labels = s.index.key(r);
            bool same = labels.size() == (*tuple)->items.size();
            for (size_t l = 0; l < labels.size() && same; ++l) {
                same = scalarsEqual(labels[l], requireScalar((*tuple)->items[l], "Series index"));
            }
            if (same) return cellValue(s.values, r);
        }
        throw ScriptError("KeyError", repr(key));
    }

    const std::vector<size_t> rows = labelRows(s.index, requireScalar(key, "Series index"));
    if (s.index.levels.size() > 1 && !rows.empty()) return makeSeries(dropOuterLevel(s, rows));
    if (rows.size() == 1) return cellValue(s.values, rows.front());
    if (rows.size() > 1) return makeSeries(s.take(rows));
    if (auto pos = positionalFallback(s, key)) return cellValue(s.values, *pos);
    throw ScriptError("KeyError", repr(key));
}

void seriesSetItem(const Value& self, const Value& key, const Value& value) {
    Series& s = self.series();
    if (key.isSeries() || key.is<ListPtr>()) {
        const Column mask = key.isSeries() ? key.series().values : columnFromValues("", iterate(key));
        const Scalar cell = requireScalar(value, "Series assignment");
        for (size_t r : maskPositions(mask, s.size())) s.values.set(r, cell);
        return;
    }
    const Scalar label = requireScalar(key, "Series index");
    const Scalar cell = requireScalar(value, "Series assignment");
    const std::vector<size_t> rows = labelRows(s.index, label);
    if (!rows.empty()) {
        for (size_t r : rows) s.values.set(r, cell);
        return;
    }
    if (auto pos = positionalFallback(s, key)) {
        s.values.set(*pos, cell);
        return;
    }
    if (s.index.levels.size() > 1) throw ScriptError("KeyError", repr(key));
    if (s.index.isRange()) {
        const auto* next = std::get_if<int64_t>(&label);
        if (next != nullptr && *next == static_cast<int64_t>(s.size())) {
            s.values.push(cell);
            s.index.length = s.values.size();
            return;
        }
        std::vector<int64_t> positions(s.size());
        for (size_t r = 0; r < s.size(); ++r) positions[r] = static_cast<int64_t>(r);
        s.index = Index::fromColumn(Column::fromInts("", std::move(positions)));
    }
    s.index.levels.front().push(label);
    s.index.length = s.index.levels.front().size();
    s.values.push(cell);
}

Value callSeriesMethod(const Value& self, const std::string& name, const CallArgs& args) {
    const Series& s = self.series();
    if (name == "head") return makeSeries(s.take(FrameOps::headRows(s.size(), intArg(args, 0, "n", 5))));
    if (name == "tail") return makeSeries(s.take(FrameOps::tailRows(s.size(), intArg(args, 0, "n", 5))));
    if (name == "sort_values") return sortSeries(s, args);
    if (name == "sort_index") return makeSeries(s.take(FrameOps::indexSortOrder(s.index, boolArg(args, 99, "ascending", true))));
    if (auto r = FrameOps::parseReduction(name)) {
        if (name != "first" && name != "last" && name != "size") return reduceSeries(s, *r, args);
    }
    if (name == "unique") {
        const Column& col = s.values;
        std::vector<Value> out;
        for (const auto& v : FrameOps::uniqueValues(col)) out.push_back(scalarValue(v, col.type));
        return makeList(std::move(out));
    }
    if (name == "value_counts") {
        return makeSeries(FrameOps::valueCounts(s.values, boolArg(args, 0, "normalize", false),
                                                boolArg(args, 99, "ascending", false), boolArg(args, 99, "dropna", true)));
    }
    if (name == "describe") return makeSeries(FrameOps::describe(s));
    if (name == "isna" || name == "isnull") return makeSeries(withValues(s, FrameOps::missingFlags(s.values, true)));
    if (name == "notna" || name == "notnull") return makeSeries(withValues(s, FrameOps::missingFlags(s.values, false)));
    if (name == "dropna") {
        std::vector<size_t> keep;
        for (size_t r = 0; r < s.size(); ++r) {
            if (!s.values.isMissing(r)) keep.push_back(r);
        }
        return makeSeries(s.take(keep));
    }
    if (name == "fillna") {
        const Scalar fill = requireScalar(args.required(0, "value", "fillna"), "fillna");
        return makeSeries(withValues(s, FrameOps::fillMissing(s.values, fill)));
    }
    if (name == "isin") return isinSeries(s, args.required(0, "values", "isin"));
    if (name == "between") return betweenSeries(s, args);
    if (name == "astype") {
        Column out = s.values;
        out.convertTo(dtypeArg(args.required(0, "dtype", "astype")));
        return makeSeries(Series(std::move(out), s.index));
    }
    if (name == "round") {
        return makeSeries(withValues(s, FrameOps::roundColumn(s.values, static_cast<int>(intArg(args, 0, "decimals", 0)))));
    }
    if (name == "abs") return makeSeries(withValues(s, FrameOps::absolute(s.values)));
    if (name == "cumsum") return makeSeries(withValues(s, FrameOps::cumulativeSum(s.values)));
    if (name == "quantile") {
        const Value* q = args.get(0, "q");
        if (q != nullptr && isSequence(*q)) {
            std::vector<double> levels;
            std::vector<double> cells;
            for (const auto& item : iterate(*q)) {
                levels.push_back(toDouble(item, "quantile"));
                cells.push_back(FrameOps::quantile(s.values, levels.back()));
            }
            return makeSeries(Series(Column::fromDoubles(s.name(), std::move(cells)),
                                     Index::fromColumn(Column::fromDoubles("", std::move(levels)))));
        }
        return Value(FrameOps::quantile(s.values, (q == nullptr || q->isNone()) ? 0.5 : toDouble(*q, "quantile")));
    }
    if (name == "idxmax") return extremeLabel(s, true);
    if (name == "idxmin") return extremeLabel(s, false);
    if (name == "reset_index") {
        if (boolArg(args, 99, "drop", false)) return makeSeries(Series(s.values));
        Series named = s;
        if (const Value* newName = args.keyword("name")) named.values.name = toText(*newName, "reset_index");
        if (named.values.name.empty()) named.values.name = "0";
        return makeFrame(FrameOps::seriesToFrame(named, true));
    }
    if (name == "to_frame") {
        Series named = s;
        if (const Value* newName = args.get(0, "name")) named.values.name = toText(*newName, "to_frame");
        return makeFrame(FrameOps::seriesToFrame(named, false));
    }
    if (name == "tolist" || name == "to_list") return makeList(iterate(self));
    if (name == "to_dict" || name == "items") {
        auto out = std::make_shared<DictValue>();
        std::vector<Value> pairs;
        for (size_t r = 0; r < s.size(); ++r) {
            if (name == "to_dict") out->set(labelValue(s.index, r), cellValue(s.values, r));
            else pairs.push_back(makeTuple({labelValue(s.index, r), cellValue(s.values, r)}));
        }
        if (name == "items") return makeList(std::move(pairs));
        return Value(out);
    }
    if (name == "nlargest") return seriesExtremes(s, args, true);
    if (name == "nsmallest") return seriesExtremes(s, args, false);
    if (name == "drop_duplicates" || name == "duplicated") {
        DataFrame asFrame = FrameOps::seriesToFrame(s, false);
        const std::string keep = textArg(args, 99, "keep", "first");
        if (keep != "first" && keep != "last") throw ScriptError("ValueError", "keep must be either \"first\" or \"last\"");
        const std::vector<size_t> kept = FrameOps::distinctRows(asFrame, {}, keep == "first");
        if (name == "drop_duplicates") return makeSeries(s.take(kept));
        std::vector<uint8_t> flags(s.size(), 1);
        for (size_t r : kept) flags[r] = 0;
        return makeSeries(withValues(s, Column::fromBools("", std::move(flags))));
    }
    if (name == "copy") return makeSeries(s);
    if (name == "map") return mapSeries(s, args.required(0, "arg", "map"), false);
    if (name == "apply") return mapSeries(s, args.required(0, "func", "apply"), true);
    if (name == "any" || name == "all") {
        const bool wantAny = name == "any";
        for (size_t r = 0; r < s.size(); ++r) {
            if (s.values.isMissing(r)) continue;
            if (truthy(cellValue(s.values, r)) == wantAny) return Value(wantAny);
        }
        return Value(!wantAny);
    }
    if (name == "corr") {
        const Value& other = args.required(0, "other", "corr");
        if (!other.isSeries()) throw ScriptError("TypeError", "corr expects a Series");
        auto aligned = FrameOps::align(s, other.series());
        return Value(FrameOps::pearson(aligned.first.values, aligned.second.values));
    }
    if (name == "replace") return replaceSeries(s, args);
    if (name == "unstack") return unstack(s);
    if (name == "mode") return modeSeries(s);
    if (name == "get") {
        const std::vector<size_t> rows = labelRows(s.index, requireScalar(args.required(0, "key", "get"), "get"));
        if (rows.size() == 1) return cellValue(s.values, rows.front());
        const Value* fallback = args.get(1, "default");
        return fallback == nullptr ? Value() : *fallback;
    }
    if (name == "clip") return clipSeries(s, args);
    if (name == "where") return whereSeries(s, args);
    if (name == "eq" || name == "ne" || name == "lt" || name == "le" || name == "gt" || name == "ge") {
        return compareMethod(self, name, args);
    }
    if (name == "to_string") return Value(FrameFormat::seriesToString(s));
    if (name == "agg" || name == "aggregate") return aggSeries(s, args);
    throw ScriptError("AttributeError", "'Series' object has no attribute '" + name + "'");
}

// ---------------------------------------------------------------------------
// GroupBy

std::optional<Value> groupByAttribute(const Value& self, const std::string& name) {
    const GroupByValue& g = *self.as<GroupByPtr>();
    if (groupByMethods().count(name) != 0) return boundMethod(self, name);
    if (name == "ngroups") return Value(groupsOf(g).members.size());
    if (g.frame->findColumn(name) >= 0) return groupByGetItem(self, Value(name));
    return std::nullopt;
}

Value groupByGetItem(const Value& self, const Value& key) {
    const GroupByValue& g = *self.as<GroupByPtr>();
    auto selected = std::make_shared<GroupByValue>(g);
    if (const auto* name = key.ptr<std::string>()) {
        if (g.frame->findColumn(*name) < 0) throw ScriptError("KeyError", "'Column not found: " + *name + "'");
        selected->selection = {*name};
        selected->seriesSelection = true;
        return Value(selected);
    }
    if (isSequence(key)) {
        selected->selection = toNameList(key);
        for (const auto& name : selected->selection) {
            if (g.frame->findColumn(name) < 0) throw ScriptError("KeyError", "'Columns not found: " + name + "'");
        }
        selected->seriesSelection = false;
        return Value(selected);
    }
    throw ScriptError("KeyError", repr(key));
}

Value callGroupByMethod(const Value& self, const std::string& name, const CallArgs& args) {
    const GroupByValue& g = *self.as<GroupByPtr>();
    if (name == "agg" || name == "aggregate") return groupAgg(g, args);
    if (name == "transform") return groupTransform(g, args);
    if (auto r = FrameOps::parseReduction(name)) return groupReduce(g, *r, args);
    throw ScriptError("AttributeError", "'DataFrameGroupBy' object has no attribute '" + name + "'");
}

} // namespace Runtime
} // namespace Tabula
