#include "ScriptRuntime.h"

#include "CommonUtils.h"
#include "FrameFormat.h"
#include "TabulaExceptions.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <numeric>
#include <unordered_set>

namespace Tabula {
namespace Runtime {

namespace {

using ListPtr = std::shared_ptr<ListValue>;
using TuplePtr = std::shared_ptr<TupleValue>;
using DictPtr = std::shared_ptr<DictValue>;
using SlicePtr = std::shared_ptr<SliceValue>;
using FramePtr = std::shared_ptr<DataFrame>;
using CallablePtr = std::shared_ptr<Callable>;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

const std::unordered_set<std::string>& frameMethods() {
    static const std::unordered_set<std::string> names = {
        "head", "tail", "sort_values", "sort_index", "groupby", "mean", "sum", "count", "min", "max", "median",
        "std", "var", "prod", "nunique", "describe", "corr", "isna", "isnull", "notna", "notnull", "dropna",
        "fillna", "drop", "reset_index", "set_index", "drop_duplicates", "nlargest", "nsmallest", "copy",
        "astype", "round", "abs", "cumsum", "pivot_table", "merge", "assign", "idxmax", "idxmin", "quantile",
        "iterrows", "items", "to_string", "to_dict", "select_dtypes", "get", "duplicated", "melt"
    };
    return names;
}

bool isSequence(const Value& v) {
    return v.is<ListPtr>() || v.is<TuplePtr>();
}

std::vector<std::string> namesArg(const Value* v) {
    if (v == nullptr || v->isNone()) return {};
    return toNameList(*v);
}

Series labelledSeries(const std::vector<std::string>& labels, const std::vector<Scalar>& cells, std::string name = "") {
    Column values = cells.empty() ? Column(name, ColumnType::NUMERIC, 0) : Column::fromScalars(name, cells);
    return Series(std::move(values), Index::fromColumn(Column::fromStrings("", labels)));
}

DataFrame selectColumns(const DataFrame& df, const std::vector<std::string>& names) {
    DataFrame out;
    out.index = df.index;
    for (const auto& name : names) out.columns.push_back(df.column(name));
    return out;
}

Value frameReduce(const DataFrame& df, Reduction r, const CallArgs& args) {
    const bool numericOnly = boolArg(args, 99, "numeric_only", false);
    const int ddof = static_cast<int>(intArg(args, 99, "ddof", 1));
    const bool needsNumbers = r == Reduction::MEAN || r == Reduction::MEDIAN || r == Reduction::STD ||
                              r == Reduction::VAR || r == Reduction::PROD || r == Reduction::SUM;
    if (axisArg(args, 0) == 1) {
        std::vector<const Column*> cols;
        for (const auto& c : df.columns) {
            if (c.isNumericLike()) cols.push_back(&c);
            else if (needsNumbers && !numericOnly) {
                throw ScriptError("TypeError", std::string("could not compute ") + FrameOps::reductionName(r) +
                                                   " of non-numeric column '" + c.name + "'");
            }
        }
        std::vector<Scalar> cells;
        cells.reserve(df.rows());
        for (size_t row = 0; row < df.rows(); ++row) {
            std::vector<double> values;
            values.reserve(cols.size());
            for (const Column* c : cols) values.push_back(c->numberAt(row));
            cells.push_back(FrameOps::reduce(Column::fromDoubles("", std::move(values)), r, ddof));
        }
        Column out = cells.empty() ? Column("", ColumnType::NUMERIC, 0) : Column::fromScalars("", cells);
        return makeSeries(Series(std::move(out), df.index));
    }

    std::vector<std::string> labels;
    std::vector<Scalar> cells;
    for (const auto& c : df.columns) {
        if (numericOnly && !c.isNumericLike()) continue;
        labels.push_back(c.name);
        cells.push_back(FrameOps::reduce(c, r, ddof));
    }
    return makeSeries(labelledSeries(labels, cells));
}

Value missingFrame(const DataFrame& df, bool wantMissing) {
    DataFrame out;
    out.index = df.index;
    for (const auto& c : df.columns) out.columns.push_back(FrameOps::missingFlags(c, wantMissing));
    return makeFrame(std::move(out));
}

std::vector<bool> ascendingArg(const CallArgs& args, size_t pos, size_t keys) {
    const Value* v = args.get(pos, "ascending");
    if (v == nullptr || v->isNone()) return std::vector<bool>(keys, true);
    if (isSequence(*v)) {
        std::vector<bool> out;
        for (const auto& item : iterate(*v)) out.push_back(truthy(item));
        if (out.size() != keys) {
            throw ScriptError("ValueError", "Length of ascending (" + std::to_string(out.size()) +
                                                ") != length of by (" + std::to_string(keys) + ")");
        }
        return out;
    }
    return std::vector<bool>(keys, truthy(*v));
}

DataFrame sortedBy(const DataFrame& df, const std::vector<std::string>& by, const std::vector<bool>& ascending) {
    std::vector<const Column*> keys;
    for (const auto& name : by) keys.push_back(&df.column(name));
    return df.take(FrameOps::sortOrder(keys, ascending));
}

Value dropRows(const DataFrame& df, const CallArgs& args) {
    const std::vector<std::string> subset = namesArg(args.get(99, "subset"));
    const std::string how = textArg(args, 99, "how", "any");
    if (how != "any" && how != "all") throw ScriptError("ValueError", "invalid how option: " + how);
    std::vector<const Column*> cols;
    if (subset.empty()) {
        for (const auto& c : df.columns) cols.push_back(&c);
    } else {
        for (const auto& name : subset) cols.push_back(&df.column(name));
    }

    if (axisArg(args, 0) == 1) {
        DataFrame out;
        out.index = df.index;
        for (const auto& c : df.columns) {
            const size_t present = c.countPresent();
            const bool drop = how == "any" ? present < c.size() : (present == 0 && c.size() > 0);
            if (!drop) out.columns.push_back(c);
        }
        return makeFrame(std::move(out));
    }

    std::vector<size_t> keep;
    for (size_t row = 0; row < df.rows(); ++row) {
        size_t missing = 0;
        for (const Column* c : cols) missing += c->isMissing(row) ? 1 : 0;
        const bool drop = how == "any" ? missing > 0 : (!cols.empty() && missing == cols.size());
        if (!drop) keep.push_back(row);
    }
    return makeFrame(df.take(keep));
}

Value fillFrame(const DataFrame& df, const CallArgs& args) {
    const Value& value = args.required(0, "value", "fillna");
    DataFrame out = df;
    if (const auto* mapping = value.ptr<DictPtr>()) {
        for (const auto& kv : (*mapping)->items) {
            const std::string& name = toText(kv.first, "fillna");
            const int idx = out.findColumn(name);
            if (idx < 0) continue;
            Column& col = out.columns[static_cast<size_t>(idx)];
            col = FrameOps::fillMissing(col, requireScalar(kv.second, "fillna"));
        }
        return makeFrame(std::move(out));
    }
    const Scalar fill = requireScalar(value, "fillna");
    for (auto& col : out.columns) col = FrameOps::fillMissing(col, fill);
    return makeFrame(std::move(out));
}

Value dropLabels(const DataFrame& df, const CallArgs& args) {
    std::vector<std::string> columns = namesArg(args.keyword("columns"));
    const Value* labels = args.get(0, "labels");
    const Value* indexLabels = args.keyword("index");
    const bool ignoreMissing = textArg(args, 99, "errors", "raise") == "ignore";
    if (labels != nullptr && !labels->isNone()) {
        if (axisArg(args, 1) == 1) {
            for (auto& name : toNameList(*labels)) columns.push_back(std::move(name));
        } else {
            indexLabels = labels;
        }
    }

    DataFrame out = df;
    for (const auto& name : columns) {
        const int idx = out.findColumn(name);
        if (idx < 0) {
            if (ignoreMissing) continue;
            throw ScriptError("KeyError", "\"['" + name + "'] not found in axis\"");
        }
        out.columns.erase(out.columns.begin() + idx);
    }
    if (indexLabels == nullptr || indexLabels->isNone()) return makeFrame(std::move(out));

    const std::vector<Value> dropped = isSequence(*indexLabels) ? iterate(*indexLabels) : std::vector<Value>{*indexLabels};
    std::vector<uint8_t> remove(out.rows(), 0);
    for (const auto& label : dropped) {
        const std::vector<size_t> rows = labelRows(out.index, requireScalar(label, "drop"));
        if (rows.empty() && !ignoreMissing) throw ScriptError("KeyError", "\"[" + repr(label) + "] not found in axis\"");
        for (size_t r : rows) remove[r] = 1;
    }
    std::vector<size_t> keep;
    for (size_t r = 0; r < out.rows(); ++r) {
        if (!remove[r]) keep.push_back(r);
    }
    return makeFrame(out.take(keep));
}

bool keepFirstArg(const CallArgs& args) {
    const Value* keep = args.get(99, "keep");
    if (keep == nullptr || keep->isNone()) return true;
    const std::string mode = toText(*keep, "keep");
    if (mode == "first") return true;
    if (mode == "last") return false;
    throw ScriptError("ValueError", "keep must be either \"first\" or \"last\"");
}

Value extremeRows(const DataFrame& df, const CallArgs& args, bool largest) {
    const int64_t n = toInt(args.required(0, "n", largest ? "nlargest" : "nsmallest"), "n");
    const std::vector<std::string> by = namesArg(&args.required(1, "columns", largest ? "nlargest" : "nsmallest"));
    for (const auto& name : by) {
        if (!df.column(name).isNumericLike()) {
            throw ScriptError("TypeError", "Column '" + name + "' has dtype object, cannot use method '" +
                                               (largest ? "nlargest" : "nsmallest") + "' with this dtype");
        }
    }
    const DataFrame sorted = sortedBy(df, by, std::vector<bool>(by.size(), !largest));
    return makeFrame(sorted.take(FrameOps::headRows(sorted.rows(), n)));
}

Value convertFrame(const DataFrame& df, const Value& dtype) {
    DataFrame out = df;
    if (const auto* mapping = dtype.ptr<DictPtr>()) {
        for (const auto& kv : (*mapping)->items) out.column(toText(kv.first, "astype")).convertTo(dtypeArg(kv.second));
        return makeFrame(std::move(out));
    }
    const ColumnType target = dtypeArg(dtype);
    for (auto& col : out.columns) col.convertTo(target);
    return makeFrame(std::move(out));
}

Value roundFrame(const DataFrame& df, const CallArgs& args) {
    DataFrame out = df;
    const Value* decimals = args.get(0, "decimals");
    if (decimals != nullptr && decimals->is<DictPtr>()) {
        for (const auto& kv : decimals->as<DictPtr>()->items) {
            const int idx = out.findColumn(toText(kv.first, "round"));
            if (idx < 0) continue;
            Column& col = out.columns[static_cast<size_t>(idx)];
            col = FrameOps::roundColumn(col, static_cast<int>(toInt(kv.second, "round")));
        }
        return makeFrame(std::move(out));
    }
    const int n = (decimals == nullptr || decimals->isNone()) ? 0 : static_cast<int>(toInt(*decimals, "round"));
    for (auto& col : out.columns) col = FrameOps::roundColumn(col, n);
    return makeFrame(std::move(out));
}

Value columnwise(const DataFrame& df, Column (*fn)(const Column&)) {
    DataFrame out;
    out.index = df.index;
    for (const auto& c : df.columns) out.columns.push_back(fn(c));
    return makeFrame(std::move(out));
}

Reduction aggfuncArg(const CallArgs& args, size_t pos) {
    const Value* v = args.get(pos, "aggfunc");
    if (v == nullptr || v->isNone()) return Reduction::MEAN;
    std::string name;
    if (const auto* fn = v->ptr<CallablePtr>()) name = (*fn)->name;
    else name = toText(*v, "aggfunc");
    auto r = FrameOps::parseReduction(name);
    if (!r) throw ScriptError("ValueError", "unsupported aggregation: '" + name + "'");
    return *r;
}

Value pivot(const DataFrame& df, const CallArgs& args, size_t offset) {
    const std::vector<std::string> values = namesArg(args.get(offset, "values"));
    const std::vector<std::string> index = namesArg(args.get(offset + 1, "index"));
    const Value* columns = args.get(offset + 2, "columns");
    const std::string pivotColumn = (columns == nullptr || columns->isNone()) ? std::string() : toText(*columns, "columns");
    return makeFrame(FrameOps::pivotTable(df, values, index, pivotColumn, aggfuncArg(args, offset + 3)));
}

Value mergeFrames(const DataFrame& left, const Value& rightValue, const CallArgs& args, size_t offset) {
    if (!rightValue.isFrame() && !rightValue.isSeries()) {
        throw ScriptError("TypeError", "Can only merge Series or DataFrame objects, a " + typeName(rightValue) + " was passed");
    }
    const DataFrame right = rightValue.isFrame() ? rightValue.frame() : FrameOps::seriesToFrame(rightValue.series(), false);
    const std::vector<std::string> on = namesArg(args.get(offset, "on"));
    return makeFrame(FrameOps::merge(left, right, on, textArg(args, offset + 1, "how", "inner")));
}

Value extremeLabels(const DataFrame& df, bool wantMax) {
    std::vector<std::string> labels;
    std::vector<Scalar> cells;
    for (const auto& c : df.columns) {
        if (!c.isNumericLike()) continue;
        std::optional<size_t> best;
        for (size_t r = 0; r < c.size(); ++r) {
            if (c.isMissing(r)) continue;
            if (!best || (wantMax ? c.numberAt(r) > c.numberAt(*best) : c.numberAt(r) < c.numberAt(*best))) best = r;
        }
        labels.push_back(c.name);
        cells.push_back(best ? df.index.labelAt(*best) : Scalar(std::monostate{}));
    }
    return makeSeries(labelledSeries(labels, cells));
}

Value quantiles(const DataFrame& df, const CallArgs& args) {
    const Value* q = args.get(0, "q");
    std::vector<const Column*> numeric;
    std::vector<std::string> names;
    for (const auto& c : df.columns) {
        if (c.isNumericLike()) {
            numeric.push_back(&c);
            names.push_back(c.name);
        }
    }
    if (q != nullptr && isSequence(*q)) {
        std::vector<double> qs;
        for (const auto& item : iterate(*q)) qs.push_back(toDouble(item, "quantile"));
        DataFrame out;
        out.index = Index::fromColumn(Column::fromDoubles("", qs));
        for (const Column* c : numeric) {
            std::vector<double> cells;
            for (double level : qs) cells.push_back(FrameOps::quantile(*c, level));
            out.columns.push_back(Column::fromDoubles(c->name, std::move(cells)));
        }
        return makeFrame(std::move(out));
    }
    const double level = (q == nullptr || q->isNone()) ? 0.5 : toDouble(*q, "quantile");
    std::vector<Scalar> cells;
    for (const Column* c : numeric) cells.emplace_back(FrameOps::quantile(*c, level));
    return makeSeries(labelledSeries(names, cells, FrameFormat::floatRepr(level)));
}

Value frameToDict(const DataFrame& df, const std::string& orient) {
    if (orient == "records") {
        std::vector<Value> rows;
        for (size_t r = 0; r < df.rows(); ++r) {
            auto record = std::make_shared<DictValue>();
            for (const auto& c : df.columns) record->set(Value(c.name), cellValue(c, r));
            rows.emplace_back(record);
        }
        return makeList(std::move(rows));
    }
    auto out = std::make_shared<DictValue>();
    for (const auto& c : df.columns) {
        if (orient == "list") {
            std::vector<Value> cells;
            for (size_t r = 0; r < df.rows(); ++r) cells.push_back(cellValue(c, r));
            out->set(Value(c.name), makeList(std::move(cells)));
        } else if (orient == "dict") {
            auto byLabel = std::make_shared<DictValue>();
            for (size_t r = 0; r < df.rows(); ++r) byLabel->set(labelValue(df.index, r), cellValue(c, r));
            out->set(Value(c.name), Value(byLabel));
        } else {
            throw ScriptError("ValueError", "orient '" + orient + "' not understood");
        }
    }
    return Value(out);
}

bool matchesDtype(const Column& c, const std::string& kind) {
    if (kind == "number" || kind == "numeric") return c.isNumericLike() && c.type != ColumnType::BOOLEAN;
    if (kind == "object" || kind == "category" || kind == "string" || kind == "str") return c.type == ColumnType::CATEGORICAL;
    if (kind == "bool") return c.type == ColumnType::BOOLEAN;
    if (kind == "datetime" || kind == "datetime64" || kind == "datetime64[ns]") return c.type == ColumnType::DATETIME;
    if (kind == "int" || kind == "int64" || kind == "integer") return c.type == ColumnType::INTEGER;
    if (kind == "float" || kind == "float64") return c.type == ColumnType::NUMERIC;
    throw ScriptError("TypeError", "data type '" + kind + "' not understood");
}

std::vector<std::string> dtypeKinds(const Value* v) {
    std::vector<std::string> kinds;
    if (v == nullptr || v->isNone()) return kinds;
    const std::vector<Value> items = isSequence(*v) ? iterate(*v) : std::vector<Value>{*v};
    for (const auto& item : items) {
        if (const auto* fn = item.ptr<CallablePtr>()) kinds.push_back((*fn)->name);
        else kinds.push_back(toText(item, "select_dtypes"));
    }
    return kinds;
}

Value selectDtypes(const DataFrame& df, const CallArgs& args) {
    const std::vector<std::string> include = dtypeKinds(args.get(0, "include"));
    const std::vector<std::string> exclude = dtypeKinds(args.get(1, "exclude"));
    if (include.empty() && exclude.empty()) {
        throw ScriptError("ValueError", "at least one of include or exclude must be nonempty");
    }
    DataFrame out;
    out.index = df.index;
    for (const auto& c : df.columns) {
        const auto matches = [&](const std::string& kind) { return matchesDtype(c, kind); };
        const bool included = include.empty() || std::any_of(include.begin(), include.end(), matches);
        const bool excluded = std::any_of(exclude.begin(), exclude.end(), matches);
        if (included && !excluded) out.columns.push_back(c);
    }
    return makeFrame(std::move(out));
}

Value melt(const DataFrame& df, const CallArgs& args) {
    const std::vector<std::string> idVars = namesArg(args.get(0, "id_vars"));
    std::vector<std::string> valueVars = namesArg(args.get(1, "value_vars"));
    const std::string varName = textArg(args, 2, "var_name", "variable");
    const std::string valueName = textArg(args, 3, "value_name", "value");
    if (valueVars.empty()) {
        for (const auto& c : df.columns) {
            if (std::find(idVars.begin(), idVars.end(), c.name) == idVars.end()) valueVars.push_back(c.name);
        }
    }
    std::vector<std::vector<Scalar>> ids(idVars.size());
    std::vector<Scalar> variables;
    std::vector<Scalar> values;
    for (const auto& var : valueVars) {
        const Column& source = df.column(var);
        for (size_t r = 0; r < df.rows(); ++r) {
            for (size_t i = 0; i < idVars.size(); ++i) ids[i].push_back(df.column(idVars[i]).at(r));
            variables.emplace_back(var);
            values.push_back(source.at(r));
        }
    }
    DataFrame out;
    out.index = Index::range(variables.size());
    for (size_t i = 0; i < idVars.size(); ++i) {
        out.columns.push_back(ids[i].empty() ? Column(idVars[i], df.column(idVars[i]).type, 0)
                                             : Column::fromScalars(idVars[i], ids[i]));
    }
    out.columns.push_back(Column::fromScalars(varName, variables));
    out.columns.push_back(values.empty() ? Column(valueName, ColumnType::NUMERIC, 0) : Column::fromScalars(valueName, values));
    return makeFrame(std::move(out));
}

Value makeGroupBy(const Value& self, const CallArgs& args) {
    const DataFrame& df = self.frame();
    auto g = std::make_shared<GroupByValue>();
    g->frame = self.as<FramePtr>();
    const Value& by = args.required(0, "by", "groupby");
    const std::vector<Value> keys = isSequence(by) ? iterate(by) : std::vector<Value>{by};
    if (keys.empty()) throw ScriptError("ValueError", "No group keys passed!");
    for (const auto& key : keys) {
        if (key.isSeries()) {
            if (key.series().size() != df.rows()) throw ScriptError("ValueError", "Grouper and axis must be same length");
            g->keys.push_back(key.series().values);
        } else {
            g->keys.push_back(df.column(toText(key, "groupby")));
        }
    }
    g->asIndex = boolArg(args, 99, "as_index", true);
    g->dropna = boolArg(args, 99, "dropna", true);
    g->sort = boolArg(args, 99, "sort", true);
    return Value(g);
}

std::vector<size_t> maskRows(const Column& mask, size_t rows) {
    if (mask.size() != rows) {
        throw ScriptError("ValueError", "Item wrong length " + std::to_string(mask.size()) + " instead of " +
                                            std::to_string(rows) + ".");
    }
    return FrameOps::rowsWhere(mask);
}

std::optional<size_t> findKey(const Index& index, const std::vector<Scalar>& key) {
    if (key.size() != index.nlevels()) return std::nullopt;
    if (index.levels.size() <= 1) return index.find(key.front());
    for (size_t r = 0; r < index.size(); ++r) {
        bool same = true;
        for (size_t l = 0; l < key.size() && same; ++l) same = scalarsEqual(index.labelAt(r, l), key[l]);
        if (same) return r;
    }
    return std::nullopt;
}

// Parses a whole cell as a number; nullopt when any character is left over.
std::optional<Scalar> parseNumber(const std::string& raw) {
    const std::string text = CommonUtils::trim(raw);
    if (text.empty()) return std::nullopt;
    int64_t i = 0;
    auto ir = std::from_chars(text.data(), text.data() + text.size(), i);
    if (ir.ec == std::errc{} && ir.ptr == text.data() + text.size()) return Scalar(i);
    const std::string lower = CommonUtils::toLower(text);
    if (lower == "nan") return Scalar(kNaN);
    if (lower == "inf" || lower == "+inf") return Scalar(std::numeric_limits<double>::infinity());
    if (lower == "-inf") return Scalar(-std::numeric_limits<double>::infinity());
    double d = 0.0;
    const char* begin = text.data() + (text[0] == '+' ? 1 : 0);
    auto dr = std::from_chars(begin, text.data() + text.size(), d);
    if (dr.ec == std::errc{} && dr.ptr == text.data() + text.size()) return Scalar(d);
    return std::nullopt;
}

Column numericColumn(const Column& source, bool coerce) {
    if (source.isNumericLike()) return source;
    std::vector<Scalar> cells;
    cells.reserve(source.size());
    for (size_t r = 0; r < source.size(); ++r) {
        const Scalar cell = source.at(r);
        if (scalarIsMissing(cell)) {
            cells.emplace_back(std::monostate{});
            continue;
        }
        std::optional<Scalar> parsed;
        if (const auto* s = std::get_if<std::string>(&cell)) parsed = parseNumber(*s);
        if (!parsed) {
            if (!coerce) {
                throw ScriptError("ValueError", "Unable to parse string \"" + FrameFormat::scalarStr(cell) +
                                                    "\" at position " + std::to_string(r));
            }
            parsed = Scalar(std::monostate{});
        }
        cells.push_back(*parsed);
    }
    return cells.empty() ? Column(source.name, ColumnType::NUMERIC, 0) : Column::fromScalars(source.name, cells);
}

Column datetimeColumn(const Column& source, bool coerce) {
    if (source.type == ColumnType::DATETIME) return source;
    Column out(source.name, ColumnType::DATETIME, source.size());
    for (size_t r = 0; r < source.size(); ++r) {
        const Scalar cell = source.at(r);
        if (scalarIsMissing(cell)) {
            out.missing[r] = 1;
            continue;
        }
        std::optional<Timestamp> ts;
        if (const auto* s = std::get_if<std::string>(&cell)) ts = parseTimestamp(CommonUtils::trim(*s));
        if (!ts) {
            if (!coerce) {
                throw ScriptError("ValueError", "time data \"" + FrameFormat::scalarStr(cell) +
                                                    "\" doesn't match a known format, at position " + std::to_string(r));
            }
            out.missing[r] = 1;
            continue;
        }
        std::get<std::vector<int64_t>>(out.values)[r] = ts->seconds;
    }
    return out;
}

bool coerceArg(const CallArgs& args) {
    const std::string errors = textArg(args, 99, "errors", "raise");
    if (errors != "raise" && errors != "coerce" && errors != "ignore") {
        throw ScriptError("ValueError", "invalid error value specified");
    }
    return errors == "coerce";
}

Value frameFromData(const CallArgs& args) {
    const Value* data = args.get(0, "data");
    const std::vector<std::string> columns = namesArg(args.get(2, "columns"));
    DataFrame out;

    if (data == nullptr || data->isNone()) {
        for (const auto& name : columns) out.columns.push_back(Column(name, ColumnType::CATEGORICAL, 0));
    } else if (data->isFrame()) {
        out = data->frame();
    } else if (data->isSeries()) {
        out = FrameOps::seriesToFrame(data->series(), false);
    } else if (const auto* mapping = data->ptr<DictPtr>()) {
        size_t rows = 0;
        bool sized = false;
        for (const auto& kv : (*mapping)->items) {
            if (isSequence(kv.second) || kv.second.isSeries()) {
                const size_t n = kv.second.isSeries() ? kv.second.series().size() : iterate(kv.second).size();
                if (sized && n != rows) throw ScriptError("ValueError", "All arrays must be of the same length");
                rows = n;
                sized = true;
            }
        }
        if (!sized && !(*mapping)->items.empty()) {
            throw ScriptError("ValueError", "If using all scalar values, you must pass an index");
        }
        out.index = Index::range(rows);
        for (const auto& kv : (*mapping)->items) {
            const std::string name = kv.first.is<std::string>() ? kv.first.as<std::string>() : str(kv.first);
            if (kv.second.isSeries()) {
                Column col = kv.second.series().values;
                col.name = name;
                out.columns.push_back(std::move(col));
            } else if (isSequence(kv.second)) {
                out.columns.push_back(columnFromValues(name, iterate(kv.second)));
            } else {
                out.columns.push_back(Column::fromScalars(name, std::vector<Scalar>(rows, requireScalar(kv.second, "DataFrame"))));
            }
        }
        if (!columns.empty()) {
            DataFrame selected;
            selected.index = out.index;
            for (const auto& name : columns) {
                const int idx = out.findColumn(name);
                if (idx >= 0) {
                    selected.columns.push_back(out.columns[static_cast<size_t>(idx)]);
                } else {
                    Column empty(name, ColumnType::NUMERIC, rows);
                    empty.missing.assign(rows, 1);
                    selected.columns.push_back(std::move(empty));
                }
            }
            out = std::move(selected);
        }
    } else if (isSequence(*data)) {
        const std::vector<Value> rows = iterate(*data);
        std::vector<std::string> names = columns;
        std::vector<std::vector<Scalar>> cells;
        const bool records = !rows.empty() && rows.front().is<DictPtr>();
        if (records && names.empty()) {
            for (const auto& row : rows) {
                if (!row.is<DictPtr>()) throw ScriptError("TypeError", "mixed records and sequences in DataFrame data");
                for (const auto& kv : row.as<DictPtr>()->items) {
                    const std::string name = kv.first.is<std::string>() ? kv.first.as<std::string>() : str(kv.first);
                    if (std::find(names.begin(), names.end(), name) == names.end()) names.push_back(name);
                }
            }
        }
        for (const auto& row : rows) {
            std::vector<Scalar> line;
            if (records) {
                const DictValue& record = *row.as<DictPtr>();
                for (const auto& name : names) {
                    const Value* v = record.find(Value(name));
                    line.push_back(v == nullptr ? Scalar(std::monostate{}) : requireScalar(*v, "DataFrame"));
                }
            } else if (isSequence(row)) {
                for (const auto& item : iterate(row)) line.push_back(requireScalar(item, "DataFrame"));
            } else {
                line.push_back(requireScalar(row, "DataFrame"));
            }
            cells.push_back(std::move(line));
        }
        size_t width = names.size();
        for (const auto& line : cells) width = std::max(width, line.size());
        if (!columns.empty() && width > columns.size()) {
            throw ScriptError("ValueError", std::to_string(columns.size()) + " columns passed, passed data had " +
                                                std::to_string(width) + " columns");
        }
        for (size_t j = names.size(); j < width; ++j) names.push_back(std::to_string(j));
        out.index = Index::range(cells.size());
        for (size_t j = 0; j < width; ++j) {
            std::vector<Scalar> col;
            for (const auto& line : cells) col.push_back(j < line.size() ? line[j] : Scalar(std::monostate{}));
            out.columns.push_back(col.empty() ? Column(names[j], ColumnType::CATEGORICAL, 0) : Column::fromScalars(names[j], col));
        }
    } else {
        throw ScriptError("ValueError", "DataFrame constructor not properly called!");
    }

    if (const Value* index = args.get(1, "index")) {
        if (!index->isNone()) {
            Column labels = columnFromValues("", iterate(*index));
            if (labels.size() != out.rows()) {
                throw ScriptError("ValueError", "Length of values (" + std::to_string(labels.size()) +
                                                    ") does not match length of index (" + std::to_string(out.rows()) + ")");
            }
            out.index = Index::fromColumn(std::move(labels));
        }
    }
    return makeFrame(std::move(out));
}

Value seriesFromData(const CallArgs& args) {
    const Value* data = args.get(0, "data");
    const Value* index = args.get(1, "index");
    const std::string name = textArg(args, 99, "name", "");
    Series out;
    if (data == nullptr || data->isNone()) {
        out = Series(Column(name, ColumnType::NUMERIC, 0));
    } else if (data->isSeries()) {
        out = data->series();
    } else if (const auto* mapping = data->ptr<DictPtr>()) {
        std::vector<Value> keys;
        std::vector<Value> values;
        for (const auto& kv : (*mapping)->items) {
            keys.push_back(kv.first);
            values.push_back(kv.second);
        }
        out = Series(columnFromValues(name, values), Index::fromColumn(columnFromValues("", keys)));
    } else if (isSequence(*data) || data->is<std::shared_ptr<SetValue>>()) {
        out = Series(columnFromValues(name, iterate(*data)));
    } else {
        if (index == nullptr || index->isNone()) {
            out = Series(columnFromValues(name, {*data}));
        } else {
            const size_t n = iterate(*index).size();
            out = Series(Column::fromScalars(name, std::vector<Scalar>(n, requireScalar(*data, "Series"))));
        }
    }
    if (index != nullptr && !index->isNone() && (data == nullptr || !data->is<DictPtr>())) {
        Column labels = columnFromValues("", iterate(*index));
        if (labels.size() != out.size()) {
            throw ScriptError("ValueError", "Length of values (" + std::to_string(out.size()) +
                                                ") does not match length of index (" + std::to_string(labels.size()) + ")");
        }
        out.index = Index::fromColumn(std::move(labels));
    }
    if (args.get(99, "name") != nullptr) out.values.name = name;
    return makeSeries(std::move(out));
}

Value concat(const CallArgs& args) {
    const std::vector<Value> objs = iterate(args.required(0, "objs", "concat"));
    if (objs.empty()) throw ScriptError("ValueError", "No objects to concatenate");
    const bool ignoreIndex = boolArg(args, 99, "ignore_index", false);
    const int axis = axisArg(args, 1);
    bool allSeries = true;
    std::vector<DataFrame> frames;
    for (const auto& obj : objs) {
        if (obj.isFrame()) {
            allSeries = false;
            frames.push_back(obj.frame());
        } else if (obj.isSeries()) {
            frames.push_back(FrameOps::seriesToFrame(obj.series(), false));
        } else {
            throw ScriptError("TypeError", "cannot concatenate object of type '" + typeName(obj) +
                                               "'; only Series and DataFrame objs are valid");
        }
    }
    if (axis == 1) return makeFrame(FrameOps::concatColumns(frames));
    if (allSeries) {
        const std::string name = objs.front().series().name();
        for (auto& f : frames) f.columns.front().name = "0";
        DataFrame joined = FrameOps::concatRows(frames, ignoreIndex);
        Column values = joined.columns.front();
        bool sameName = true;
        for (const auto& obj : objs) sameName = sameName && obj.series().name() == name;
        values.name = sameName ? name : std::string();
        return makeSeries(Series(std::move(values), joined.index));
    }
    return makeFrame(FrameOps::concatRows(frames, ignoreIndex));
}

Value missingCheck(const Value& v, bool wantMissing) {
    if (v.isSeries()) return makeSeries(Series(FrameOps::missingFlags(v.series().values, wantMissing), v.series().index));
    if (v.isFrame()) return missingFrame(v.frame(), wantMissing);
    if (isSequence(v)) {
        std::vector<Value> out;
        for (const auto& item : iterate(v)) out.push_back(missingCheck(item, wantMissing));
        return makeList(std::move(out));
    }
    const auto s = toScalar(v);
    const bool missing = s && scalarIsMissing(*s);
    return Value(missing == wantMissing);
}

} // namespace

// ---------------------------------------------------------------------------
// Shared helpers

Column alignedColumn(const DataFrame& df, const Value& v, const std::string& name) {
    const bool fresh = df.columns.empty() && df.rows() == 0 && df.index.isRange();
    if (v.isSeries()) {
        const Series& s = v.series();
        Column out;
        if (fresh || s.index.sameLabels(df.index)) {
            out = s.values;
        } else {
            std::vector<Scalar> cells;
            cells.reserve(df.rows());
            for (size_t r = 0; r < df.rows(); ++r) {
                const auto pos = findKey(s.index, df.index.key(r));
                cells.push_back(pos ? s.values.at(*pos) : Scalar(std::monostate{}));
            }
            out = cells.empty() ? Column(name, s.values.type, 0) : Column::fromScalars(name, cells);
        }
        out.name = name;
        return out;
    }
    if (v.isFrame()) {
        if (v.frame().cols() != 1) {
            throw ScriptError("ValueError", "Cannot set a DataFrame with multiple columns to the single column " + name);
        }
        return alignedColumn(df, makeSeries(Series(v.frame().columns.front(), v.frame().index)), name);
    }
    if (isSequence(v)) {
        const std::vector<Value> items = iterate(v);
        if (!fresh && items.size() != df.rows()) {
            throw ScriptError("ValueError", "Length of values (" + std::to_string(items.size()) +
                                                ") does not match length of index (" + std::to_string(df.rows()) + ")");
        }
        return columnFromValues(name, items);
    }
    const Scalar cell = requireScalar(v, "column assignment");
    if (df.rows() == 0) {
        Column empty = Column::fromScalars(name, {cell});
        return empty.take({});
    }
    return Column::fromScalars(name, std::vector<Scalar>(df.rows(), cell));
}

std::vector<size_t> labelRows(const Index& index, const Scalar& label) {
    std::vector<size_t> rows;
    if (index.isRange()) {
        if (auto r = index.find(label)) rows.push_back(*r);
        return rows;
    }
    const Column& first = index.levels.front();
    for (size_t r = 0; r < index.size(); ++r) {
        if (scalarsEqual(first.at(r), label)) rows.push_back(r);
    }
    return rows;
}

Value labelValue(const Index& index, size_t row) {
    if (index.levels.size() <= 1) return fromScalar(index.labelAt(row));
    std::vector<Value> parts;
    for (size_t l = 0; l < index.levels.size(); ++l) parts.push_back(fromScalar(index.labelAt(row, l)));
    return makeTuple(std::move(parts));
}

ColumnType dtypeArg(const Value& v) {
    std::string name;
    if (const auto* fn = v.ptr<CallablePtr>()) name = (*fn)->name;
    else name = CommonUtils::toLower(toText(v, "astype"));
    if (name == "int" || name == "int64" || name == "int32" || name == "int16" || name == "int8" || name == "integer") {
        return ColumnType::INTEGER;
    }
    if (name == "float" || name == "float64" || name == "float32" || name == "double") return ColumnType::NUMERIC;
    if (name == "str" || name == "string" || name == "object" || name == "category") return ColumnType::CATEGORICAL;
    if (name == "bool" || name == "boolean") return ColumnType::BOOLEAN;
    if (name == "datetime64" || name == "datetime64[ns]" || name == "datetime") return ColumnType::DATETIME;
    throw ScriptError("TypeError", "data type '" + name + "' not understood");
}

int axisArg(const CallArgs& args, size_t pos) {
    const Value* v = args.get(pos, "axis");
    if (v == nullptr || v->isNone()) return 0;
    if (const auto* s = v->ptr<std::string>()) {
        if (*s == "index" || *s == "rows") return 0;
        if (*s == "columns") return 1;
        throw ScriptError("ValueError", "No axis named " + *s);
    }
    const int64_t axis = toInt(*v, "axis");
    if (axis != 0 && axis != 1) throw ScriptError("ValueError", "No axis named " + std::to_string(axis));
    return static_cast<int>(axis);
}

// ---------------------------------------------------------------------------
// DataFrame

std::optional<Value> frameAttribute(const Value& self, const std::string& name) {
    const DataFrame& df = self.frame();
    if (frameMethods().count(name) != 0) return boundMethod(self, name);
    if (name == "columns") {
        std::vector<Value> names;
        for (const auto& c : df.columns) names.emplace_back(c.name);
        return makeList(std::move(names));
    }
    if (name == "shape") return makeTuple({Value(df.rows()), Value(df.cols())});
    if (name == "size") return Value(df.rows() * df.cols());
    if (name == "ndim") return Value(static_cast<int64_t>(2));
    if (name == "empty") return Value(df.rows() == 0 || df.cols() == 0);
    if (name == "index") {
        std::vector<Scalar> labels;
        labels.reserve(df.rows());
        if (df.index.levels.size() > 1) {
            std::vector<Value> keys;
            for (size_t r = 0; r < df.rows(); ++r) keys.push_back(labelValue(df.index, r));
            return makeList(std::move(keys));
        }
        for (size_t r = 0; r < df.rows(); ++r) labels.push_back(df.index.labelAt(r));
        const std::string indexName = df.index.isRange() ? std::string() : df.index.levels.front().name;
        Column values = labels.empty() ? Column(indexName, ColumnType::INTEGER, 0) : Column::fromScalars(indexName, labels);
        return makeSeries(Series(std::move(values), df.index));
    }
    if (name == "dtypes") {
        std::vector<std::string> labels;
        std::vector<Scalar> types;
        for (const auto& c : df.columns) {
            labels.push_back(c.name);
            types.emplace_back(std::string(columnTypeName(c.type)));
        }
        return makeSeries(labelledSeries(labels, types));
    }
    if (name == "values") {
        std::vector<Value> rows;
        rows.reserve(df.rows());
        for (size_t r = 0; r < df.rows(); ++r) {
            std::vector<Value> row;
            for (const auto& c : df.columns) row.push_back(cellValue(c, r));
            rows.push_back(makeList(std::move(row)));
        }
        return makeList(std::move(rows));
    }
    if (name == "loc" || name == "iloc") {
        auto accessor = std::make_shared<Accessor>();
        accessor->kind = name == "loc" ? Accessor::Kind::LOC : Accessor::Kind::ILOC;
        accessor->target = self;
        return Value(accessor);
    }
    const int idx = df.findColumn(name);
    if (idx >= 0) return makeSeries(Series(df.columns[static_cast<size_t>(idx)], df.index));
    return std::nullopt;
}

Value frameGetItem(const Value& self, const Value& key) {
    const DataFrame& df = self.frame();
    if (const auto* name = key.ptr<std::string>()) return makeSeries(Series(df.column(*name), df.index));
    if (key.isSeries()) return makeFrame(df.take(maskRows(key.series().values, df.rows())));
    if (const auto* slice = key.ptr<SlicePtr>()) return makeFrame(df.take(slicePositions(**slice, df.rows())));
    if (key.is<ListPtr>()) {
        const std::vector<Value> items = iterate(key);
        const bool mask = !items.empty() && std::all_of(items.begin(), items.end(), [](const Value& v) { return v.is<bool>(); });
        if (mask) return makeFrame(df.take(maskRows(columnFromValues("", items), df.rows())));
        return makeFrame(selectColumns(df, toNameList(key)));
    }
    throw ScriptError("KeyError", repr(key));
}

void frameSetItem(const Value& self, const Value& key, const Value& value) {
    DataFrame& df = self.frame();
    if (const auto* name = key.ptr<std::string>()) {
        df.setColumn(alignedColumn(df, value, *name));
        return;
    }
    if (key.is<ListPtr>()) {
        const std::vector<std::string> names = toNameList(key);
        if (value.isFrame()) {
            const DataFrame& source = value.frame();
            if (source.cols() != names.size()) throw ScriptError("ValueError", "Columns must be same length as key");
            for (size_t i = 0; i < names.size(); ++i) {
                df.setColumn(alignedColumn(df, makeSeries(Series(source.columns[i], source.index)), names[i]));
            }
            return;
        }
        for (const auto& name : names) df.setColumn(alignedColumn(df, value, name));
        return;
    }
    if (key.isSeries()) {
        const std::vector<size_t> rows = maskRows(key.series().values, df.rows());
        const Scalar cell = requireScalar(value, "masked assignment");
        for (auto& col : df.columns) {
            for (size_t r : rows) col.set(r, cell);
        }
        return;
    }
    throw ScriptError("TypeError", "unsupported DataFrame assignment key of type '" + typeName(key) + "'");
}

Value callFrameMethod(const Value& self, const std::string& name, const CallArgs& args) {
    const DataFrame& df = self.frame();
    if (name == "head") return makeFrame(df.take(FrameOps::headRows(df.rows(), intArg(args, 0, "n", 5))));
    if (name == "tail") return makeFrame(df.take(FrameOps::tailRows(df.rows(), intArg(args, 0, "n", 5))));
    if (name == "sort_values") {
        const std::vector<std::string> by = namesArg(&args.required(0, "by", "sort_values"));
        return makeFrame(sortedBy(df, by, ascendingArg(args, 1, by.size())));
    }
    if (name == "sort_index") return makeFrame(df.take(FrameOps::indexSortOrder(df.index, boolArg(args, 99, "ascending", true))));
    if (name == "groupby") return makeGroupBy(self, args);
    if (auto r = FrameOps::parseReduction(name)) {
        if (name != "first" && name != "last" && name != "size") return frameReduce(df, *r, args);
    }
    if (name == "describe") return makeFrame(FrameOps::describe(df));
    if (name == "corr") return makeFrame(FrameOps::correlation(df));
    if (name == "isna" || name == "isnull") return missingFrame(df, true);
    if (name == "notna" || name == "notnull") return missingFrame(df, false);
    if (name == "dropna") return dropRows(df, args);
    if (name == "fillna") return fillFrame(df, args);
    if (name == "drop") return dropLabels(df, args);
    if (name == "reset_index") return makeFrame(FrameOps::resetIndex(df, boolArg(args, 99, "drop", false)));
    if (name == "set_index") {
        return makeFrame(FrameOps::setIndex(df, namesArg(&args.required(0, "keys", "set_index")),
                                            boolArg(args, 99, "drop", true)));
    }
    if (name == "drop_duplicates") {
        return makeFrame(df.take(FrameOps::distinctRows(df, namesArg(args.get(0, "subset")), keepFirstArg(args))));
    }
    if (name == "duplicated") {
        const std::vector<size_t> kept = FrameOps::distinctRows(df, namesArg(args.get(0, "subset")), keepFirstArg(args));
        std::vector<uint8_t> flags(df.rows(), 1);
        for (size_t r : kept) flags[r] = 0;
        return makeSeries(Series(Column::fromBools("", std::move(flags)), df.index));
    }
    if (name == "nlargest") return extremeRows(df, args, true);
    if (name == "nsmallest") return extremeRows(df, args, false);
    if (name == "copy") return makeFrame(df);
    if (name == "astype") return convertFrame(df, args.required(0, "dtype", "astype"));
    if (name == "round") return roundFrame(df, args);
    if (name == "abs") return columnwise(df, FrameOps::absolute);
    if (name == "cumsum") return columnwise(df, FrameOps::cumulativeSum);
    if (name == "pivot_table") return pivot(df, args, 0);
    if (name == "merge") return mergeFrames(df, args.required(0, "right", "merge"), args, 1);
    if (name == "assign") {
        DataFrame out = df;
        for (const auto& kw : args.keywords) out.setColumn(alignedColumn(out, kw.second, kw.first));
        return makeFrame(std::move(out));
    }
    if (name == "idxmax") return extremeLabels(df, true);
    if (name == "idxmin") return extremeLabels(df, false);
    if (name == "quantile") return quantiles(df, args);
    if (name == "iterrows") {
        std::vector<Value> rows;
        rows.reserve(df.rows());
        for (size_t r = 0; r < df.rows(); ++r) rows.push_back(makeTuple({labelValue(df.index, r), makeSeries(df.row(r))}));
        return makeList(std::move(rows));
    }
    if (name == "items") {
        std::vector<Value> cols;
        for (const auto& c : df.columns) cols.push_back(makeTuple({Value(c.name), makeSeries(Series(c, df.index))}));
        return makeList(std::move(cols));
    }
    if (name == "to_string") return Value(FrameFormat::frameToString(df));
    if (name == "to_dict") return frameToDict(df, textArg(args, 0, "orient", "dict"));
    if (name == "select_dtypes") return selectDtypes(df, args);
    if (name == "get") {
        const std::string key = toText(args.required(0, "key", "get"), "get");
        const int idx = df.findColumn(key);
        if (idx >= 0) return makeSeries(Series(df.columns[static_cast<size_t>(idx)], df.index));
        const Value* fallback = args.get(1, "default");
        return fallback == nullptr ? Value() : *fallback;
    }
    if (name == "melt") return melt(df, args);
    throw ScriptError("AttributeError", "'DataFrame' object has no attribute '" + name + "'");
}

// ---------------------------------------------------------------------------
// pandas module

bool pandasHas(const std::string& name) {
    static const std::unordered_set<std::string> names = {
        "concat", "DataFrame", "Series", "to_numeric", "to_datetime", "isna", "isnull", "notna", "notnull",
        "merge", "pivot_table", "Timestamp", "melt"
    };
    return names.count(name) != 0;
}

Value pandasFunction(const std::string& name, const CallArgs& args) {
    if (name == "concat") return concat(args);
    if (name == "DataFrame") return frameFromData(args);
    if (name == "Series") return seriesFromData(args);
    if (name == "to_numeric") {
        const Value& arg = args.required(0, "arg", "to_numeric");
        const bool coerce = coerceArg(args);
        if (arg.isSeries()) return makeSeries(Series(numericColumn(arg.series().values, coerce), arg.series().index));
        if (isSequence(arg)) return makeSeries(Series(numericColumn(columnFromValues("", iterate(arg)), coerce)));
        const Column one = numericColumn(Column::fromScalars("", {requireScalar(arg, "to_numeric")}), coerce);
        return cellValue(one, 0);
    }
    if (name == "to_datetime" || name == "Timestamp") {
        const Value& arg = args.required(0, name == "Timestamp" ? "ts_input" : "arg", name);
        const bool coerce = name == "to_datetime" && coerceArg(args);
        if (arg.isSeries()) return makeSeries(Series(datetimeColumn(arg.series().values, coerce), arg.series().index));
        if (isSequence(arg)) return makeSeries(Series(datetimeColumn(columnFromValues("", iterate(arg)), coerce)));
        if (arg.is<Timestamp>()) return arg;
        const Column one = datetimeColumn(Column::fromScalars("", {requireScalar(arg, name)}), coerce);
        return cellValue(one, 0);
    }
    if (name == "isna" || name == "isnull") return missingCheck(args.required(0, "obj", name), true);
    if (name == "notna" || name == "notnull") return missingCheck(args.required(0, "obj", name), false);
    if (name == "merge") {
        const Value& left = args.required(0, "left", "merge");
        if (!left.isFrame()) throw ScriptError("TypeError", "Can only merge Series or DataFrame objects");
        return mergeFrames(left.frame(), args.required(1, "right", "merge"), args, 2);
    }
    if (name == "pivot_table") {
        const Value& data = args.required(0, "data", "pivot_table");
        if (!data.isFrame()) throw ScriptError("TypeError", "pivot_table expects a DataFrame");
        return pivot(data.frame(), args, 1);
    }
    if (name == "melt") {
        const Value& frame = args.required(0, "frame", "melt");
        if (!frame.isFrame()) throw ScriptError("TypeError", "melt expects a DataFrame");
        CallArgs rest;
        rest.positional.assign(args.positional.begin() + 1, args.positional.end());
        rest.keywords = args.keywords;
        return melt(frame.frame(), rest);
    }
    throw ScriptError("AttributeError", "module 'pandas' has no attribute '" + name + "'");
}

} // namespace Runtime
} // namespace Tabula
