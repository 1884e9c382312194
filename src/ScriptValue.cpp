#include "ScriptValue.h"

#include "FrameFormat.h"
#include "TabulaExceptions.h"

#include <cmath>
#include <limits>
#include <type_traits>

namespace Tabula {

const Value* DictValue::find(const Value& key) const {
    for (const auto& kv : items) {
        if (valuesEqual(kv.first, key)) return &kv.second;
    }
    return nullptr;
}

void DictValue::set(const Value& key, Value value) {
    for (auto& kv : items) {
        if (valuesEqual(kv.first, key)) {
            kv.second = std::move(value);
            return;
        }
    }
    items.emplace_back(key, std::move(value));
}

bool SetValue::contains(const Value& v) const {
    for (const auto& item : items) {
        if (valuesEqual(item, v)) return true;
    }
    return false;
}

void SetValue::add(const Value& v) {
    if (!contains(v)) items.push_back(v);
}

Value makeList(std::vector<Value> items) {
    auto list = std::make_shared<ListValue>();
    list->items = std::move(items);
    return Value(list);
}

Value makeTuple(std::vector<Value> items) {
    auto tuple = std::make_shared<TupleValue>();
    tuple->items = std::move(items);
    return Value(tuple);
}

Value makeFrame(DataFrame df) {
    return Value(std::make_shared<DataFrame>(std::move(df)));
}

Value makeSeries(Series s) {
    return Value(std::make_shared<Series>(std::move(s)));
}

Value builtinCallable(std::string name) {
    auto fn = std::make_shared<Callable>();
    fn->kind = Callable::Kind::BUILTIN;
    fn->name = std::move(name);
    return Value(fn);
}

Value boundMethod(Value receiver, std::string name) {
    auto fn = std::make_shared<Callable>();
    fn->kind = Callable::Kind::METHOD;
    fn->name = std::move(name);
    fn->receiver = std::move(receiver);
    return Value(fn);
}

const Value* CallArgs::keyword(const std::string& name) const {
    for (const auto& kv : keywords) {
        if (kv.first == name) return &kv.second;
    }
    return nullptr;
}

const Value* CallArgs::get(size_t pos, const std::string& name) const {
    if (pos < positional.size()) return &positional[pos];
    return keyword(name);
}

void CallArgs::expectAtMost(size_t n, const std::string& function) const {
    if (positional.size() > n) {
        throw ScriptError("TypeError", function + "() takes at most " + std::to_string(n) + " positional arguments (" +
                                           std::to_string(positional.size()) + " given)");
    }
}

const Value& CallArgs::required(size_t pos, const std::string& name, const std::string& function) const {
    const Value* v = get(pos, name);
    if (v == nullptr) throw ScriptError("TypeError", function + "() missing required argument: '" + name + "'");
    return *v;
}

std::string typeName(const Value& v) {
    struct Namer {
        std::string operator()(std::monostate) const { return "NoneType"; }
        std::string operator()(bool) const { return "bool"; }
        std::string operator()(int64_t) const { return "int"; }
        std::string operator()(double) const { return "float"; }
        std::string operator()(const std::string&) const { return "str"; }
        std::string operator()(Timestamp) const { return "Timestamp"; }
        std::string operator()(const std::shared_ptr<ListValue>&) const { return "list"; }
        std::string operator()(const std::shared_ptr<TupleValue>&) const { return "tuple"; }
        std::string operator()(const std::shared_ptr<DictValue>&) const { return "dict"; }
        std::string operator()(const std::shared_ptr<SetValue>&) const { return "set"; }
        std::string operator()(const std::shared_ptr<SliceValue>&) const { return "slice"; }
        std::string operator()(const std::shared_ptr<DataFrame>&) const { return "DataFrame"; }
        std::string operator()(const std::shared_ptr<Series>&) const { return "Series"; }
        std::string operator()(const std::shared_ptr<GroupByValue>&) const { return "DataFrameGroupBy"; }
        std::string operator()(const std::shared_ptr<Figure>&) const { return "Figure"; }
        std::string operator()(const std::shared_ptr<Trace>& t) const { return t->type; }
        std::string operator()(const std::shared_ptr<Callable>& c) const {
            return c->kind == Callable::Kind::METHOD ? "method" : "builtin_function_or_method";
        }
        std::string operator()(const std::shared_ptr<Accessor>&) const { return "accessor"; }
        std::string operator()(ModuleRef) const { return "module"; }
    };
    return std::visit(Namer{}, v.data);
}

bool truthy(const Value& v) {
    if (v.isNone()) return false;
    if (const auto* b = v.ptr<bool>()) return *b;
    if (const auto* i = v.ptr<int64_t>()) return *i != 0;
    if (const auto* d = v.ptr<double>()) return *d != 0.0;
    if (const auto* s = v.ptr<std::string>()) return !s->empty();
    if (const auto* l = v.ptr<std::shared_ptr<ListValue>>()) return !(*l)->items.empty();
    if (const auto* t = v.ptr<std::shared_ptr<TupleValue>>()) return !(*t)->items.empty();
    if (const auto* d = v.ptr<std::shared_ptr<DictValue>>()) return !(*d)->items.empty();
    if (const auto* s = v.ptr<std::shared_ptr<SetValue>>()) return !(*s)->items.empty();
    if (v.isFrame() || v.isSeries()) {
        throw ScriptError("ValueError", "The truth value of a " + typeName(v) +
                                            " is ambiguous. Use a.empty, a.bool(), a.item(), a.any() or a.all().");
    }
    return true;
}

namespace {
std::string joinRepr(const std::vector<Value>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += repr(items[i]);
    }
    return out;
}

std::string seriesFooter(const Series& s) {
    std::string footer;
    if (!s.name().empty()) footer += "Name: " + s.name() + ", ";
    footer += std::string("dtype: ") + columnTypeName(s.values.type);
    return footer;
}
} // namespace

std::string repr(const Value& v) {
    if (const auto* l = v.ptr<std::shared_ptr<ListValue>>()) return "[" + joinRepr((*l)->items) + "]";
    if (const auto* t = v.ptr<std::shared_ptr<TupleValue>>()) {
        if ((*t)->items.size() == 1) return "(" + repr((*t)->items.front()) + ",)";
        return "(" + joinRepr((*t)->items) + ")";
    }
    if (const auto* d = v.ptr<std::shared_ptr<DictValue>>()) {
        std::string out = "{";
        for (size_t i = 0; i < (*d)->items.size(); ++i) {
            if (i > 0) out += ", ";
            out += repr((*d)->items[i].first) + ": " + repr((*d)->items[i].second);
        }
        return out + "}";
    }
    if (const auto* s = v.ptr<std::shared_ptr<SetValue>>()) {
        if ((*s)->items.empty()) return "set()";
        return "{" + joinRepr((*s)->items) + "}";
    }
    if (const auto* s = v.ptr<std::string>()) return FrameFormat::quoteString(*s);
    if (const auto* t = v.ptr<Timestamp>()) return FrameFormat::scalarRepr(*t);
    return str(v);
}

std::string str(const Value& v) {
    if (v.isNone()) return "None";
    if (const auto* b = v.ptr<bool>()) return *b ? "True" : "False";
    if (const auto* i = v.ptr<int64_t>()) return std::to_string(*i);
    if (const auto* d = v.ptr<double>()) return FrameFormat::floatRepr(*d);
    if (const auto* s = v.ptr<std::string>()) return *s;
    if (const auto* t = v.ptr<Timestamp>()) return FrameFormat::timestampText(*t, false);
    if (v.isFrame()) return FrameFormat::frameToString(v.frame());
    if (v.isSeries()) {
        const Series& s = v.series();
        if (s.size() == 0) return FrameFormat::seriesToString(s);
        return FrameFormat::seriesToString(s) + "\n" + seriesFooter(s);
    }
    if (const auto* f = v.ptr<std::shared_ptr<Figure>>()) return (*f)->describe();
    if (const auto* t = v.ptr<std::shared_ptr<Trace>>()) return (*t)->type + "(" + (*t)->name + ")";
    if (const auto* g = v.ptr<std::shared_ptr<GroupByValue>>()) {
        return "<DataFrameGroupBy with " + std::to_string((*g)->keys.size()) + " key(s)>";
    }
    if (const auto* c = v.ptr<std::shared_ptr<Callable>>()) return "<function " + (*c)->name + ">";
    if (const auto* m = v.ptr<ModuleRef>()) {
        switch (m->kind) {
            case ModuleKind::PANDAS: return "<module 'pandas'>";
            case ModuleKind::NUMPY: return "<module 'numpy'>";
            case ModuleKind::PLOTLY_EXPRESS: return "<module 'plotly.express'>";
            case ModuleKind::GRAPH_OBJECTS: return "<module 'plotly.graph_objects'>";
        }
    }
    if (v.is<std::shared_ptr<SliceValue>>()) {
        const auto& s = *v.as<std::shared_ptr<SliceValue>>();
        return "slice(" + repr(s.start) + ", " + repr(s.stop) + ", " + repr(s.step) + ")";
    }
    if (v.is<std::shared_ptr<Accessor>>()) return "<accessor>";
    return repr(v);
}

bool valuesEqual(const Value& a, const Value& b) {
    if (a.isNumber() && b.isNumber()) {
        if (a.is<int64_t>() && b.is<int64_t>()) return a.as<int64_t>() == b.as<int64_t>();
        return toDouble(a, "==") == toDouble(b, "==");
    }
    if (a.isNone() || b.isNone()) return a.isNone() && b.isNone();
    if (a.is<std::string>() && b.is<std::string>()) return a.as<std::string>() == b.as<std::string>();
    if (a.is<Timestamp>() && b.is<Timestamp>()) return a.as<Timestamp>() == b.as<Timestamp>();

    const auto sameItems = [](const std::vector<Value>& x, const std::vector<Value>& y) {
        if (x.size() != y.size()) return false;
        for (size_t i = 0; i < x.size(); ++i) {
            if (!valuesEqual(x[i], y[i])) return false;
        }
        return true;
    };
    if (a.is<std::shared_ptr<ListValue>>() && b.is<std::shared_ptr<ListValue>>()) {
        return sameItems(a.as<std::shared_ptr<ListValue>>()->items, b.as<std::shared_ptr<ListValue>>()->items);
    }
    if (a.is<std::shared_ptr<TupleValue>>() && b.is<std::shared_ptr<TupleValue>>()) {
        return sameItems(a.as<std::shared_ptr<TupleValue>>()->items, b.as<std::shared_ptr<TupleValue>>()->items);
    }
    if (a.is<std::shared_ptr<SetValue>>() && b.is<std::shared_ptr<SetValue>>()) {
        const auto& x = *a.as<std::shared_ptr<SetValue>>();
        const auto& y = *b.as<std::shared_ptr<SetValue>>();
        if (x.items.size() != y.items.size()) return false;
        for (const auto& item : x.items) {
            if (!y.contains(item)) return false;
        }
        return true;
    }
    if (a.is<std::shared_ptr<DictValue>>() && b.is<std::shared_ptr<DictValue>>()) {
        const auto& x = *a.as<std::shared_ptr<DictValue>>();
        const auto& y = *b.as<std::shared_ptr<DictValue>>();
        if (x.items.size() != y.items.size()) return false;
        for (const auto& kv : x.items) {
            const Value* other = y.find(kv.first);
            if (other == nullptr || !valuesEqual(kv.second, *other)) return false;
        }
        return true;
    }
    if (const auto* m = a.ptr<ModuleRef>()) {
        const auto* n = b.ptr<ModuleRef>();
        return n != nullptr && m->kind == n->kind;
    }
    // Reference types compare by identity.
    if (a.data.index() != b.data.index()) return false;
    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        if constexpr (std::is_same_v<T, std::shared_ptr<DataFrame>> || std::is_same_v<T, std::shared_ptr<Series>> ||
                      std::is_same_v<T, std::shared_ptr<Figure>> || std::is_same_v<T, std::shared_ptr<Trace>> ||
                      std::is_same_v<T, std::shared_ptr<GroupByValue>> || std::is_same_v<T, std::shared_ptr<Callable>> ||
                      std::is_same_v<T, std::shared_ptr<Accessor>> || std::is_same_v<T, std::shared_ptr<SliceValue>>) {
            return lhs == std::get<T>(b.data);
        } else {
            return false;
        }
    }, a.data);
}

bool valueLess(const Value& a, const Value& b) {
    if (a.isNumber() && b.isNumber()) {
        if (a.is<int64_t>() && b.is<int64_t>()) return a.as<int64_t>() < b.as<int64_t>();
        return toDouble(a, "<") < toDouble(b, "<");
    }
    if (a.is<std::string>() && b.is<std::string>()) return a.as<std::string>() < b.as<std::string>();
    if (a.is<Timestamp>() && b.is<Timestamp>()) return a.as<Timestamp>() < b.as<Timestamp>();

    const auto lexLess = [](const std::vector<Value>& x, const std::vector<Value>& y) {
        for (size_t i = 0; i < x.size() && i < y.size(); ++i) {
            if (valuesEqual(x[i], y[i])) continue;
            return valueLess(x[i], y[i]);
        }
        return x.size() < y.size();
    };
    if (a.is<std::shared_ptr<TupleValue>>() && b.is<std::shared_ptr<TupleValue>>()) {
        return lexLess(a.as<std::shared_ptr<TupleValue>>()->items, b.as<std::shared_ptr<TupleValue>>()->items);
    }
    if (a.is<std::shared_ptr<ListValue>>() && b.is<std::shared_ptr<ListValue>>()) {
        return lexLess(a.as<std::shared_ptr<ListValue>>()->items, b.as<std::shared_ptr<ListValue>>()->items);
    }
    throw ScriptError("TypeError", "'<' not supported between instances of '" + typeName(a) + "' and '" +
                                       typeName(b) + "'");
}

Value fromScalar(const Scalar& s) {
    return std::visit([](const auto& x) -> Value {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return Value();
        } else {
            return Value(x);
        }
    }, s);
}

Value cellValue(const Column& col, size_t row) {
    if (col.isMissing(row)) {
        if (col.type == ColumnType::NUMERIC || col.type == ColumnType::INTEGER) {
            return Value(std::numeric_limits<double>::quiet_NaN());
        }
        return Value();
    }
    return fromScalar(col.at(row));
}

std::optional<Scalar> toScalar(const Value& v) {
    if (v.isNone()) return Scalar(std::monostate{});
    if (const auto* b = v.ptr<bool>()) return Scalar(*b);
    if (const auto* i = v.ptr<int64_t>()) return Scalar(*i);
    if (const auto* d = v.ptr<double>()) return Scalar(*d);
    if (const auto* s = v.ptr<std::string>()) return Scalar(*s);
    if (const auto* t = v.ptr<Timestamp>()) return Scalar(*t);
    return std::nullopt;
}

int64_t toInt(const Value& v, const std::string& context) {
    if (const auto* i = v.ptr<int64_t>()) return *i;
    if (const auto* b = v.ptr<bool>()) return *b ? 1 : 0;
    throw ScriptError("TypeError", context + ": expected int, got '" + typeName(v) + "'");
}

double toDouble(const Value& v, const std::string& context) {
    if (const auto* d = v.ptr<double>()) return *d;
    if (const auto* i = v.ptr<int64_t>()) return static_cast<double>(*i);
    if (const auto* b = v.ptr<bool>()) return *b ? 1.0 : 0.0;
    throw ScriptError("TypeError", context + ": expected a number, got '" + typeName(v) + "'");
}

const std::string& toText(const Value& v, const std::string& context) {
    if (const auto* s = v.ptr<std::string>()) return *s;
    throw ScriptError("TypeError", context + ": expected str, got '" + typeName(v) + "'");
}

std::vector<std::string> toNameList(const Value& v) {
    std::vector<std::string> names;
    if (const auto* s = v.ptr<std::string>()) {
        names.push_back(*s);
        return names;
    }
    if (v.isSeries()) {
        for (size_t r = 0; r < v.series().size(); ++r) names.push_back(str(cellValue(v.series().values, r)));
        return names;
    }
    for (const auto& item : iterate(v)) {
        if (const auto* s = item.ptr<std::string>()) names.push_back(*s);
        else names.push_back(str(item));
    }
    return names;
}

std::vector<Value> iterate(const Value& v) {
    if (const auto* l = v.ptr<std::shared_ptr<ListValue>>()) return (*l)->items;
    if (const auto* t = v.ptr<std::shared_ptr<TupleValue>>()) return (*t)->items;
    if (const auto* s = v.ptr<std::shared_ptr<SetValue>>()) return (*s)->items;
    if (const auto* d = v.ptr<std::shared_ptr<DictValue>>()) {
        std::vector<Value> keys;
        keys.reserve((*d)->items.size());
        for (const auto& kv : (*d)->items) keys.push_back(kv.first);
        return keys;
    }
    if (const auto* s = v.ptr<std::string>()) {
        std::vector<Value> chars;
        chars.reserve(s->size());
        for (char c : *s) chars.emplace_back(std::string(1, c));
        return chars;
    }
    if (v.isSeries()) {
        const Series& s = v.series();
        std::vector<Value> items;
        items.reserve(s.size());
        for (size_t r = 0; r < s.size(); ++r) items.push_back(cellValue(s.values, r));
        return items;
    }
    if (v.isFrame()) {
        std::vector<Value> names;
        for (const auto& c : v.frame().columns) names.emplace_back(c.name);
        return names;
    }
    throw ScriptError("TypeError", "'" + typeName(v) + "' object is not iterable");
}

Column columnFromValues(const std::string& name, const std::vector<Value>& items) {
    std::vector<Scalar> cells;
    cells.reserve(items.size());
    for (const auto& item : items) {
        auto s = toScalar(item);
        if (!s) {
            throw ScriptError("TypeError", "cannot store a '" + typeName(item) + "' value in a column");
        }
        cells.push_back(std::move(*s));
    }
    return Column::fromScalars(name, cells);
}

} // namespace Tabula
