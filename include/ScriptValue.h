#pragma once

#include "DataFrame.h"
#include "Figure.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace Tabula {

struct ListValue;
struct TupleValue;
struct DictValue;
struct SetValue;
struct SliceValue;
struct GroupByValue;
struct Callable;
struct Accessor;

enum class ModuleKind { PANDAS, NUMPY, PLOTLY_EXPRESS, GRAPH_OBJECTS };

struct ModuleRef {
    ModuleKind kind = ModuleKind::PANDAS;
};

/**
 * @brief Dynamically typed script value.
 * @details Scalars are held inline; containers, frames and figures are shared
 * so that aliasing behaves like Python references (mutating `b` after `b = a`
 * is visible through `a`).
 */
struct Value {
    using Storage = std::variant<std::monostate,
                                 bool,
                                 int64_t,
                                 double,
                                 std::string,
                                 Timestamp,
                                 std::shared_ptr<ListValue>,
                                 std::shared_ptr<TupleValue>,
                                 std::shared_ptr<DictValue>,
                                 std::shared_ptr<SetValue>,
                                 std::shared_ptr<SliceValue>,
                                 std::shared_ptr<DataFrame>,
                                 std::shared_ptr<Series>,
                                 std::shared_ptr<GroupByValue>,
                                 std::shared_ptr<Figure>,
                                 std::shared_ptr<Trace>,
                                 std::shared_ptr<Callable>,
                                 std::shared_ptr<Accessor>,
                                 ModuleRef>;

    Storage data;

    Value() = default;
    Value(bool b) : data(b) {}
    Value(int v) : data(static_cast<int64_t>(v)) {}
    Value(int64_t v) : data(v) {}
    Value(size_t v) : data(static_cast<int64_t>(v)) {}
    Value(double v) : data(v) {}
    Value(const char* s) : data(std::string(s)) {}
    Value(std::string s) : data(std::move(s)) {}
    Value(Timestamp t) : data(t) {}
    Value(ModuleRef m) : data(m) {}
    template <typename T>
    Value(std::shared_ptr<T> p) : data(std::move(p)) {}

    bool isNone() const noexcept { return std::holds_alternative<std::monostate>(data); }
    template <typename T>
    bool is() const noexcept { return std::holds_alternative<T>(data); }
    template <typename T>
    const T& as() const { return std::get<T>(data); }
    template <typename T>
    T* ptr() noexcept { return std::get_if<T>(&data); }
    template <typename T>
    const T* ptr() const noexcept { return std::get_if<T>(&data); }

    bool isNumber() const noexcept { return is<int64_t>() || is<double>() || is<bool>(); }
    bool isFrame() const noexcept { return is<std::shared_ptr<DataFrame>>(); }
    bool isSeries() const noexcept { return is<std::shared_ptr<Series>>(); }

    DataFrame& frame() const { return *std::get<std::shared_ptr<DataFrame>>(data); }
    Series& series() const { return *std::get<std::shared_ptr<Series>>(data); }
};

struct ListValue {
    std::vector<Value> items;
};

struct TupleValue {
    std::vector<Value> items;
};

/**
 * @brief Insertion-ordered mapping with linear lookup by Python equality.
 */
struct DictValue {
    std::vector<std::pair<Value, Value>> items;

    const Value* find(const Value& key) const;
    void set(const Value& key, Value value);
};

struct SetValue {
    std::vector<Value> items;

    bool contains(const Value& v) const;
    void add(const Value& v);
};

struct SliceValue {
    Value start;
    Value stop;
    Value step;
};

struct GroupByValue {
    std::shared_ptr<DataFrame> frame;
    std::vector<Column> keys;
    std::vector<std::string> selection;
    bool seriesSelection = false;
    bool asIndex = true;
    bool dropna = true;
    bool sort = true;
};

struct Callable {
    enum class Kind { BUILTIN, METHOD };
    Kind kind = Kind::BUILTIN;
    std::string name;
    Value receiver;
};

struct Accessor {
    enum class Kind { STR, DT, LOC, ILOC };
    Kind kind = Kind::STR;
    Value target;
};

template <typename T, typename... Args>
Value makeValue(Args&&... args) {
    return Value(std::make_shared<T>(std::forward<Args>(args)...));
}

Value makeList(std::vector<Value> items);
Value makeTuple(std::vector<Value> items);
Value makeFrame(DataFrame df);
Value makeSeries(Series s);
Value builtinCallable(std::string name);
Value boundMethod(Value receiver, std::string name);

/**
 * @brief Arguments of a call: positional values followed by keyword pairs.
 */
struct CallArgs {
    std::vector<Value> positional;
    std::vector<std::pair<std::string, Value>> keywords;

    const Value* keyword(const std::string& name) const;

    /**
     * @brief Argument at position `pos`, or the keyword `name`; nullptr when absent.
     */
    const Value* get(size_t pos, const std::string& name) const;

    /**
     * @throws Tabula::ScriptError (TypeError) when more than `n` positional arguments are given.
     */
    void expectAtMost(size_t n, const std::string& function) const;

    /**
     * @throws Tabula::ScriptError (TypeError) when the argument is absent.
     */
    const Value& required(size_t pos, const std::string& name, const std::string& function) const;
};

/**
 * @brief Python type name (`int`, `str`, `DataFrame`, ...).
 */
std::string typeName(const Value& v);

/**
 * @brief Python truthiness.
 * @throws Tabula::ScriptError (ValueError) for frames and series.
 */
bool truthy(const Value& v);

std::string repr(const Value& v);
std::string str(const Value& v);

/**
 * @brief Python `==` for scalars and containers; identity for frames and figures.
 */
bool valuesEqual(const Value& a, const Value& b);

/**
 * @brief Total order used by sorted()/min()/max() on plain values.
 * @throws Tabula::ScriptError (TypeError) when the values are not comparable.
 */
bool valueLess(const Value& a, const Value& b);

// Scalar bridge between the frame model and script values.
Value fromScalar(const Scalar& s);
Value cellValue(const Column& col, size_t row);
std::optional<Scalar> toScalar(const Value& v);

/**
 * @throws Tabula::ScriptError (TypeError) when the value is not an integer (bools count).
 */
int64_t toInt(const Value& v, const std::string& context);

/**
 * @throws Tabula::ScriptError (TypeError) when the value is not a real number.
 */
double toDouble(const Value& v, const std::string& context);

/**
 * @throws Tabula::ScriptError (TypeError) when the value is not a string.
 */
const std::string& toText(const Value& v, const std::string& context);

/**
 * @brief Column names or labels given as a single string or a list/tuple of strings.
 */
std::vector<std::string> toNameList(const Value& v);

/**
 * @brief Items of a list, tuple, set, dict (keys), string (characters) or series (values).
 * @throws Tabula::ScriptError (TypeError) when the value is not iterable.
 */
std::vector<Value> iterate(const Value& v);

/**
 * @brief Builds a column from script values (list items, dict values, range output).
 */
Column columnFromValues(const std::string& name, const std::vector<Value>& items);

} // namespace Tabula
