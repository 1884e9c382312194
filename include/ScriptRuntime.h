#pragma once

#include "FrameOps.h"
#include "ScriptAst.h"
#include "ScriptValue.h"

#include <optional>
#include <string>
#include <vector>

namespace Tabula {

/**
 * @brief Object model behind the interpreter: operators, attribute lookup,
 * method dispatch and the pandas/numpy/plotly facades.
 * @details Every failure is a ScriptError carrying the Python exception
 * category (TypeError, KeyError, ValueError, AttributeError, ...).
 */
namespace Runtime {

// Operators and item access (RuntimeOperators.cpp).
Value binary(ArithOp op, const Value& a, const Value& b);
Value unary(Ast::UnaryOperator op, const Value& v);
Value compare(Ast::CompareOperator op, const Value& a, const Value& b);
bool contains(const Value& container, const Value& item);
Value getItem(const Value& obj, const Value& key);
void setItem(const Value& obj, const Value& key, const Value& value);

/**
 * @brief Python format-spec rendering for f-strings and format()
 * (`.2f`, `,`, `.1%`, `>10`, `d`, `e`).
 */
std::string formatValue(const Value& v, const std::string& spec);

// Attribute lookup and call dispatch (RuntimeBuiltins.cpp).
Value getAttribute(const Value& obj, const std::string& name);
Value call(const Value& fn, const CallArgs& args);
Value callBuiltin(const std::string& name, const CallArgs& args);
Value callPlainMethod(const Value& self, const std::string& name, const CallArgs& args);
Value numpyFunction(const std::string& name, const CallArgs& args);
bool numpyHas(const std::string& name);

// Conversions shared by the runtime files.
/**
 * @brief Cell-style value: missing numeric cells read as NaN, other missing as None.
 */
Value scalarValue(const Scalar& s, ColumnType type);

/**
 * @brief Series view of a value (series as-is, list/tuple/range as a new series).
 * @throws Tabula::ScriptError (TypeError) for anything else.
 */
Series toSeries(const Value& v, const std::string& context);

/**
 * @brief Scalar view of a plain value.
 * @throws Tabula::ScriptError (TypeError) for containers and objects.
 */
Scalar requireScalar(const Value& v, const std::string& context);

/**
 * @brief Positions selected by a Python slice over `length` items.
 */
std::vector<size_t> slicePositions(const SliceValue& slice, size_t length);

/**
 * @brief Resolves a possibly negative position.
 * @throws Tabula::ScriptError (IndexError) when out of range.
 */
size_t normalizeIndex(int64_t pos, size_t length, const std::string& what);

/**
 * @brief strftime-style rendering (%Y %m %d %H %M %S %y %j %B %b %A %a %%).
 */
std::string formatTimestamp(Timestamp ts, const std::string& pattern);

bool boolArg(const CallArgs& args, size_t pos, const std::string& name, bool fallback);
int64_t intArg(const CallArgs& args, size_t pos, const std::string& name, int64_t fallback);
std::string textArg(const CallArgs& args, size_t pos, const std::string& name, const std::string& fallback);

/**
 * @brief Column of `df.rows()` cells built from a scalar (broadcast), a list
 * (positional) or a series (aligned on index labels, missing where absent).
 * @throws Tabula::ScriptError (ValueError) on length mismatch.
 */
Column alignedColumn(const DataFrame& df, const Value& v, const std::string& name);

/**
 * @brief Rows whose label equals `label` (first level for multi-level indexes).
 */
std::vector<size_t> labelRows(const Index& index, const Scalar& label);

/**
 * @brief Row label as a script value; a tuple for multi-level indexes.
 */
Value labelValue(const Index& index, size_t row);

/**
 * @brief Column type named by `int`, `float`, `"int64"`, `"category"`, `"datetime64[ns]"`, ...
 * @throws Tabula::ScriptError (TypeError) for an unknown dtype.
 */
ColumnType dtypeArg(const Value& v);

/**
 * @brief 0 or 1 from `axis=` given as a number or as "index"/"columns".
 */
int axisArg(const CallArgs& args, size_t pos);

// Frame objects and the pandas module (FrameMethods.cpp).
std::optional<Value> frameAttribute(const Value& self, const std::string& name);
Value callFrameMethod(const Value& self, const std::string& name, const CallArgs& args);
Value frameGetItem(const Value& self, const Value& key);
void frameSetItem(const Value& self, const Value& key, const Value& value);
Value pandasFunction(const std::string& name, const CallArgs& args);
bool pandasHas(const std::string& name);

// Series and group-by objects (SeriesMethods.cpp).
std::optional<Value> seriesAttribute(const Value& self, const std::string& name);
Value callSeriesMethod(const Value& self, const std::string& name, const CallArgs& args);
Value seriesGetItem(const Value& self, const Value& key);
void seriesSetItem(const Value& self, const Value& key, const Value& value);

std::optional<Value> groupByAttribute(const Value& self, const std::string& name);
Value callGroupByMethod(const Value& self, const std::string& name, const CallArgs& args);
Value groupByGetItem(const Value& self, const Value& key);

// .str, .dt, .loc and .iloc (Accessors.cpp).
std::optional<Value> accessorAttribute(const Value& self, const std::string& name);
Value callAccessorMethod(const Value& self, const std::string& name, const CallArgs& args);
Value accessorGetItem(const Value& self, const Value& key);
void accessorSetItem(const Value& self, const Value& key, const Value& value);

// Chart facades (PlotFacade.cpp).
Value plotExpress(const std::string& name, const CallArgs& args);
bool plotExpressHas(const std::string& name);
Value graphObjects(const std::string& name, const CallArgs& args);
bool graphObjectsHas(const std::string& name);
std::optional<Value> figureAttribute(const Value& self, const std::string& name);
Value callFigureMethod(const Value& self, const std::string& name, const CallArgs& args);

} // namespace Runtime
} // namespace Tabula
