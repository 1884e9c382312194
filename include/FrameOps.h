#pragma once

#include "DataFrame.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Tabula {

enum class ArithOp { ADD, SUB, MUL, DIV, FLOOR_DIV, MOD, POW, BIT_AND, BIT_OR, BIT_XOR, LSHIFT, RSHIFT };
enum class CompareOp { EQ, NE, LT, LE, GT, GE };

const char* arithSymbol(ArithOp op) noexcept;
const char* compareSymbol(CompareOp op) noexcept;

enum class Reduction { MEAN, SUM, COUNT, MIN, MAX, MEDIAN, STD, VAR, SIZE, NUNIQUE, FIRST, LAST, PROD };

/**
 * @brief Column algebra and relational operations behind the frame/series runtime.
 * @details Elementwise operations follow vectorized semantics: missing cells
 * propagate, float division by zero yields inf/nan. Scalar operations follow
 * Python semantics and raise ScriptError (TypeError, ZeroDivisionError).
 */
namespace FrameOps {

Scalar arith(ArithOp op, const Scalar& a, const Scalar& b);
bool compare(CompareOp op, const Scalar& a, const Scalar& b);

Column arithColumns(ArithOp op, const Column& a, const Column& b);
Column arithColumnScalar(ArithOp op, const Column& a, const Scalar& b, bool scalarOnLeft);
Column compareColumns(CompareOp op, const Column& a, const Column& b);
Column compareColumnScalar(CompareOp op, const Column& a, const Scalar& b, bool scalarOnLeft);
Column negate(const Column& a);
Column invert(const Column& a);
Column absolute(const Column& a);

/**
 * @brief Row positions where a boolean column is true (missing counts as false).
 * @throws Tabula::ScriptError (TypeError) when the column is not boolean.
 */
std::vector<size_t> rowsWhere(const Column& mask);

/**
 * @brief Positionally aligned copies when indexes match or lengths agree,
 * otherwise a label union of two single-level indexes.
 */
std::pair<Series, Series> align(const Series& a, const Series& b);

std::optional<Reduction> parseReduction(const std::string& name);
const char* reductionName(Reduction r) noexcept;
bool reductionApplies(const Column& col, Reduction r);
Scalar reduce(const Column& col, Reduction r, int ddof = 1);
double quantile(const Column& col, double q);

std::vector<size_t> headRows(size_t n, int64_t k);
std::vector<size_t> tailRows(size_t n, int64_t k);

/**
 * @brief Stable multi-key ordering; missing values go last in either direction.
 */
std::vector<size_t> sortOrder(const std::vector<const Column*>& keys, const std::vector<bool>& ascending);
std::vector<size_t> indexSortOrder(const Index& index, bool ascending);

struct Groups {
    Index keys;
    std::vector<std::vector<size_t>> members;
};

Groups groupRows(const std::vector<const Column*>& keys, bool sort, bool dropna);
Column aggregateGroups(const Column& values, const Groups& groups, Reduction r);

Series valueCounts(const Column& col, bool normalize, bool ascending, bool dropna);
std::vector<Scalar> uniqueValues(const Column& col);
size_t countUnique(const Column& col, bool dropna = true);

DataFrame describe(const DataFrame& df);
Series describe(const Series& s);
double pearson(const Column& a, const Column& b);
DataFrame correlation(const DataFrame& df);

DataFrame concatRows(const std::vector<DataFrame>& frames, bool ignoreIndex);
DataFrame concatColumns(const std::vector<DataFrame>& frames);
DataFrame resetIndex(const DataFrame& df, bool drop);
DataFrame seriesToFrame(const Series& s, bool withIndexColumns);
DataFrame setIndex(const DataFrame& df, const std::vector<std::string>& cols, bool drop);
DataFrame pivotTable(const DataFrame& df,
                     const std::vector<std::string>& values,
                     const std::vector<std::string>& index,
                     const std::string& columns,
                     Reduction aggfunc);
DataFrame merge(const DataFrame& left,
                const DataFrame& right,
                const std::vector<std::string>& on,
                const std::string& how);
std::vector<size_t> distinctRows(const DataFrame& df, const std::vector<std::string>& subset, bool keepFirst);

Column cumulativeSum(const Column& col);
Column roundColumn(const Column& col, int decimals);
Column fillMissing(const Column& col, const Scalar& value);
Column missingFlags(const Column& col, bool wantMissing);
double roundHalfEven(double value, int decimals) noexcept;

} // namespace FrameOps
} // namespace Tabula
