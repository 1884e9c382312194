#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Tabula {

enum class ColumnType { NUMERIC, INTEGER, BOOLEAN, CATEGORICAL, DATETIME };

// INTEGER and DATETIME share int64 storage; DATETIME holds unix seconds.
using ColumnStorage = std::variant<std::vector<double>,
                                   std::vector<int64_t>,
                                   std::vector<uint8_t>,
                                   std::vector<std::string>>;
using MissingMask = std::vector<uint8_t>;

struct Timestamp {
    int64_t seconds = 0;
};

inline bool operator==(Timestamp a, Timestamp b) noexcept { return a.seconds == b.seconds; }
inline bool operator!=(Timestamp a, Timestamp b) noexcept { return a.seconds != b.seconds; }
inline bool operator<(Timestamp a, Timestamp b) noexcept { return a.seconds < b.seconds; }

// monostate is the missing value (NaN / None / NaT depending on column type).
using Scalar = std::variant<std::monostate, bool, int64_t, double, std::string, Timestamp>;

/**
 * @brief dtype name as pandas would print it (float64, int64, bool, object, datetime64[ns]).
 */
const char* columnTypeName(ColumnType type) noexcept;

struct Column {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    Column() = default;

    /**
     * @brief Allocates `rows` cells of the storage matching `type`, all present.
     */
    Column(std::string columnName, ColumnType columnType, size_t rows);

    size_t size() const noexcept { return missing.size(); }
    bool isMissing(size_t row) const noexcept { return missing[row] != 0; }
    bool isNumericLike() const noexcept {
        return type == ColumnType::NUMERIC || type == ColumnType::INTEGER || type == ColumnType::BOOLEAN;
    }

    /**
     * @brief Numeric view of a cell; NaN when missing or not numeric-like.
     */
    double numberAt(size_t row) const;
    Scalar at(size_t row) const;

    /**
     * @brief Stores a value, promoting the column type when the value does not fit
     * (int into bool column -> INTEGER, float into INTEGER -> NUMERIC, text -> CATEGORICAL).
     */
    void set(size_t row, const Scalar& value);
    void push(const Scalar& value);

    Column take(const std::vector<size_t>& rows) const;
    std::vector<double> presentNumbers() const;
    size_t countPresent() const;

    /**
     * @brief Converts storage in place to the requested type.
     * @throws Tabula::ScriptError (ValueError) when a value cannot be converted.
     */
    void convertTo(ColumnType target);

    static Column fromScalars(std::string name, const std::vector<Scalar>& values);
    static Column fromDoubles(std::string name, std::vector<double> values);
    static Column fromInts(std::string name, std::vector<int64_t> values);
    static Column fromBools(std::string name, std::vector<uint8_t> values);
    static Column fromStrings(std::string name, std::vector<std::string> values);
};

/**
 * @brief Row labels: a RangeIndex (no levels) or one column per level.
 */
struct Index {
    std::vector<Column> levels;
    size_t length = 0;

    static Index range(size_t n);
    static Index fromColumn(Column level);
    static Index fromLevels(std::vector<Column> levels);

    bool isRange() const noexcept { return levels.empty(); }
    size_t size() const noexcept { return length; }
    size_t nlevels() const noexcept { return levels.empty() ? 1 : levels.size(); }

    Scalar labelAt(size_t row, size_t level = 0) const;
    std::vector<Scalar> key(size_t row) const;
    std::vector<std::string> names() const;
    bool hasNames() const;

    Index take(const std::vector<size_t>& rows) const;

    /**
     * @brief First row whose (single-level) label equals `label`.
     */
    std::optional<size_t> find(const Scalar& label) const;
    bool sameLabels(const Index& other) const;
};

struct Series {
    Column values;
    Index index;

    Series() = default;
    Series(Column column, Index idx) : values(std::move(column)), index(std::move(idx)) {}
    explicit Series(Column column);

    size_t size() const noexcept { return values.size(); }
    const std::string& name() const noexcept { return values.name; }
    Series take(const std::vector<size_t>& rows) const;
};

struct DataFrame {
    std::vector<Column> columns;
    Index index;

    size_t rows() const noexcept { return index.size(); }
    size_t cols() const noexcept { return columns.size(); }

    int findColumn(const std::string& name) const;

    /**
     * @throws Tabula::ScriptError (KeyError) when the column is absent.
     */
    const Column& column(const std::string& name) const;
    Column& column(const std::string& name);

    /**
     * @brief Replaces a same-named column or appends a new one.
     * @throws Tabula::ScriptError (ValueError) on length mismatch.
     */
    void setColumn(Column column);

    std::vector<std::string> columnNames() const;
    DataFrame take(const std::vector<size_t>& rows) const;
    Series row(size_t r) const;
};

// Scalar helpers shared by the frame model and the script runtime.
bool scalarIsMissing(const Scalar& s) noexcept;

/**
 * @brief Numeric view; nullopt for text or missing values.
 */
std::optional<double> scalarToNumber(const Scalar& s) noexcept;
bool scalarsEqual(const Scalar& a, const Scalar& b) noexcept;

/**
 * @brief Strict weak ordering across scalars; missing values sort last,
 * numbers before text before timestamps.
 */
bool scalarLess(const Scalar& a, const Scalar& b) noexcept;

// Calendar conversions (UTC).
int64_t daysFromCivil(int y, unsigned m, unsigned d) noexcept;
void civilFromDays(int64_t days, int& y, unsigned& m, unsigned& d) noexcept;

/**
 * @brief Parses ISO-like date/time text (YYYY-MM-DD[ HH:MM:SS], YYYY-MM-DDTHH:MM:SS, DD/MM/YYYY).
 */
std::optional<Timestamp> parseTimestamp(const std::string& text) noexcept;

} // namespace Tabula
