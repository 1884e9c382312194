#pragma once

#include "CSVUtils.h"
#include "DataFrame.h"

#include <istream>
#include <string>
#include <unordered_map>

namespace Tabula {

/**
 * @brief CSV loader with per-column type inference into a DataFrame.
 * @details Tokenization is delegated to CSVUtils; this class owns type
 * inference. Columns are inferred independently (in parallel when built
 * with OpenMP) in the order bool, int64, float64, datetime, object.
 */
class TypedDataset {
public:
    enum class NumericSeparatorPolicy {
        PLAIN,
        US_THOUSANDS, // 1,234.5
        EUROPEAN      // 1.234,5
    };

    explicit TypedDataset(std::string filename, char delimiter = ',');

    void setNumericSeparatorPolicy(NumericSeparatorPolicy policy) noexcept { numericSeparatorPolicy_ = policy; }
    void setColumnTypeOverride(std::string columnName, ColumnType type) { columnTypeOverrides_[std::move(columnName)] = type; }
    void setParseLimits(const CSVUtils::ParseLimits& limits) noexcept { limits_ = limits; }

    /**
     * @brief Loads the configured file.
     * @pre file exists and is readable.
     * @post frame() holds one typed column per header field and a RangeIndex.
     * @throws Tabula::IOException when the file cannot be opened.
     * @throws Tabula::DatasetException on an empty header or a record over the parse limits.
     */
    void load();

    /**
     * @brief Loads CSV text from an already open stream.
     */
    void load(std::istream& in);

    size_t rowCount() const noexcept { return frame_.rows(); }
    size_t colCount() const noexcept { return frame_.cols(); }

    // Records dropped for an unterminated quote or more fields than the header.
    size_t skippedRecords() const noexcept { return skippedRecords_; }

    const DataFrame& frame() const noexcept { return frame_; }
    DataFrame release() { return std::move(frame_); }

    /**
     * @brief Numeric text under a separator policy; accepts a leading '+', inf and nan.
     */
    static bool parseNumber(const std::string& text, NumericSeparatorPolicy policy, double& out);
    static bool parseInteger(const std::string& text, NumericSeparatorPolicy policy, int64_t& out);

private:
    std::string filename_;
    char delimiter_;
    NumericSeparatorPolicy numericSeparatorPolicy_ = NumericSeparatorPolicy::PLAIN;
    std::unordered_map<std::string, ColumnType> columnTypeOverrides_;
    CSVUtils::ParseLimits limits_;
    size_t skippedRecords_ = 0;
    DataFrame frame_;
};

} // namespace Tabula
