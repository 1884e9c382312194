#include "TypedDataset.h"
#include "CommonUtils.h"
#include "Log.h"
#include "TabulaExceptions.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <optional>

#ifdef TABULA_USE_OPENMP
#include <omp.h>
#endif

namespace Tabula {

TypedDataset::TypedDataset(std::string filename, char delimiter)
    : filename_(std::move(filename)), delimiter_(delimiter) {}

namespace {
struct RawColumn {
    std::string name;
    std::vector<std::string> cells;
    MissingMask missing;
};

std::string stripSeparators(const std::string& input, TypedDataset::NumericSeparatorPolicy policy) {
    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        if (policy == TypedDataset::NumericSeparatorPolicy::US_THOUSANDS && ch == ',') continue;
        if (policy == TypedDataset::NumericSeparatorPolicy::EUROPEAN) {
            if (ch == '.') continue;
            if (ch == ',') ch = '.';
        }
        out.push_back(ch);
    }
    if (!out.empty() && out.front() == '+') out.erase(out.begin());
    return out;
}

bool parseBoolLiteral(const std::string& s, bool& out) {
    if (s == "True" || s == "true" || s == "TRUE") {
        out = true;
        return true;
    }
    if (s == "False" || s == "false" || s == "FALSE") {
        out = false;
        return true;
    }
    return false;
}

bool isDateLikeHeader(const std::string& name) {
    const std::string lower = CommonUtils::toLower(name);
    return lower.find("date") != std::string::npos ||
           lower.find("time") != std::string::npos ||
           lower.find("timestamp") != std::string::npos;
}

Column buildForced(const RawColumn& raw, ColumnType type, TypedDataset::NumericSeparatorPolicy policy) {
    const size_t rows = raw.cells.size();
    std::vector<Scalar> values(rows);
    for (size_t r = 0; r < rows; ++r) {
        if (raw.missing[r]) continue;
        const std::string& cell = raw.cells[r];
        switch (type) {
            case ColumnType::NUMERIC: {
                double dv = 0.0;
                if (TypedDataset::parseNumber(cell, policy, dv)) values[r] = dv;
                break;
            }
            case ColumnType::INTEGER: {
                int64_t iv = 0;
                if (TypedDataset::parseInteger(cell, policy, iv)) values[r] = iv;
                break;
            }
            case ColumnType::BOOLEAN: {
                bool bv = false;
                if (parseBoolLiteral(cell, bv)) values[r] = bv;
                break;
            }
            case ColumnType::DATETIME: {
                if (auto ts = parseTimestamp(cell)) values[r] = *ts;
                break;
            }
            case ColumnType::CATEGORICAL:
                values[r] = cell;
                break;
        }
    }

    const bool gaps = std::any_of(values.begin(), values.end(), [](const Scalar& v) { return scalarIsMissing(v); });
    // int64 and bool storage cannot hold a gap.
    const bool widen = gaps && (type == ColumnType::INTEGER || type == ColumnType::BOOLEAN);
    Column col(raw.name, widen ? ColumnType::NUMERIC : type, rows);
    for (size_t r = 0; r < rows; ++r) {
        if (scalarIsMissing(values[r])) {
            col.missing[r] = 1;
            if (col.type == ColumnType::NUMERIC) {
                std::get<std::vector<double>>(col.values)[r] = std::numeric_limits<double>::quiet_NaN();
            }
        } else {
            col.set(r, values[r]);
        }
    }
    return col;
}

Column inferColumn(const RawColumn& raw, TypedDataset::NumericSeparatorPolicy policy) {
    const size_t rows = raw.cells.size();
    size_t present = 0;
    size_t boolHits = 0;
    size_t intHits = 0;
    size_t numberHits = 0;
    size_t datetimeHits = 0;
    for (size_t r = 0; r < rows; ++r) {
        if (raw.missing[r]) continue;
        ++present;
        const std::string& cell = raw.cells[r];
        bool bv = false;
        int64_t iv = 0;
        double dv = 0.0;
        if (parseBoolLiteral(cell, bv)) ++boolHits;
        if (TypedDataset::parseInteger(cell, policy, iv)) ++intHits;
        if (TypedDataset::parseNumber(cell, policy, dv)) ++numberHits;
        if (parseTimestamp(cell)) ++datetimeHits;
    }

    const bool anyMissing = present < rows;
    if (present == 0) return buildForced(raw, ColumnType::NUMERIC, policy);
    if (boolHits == present && !anyMissing) return buildForced(raw, ColumnType::BOOLEAN, policy);
    if (intHits == present) return buildForced(raw, anyMissing ? ColumnType::NUMERIC : ColumnType::INTEGER, policy);
    if (numberHits == present) return buildForced(raw, ColumnType::NUMERIC, policy);

    // A date-named column tolerates a minority of unparseable cells, which become NaT.
    const size_t datetimeThreshold = isDateLikeHeader(raw.name) ? std::max<size_t>(1, (present * 6) / 10) : present;
    if (datetimeHits >= datetimeThreshold) return buildForced(raw, ColumnType::DATETIME, policy);
    return buildForced(raw, ColumnType::CATEGORICAL, policy);
}
} // namespace

bool TypedDataset::parseNumber(const std::string& text, NumericSeparatorPolicy policy, double& out) {
    const std::string cleaned = stripSeparators(text, policy);
    if (cleaned.empty()) return false;
    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e;
}

bool TypedDataset::parseInteger(const std::string& text, NumericSeparatorPolicy policy, int64_t& out) {
    const std::string cleaned = stripSeparators(text, policy);
    if (cleaned.empty()) return false;
    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, 10);
    return ec == std::errc{} && p == e;
}

void TypedDataset::load() {
    std::ifstream in(filename_, std::ios::binary);
    if (!in) throw IOException("Could not open file: " + filename_);
    load(in);
}

void TypedDataset::load(std::istream& in) {
    CSVUtils::skipBOM(in);
    skippedRecords_ = 0;

    CSVUtils::Record headerRecord = CSVUtils::readRecord(in, delimiter_, limits_);
    while (headerRecord.status == CSVUtils::RecordStatus::OK && headerRecord.blank()) {
        headerRecord = CSVUtils::readRecord(in, delimiter_, limits_);
    }
    if (headerRecord.status != CSVUtils::RecordStatus::OK || headerRecord.fields.empty()) {
        throw DatasetException("Malformed or empty CSV header");
    }
    const std::vector<std::string> header = CSVUtils::normalizeHeader(headerRecord.fields);

    std::vector<RawColumn> raw(header.size());
    for (size_t c = 0; c < header.size(); ++c) raw[c].name = header[c];

    while (true) {
        CSVUtils::Record rec = CSVUtils::readRecord(in, delimiter_, limits_);
        if (rec.status == CSVUtils::RecordStatus::END) break;
        if (rec.status == CSVUtils::RecordStatus::LIMIT_EXCEEDED) {
            throw DatasetException("CSV record exceeds parse limits");
        }
        if (rec.status == CSVUtils::RecordStatus::MALFORMED || rec.fields.size() > header.size()) {
            ++skippedRecords_;
            continue;
        }
        if (rec.blank()) continue;

        for (size_t c = 0; c < header.size(); ++c) {
            if (c < rec.fields.size() && !CSVUtils::isMissingToken(rec.fields[c])) {
                raw[c].cells.push_back(std::move(rec.fields[c]));
                raw[c].missing.push_back(0);
            } else {
                raw[c].cells.emplace_back();
                raw[c].missing.push_back(1);
            }
        }
    }

    std::vector<Column> columns(raw.size());
    #ifdef TABULA_USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t c = 0; c < raw.size(); ++c) {
        const auto it = columnTypeOverrides_.find(raw[c].name);
        columns[c] = it != columnTypeOverrides_.end()
            ? buildForced(raw[c], it->second, numericSeparatorPolicy_)
            : inferColumn(raw[c], numericSeparatorPolicy_);
    }

    const size_t rows = raw.empty() ? 0 : raw.front().cells.size();
    frame_ = DataFrame{};
    frame_.columns = std::move(columns);
    frame_.index = Index::range(rows);

    if (skippedRecords_ > 0) {
        Log::warn("Dataset", "Skipped malformed CSV records" + LogFields().add("count", skippedRecords_).str());
    }
}

} // namespace Tabula
