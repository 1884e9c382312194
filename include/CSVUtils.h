#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// CSV record tokenization and header cleanup. No type inference here.
struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;    // 8 MiB
    size_t maxRecordBytes = 64 * 1024 * 1024;  // 64 MiB
    size_t maxColumns = 20000;
};

enum class RecordStatus { OK, END, MALFORMED, LIMIT_EXCEEDED };

struct Record {
    std::vector<std::string> fields;
    // 1 where the field was quoted; quoted fields keep their surrounding whitespace.
    std::vector<uint8_t> quoted;
    RecordStatus status = RecordStatus::END;
    size_t physicalLines = 0;

    bool blank() const noexcept { return fields.size() == 1 && fields[0].empty() && !quoted[0]; }
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record (quoted fields may span lines).
 * @post status is END only when the stream had no data left; a record with an
 * unterminated quote is returned with status MALFORMED.
 */
Record readRecord(std::istream& is, char delimiter, const ParseLimits& limits = ParseLimits{});

/**
 * @brief Header names as a dataframe loader would assign them:
 * empty names become `Unnamed: <i>`, repeats get `.1`, `.2` suffixes.
 */
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

/**
 * @brief Default missing-value spellings (`NA`, `N/A`, `NaN`, `null`, `None`, ...).
 */
bool isMissingToken(const std::string& field);
}
