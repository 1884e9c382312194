#include "CSVUtils.h"

#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    const std::streampos start = is.tellg();
    for (unsigned char expected : kBom) {
        const int ch = is.get();
        if (ch == EOF || static_cast<unsigned char>(ch) != expected) {
            is.clear();
            is.seekg(start);
            return;
        }
    }
}

Record readRecord(std::istream& is, char delimiter, const ParseLimits& limits) {
    Record rec;
    if (is.peek() == EOF) return rec;

    rec.status = RecordStatus::OK;
    rec.physicalLines = 1;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool closedQuote = false;
    size_t recordBytes = 0;

    auto pushField = [&]() {
        rec.fields.push_back(fieldQuoted ? val : trimUnquotedField(val));
        rec.quoted.push_back(fieldQuoted ? 1 : 0);
        val.clear();
        fieldQuoted = false;
        closedQuote = false;
        if (limits.maxColumns > 0 && rec.fields.size() > limits.maxColumns) {
            rec.status = RecordStatus::LIMIT_EXCEEDED;
        }
    };

    auto append = [&](char ch) {
        val += ch;
        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) {
            rec.status = RecordStatus::LIMIT_EXCEEDED;
        }
    };

    char c;
    while (rec.status == RecordStatus::OK && is.get(c)) {
        if (limits.maxRecordBytes > 0 && ++recordBytes > limits.maxRecordBytes) {
            rec.status = RecordStatus::LIMIT_EXCEEDED;
            break;
        }

        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    append('"');
                } else {
                    inQuotes = false;
                    closedQuote = true;
                }
            } else {
                if (c == '\r' && is.peek() == '\n') {
                    is.get();
                    c = '\n';
                }
                if (c == '\n') ++rec.physicalLines;
                append(c);
            }
            continue;
        }

        if (c == '"' && !fieldQuoted && trimUnquotedField(val).empty()) {
            // Leading whitespace before an opening quote is dropped.
            val.clear();
            inQuotes = true;
            fieldQuoted = true;
        } else if (c == delimiter) {
            pushField();
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else if (closedQuote) {
            // Text after a closing quote stays part of the field, as loose CSV writers produce.
            if (c != ' ' && c != '\t') append(c);
        } else {
            append(c);
        }
    }

    if (rec.status != RecordStatus::OK) return rec;
    pushField();
    if (inQuotes) rec.status = RecordStatus::MALFORMED;
    return rec;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) {
            out[i] = "Unnamed: " + std::to_string(i);
        }

        const std::string original = out[i];
        size_t suffix = 1;
        while (seen.count(out[i]) != 0) {
            out[i] = original + "." + std::to_string(suffix++);
        }
        seen.insert(out[i]);
    }

    return out;
}

bool isMissingToken(const std::string& field) {
    static const std::unordered_set<std::string> kTokens = {
        "",     "#N/A", "#N/A N/A", "#NA", "-1.#IND", "-1.#QNAN", "-NaN", "-nan", "1.#IND", "1.#QNAN",
        "<NA>", "N/A",  "NA",       "NULL", "NaN",    "None",     "n/a",  "nan",  "null",
    };
    return kTokens.count(field) != 0;
}
} // namespace CSVUtils
