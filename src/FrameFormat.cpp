#include "FrameFormat.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <vector>

namespace Tabula {
namespace FrameFormat {

namespace {
constexpr int kMaxTableDecimals = 6;

std::string padLeft(const std::string& text, size_t width) {
    if (text.size() >= width) return text;
    return std::string(width - text.size(), ' ') + text;
}

std::string padRight(const std::string& text, size_t width) {
    if (text.size() >= width) return text;
    return text + std::string(width - text.size(), ' ');
}

std::string fixedText(double value, int decimals) {
    char buf[400];
    auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed, decimals);
    if (res.ec != std::errc{}) return floatRepr(value);
    return std::string(buf, res.ptr);
}

// Decimals needed to show `value` at table precision without trailing zeros.
int decimalsNeeded(double value) {
    const std::string text = fixedText(value, kMaxTableDecimals);
    const size_t dot = text.find('.');
    if (dot == std::string::npos) return 0;
    size_t last = text.size();
    while (last > dot + 1 && text[last - 1] == '0') --last;
    return static_cast<int>(last - dot - 1);
}

bool allMidnight(const Column& col) {
    for (size_t r = 0; r < col.size(); ++r) {
        if (col.isMissing(r)) continue;
        const int64_t secs = std::get<std::vector<int64_t>>(col.values)[r];
        if (((secs % 86400) + 86400) % 86400 != 0) return false;
    }
    return true;
}

/**
 * @brief Renders every cell of a column with the shared per-column format.
 */
std::vector<std::string> formatColumn(const Column& col) {
    std::vector<std::string> out(col.size());
    switch (col.type) {
        case ColumnType::NUMERIC: {
            const auto& v = std::get<std::vector<double>>(col.values);
            int decimals = 1;
            bool huge = false;
            for (size_t r = 0; r < v.size(); ++r) {
                if (col.isMissing(r) || !std::isfinite(v[r])) continue;
                if (std::fabs(v[r]) >= 1e16) huge = true;
                decimals = std::max(decimals, decimalsNeeded(v[r]));
            }
            for (size_t r = 0; r < v.size(); ++r) {
                if (col.isMissing(r) || std::isnan(v[r])) out[r] = "NaN";
                else if (std::isinf(v[r])) out[r] = v[r] > 0 ? "inf" : "-inf";
                else out[r] = huge ? floatRepr(v[r]) : fixedText(v[r], decimals);
            }
            break;
        }
        case ColumnType::DATETIME: {
            const bool dateOnly = allMidnight(col);
            const auto& v = std::get<std::vector<int64_t>>(col.values);
            for (size_t r = 0; r < v.size(); ++r) {
                out[r] = col.isMissing(r) ? std::string("NaT") : timestampText(Timestamp{v[r]}, dateOnly);
            }
            break;
        }
        default:
            for (size_t r = 0; r < col.size(); ++r) {
                out[r] = col.isMissing(r) ? std::string("NaN") : scalarStr(col.at(r));
            }
            break;
    }
    return out;
}

struct IndexBlock {
    std::vector<std::vector<std::string>> cells; // [level][row]
    std::vector<size_t> widths;
    std::vector<std::string> names;
    bool named = false;
};

IndexBlock formatIndex(const Index& index) {
    IndexBlock block;
    if (index.isRange()) {
        std::vector<std::string> labels(index.size());
        for (size_t r = 0; r < index.size(); ++r) labels[r] = std::to_string(r);
        block.cells.push_back(std::move(labels));
        block.names.emplace_back();
    } else {
        for (const auto& level : index.levels) {
            block.cells.push_back(formatColumn(level));
            block.names.push_back(level.name);
            block.named = block.named || !level.name.empty();
        }
    }
    for (size_t l = 0; l < block.cells.size(); ++l) {
        size_t w = block.named ? block.names[l].size() : 0;
        for (const auto& c : block.cells[l]) w = std::max(w, c.size());
        block.widths.push_back(w);
    }
    return block;
}

std::string indexPrefix(const IndexBlock& block, size_t row) {
    std::string out;
    for (size_t l = 0; l < block.cells.size(); ++l) {
        if (l > 0) out += ' ';
        out += padRight(block.cells[l][row], block.widths[l]);
    }
    return out;
}

std::string indexNameLine(const IndexBlock& block) {
    std::string out;
    for (size_t l = 0; l < block.names.size(); ++l) {
        if (l > 0) out += ' ';
        out += padRight(block.names[l], block.widths[l]);
    }
    return out;
}

size_t prefixWidth(const IndexBlock& block) {
    size_t w = 0;
    for (size_t l = 0; l < block.widths.size(); ++l) w += block.widths[l] + (l > 0 ? 1 : 0);
    return w;
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out = "[";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out + "]";
}
} // namespace

std::string floatRepr(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    if (value == 0.0) return std::signbit(value) ? "-0.0" : "0.0";

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    const std::string sci(buf, res.ptr);
    const size_t ePos = sci.find('e');
    std::string mantissa = sci.substr(0, ePos);
    int exponent = 0;
    std::from_chars(sci.data() + ePos + 1 + (sci[ePos + 1] == '+' ? 1 : 0), sci.data() + sci.size(), exponent);

    const bool negative = mantissa[0] == '-';
    std::string digits;
    for (char c : mantissa) {
        if (c >= '0' && c <= '9') digits.push_back(c);
    }
    std::string out = negative ? "-" : "";

    if (exponent >= -4 && exponent < 16) {
        if (exponent < 0) {
            out += "0." + std::string(static_cast<size_t>(-exponent - 1), '0') + digits;
        } else {
            const size_t intDigits = static_cast<size_t>(exponent) + 1;
            if (digits.size() <= intDigits) {
                out += digits + std::string(intDigits - digits.size(), '0') + ".0";
            } else {
                out += digits.substr(0, intDigits) + "." + digits.substr(intDigits);
            }
        }
        return out;
    }

    out += digits.substr(0, 1);
    if (digits.size() > 1) out += "." + digits.substr(1);
    out += (exponent < 0) ? "e-" : "e+";
    const int absExp = exponent < 0 ? -exponent : exponent;
    if (absExp < 10) out += '0';
    out += std::to_string(absExp);
    return out;
}

std::string timestampText(Timestamp ts, bool dateOnly) {
    const int64_t days = (ts.seconds >= 0) ? ts.seconds / 86400 : -((-ts.seconds + 86399) / 86400);
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civilFromDays(days, y, m, d);
    const int64_t secs = ts.seconds - days * 86400;

    char buf[48];
    char* p = std::to_chars(buf, buf + sizeof(buf), y).ptr;
    const unsigned fields[5] = {m, d, static_cast<unsigned>(secs / 3600), static_cast<unsigned>((secs / 60) % 60),
                                static_cast<unsigned>(secs % 60)};
    const char seps[5] = {'-', '-', ' ', ':', ':'};
    const int count = dateOnly ? 2 : 5;
    for (int i = 0; i < count; ++i) {
        *p++ = seps[i];
        *p++ = static_cast<char>('0' + fields[i] / 10);
        *p++ = static_cast<char>('0' + fields[i] % 10);
    }
    return std::string(buf, p);
}

std::string scalarStr(const Scalar& value) {
    if (std::holds_alternative<std::monostate>(value)) return "None";
    if (const auto* b = std::get_if<bool>(&value)) return *b ? "True" : "False";
    if (const auto* i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    if (const auto* d = std::get_if<double>(&value)) return floatRepr(*d);
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    const Timestamp ts = std::get<Timestamp>(value);
    return timestampText(ts, false);
}

std::string quoteString(const std::string& text) {
    const bool useDouble = text.find('\'') != std::string::npos && text.find('"') == std::string::npos;
    const char quote = useDouble ? '"' : '\'';
    std::string out(1, quote);
    for (char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (c == quote) out += '\\';
                out += c;
        }
    }
    out += quote;
    return out;
}

std::string scalarRepr(const Scalar& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return quoteString(*s);
    if (const auto* t = std::get_if<Timestamp>(&value)) return "Timestamp('" + timestampText(*t, false) + "')";
    return scalarStr(value);
}

std::string frameToString(const DataFrame& df) {
    if (df.rows() == 0 || df.cols() == 0) {
        std::string out = "Empty DataFrame\nColumns: " + joinNames(df.columnNames()) + "\nIndex: ";
        if (df.rows() == 0) return out + "[]";
        std::vector<std::string> labels;
        const IndexBlock block = formatIndex(df.index);
        for (size_t r = 0; r < df.rows(); ++r) labels.push_back(indexPrefix(block, r));
        return out + joinNames(labels);
    }

    const IndexBlock block = formatIndex(df.index);
    const size_t prefix = prefixWidth(block);

    std::vector<std::vector<std::string>> cells;
    std::vector<size_t> widths;
    for (const auto& col : df.columns) {
        cells.push_back(formatColumn(col));
        size_t w = col.name.size();
        for (const auto& c : cells.back()) w = std::max(w, c.size());
        widths.push_back(w);
    }

    std::string out = std::string(prefix, ' ');
    for (size_t c = 0; c < df.cols(); ++c) out += "  " + padLeft(df.columns[c].name, widths[c]);
    if (block.named) {
        out += '\n';
        std::string line = indexNameLine(block);
        line = padRight(line, prefix);
        for (size_t c = 0; c < df.cols(); ++c) line += std::string(widths[c] + 2, ' ');
        out += line;
    }
    for (size_t r = 0; r < df.rows(); ++r) {
        out += '\n';
        out += indexPrefix(block, r);
        for (size_t c = 0; c < df.cols(); ++c) out += "  " + padLeft(cells[c][r], widths[c]);
    }
    return out;
}

std::string seriesToString(const Series& series) {
    if (series.size() == 0) {
        return std::string("Series([], dtype: ") + columnTypeName(series.values.type) + ")";
    }
    const IndexBlock block = formatIndex(series.index);
    const std::vector<std::string> cells = formatColumn(series.values);
    size_t width = 0;
    for (const auto& c : cells) width = std::max(width, c.size());

    std::string out;
    if (block.named) out += indexNameLine(block);
    for (size_t r = 0; r < series.size(); ++r) {
        if (!out.empty() || r > 0) out += '\n';
        out += indexPrefix(block, r) + "    " + padLeft(cells[r], width);
    }
    return out;
}

} // namespace FrameFormat
} // namespace Tabula
