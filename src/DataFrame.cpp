#include "DataFrame.h"

#include "CommonUtils.h"
#include "TabulaExceptions.h"

#include <charconv>
#include <cmath>
#include <limits>

namespace Tabula {

const char* columnTypeName(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::NUMERIC: return "float64";
        case ColumnType::INTEGER: return "int64";
        case ColumnType::BOOLEAN: return "bool";
        case ColumnType::CATEGORICAL: return "object";
        case ColumnType::DATETIME: return "datetime64[ns]";
    }
    return "object";
}

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

ColumnStorage makeStorage(ColumnType type, size_t rows) {
    switch (type) {
        case ColumnType::NUMERIC: return std::vector<double>(rows, kNaN);
        case ColumnType::INTEGER:
        case ColumnType::DATETIME: return std::vector<int64_t>(rows, 0);
        case ColumnType::BOOLEAN: return std::vector<uint8_t>(rows, 0);
        case ColumnType::CATEGORICAL: return std::vector<std::string>(rows);
    }
    return std::vector<std::string>(rows);
}

std::string scalarText(const Scalar& s) {
    if (const auto* str = std::get_if<std::string>(&s)) return *str;
    if (const auto* b = std::get_if<bool>(&s)) return *b ? "True" : "False";
    if (const auto* i = std::get_if<int64_t>(&s)) return std::to_string(*i);
    if (const auto* d = std::get_if<double>(&s)) {
        char buf[64];
        auto res = std::to_chars(buf, buf + sizeof(buf), *d);
        std::string out(buf, res.ptr);
        if (out.find_first_of(".eni") == std::string::npos) out += ".0";
        return out;
    }
    if (const auto* t = std::get_if<Timestamp>(&s)) {
        int y = 0;
        unsigned m = 0;
        unsigned d = 0;
        const int64_t days = (t->seconds >= 0) ? t->seconds / 86400 : -((-t->seconds + 86399) / 86400);
        civilFromDays(days, y, m, d);
        char buf[32];
        char* p = buf;
        p = std::to_chars(p, buf + sizeof(buf), y).ptr;
        *p++ = '-';
        *p++ = static_cast<char>('0' + m / 10);
        *p++ = static_cast<char>('0' + m % 10);
        *p++ = '-';
        *p++ = static_cast<char>('0' + d / 10);
        *p++ = static_cast<char>('0' + d % 10);
        const int64_t secs = t->seconds - days * 86400;
        if (secs != 0) {
            const int parts[3] = {static_cast<int>(secs / 3600), static_cast<int>((secs / 60) % 60), static_cast<int>(secs % 60)};
            for (int i = 0; i < 3; ++i) {
                *p++ = (i == 0) ? ' ' : ':';
                *p++ = static_cast<char>('0' + parts[i] / 10);
                *p++ = static_cast<char>('0' + parts[i] % 10);
            }
        }
        return std::string(buf, p);
    }
    return std::string();
}

int rankOf(const Scalar& s) {
    if (std::holds_alternative<bool>(s) || std::holds_alternative<int64_t>(s) || std::holds_alternative<double>(s)) return 0;
    if (std::holds_alternative<std::string>(s)) return 1;
    if (std::holds_alternative<Timestamp>(s)) return 2;
    return 3;
}

bool parseFixedInt(const std::string& s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

bool parseTimePart(const std::string& timePart, int& hour, int& minute, int& second) {
    hour = minute = second = 0;
    if (timePart.empty()) return true;
    if (timePart.size() == 5) {
        return parseFixedInt(timePart, 0, 2, hour) && timePart[2] == ':' && parseFixedInt(timePart, 3, 2, minute);
    }
    if (timePart.size() < 8) return false;
    return parseFixedInt(timePart, 0, 2, hour) && timePart[2] == ':' &&
           parseFixedInt(timePart, 3, 2, minute) && timePart[5] == ':' &&
           parseFixedInt(timePart, 6, 2, second);
}

bool parseDatePart(const std::string& datePart, int& year, int& month, int& day) {
    // ISO: YYYY-MM-DD or YYYY/MM/DD
    if (datePart.size() == 10 && (datePart[4] == '-' || datePart[4] == '/') && datePart[7] == datePart[4]) {
        return parseFixedInt(datePart, 0, 4, year) &&
               parseFixedInt(datePart, 5, 2, month) &&
               parseFixedInt(datePart, 8, 2, day);
    }
    // dd/mm/yyyy or mm/dd/yyyy; month first unless the first field cannot be a month.
    if (datePart.size() == 10 && (datePart[2] == '/' || datePart[2] == '-') && datePart[5] == datePart[2]) {
        int a = 0;
        int b = 0;
        if (!parseFixedInt(datePart, 0, 2, a) || !parseFixedInt(datePart, 3, 2, b) ||
            !parseFixedInt(datePart, 6, 4, year)) {
            return false;
        }
        if (a > 12 && b <= 12) {
            day = a;
            month = b;
        } else {
            month = a;
            day = b;
        }
        return true;
    }
    // YYYY-MM
    if (datePart.size() == 7 && datePart[4] == '-') {
        day = 1;
        return parseFixedInt(datePart, 0, 4, year) && parseFixedInt(datePart, 5, 2, month);
    }
    // YYYY
    if (datePart.size() == 4) {
        month = 1;
        day = 1;
        return parseFixedInt(datePart, 0, 4, year);
    }
    return false;
}
} // namespace

Column::Column(std::string columnName, ColumnType columnType, size_t rows)
    : name(std::move(columnName)), type(columnType), values(makeStorage(columnType, rows)), missing(rows, 0) {}

double Column::numberAt(size_t row) const {
    if (missing[row]) return kNaN;
    switch (type) {
        case ColumnType::NUMERIC: return std::get<std::vector<double>>(values)[row];
        case ColumnType::INTEGER: return static_cast<double>(std::get<std::vector<int64_t>>(values)[row]);
        case ColumnType::BOOLEAN: return std::get<std::vector<uint8_t>>(values)[row] ? 1.0 : 0.0;
        default: return kNaN;
    }
}

Scalar Column::at(size_t row) const {
    if (missing[row]) return std::monostate{};
    switch (type) {
        case ColumnType::NUMERIC: return std::get<std::vector<double>>(values)[row];
        case ColumnType::INTEGER: return std::get<std::vector<int64_t>>(values)[row];
        case ColumnType::BOOLEAN: return std::get<std::vector<uint8_t>>(values)[row] != 0;
        case ColumnType::CATEGORICAL: return std::get<std::vector<std::string>>(values)[row];
        case ColumnType::DATETIME: return Timestamp{std::get<std::vector<int64_t>>(values)[row]};
    }
    return std::monostate{};
}

void Column::set(size_t row, const Scalar& value) {
    if (scalarIsMissing(value)) {
        if (type == ColumnType::INTEGER || type == ColumnType::BOOLEAN) convertTo(ColumnType::NUMERIC);
        if (type == ColumnType::NUMERIC) std::get<std::vector<double>>(values)[row] = kNaN;
        missing[row] = 1;
        return;
    }

    ColumnType needed = type;
    if (std::holds_alternative<std::string>(value)) {
        needed = ColumnType::CATEGORICAL;
    } else if (std::holds_alternative<Timestamp>(value)) {
        if (type != ColumnType::DATETIME) needed = ColumnType::CATEGORICAL;
    } else if (std::holds_alternative<double>(value)) {
        if (type == ColumnType::INTEGER || type == ColumnType::BOOLEAN) needed = ColumnType::NUMERIC;
        else if (type == ColumnType::DATETIME) needed = ColumnType::CATEGORICAL;
    } else if (std::holds_alternative<int64_t>(value)) {
        if (type == ColumnType::BOOLEAN) needed = ColumnType::INTEGER;
        else if (type == ColumnType::DATETIME) needed = ColumnType::CATEGORICAL;
    } else if (std::holds_alternative<bool>(value)) {
        if (type == ColumnType::DATETIME) needed = ColumnType::CATEGORICAL;
    }
    if (needed != type) convertTo(needed);

    missing[row] = 0;
    switch (type) {
        case ColumnType::NUMERIC:
            std::get<std::vector<double>>(values)[row] = *scalarToNumber(value);
            break;
        case ColumnType::INTEGER:
            std::get<std::vector<int64_t>>(values)[row] =
                std::holds_alternative<bool>(value) ? (std::get<bool>(value) ? 1 : 0) : std::get<int64_t>(value);
            break;
        case ColumnType::BOOLEAN:
            std::get<std::vector<uint8_t>>(values)[row] = std::get<bool>(value) ? 1 : 0;
            break;
        case ColumnType::CATEGORICAL:
            std::get<std::vector<std::string>>(values)[row] = scalarText(value);
            break;
        case ColumnType::DATETIME:
            std::get<std::vector<int64_t>>(values)[row] = std::get<Timestamp>(value).seconds;
            break;
    }
}

void Column::push(const Scalar& value) {
    std::visit([](auto& vec) { vec.emplace_back(); }, values);
    if (type == ColumnType::NUMERIC) std::get<std::vector<double>>(values).back() = kNaN;
    missing.push_back(1);
    set(missing.size() - 1, value);
}

Column Column::take(const std::vector<size_t>& rows) const {
    Column out;
    out.name = name;
    out.type = type;
    out.missing.resize(rows.size());
    std::visit([&](const auto& src) {
        using Vec = std::decay_t<decltype(src)>;
        Vec dst;
        dst.reserve(rows.size());
        for (size_t r : rows) dst.push_back(src[r]);
        out.values = std::move(dst);
    }, values);
    for (size_t i = 0; i < rows.size(); ++i) out.missing[i] = missing[rows[i]];
    return out;
}

std::vector<double> Column::presentNumbers() const {
    std::vector<double> out;
    if (!isNumericLike()) return out;
    out.reserve(size());
    for (size_t r = 0; r < size(); ++r) {
        if (missing[r]) continue;
        const double v = numberAt(r);
        if (!std::isnan(v)) out.push_back(v);
    }
    return out;
}

size_t Column::countPresent() const {
    size_t n = 0;
    for (uint8_t m : missing) n += (m == 0);
    return n;
}

void Column::convertTo(ColumnType target) {
    if (target == type) return;
    const size_t n = size();
    Column converted(name, target, n);
    for (size_t r = 0; r < n; ++r) {
        if (missing[r]) {
            converted.missing[r] = 1;
            continue;
        }
        const Scalar v = at(r);
        switch (target) {
            case ColumnType::NUMERIC: {
                std::optional<double> num = scalarToNumber(v);
                if (!num && std::holds_alternative<std::string>(v)) {
                    const std::string t = CommonUtils::trim(std::get<std::string>(v));
                    double parsed = 0.0;
                    auto res = std::from_chars(t.data(), t.data() + t.size(), parsed);
                    if (res.ec == std::errc{} && res.ptr == t.data() + t.size()) num = parsed;
                }
                if (!num && std::holds_alternative<Timestamp>(v)) num = static_cast<double>(std::get<Timestamp>(v).seconds);
                if (!num) throw ScriptError("ValueError", "could not convert string to float: '" + scalarText(v) + "'");
                std::get<std::vector<double>>(converted.values)[r] = *num;
                break;
            }
            case ColumnType::INTEGER: {
                int64_t iv = 0;
                if (const auto* d = std::get_if<double>(&v)) {
                    if (!std::isfinite(*d)) throw ScriptError("ValueError", "cannot convert non-finite values to integer");
                    iv = static_cast<int64_t>(std::trunc(*d));
                } else if (const auto* i = std::get_if<int64_t>(&v)) {
                    iv = *i;
                } else if (const auto* b = std::get_if<bool>(&v)) {
                    iv = *b ? 1 : 0;
                } else if (const auto* t = std::get_if<Timestamp>(&v)) {
                    iv = t->seconds;
                } else {
                    const std::string text = CommonUtils::trim(std::get<std::string>(v));
                    auto res = std::from_chars(text.data(), text.data() + text.size(), iv);
                    if (res.ec != std::errc{} || res.ptr != text.data() + text.size()) {
                        throw ScriptError("ValueError", "invalid literal for int() with base 10: '" + text + "'");
                    }
                }
                std::get<std::vector<int64_t>>(converted.values)[r] = iv;
                break;
            }
            case ColumnType::BOOLEAN: {
                bool bv = false;
                if (const auto* s = std::get_if<std::string>(&v)) bv = !s->empty();
                else if (const auto* t = std::get_if<Timestamp>(&v)) bv = t->seconds != 0;
                else bv = scalarToNumber(v).value_or(0.0) != 0.0;
                std::get<std::vector<uint8_t>>(converted.values)[r] = bv ? 1 : 0;
                break;
            }
            case ColumnType::CATEGORICAL:
                std::get<std::vector<std::string>>(converted.values)[r] = scalarText(v);
                break;
            case ColumnType::DATETIME: {
                std::optional<Timestamp> ts;
                if (const auto* t = std::get_if<Timestamp>(&v)) ts = *t;
                else if (const auto* s = std::get_if<std::string>(&v)) ts = parseTimestamp(*s);
                else if (auto num = scalarToNumber(v)) ts = Timestamp{static_cast<int64_t>(*num)};
                if (!ts) throw ScriptError("ValueError", "could not parse datetime: '" + scalarText(v) + "'");
                std::get<std::vector<int64_t>>(converted.values)[r] = ts->seconds;
                break;
            }
        }
    }
    *this = std::move(converted);
}

Column Column::fromScalars(std::string name, const std::vector<Scalar>& values) {
    bool anyText = false;
    bool anyTime = false;
    bool anyDouble = false;
    bool anyInt = false;
    bool anyBool = false;
    bool anyMissing = false;
    for (const auto& v : values) {
        if (std::holds_alternative<std::monostate>(v)) anyMissing = true;
        else if (std::holds_alternative<std::string>(v)) anyText = true;
        else if (std::holds_alternative<Timestamp>(v)) anyTime = true;
        else if (std::holds_alternative<double>(v)) anyDouble = true;
        else if (std::holds_alternative<int64_t>(v)) anyInt = true;
        else if (std::holds_alternative<bool>(v)) anyBool = true;
    }

    ColumnType type = ColumnType::NUMERIC;
    if (anyText || (anyTime && (anyDouble || anyInt || anyBool))) type = ColumnType::CATEGORICAL;
    else if (anyTime) type = ColumnType::DATETIME;
    else if (anyDouble) type = ColumnType::NUMERIC;
    else if (anyInt) type = anyMissing ? ColumnType::NUMERIC : ColumnType::INTEGER;
    else if (anyBool) type = anyMissing ? ColumnType::CATEGORICAL : ColumnType::BOOLEAN;

    Column out(std::move(name), type, values.size());
    for (size_t i = 0; i < values.size(); ++i) out.set(i, values[i]);
    return out;
}

Column Column::fromDoubles(std::string name, std::vector<double> values) {
    Column out;
    out.name = std::move(name);
    out.type = ColumnType::NUMERIC;
    out.missing.assign(values.size(), 0);
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i])) out.missing[i] = 1;
    }
    out.values = std::move(values);
    return out;
}

Column Column::fromInts(std::string name, std::vector<int64_t> values) {
    Column out;
    out.name = std::move(name);
    out.type = ColumnType::INTEGER;
    out.missing.assign(values.size(), 0);
    out.values = std::move(values);
    return out;
}

Column Column::fromBools(std::string name, std::vector<uint8_t> values) {
    Column out;
    out.name = std::move(name);
    out.type = ColumnType::BOOLEAN;
    out.missing.assign(values.size(), 0);
    out.values = std::move(values);
    return out;
}

Column Column::fromStrings(std::string name, std::vector<std::string> values) {
    Column out;
    out.name = std::move(name);
    out.type = ColumnType::CATEGORICAL;
    out.missing.assign(values.size(), 0);
    out.values = std::move(values);
    return out;
}

Index Index::range(size_t n) {
    Index idx;
    idx.length = n;
    return idx;
}

Index Index::fromColumn(Column level) {
    Index idx;
    idx.length = level.size();
    idx.levels.push_back(std::move(level));
    return idx;
}

Index Index::fromLevels(std::vector<Column> levels) {
    Index idx;
    idx.length = levels.empty() ? 0 : levels.front().size();
    idx.levels = std::move(levels);
    return idx;
}

Scalar Index::labelAt(size_t row, size_t level) const {
    if (levels.empty()) return static_cast<int64_t>(row);
    return levels[level].at(row);
}

std::vector<Scalar> Index::key(size_t row) const {
    std::vector<Scalar> out;
    if (levels.empty()) {
        out.emplace_back(static_cast<int64_t>(row));
        return out;
    }
    out.reserve(levels.size());
    for (const auto& level : levels) out.push_back(level.at(row));
    return out;
}

std::vector<std::string> Index::names() const {
    std::vector<std::string> out;
    for (const auto& level : levels) out.push_back(level.name);
    return out;
}

bool Index::hasNames() const {
    for (const auto& level : levels) {
        if (!level.name.empty()) return true;
    }
    return false;
}

Index Index::take(const std::vector<size_t>& rows) const {
    Index out;
    out.length = rows.size();
    if (levels.empty()) {
        bool identity = true;
        for (size_t i = 0; i < rows.size() && identity; ++i) identity = (rows[i] == i);
        if (identity) return out;
        std::vector<int64_t> labels(rows.begin(), rows.end());
        out.levels.push_back(Column::fromInts("", std::move(labels)));
        return out;
    }
    for (const auto& level : levels) out.levels.push_back(level.take(rows));
    return out;
}

std::optional<size_t> Index::find(const Scalar& label) const {
    if (levels.empty()) {
        std::optional<double> num = scalarToNumber(label);
        if (!num || std::holds_alternative<bool>(label)) return std::nullopt;
        if (*num < 0 || *num >= static_cast<double>(length) || std::floor(*num) != *num) return std::nullopt;
        return static_cast<size_t>(*num);
    }
    const Column& first = levels.front();
    for (size_t r = 0; r < length; ++r) {
        if (scalarsEqual(first.at(r), label)) return r;
    }
    return std::nullopt;
}

bool Index::sameLabels(const Index& other) const {
    if (length != other.length) return false;
    if (isRange() && other.isRange()) return true;
    if (nlevels() != other.nlevels()) return false;
    for (size_t r = 0; r < length; ++r) {
        for (size_t l = 0; l < nlevels(); ++l) {
            if (!scalarsEqual(labelAt(r, l), other.labelAt(r, l))) return false;
        }
    }
    return true;
}

Series::Series(Column column) : values(std::move(column)), index(Index::range(values.size())) {}

Series Series::take(const std::vector<size_t>& rows) const {
    return Series(values.take(rows), index.take(rows));
}

int DataFrame::findColumn(const std::string& name) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

const Column& DataFrame::column(const std::string& name) const {
    const int idx = findColumn(name);
    if (idx < 0) throw ScriptError("KeyError", "'" + name + "'");
    return columns[static_cast<size_t>(idx)];
}

Column& DataFrame::column(const std::string& name) {
    const int idx = findColumn(name);
    if (idx < 0) throw ScriptError("KeyError", "'" + name + "'");
    return columns[static_cast<size_t>(idx)];
}

void DataFrame::setColumn(Column col) {
    if (columns.empty() && index.size() == 0 && index.isRange()) {
        index = Index::range(col.size());
    }
    if (col.size() != rows()) {
        throw ScriptError("ValueError", "Length of values (" + std::to_string(col.size()) +
                                            ") does not match length of index (" + std::to_string(rows()) + ")");
    }
    const int idx = findColumn(col.name);
    if (idx >= 0) {
        columns[static_cast<size_t>(idx)] = std::move(col);
    } else {
        columns.push_back(std::move(col));
    }
}

std::vector<std::string> DataFrame::columnNames() const {
    std::vector<std::string> out;
    out.reserve(columns.size());
    for (const auto& c : columns) out.push_back(c.name);
    return out;
}

DataFrame DataFrame::take(const std::vector<size_t>& rowsToTake) const {
    DataFrame out;
    out.index = index.take(rowsToTake);
    out.columns.reserve(columns.size());
    for (const auto& c : columns) out.columns.push_back(c.take(rowsToTake));
    return out;
}

Series DataFrame::row(size_t r) const {
    std::vector<Scalar> cells;
    std::vector<std::string> names;
    cells.reserve(columns.size());
    for (const auto& c : columns) {
        cells.push_back(c.at(r));
        names.push_back(c.name);
    }
    Column values = Column::fromScalars("", cells);
    const Scalar label = index.labelAt(r);
    if (const auto* s = std::get_if<std::string>(&label)) values.name = *s;
    else if (const auto* i = std::get_if<int64_t>(&label)) values.name = std::to_string(*i);
    return Series(std::move(values), Index::fromColumn(Column::fromStrings("", std::move(names))));
}

bool scalarIsMissing(const Scalar& s) noexcept {
    if (std::holds_alternative<std::monostate>(s)) return true;
    if (const auto* d = std::get_if<double>(&s)) return std::isnan(*d);
    return false;
}

std::optional<double> scalarToNumber(const Scalar& s) noexcept {
    if (const auto* d = std::get_if<double>(&s)) return *d;
    if (const auto* i = std::get_if<int64_t>(&s)) return static_cast<double>(*i);
    if (const auto* b = std::get_if<bool>(&s)) return *b ? 1.0 : 0.0;
    return std::nullopt;
}

bool scalarsEqual(const Scalar& a, const Scalar& b) noexcept {
    const bool am = scalarIsMissing(a);
    const bool bm = scalarIsMissing(b);
    if (am || bm) return am && bm;
    if (rankOf(a) != rankOf(b)) return false;
    if (rankOf(a) == 0) {
        if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
            return std::get<int64_t>(a) == std::get<int64_t>(b);
        }
        return *scalarToNumber(a) == *scalarToNumber(b);
    }
    if (rankOf(a) == 1) return std::get<std::string>(a) == std::get<std::string>(b);
    return std::get<Timestamp>(a) == std::get<Timestamp>(b);
}

bool scalarLess(const Scalar& a, const Scalar& b) noexcept {
    const bool am = scalarIsMissing(a);
    const bool bm = scalarIsMissing(b);
    if (am || bm) return !am && bm;
    const int ra = rankOf(a);
    const int rb = rankOf(b);
    if (ra != rb) return ra < rb;
    if (ra == 0) {
        if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
            return std::get<int64_t>(a) < std::get<int64_t>(b);
        }
        return *scalarToNumber(a) < *scalarToNumber(b);
    }
    if (ra == 1) return std::get<std::string>(a) < std::get<std::string>(b);
    return std::get<Timestamp>(a) < std::get<Timestamp>(b);
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) noexcept {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t days, int& y, unsigned& m, unsigned& d) noexcept {
    const int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
}

std::optional<Timestamp> parseTimestamp(const std::string& text) noexcept {
    const std::string s = CommonUtils::trim(text);
    if (s.empty()) return std::nullopt;

    std::string datePart = s;
    std::string timePart;
    const size_t sep = s.find_first_of(" T");
    if (sep != std::string::npos) {
        datePart = s.substr(0, sep);
        timePart = CommonUtils::trim(s.substr(sep + 1));
        if (!timePart.empty() && timePart.back() == 'Z') timePart.pop_back();
    }

    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!parseDatePart(datePart, year, month, day)) return std::nullopt;
    if (!parseTimePart(timePart, hour, minute, second)) return std::nullopt;
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > daysInMonth(year, month)) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return Timestamp{days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 + second};
}

} // namespace Tabula
