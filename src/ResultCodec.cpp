#include "ResultCodec.h"

#include "TabulaExceptions.h"

#include <charconv>
#include <cctype>
#include <cmath>
#include <limits>
#include <map>
#include <sstream>
#include <utility>

namespace Tabula {
namespace ResultCodec {

namespace {

constexpr size_t kMaxDepth = 256;

struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };

    Type type = Type::Null;
    bool booleanValue = false;
    // Number tokens are kept as text so int64 values decode exactly.
    std::string numberText;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::map<std::string, JsonValue> objectValue;

    bool isObject() const noexcept { return type == Type::Object; }
    bool isArray() const noexcept { return type == Type::Array; }
    bool isString() const noexcept { return type == Type::String; }
    bool isNumber() const noexcept { return type == Type::Number; }

    const JsonValue* find(const std::string& key) const {
        if (!isObject()) return nullptr;
        auto it = objectValue.find(key);
        if (it == objectValue.end()) return nullptr;
        return &it->second;
    }
};

[[noreturn]] void malformed(const std::string& what) {
    throw CodeExecutionError("Result payload is malformed", what);
}

class JsonParser {
public:
    explicit JsonParser(const std::string& source) : text(source) {}

    JsonValue parse() {
        skipWhitespace();
        JsonValue value = parseValue(0);
        skipWhitespace();
        if (position != text.size()) malformed("Unexpected trailing JSON content");
        return value;
    }

private:
    const std::string& text;
    size_t position = 0;

    void skipWhitespace() {
        while (position < text.size() && std::isspace(static_cast<unsigned char>(text[position])) != 0) {
            ++position;
        }
    }

    char peek() const {
        if (position >= text.size()) malformed("Unexpected end of JSON input");
        return text[position];
    }

    char take() {
        if (position >= text.size()) malformed("Unexpected end of JSON input");
        return text[position++];
    }

    void expect(char expected) {
        if (take() != expected) malformed(std::string("Expected JSON character '") + expected + "'");
    }

    bool consume(const char* word) {
        const std::string token(word);
        if (text.compare(position, token.size(), token) != 0) return false;
        position += token.size();
        return true;
    }

    JsonValue parseValue(size_t depth) {
        if (depth > kMaxDepth) malformed("JSON nesting too deep");
        skipWhitespace();
        const char c = peek();
        if (c == '{') return parseObject(depth);
        if (c == '[') return parseArray(depth);
        if (c == '"') return parseString();
        if (c == 't' || c == 'f') return parseBoolean();
        if (c == 'n') return parseNull();
        if (c == '-' || c == 'N' || c == 'I' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber();
        malformed("Invalid JSON token");
    }

    JsonValue parseObject(size_t depth) {
        JsonValue object;
        object.type = JsonValue::Type::Object;

        expect('{');
        skipWhitespace();
        if (peek() == '}') {
            take();
            return object;
        }

        while (true) {
            JsonValue key = parseString();
            skipWhitespace();
            expect(':');
            skipWhitespace();
            object.objectValue[key.stringValue] = parseValue(depth + 1);

            skipWhitespace();
            const char next = take();
            if (next == '}') break;
            if (next != ',') malformed("Expected ',' or '}' in JSON object");
            skipWhitespace();
        }
        return object;
    }

    JsonValue parseArray(size_t depth) {
        JsonValue array;
        array.type = JsonValue::Type::Array;

        expect('[');
        skipWhitespace();
        if (peek() == ']') {
            take();
            return array;
        }

        while (true) {
            array.arrayValue.push_back(parseValue(depth + 1));
            skipWhitespace();
            const char next = take();
            if (next == ']') break;
            if (next != ',') malformed("Expected ',' or ']' in JSON array");
            skipWhitespace();
        }
        return array;
    }

    JsonValue parseString() {
        JsonValue str;
        str.type = JsonValue::Type::String;

        expect('"');
        while (true) {
            const char c = take();
            if (c == '"') break;
            if (c == '\\') {
                const char escaped = take();
                switch (escaped) {
                    case '"': str.stringValue.push_back('"'); break;
                    case '\\': str.stringValue.push_back('\\'); break;
                    case '/': str.stringValue.push_back('/'); break;
                    case 'b': str.stringValue.push_back('\b'); break;
                    case 'f': str.stringValue.push_back('\f'); break;
                    case 'n': str.stringValue.push_back('\n'); break;
                    case 'r': str.stringValue.push_back('\r'); break;
                    case 't': str.stringValue.push_back('\t'); break;
                    case 'u': str.stringValue.push_back(static_cast<char>(parseHexByte())); break;
                    default: malformed("Unsupported escaped character in JSON string");
                }
                continue;
            }
            str.stringValue.push_back(c);
        }
        return str;
    }

    // Only \u00XX escapes are produced by the encoder (control bytes).
    unsigned parseHexByte() {
        unsigned out = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = take();
            out <<= 4;
            if (h >= '0' && h <= '9') out |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') out |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') out |= static_cast<unsigned>(h - 'A' + 10);
            else malformed("Invalid \\u escape");
        }
        if (out > 0xFF) malformed("Unsupported \\u escape");
        return out;
    }

    JsonValue parseBoolean() {
        JsonValue value;
        value.type = JsonValue::Type::Bool;
        if (consume("true")) {
            value.booleanValue = true;
            return value;
        }
        if (consume("false")) return value;
        malformed("Invalid JSON boolean value");
    }

    JsonValue parseNull() {
        if (!consume("null")) malformed("Invalid JSON null value");
        return JsonValue{};
    }

    JsonValue parseNumber() {
        JsonValue number;
        number.type = JsonValue::Type::Number;
        const size_t start = position;
        if (consume("NaN") || consume("Infinity") || consume("-Infinity")) {
            number.numberText = text.substr(start, position - start);
            return number;
        }
        if (peek() == '-') take();
        while (position < text.size()) {
            const char c = text[position];
            if (std::isdigit(static_cast<unsigned char>(c)) == 0 && c != '.' && c != 'e' && c != 'E' && c != '+' &&
                c != '-') {
                break;
            }
            ++position;
        }
        number.numberText = text.substr(start, position - start);
        if (number.numberText.empty() || number.numberText == "-") malformed("Invalid JSON number");
        return number;
    }
};

// ---------------------------------------------------------------------------
// Encoding

void writeString(std::ostringstream& out, const std::string& value) {
    static const char* hex = "0123456789abcdef";
    out << '"';
    for (char c : value) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    const auto u = static_cast<unsigned char>(c);
                    out << "\\u00" << hex[u >> 4] << hex[u & 0x0F];
                } else {
                    out << c;
                }
                break;
        }
    }
    out << '"';
}

void writeDouble(std::ostringstream& out, double value) {
    if (std::isnan(value)) {
        out << "NaN";
        return;
    }
    if (std::isinf(value)) {
        out << (value > 0 ? "Infinity" : "-Infinity");
        return;
    }
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), value);
    std::string text(buf, res.ptr);
    if (text.find_first_of(".e") == std::string::npos) text += ".0";
    out << text;
}

void writeScalar(std::ostringstream& out, const Scalar& value) {
    if (std::holds_alternative<std::monostate>(value)) out << "null";
    else if (const auto* b = std::get_if<bool>(&value)) out << (*b ? "true" : "false");
    else if (const auto* i = std::get_if<int64_t>(&value)) out << *i;
    else if (const auto* d = std::get_if<double>(&value)) writeDouble(out, *d);
    else if (const auto* s = std::get_if<std::string>(&value)) writeString(out, *s);
    else out << "{\"$t\":\"ts\",\"v\":" << std::get<Timestamp>(value).seconds << '}';
}

void writeScalars(std::ostringstream& out, const std::vector<Scalar>& values) {
    out << '[';
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out << ',';
        writeScalar(out, values[i]);
    }
    out << ']';
}

void writeColumn(std::ostringstream& out, const Column& col) {
    out << "{\"name\":";
    writeString(out, col.name);
    out << ",\"type\":\"" << columnTypeName(col.type) << "\",\"values\":[";
    for (size_t r = 0; r < col.size(); ++r) {
        if (r > 0) out << ',';
        writeScalar(out, col.at(r));
    }
    out << "]}";
}

void writeIndex(std::ostringstream& out, const Index& index) {
    out << "{\"length\":" << index.length << ",\"levels\":[";
    for (size_t l = 0; l < index.levels.size(); ++l) {
        if (l > 0) out << ',';
        writeColumn(out, index.levels[l]);
    }
    out << "]}";
}

void writeTrace(std::ostringstream& out, const Trace& trace) {
    out << "{\"$t\":\"trace\",\"type\":";
    writeString(out, trace.type);
    out << ",\"name\":";
    writeString(out, trace.name);
    out << ",\"mode\":";
    writeString(out, trace.mode);
    out << ",\"x\":";
    writeScalars(out, trace.x);
    out << ",\"y\":";
    writeScalars(out, trace.y);
    out << ",\"labels\":";
    writeScalars(out, trace.labels);
    out << ",\"values\":";
    writeScalars(out, trace.values);
    out << ",\"attributes\":{";
    bool first = true;
    for (const auto& [k, v] : trace.attributes) {
        if (!first) out << ',';
        first = false;
        writeString(out, k);
        out << ':';
        writeString(out, v);
    }
    out << "}}";
}

void writeValue(std::ostringstream& out, const Value& value);

void writeItems(std::ostringstream& out, const std::vector<Value>& items) {
    out << '[';
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out << ',';
        writeValue(out, items[i]);
    }
    out << ']';
}

void writeValue(std::ostringstream& out, const Value& value) {
    if (const auto scalar = toScalar(value)) {
        writeScalar(out, *scalar);
        return;
    }
    if (const auto* list = value.ptr<std::shared_ptr<ListValue>>()) {
        writeItems(out, (*list)->items);
    } else if (const auto* tuple = value.ptr<std::shared_ptr<TupleValue>>()) {
        out << "{\"$t\":\"tuple\",\"v\":";
        writeItems(out, (*tuple)->items);
        out << '}';
    } else if (const auto* set = value.ptr<std::shared_ptr<SetValue>>()) {
        out << "{\"$t\":\"set\",\"v\":";
        writeItems(out, (*set)->items);
        out << '}';
    } else if (const auto* dict = value.ptr<std::shared_ptr<DictValue>>()) {
        out << "{\"$t\":\"dict\",\"v\":[";
        for (size_t i = 0; i < (*dict)->items.size(); ++i) {
            if (i > 0) out << ',';
            out << '[';
            writeValue(out, (*dict)->items[i].first);
            out << ',';
            writeValue(out, (*dict)->items[i].second);
            out << ']';
        }
        out << "]}";
    } else if (value.isFrame()) {
        const DataFrame& df = value.frame();
        out << "{\"$t\":\"frame\",\"index\":";
        writeIndex(out, df.index);
        out << ",\"columns\":[";
        for (size_t c = 0; c < df.cols(); ++c) {
            if (c > 0) out << ',';
            writeColumn(out, df.columns[c]);
        }
        out << "]}";
    } else if (value.isSeries()) {
        const Series& s = value.series();
        out << "{\"$t\":\"series\",\"index\":";
        writeIndex(out, s.index);
        out << ",\"values\":";
        writeColumn(out, s.values);
        out << '}';
    } else if (const auto* fig = value.ptr<std::shared_ptr<Figure>>()) {
        const Figure& figure = **fig;
        out << "{\"$t\":\"figure\",\"title\":";
        writeString(out, figure.title);
        out << ",\"layout\":{";
        bool first = true;
        for (const auto& [k, v] : figure.layout) {
            if (!first) out << ',';
            first = false;
            writeString(out, k);
            out << ':';
            writeString(out, v);
        }
        out << "},\"data\":[";
        for (size_t i = 0; i < figure.data.size(); ++i) {
            if (i > 0) out << ',';
            writeTrace(out, figure.data[i]);
        }
        out << "]}";
    } else if (const auto* trace = value.ptr<std::shared_ptr<Trace>>()) {
        writeTrace(out, **trace);
    } else {
        out << "{\"$t\":\"repr\",\"v\":";
        writeString(out, repr(value));
        out << '}';
    }
}

// ---------------------------------------------------------------------------
// Decoding

const JsonValue& member(const JsonValue& object, const std::string& key) {
    const JsonValue* found = object.find(key);
    if (found == nullptr) malformed("missing field '" + key + "'");
    return *found;
}

const std::string& textOf(const JsonValue& v) {
    if (!v.isString()) malformed("expected a string");
    return v.stringValue;
}

const std::vector<JsonValue>& arrayOf(const JsonValue& v) {
    if (!v.isArray()) malformed("expected an array");
    return v.arrayValue;
}

int64_t intOf(const JsonValue& v) {
    if (!v.isNumber()) malformed("expected an integer");
    int64_t out = 0;
    const std::string& t = v.numberText;
    auto res = std::from_chars(t.data(), t.data() + t.size(), out);
    if (res.ec != std::errc() || res.ptr != t.data() + t.size()) malformed("invalid integer '" + t + "'");
    return out;
}

Scalar numberScalar(const JsonValue& v) {
    const std::string& t = v.numberText;
    if (t == "NaN") return std::numeric_limits<double>::quiet_NaN();
    if (t == "Infinity") return std::numeric_limits<double>::infinity();
    if (t == "-Infinity") return -std::numeric_limits<double>::infinity();
    if (t.find_first_of(".eE") == std::string::npos) return intOf(v);
    try {
        return std::stod(t);
    } catch (const std::exception&) {
        malformed("invalid number '" + t + "'");
    }
}

Scalar readScalar(const JsonValue& v) {
    switch (v.type) {
        case JsonValue::Type::Null: return std::monostate{};
        case JsonValue::Type::Bool: return v.booleanValue;
        case JsonValue::Type::Number: return numberScalar(v);
        case JsonValue::Type::String: return v.stringValue;
        case JsonValue::Type::Object:
            if (const JsonValue* tag = v.find("$t"); tag != nullptr && textOf(*tag) == "ts") {
                return Timestamp{intOf(member(v, "v"))};
            }
            break;
        case JsonValue::Type::Array:
            break;
    }
    malformed("expected a scalar");
}

std::vector<Scalar> readScalars(const JsonValue& v) {
    std::vector<Scalar> out;
    for (const auto& item : arrayOf(v)) out.push_back(readScalar(item));
    return out;
}

ColumnType typeFromName(const std::string& name) {
    for (ColumnType t : {ColumnType::NUMERIC, ColumnType::INTEGER, ColumnType::BOOLEAN, ColumnType::CATEGORICAL,
                         ColumnType::DATETIME}) {
        if (name == columnTypeName(t)) return t;
    }
    malformed("unknown column type '" + name + "'");
}

Column readColumn(const JsonValue& v) {
    const std::vector<JsonValue>& cells = arrayOf(member(v, "values"));
    Column col(textOf(member(v, "name")), typeFromName(textOf(member(v, "type"))), cells.size());
    for (size_t r = 0; r < cells.size(); ++r) {
        const Scalar cell = readScalar(cells[r]);
        if (!scalarIsMissing(cell)) {
            col.set(r, cell);
            continue;
        }
        // Mark in place: set() would promote INTEGER and BOOLEAN columns.
        col.missing[r] = 1;
        if (auto* numbers = std::get_if<std::vector<double>>(&col.values)) (*numbers)[r] = std::nan("");
    }
    return col;
}

Index readIndex(const JsonValue& v) {
    Index index;
    index.length = static_cast<size_t>(intOf(member(v, "length")));
    for (const auto& level : arrayOf(member(v, "levels"))) {
        index.levels.push_back(readColumn(level));
        if (index.levels.back().size() != index.length) malformed("index level length mismatch");
    }
    return index;
}

Trace readTrace(const JsonValue& v) {
    Trace trace;
    trace.type = textOf(member(v, "type"));
    trace.name = textOf(member(v, "name"));
    trace.mode = textOf(member(v, "mode"));
    trace.x = readScalars(member(v, "x"));
    trace.y = readScalars(member(v, "y"));
    trace.labels = readScalars(member(v, "labels"));
    trace.values = readScalars(member(v, "values"));
    const JsonValue& attributes = member(v, "attributes");
    if (!attributes.isObject()) malformed("expected trace attributes");
    for (const auto& [k, a] : attributes.objectValue) trace.attributes[k] = textOf(a);
    return trace;
}

Value readValue(const JsonValue& v);

std::vector<Value> readItems(const JsonValue& v) {
    std::vector<Value> out;
    for (const auto& item : arrayOf(v)) out.push_back(readValue(item));
    return out;
}

Value readValue(const JsonValue& v) {
    if (v.isArray()) return makeList(readItems(v));
    if (!v.isObject()) return fromScalar(readScalar(v));

    const std::string& tag = textOf(member(v, "$t"));
    if (tag == "ts") return fromScalar(readScalar(v));
    if (tag == "tuple") return makeTuple(readItems(member(v, "v")));
    if (tag == "set") {
        auto set = std::make_shared<SetValue>();
        for (auto& item : readItems(member(v, "v"))) set->add(item);
        return Value(set);
    }
    if (tag == "dict") {
        auto dict = std::make_shared<DictValue>();
        for (const auto& pair : arrayOf(member(v, "v"))) {
            const auto& kv = arrayOf(pair);
            if (kv.size() != 2) malformed("dict entry must be a pair");
            dict->set(readValue(kv[0]), readValue(kv[1]));
        }
        return Value(dict);
    }
    if (tag == "frame") {
        DataFrame df;
        df.index = readIndex(member(v, "index"));
        for (const auto& col : arrayOf(member(v, "columns"))) {
            df.columns.push_back(readColumn(col));
            if (df.columns.back().size() != df.rows()) malformed("column length mismatch");
        }
        return makeFrame(std::move(df));
    }
    if (tag == "series") {
        Series s(readColumn(member(v, "values")), readIndex(member(v, "index")));
        if (s.values.size() != s.index.size()) malformed("series length mismatch");
        return makeSeries(std::move(s));
    }
    if (tag == "figure") {
        auto figure = std::make_shared<Figure>();
        figure->title = textOf(member(v, "title"));
        const JsonValue& layout = member(v, "layout");
        if (!layout.isObject()) malformed("expected figure layout");
        for (const auto& [k, a] : layout.objectValue) figure->layout[k] = textOf(a);
        for (const auto& trace : arrayOf(member(v, "data"))) figure->data.push_back(readTrace(trace));
        return Value(figure);
    }
    if (tag == "trace") return Value(std::make_shared<Trace>(readTrace(v)));
    if (tag == "repr") return Value(textOf(member(v, "v")));
    malformed("unknown value tag '" + tag + "'");
}

} // namespace

std::string encodeValue(const Value& value) {
    std::ostringstream out;
    writeValue(out, value);
    return out.str();
}

Value decodeValue(const std::string& text) {
    JsonParser parser(text);
    return readValue(parser.parse());
}

std::string encodeSuccess(const Value& value, const std::string& note) {
    std::ostringstream out;
    out << "{\"ok\":true,\"note\":";
    writeString(out, note);
    out << ",\"value\":";
    writeValue(out, value);
    out << '}';
    return out.str();
}

std::string encodeFailure(const std::string& category, const std::string& message, const std::string& note) {
    std::ostringstream out;
    out << "{\"ok\":false,\"note\":";
    writeString(out, note);
    out << ",\"category\":";
    writeString(out, category);
    out << ",\"message\":";
    writeString(out, message);
    out << '}';
    return out.str();
}

WorkerReply decodeReply(const std::string& text) {
    JsonParser parser(text);
    const JsonValue root = parser.parse();
    const JsonValue& ok = member(root, "ok");
    if (ok.type != JsonValue::Type::Bool) malformed("expected 'ok' flag");

    WorkerReply reply;
    reply.ok = ok.booleanValue;
    if (const JsonValue* note = root.find("note")) reply.note = textOf(*note);
    if (reply.ok) {
        reply.value = readValue(member(root, "value"));
    } else {
        reply.category = textOf(member(root, "category"));
        reply.message = textOf(member(root, "message"));
    }
    return reply;
}

} // namespace ResultCodec
} // namespace Tabula
