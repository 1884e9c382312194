#include "SecurityPolicy.h"

#include "CommonUtils.h"
#include "TabulaExceptions.h"

#include <algorithm>
#include <fstream>
#include <limits>
#include <unordered_map>

namespace Tabula {

namespace {
std::vector<std::string> splitCSV(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            std::string t = CommonUtils::trim(cur);
            if (!t.empty()) out.push_back(t);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    std::string t = CommonUtils::trim(cur);
    if (!t.empty()) out.push_back(t);
    return out;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Lists may arrive as `a, b`, `[a, b]` or `["a", "b"]`.
std::vector<std::string> parseList(const std::string& raw) {
    std::string body = CommonUtils::trim(raw);
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }
    std::vector<std::string> out;
    for (const auto& item : splitCSV(body)) {
        std::string v = maybeUnquote(item);
        if (!v.empty()) out.push_back(v);
    }
    return out;
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

size_t parseSizeStrict(const std::string& value, const std::string& key, size_t minValue) {
    unsigned long long parsed = 0;
    try {
        size_t pos = 0;
        if (!value.empty() && value.front() == '-') throw ConfigurationException("Invalid size for " + key + ": " + value);
        parsed = std::stoull(value, &pos);
        if (pos != value.size()) throw ConfigurationException("Invalid size for " + key + ": " + value);
    } catch (const TabulaException&) {
        throw;
    } catch (const std::exception& ex) {
        throw ConfigurationException("Invalid size for " + key + ": " + value + " (" + ex.what() + ")");
    }
    if (parsed < minValue) {
        throw ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    if (parsed > static_cast<unsigned long long>(std::numeric_limits<size_t>::max())) {
        throw ConfigurationException("Value for " + key + " exceeds size range");
    }
    return static_cast<size_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = 0.0;
    try {
        size_t pos = 0;
        parsed = std::stod(value, &pos);
        if (pos != value.size()) throw ConfigurationException("Invalid number for " + key + ": " + value);
    } catch (const TabulaException&) {
        throw;
    } catch (const std::exception& ex) {
        throw ConfigurationException("Invalid number for " + key + ": " + value + " (" + ex.what() + ")");
    }
    if (!(parsed >= minValue)) {
        throw ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

SyscallFilterMode parseSyscallFilterMode(const std::string& value) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "off" || v == "none" || v == "false") return SyscallFilterMode::OFF;
    if (v == "best_effort" || v == "best-effort") return SyscallFilterMode::BEST_EFFORT;
    if (v == "strict") return SyscallFilterMode::STRICT;
    throw ConfigurationException("syscall_filter must be one of: off, best_effort, strict");
}

void applyList(std::set<std::string>& target, const std::string& value, bool extend) {
    if (!extend) target.clear();
    for (auto& item : parseList(value)) target.insert(std::move(item));
}

void assignKeyValue(SecurityPolicy& policy, std::string key, const std::string& value) {
    bool extend = false;
    if (!key.empty() && key.back() == '+') {
        extend = true;
        key.pop_back();
        key = CommonUtils::trim(key);
    }

    static const std::unordered_map<std::string, std::set<std::string> SecurityPolicy::*> setFields = {
        {"allowed_operations", &SecurityPolicy::allowedOperations},
        {"blocked_operations", &SecurityPolicy::blockedOperations},
        {"blocked_modules", &SecurityPolicy::blockedModules},
        {"allowed_variables", &SecurityPolicy::allowedVariables}
    };
    auto setIt = setFields.find(key);
    if (setIt != setFields.end()) {
        applyList(policy.*(setIt->second), value, extend);
        return;
    }

    if (key == "dataset_aliases" || key == "result_names") {
        std::vector<std::string>& target = (key == "dataset_aliases") ? policy.datasetAliases : policy.resultNames;
        if (!extend) target.clear();
        for (auto& item : parseList(value)) {
            if (std::find(target.begin(), target.end(), item) == target.end()) target.push_back(std::move(item));
        }
        return;
    }
    if (extend) {
        throw ConfigurationException("'+' is only valid on list keys: " + key);
    }

    struct SizeRule {
        size_t SecurityPolicy::*member;
        size_t minValue;
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"max_input_length", {&SecurityPolicy::maxInputLength, 1}},
        {"max_memory_mb", {&SecurityPolicy::maxMemoryMb, 1}},
        {"max_result_bytes", {&SecurityPolicy::maxResultBytes, 1024}}
    };
    auto sizeIt = sizeFields.find(key);
    if (sizeIt != sizeFields.end()) {
        policy.*(sizeIt->second.member) = parseSizeStrict(value, key, sizeIt->second.minValue);
        return;
    }

    if (key == "execution_timeout" || key == "execution_timeout_seconds") {
        policy.executionTimeoutSeconds = parseDoubleStrict(value, key, 0.0);
        return;
    }
    if (key == "dataset_name") {
        policy.datasetName = value;
        return;
    }
    if (key == "syscall_filter") {
        policy.syscallFilter = parseSyscallFilterMode(value);
        return;
    }
    if (key == "log_level") {
        policy.logLevel = Log::parseLevel(value);
        return;
    }

    throw ConfigurationException("Unknown config key: " + key);
}

bool isIdentifier(const std::string& s) {
    if (s.empty()) return false;
    if (!(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_')) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}
} // namespace

const char* syscallFilterModeName(SyscallFilterMode mode) noexcept {
    switch (mode) {
        case SyscallFilterMode::OFF: return "off";
        case SyscallFilterMode::BEST_EFFORT: return "best_effort";
        case SyscallFilterMode::STRICT: return "strict";
    }
    return "best_effort";
}

SecurityPolicy SecurityPolicy::defaults() {
    SecurityPolicy policy;
    policy.allowedOperations = {
        "groupby", "agg", "aggregate", "apply", "transform", "pipe", "mean", "sum", "count", "std", "var",
        "min", "max", "median", "quantile", "describe", "mode", "sem", "skew", "kurt", "filter", "query",
        "loc", "iloc", "isin", "contains", "between", "isna", "notna", "dropna", "fillna", "where", "mask",
        "merge", "join", "concat", "pivot", "pivot_table", "melt", "stack", "unstack", "explode", "crosstab",
        "corr", "cov", "value_counts", "unique", "nunique", "duplicated", "sort_values", "sort_index",
        "reset_index", "set_index", "reindex", "head", "tail", "sample", "drop_duplicates", "nlargest",
        "nsmallest", "str", "lower", "upper", "strip", "replace", "split", "dt", "year", "month", "day",
        "hour", "minute", "astype", "to_numeric", "to_datetime", "first", "last", "nth", "size", "eq", "ne",
        "lt", "le", "gt", "ge", "abs", "round", "floor", "ceil", "clip", "any", "all", "bool", "shape",
        "columns", "index", "values", "dtypes", "info", "len", "copy", "assign", "bar", "scatter", "line",
        "pie", "histogram", "box", "violin", "heatmap", "treemap", "sunburst", "funnel", "waterfall",
        "icicle", "scatter_3d", "line_3d", "scatter_matrix", "parallel_coordinates", "density_heatmap",
        "density_contour", "area", "ecdf", "strip", "scatter_polar", "line_polar", "bar_polar", "choropleth",
        "imshow", "Figure", "Bar", "Scatter", "Pie", "Histogram", "Box", "Violin", "Heatmap", "Contour",
        "Surface", "Mesh3d", "Indicator", "Gauge", "Scatterpolar", "Barpolar", "Scatterternary", "Sankey",
        "Treemap", "Sunburst", "Funnel", "Waterfall", "Candlestick", "Ohlc", "Table", "Scattergeo",
        "Choropleth", "Scattermapbox", "Densitymapbox", "Scatter3d", "Line3d", "Isosurface", "Volume",
        "Cone", "Streamtube", "update_layout", "update_traces", "update_xaxes", "update_yaxes", "add_trace",
        "add_annotation", "add_shape", "add_vline", "add_hline", "add_vrect", "add_hrect", "set_subplots",
        "make_subplots", "data", "layout", "frames", "to_dict", "to_json", "colors", "qualitative",
        "sequential", "diverging", "cyclical", "Set1", "Set2", "Set3", "Pastel", "Pastel1", "Pastel2",
        "Dark2", "Viridis", "Plasma", "Inferno", "Magma", "Cividis", "Blues", "Reds", "RdBu", "RdBu_r",
        "Spectral", "Rainbow", "Jet", "Hot", "Cool", "dict", "list", "tuple", "range", "enumerate", "zip",
        "sorted", "format", "f", "tolist", "items", "keys", "path", "names", "parents", "ids", "hole",
        "pull", "textinfo", "textposition", "textfont", "insidetextfont", "outsidetextfont", "hovertemplate",
        "hoverinfo", "hoverlabel", "customdata", "marker_color", "marker_line", "marker_size", "opacity",
        "orientation", "barmode", "barnorm", "bargap", "bargroupgap", "nbinsx", "nbinsy", "histfunc",
        "histnorm", "cumulative", "trendline", "trendline_color_override", "trendline_scope",
        "color_discrete_sequence", "color_discrete_map", "color_continuous_scale",
        "color_continuous_midpoint", "symbol", "symbol_sequence", "symbol_map", "facet_row", "facet_col",
        "facet_col_wrap", "animation_frame", "category_orders", "labels", "title", "template", "width",
        "height", "marginal", "marginal_x", "marginal_y", "log_x", "log_y", "range_x", "range_y",
        "render_mode", "hover_name", "hover_data", "text", "error_x", "error_y", "base", "pattern_shape",
        "pattern_shape_sequence", "pattern_shape_map"
    };
    policy.blockedOperations = {
        "eval", "exec", "compile", "__import__", "execfile", "input", "raw_input", "open", "file", "read",
        "write", "remove", "delete", "rmdir", "mkdir", "chmod", "chown", "unlink", "rename", "listdir",
        "walk", "glob", "scandir", "system", "popen", "call", "run", "spawn", "kill", "fork", "wait", "exit",
        "quit", "abort", "socket", "urllib", "requests", "http", "ftp", "smtp", "connect", "send", "recv",
        "bind", "listen", "__builtins__", "__globals__", "__locals__", "__dict__", "__class__", "__bases__",
        "__subclasses__", "__getattribute__", "__setattr__", "__delattr__", "__code__", "__func__",
        "getattr", "setattr", "delattr", "hasattr", "vars", "dir", "globals", "locals", "type", "object",
        "pickle", "marshal", "dill", "shelve", "load", "loads", "dump", "dumps", "subprocess", "Popen",
        "check_output", "check_call", "importlib", "__loader__", "__spec__"
    };
    policy.blockedModules = {
        "os", "sys", "subprocess", "shutil", "pickle", "marshal", "socket", "urllib", "requests", "http",
        "ftplib", "smtplib", "sqlite3", "ctypes", "multiprocessing", "threading", "asyncio", "importlib",
        "builtins", "code", "codeop", "compile", "gc", "inspect", "traceback", "linecache", "tempfile",
        "pathlib", "io", "zipfile", "tarfile", "gzip", "bz2"
    };
    policy.allowedVariables = {
        "df", "pd", "np", "result", "filtered", "grouped", "merged", "temp", "data", "subset", "output",
        "stats", "summary", "px", "go", "fig", "figure", "chart", "plot", "trace", "traces", "colors",
        "layout", "annotation", "annotations", "shape", "shapes", "corr", "numeric_cols", "courses",
        "levels", "genders", "row", "col", "i", "j", "x", "y", "z", "r", "theta", "label", "labels", "value",
        "avg_score", "top_students", "level", "course", "gender", "score", "path", "parent", "parents",
        "ids", "names", "values", "text", "hover_data", "color", "size", "symbol", "opacity", "line",
        "marker", "counts", "totals", "means", "averages", "sums", "students_data", "distribution",
        "metrics", "categories", "series", "column", "columns", "rows", "idx", "index", "title", "name",
        "mode", "fill", "showlegend", "legendgroup", "make_subplots", "subplot", "axis", "polar",
        "radialaxis"
    };
    return policy;
}

SecurityPolicy SecurityPolicy::fromFile(const std::string& configPath, const SecurityPolicy& base) {
    std::ifstream in(configPath);
    if (!in) throw ConfigurationException("Could not open config file: " + configPath);

    SecurityPolicy policy = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw ConfigurationException("Config parse error at line " + std::to_string(lineNo) +
                                         ": expected key: value, got '" + line + "'");
        }

        std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(policy, key, value);
        } catch (const TabulaException& ex) {
            throw ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    policy.validate();

    return policy;
}

void SecurityPolicy::validate() const {
    if (maxInputLength == 0) {
        throw ConfigurationException("max_input_length must be > 0");
    }
    if (!(executionTimeoutSeconds > 0.0)) {
        throw ConfigurationException("execution_timeout must be > 0");
    }
    if (maxMemoryMb == 0) {
        throw ConfigurationException("max_memory_mb must be > 0");
    }
    if (maxResultBytes == 0) {
        throw ConfigurationException("max_result_bytes must be > 0");
    }
    for (const auto& name : datasetBindings()) {
        if (!isIdentifier(name)) {
            throw ConfigurationException("dataset name is not a valid identifier: '" + name + "'");
        }
        if (isDeniedIdentifier(name)) {
            throw ConfigurationException("dataset name is itself blocked: " + name);
        }
    }
    for (const auto& name : resultNames) {
        if (!isIdentifier(name)) {
            throw ConfigurationException("result name is not a valid identifier: '" + name + "'");
        }
    }
    for (const auto& op : allowedOperations) {
        if (blockedOperations.count(op) != 0) {
            throw ConfigurationException("operation is both allowed and blocked: " + op);
        }
    }
}

std::vector<std::string> SecurityPolicy::datasetBindings() const {
    std::vector<std::string> out;
    out.push_back(datasetName);
    for (const auto& alias : datasetAliases) {
        if (std::find(out.begin(), out.end(), alias) == out.end()) out.push_back(alias);
    }
    return out;
}

bool SecurityPolicy::isDeniedIdentifier(const std::string& name) const {
    return CommonUtils::isDunder(name) || isBlockedOperation(name) || isBlockedModule(name);
}

} // namespace Tabula
