#include "ScriptRuntime.h"

#include "CommonUtils.h"
#include "TabulaExceptions.h"

#include <algorithm>
#include <unordered_set>

namespace Tabula {
namespace Runtime {

namespace {

using FigurePtr = std::shared_ptr<Figure>;
using TracePtr = std::shared_ptr<Trace>;
using DictPtr = std::shared_ptr<DictValue>;

struct ExpressKind {
    const char* traceType;
    const char* mode;
};

const std::unordered_set<std::string>& figureMethods() {
    static const std::unordered_set<std::string> names = {
        "update_layout", "add_trace", "update_traces", "update_xaxes", "update_yaxes", "show"
    };
    return names;
}

std::optional<ExpressKind> expressKind(const std::string& name) {
    if (name == "bar") return ExpressKind{"bar", ""};
    if (name == "line") return ExpressKind{"scatter", "lines"};
    if (name == "scatter") return ExpressKind{"scatter", "markers"};
    if (name == "pie") return ExpressKind{"pie", ""};
    if (name == "histogram") return ExpressKind{"histogram", ""};
    if (name == "box") return ExpressKind{"box", ""};
    if (name == "area") return ExpressKind{"scatter", "lines"};
    return std::nullopt;
}

std::vector<Scalar> cellsOf(const Column& col, const std::vector<size_t>& rows) {
    std::vector<Scalar> out;
    out.reserve(rows.size());
    for (size_t r : rows) out.push_back(col.at(r));
    return out;
}

std::vector<Scalar> scalarsOf(const Value& v, const std::string& context) {
    if (v.isSeries()) {
        const Column& col = v.series().values;
        std::vector<Scalar> out;
        for (size_t r = 0; r < col.size(); ++r) out.push_back(col.at(r));
        return out;
    }
    std::vector<Scalar> out;
    for (const auto& item : iterate(v)) out.push_back(requireScalar(item, context));
    return out;
}

std::string layoutText(const Value& v) {
    if (v.is<std::string>()) return v.as<std::string>();
    return repr(v);
}

// Column reference of a px call: a column name, or a sequence with one entry per row.
class ExpressData {
public:
    ExpressData(const Value* frame, const std::string& function) : function_(function) {
        if (frame == nullptr || frame->isNone()) return;
        if (frame->isFrame()) {
            frame_ = frame->frame();
        } else if (frame->isSeries()) {
            const Series& s = frame->series();
            frame_.index = s.index;
            Column values = s.values;
            if (values.name.empty()) values.name = "value";
            frame_.columns.push_back(std::move(values));
            seriesInput_ = true;
        } else if (frame->is<DictPtr>()) {
            CallArgs build;
            build.positional.push_back(*frame);
            frame_ = pandasFunction("DataFrame", build).frame();
        } else {
            throw ScriptError("ValueError", function + "() data_frame must be a DataFrame, got " + typeName(*frame));
        }
        present_ = true;
    }

    size_t rows() const { return present_ ? frame_.rows() : rows_; }
    bool seriesInput() const noexcept { return seriesInput_; }
    const DataFrame& frame() const noexcept { return frame_; }

    std::optional<Column> column(const Value* ref, const std::string& argument) {
        if (ref == nullptr || ref->isNone()) return std::nullopt;
        if (ref->is<std::string>()) {
            const std::string& name = ref->as<std::string>();
            if (!present_ || frame_.findColumn(name) < 0) {
                std::vector<std::string> quoted;
                for (const auto& n : frame_.columnNames()) quoted.push_back("'" + n + "'");
                throw ScriptError("ValueError", "Value of '" + argument + "' is not the name of a column in 'data_frame'. "
                                                "Expected one of [" + CommonUtils::join(quoted, ", ") + "] but received: " + name);
            }
            return frame_.column(name);
        }
        Column col = Column::fromScalars(argument, scalarsOf(*ref, function_));
        if (present_ && col.size() != frame_.rows()) {
            throw ScriptError("ValueError", "All arguments should have the same length. The length of argument '" +
                                                argument + "' is " + std::to_string(col.size()) +
                                                ", whereas the length of previously-processed arguments is " +
                                                std::to_string(frame_.rows()));
        }
        if (!present_) rows_ = std::max(rows_, col.size());
        return col;
    }

    Column indexLabels() const {
        std::vector<Scalar> labels;
        for (size_t r = 0; r < rows(); ++r) {
            labels.push_back(present_ && !frame_.index.isRange() ? frame_.index.labelAt(r) : Scalar(static_cast<int64_t>(r)));
        }
        return labels.empty() ? Column("index", ColumnType::INTEGER, 0) : Column::fromScalars("index", labels);
    }

private:
    std::string function_;
    DataFrame frame_;
    bool present_ = false;
    bool seriesInput_ = false;
    size_t rows_ = 0;
};

Trace expressTrace(const ExpressKind& kind, const std::string& function, const std::string& name,
                   const std::optional<Column>& x, const std::optional<Column>& y, const std::vector<size_t>& rows) {
    Trace trace;
    trace.type = kind.traceType;
    trace.mode = kind.mode;
    trace.name = name;
    if (function == "area") trace.attributes["fill"] = "tozeroy";
    if (x) trace.x = cellsOf(*x, rows);
    if (y) trace.y = cellsOf(*y, rows);
    return trace;
}

Value expressFigure(const std::string& function, const CallArgs& args) {
    const ExpressKind kind = *expressKind(function);
    ExpressData data(args.get(0, "data_frame"), function);
    auto figure = std::make_shared<Figure>();

    if (const Value* title = args.keyword("title")) figure->title = layoutText(*title);
    if (const Value* labels = args.keyword("labels")) {
        if (const auto* dict = labels->ptr<DictPtr>()) {
            for (const auto& [k, v] : (*dict)->items) figure->layout["labels." + str(k)] = layoutText(v);
        }
    }
    for (const char* key : {"barmode", "template", "height", "width"}) {
        if (const Value* v = args.keyword(key)) figure->layout[key] = layoutText(*v);
    }

    if (function == "pie") {
        std::optional<Column> names = data.column(args.get(1, "names"), "names");
        std::optional<Column> values = data.column(args.get(2, "values"), "values");
        if (!names && data.seriesInput()) names = data.indexLabels();
        if (!values && data.seriesInput()) values = data.frame().columns.front();
        Trace trace;
        trace.type = "pie";
        std::vector<size_t> rows(data.rows());
        for (size_t r = 0; r < rows.size(); ++r) rows[r] = r;
        if (names) trace.labels = cellsOf(*names, rows);
        if (values) trace.values = cellsOf(*values, rows);
        if (const Value* hole = args.keyword("hole")) trace.attributes["hole"] = str(*hole);
        figure->data.push_back(std::move(trace));
        return Value(figure);
    }

    std::optional<Column> x = data.column(args.get(1, "x"), "x");
    std::optional<Column> y = data.column(args.get(2, "y"), "y");
    if (data.seriesInput() && !x && !y) {
        x = data.indexLabels();
        y = data.frame().columns.front();
    }
    if (!x && y && function != "box" && function != "histogram") x = data.indexLabels();
    const std::optional<Column> color = data.column(args.keyword("color"), "color");

    std::vector<size_t> all(data.rows());
    for (size_t r = 0; r < all.size(); ++r) all[r] = r;
    if (!color) {
        figure->data.push_back(expressTrace(kind, function, "", x, y, all));
    } else {
        const FrameOps::Groups groups = FrameOps::groupRows({&*color}, false, false);
        for (size_t g = 0; g < groups.members.size(); ++g) {
            const std::string name = str(fromScalar(groups.keys.labelAt(g)));
            figure->data.push_back(expressTrace(kind, function, name, x, y, groups.members[g]));
        }
    }
    for (auto& trace : figure->data) {
        if (const Value* orientation = args.keyword("orientation")) trace.attributes["orientation"] = layoutText(*orientation);
        if (const Value* nbins = args.keyword("nbins")) trace.attributes["nbinsx"] = str(*nbins);
        if (const Value* markers = args.keyword("markers")) {
            if (truthy(*markers) && trace.mode == "lines") trace.mode = "lines+markers";
        }
    }
    return Value(figure);
}

void setTraceField(Trace& trace, const std::string& key, const Value& v) {
    if (key == "x") trace.x = scalarsOf(v, key);
    else if (key == "y") trace.y = scalarsOf(v, key);
    else if (key == "labels") trace.labels = scalarsOf(v, key);
    else if (key == "values") trace.values = scalarsOf(v, key);
    else if (key == "name") trace.name = str(v);
    else if (key == "mode") trace.mode = layoutText(v);
    else trace.attributes[key] = layoutText(v);
}

void updateLayout(Figure& figure, const std::string& prefix, const CallArgs& args) {
    for (const auto& arg : args.positional) {
        const auto* dict = arg.ptr<DictPtr>();
        if (dict == nullptr) throw ScriptError("ValueError", "layout updates must be given as a dict or keyword arguments");
        CallArgs nested;
        for (const auto& [k, v] : (*dict)->items) nested.keywords.emplace_back(toText(k, "layout key"), v);
        updateLayout(figure, prefix, nested);
    }
    for (const auto& [key, v] : args.keywords) {
        if (prefix.empty() && (key == "title" || key == "title_text")) {
            if (const auto* dict = v.ptr<DictPtr>()) {
                if (const Value* text = (*dict)->find(Value("text"))) figure.title = layoutText(*text);
            } else {
                figure.title = layoutText(v);
            }
            continue;
        }
        figure.layout[prefix + key] = layoutText(v);
    }
}

Trace traceFrom(const Value& v) {
    if (const auto* trace = v.ptr<TracePtr>()) return **trace;
    throw ScriptError("ValueError", "Invalid element(s) received for the 'data' property: expected a trace, got " + typeName(v));
}

} // namespace

bool plotExpressHas(const std::string& name) {
    return expressKind(name).has_value();
}

Value plotExpress(const std::string& name, const CallArgs& args) {
    if (!plotExpressHas(name)) throw ScriptError("AttributeError", "module 'plotly.express' has no attribute '" + name + "'");
    return expressFigure(name, args);
}

bool graphObjectsHas(const std::string& name) {
    static const std::unordered_set<std::string> names = {"Figure", "Bar", "Scatter", "Pie", "Histogram", "Box"};
    return names.count(name) != 0;
}

Value graphObjects(const std::string& name, const CallArgs& args) {
    if (name == "Figure") {
        auto figure = std::make_shared<Figure>();
        if (const Value* data = args.get(0, "data")) {
            if (data->is<TracePtr>()) figure->data.push_back(traceFrom(*data));
            else if (!data->isNone()) {
                for (const auto& item : iterate(*data)) figure->data.push_back(traceFrom(item));
            }
        }
        if (const Value* layout = args.get(1, "layout")) {
            if (!layout->isNone()) {
                CallArgs nested;
                nested.positional.push_back(*layout);
                updateLayout(*figure, "", nested);
            }
        }
        return Value(figure);
    }
    if (!graphObjectsHas(name)) {
        throw ScriptError("AttributeError", "module 'plotly.graph_objects' has no attribute '" + name + "'");
    }
    auto trace = std::make_shared<Trace>();
    trace->type = CommonUtils::toLower(name);
    for (const auto& [key, v] : args.keywords) setTraceField(*trace, key, v);
    return Value(trace);
}

std::optional<Value> figureAttribute(const Value& self, const std::string& name) {
    if (const auto* trace = self.ptr<TracePtr>()) {
        const Trace& t = **trace;
        auto list = [](const std::vector<Scalar>& cells) {
            std::vector<Value> items;
            for (const auto& c : cells) items.push_back(fromScalar(c));
            return makeTuple(std::move(items));
        };
        if (name == "x") return list(t.x);
        if (name == "y") return list(t.y);
        if (name == "labels") return list(t.labels);
        if (name == "values") return list(t.values);
        if (name == "name") return t.name.empty() ? Value() : Value(t.name);
        if (name == "type") return Value(t.type);
        if (name == "mode") return t.mode.empty() ? Value() : Value(t.mode);
        return std::nullopt;
    }
    const Figure& figure = *self.as<FigurePtr>();
    if (figureMethods().count(name) != 0) return boundMethod(self, name);
    if (name == "data") {
        std::vector<Value> traces;
        for (const auto& t : figure.data) traces.push_back(Value(std::make_shared<Trace>(t)));
        return makeTuple(std::move(traces));
    }
    if (name == "layout") {
        auto dict = std::make_shared<DictValue>();
        if (!figure.title.empty()) dict->set(Value("title"), Value(figure.title));
        for (const auto& [k, v] : figure.layout) dict->set(Value(k), Value(v));
        return Value(dict);
    }
    return std::nullopt;
}

Value callFigureMethod(const Value& self, const std::string& name, const CallArgs& args) {
    if (!self.is<FigurePtr>()) throw ScriptError("AttributeError", "'" + typeName(self) + "' object has no attribute '" + name + "'");
    Figure& figure = *self.as<FigurePtr>();
    if (name == "update_layout") {
        updateLayout(figure, "", args);
        return self;
    }
    if (name == "update_xaxes" || name == "update_yaxes") {
        updateLayout(figure, name == "update_xaxes" ? "xaxis." : "yaxis.", args);
        return self;
    }
    if (name == "add_trace") {
        figure.data.push_back(traceFrom(args.required(0, "trace", "add_trace")));
        return self;
    }
    if (name == "update_traces") {
        for (auto& trace : figure.data) {
            for (const auto& [key, v] : args.keywords) setTraceField(trace, key, v);
        }
        return self;
    }
    if (name == "show") return Value();
    throw ScriptError("AttributeError", "'Figure' object has no attribute '" + name + "'");
}

} // namespace Runtime
} // namespace Tabula
