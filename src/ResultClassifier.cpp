#include "ResultClassifier.h"

#include "FrameFormat.h"
#include "FrameOps.h"

#include <cmath>

namespace Tabula {

namespace {

std::vector<size_t> edgeRows(size_t n) {
    std::vector<size_t> rows = FrameOps::headRows(n, ResultClassifier::kEdgeRows);
    const std::vector<size_t> tail = FrameOps::tailRows(n, ResultClassifier::kEdgeRows);
    rows.insert(rows.end(), tail.begin(), tail.end());
    return rows;
}

std::string scalarText(double value) {
    if (!std::isfinite(value)) return FrameFormat::floatRepr(value);
    return FrameFormat::floatRepr(FrameOps::roundHalfEven(value, ResultClassifier::kFloatDecimals));
}

} // namespace

ClassifiedResult ResultClassifier::classify(const Value& value) {
    if (value.isNone()) return {"", "other"};

    if (value.isFrame()) {
        const DataFrame& df = value.frame();
        if (df.rows() > kTruncateAbove) {
            return {"Showing first 10 and last 10 of " + std::to_string(df.rows()) + " rows:\n" +
                        FrameFormat::frameToString(df.take(edgeRows(df.rows()))),
                    "table"};
        }
        return {FrameFormat::frameToString(df), "table"};
    }
    if (value.isSeries()) {
        const Series& s = value.series();
        if (s.size() > kTruncateAbove) {
            return {"Showing first 10 and last 10 of " + std::to_string(s.size()) + " items:\n" +
                        FrameFormat::seriesToString(s.take(edgeRows(s.size()))),
                    "series"};
        }
        return {FrameFormat::seriesToString(s), "series"};
    }
    if (const auto* b = value.ptr<bool>()) return {*b ? "True" : "False", "scalar"};
    if (const auto* i = value.ptr<int64_t>()) return {std::to_string(*i), "scalar"};
    if (const auto* d = value.ptr<double>()) return {scalarText(*d), "scalar"};
    if (value.is<std::shared_ptr<ListValue>>() || value.is<std::shared_ptr<TupleValue>>()) {
        return {repr(value), "list"};
    }
    if (const auto* fig = value.ptr<std::shared_ptr<Figure>>()) return {(*fig)->describe(), "figure"};
    return {str(value), "other"};
}

bool ResultClassifier::hasData(const std::string& typeTag) {
    return typeTag == "table" || typeTag == "series" || typeTag == "list";
}

} // namespace Tabula
