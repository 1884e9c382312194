#include "Figure.h"

#include <algorithm>

namespace Tabula {

size_t Trace::pointCount() const noexcept {
    if (type == "pie") return std::max(labels.size(), values.size());
    return std::max(x.size(), y.size());
}

std::string Figure::describe() const {
    const std::string shownTitle = title.empty() ? "Untitled" : title;
    return "Figure: " + shownTitle + " (" + std::to_string(data.size()) + " data series)";
}

} // namespace Tabula
