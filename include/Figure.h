#pragma once

#include "DataFrame.h"

#include <map>
#include <string>
#include <vector>

namespace Tabula {

/**
 * @brief One data series of a chart (bar, scatter, line, pie, histogram, box, area).
 * @details Cartesian traces use x/y; pie traces use labels/values.
 */
struct Trace {
    std::string type = "scatter";
    std::string name;
    std::string mode;
    std::vector<Scalar> x;
    std::vector<Scalar> y;
    std::vector<Scalar> labels;
    std::vector<Scalar> values;
    std::map<std::string, std::string> attributes;

    size_t pointCount() const noexcept;
};

struct Figure {
    std::vector<Trace> data;
    std::string title;
    std::map<std::string, std::string> layout;

    /**
     * @brief Short display form: `Figure: <title> (<k> data series)`.
     */
    std::string describe() const;
};

} // namespace Tabula
