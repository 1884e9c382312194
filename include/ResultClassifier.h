#pragma once

#include "ScriptValue.h"

#include <string>

namespace Tabula {

struct ClassifiedResult {
    std::string displayText;
    std::string typeTag; // table | series | scalar | list | figure | other
};

/**
 * @brief Maps a script result to display text and a type tag.
 * @details Pure function of the value: no locale, clock or global state.
 */
class ResultClassifier {
public:
    // Results longer than this are shown as their first and last kEdgeRows rows.
    static constexpr size_t kTruncateAbove = 20;
    static constexpr size_t kEdgeRows = 10;
    static constexpr int kFloatDecimals = 4;

    static ClassifiedResult classify(const Value& value);

    static bool hasData(const std::string& typeTag);
};

} // namespace Tabula
