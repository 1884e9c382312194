#pragma once

#include "DataFrame.h"

#include <string>

namespace Tabula {

/**
 * @brief Locale-independent text rendering of frames, series and scalars.
 * @details Table layout follows pandas `to_string()`: index labels left-aligned,
 * values right-aligned, an index-name line when the index is named, and a
 * per-column float precision of the widest value (at most 6 decimals).
 */
namespace FrameFormat {

/**
 * @brief Shortest round-trip float text as Python's repr prints it
 * (`2.0`, `0.1`, `1e+16`, `1.5e-05`, `nan`, `inf`).
 */
std::string floatRepr(double value);

/**
 * @brief `YYYY-MM-DD` when `dateOnly`, else `YYYY-MM-DD HH:MM:SS`.
 */
std::string timestampText(Timestamp ts, bool dateOnly);

/**
 * @brief Python `str()` of a scalar (strings unquoted, None for missing).
 */
std::string scalarStr(const Scalar& value);

/**
 * @brief Python `repr()` of a scalar (strings single-quoted).
 */
std::string scalarRepr(const Scalar& value);
std::string quoteString(const std::string& text);

std::string frameToString(const DataFrame& df);
std::string seriesToString(const Series& series);

} // namespace FrameFormat
} // namespace Tabula
