#pragma once

#include "ScriptValue.h"

#include <string>

namespace Tabula {

/**
 * @brief Worker outcome as shipped from the sandbox process to the parent.
 */
struct WorkerReply {
    bool ok = false;
    Value value;
    std::string category;
    std::string message;
    // Set when a sandbox layer could not be applied in best-effort mode.
    std::string note;
};

/**
 * @brief JSON wire format for script results crossing the process boundary.
 * @details Plain JSON extended with the `NaN`, `Infinity` and `-Infinity`
 * number tokens. Integers are written without a fraction and floats always
 * with one, so `2` and `2.0` survive the trip as different types. Frames,
 * series, figures and the non-list containers are objects tagged with `"$t"`.
 * Callables, modules and accessors are sent as their repr text.
 */
namespace ResultCodec {

std::string encodeValue(const Value& value);

/**
 * @throws Tabula::CodeExecutionError when the text is not a well-formed payload.
 */
Value decodeValue(const std::string& text);

std::string encodeSuccess(const Value& value, const std::string& note = {});
std::string encodeFailure(const std::string& category, const std::string& message, const std::string& note = {});

/**
 * @throws Tabula::CodeExecutionError when the reply is malformed.
 */
WorkerReply decodeReply(const std::string& text);

} // namespace ResultCodec
} // namespace Tabula
