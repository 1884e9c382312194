#include "TabulaExceptions.h"

#include "CommonUtils.h"

#include <algorithm>
#include <sstream>

namespace Tabula {

const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::LLM_CONNECTION_ERROR: return "LLM_CONNECTION_ERROR";
        case ErrorCode::LLM_TIMEOUT: return "LLM_TIMEOUT";
        case ErrorCode::LLM_INVALID_RESPONSE: return "LLM_INVALID_RESPONSE";
        case ErrorCode::CODE_EXTRACTION_FAILED: return "CODE_EXTRACTION_FAILED";
        case ErrorCode::VALIDATION_FAILED: return "VALIDATION_FAILED";
        case ErrorCode::BLOCKED_OPERATION: return "BLOCKED_OPERATION";
        case ErrorCode::BLOCKED_MODULE: return "BLOCKED_MODULE";
        case ErrorCode::SYNTAX_ERROR: return "SYNTAX_ERROR";
        case ErrorCode::UNKNOWN_OPERATION: return "UNKNOWN_OPERATION";
        case ErrorCode::EXECUTION_FAILED: return "EXECUTION_FAILED";
        case ErrorCode::EXECUTION_TIMEOUT: return "EXECUTION_TIMEOUT";
        case ErrorCode::MEMORY_LIMIT: return "MEMORY_LIMIT";
        case ErrorCode::RUNTIME_ERROR: return "RUNTIME_ERROR";
        case ErrorCode::SECURITY_VIOLATION: return "SECURITY_VIOLATION";
        case ErrorCode::INPUT_TOO_LONG: return "INPUT_TOO_LONG";
        case ErrorCode::INJECTION_ATTEMPT: return "INJECTION_ATTEMPT";
        case ErrorCode::DATA_LOAD_ERROR: return "DATA_LOAD_ERROR";
        case ErrorCode::INVALID_COLUMN: return "INVALID_COLUMN";
        case ErrorCode::DATA_TYPE_ERROR: return "DATA_TYPE_ERROR";
        case ErrorCode::UNEXPECTED_ERROR: return "UNEXPECTED_ERROR";
    }
    return "UNEXPECTED_ERROR";
}

CodeGenerationError::CodeGenerationError(const std::string& message, ErrorCode code, std::string details)
    : TabulaError(message,
                  code,
                  std::move(details),
                  "I couldn't generate the code for your question. Please try rephrasing.") {}

namespace {
std::string joinViolations(const std::vector<Violation>& violations) {
    std::vector<std::string> parts;
    parts.reserve(violations.size());
    for (const auto& v : violations) parts.push_back(v.type + ": " + v.item);
    return CommonUtils::join(parts, ", ");
}

int violationPriority(const std::string& type) {
    if (type == "import") return 0;
    if (type == "lambda") return 1;
    return 2;
}

std::string buildValidationUserMessage(ValidationKind kind,
                                       const std::string& message,
                                       const std::vector<Violation>& violations,
                                       const std::string& primaryType,
                                       const std::vector<std::string>& primaryItems) {
    if (kind == ValidationKind::SyntaxError) {
        return "Syntax error in generated code: " + message +
               ". The generated code is not valid. Please try rephrasing your question.";
    }
    if (violations.empty()) {
        return "The generated code contains unsafe operations. Please try a different question.";
    }
    if (primaryType == "lambda") {
        return "Lambda functions are not supported. Please try a different query.";
    }
    if (primaryType == "import") {
        return "Import statements are not allowed (attempted: " + CommonUtils::join(primaryItems, ", ") +
               "). All libraries (px, go, pd, np, df) are already imported. Please rephrase your question.";
    }
    std::vector<std::string> shown(primaryItems.begin(),
                                   primaryItems.begin() + static_cast<std::ptrdiff_t>(std::min<size_t>(2, primaryItems.size())));
    return "Security block: " + CommonUtils::join(shown, ", ") + ". Please try rephrasing your question.";
}
} // namespace

CodeValidationError::CodeValidationError(ValidationKind kind,
                                         const std::string& message,
                                         std::vector<Violation> violations)
    : TabulaError(message,
                  kind == ValidationKind::SyntaxError ? ErrorCode::SYNTAX_ERROR : ErrorCode::SECURITY_VIOLATION,
                  joinViolations(violations),
                  std::string()),
      kind_(kind),
      violations_(std::move(violations)) {
    const std::string primary = violationType();
    setUserMessage(buildValidationUserMessage(kind_, message, violations_, primary, itemsOfType(primary)));
}

std::string CodeValidationError::violationType() const {
    if (violations_.empty()) return std::string();
    const Violation* best = &violations_.front();
    for (const auto& v : violations_) {
        if (violationPriority(v.type) < violationPriority(best->type)) best = &v;
    }
    return best->type;
}

std::vector<std::string> CodeValidationError::itemsOfType(const std::string& type) const {
    std::vector<std::string> out;
    for (const auto& v : violations_) {
        if (v.type != type) continue;
        if (std::find(out.begin(), out.end(), v.item) == out.end()) out.push_back(v.item);
    }
    return out;
}

CodeExecutionError::CodeExecutionError(const std::string& message, std::string originalError, ErrorCode code)
    : TabulaError(message,
                  code,
                  std::move(originalError),
                  "There was an error executing the analysis. Please try a different question.") {}

namespace {
std::string formatSeconds(double seconds) {
    std::ostringstream out;
    out << seconds;
    return out.str();
}
} // namespace

ExecutionTimeoutError::ExecutionTimeoutError(double timeoutSeconds)
    : CodeExecutionError("Code execution timed out after " + formatSeconds(timeoutSeconds) + " seconds",
                         std::string(),
                         ErrorCode::EXECUTION_TIMEOUT) {
    setUserMessage("The query took too long. Please try a simpler question.");
}

MemoryLimitError::MemoryLimitError(size_t limitMb)
    : CodeExecutionError("Code execution exceeded the memory limit of " + std::to_string(limitMb) + " MB",
                         std::string(),
                         ErrorCode::MEMORY_LIMIT) {
    setUserMessage("The query needed too much memory. Please try a narrower question.");
}

DataLoadError::DataLoadError(const std::string& message, const std::string& filePath)
    : TabulaError(message,
                  ErrorCode::DATA_LOAD_ERROR,
                  "File: " + filePath,
                  "Could not load the data file. Please check if it exists.") {}

InputValidationError::InputValidationError(const std::string& message, ErrorCode code)
    : TabulaError(message, code, std::string(), message) {}

} // namespace Tabula
