#ifndef TABULA_EXCEPTIONS_H
#define TABULA_EXCEPTIONS_H

#include <stdexcept>
#include <string>
#include <vector>

namespace Tabula {

class TabulaException : public std::runtime_error {
public:
    explicit TabulaException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public TabulaException {
public:
    explicit IOException(const std::string& message) : TabulaException("IO Error: " + message) {}
};

class DatasetException : public TabulaException {
public:
    explicit DatasetException(const std::string& message) : TabulaException("Dataset Error: " + message) {}
};

class ConfigurationException : public TabulaException {
public:
    explicit ConfigurationException(const std::string& message) : TabulaException("Configuration Error: " + message) {}
};

/**
 * @brief Raised by the script runtime. The category mirrors the familiar
 * Python exception names so generated code gets recognisable feedback.
 */
class ScriptError : public TabulaException {
public:
    ScriptError(std::string category, const std::string& message)
        : TabulaException(category + ": " + message), category_(std::move(category)), message_(message) {}

    const std::string& category() const noexcept { return category_; }
    const std::string& message() const noexcept { return message_; }

private:
    std::string category_;
    std::string message_;
};

/**
 * @brief Lexer/parser rejection of candidate code, with a 1-based position.
 */
class ScriptSyntaxError : public TabulaException {
public:
    ScriptSyntaxError(const std::string& message, int line, int column)
        : TabulaException(message + " (line " + std::to_string(line) + ", column " + std::to_string(column) + ")"),
          message_(message),
          line_(line),
          column_(column) {}

    const std::string& message() const noexcept { return message_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }

private:
    std::string message_;
    int line_;
    int column_;
};

enum class ErrorCode {
    // Code generation (1xx)
    LLM_CONNECTION_ERROR = 101,
    LLM_TIMEOUT = 102,
    LLM_INVALID_RESPONSE = 103,
    CODE_EXTRACTION_FAILED = 104,

    // Validation (2xx)
    VALIDATION_FAILED = 201,
    BLOCKED_OPERATION = 202,
    BLOCKED_MODULE = 203,
    SYNTAX_ERROR = 204,
    UNKNOWN_OPERATION = 205,

    // Execution (3xx)
    EXECUTION_FAILED = 301,
    EXECUTION_TIMEOUT = 302,
    MEMORY_LIMIT = 303,
    RUNTIME_ERROR = 304,

    // Security (4xx)
    SECURITY_VIOLATION = 401,
    INPUT_TOO_LONG = 402,
    INJECTION_ATTEMPT = 403,

    // Data (5xx)
    DATA_LOAD_ERROR = 501,
    INVALID_COLUMN = 502,
    DATA_TYPE_ERROR = 503,

    UNEXPECTED_ERROR = 900
};

const char* errorCodeName(ErrorCode code) noexcept;

/**
 * @brief Base of every failure that can reach a caller.
 * @details what() is the internal diagnostic (logged only); userMessage() is
 * always safe to display.
 */
class TabulaError : public TabulaException {
public:
    TabulaError(const std::string& message, ErrorCode code, std::string details, std::string userMessage)
        : TabulaException(message),
          code_(code),
          details_(std::move(details)),
          userMessage_(userMessage.empty() ? message : std::move(userMessage)) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& details() const noexcept { return details_; }
    const std::string& userMessage() const noexcept { return userMessage_; }

protected:
    void setUserMessage(std::string message) { userMessage_ = std::move(message); }

private:
    ErrorCode code_;
    std::string details_;
    std::string userMessage_;
};

class CodeGenerationError : public TabulaError {
public:
    explicit CodeGenerationError(const std::string& message,
                                 ErrorCode code = ErrorCode::LLM_INVALID_RESPONSE,
                                 std::string details = {});
};

enum class ValidationKind { SyntaxError, SecurityViolation };

struct Violation {
    std::string type; // "import" | "operation" | "lambda"
    std::string item;
};

class CodeValidationError : public TabulaError {
public:
    CodeValidationError(ValidationKind kind, const std::string& message, std::vector<Violation> violations = {});

    ValidationKind kind() const noexcept { return kind_; }
    const std::vector<Violation>& violations() const noexcept { return violations_; }

    /**
     * @brief Highest-priority violation type present (import > lambda > operation),
     * empty for syntax errors.
     */
    std::string violationType() const;

    /**
     * @brief Distinct items of the given violation type in first-seen order.
     */
    std::vector<std::string> itemsOfType(const std::string& type) const;

private:
    ValidationKind kind_;
    std::vector<Violation> violations_;
};

class CodeExecutionError : public TabulaError {
public:
    explicit CodeExecutionError(const std::string& message,
                                std::string originalError = {},
                                ErrorCode code = ErrorCode::EXECUTION_FAILED);
};

class ExecutionTimeoutError : public CodeExecutionError {
public:
    explicit ExecutionTimeoutError(double timeoutSeconds);
};

class MemoryLimitError : public CodeExecutionError {
public:
    explicit MemoryLimitError(size_t limitMb);
};

class DataLoadError : public TabulaError {
public:
    DataLoadError(const std::string& message, const std::string& filePath);
};

class InputValidationError : public TabulaError {
public:
    explicit InputValidationError(const std::string& message, ErrorCode code = ErrorCode::INPUT_TOO_LONG);
};

} // namespace Tabula

#endif // TABULA_EXCEPTIONS_H
