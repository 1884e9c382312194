#pragma once

#include "CodeValidator.h"
#include "DataManager.h"
#include "SandboxExecutor.h"
#include "ScriptValue.h"
#include "SecurityPolicy.h"
#include "TabulaExceptions.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace Tabula {

struct GenerationResult {
    bool success = false;
    std::string code;
    double generationTimeMs = 0.0;
    std::string error;
};

/**
 * @brief Turns a question plus schema text into a candidate script.
 * @details Implemented by the caller (typically an LLM client). May throw
 * CodeGenerationError; any other exception is reported as UNEXPECTED_ERROR.
 */
class CodeGenerator {
public:
    virtual ~CodeGenerator() = default;
    virtual GenerationResult generate(const std::string& question, const std::string& schema) = 0;
    virtual bool checkConnection() { return true; }
};

/**
 * @brief Writes the natural-language answer from the classified result text.
 */
class ResponseGenerator {
public:
    virtual ~ResponseGenerator() = default;
    virtual std::string generateResponse(const std::string& question,
                                         const std::string& displayText,
                                         const std::string& code) = 0;
};

struct QueryResult {
    bool success = false;
    std::string question;
    std::string answer;
    std::optional<Value> data;
    std::string dataType = "none";
    std::string displayText;
    std::string code;
    double executionTimeMs = 0.0;
    double generationTimeMs = 0.0;
    double totalTimeMs = 0.0;
    std::optional<std::string> error;
    std::optional<ErrorCode> errorCode;
    std::vector<std::string> warnings;
    std::string violationType;
    std::vector<std::string> violations;

    bool hasData() const { return data.has_value() && dataType != "none"; }
    bool hasVisualization() const { return dataType == "figure"; }
};

struct SystemStatus {
    bool dataLoaded = false;
    bool generatorConnected = false;
    bool ready = false;
};

/**
 * @brief Sequences input check, generation, validation, sandboxed execution,
 * classification and summarization for one question.
 * @details Every stage failure becomes a terminal QueryResult with
 * success=false; nothing is retried. Holds references only, so one instance
 * may serve concurrent queries as long as the collaborators are thread-safe.
 */
class QueryProcessor {
public:
    QueryProcessor(const SecurityPolicy& policy,
                   DataManager& dataManager,
                   CodeGenerator* generator = nullptr,
                   ResponseGenerator* responder = nullptr);

    /**
     * @brief Full pipeline for a user question.
     * @post Never throws; failures carry an errorCode and a user-safe error.
     */
    QueryResult processQuestion(const std::string& question) const;

    /**
     * @brief Validate, execute, classify and summarize already generated code.
     * @post Never throws. At most one sandboxed execution.
     */
    QueryResult runCandidate(const std::string& code,
                             double generationTimeMs,
                             const std::string& question) const;

    SystemStatus checkSystem() const;

    /**
     * @brief Length and injection-pattern check on a question; returns it trimmed.
     * @throws Tabula::InputValidationError (INPUT_TOO_LONG or INJECTION_ATTEMPT).
     */
    static std::string checkInput(const std::string& question, size_t maxLength);

private:
    using Clock = std::chrono::steady_clock;

    const SecurityPolicy& policy_;
    DataManager& dataManager_;
    CodeGenerator* generator_;
    ResponseGenerator* responder_;
    CodeValidator validator_;
    SandboxExecutor executor_;

    QueryResult runStages(const std::string& code,
                          double generationTimeMs,
                          const std::string& question,
                          Clock::time_point start) const;
    std::string summarize(const std::string& question, const std::string& displayText, const std::string& code) const;
    QueryResult failure(const std::string& question,
                        const std::string& error,
                        ErrorCode code,
                        Clock::time_point start) const;
};

} // namespace Tabula
