#include "QueryProcessor.h"

#include "CommonUtils.h"
#include "Log.h"
#include "ResultClassifier.h"

#include <regex>

namespace Tabula {

namespace {
constexpr size_t kLoggedQuestionChars = 100;
const char* const kUnexpectedMessage = "An unexpected error occurred. Please try again.";
const char* const kGenerationFailedMessage = "Could not generate analysis code";

double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

void logCompletion(const std::string& question, bool success, double durationMs) {
    Log::info("Query", "Query completed" + LogFields()
                                               .add("question", question.substr(0, kLoggedQuestionChars))
                                               .add("success", success ? "true" : "false")
                                               .add("duration_ms", durationMs)
                                               .str());
}
} // namespace

QueryProcessor::QueryProcessor(const SecurityPolicy& policy,
                               DataManager& dataManager,
                               CodeGenerator* generator,
                               ResponseGenerator* responder)
    : policy_(policy),
      dataManager_(dataManager),
      generator_(generator),
      responder_(responder),
      validator_(policy),
      executor_(policy) {}

std::string QueryProcessor::checkInput(const std::string& question, size_t maxLength) {
    static const std::vector<std::regex> kInjectionPatterns = {
        std::regex(R"(__\w+__)", std::regex::icase),
        std::regex(R"(import\s+\w+)", std::regex::icase),
        std::regex(R"(exec\s*\()", std::regex::icase),
        std::regex(R"(eval\s*\()", std::regex::icase),
        std::regex(R"(open\s*\()", std::regex::icase),
        std::regex(R"(os\.\w+)", std::regex::icase),
        std::regex(R"(sys\.\w+)", std::regex::icase),
    };

    if (question.size() > maxLength) {
        throw InputValidationError("Input too long. Maximum " + std::to_string(maxLength) + " characters allowed.",
                                   ErrorCode::INPUT_TOO_LONG);
    }
    std::string text = CommonUtils::trim(question);
    for (const auto& pattern : kInjectionPatterns) {
        if (std::regex_search(text, pattern)) {
            throw InputValidationError("Input contains potentially unsafe patterns.", ErrorCode::INJECTION_ATTEMPT);
        }
    }
    return text;
}

QueryResult QueryProcessor::failure(const std::string& question,
                                    const std::string& error,
                                    ErrorCode code,
                                    Clock::time_point start) const {
    QueryResult out;
    out.success = false;
    out.question = question;
    out.answer = "Error: " + error;
    out.error = error;
    out.errorCode = code;
    out.totalTimeMs = elapsedMs(start);
    logCompletion(question, false, out.totalTimeMs);
    return out;
}

std::string QueryProcessor::summarize(const std::string& question,
                                      const std::string& displayText,
                                      const std::string& code) const {
    if (!responder_) return displayText;
    try {
        return responder_->generateResponse(question, displayText, code);
    } catch (const std::exception& e) {
        Log::warn("Query", "Response generation failed" + LogFields().add("error", e.what()).str());
        return "Here are the results:\n\n" + displayText;
    }
}

QueryResult QueryProcessor::runStages(const std::string& code,
                                      double generationTimeMs,
                                      const std::string& question,
                                      Clock::time_point start) const {
    if (code.size() > policy_.maxInputLength) {
        QueryResult out = failure(question,
                                  "Input too long. Maximum " + std::to_string(policy_.maxInputLength) +
                                      " characters allowed.",
                                  ErrorCode::INPUT_TOO_LONG,
                                  start);
        out.generationTimeMs = generationTimeMs;
        return out;
    }

    ValidationResult validated;
    try {
        validated = validator_.validate(code);
    } catch (const CodeValidationError& e) {
        Log::info("Query", std::string("Validation rejected candidate: ") + e.what());
        QueryResult out = failure(question, e.userMessage(), e.code(), start);
        out.generationTimeMs = generationTimeMs;
        out.violationType = e.violationType();
        for (const Violation& v : e.violations()) out.violations.push_back(v.type + ": " + v.item);
        return out;
    }

    const std::shared_ptr<const DataFrame> dataset = dataManager_.frame();
    const ExecutionResult executed = executor_.execute(validated.sanitizedCode, *dataset);
    if (!executed.success) {
        QueryResult out = failure(question,
                                  executed.error.value_or("Execution failed"),
                                  executed.errorCode.value_or(ErrorCode::EXECUTION_FAILED),
                                  start);
        out.code = code;
        out.generationTimeMs = generationTimeMs;
        out.executionTimeMs = executed.executionTimeMs;
        out.warnings = validated.warnings;
        return out;
    }

    const Value resultValue = executed.result.value_or(Value{});
    const ClassifiedResult classified = ResultClassifier::classify(resultValue);

    QueryResult out;
    out.success = true;
    out.question = question;
    out.answer = summarize(question, classified.displayText, code);
    if (!resultValue.isNone()) out.data = resultValue;
    out.dataType = classified.typeTag;
    out.displayText = classified.displayText;
    out.code = code;
    out.executionTimeMs = executed.executionTimeMs;
    out.generationTimeMs = generationTimeMs;
    out.warnings = validated.warnings;
    out.totalTimeMs = elapsedMs(start);
    logCompletion(question, true, out.totalTimeMs);
    return out;
}

QueryResult QueryProcessor::runCandidate(const std::string& code,
                                         double generationTimeMs,
                                         const std::string& question) const {
    const Clock::time_point start = Clock::now();
    try {
        return runStages(code, generationTimeMs, question, start);
    } catch (const TabulaError& e) {
        Log::warn("Query", std::string("Query failed: ") + e.what() + LogFields().add("code", errorCodeName(e.code())).str());
        return failure(question, e.userMessage(), e.code(), start);
    } catch (const std::exception& e) {
        Log::error("Query", std::string("Unexpected error processing question: ") + e.what());
        return failure(question, kUnexpectedMessage, ErrorCode::UNEXPECTED_ERROR, start);
    }
}

QueryResult QueryProcessor::processQuestion(const std::string& question) const {
    const Clock::time_point start = Clock::now();
    Log::info("Query", "Processing question" + LogFields().add("question", question.substr(0, kLoggedQuestionChars)).str());

    std::string checked = question;
    try {
        checked = checkInput(question, policy_.maxInputLength);
        dataManager_.frame();
        const std::string schema = dataManager_.schema();

        if (!generator_) {
            return failure(checked, kGenerationFailedMessage, ErrorCode::LLM_CONNECTION_ERROR, start);
        }
        const GenerationResult generated = generator_->generate(checked, schema);
        if (!generated.success) {
            Log::warn("Query", "Code generation failed" + LogFields().add("error", generated.error).str());
            QueryResult out = failure(checked, kGenerationFailedMessage, ErrorCode::LLM_INVALID_RESPONSE, start);
            out.generationTimeMs = generated.generationTimeMs;
            return out;
        }

        return runStages(generated.code, generated.generationTimeMs, checked, start);
    } catch (const TabulaError& e) {
        Log::warn("Query", std::string("Query failed: ") + e.what() + LogFields().add("code", errorCodeName(e.code())).str());
        return failure(checked, e.userMessage(), e.code(), start);
    } catch (const std::exception& e) {
        Log::error("Query", std::string("Unexpected error processing question: ") + e.what());
        return failure(checked, kUnexpectedMessage, ErrorCode::UNEXPECTED_ERROR, start);
    }
}

SystemStatus QueryProcessor::checkSystem() const {
    SystemStatus status;
    try {
        dataManager_.frame();
        status.dataLoaded = true;
    } catch (const TabulaError& e) {
        Log::warn("Query", std::string("Dataset not available: ") + e.what());
    }

    if (generator_) {
        try {
            status.generatorConnected = generator_->checkConnection();
        } catch (const std::exception& e) {
            Log::warn("Query", std::string("Generator check failed: ") + e.what());
        }
    }

    status.ready = status.dataLoaded && status.generatorConnected;
    return status;
}

} // namespace Tabula
