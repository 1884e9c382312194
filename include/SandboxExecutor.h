#pragma once

#include "DataFrame.h"
#include "ScriptValue.h"
#include "SecurityPolicy.h"
#include "TabulaExceptions.h"

#include <optional>
#include <string>

namespace Tabula {

struct ExecutionResult {
    bool success = false;
    std::optional<Value> result;
    std::optional<std::string> error;
    std::optional<ErrorCode> errorCode;
    double executionTimeMs = 0.0;
};

/**
 * @brief Runs validated scripts in a forked, resource-bounded worker process.
 * @details Each call forks one worker. The worker drops every inherited
 * descriptor except the result pipe, starts a new session, applies rlimits
 * (address space, CPU, file size, descriptors, processes, core dumps), sets
 * NO_NEW_PRIVS and installs the syscall filter before interpreting anything.
 * The parent enforces the wall-clock deadline and kills the whole process
 * group on expiry. Stateless apart from the policy reference, so concurrent
 * calls from several threads are safe.
 */
class SandboxExecutor {
public:
    explicit SandboxExecutor(const SecurityPolicy& policy);

    /**
     * @brief Executes `sanitizedCode` against a private copy of `dataset`.
     * @pre `sanitizedCode` passed CodeValidator.
     * @post Returns within the policy timeout plus a bounded teardown. `result`
     * is set iff `success`; on failure `error` and `errorCode` are set
     * (EXECUTION_TIMEOUT, MEMORY_LIMIT, EXECUTION_FAILED or RUNTIME_ERROR).
     */
    ExecutionResult execute(const std::string& sanitizedCode, const DataFrame& dataset) const;

    /**
     * @brief Strips host paths, hex addresses and trace lines from an error message.
     */
    static std::string scrubErrorMessage(const std::string& message);

private:
    const SecurityPolicy& policy_;

    [[noreturn]] void runWorker(int resultFd, const std::string& code, const DataFrame& dataset) const;
};

} // namespace Tabula
