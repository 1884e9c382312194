#pragma once

#include "Log.h"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace Tabula {

enum class SyscallFilterMode { OFF, BEST_EFFORT, STRICT };

/**
 * @brief Immutable allow/deny rules and resource limits for validation and execution.
 * @details Built once at start-up (defaults or `fromFile`) and shared by const
 * reference with the validator, executor and orchestrator.
 */
struct SecurityPolicy {
    std::set<std::string> allowedOperations;
    std::set<std::string> blockedOperations;
    std::set<std::string> blockedModules;
    std::set<std::string> allowedVariables;

    size_t maxInputLength = 1000;
    double executionTimeoutSeconds = 10.0;
    size_t maxMemoryMb = 512;

    // Name the dataset is bound to inside scripts, plus extra aliases.
    std::string datasetName = "df";
    std::vector<std::string> datasetAliases = {"data"};
    // Conventional output names searched when the script ends without an expression.
    std::vector<std::string> resultNames = {"result", "fig", "figure", "chart", "output"};

    SyscallFilterMode syscallFilter = SyscallFilterMode::BEST_EFFORT;
    size_t maxResultBytes = 64 * 1024 * 1024;
    LogLevel logLevel = LogLevel::WARN;

    /**
     * @brief Reference deployment defaults for every list and limit.
     */
    static SecurityPolicy defaults();

    /**
     * @brief Loads policy values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged policy using `base` as defaults. `key:` replaces a list,
     * `key+:` extends it.
     * @throws Tabula::ConfigurationException on parse/validation failures.
     */
    static SecurityPolicy fromFile(const std::string& configPath, const SecurityPolicy& base);

    /**
     * @brief Validates limits and list consistency.
     * @throws Tabula::ConfigurationException on invalid values.
     */
    void validate() const;

    bool isBlockedOperation(const std::string& name) const { return blockedOperations.count(name) != 0; }
    bool isBlockedModule(const std::string& name) const { return blockedModules.count(name) != 0; }
    bool isAllowedOperation(const std::string& name) const { return allowedOperations.count(name) != 0; }
    bool isAllowedVariable(const std::string& name) const { return allowedVariables.count(name) != 0; }

    /**
     * @brief Dataset name followed by its aliases.
     */
    std::vector<std::string> datasetBindings() const;

    /**
     * @brief True when the identifier is denied outright (blocked operation or module, or dunder).
     */
    bool isDeniedIdentifier(const std::string& name) const;
};

const char* syscallFilterModeName(SyscallFilterMode mode) noexcept;

} // namespace Tabula
