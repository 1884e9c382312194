#pragma once

#include "SecurityPolicy.h"

#include <string>
#include <vector>

namespace Tabula {

struct ValidationResult {
    std::string sanitizedCode;
    std::vector<std::string> warnings;
};

/**
 * @brief Static safety gate for generated scripts.
 * @details Parses the script, walks the tree against the policy and strips
 * comments that are long or mention denied identifiers. Holds only a
 * reference to the policy, so one instance may be shared across threads.
 */
class CodeValidator {
public:
    explicit CodeValidator(const SecurityPolicy& policy);

    /**
     * @brief Validates and sanitizes `code`.
     * @post Returned warnings never cause rejection.
     * @throws Tabula::CodeValidationError with kind SyntaxError (204) when the
     * script does not parse, or SecurityViolation (401) listing every violation.
     */
    ValidationResult validate(const std::string& code) const;

    /**
     * @brief True when the comment text names a denied identifier.
     */
    bool mentionsDeniedIdentifier(const std::string& text) const;

private:
    const SecurityPolicy& policy_;
};

} // namespace Tabula
