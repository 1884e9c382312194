#pragma once

#include "ScriptLexer.h"

#include <functional>
#include <string>
#include <vector>

/**
 * @brief Text-level cleanup of generated code.
 * @details preClean() and stripComments() run inside validation;
 * extractFromResponse() is offered to CodeGenerator implementations that
 * receive free-form model output.
 */
namespace CodeSanitizer {

/**
 * @brief Removes display artifacts that would break parsing: markdown fences,
 * a leading `CODE:` marker, and prose lines (starting with "here", "this",
 * "the ", "to ", "i ") that carry no code punctuation.
 */
std::string preClean(const std::string& code);

/**
 * @brief Removes comments that are long (full-line >= 50 chars, trailing >= 30
 * chars) or for which `mentionsDenied` is true, using lexer comment spans.
 */
std::string stripComments(const std::string& code,
                          const std::vector<Tabula::CommentSpan>& comments,
                          const std::function<bool(const std::string&)>& mentionsDenied);

/**
 * @brief Pulls code out of a raw generator response: the first fenced block,
 * otherwise the code-like lines, otherwise the whole text; then cleanCode().
 */
std::string extractFromResponse(const std::string& response);

/**
 * @brief Normalizes extracted code: strips fences and `CODE:`, unwraps
 * `print(...)` calls and drops long explanatory comments.
 */
std::string cleanCode(const std::string& code);

} // namespace CodeSanitizer
