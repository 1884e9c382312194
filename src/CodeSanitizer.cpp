#include "CodeSanitizer.h"

#include "CommonUtils.h"
#include "TabulaExceptions.h"

#include <algorithm>
#include <regex>

namespace CodeSanitizer {

namespace {
constexpr size_t kMaxFullLineComment = 50;
constexpr size_t kMaxTrailingComment = 30;

bool looksLikeProse(const std::string& trimmedLine) {
    static const char* const prefixes[] = {"here", "this", "the ", "to ", "i "};
    const std::string lower = CommonUtils::toLower(trimmedLine);
    bool prefixed = false;
    for (const char* p : prefixes) {
        if (CommonUtils::startsWith(lower, p)) {
            prefixed = true;
            break;
        }
    }
    if (!prefixed) return false;
    return trimmedLine.find_first_of("=()[]{}'\"#") == std::string::npos;
}

bool isFence(const std::string& trimmedLine) {
    return CommonUtils::startsWith(trimmedLine, "```");
}
} // namespace

std::string preClean(const std::string& code) {
    std::vector<std::string> kept;
    bool seenCode = false;
    for (std::string line : CommonUtils::splitLines(code)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const std::string trimmed = CommonUtils::trim(line);
        if (isFence(trimmed)) continue;
        if (!seenCode && !trimmed.empty() && CommonUtils::startsWith(CommonUtils::toUpper(trimmed), "CODE:")) {
            line = CommonUtils::trim(trimmed.substr(5));
            if (line.empty()) continue;
        }
        if (looksLikeProse(trimmed)) continue;
        if (!trimmed.empty()) seenCode = true;
        kept.push_back(std::move(line));
    }
    while (!kept.empty() && CommonUtils::trim(kept.back()).empty()) kept.pop_back();
    return CommonUtils::join(kept, "\n");
}

std::string stripComments(const std::string& code,
                          const std::vector<Tabula::CommentSpan>& comments,
                          const std::function<bool(const std::string&)>& mentionsDenied) {
    std::vector<const Tabula::CommentSpan*> doomed;
    for (const auto& c : comments) {
        const bool tooLong = c.fullLine ? c.text.size() >= kMaxFullLineComment
                                        : (c.text.size() > 0 && c.text.size() - 1 >= kMaxTrailingComment);
        if (tooLong || (mentionsDenied && mentionsDenied(c.text))) doomed.push_back(&c);
    }
    std::sort(doomed.begin(), doomed.end(), [](const auto* a, const auto* b) { return a->offset > b->offset; });

    std::string out = code;
    for (const auto* c : doomed) {
        size_t begin = c->offset;
        size_t end = std::min(out.size(), c->offset + c->length);
        if (c->fullLine) {
            while (begin > 0 && out[begin - 1] != '\n') --begin;
            if (end < out.size() && out[end] == '\n') ++end;
        } else {
            while (begin > 0 && (out[begin - 1] == ' ' || out[begin - 1] == '\t')) --begin;
        }
        out.erase(begin, end - begin);
    }
    while (!out.empty() && (out.back() == '\n' || out.back() == ' ')) out.pop_back();
    return out;
}

std::string extractFromResponse(const std::string& response) {
    static const std::regex fencedPython("```python\\s*\\n([\\s\\S]*?)```");
    static const std::regex fencedPlain("```\\s*\\n([\\s\\S]*?)```");
    static const std::regex fencedInline("```([\\s\\S]*?)```");

    for (const std::regex* re : {&fencedPython, &fencedPlain, &fencedInline}) {
        std::smatch match;
        if (std::regex_search(response, match, *re)) {
            const std::string code = CommonUtils::trim(match[1].str());
            if (!code.empty()) return cleanCode(code);
        }
    }

    static const char* const codeMarkers[] = {"df", "pd.", "np.", "=", ".", "(", "[", "groupby"};
    std::vector<std::string> codeLines;
    for (const auto& line : CommonUtils::splitLines(CommonUtils::trim(response))) {
        const std::string stripped = CommonUtils::trim(line);
        if (stripped.empty()) continue;
        if (stripped[0] == '#' && stripped.size() > kMaxFullLineComment) continue;
        const std::string lower = CommonUtils::toLower(stripped);
        bool prose = false;
        for (const char* p : {"here", "this", "the ", "to ", "i "}) {
            if (CommonUtils::startsWith(lower, p)) prose = true;
        }
        if (prose) continue;
        for (const char* marker : codeMarkers) {
            if (stripped.find(marker) != std::string::npos) {
                codeLines.push_back(stripped);
                break;
            }
        }
    }
    if (!codeLines.empty()) return cleanCode(CommonUtils::join(codeLines, "\n"));
    return cleanCode(response);
}

std::string cleanCode(const std::string& code) {
    static const std::regex leadingFence("^```\\w*\\s*");
    static const std::regex trailingFence("```\\s*$");
    static const std::regex codeMarker("^CODE:\\s*", std::regex::icase);
    static const std::regex printCall("\\bprint\\s*\\((.*)\\)");

    std::string out = std::regex_replace(code, leadingFence, "");
    out = std::regex_replace(out, trailingFence, "");
    out = std::regex_replace(out, codeMarker, "");
    out = std::regex_replace(out, printCall, "$1");
    out = CommonUtils::trim(out);

    try {
        Tabula::ScriptLexer lexer(out);
        lexer.tokenize();
        out = stripComments(out, lexer.comments(), {});
    } catch (const Tabula::ScriptSyntaxError&) {
        // Left for validation to report with a position.
    }
    return CommonUtils::trim(out);
}

} // namespace CodeSanitizer
