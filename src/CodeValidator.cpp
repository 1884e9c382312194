#include "CodeValidator.h"

#include "CodeSanitizer.h"
#include "CommonUtils.h"
#include "ScriptAst.h"
#include "ScriptInterpreter.h"
#include "ScriptLexer.h"
#include "ScriptParser.h"
#include "TabulaExceptions.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace Tabula {

namespace {

using namespace Ast;

// Walks the tree in execution order so that "assigned earlier" is meaningful.
class PolicyWalker {
public:
    explicit PolicyWalker(const SecurityPolicy& policy) : policy_(policy) {
        for (const auto& name : policy.datasetBindings()) globals_.insert(name);
        for (const auto& name : scriptModuleNames()) globals_.insert(name);
        for (const auto& name : scriptBuiltinNames()) globals_.insert(name);
    }

    void walk(const Block& block) {
        for (const auto& stmt : block) visitStmt(*stmt);
    }

    std::vector<Violation> violations;
    std::vector<std::string> warnings;

private:
    const SecurityPolicy& policy_;
    std::set<std::string> globals_;
    std::set<std::string> bound_;

    void addViolation(const std::string& type, const std::string& item) {
        for (const auto& v : violations) {
            if (v.type == type && v.item == item) return;
        }
        violations.push_back(Violation{type, item});
    }

    void addWarning(const std::string& message) {
        if (std::find(warnings.begin(), warnings.end(), message) == warnings.end()) warnings.push_back(message);
    }

    void checkIdentifier(const std::string& id) {
        if (policy_.isBlockedOperation(id) || CommonUtils::isDunder(id)) addViolation("operation", id);
    }

    bool isKnownName(const std::string& id) const {
        return bound_.count(id) != 0 || globals_.count(id) != 0 || policy_.isAllowedVariable(id);
    }

    void readName(const std::string& id) {
        if (policy_.isBlockedModule(id)) {
            addViolation("import", id);
            return;
        }
        checkIdentifier(id);
        if (!policy_.isBlockedOperation(id) && !CommonUtils::isDunder(id) && !isKnownName(id)) {
            addWarning("Unknown variable: " + id);
        }
    }

    void bindTarget(const Expr& target) {
        std::visit(Overloaded{
                       [&](const Name& n) {
                           checkIdentifier(n.id);
                           bound_.insert(n.id);
                       },
                       [&](const TupleExpr& t) {
                           for (const auto& e : t.elts) bindTarget(*e);
                       },
                       [&](const ListExpr& l) {
                           for (const auto& e : l.elts) bindTarget(*e);
                       },
                       [&](const auto&) { visitExpr(target); },
                   },
                   target.node);
    }

    void visitAll(const std::vector<ExprPtr>& exprs) {
        for (const auto& e : exprs) {
            if (e) visitExpr(*e);
        }
    }

    void visitGenerators(const std::vector<Comprehension>& generators) {
        for (const auto& gen : generators) {
            visitExpr(*gen.iter);
            bindTarget(*gen.target);
            visitAll(gen.ifs);
        }
    }

    static std::string callName(const Expr& func) {
        if (const auto* n = std::get_if<Name>(&func.node)) return n->id;
        if (const auto* a = std::get_if<Attribute>(&func.node)) return a->attr;
        return std::string();
    }

    void visitExpr(const Expr& expr) {
        std::visit(Overloaded{
                       [&](const Name& n) { readName(n.id); },
                       [&](const Attribute& a) {
                           visitExpr(*a.value);
                           checkIdentifier(a.attr);
                       },
                       [&](const Subscript& s) {
                           visitExpr(*s.value);
                           visitExpr(*s.index);
                       },
                       [&](const Slice& s) {
                           if (s.lower) visitExpr(*s.lower);
                           if (s.upper) visitExpr(*s.upper);
                           if (s.step) visitExpr(*s.step);
                       },
                       [&](const Call& c) {
                           if (const auto* callee = std::get_if<Name>(&c.func->node)) {
                               if (policy_.isBlockedModule(callee->id)) {
                                   addViolation("import", callee->id);
                               } else {
                                   checkIdentifier(callee->id);
                               }
                           } else {
                               visitExpr(*c.func);
                           }
                           const std::string name = callName(*c.func);
                           if (!name.empty() && !policy_.isBlockedOperation(name) && !CommonUtils::isDunder(name) &&
                               !policy_.isAllowedOperation(name)) {
                               addWarning("Unknown operation: " + name);
                           }
                           visitAll(c.args);
                           for (const auto& kw : c.keywords) {
                               checkIdentifier(kw.name);
                               visitExpr(*kw.value);
                           }
                       },
                       [&](const FString& f) {
                           for (const auto& part : f.parts) {
                               if (part.expr) visitExpr(*part.expr);
                           }
                       },
                       [&](const UnaryOp& u) { visitExpr(*u.operand); },
                       [&](const BinOp& b) {
                           visitExpr(*b.left);
                           visitExpr(*b.right);
                       },
                       [&](const BoolOp& b) { visitAll(b.values); },
                       [&](const Compare& c) {
                           visitExpr(*c.left);
                           visitAll(c.comparators);
                       },
                       [&](const IfExp& e) {
                           visitExpr(*e.test);
                           visitExpr(*e.body);
                           visitExpr(*e.orelse);
                       },
                       [&](const Lambda& l) {
                           addViolation("lambda", "lambda");
                           const auto saved = bound_;
                           for (const auto& p : l.params) {
                               checkIdentifier(p);
                               bound_.insert(p);
                           }
                           visitExpr(*l.body);
                           bound_ = saved;
                       },
                       [&](const ListExpr& l) { visitAll(l.elts); },
                       [&](const TupleExpr& t) { visitAll(t.elts); },
                       [&](const SetExpr& s) { visitAll(s.elts); },
                       [&](const DictExpr& d) {
                           visitAll(d.keys);
                           visitAll(d.values);
                       },
                       [&](const Comp& c) {
                           const auto saved = bound_;
                           visitGenerators(c.generators);
                           visitExpr(*c.elt);
                           bound_ = saved;
                       },
                       [&](const DictComp& c) {
                           const auto saved = bound_;
                           visitGenerators(c.generators);
                           visitExpr(*c.key);
                           visitExpr(*c.value);
                           bound_ = saved;
                       },
                       [&](const auto&) {},
                   },
                   expr.node);
    }

    void visitImport(const Import& imp) {
        for (const auto& module : imp.modules) {
            const size_t begin = module.find_first_not_of('.');
            std::string root = begin == std::string::npos ? module : module.substr(begin);
            root = root.substr(0, root.find('.'));
            addViolation("import", root);
        }
        for (const auto& name : imp.names) {
            if (name != "*") checkIdentifier(name);
        }
        for (const auto& alias : imp.aliases) {
            if (!alias.empty()) checkIdentifier(alias);
        }
    }

    void visitStmt(const Stmt& stmt) {
        std::visit(Overloaded{
                       [&](const ExprStmt& s) { visitExpr(*s.value); },
                       [&](const Assign& s) {
                           visitExpr(*s.value);
                           for (const auto& t : s.targets) bindTarget(*t);
                       },
                       [&](const AugAssign& s) {
                           visitExpr(*s.target);
                           visitExpr(*s.value);
                           bindTarget(*s.target);
                       },
                       [&](const If& s) {
                           visitExpr(*s.test);
                           walk(s.body);
                           walk(s.orelse);
                       },
                       [&](const For& s) {
                           visitExpr(*s.iter);
                           bindTarget(*s.target);
                           walk(s.body);
                           walk(s.orelse);
                       },
                       [&](const While& s) {
                           visitExpr(*s.test);
                           walk(s.body);
                           walk(s.orelse);
                       },
                       [&](const Import& s) { visitImport(s); },
                       [&](const auto&) {},
                   },
                   stmt.node);
    }
};

std::string describeViolations(const std::vector<Violation>& violations) {
    std::vector<std::string> parts;
    parts.reserve(violations.size());
    for (const auto& v : violations) parts.push_back(v.type + ": " + v.item);
    return "Security violations found: " + CommonUtils::join(parts, ", ");
}

} // namespace

CodeValidator::CodeValidator(const SecurityPolicy& policy) : policy_(policy) {}

bool CodeValidator::mentionsDeniedIdentifier(const std::string& text) const {
    std::string word;
    const auto flush = [&]() {
        const bool denied = !word.empty() && policy_.isDeniedIdentifier(word);
        word.clear();
        return denied;
    };
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            word.push_back(c);
        } else if (flush()) {
            return true;
        }
    }
    return flush();
}

ValidationResult CodeValidator::validate(const std::string& code) const {
    const std::string cleaned = CodeSanitizer::preClean(code);

    ScriptLexer lexer(cleaned);
    Ast::Module module;
    try {
        module = ScriptParser(lexer.tokenize()).parseModule();
    } catch (const ScriptSyntaxError& ex) {
        Log::warn("Validator", std::string("syntax error") +
                                   LogFields().add("line", ex.line()).add("column", ex.column()).str());
        throw CodeValidationError(ValidationKind::SyntaxError, ex.what());
    }

    PolicyWalker walker(policy_);
    walker.walk(module.body);

    if (!walker.violations.empty()) {
        CodeValidationError error(ValidationKind::SecurityViolation, describeViolations(walker.violations),
                                  walker.violations);
        Log::warn("Validator", std::string("rejected script") +
                                   LogFields().add("type", error.violationType())
                                       .add("violations", walker.violations.size()).str());
        throw error;
    }

    ValidationResult result;
    result.sanitizedCode = CodeSanitizer::stripComments(
        cleaned, lexer.comments(), [this](const std::string& text) { return mentionsDeniedIdentifier(text); });
    result.warnings = std::move(walker.warnings);
    for (const auto& w : result.warnings) Log::info("Validator", w);
    Log::debug("Validator", std::string("accepted script") +
                                LogFields().add("chars", result.sanitizedCode.size())
                                    .add("warnings", result.warnings.size()).str());
    return result;
}

} // namespace Tabula
