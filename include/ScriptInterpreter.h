#pragma once

#include "ScriptAst.h"
#include "ScriptValue.h"
#include "SecurityPolicy.h"

#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace Tabula {

/**
 * @brief Names the interpreter binds as builtins (`len`, `sum`, `print`, ...).
 */
const std::vector<std::string>& scriptBuiltinNames();

/**
 * @brief Names bound to library facades: `pd`, `np`, `px`, `go`.
 */
const std::vector<std::string>& scriptModuleNames();

/**
 * @brief Tree-walking evaluator for validated analysis scripts.
 * @details The namespace holds exactly the dataset (under the policy's dataset
 * name and aliases), the library facades and the builtins. There is no import
 * machinery and no file, network or process facility to reach.
 */
class ScriptInterpreter {
public:
    ScriptInterpreter(const SecurityPolicy& policy, std::shared_ptr<DataFrame> dataset);

    /**
     * @brief Executes the script and returns its result.
     * @post The result is the value of a final expression statement (a final
     * `print(x)` yields x), else the first bound conventional output name,
     * else None.
     * @throws Tabula::ScriptError on any runtime failure.
     */
    Value run(const Ast::Module& module);

    /**
     * @brief Current binding of a global name; nullptr when unbound.
     */
    const Value* lookup(const std::string& name) const;

private:
    enum class Flow { NORMAL, BREAK, CONTINUE };

    const SecurityPolicy& policy_;
    std::unordered_map<std::string, Value> globals_;
    std::set<std::string> assigned_;

    Flow execBlock(const Ast::Block& block);
    Flow execStmt(const Ast::Stmt& stmt);
    Flow execFor(const Ast::For& loop);
    Flow execWhile(const Ast::While& loop);

    Value eval(const Ast::Expr& expr);
    Value evalName(const Ast::Name& name);
    Value evalCall(const Ast::Call& call);
    Value evalCompare(const Ast::Compare& cmp);
    Value evalBoolOp(const Ast::BoolOp& op);
    Value evalFString(const Ast::FString& fs);
    Value evalSubscriptKey(const Ast::Expr& index);
    Value evalComprehension(const Ast::Comp& comp);
    Value evalDictComprehension(const Ast::DictComp& comp);
    std::vector<Value> evalItems(const std::vector<Ast::ExprPtr>& items);

    /**
     * @brief Runs `body` once per binding produced by the generator clauses.
     * @details Targets bound inside are restored afterwards, so comprehension
     * variables never leak into the script namespace.
     */
    template <typename Body>
    void forEachBinding(const std::vector<Ast::Comprehension>& generators, size_t level, Body& body);

    void assign(const Ast::Expr& target, const Value& value);
    void bind(const std::string& name, const Value& value);
    std::vector<std::string> targetNames(const Ast::Expr& target) const;

    Value finalValue(const Ast::Stmt& last);
    bool isPrintCall(const Ast::Stmt& stmt) const;
};

} // namespace Tabula
