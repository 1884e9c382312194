#include "ScriptInterpreter.h"

#include "ScriptRuntime.h"
#include "TabulaExceptions.h"

#include <optional>

namespace Tabula {

using namespace Ast;

const std::vector<std::string>& scriptBuiltinNames() {
    static const std::vector<std::string> names = {
        "len", "sum", "min", "max", "round", "abs", "sorted", "reversed", "list", "tuple", "dict", "set",
        "range", "enumerate", "zip", "str", "int", "float", "bool", "any", "all", "print", "isinstance", "format"
    };
    return names;
}

const std::vector<std::string>& scriptModuleNames() {
    static const std::vector<std::string> names = {"pd", "np", "px", "go"};
    return names;
}

ScriptInterpreter::ScriptInterpreter(const SecurityPolicy& policy, std::shared_ptr<DataFrame> dataset)
    : policy_(policy) {
    for (const auto& name : scriptBuiltinNames()) globals_[name] = builtinCallable(name);
    globals_["pd"] = Value(ModuleRef{ModuleKind::PANDAS});
    globals_["np"] = Value(ModuleRef{ModuleKind::NUMPY});
    globals_["px"] = Value(ModuleRef{ModuleKind::PLOTLY_EXPRESS});
    globals_["go"] = Value(ModuleRef{ModuleKind::GRAPH_OBJECTS});

    const Value frame(std::move(dataset));
    for (const auto& name : policy_.datasetBindings()) globals_[name] = frame;
}

const Value* ScriptInterpreter::lookup(const std::string& name) const {
    auto it = globals_.find(name);
    return it == globals_.end() ? nullptr : &it->second;
}

Value ScriptInterpreter::run(const Module& module) {
    const Block& body = module.body;
    if (body.empty()) return Value();

    for (size_t i = 0; i + 1 < body.size(); ++i) {
        if (execStmt(*body[i]) != Flow::NORMAL) throw ScriptError("SyntaxError", "'break' outside loop");
    }
    const Stmt& last = *body.back();
    if (std::holds_alternative<ExprStmt>(last.node)) return finalValue(last);
    if (execStmt(last) != Flow::NORMAL) throw ScriptError("SyntaxError", "'break' outside loop");

    for (const auto& name : policy_.resultNames) {
        if (assigned_.count(name) == 0) continue;
        if (const Value* v = lookup(name)) return *v;
    }
    return Value();
}

bool ScriptInterpreter::isPrintCall(const Stmt& stmt) const {
    const auto* es = std::get_if<ExprStmt>(&stmt.node);
    if (es == nullptr) return false;
    const auto* call = std::get_if<Call>(&es->value->node);
    if (call == nullptr) return false;
    const auto* name = std::get_if<Name>(&call->func->node);
    if (name == nullptr || name->id != "print") return false;
    const Value* bound = lookup("print");
    if (bound == nullptr) return false;
    const auto* fn = bound->ptr<std::shared_ptr<Callable>>();
    return fn != nullptr && (*fn)->kind == Callable::Kind::BUILTIN && (*fn)->name == "print";
}

Value ScriptInterpreter::finalValue(const Stmt& last) {
    const auto& es = std::get<ExprStmt>(last.node);
    if (!isPrintCall(last)) return eval(*es.value);

    const auto& call = std::get<Call>(es.value->node);
    std::vector<Value> items = evalItems(call.args);
    for (const auto& kw : call.keywords) eval(*kw.value);
    if (items.empty()) return Value();
    if (items.size() == 1) return items.front();
    std::string joined;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) joined += ' ';
        joined += str(items[i]);
    }
    return Value(joined);
}

ScriptInterpreter::Flow ScriptInterpreter::execBlock(const Block& block) {
    for (const auto& stmt : block) {
        const Flow flow = execStmt(*stmt);
        if (flow != Flow::NORMAL) return flow;
    }
    return Flow::NORMAL;
}

ScriptInterpreter::Flow ScriptInterpreter::execStmt(const Stmt& stmt) {
    return std::visit(Overloaded{
                          [&](const ExprStmt& s) {
                              eval(*s.value);
                              return Flow::NORMAL;
                          },
                          [&](const Assign& s) {
                              const Value value = eval(*s.value);
                              for (const auto& target : s.targets) assign(*target, value);
                              return Flow::NORMAL;
                          },
                          [&](const AugAssign& s) {
                              const Value current = eval(*s.target);
                              assign(*s.target, Runtime::binary(s.op, current, eval(*s.value)));
                              return Flow::NORMAL;
                          },
                          [&](const If& s) {
                              return truthy(eval(*s.test)) ? execBlock(s.body) : execBlock(s.orelse);
                          },
                          [&](const For& s) { return execFor(s); },
                          [&](const While& s) { return execWhile(s); },
                          [&](const Break&) { return Flow::BREAK; },
                          [&](const Continue&) { return Flow::CONTINUE; },
                          [&](const Pass&) { return Flow::NORMAL; },
                          [&](const Import&) -> Flow {
                              throw ScriptError("ImportError", "import statements are not available");
                          },
                      },
                      stmt.node);
}

ScriptInterpreter::Flow ScriptInterpreter::execFor(const For& loop) {
    const std::vector<Value> items = iterate(eval(*loop.iter));
    for (const auto& item : items) {
        assign(*loop.target, item);
        const Flow flow = execBlock(loop.body);
        if (flow == Flow::BREAK) return Flow::NORMAL;
    }
    return execBlock(loop.orelse);
}

ScriptInterpreter::Flow ScriptInterpreter::execWhile(const While& loop) {
    while (truthy(eval(*loop.test))) {
        const Flow flow = execBlock(loop.body);
        if (flow == Flow::BREAK) return Flow::NORMAL;
    }
    return execBlock(loop.orelse);
}

void ScriptInterpreter::bind(const std::string& name, const Value& value) {
    globals_[name] = value;
    assigned_.insert(name);
}

void ScriptInterpreter::assign(const Expr& target, const Value& value) {
    const auto unpack = [&](const std::vector<ExprPtr>& elts) {
        const std::vector<Value> items = iterate(value);
        if (items.size() < elts.size()) {
            throw ScriptError("ValueError", "not enough values to unpack (expected " + std::to_string(elts.size()) +
                                                ", got " + std::to_string(items.size()) + ")");
        }
        if (items.size() > elts.size()) {
            throw ScriptError("ValueError", "too many values to unpack (expected " + std::to_string(elts.size()) + ")");
        }
        for (size_t i = 0; i < elts.size(); ++i) assign(*elts[i], items[i]);
    };

    std::visit(Overloaded{
                   [&](const Name& n) { bind(n.id, value); },
                   [&](const TupleExpr& t) { unpack(t.elts); },
                   [&](const ListExpr& l) { unpack(l.elts); },
                   [&](const Subscript& s) {
                       const Value obj = eval(*s.value);
                       Runtime::setItem(obj, evalSubscriptKey(*s.index), value);
                   },
                   [&](const Attribute& a) {
                       const Value obj = eval(*a.value);
                       throw ScriptError("AttributeError", "cannot set attribute '" + a.attr + "' on '" +
                                                               typeName(obj) + "' object");
                   },
                   [&](const auto&) { throw ScriptError("SyntaxError", "cannot assign to expression"); },
               },
               target.node);
}

std::vector<std::string> ScriptInterpreter::targetNames(const Expr& target) const {
    std::vector<std::string> names;
    if (const auto* n = std::get_if<Name>(&target.node)) {
        names.push_back(n->id);
    } else if (const auto* t = std::get_if<TupleExpr>(&target.node)) {
        for (const auto& e : t->elts) {
            for (auto& name : targetNames(*e)) names.push_back(std::move(name));
        }
    } else if (const auto* l = std::get_if<ListExpr>(&target.node)) {
        for (const auto& e : l->elts) {
            for (auto& name : targetNames(*e)) names.push_back(std::move(name));
        }
    }
    return names;
}

std::vector<Value> ScriptInterpreter::evalItems(const std::vector<ExprPtr>& items) {
    std::vector<Value> out;
    out.reserve(items.size());
    for (const auto& e : items) out.push_back(eval(*e));
    return out;
}

Value ScriptInterpreter::evalName(const Name& name) {
    if (const Value* v = lookup(name.id)) return *v;
    throw ScriptError("NameError", "name '" + name.id + "' is not defined");
}

Value ScriptInterpreter::evalSubscriptKey(const Expr& index) {
    if (const auto* s = std::get_if<Ast::Slice>(&index.node)) {
        auto slice = std::make_shared<SliceValue>();
        if (s->lower) slice->start = eval(*s->lower);
        if (s->upper) slice->stop = eval(*s->upper);
        if (s->step) slice->step = eval(*s->step);
        return Value(slice);
    }
    if (const auto* t = std::get_if<TupleExpr>(&index.node)) {
        std::vector<Value> parts;
        parts.reserve(t->elts.size());
        for (const auto& e : t->elts) parts.push_back(evalSubscriptKey(*e));
        return makeTuple(std::move(parts));
    }
    return eval(index);
}

Value ScriptInterpreter::evalCall(const Call& call) {
    const Value fn = eval(*call.func);
    CallArgs args;
    args.positional = evalItems(call.args);
    for (const auto& kw : call.keywords) args.keywords.emplace_back(kw.name, eval(*kw.value));
    return Runtime::call(fn, args);
}

Value ScriptInterpreter::evalCompare(const Compare& cmp) {
    Value left = eval(*cmp.left);
    Value result;
    for (size_t i = 0; i < cmp.ops.size(); ++i) {
        Value right = eval(*cmp.comparators[i]);
        result = Runtime::compare(cmp.ops[i], left, right);
        if (i + 1 < cmp.ops.size() && !truthy(result)) return result;
        left = std::move(right);
    }
    return result;
}

Value ScriptInterpreter::evalBoolOp(const BoolOp& op) {
    Value current;
    for (const auto& e : op.values) {
        current = eval(*e);
        if (op.isAnd ? !truthy(current) : truthy(current)) return current;
    }
    return current;
}

Value ScriptInterpreter::evalFString(const FString& fs) {
    std::string out;
    for (const auto& part : fs.parts) {
        out += part.literal;
        if (!part.expr) continue;
        Value v = eval(*part.expr);
        if (part.conversion == 'r' || part.conversion == 'a') v = Value(repr(v));
        else if (part.conversion == 's') v = Value(str(v));
        out += part.formatSpec.empty() ? str(v) : Runtime::formatValue(v, part.formatSpec);
    }
    return Value(out);
}

template <typename Body>
void ScriptInterpreter::forEachBinding(const std::vector<Comprehension>& generators, size_t level, Body& body) {
    if (level == generators.size()) {
        body();
        return;
    }
    const Comprehension& gen = generators[level];
    const std::vector<Value> items = iterate(eval(*gen.iter));
    for (const auto& item : items) {
        assign(*gen.target, item);
        bool keep = true;
        for (const auto& cond : gen.ifs) {
            if (!truthy(eval(*cond))) {
                keep = false;
                break;
            }
        }
        if (keep) forEachBinding(generators, level + 1, body);
    }
}

namespace {
// Restores the bindings a comprehension shadowed once it finishes.
class ComprehensionScope {
public:
    ComprehensionScope(std::unordered_map<std::string, Value>& globals,
                       std::set<std::string>& assigned,
                       const std::vector<std::string>& names)
        : globals_(globals), assigned_(assigned), savedAssigned_(assigned) {
        for (const auto& name : names) {
            auto it = globals_.find(name);
            saved_.emplace_back(name, it == globals_.end() ? std::nullopt : std::optional<Value>(it->second));
        }
    }
    ~ComprehensionScope() {
        for (auto& entry : saved_) {
            if (entry.second) globals_[entry.first] = std::move(*entry.second);
            else globals_.erase(entry.first);
        }
        assigned_ = std::move(savedAssigned_);
    }
    ComprehensionScope(const ComprehensionScope&) = delete;
    ComprehensionScope& operator=(const ComprehensionScope&) = delete;

private:
    std::unordered_map<std::string, Value>& globals_;
    std::set<std::string>& assigned_;
    std::set<std::string> savedAssigned_;
    std::vector<std::pair<std::string, std::optional<Value>>> saved_;
};
} // namespace

Value ScriptInterpreter::evalComprehension(const Comp& comp) {
    std::vector<std::string> names;
    for (const auto& gen : comp.generators) {
        for (auto& name : targetNames(*gen.target)) names.push_back(std::move(name));
    }
    ComprehensionScope scope(globals_, assigned_, names);

    std::vector<Value> items;
    auto body = [&]() { items.push_back(eval(*comp.elt)); };
    forEachBinding(comp.generators, 0, body);

    if (comp.kind == ComprehensionKind::SET) {
        auto set = std::make_shared<SetValue>();
        for (const auto& item : items) set->add(item);
        return Value(set);
    }
    return makeList(std::move(items));
}

Value ScriptInterpreter::evalDictComprehension(const DictComp& comp) {
    std::vector<std::string> names;
    for (const auto& gen : comp.generators) {
        for (auto& name : targetNames(*gen.target)) names.push_back(std::move(name));
    }
    ComprehensionScope scope(globals_, assigned_, names);

    auto dict = std::make_shared<DictValue>();
    auto body = [&]() {
        Value key = eval(*comp.key);
        dict->set(key, eval(*comp.value));
    };
    forEachBinding(comp.generators, 0, body);
    return Value(dict);
}

Value ScriptInterpreter::eval(const Expr& expr) {
    return std::visit(Overloaded{
                          [&](const NoneLiteral&) { return Value(); },
                          [&](const BoolLiteral& b) { return Value(b.value); },
                          [&](const IntLiteral& i) { return Value(i.value); },
                          [&](const FloatLiteral& f) { return Value(f.value); },
                          [&](const StringLiteral& s) { return Value(s.value); },
                          [&](const FString& f) { return evalFString(f); },
                          [&](const Name& n) { return evalName(n); },
                          [&](const Attribute& a) { return Runtime::getAttribute(eval(*a.value), a.attr); },
                          [&](const Subscript& s) {
                              const Value obj = eval(*s.value);
                              return Runtime::getItem(obj, evalSubscriptKey(*s.index));
                          },
                          [&](const Ast::Slice&) { return evalSubscriptKey(expr); },
                          [&](const Call& c) { return evalCall(c); },
                          [&](const UnaryOp& u) {
                              const Value v = eval(*u.operand);
                              if (u.op == UnaryOperator::NOT) return Value(!truthy(v));
                              return Runtime::unary(u.op, v);
                          },
                          [&](const BinOp& b) {
                              const Value left = eval(*b.left);
                              return Runtime::binary(b.op, left, eval(*b.right));
                          },
                          [&](const BoolOp& b) { return evalBoolOp(b); },
                          [&](const Compare& c) { return evalCompare(c); },
                          [&](const IfExp& e) { return truthy(eval(*e.test)) ? eval(*e.body) : eval(*e.orelse); },
                          [&](const Lambda&) -> Value {
                              throw ScriptError("SyntaxError", "lambda expressions are not available");
                          },
                          [&](const ListExpr& l) { return makeList(evalItems(l.elts)); },
                          [&](const TupleExpr& t) { return makeTuple(evalItems(t.elts)); },
                          [&](const SetExpr& s) {
                              auto set = std::make_shared<SetValue>();
                              for (const auto& e : s.elts) set->add(eval(*e));
                              return Value(set);
                          },
                          [&](const DictExpr& d) {
                              auto dict = std::make_shared<DictValue>();
                              for (size_t i = 0; i < d.keys.size(); ++i) {
                                  Value key = eval(*d.keys[i]);
                                  dict->set(key, eval(*d.values[i]));
                              }
                              return Value(dict);
                          },
                          [&](const Comp& c) { return evalComprehension(c); },
                          [&](const DictComp& c) { return evalDictComprehension(c); },
                      },
                      expr.node);
}

} // namespace Tabula
