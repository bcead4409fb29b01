#include <stdexcept>
#include <string>

#include "evaluator.hpp"

namespace {
// Marks the dynamic extent of a loop body so `break` knows it has a target.
struct LoopDepthGuard {
    int& depth;
    explicit LoopDepthGuard(int& d) : depth(d) { ++depth; }
    ~LoopDepthGuard() { --depth; }
};
}  // namespace

// ----------------- Statement evaluation -----------------
ExecResult Evaluator::evaluate_statement(StatementNode* stmt, const EnvPtr& env) {
    if (!stmt) return ExecResult::normal();

    if (auto ws = dynamic_cast<WithStatementNode*>(stmt)) {
        return evaluate_with(ws, env);
    }

    if (auto wa = dynamic_cast<WithAliasStatementNode*>(stmt)) {
        return evaluate_with_alias(wa, env);
    }

    if (auto ls = dynamic_cast<LetStatementNode*>(stmt)) {
        env->bind(ls->name, std::monostate{}, Durability::Durable, ls->token);
        return ExecResult::normal();
    }

    if (auto ss = dynamic_cast<SetStatementNode*>(stmt)) {
        Value v = evaluate_expression(ss->value.get(), env);
        env->rebind(ss->name, v, ss->token);
        return ExecResult::normal();
    }

    if (auto is = dynamic_cast<IfStatementNode*>(stmt)) {
        return evaluate_if(is, env);
    }

    if (auto lp = dynamic_cast<LoopStatementNode*>(stmt)) {
        return evaluate_loop(lp, env);
    }

    if (auto it = dynamic_cast<IterStatementNode*>(stmt)) {
        return evaluate_iter(it, env);
    }

    if (auto bs = dynamic_cast<BlockStatementNode*>(stmt)) {
        return evaluate_block(bs, env);
    }

    if (auto sq = dynamic_cast<SequenceStatementNode*>(stmt)) {
        return evaluate_sequence(sq, env);
    }

    if (auto br = dynamic_cast<BreakStatementNode*>(stmt)) {
        if (loop_depth_ == 0) {
            throw ControlFlowError("'break' used outside of a loop", br->token.loc);
        }
        return ExecResult::breaking();
    }

    if (auto ps = dynamic_cast<PrintStatementNode*>(stmt)) {
        Value v = evaluate_expression(ps->expression.get(), env);
        out_.write(display_string(v) + "\n");
        return ExecResult::normal();
    }

    if (auto pr = dynamic_cast<PromptStatementNode*>(stmt)) {
        return evaluate_prompt(pr, env);
    }

    if (auto us = dynamic_cast<UsingStatementNode*>(stmt)) {
        evaluate_using(us, env);
        return ExecResult::normal();
    }

    if (auto es = dynamic_cast<ExpressionStatementNode*>(stmt)) {
        return ExecResult::normal(evaluate_expression(es->expression.get(), env));
    }

    throw RuntimeError("Unsupported statement", stmt->token.loc);
}

// The value is computed in the enclosing scope, so `with x as x + 1` sees the
// outer x. The binding lives exactly as long as the guard.
ExecResult Evaluator::evaluate_with(WithStatementNode* node, const EnvPtr& env) {
    Value v = evaluate_expression(node->value.get(), env);
    ScopeGuard guard(*env);
    guard.scope()->bind(node->name, v, Durability::Transient, node->token);
    return evaluate_statement(node->body.get(), guard.scope());
}

ExecResult Evaluator::evaluate_with_alias(WithAliasStatementNode* node, const EnvPtr& env) {
    Value target = evaluate_expression(node->target.get(), env);
    ScopeGuard guard(*env);
    guard.scope()->bind(node->alias, target, Durability::Transient, node->token);
    return evaluate_statement(node->body.get(), guard.scope());
}

ExecResult Evaluator::evaluate_if(IfStatementNode* node, const EnvPtr& env) {
    Value cond = evaluate_expression(node->condition.get(), env);
    StatementNode* branch = to_condition(cond, node->condition->token) ? node->then_branch.get() : node->else_branch.get();
    if (!branch) return ExecResult::normal();
    ScopeGuard guard(*env);
    return evaluate_statement(branch, guard.scope());
}

// Running -> (Break) -> Completed. Each iteration gets a fresh scope, so
// bindings made in one pass do not leak into the next.
ExecResult Evaluator::evaluate_loop(LoopStatementNode* node, const EnvPtr& env) {
    LoopDepthGuard depth(loop_depth_);
    while (true) {
        ScopeGuard iteration(*env);
        for (auto& stmt : node->body) {
            ExecResult r = evaluate_statement(stmt.get(), iteration.scope());
            if (r.is_break()) return ExecResult::normal();
        }
    }
}

ExecResult Evaluator::evaluate_iter(IterStatementNode* node, const EnvPtr& env) {
    Value iterable = evaluate_expression(node->iterable.get(), env);
    LoopDepthGuard depth(loop_depth_);

    auto run_once = [&](const Value& item) -> bool {
        ScopeGuard iteration(*env);
        iteration.scope()->bind(node->variable, item, Durability::Transient, node->token);
        return evaluate_statement(node->body.get(), iteration.scope()).is_break();
    };

    if (std::holds_alternative<ListPtr>(iterable)) {
        ListPtr list = std::get<ListPtr>(iterable);  // keeps the list alive while iterating
        for (const auto& item : list->elements) {
            if (run_once(item)) break;
        }
        return ExecResult::normal();
    }

    if (std::holds_alternative<std::string>(iterable)) {
        for (const std::string& c : utf8_chars(std::get<std::string>(iterable))) {
            if (run_once(c)) break;
        }
        return ExecResult::normal();
    }

    if (std::holds_alternative<std::int64_t>(iterable)) {
        std::int64_t n = std::get<std::int64_t>(iterable);
        for (std::int64_t i = 0; i < n; ++i) {
            if (run_once(i)) break;
        }
        return ExecResult::normal();
    }

    throw RuntimeTypeError("Cannot iterate over a " + type_name(iterable) + " (expected list, string or int)", node->iterable->token.loc);
}

ExecResult Evaluator::evaluate_block(BlockStatementNode* node, const EnvPtr& env) {
    ScopeGuard guard(*env);
    ExecResult last;
    for (auto& stmt : node->body) {
        last = evaluate_statement(stmt.get(), guard.scope());
        if (last.is_break()) return last;
    }
    return last;
}

// `a and b`: same scope, left to right, a Break skips the rest
ExecResult Evaluator::evaluate_sequence(SequenceStatementNode* node, const EnvPtr& env) {
    ExecResult last;
    for (auto& stmt : node->statements) {
        last = evaluate_statement(stmt.get(), env);
        if (last.is_break()) return last;
    }
    return last;
}

// The line read is only a go-ahead signal; its content is dropped. End of
// input releases the prompt as well.
ExecResult Evaluator::evaluate_prompt(PromptStatementNode* node, const EnvPtr& env) {
    out_.write(node->message);
    try {
        (void)in_.read_line();
    } catch (const std::runtime_error& e) {
        throw IOError(std::string("prompt could not read input: ") + e.what(), node->token.loc);
    }
    return evaluate_statement(node->then_statement.get(), env);
}

void Evaluator::evaluate_using(UsingStatementNode* node, const EnvPtr& env) {
    Value module;
    if (node->is_file_path) {
        module = import_script_module(node->module_path, node->name, node->module_token);
    } else {
        module = registry_.resolve_member(node->module_path, node->name, node->module_token);
    }

    if (env->has_local(node->name)) {
        const Value& existing = env->lookup(node->name, node->token);
        if (values_equal(existing, module) && std::holds_alternative<ModulePtr>(existing)) return;
        throw NameError("'" + node->name + "' is already declared in this scope", node->token.loc);
    }
    env->bind(node->name, module, Durability::Durable, node->token);
}
