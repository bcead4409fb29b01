// src/evaluator/Evaluator.cpp
#include <algorithm>

#include "evaluator.hpp"

Evaluator::Evaluator(OutputSink& out, InputSource& in, const ModuleRegistry& registry)
    : out_(out), in_(in), registry_(registry), top_level_(std::make_shared<Environment>(nullptr)) {}

Evaluator::~Evaluator() = default;

void Evaluator::evaluate(ProgramNode* program) {
    if (!program) return;
    run_program(program, top_level_);
}

Value Evaluator::evaluate_interactive(ProgramNode* program) {
    if (!program) return std::monostate{};
    ExecResult r = run_program(program, top_level_);
    if (program->body.empty()) return std::monostate{};
    if (!dynamic_cast<ExpressionStatementNode*>(program->body.back().get())) return std::monostate{};
    return r.value;
}

ExecResult Evaluator::run_program(ProgramNode* program, const EnvPtr& env) {
    ExecResult last;
    for (auto& stmt : program->body) {
        if (!stmt) continue;
        last = evaluate_statement(stmt.get(), env);
        if (last.is_break()) {
            throw ControlFlowError("'break' used outside of a loop", stmt->token.loc);
        }
    }
    return last;
}

void Evaluator::reset_top_level() {
    top_level_->pop_scope();
    top_level_ = std::make_shared<Environment>(nullptr);
}

void Evaluator::set_entry_point(const std::string& filename) {
    entry_file_ = filename;
}

void Evaluator::set_module_search_path(const std::vector<std::string>& dirs) {
    search_path_ = dirs;
}

const SourceManager* Evaluator::register_source(const std::string& filename, const std::string& source) {
    sources_.push_back(std::make_unique<SourceManager>(filename, source));
    return sources_.back().get();
}

void Evaluator::release_source(const SourceManager* mgr) {
    auto it = std::find_if(sources_.begin(), sources_.end(), [mgr](const std::unique_ptr<SourceManager>& s) { return s.get() == mgr; });
    if (it != sources_.end()) sources_.erase(it);
}
