#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ClariceError.hpp"
#include "SourceManager.hpp"
#include "ast.hpp"
#include "environment.hpp"
#include "io.hpp"
#include "module_registry.hpp"
#include "value.hpp"

// Statement outcome. Break is a control signal, not a value: it travels back
// up through with/if/blocks until the nearest loop or iter absorbs it.
struct ExecResult {
    enum class Flow {
        Normal,
        Break
    };
    Flow flow = Flow::Normal;
    Value value;  // value of an expression statement, null otherwise

    static ExecResult normal(const Value& v = std::monostate{}) {
        ExecResult r;
        r.value = v;
        return r;
    }
    static ExecResult breaking() {
        ExecResult r;
        r.flow = Flow::Break;
        return r;
    }
    bool is_break() const { return flow == Flow::Break; }
};

class Evaluator {
   public:
    Evaluator(OutputSink& out, InputSource& in, const ModuleRegistry& registry = ModuleRegistry::builtin());
    ~Evaluator();

    // Evaluate a whole program against the persistent top-level scope.
    // The caller keeps the ProgramNode alive for the duration of the call.
    void evaluate(ProgramNode* program);

    // REPL entry: like evaluate(), but hands back the value of a trailing
    // expression statement so the shell can echo it.
    Value evaluate_interactive(ProgramNode* program);

    // Discards every top-level binding and starts over with an empty scope.
    void reset_top_level();

    const EnvPtr& top_level() const { return top_level_; }

    // Script file being run; relative `using ... from "x.clrs"` paths resolve
    // against its directory.
    void set_entry_point(const std::string& filename);
    void set_module_search_path(const std::vector<std::string>& dirs);

    // Keeps source text alive for diagnostics that quote it later.
    const SourceManager* register_source(const std::string& filename, const std::string& source);

    // Drops a registered source. Nothing that points at it (tokens, AST,
    // unreported errors) may be used afterwards.
    void release_source(const SourceManager* mgr);

    size_t source_count() const { return sources_.size(); }

   private:
    OutputSink& out_;
    InputSource& in_;
    const ModuleRegistry& registry_;

    EnvPtr top_level_;
    std::string entry_file_;
    std::vector<std::string> search_path_;
    int loop_depth_ = 0;

    std::vector<std::unique_ptr<SourceManager>> sources_;

    // Script modules, keyed by canonical path.
    struct ModuleRecord {
        enum class State {
            Loading,
            Loaded
        };
        State state = State::Loading;
        ModulePtr exports;
        std::string path;
    };
    std::map<std::string, ModuleRecord> module_cache_;

    ExecResult run_program(ProgramNode* program, const EnvPtr& env);

    // statements (StatementEval.cpp)
    ExecResult evaluate_statement(StatementNode* stmt, const EnvPtr& env);
    ExecResult evaluate_with(WithStatementNode* node, const EnvPtr& env);
    ExecResult evaluate_with_alias(WithAliasStatementNode* node, const EnvPtr& env);
    ExecResult evaluate_if(IfStatementNode* node, const EnvPtr& env);
    ExecResult evaluate_loop(LoopStatementNode* node, const EnvPtr& env);
    ExecResult evaluate_iter(IterStatementNode* node, const EnvPtr& env);
    ExecResult evaluate_block(BlockStatementNode* node, const EnvPtr& env);
    ExecResult evaluate_sequence(SequenceStatementNode* node, const EnvPtr& env);
    ExecResult evaluate_prompt(PromptStatementNode* node, const EnvPtr& env);
    void evaluate_using(UsingStatementNode* node, const EnvPtr& env);

    // expressions (ExpressionEval.cpp)
    Value evaluate_expression(ExpressionNode* expr, const EnvPtr& env);
    Value evaluate_binary(BinaryExpressionNode* node, const EnvPtr& env);
    Value evaluate_unary(UnaryExpressionNode* node, const EnvPtr& env);
    Value evaluate_call(CallExpressionNode* node, const EnvPtr& env);
    Value evaluate_member(MemberExpressionNode* node, const EnvPtr& env);
    Value evaluate_template(TemplateLiteralNode* node, const EnvPtr& env);

    Value arithmetic(const std::string& op, const Value& left, const Value& right, const Token& tok);
    bool compare(const std::string& op, const Value& left, const Value& right, const Token& tok);

    // helpers (EvaluatorHelper.cpp)
    static bool to_condition(const Value& v, const Token& tok);

    // script modules (ModuleLoader.cpp)
    ModulePtr import_script_module(const std::string& request, const std::string& name, const Token& tok);
    std::string resolve_module_path(const std::string& request, const Token& tok) const;
};
