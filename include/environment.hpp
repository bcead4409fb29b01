#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "token.hpp"
#include "value.hpp"

class Environment;
using EnvPtr = std::shared_ptr<Environment>;

enum class Durability {
    Transient,  // `with`, `iter`: dies with the construct that introduced it
    Durable     // `let`, `using`: lives as long as its scope
};

// One lexical scope. The parent pointer is lookup-only; a scope never keeps
// its parent alive (the evaluator's call structure does).
class Environment {
   public:
    struct Binding {
        Value value;
        Durability durability = Durability::Durable;
    };

    explicit Environment(Environment* parent = nullptr);
    ~Environment();
    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    Environment* parent() const { return parent_; }

    // innermost binding for name, or nullptr
    Binding* find(const std::string& name);
    const Binding* find(const std::string& name) const;
    bool has(const std::string& name) const { return find(name) != nullptr; }
    bool has_local(const std::string& name) const;

    // NameError when the name is not bound anywhere in the chain.
    const Value& lookup(const std::string& name, const Token& tok) const;

    // Adds a binding to this scope. Durable redeclaration in the same scope is
    // a NameError; transient bindings replace whatever the scope held.
    void bind(const std::string& name, const Value& value, Durability durability, const Token& tok);

    // `set`: assigns to the nearest existing binding, keeping its durability.
    void rebind(const std::string& name, const Value& value, const Token& tok);

    // Child scope whose parent is this one. The child is released by pop_scope()
    // and by dropping the last EnvPtr to it.
    EnvPtr push_scope();

    // Drops every binding held here, releasing values nothing else refers to.
    void pop_scope();

    const std::unordered_map<std::string, Binding>& bindings() const { return values_; }
    size_t depth() const;

   private:
    std::unordered_map<std::string, Binding> values_;
    Environment* parent_;
};

// push_scope() for the lifetime of a C++ block: the scope is popped on normal
// completion, on Break unwinding and while an error propagates.
class ScopeGuard {
   public:
    explicit ScopeGuard(Environment& parent) : scope_(parent.push_scope()) {}
    ~ScopeGuard() { scope_->pop_scope(); }
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    const EnvPtr& scope() const { return scope_; }

   private:
    EnvPtr scope_;
};
