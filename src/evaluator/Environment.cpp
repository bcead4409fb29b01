//src/evaluator/Environment.cpp
#include "environment.hpp"

#include "ClariceError.hpp"
#include "memory_tracking.hpp"

// ----------------- Environment methods -----------------

Environment::Environment(Environment* parent) : parent_(parent) {
   MemoryTracking::g_scope_count.fetch_add(1);
}

Environment::~Environment() {
   MemoryTracking::g_scope_count.fetch_sub(1);
}

Environment::Binding* Environment::find(const std::string& name) {
   for (Environment* env = this; env; env = env->parent_) {
      auto it = env->values_.find(name);
      if (it != env->values_.end()) return &it->second;
   }
   return nullptr;
}

const Environment::Binding* Environment::find(const std::string& name) const {
   for (const Environment* env = this; env; env = env->parent_) {
      auto it = env->values_.find(name);
      if (it != env->values_.end()) return &it->second;
   }
   return nullptr;
}

bool Environment::has_local(const std::string& name) const {
   return values_.find(name) != values_.end();
}

const Value& Environment::lookup(const std::string& name, const Token& tok) const {
   const Binding* b = find(name);
   if (!b) {
      throw NameError("'" + name + "' is not defined in this scope", tok.loc);
   }
   return b->value;
}

void Environment::bind(const std::string& name, const Value& value, Durability durability, const Token& tok) {
   auto it = values_.find(name);
   if (it != values_.end() && durability == Durability::Durable) {
      throw NameError("'" + name + "' is already declared in this scope", tok.loc);
   }
   values_[name] = Binding{value, durability};
}

void Environment::rebind(const std::string& name, const Value& value, const Token& tok) {
   Binding* b = find(name);
   if (!b) {
      throw NameError("Cannot set '" + name + "': it was never declared (use 'let " + name + "' first)", tok.loc);
   }
   b->value = value;
}

EnvPtr Environment::push_scope() {
   return std::make_shared<Environment>(this);
}

void Environment::pop_scope() {
   // move out first so destructors running during release never see a
   // half-cleared map
   std::unordered_map<std::string, Binding> released;
   released.swap(values_);
}

size_t Environment::depth() const {
   size_t d = 0;
   for (const Environment* env = parent_; env; env = env->parent_) ++d;
   return d;
}
