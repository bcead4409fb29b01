#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "memory_tracking.hpp"
#include "token.hpp"

struct ListValue;
using ListPtr = std::shared_ptr<ListValue>;

struct FunctionValue;
using FunctionPtr = std::shared_ptr<FunctionValue>;

struct ModuleValue;
using ModulePtr = std::shared_ptr<ModuleValue>;

// Runtime value. std::monostate is null. Heap kinds are shared by reference
// and reclaimed when the last binding, list slot or module member lets go.
using Value = std::variant<
    std::monostate,
    bool,
    std::int64_t,
    double,
    std::string,
    ListPtr,
    FunctionPtr,
    ModulePtr>;

// Lists are built once (literal, concatenation, builtin) and never mutated
// afterwards, which is what keeps the object graph acyclic.
struct ListValue {
    std::vector<Value> elements;

    ListValue() {
        MemoryTracking::g_list_count.fetch_add(1);
    }
    explicit ListValue(std::vector<Value> elems) : elements(std::move(elems)) {
        MemoryTracking::g_list_count.fetch_add(1);
        MemoryTracking::g_list_elements.fetch_add(elements.size());
    }
    ListValue(const ListValue&) = delete;
    ListValue& operator=(const ListValue&) = delete;
    ~ListValue() {
        MemoryTracking::g_list_count.fetch_sub(1);
        MemoryTracking::g_list_elements.fetch_sub(elements.size());
    }
};

using NativeFn = std::function<Value(const std::vector<Value>&, const Token&)>;

// Callable exposed by a module. arity < 0 accepts any argument count.
struct FunctionValue {
    std::string name;
    int arity = -1;
    NativeFn native_impl;

    FunctionValue(const std::string& nm, int ar, NativeFn impl)
        : name(nm), arity(ar), native_impl(std::move(impl)) {
        MemoryTracking::g_function_count.fetch_add(1);
    }
    FunctionValue(const FunctionValue&) = delete;
    FunctionValue& operator=(const FunctionValue&) = delete;
    ~FunctionValue() {
        MemoryTracking::g_function_count.fetch_sub(1);
    }
};

// Named bag of members: callables, constants or nested modules.
struct ModuleValue {
    std::string name;
    std::map<std::string, Value> members;

    explicit ModuleValue(const std::string& nm) : name(nm) {
        MemoryTracking::g_module_count.fetch_add(1);
    }
    ModuleValue(const ModuleValue&) = delete;
    ModuleValue& operator=(const ModuleValue&) = delete;
    ~ModuleValue() {
        MemoryTracking::g_module_count.fetch_sub(1);
    }

    // nullptr when the member does not exist
    const Value* member(const std::string& key) const {
        auto it = members.find(key);
        if (it == members.end()) return nullptr;
        return &it->second;
    }

    void define(const std::string& key, const Value& v) {
        members[key] = v;
    }

    void define_function(const std::string& key, int arity, NativeFn impl) {
        members[key] = std::make_shared<FunctionValue>(name + "." + key, arity, std::move(impl));
    }
};

// helpers (src/evaluator/EvaluatorHelper.cpp)

// "null", "bool", "int", "float", "string", "list", "function", "module"
std::string type_name(const Value& v);

// Text used by print, templates and `..`. Strings are verbatim at the top
// level and quoted inside lists.
std::string display_string(const Value& v);

// Shortest decimal that reads back to the same double, with ".0" appended
// when the result would otherwise look like an integer.
std::string format_float(double d);

// Structural equality: ints and floats compare numerically, lists element
// by element, functions and modules by identity. Mismatched kinds are unequal.
bool values_equal(const Value& a, const Value& b);

// -1, 0 or 1 for two numbers, exact for every int/float pair (no rounding of
// the int through double). Neither operand may be NaN.
int compare_numbers(const Value& a, const Value& b);

// Splits UTF-8 text into one string per code point. A byte that does not
// start a well-formed sequence stands alone.
std::vector<std::string> utf8_chars(const std::string& s);
size_t utf8_length(const std::string& s);

inline bool is_null(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

inline bool is_numeric(const Value& v) {
    return std::holds_alternative<std::int64_t>(v) || std::holds_alternative<double>(v);
}

// Caller must check is_numeric first.
inline double as_double(const Value& v) {
    if (std::holds_alternative<std::int64_t>(v)) return static_cast<double>(std::get<std::int64_t>(v));
    return std::get<double>(v);
}
