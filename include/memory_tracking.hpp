#pragma once

#include <atomic>
#include <cstddef>

// Live counts of heap-allocated runtime values. Incremented by the value
// constructors and decremented by their destructors, so a count dropping back
// means the last reference was released.
namespace MemoryTracking {
extern std::atomic<size_t> g_list_count;
extern std::atomic<size_t> g_function_count;
extern std::atomic<size_t> g_module_count;
extern std::atomic<size_t> g_scope_count;

// Element slots held by live lists
extern std::atomic<size_t> g_list_elements;

struct Snapshot {
    size_t lists = 0;
    size_t functions = 0;
    size_t modules = 0;
    size_t scopes = 0;
    size_t list_elements = 0;
};

inline Snapshot snapshot() {
    Snapshot s;
    s.lists = g_list_count.load();
    s.functions = g_function_count.load();
    s.modules = g_module_count.load();
    s.scopes = g_scope_count.load();
    s.list_elements = g_list_elements.load();
    return s;
}
}  // namespace MemoryTracking
