#include "memory_tracking.hpp"

namespace MemoryTracking {
std::atomic<size_t> g_list_count{0};
std::atomic<size_t> g_function_count{0};
std::atomic<size_t> g_module_count{0};
std::atomic<size_t> g_scope_count{0};

std::atomic<size_t> g_list_elements{0};
}  // namespace MemoryTracking
