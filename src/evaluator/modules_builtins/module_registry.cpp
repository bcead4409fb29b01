#include "module_registry.hpp"

#include "ClariceError.hpp"
#include "builtins.hpp"

static ModulePtr make_package(const std::string& path, const std::vector<ModulePtr>& modules) {
    auto package = std::make_shared<ModuleValue>(path);
    for (const auto& m : modules) package->define(m->name, m);
    return package;
}

const ModuleRegistry& ModuleRegistry::builtin() {
    static const ModuleRegistry registry = [] {
        ModuleRegistry r;
        r.register_package("Clarice/Extra", make_package("Clarice/Extra", {make_markdown_module()}));
        r.register_package("Clarice/Std", make_package("Clarice/Std", {make_text_module(), make_math_module(), make_lists_module(), make_convert_module()}));
        return r;
    }();
    return registry;
}

void ModuleRegistry::register_package(const std::string& path, ModulePtr package) {
    packages_[path] = std::move(package);
}

bool ModuleRegistry::has_package(const std::string& path) const {
    return packages_.find(path) != packages_.end();
}

std::vector<std::string> ModuleRegistry::package_paths() const {
    std::vector<std::string> out;
    for (const auto& kv : packages_) out.push_back(kv.first);
    return out;
}

ModulePtr ModuleRegistry::resolve(const std::string& path, const Token& tok) const {
    auto it = packages_.find(path);
    if (it == packages_.end()) {
        throw ModuleNotFoundError("No module package named '" + path + "'", tok.loc);
    }
    return it->second;
}

Value ModuleRegistry::resolve_member(const std::string& path, const std::string& name, const Token& tok) const {
    ModulePtr package = resolve(path, tok);
    const Value* member = package->member(name);
    if (!member) {
        std::string available;
        for (const auto& kv : package->members) {
            if (!available.empty()) available += ", ";
            available += kv.first;
        }
        throw ModuleNotFoundError("Package '" + path + "' has no module '" + name + "' (available: " + available + ")", tok.loc);
    }
    return *member;
}
