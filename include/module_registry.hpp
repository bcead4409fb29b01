#pragma once
#include <map>
#include <string>
#include <vector>

#include "token.hpp"
#include "value.hpp"

// Maps package paths ("Clarice/Extra") to package modules whose members are
// the importable modules. Filled once and read-only afterwards.
class ModuleRegistry {
   public:
    ModuleRegistry() = default;

    // Process-wide registry holding the native packages.
    static const ModuleRegistry& builtin();

    void register_package(const std::string& path, ModulePtr package);

    bool has_package(const std::string& path) const;
    std::vector<std::string> package_paths() const;

    // Package for `path`; ModuleNotFoundError when unknown.
    ModulePtr resolve(const std::string& path, const Token& tok) const;

    // `using name from path`; ModuleNotFoundError when either part is unknown.
    Value resolve_member(const std::string& path, const std::string& name, const Token& tok) const;

   private:
    std::map<std::string, ModulePtr> packages_;
};
