#include <filesystem>
#include <fstream>
#include <sstream>

#include "evaluator.hpp"
#include "lexer.hpp"
#include "parser.hpp"
namespace fs = std::filesystem;

static const char* const kScriptExtension = ".clrs";

// Resolve a `using x from "path"` specifier to an existing file. Tries, in order:
// - the requesting file's directory (cwd for the REPL)
// - the entry script's directory
// - every CLARICE_PATH directory
// For each base the request is tried as written, then with ".clrs" when it has no extension.
std::string Evaluator::resolve_module_path(const std::string& request, const Token& tok) const {
    fs::path requestPath(request);

    auto try_candidate = [&](const fs::path& cand) -> std::string {
        std::error_code ec;
        if (fs::is_regular_file(cand, ec)) return fs::weakly_canonical(cand, ec).string();
        if (!cand.has_extension()) {
            fs::path withExt = cand;
            withExt += kScriptExtension;
            if (fs::is_regular_file(withExt, ec)) return fs::weakly_canonical(withExt, ec).string();
        }
        return "";
    };

    if (requestPath.is_absolute()) {
        std::string found = try_candidate(requestPath);
        if (!found.empty()) return found;
        throw ModuleNotFoundError("Module file '" + request + "' not found", tok.loc);
    }

    std::vector<fs::path> bases;
    const std::string& requester = tok.loc.filename;
    if (requester.empty() || requester == "<repl>" || requester == "<stdin>") {
        bases.push_back(fs::current_path());
    } else {
        bases.push_back(fs::path(requester).parent_path());
    }
    if (!entry_file_.empty()) {
        bases.push_back(fs::path(entry_file_).parent_path());
    }
    for (const auto& dir : search_path_) {
        if (!dir.empty()) bases.push_back(fs::path(dir));
    }

    for (const auto& base : bases) {
        std::string found = try_candidate(base / requestPath);
        if (!found.empty()) return found;
    }

    throw ModuleNotFoundError("Module file '" + request + "' not found", tok.loc);
}

// Loads, parses and runs a script module in its own top-level scope, then
// exports every binding that scope holds. Results are cached by canonical path;
// a module that is still loading when it is requested again is a cycle.
ModulePtr Evaluator::import_script_module(const std::string& request, const std::string& name, const Token& tok) {
    const std::string path = resolve_module_path(request, tok);

    auto it = module_cache_.find(path);
    if (it != module_cache_.end()) {
        if (it->second.state == ModuleRecord::State::Loading) {
            throw ModuleNotFoundError("circular import of '" + request + "' (" + path + ")", tok.loc);
        }
        return it->second.exports;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ModuleNotFoundError("Unable to open module file '" + path + "'", tok.loc);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    std::string src = ss.str();
    if (src.empty() || src.back() != '\n') src.push_back('\n');

    ModuleRecord& rec = module_cache_[path];
    rec.state = ModuleRecord::State::Loading;
    rec.path = path;

    int saved_loop_depth = loop_depth_;
    try {
        const SourceManager* mgr = register_source(path, src);
        Lexer lexer(src, path, mgr);
        std::vector<Token> tokens = lexer.tokenize();
        Parser parser(tokens);
        std::unique_ptr<ProgramNode> ast = parser.parse();

        auto module_env = std::make_shared<Environment>(nullptr);
        loop_depth_ = 0;
        run_program(ast.get(), module_env);
        loop_depth_ = saved_loop_depth;

        std::string module_name = fs::path(path).stem().string();
        if (module_name.empty()) module_name = name;
        auto exports = std::make_shared<ModuleValue>(module_name);
        for (const auto& kv : module_env->bindings()) {
            exports->define(kv.first, kv.second.value);
        }
        module_env->pop_scope();

        ModuleRecord& done = module_cache_[path];
        done.exports = exports;
        done.state = ModuleRecord::State::Loaded;
        return exports;
    } catch (...) {
        loop_depth_ = saved_loop_depth;
        module_cache_.erase(path);
        throw;
    }
}
