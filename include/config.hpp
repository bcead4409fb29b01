#pragma once
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Bad command line; main prints it together with the usage hint.
class UsageError : public std::runtime_error {
   public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

struct CliConfig {
    bool show_help = false;
    bool show_version = false;
    bool interactive = false;  // -i, or no script given
    bool dump_tokens = false;  // --tokens
    bool dump_ast = false;     // --ast
    bool color = true;

    std::string script;  // empty: REPL
    std::vector<std::string> module_path;
    std::string history_file;
};

using EnvLookup = std::function<const char*(const char*)>;

// clarice [options] [file]. The first non-option argument (or the first
// argument after `--`) is the script; whatever follows is ignored.
CliConfig parse_command_line(const std::vector<std::string>& args);

// CLARICE_PATH (colon separated), NO_COLOR, CLARICE_HISTORY.
void apply_environment(CliConfig& cfg, const EnvLookup& getenv_fn);

// `name`, or `name.clrs` when `name` does not exist and has no extension.
std::optional<std::string> resolve_script_path(const std::string& name);

std::string usage_text();
