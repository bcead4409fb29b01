#include "config.hpp"

#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

std::string usage_text() {
    std::ostringstream ss;
    ss << "Usage: clarice [options] [file]\n"
       << "Options:\n"
       << "  -v, --version    Print version and exit\n"
       << "  -i               Start REPL (interactive)\n"
       << "  -h, --help       Show this help message\n"
       << "      --tokens     Print the token stream of the file and exit\n"
       << "      --ast        Print the parsed program in canonical form and exit\n"
       << "      --no-color   Plain diagnostics\n"
       << "\n"
       << "If a filename starts with '-', either use `--` to end options\n"
       << "or prefix the filename with a path (for example `./-weird.clrs`):\n"
       << "  clarice -- -weird.clrs\n";
    return ss.str();
}

CliConfig parse_command_line(const std::vector<std::string>& args) {
    CliConfig cfg;
    bool seen_double_dash = false;

    for (const auto& arg : args) {
        if (seen_double_dash) {
            cfg.script = arg;
            break;
        }

        if (arg == "--") {
            seen_double_dash = true;
            continue;
        }

        if (!arg.empty() && arg[0] == '-') {
            if (arg == "-v" || arg == "--version") {
                cfg.show_version = true;
            } else if (arg == "-h" || arg == "--help") {
                cfg.show_help = true;
            } else if (arg == "-i") {
                cfg.interactive = true;
            } else if (arg == "--tokens") {
                cfg.dump_tokens = true;
            } else if (arg == "--ast") {
                cfg.dump_ast = true;
            } else if (arg == "--no-color") {
                cfg.color = false;
            } else {
                throw UsageError("unknown option '" + arg + "'");
            }
            continue;
        }

        cfg.script = arg;
        break;
    }

    if (cfg.script.empty()) {
        if (cfg.dump_tokens || cfg.dump_ast) {
            throw UsageError("--tokens and --ast need a file");
        }
        cfg.interactive = true;
    }
    return cfg;
}

void apply_environment(CliConfig& cfg, const EnvLookup& getenv_fn) {
    if (const char* path = getenv_fn("CLARICE_PATH")) {
        std::stringstream ss(path);
        std::string dir;
        while (std::getline(ss, dir, ':')) {
            if (!dir.empty()) cfg.module_path.push_back(dir);
        }
    }

    const char* no_color = getenv_fn("NO_COLOR");
    if (no_color && no_color[0] != '\0') cfg.color = false;

    const char* history = getenv_fn("CLARICE_HISTORY");
    if (history && history[0] != '\0') {
        cfg.history_file = history;
    } else if (const char* home = getenv_fn("HOME"); home && home[0] != '\0') {
        cfg.history_file = (fs::path(home) / ".clarice_history").string();
    } else {
        cfg.history_file = ".clarice_history";
    }
}

std::optional<std::string> resolve_script_path(const std::string& name) {
    fs::path p(name);
    std::error_code ec;
    if (fs::is_regular_file(p, ec)) return p.string();
    if (p.has_extension()) return std::nullopt;

    fs::path candidate = p;
    candidate += ".clrs";
    if (fs::is_regular_file(candidate, ec)) return candidate.string();
    return std::nullopt;
}
