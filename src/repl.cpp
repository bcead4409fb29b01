#include <cstdlib>
#include <filesystem>
#include <iostream>

#include "colors.hpp"
#include "linenoise.h"
#include "repl.hpp"

namespace fs = std::filesystem;

void run_repl_mode(const CliConfig& cfg) {
    StreamOutput out(std::cout);
    StreamInput in(std::cin);
    ReplSession session(out, in, std::cerr, cfg.color);
    session.evaluator().set_module_search_path(cfg.module_path);

    std::cout << "Clarice v" << CLARICE_VERSION << " | built on " << __DATE__ << "\n";
    std::cout << "Type 'exit' or 'quit' or Ctrl-D to quit\n";

    const std::string& history_path = cfg.history_file;
    if (!history_path.empty()) {
        std::error_code ec;
        fs::path parent = fs::path(history_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent, ec);
        linenoiseHistoryLoad(history_path.c_str());
    }

    std::string last_added_history;

    while (true) {
        const char* prompt = session.has_pending_input() ? "...... " : "clarice> ";
        char* raw = linenoise(prompt);
        if (!raw) {  // EOF (Ctrl-D) or error
            std::cout << "\n";
            break;
        }

        std::string line(raw);
        linenoiseFree(raw);

        if (!session.has_pending_input() && (line == "exit" || line == "quit")) break;

        if (!line.empty() && line != last_added_history) {
            linenoiseHistoryAdd(line.c_str());
            last_added_history = line;
        }

        session.feed_line(line);
    }

    if (!history_path.empty() && linenoiseHistorySave(history_path.c_str()) != 0) {
        std::cerr << Color::paint("warning: ", Color::yellow, cfg.color)
                  << "could not save history to " << history_path << "\n";
    }
}
