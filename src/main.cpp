#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "colors.hpp"
#include "config.hpp"
#include "io.hpp"
#include "repl.hpp"
#include "runner.hpp"

namespace fs = std::filesystem;

int main(int argc, char* argv[]) {
  CliConfig cfg;
  try {
    cfg = parse_command_line(std::vector < std::string > (argv + 1, argv + argc));
  } catch (const UsageError &e) {
    std::cerr << "clarice: " << e.what() << "\n";
    std::cerr << "Try 'clarice --help' for more information.\n";
    return 1;
  }
  apply_environment(cfg, [](const char* name) {
    return static_cast < const char* > (std::getenv(name));
  });
  if (cfg.color && !Color::supports_color()) cfg.color = false;

  if (cfg.show_help) {
    std::cout << usage_text();
    return 0;
  }
  if (cfg.show_version) {
    std::cout << "clarice v" << CLARICE_VERSION << std::endl;
    return 0;
  }

  if (cfg.interactive) {
    run_repl_mode(cfg);
    return 0;
  }

  auto resolved = resolve_script_path(cfg.script);
  if (!resolved.has_value()) {
    std::cerr << Color::paint("Error: ", Color::bright_red, cfg.color)
              << "File not found: " << cfg.script;
    if (fs::path(cfg.script).extension().empty()) std::cerr << " (also tried " << cfg.script << ".clrs)";
    std::cerr << std::endl;
    return 1;
  }

  StreamOutput out(std::cout);
  try {
    UvStdinInput in;
    return run_script_file(resolved.value(), cfg, out, in, std::cerr);
  } catch (const std::runtime_error &e) {
    // stdin could not be attached to the event loop
    std::cerr << Color::paint("Error: ", Color::bright_red, cfg.color) << e.what() << std::endl;
    return 1;
  }
}
