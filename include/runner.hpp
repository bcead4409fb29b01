#pragma once
#include <ostream>
#include <string>

#include "config.hpp"
#include "io.hpp"

// Script mode: runs `path` in a fresh interpreter. Diagnostics go to `diag`
// as "Error: ..."; the return value is the process exit status (0 or 1).
// With cfg.dump_tokens / cfg.dump_ast the dump is written to `out` instead
// of running the program.
int run_script_file(const std::string& path, const CliConfig& cfg, OutputSink& out, InputSource& in, std::ostream& diag);

// Same, over source text that did not come from disk.
int run_script_source(const std::string& filename, const std::string& source, const CliConfig& cfg, OutputSink& out, InputSource& in, std::ostream& diag);
