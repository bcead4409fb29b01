#include "runner.hpp"

#include <fstream>
#include <sstream>
#include <vector>

#include "ClariceError.hpp"
#include "colors.hpp"
#include "evaluator.hpp"
#include "format/format.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "print_debug.hpp"

static void report(std::ostream& diag, const std::string& msg, bool color) {
    diag << Color::paint("Error: ", Color::bright_red, color) << msg << std::endl;
}

int run_script_file(const std::string& path, const CliConfig& cfg, OutputSink& out, InputSource& in, std::ostream& diag) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        report(diag, "Could not open file " + path, cfg.color);
        return 1;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return run_script_source(path, buffer.str(), cfg, out, in, diag);
}

int run_script_source(const std::string& filename, const std::string& source, const CliConfig& cfg, OutputSink& out, InputSource& in, std::ostream& diag) {
    std::string source_code = source;
    if (source_code.empty() || source_code.back() != '\n') source_code.push_back('\n');

    try {
        Evaluator evaluator(out, in);
        evaluator.set_entry_point(filename);
        evaluator.set_module_search_path(cfg.module_path);
        const SourceManager* src_mgr = evaluator.register_source(filename, source_code);

        Lexer lexer(source_code, filename, src_mgr);
        std::vector<Token> tokens = lexer.tokenize();

        if (cfg.dump_tokens) {
            std::ostringstream ss;
            print_tokens(tokens, ss);
            out.write(ss.str());
            return 0;
        }

        Parser parser(tokens);
        std::unique_ptr<ProgramNode> ast = parser.parse();

        if (cfg.dump_ast) {
            out.write(format_program(ast.get()));
            return 0;
        }

        evaluator.evaluate(ast.get());
    } catch (const ClariceError& e) {
        report(diag, e.what(), cfg.color);
        return 1;
    } catch (const std::exception& e) {
        report(diag, std::string("internal error: ") + e.what(), cfg.color);
        return 1;
    }
    return 0;
}
