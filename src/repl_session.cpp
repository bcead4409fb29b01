#include <cctype>
#include <vector>

#include "ClariceError.hpp"
#include "colors.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "repl.hpp"

static bool is_blank(const std::string& s) {
    for (unsigned char c : s)
        if (!std::isspace(c)) return false;
    return true;
}

ReplSession::ReplSession(OutputSink& out, InputSource& in, std::ostream& diag, bool color)
    : out_(out), diag_(diag), color_(color), evaluator_(out, in) {}

ReplSession::Status ReplSession::feed_line(const std::string& line) {
    buffer_ += line;
    buffer_.push_back('\n');

    if (is_blank(buffer_)) {
        buffer_.clear();
        return Status::Evaluated;
    }

    // The buffer's source lives only for this call: the AST is gone and every
    // error has been printed by the time it is released.
    struct SourceRelease {
        Evaluator& evaluator;
        const SourceManager* mgr;
        ~SourceRelease() { evaluator.release_source(mgr); }
    };
    const SourceManager* src_mgr = evaluator_.register_source("<repl>", buffer_);
    SourceRelease release{evaluator_, src_mgr};

    std::unique_ptr<ProgramNode> ast;
    try {
        Lexer lexer(buffer_, "<repl>", src_mgr);
        std::vector<Token> tokens = lexer.tokenize();

        Parser parser(tokens, true);
        ast = parser.parse();
    } catch (const LexError& e) {
        if (e.incomplete()) return Status::NeedMore;
        diag_ << Color::paint("Error: ", Color::bright_red, color_) << e.what() << std::endl;
        buffer_.clear();
        return Status::Failed;
    } catch (const ParseError& e) {
        if (e.incomplete()) return Status::NeedMore;
        diag_ << Color::paint("Error: ", Color::bright_red, color_) << e.what() << std::endl;
        buffer_.clear();
        return Status::Failed;
    }

    buffer_.clear();
    try {
        Value v = evaluator_.evaluate_interactive(ast.get());
        if (!is_null(v)) out_.write(display_string(v) + "\n");
    } catch (const ClariceError& e) {
        diag_ << Color::paint("Error: ", Color::bright_red, color_) << e.what() << std::endl;
        return Status::Failed;
    }
    return Status::Evaluated;
}
