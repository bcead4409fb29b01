#include <sstream>

#include "format/format.hpp"

namespace {

// True when the statement's text ends in an `if` with no `else`, where a
// following `else` would be taken by that inner `if`.
bool ends_with_open_if(StatementNode* stmt) {
    if (!stmt) return false;
    if (auto ifn = dynamic_cast<IfStatementNode*>(stmt)) {
        return ifn->else_branch ? ends_with_open_if(ifn->else_branch.get()) : true;
    }
    if (auto ws = dynamic_cast<WithStatementNode*>(stmt)) return ends_with_open_if(ws->body.get());
    if (auto wa = dynamic_cast<WithAliasStatementNode*>(stmt)) return ends_with_open_if(wa->body.get());
    if (auto it = dynamic_cast<IterStatementNode*>(stmt)) return ends_with_open_if(it->body.get());
    if (auto pr = dynamic_cast<PromptStatementNode*>(stmt)) return ends_with_open_if(pr->then_statement.get());
    if (auto sq = dynamic_cast<SequenceStatementNode*>(stmt)) {
        return !sq->statements.empty() && ends_with_open_if(sq->statements.back().get());
    }
    return false;
}

// True when the statement's text begins with the `do` keyword.
bool starts_with_do(StatementNode* stmt) {
    if (dynamic_cast<BlockStatementNode*>(stmt)) return true;
    if (auto sq = dynamic_cast<SequenceStatementNode*>(stmt)) {
        return !sq->statements.empty() && starts_with_do(sq->statements.front().get());
    }
    return false;
}

std::string format_body(const std::vector<std::unique_ptr<StatementNode>>& body, int depth) {
    std::ostringstream ss;
    std::string indent(depth * 2, ' ');
    for (auto& s : body) {
        ss << indent << format_statement(s.get(), depth) << "\n";
    }
    return ss.str();
}

}  // namespace

// Single-statement bodies stay on the line of their header; only `do` blocks
// and loops open new lines. `depth` is the indentation of the line the
// statement starts on.
std::string format_statement(StatementNode* stmt, int depth) {
    if (!stmt) return "";

    std::string indent(depth * 2, ' ');

    if (auto ws = dynamic_cast<WithStatementNode*>(stmt)) {
        std::string value = format_expression(ws->value.get());
        // `with x as y do ...` would read back as the alias form
        if (dynamic_cast<IdentifierNode*>(ws->value.get()) && starts_with_do(ws->body.get())) {
            value = "(" + value + ")";
        }
        return "with " + ws->name + " as " + value + " " + format_statement(ws->body.get(), depth);
    }

    if (auto wa = dynamic_cast<WithAliasStatementNode*>(stmt)) {
        std::string target = format_expression(wa->target.get());
        return "with " + target + " as " + wa->alias + " do " + format_statement(wa->body.get(), depth);
    }

    if (auto ls = dynamic_cast<LetStatementNode*>(stmt)) {
        std::string s = "let " + ls->name;
        if (!ls->type_hint.empty()) s += " as " + ls->type_hint;
        return s;
    }

    if (auto ss = dynamic_cast<SetStatementNode*>(stmt)) {
        return "set " + ss->name + " to " + format_expression(ss->value.get());
    }

    if (auto ifn = dynamic_cast<IfStatementNode*>(stmt)) {
        std::ostringstream ss;
        ss << "if " << format_expression(ifn->condition.get()) << " then ";
        if (ifn->else_branch && ends_with_open_if(ifn->then_branch.get())) {
            ss << "do\n"
               << std::string((depth + 1) * 2, ' ') << format_statement(ifn->then_branch.get(), depth + 1) << "\n"
               << indent << "end";
        } else {
            ss << format_statement(ifn->then_branch.get(), depth);
        }
        if (ifn->else_branch) {
            ss << " else " << format_statement(ifn->else_branch.get(), depth);
        }
        return ss.str();
    }

    if (auto lp = dynamic_cast<LoopStatementNode*>(stmt)) {
        return "loop do\n" + format_body(lp->body, depth + 1) + indent + "end";
    }

    if (auto it = dynamic_cast<IterStatementNode*>(stmt)) {
        return "iter " + it->variable + " in " + format_expression(it->iterable.get()) + " do " +
               format_statement(it->body.get(), depth);
    }

    if (auto bs = dynamic_cast<BlockStatementNode*>(stmt)) {
        return "do\n" + format_body(bs->body, depth + 1) + indent + "end";
    }

    if (auto sq = dynamic_cast<SequenceStatementNode*>(stmt)) {
        std::string out;
        for (size_t i = 0; i < sq->statements.size(); i++) {
            if (i > 0) out += " and ";
            out += format_statement(sq->statements[i].get(), depth);
        }
        return out;
    }

    if (dynamic_cast<BreakStatementNode*>(stmt)) {
        return "break";
    }

    if (auto ps = dynamic_cast<PrintStatementNode*>(stmt)) {
        return "print " + format_expression(ps->expression.get());
    }

    if (auto pr = dynamic_cast<PromptStatementNode*>(stmt)) {
        return "prompt " + quote_string(pr->message) + " then " + format_statement(pr->then_statement.get(), depth);
    }

    if (auto us = dynamic_cast<UsingStatementNode*>(stmt)) {
        std::string path = us->is_file_path ? quote_string(us->module_path) : us->module_path;
        return "using " + us->name + " from " + path;
    }

    if (auto es = dynamic_cast<ExpressionStatementNode*>(stmt)) {
        return format_expression(es->expression.get());
    }

    return stmt->to_string();
}
