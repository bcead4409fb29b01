#include <sstream>

#include "format/format.hpp"

std::string format_program(ProgramNode* program) {
    if (!program) return "";
    std::ostringstream ss;

    for (auto& stmt_uptr : program->body) {
        ss << format_statement(stmt_uptr.get(), 0) << "\n";
    }

    return ss.str();
}

std::string quote_string(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        switch (c) {
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '$':
                out += "\\$";
                break;
            default:
                out += c;
        }
    }
    out += "\"";
    return out;
}
