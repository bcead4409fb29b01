#pragma once

#include <algorithm>
#include <string>

#include "SourceManager.hpp"

// Token types (keep in sync with the lexer keyword table and print_tokens)
enum class TokenType {
    // -----------------------
    // Binding / statements
    // -----------------------
    WITH,
    AS,
    LET,
    SET,
    TO,
    PRINT,
    PROMPT,
    USING,  // 'using' (import)
    FROM,   // 'from'

    // -----------------------
    // Control-flow
    // -----------------------
    IF,
    THEN,
    ELSE,
    LOOP,
    ITER,
    IN,
    DO,
    END,
    BREAK,

    // sequencing sugar: `print a and print b`
    AND,

    // -----------------------
    // Literals & identifiers
    // -----------------------
    IDENTIFIER,
    INTEGER,
    FLOAT,
    STRING,               // "..." or """...""" without interpolation
    TEMPLATE_CHUNK,       // raw text inside an interpolated string
    TEMPLATE_EXPR_START,  // "${"
    TEMPLATE_EXPR_END,    // "}" that closes interpolation
    TEMPLATE_END,         // closing quote(s) of an interpolated string
    BOOLEAN,
    NULL_LITERAL,

    // -----------------------
    // Punctuation
    // -----------------------
    COMMA,
    DOT,
    OPENPARENTHESIS,
    CLOSEPARENTHESIS,
    OPENBRACKET,
    CLOSEBRACKET,

    // -----------------------
    // Arithmetic
    // -----------------------
    PLUS,
    MINUS,
    STAR,
    SLASH,
    PERCENT,
    CONCAT,  // ..

    // -----------------------
    // Comparison
    // -----------------------
    EQUALITY,  // '=' is comparison; assignment is `set ... to`
    NOTEQUAL,
    LESSTHAN,
    LESSOREQUALTHAN,
    GREATERTHAN,
    GREATEROREQUALTHAN,

    EOF_TOKEN,
    UNKNOWN
};

// Small struct for token location / span in source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<repl>")
    int line = 1;          // 1-based
    int col = 1;           // 1-based column of token start
    int length = 0;        // token length in characters

    const SourceManager* src_mgr = nullptr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, const SourceManager* mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(mgr) {}

    int end_col() const { return col + std::max(0, length - 1); }

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Represents a single token with location
struct Token {
    TokenType type = TokenType::UNKNOWN;
    std::string value;  // raw text / decoded string contents
    TokenLocation loc;

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}

    const std::string& filename() const { return loc.filename; }
    int line() const { return loc.line; }
    int col() const { return loc.col; }
    int length() const { return loc.length; }

    std::string debug_string() const {
        return loc.to_string() + " [" + value + "]";
    }
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->format_error_context(line, col);
}

// Human readable name of a token type, used by diagnostics and the token dump.
std::string token_type_name(TokenType t);

// Text used in "expected X, found Y" parse errors.
std::string describe_token(const Token& tok);
