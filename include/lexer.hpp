#pragma once

#include <string>
#include <vector>

#include "token.hpp"

class Lexer {
   public:
    Lexer(const std::string& source, const std::string& filename = "", const SourceManager* mgr = nullptr);

    // Materializes the whole token stream, terminated by EOF_TOKEN.
    // Throws LexError on the first malformed token.
    std::vector<Token> tokenize();

   private:
    const std::string src;
    const std::string filename;
    size_t i = 0;
    int line = 1;
    int col = 1;
    const SourceManager* src_mgr = nullptr;

    // helpers
    bool eof() const;
    char peek(size_t offset = 0) const;
    char peek_next() const;
    char advance();
    TokenLocation location(int tok_line, int tok_col, int tok_length = 0) const;

    // Add token: optional explicit length (if -1, length is value.size()).
    void add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length = -1);

    void skip_whitespace_and_comments();
    void scan_token(std::vector<Token>& out);
    void scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);
    void scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);

    // "..." and """...""" strings; emits TEMPLATE_* tokens when the body contains ${...}
    void scan_string(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);
    void scan_template_expression(std::vector<Token>& out);
    char scan_escape(int tok_line, int tok_col);
};
