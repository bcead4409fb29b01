#include "lexer.hpp"

#include <cctype>
#include <stdexcept>
#include <unordered_map>

#include "ClariceError.hpp"

static const std::unordered_map<std::string, TokenType>& keyword_table() {
    static const std::unordered_map<std::string, TokenType> keywords = {
        {"with", TokenType::WITH},
        {"as", TokenType::AS},
        {"let", TokenType::LET},
        {"set", TokenType::SET},
        {"to", TokenType::TO},
        {"if", TokenType::IF},
        {"then", TokenType::THEN},
        {"else", TokenType::ELSE},
        {"loop", TokenType::LOOP},
        {"iter", TokenType::ITER},
        {"in", TokenType::IN},
        {"do", TokenType::DO},
        {"end", TokenType::END},
        {"break", TokenType::BREAK},
        {"print", TokenType::PRINT},
        {"prompt", TokenType::PROMPT},
        {"using", TokenType::USING},
        {"from", TokenType::FROM},
        {"and", TokenType::AND},
        {"true", TokenType::BOOLEAN},
        {"false", TokenType::BOOLEAN},
        {"null", TokenType::NULL_LITERAL}};
    return keywords;
}

// Constructor
Lexer::Lexer(const std::string& source, const std::string& filename, const SourceManager* mgr)
    : src(source), filename(filename), i(0), line(1), col(1), src_mgr(mgr) {}

bool Lexer::eof() const {
    return i >= src.size();
}
char Lexer::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}
char Lexer::peek_next() const {
    return peek(1);
}

char Lexer::advance() {
    if (eof()) return '\0';
    char c = src[i++];
    if (c == '\n') {
        line++;
        col = 1;
    } else {
        col++;
    }
    return c;
}

TokenLocation Lexer::location(int tok_line, int tok_col, int tok_length) const {
    return TokenLocation(filename.empty() ? "<repl>" : filename, tok_line, tok_col, tok_length, src_mgr);
}

void Lexer::add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length) {
    int len = tok_length >= 0 ? tok_length : static_cast<int>(value.size());
    out.emplace_back(type, value, location(tok_line, tok_col, len));
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;
    while (true) {
        skip_whitespace_and_comments();
        if (eof()) break;
        scan_token(out);
    }
    add_token(out, TokenType::EOF_TOKEN, "", line, col, 0);
    return out;
}

void Lexer::skip_whitespace_and_comments() {
    while (!eof()) {
        char c = peek();
        if (c == '#') {
            while (!eof() && peek() != '\n') advance();
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            advance();
        } else {
            break;
        }
    }
}

void Lexer::scan_token(std::vector<Token>& out) {
    int tok_line = line;
    int tok_col = col;
    size_t start_index = i;
    char c = peek();

    if (std::isdigit(static_cast<unsigned char>(c))) {
        scan_number(out, tok_line, tok_col, start_index);
        return;
    }
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        scan_identifier_or_keyword(out, tok_line, tok_col, start_index);
        return;
    }
    if (c == '"') {
        scan_string(out, tok_line, tok_col, start_index);
        return;
    }

    switch (c) {
        case '(':
            advance();
            add_token(out, TokenType::OPENPARENTHESIS, "(", tok_line, tok_col);
            return;
        case ')':
            advance();
            add_token(out, TokenType::CLOSEPARENTHESIS, ")", tok_line, tok_col);
            return;
        case '[':
            advance();
            add_token(out, TokenType::OPENBRACKET, "[", tok_line, tok_col);
            return;
        case ']':
            advance();
            add_token(out, TokenType::CLOSEBRACKET, "]", tok_line, tok_col);
            return;
        case ',':
            advance();
            add_token(out, TokenType::COMMA, ",", tok_line, tok_col);
            return;
        case '.':
            advance();
            if (peek() == '.') {
                advance();
                add_token(out, TokenType::CONCAT, "..", tok_line, tok_col);
            } else {
                add_token(out, TokenType::DOT, ".", tok_line, tok_col);
            }
            return;
        case '+':
            advance();
            add_token(out, TokenType::PLUS, "+", tok_line, tok_col);
            return;
        case '-':
            advance();
            add_token(out, TokenType::MINUS, "-", tok_line, tok_col);
            return;
        case '*':
            advance();
            add_token(out, TokenType::STAR, "*", tok_line, tok_col);
            return;
        case '/':
            advance();
            add_token(out, TokenType::SLASH, "/", tok_line, tok_col);
            return;
        case '%':
            advance();
            add_token(out, TokenType::PERCENT, "%", tok_line, tok_col);
            return;
        case '=':
            advance();
            add_token(out, TokenType::EQUALITY, "=", tok_line, tok_col);
            return;
        case '!':
            if (peek_next() == '=') {
                advance();
                advance();
                add_token(out, TokenType::NOTEQUAL, "!=", tok_line, tok_col);
                return;
            }
            break;
        case '<':
            advance();
            if (peek() == '=') {
                advance();
                add_token(out, TokenType::LESSOREQUALTHAN, "<=", tok_line, tok_col);
            } else {
                add_token(out, TokenType::LESSTHAN, "<", tok_line, tok_col);
            }
            return;
        case '>':
            advance();
            if (peek() == '=') {
                advance();
                add_token(out, TokenType::GREATEROREQUALTHAN, ">=", tok_line, tok_col);
            } else {
                add_token(out, TokenType::GREATERTHAN, ">", tok_line, tok_col);
            }
            return;
        default:
            break;
    }

    std::string shown;
    if (std::isprint(static_cast<unsigned char>(c))) {
        shown = std::string("'") + c + "'";
    } else {
        static const char* hex = "0123456789abcdef";
        unsigned char uc = static_cast<unsigned char>(c);
        shown = std::string("byte 0x") + hex[uc >> 4] + hex[uc & 0xF];
    }
    throw LexError("Invalid character " + shown, location(tok_line, tok_col, 1));
}

void Lexer::scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    bool is_float = false;
    while (std::isdigit(static_cast<unsigned char>(peek()))) advance();

    // a '.' only belongs to the number when a digit follows (so `1..3` stays a range-like concat)
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek_next()))) {
        is_float = true;
        advance();
        while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
    }

    if (peek() == 'e' || peek() == 'E') {
        size_t off = 1;
        if (peek(off) == '+' || peek(off) == '-') off++;
        if (std::isdigit(static_cast<unsigned char>(peek(off)))) {
            is_float = true;
            for (size_t k = 0; k < off; ++k) advance();
            while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
        }
    }

    if (std::isalpha(static_cast<unsigned char>(peek())) || peek() == '_') {
        throw LexError("Malformed number literal: identifier characters directly after digits",
            location(tok_line, tok_col, static_cast<int>(i - start_index + 1)));
    }

    std::string text = src.substr(start_index, i - start_index);
    if (!is_float) {
        try {
            (void)std::stoll(text);
        } catch (const std::out_of_range&) {
            throw LexError("Integer literal '" + text + "' does not fit in 64 bits",
                location(tok_line, tok_col, static_cast<int>(text.size())));
        }
    }
    add_token(out, is_float ? TokenType::FLOAT : TokenType::INTEGER, text, tok_line, tok_col);
}

void Lexer::scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_') advance();
    std::string word = src.substr(start_index, i - start_index);

    const auto& keywords = keyword_table();
    auto it = keywords.find(word);
    if (it != keywords.end()) {
        add_token(out, it->second, word, tok_line, tok_col);
    } else {
        add_token(out, TokenType::IDENTIFIER, word, tok_line, tok_col);
    }
}

char Lexer::scan_escape(int tok_line, int tok_col) {
    // backslash already consumed
    char nxt = peek();
    switch (nxt) {
        case 'n':
            advance();
            return '\n';
        case 't':
            advance();
            return '\t';
        case 'r':
            advance();
            return '\r';
        case '"':
            advance();
            return '"';
        case '\\':
            advance();
            return '\\';
        case '$':
            advance();
            return '$';
        case '\0':
            if (eof()) {
                throw LexError("Unterminated string literal", location(tok_line, tok_col, 1), true);
            }
            break;
        default:
            break;
    }
    throw LexError(std::string("Unknown escape sequence '\\") + nxt + "'", location(line, col - 1, 2));
}

// scan "..." or """...""" starting at the opening quote.
void Lexer::scan_string(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    bool triple = peek(1) == '"' && peek(2) == '"';
    advance();
    if (triple) {
        advance();
        advance();
        // a newline directly after the opening quotes is layout, not content
        if (peek() == '\n') {
            advance();
        } else if (peek() == '\r' && peek_next() == '\n') {
            advance();
            advance();
        }
    }

    std::string val;
    bool is_template = false;

    while (true) {
        if (eof()) {
            throw LexError(triple ? "Unterminated multi-line string literal" : "Unterminated string literal",
                location(tok_line, tok_col, 1), triple);
        }
        char c = peek();

        if (triple && c == '"' && peek(1) == '"' && peek(2) == '"') {
            advance();
            advance();
            advance();
            break;
        }
        if (!triple && c == '"') {
            advance();
            break;
        }
        if (!triple && c == '\n') {
            throw LexError("Unterminated string literal (line break before closing quote)",
                location(tok_line, tok_col, 1));
        }

        if (c == '\\') {
            advance();
            val.push_back(scan_escape(tok_line, tok_col));
            continue;
        }

        if (c == '$' && peek_next() == '{') {
            if (!val.empty()) {
                add_token(out, TokenType::TEMPLATE_CHUNK, val, tok_line, tok_col);
                val.clear();
            }
            is_template = true;
            scan_template_expression(out);
            continue;
        }

        val.push_back(advance());
    }

    int length = static_cast<int>(i - start_index);
    if (is_template) {
        if (!val.empty()) add_token(out, TokenType::TEMPLATE_CHUNK, val, tok_line, tok_col);
        add_token(out, TokenType::TEMPLATE_END, triple ? "\"\"\"" : "\"", line, col, triple ? 3 : 1);
        return;
    }
    add_token(out, TokenType::STRING, val, tok_line, tok_col, length);
}

// Lexes the tokens of one ${ ... } section in place, bracketing them with
// TEMPLATE_EXPR_START / TEMPLATE_EXPR_END.
void Lexer::scan_template_expression(std::vector<Token>& out) {
    int start_line = line;
    int start_col = col;
    advance();  // '$'
    advance();  // '{'
    add_token(out, TokenType::TEMPLATE_EXPR_START, "${", start_line, start_col, 2);

    size_t tokens_before = out.size();
    while (true) {
        while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) advance();
        if (eof()) {
            throw LexError("Unterminated ${ in string template", location(start_line, start_col, 2), true);
        }
        if (peek() == '}') {
            if (out.size() == tokens_before) {
                throw LexError("Empty ${} in string template", location(start_line, start_col, 2));
            }
            add_token(out, TokenType::TEMPLATE_EXPR_END, "}", line, col, 1);
            advance();
            return;
        }
        if (peek() == '#') {
            throw LexError("Comments are not allowed inside ${ ... }", location(line, col, 1));
        }
        scan_token(out);
    }
}
