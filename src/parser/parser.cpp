// src/parser/parser.cpp
#include "parser.hpp"

#include "ClariceError.hpp"

Parser::Parser(const std::vector<Token>& tokens, bool interactive) : tokens(tokens), interactive(interactive) {
    // every stream ends in EOF so peek() never runs off the end
    if (this->tokens.empty() || this->tokens.back().type != TokenType::EOF_TOKEN) {
        TokenLocation loc = this->tokens.empty() ? TokenLocation("<eof>", 1, 1, 0) : this->tokens.back().loc;
        this->tokens.emplace_back(TokenType::EOF_TOKEN, "", loc);
    }
}

const Token& Parser::peek() const {
    if (position < tokens.size()) return tokens[position];
    return tokens.back();
}

const Token& Parser::peek_next(size_t offset) const {
    if (position + offset < tokens.size()) return tokens[position + offset];
    return tokens.back();
}

// Consume and return the current token; EOF is sticky
Token Parser::consume() {
    Token tok = peek();
    if (position < tokens.size() - 1) position++;
    return tok;
}

bool Parser::match(TokenType t) {
    if (peek().type == t) {
        consume();
        return true;
    }
    return false;
}

Token Parser::expect(TokenType t, const std::string& expected) {
    if (peek().type != t) {
        throw ParseError(expected, peek());
    }
    return consume();
}

bool Parser::can_start_statement(const Token& tok) const {
    switch (tok.type) {
        case TokenType::WITH:
        case TokenType::LET:
        case TokenType::SET:
        case TokenType::IF:
        case TokenType::LOOP:
        case TokenType::ITER:
        case TokenType::DO:
        case TokenType::BREAK:
        case TokenType::PRINT:
        case TokenType::PROMPT:
        case TokenType::USING:
        case TokenType::IDENTIFIER:
        case TokenType::INTEGER:
        case TokenType::FLOAT:
        case TokenType::STRING:
        case TokenType::TEMPLATE_CHUNK:
        case TokenType::TEMPLATE_EXPR_START:
        case TokenType::BOOLEAN:
        case TokenType::NULL_LITERAL:
        case TokenType::OPENBRACKET:
        case TokenType::OPENPARENTHESIS:
        case TokenType::MINUS:
            return true;
        default:
            return false;
    }
}

std::unique_ptr<ProgramNode> Parser::parse() {
    auto program = std::make_unique<ProgramNode>();
    program->token = peek();
    while (peek().type != TokenType::EOF_TOKEN) {
        program->body.push_back(parse_statement());
    }
    return program;
}

// Statement := SimpleStatement ("and" SimpleStatement)*
// The chain is collected here, so `and` always attaches to the innermost
// statement currently being parsed.
std::unique_ptr<StatementNode> Parser::parse_statement() {
    Token first = peek();
    auto stmt = parse_simple_statement();
    if (peek().type != TokenType::AND) return stmt;

    auto seq = std::make_unique<SequenceStatementNode>();
    seq->token = first;
    seq->statements.push_back(std::move(stmt));
    while (match(TokenType::AND)) {
        seq->statements.push_back(parse_simple_statement());
    }
    return seq;
}

std::unique_ptr<StatementNode> Parser::parse_simple_statement() {
    const Token& tok = peek();
    switch (tok.type) {
        case TokenType::WITH:
            return parse_with_statement();
        case TokenType::LET:
            return parse_let_statement();
        case TokenType::SET:
            return parse_set_statement();
        case TokenType::IF:
            return parse_if_statement();
        case TokenType::LOOP:
            return parse_loop_statement();
        case TokenType::ITER:
            return parse_iter_statement();
        case TokenType::DO:
            return parse_block_statement();
        case TokenType::BREAK:
            return parse_break_statement();
        case TokenType::PRINT:
            return parse_print_statement();
        case TokenType::PROMPT:
            return parse_prompt_statement();
        case TokenType::USING:
            return parse_using_statement();
        default:
            break;
    }
    if (!can_start_statement(tok)) {
        throw ParseError("a statement", tok);
    }
    return parse_expression_statement();
}
