#pragma once
#include <memory>
#include <string>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

class Parser {
   public:
    // `interactive`: a `loop do` body cut off by the end of input is reported
    // as incomplete instead of closing the loop (the REPL keeps reading).
    Parser(const std::vector<Token>& tokens, bool interactive = false);

    // Parses the whole token stream. The first structural mismatch throws a
    // ParseError; there is no recovery.
    std::unique_ptr<ProgramNode> parse();

   private:
    std::vector<Token> tokens;
    size_t position = 0;
    bool interactive = false;

    const Token& peek() const;
    const Token& peek_next(size_t offset = 1) const;

    Token consume();
    bool match(TokenType t);
    Token expect(TokenType t, const std::string& expected);

    bool can_start_statement(const Token& tok) const;

    // expression parsing (precedence chain)
    std::unique_ptr<ExpressionNode> parse_expression();
    std::unique_ptr<ExpressionNode> parse_comparison();
    std::unique_ptr<ExpressionNode> parse_concat();
    std::unique_ptr<ExpressionNode> parse_additive();
    std::unique_ptr<ExpressionNode> parse_multiplicative();
    std::unique_ptr<ExpressionNode> parse_unary();
    std::unique_ptr<ExpressionNode> parse_postfix();
    std::unique_ptr<ExpressionNode> parse_primary();
    std::unique_ptr<ExpressionNode> parse_call(std::unique_ptr<ExpressionNode> callee);
    std::unique_ptr<ExpressionNode> parse_list_literal();
    std::unique_ptr<ExpressionNode> parse_template_literal();

    // statements
    std::unique_ptr<StatementNode> parse_statement();
    std::unique_ptr<StatementNode> parse_simple_statement();
    std::unique_ptr<StatementNode> parse_with_statement();
    std::unique_ptr<StatementNode> parse_let_statement();
    std::unique_ptr<StatementNode> parse_set_statement();
    std::unique_ptr<StatementNode> parse_print_statement();
    std::unique_ptr<StatementNode> parse_prompt_statement();
    std::unique_ptr<StatementNode> parse_using_statement();
    std::unique_ptr<StatementNode> parse_block_statement();
    std::unique_ptr<StatementNode> parse_expression_statement();

    // control-flow parsing
    std::unique_ptr<StatementNode> parse_if_statement();
    std::unique_ptr<StatementNode> parse_loop_statement();
    std::unique_ptr<StatementNode> parse_iter_statement();
    std::unique_ptr<StatementNode> parse_break_statement();
};
