#pragma once
#include <string>

#include "ast.hpp"

// Canonical Clarice source for an AST. Statements are laid out one per line,
// `do`/`loop` bodies indented by two spaces and always closed with `end`.
// Parentheses appear only where precedence needs them, so printing the
// re-parsed output gives back the same text.
std::string format_program(ProgramNode* program);
std::string format_statement(StatementNode* stmt, int depth = 0);
std::string format_expression(ExpressionNode* expr);

// Quoted "..." literal with \n \t \r \" \\ \$ escaped.
std::string quote_string(const std::string& value);
