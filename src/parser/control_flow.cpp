#include "parser.hpp"

#include "ClariceError.hpp"

// if EXPR then STATEMENT (else STATEMENT)?
std::unique_ptr < StatementNode > Parser::parse_if_statement() {
  Token ifTok = consume();
  auto node = std::make_unique < IfStatementNode > ();
  node->token = ifTok;
  node->condition = parse_expression();
  expect(TokenType::THEN, "'then' after if condition");
  node->then_branch = parse_statement();
  if (match(TokenType::ELSE)) {
    node->else_branch = parse_statement();
  }
  return node;
}

// loop do STATEMENT+ end?
// The body runs until a token that cannot start a statement; a trailing
// `end` is consumed when present.
std::unique_ptr < StatementNode > Parser::parse_loop_statement() {
  Token loopTok = consume();
  expect(TokenType::DO, "'do' after 'loop'");

  auto node = std::make_unique < LoopStatementNode > ();
  node->token = loopTok;
  if (!can_start_statement(peek())) {
    throw ParseError("a statement in the loop body", peek());
  }
  while (can_start_statement(peek())) {
    node->body.push_back(parse_statement());
  }
  if (interactive && peek().type == TokenType::EOF_TOKEN) {
    throw ParseError("'end' to close the loop", peek());
  }
  match(TokenType::END);
  return node;
}

// iter NAME in EXPR do STATEMENT
std::unique_ptr < StatementNode > Parser::parse_iter_statement() {
  Token iterTok = consume();
  auto node = std::make_unique < IterStatementNode > ();
  node->token = iterTok;
  node->variable = expect(TokenType::IDENTIFIER, "loop variable after 'iter'").value;
  expect(TokenType::IN, "'in' after loop variable");
  node->iterable = parse_expression();
  expect(TokenType::DO, "'do' after iterable expression");
  node->body = parse_statement();
  return node;
}

std::unique_ptr < StatementNode > Parser::parse_break_statement() {
  auto node = std::make_unique < BreakStatementNode > ();
  node->token = consume();
  return node;
}
