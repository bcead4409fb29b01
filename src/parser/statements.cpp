#include "parser.hpp"

#include "ClariceError.hpp"


// with NAME as EXPR STATEMENT          (transient binding)
// with EXPR as ALIAS do STATEMENT      (alias of a callable/member)
//
// The forms share a prefix when EXPR is a bare identifier. One token of
// lookahead past `as` decides: IDENT followed by `do` is the alias form.
std::unique_ptr < StatementNode > Parser::parse_with_statement() {
  Token withTok = consume();

  if (peek().type == TokenType::IDENTIFIER && peek_next().type == TokenType::AS) {
    bool alias_form = peek_next(2).type == TokenType::IDENTIFIER && peek_next(3).type == TokenType::DO;
    if (!alias_form) {
      auto node = std::make_unique < WithStatementNode > ();
      node->token = withTok;
      node->name = consume().value;
      consume();  // 'as'
      node->value = parse_expression();
      node->body = parse_statement();
      return node;
    }
  }

  auto node = std::make_unique < WithAliasStatementNode > ();
  node->token = withTok;
  node->target = parse_expression();
  expect(TokenType::AS, "'as' after the aliased expression");
  node->alias = expect(TokenType::IDENTIFIER, "alias name after 'as'").value;
  expect(TokenType::DO, "'do' after alias name");
  node->body = parse_statement();
  return node;
}

// let NAME (as TYPE)?  -- the type word is kept but never checked
std::unique_ptr < StatementNode > Parser::parse_let_statement() {
  Token letTok = consume();
  auto node = std::make_unique < LetStatementNode > ();
  node->token = letTok;
  node->name = expect(TokenType::IDENTIFIER, "variable name after 'let'").value;
  if (match(TokenType::AS)) {
    node->type_hint = expect(TokenType::IDENTIFIER, "type name after 'as'").value;
  }
  return node;
}

std::unique_ptr < StatementNode > Parser::parse_set_statement() {
  Token setTok = consume();
  auto node = std::make_unique < SetStatementNode > ();
  node->token = setTok;
  node->name = expect(TokenType::IDENTIFIER, "variable name after 'set'").value;
  expect(TokenType::TO, "'to' after variable name");
  node->value = parse_expression();
  return node;
}

std::unique_ptr < StatementNode > Parser::parse_print_statement() {
  Token printTok = consume();
  auto node = std::make_unique < PrintStatementNode > ();
  node->token = printTok;
  node->expression = parse_expression();
  return node;
}

// prompt "message" then STATEMENT
std::unique_ptr < StatementNode > Parser::parse_prompt_statement() {
  Token promptTok = consume();
  auto node = std::make_unique < PromptStatementNode > ();
  node->token = promptTok;
  node->message = expect(TokenType::STRING, "prompt text (a plain string literal)").value;
  expect(TokenType::THEN, "'then' after prompt text");
  node->then_statement = parse_statement();
  return node;
}

// using NAME from Package/Path
// using NAME from "relative/script.clrs"
std::unique_ptr < StatementNode > Parser::parse_using_statement() {
  Token usingTok = consume();
  auto node = std::make_unique < UsingStatementNode > ();
  node->token = usingTok;
  node->name = expect(TokenType::IDENTIFIER, "module name after 'using'").value;
  expect(TokenType::FROM, "'from' after module name");

  if (peek().type == TokenType::STRING) {
    node->module_token = consume();
    node->module_path = node->module_token.value;
    node->is_file_path = true;
    return node;
  }

  node->module_token = expect(TokenType::IDENTIFIER, "module path");
  node->module_path = node->module_token.value;
  while (peek().type == TokenType::SLASH) {
    consume();
    node->module_path += "/" + expect(TokenType::IDENTIFIER, "path segment after '/'").value;
  }
  return node;
}

// do STATEMENT* end
std::unique_ptr < StatementNode > Parser::parse_block_statement() {
  Token doTok = consume();
  auto node = std::make_unique < BlockStatementNode > ();
  node->token = doTok;
  while (peek().type != TokenType::END) {
    if (!can_start_statement(peek())) {
      throw ParseError("a statement or 'end' to close the 'do' block", peek());
    }
    node->body.push_back(parse_statement());
  }
  consume();  // 'end'
  return node;
}

std::unique_ptr < StatementNode > Parser::parse_expression_statement() {
  auto node = std::make_unique < ExpressionStatementNode > ();
  node->token = peek();
  node->expression = parse_expression();
  return node;
}
