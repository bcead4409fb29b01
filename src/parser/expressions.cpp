#include <cstdlib>
#include <string>

#include "ClariceError.hpp"
#include "parser.hpp"

namespace {
   bool is_comparison(TokenType t) {
      return t == TokenType::EQUALITY || t == TokenType::NOTEQUAL ||
         t == TokenType::LESSTHAN || t == TokenType::LESSOREQUALTHAN ||
         t == TokenType::GREATERTHAN || t == TokenType::GREATEROREQUALTHAN;
   }

   std::unique_ptr < ExpressionNode > make_binary(const Token& op,
      std::unique_ptr < ExpressionNode > left,
      std::unique_ptr < ExpressionNode > right) {
      auto node = std::make_unique < BinaryExpressionNode > ();
      node->op = op.value;
      node->left = std::move(left);
      node->right = std::move(right);
      node->token = op;
      return node;
   }
}

std::unique_ptr < ExpressionNode > Parser::parse_expression() {
   return parse_comparison();
}

// Comparisons do not chain: `a = b = c` is rejected rather than silently
// comparing a bool against c.
std::unique_ptr < ExpressionNode > Parser::parse_comparison() {
   auto left = parse_concat();
   if (is_comparison(peek().type)) {
      Token op = consume();
      auto right = parse_concat();
      left = make_binary(op, std::move(left), std::move(right));
      if (is_comparison(peek().type)) {
         throw ParseError("'and', 'then' or another statement (comparisons cannot be chained)", peek());
      }
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_concat() {
   auto left = parse_additive();
   while (peek().type == TokenType::CONCAT) {
      Token op = consume();
      auto right = parse_additive();
      left = make_binary(op, std::move(left), std::move(right));
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_additive() {
   auto left = parse_multiplicative();
   while (peek().type == TokenType::PLUS || peek().type == TokenType::MINUS) {
      Token op = consume();
      auto right = parse_multiplicative();
      left = make_binary(op, std::move(left), std::move(right));
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_multiplicative() {
   auto left = parse_unary();
   while (peek().type == TokenType::STAR || peek().type == TokenType::SLASH || peek().type == TokenType::PERCENT) {
      Token op = consume();
      auto right = parse_unary();
      left = make_binary(op, std::move(left), std::move(right));
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_unary() {
   if (peek().type == TokenType::MINUS) {
      Token op = consume();
      auto node = std::make_unique < UnaryExpressionNode > ();
      node->op = "-";
      node->operand = parse_unary();
      node->token = op;
      return node;
   }
   return parse_postfix();
}

// member access and calls, left to right: Markdown.ConvertHTML(text, path)
std::unique_ptr < ExpressionNode > Parser::parse_postfix() {
   auto expr = parse_primary();
   while (true) {
      if (peek().type == TokenType::DOT) {
         Token dotTok = consume();
         auto mem = std::make_unique < MemberExpressionNode > ();
         mem->property = expect(TokenType::IDENTIFIER, "member name after '.'").value;
         mem->object = std::move(expr);
         mem->token = dotTok;
         expr = std::move(mem);
         continue;
      }
      if (peek().type == TokenType::OPENPARENTHESIS) {
         expr = parse_call(std::move(expr));
         continue;
      }
      break;
   }
   return expr;
}

std::unique_ptr < ExpressionNode > Parser::parse_primary() {
   Token t = peek();

   switch (t.type) {
      case TokenType::INTEGER: {
         consume();
         auto node = std::make_unique < IntegerLiteralNode > ();
         node->value = std::stoll(t.value);
         node->token = t;
         return node;
      }
      case TokenType::FLOAT: {
         consume();
         auto node = std::make_unique < FloatLiteralNode > ();
         node->value = std::strtod(t.value.c_str(), nullptr);  // out-of-range spellings become inf
         node->text = t.value;
         node->token = t;
         return node;
      }
      case TokenType::STRING: {
         consume();
         auto node = std::make_unique < StringLiteralNode > ();
         node->value = t.value;
         node->token = t;
         return node;
      }
      case TokenType::TEMPLATE_CHUNK:
      case TokenType::TEMPLATE_EXPR_START:
         return parse_template_literal();
      case TokenType::BOOLEAN: {
         consume();
         auto node = std::make_unique < BooleanLiteralNode > ();
         node->value = (t.value == "true");
         node->token = t;
         return node;
      }
      case TokenType::NULL_LITERAL: {
         consume();
         auto node = std::make_unique < NullLiteralNode > ();
         node->token = t;
         return node;
      }
      case TokenType::IDENTIFIER: {
         consume();
         auto node = std::make_unique < IdentifierNode > ();
         node->name = t.value;
         node->token = t;
         return node;
      }
      case TokenType::OPENBRACKET:
         return parse_list_literal();
      case TokenType::OPENPARENTHESIS: {
         consume();
         auto inner = parse_expression();
         expect(TokenType::CLOSEPARENTHESIS, "')' to close the parenthesised expression");
         return inner;
      }
      default:
         break;
   }
   throw ParseError("an expression", t);
}

std::unique_ptr < ExpressionNode > Parser::parse_call(std::unique_ptr < ExpressionNode > callee) {
   Token openTok = expect(TokenType::OPENPARENTHESIS, "'(' in call");
   auto call = std::make_unique < CallExpressionNode > ();
   call->callee = std::move(callee);
   call->token = openTok;
   if (peek().type != TokenType::CLOSEPARENTHESIS) {
      do {
         call->arguments.push_back(parse_expression());
      } while (match(TokenType::COMMA));
   }
   expect(TokenType::CLOSEPARENTHESIS, "',' or ')' after call argument");
   return call;
}

std::unique_ptr < ExpressionNode > Parser::parse_list_literal() {
   Token openTok = consume();  // '['
   auto node = std::make_unique < ListExpressionNode > ();
   node->token = openTok;
   if (peek().type != TokenType::CLOSEBRACKET) {
      do {
         node->elements.push_back(parse_expression());
      } while (match(TokenType::COMMA));
   }
   expect(TokenType::CLOSEBRACKET, "',' or ']' after list element");
   return node;
}

// The lexer splits "a ${x} b" into
//   TEMPLATE_CHUNK("a ") TEMPLATE_EXPR_START ...x... TEMPLATE_EXPR_END TEMPLATE_CHUNK(" b") TEMPLATE_END
// with empty chunks omitted; quasis are rebuilt with explicit empty strings.
std::unique_ptr < ExpressionNode > Parser::parse_template_literal() {
   auto node = std::make_unique < TemplateLiteralNode > ();
   node->token = peek();

   std::string chunk;
   while (peek().type != TokenType::TEMPLATE_END) {
      if (peek().type == TokenType::TEMPLATE_CHUNK) {
         chunk += consume().value;
         continue;
      }
      expect(TokenType::TEMPLATE_EXPR_START, "string template content");
      node->quasis.push_back(chunk);
      chunk.clear();
      node->expressions.push_back(parse_expression());
      expect(TokenType::TEMPLATE_EXPR_END, "'}' to close the template expression");
   }
   consume();  // TEMPLATE_END
   node->quasis.push_back(chunk);
   return node;
}
