#include <iostream>
#include <string>
#include <unordered_map>

#include "print_debug.hpp"

std::string token_type_name(TokenType t) {
    static const std::unordered_map<TokenType, std::string> names = {
        {TokenType::WITH, "WITH"}, {TokenType::AS, "AS"}, {TokenType::LET, "LET"}, {TokenType::SET, "SET"},
        {TokenType::TO, "TO"}, {TokenType::PRINT, "PRINT"}, {TokenType::PROMPT, "PROMPT"},
        {TokenType::USING, "USING"}, {TokenType::FROM, "FROM"}, {TokenType::IF, "IF"},
        {TokenType::THEN, "THEN"}, {TokenType::ELSE, "ELSE"}, {TokenType::LOOP, "LOOP"},
        {TokenType::ITER, "ITER"}, {TokenType::IN, "IN"}, {TokenType::DO, "DO"}, {TokenType::END, "END"},
        {TokenType::BREAK, "BREAK"}, {TokenType::AND, "AND"},
        {TokenType::IDENTIFIER, "IDENTIFIER"}, {TokenType::INTEGER, "INTEGER"}, {TokenType::FLOAT, "FLOAT"},
        {TokenType::STRING, "STRING"}, {TokenType::TEMPLATE_CHUNK, "TEMPLATE_CHUNK"},
        {TokenType::TEMPLATE_EXPR_START, "TEMPLATE_EXPR_START"}, {TokenType::TEMPLATE_EXPR_END, "TEMPLATE_EXPR_END"},
        {TokenType::TEMPLATE_END, "TEMPLATE_END"}, {TokenType::BOOLEAN, "BOOLEAN"},
        {TokenType::NULL_LITERAL, "NULL_LITERAL"}, {TokenType::COMMA, "COMMA"}, {TokenType::DOT, "DOT"},
        {TokenType::OPENPARENTHESIS, "OPENPARENTHESIS"}, {TokenType::CLOSEPARENTHESIS, "CLOSEPARENTHESIS"},
        {TokenType::OPENBRACKET, "OPENBRACKET"}, {TokenType::CLOSEBRACKET, "CLOSEBRACKET"},
        {TokenType::PLUS, "PLUS"}, {TokenType::MINUS, "MINUS"}, {TokenType::STAR, "STAR"},
        {TokenType::SLASH, "SLASH"}, {TokenType::PERCENT, "PERCENT"}, {TokenType::CONCAT, "CONCAT"},
        {TokenType::EQUALITY, "EQUALITY"}, {TokenType::NOTEQUAL, "NOTEQUAL"},
        {TokenType::LESSTHAN, "LESSTHAN"}, {TokenType::LESSOREQUALTHAN, "LESSOREQUALTHAN"},
        {TokenType::GREATERTHAN, "GREATERTHAN"}, {TokenType::GREATEROREQUALTHAN, "GREATEROREQUALTHAN"},
        {TokenType::EOF_TOKEN, "EOF_TOKEN"}, {TokenType::UNKNOWN, "UNKNOWN"}};
    auto it = names.find(t);
    if (it != names.end()) return it->second;
    return "TOKEN(?)";
}

std::string describe_token(const Token& tok) {
    switch (tok.type) {
        case TokenType::EOF_TOKEN:
            return "end of input";
        case TokenType::IDENTIFIER:
            return "identifier '" + tok.value + "'";
        case TokenType::INTEGER:
        case TokenType::FLOAT:
            return "number " + tok.value;
        case TokenType::STRING:
            return "string \"" + tok.value + "\"";
        case TokenType::TEMPLATE_CHUNK:
        case TokenType::TEMPLATE_EXPR_START:
            return "string template";
        case TokenType::TEMPLATE_EXPR_END:
            return "'}'";
        case TokenType::TEMPLATE_END:
            return "end of string template";
        default:
            break;
    }
    if (tok.value.empty()) return token_type_name(tok.type);
    return "'" + tok.value + "'";
}

void print_tokens(const std::vector<Token>& tokens, std::ostream& out) {
    out << "---- TOKEN DUMP (" << tokens.size() << " tokens) ----\n";
    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& tok = tokens[i];
        out << i << ": " << token_type_name(tok.type)
            << " value='" << tok.value << "'"
            << " file='" << tok.filename() << "'"
            << " line=" << tok.line() << " col=" << tok.col() << "\n";
    }
    out << "---- END TOKEN DUMP ----\n";
}
