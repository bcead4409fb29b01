#include <sstream>

#include "format/format.hpp"
#include "value.hpp"

namespace {

// Binding strength of a binary operator, lowest first. Matches the parser's
// ladder: comparison < concat < additive < multiplicative.
int precedence(const std::string& op) {
    if (op == "=" || op == "!=" || op == "<" || op == "<=" || op == ">" || op == ">=") return 1;
    if (op == "..") return 2;
    if (op == "+" || op == "-") return 3;
    return 4;
}

std::string format_operand(ExpressionNode* child, int parent_prec, bool right_side) {
    std::string text = format_expression(child);
    auto b = dynamic_cast<BinaryExpressionNode*>(child);
    if (!b) return text;

    int p = precedence(b->op);
    // comparisons never chain, so a nested one is always grouped
    bool wrap = right_side ? p <= parent_prec : (p < parent_prec || (p == 1 && parent_prec == 1));
    return wrap ? "(" + text + ")" : text;
}

// object of `.x` or callee of `(...)`
std::string format_postfix_target(ExpressionNode* target) {
    std::string text = format_expression(target);
    if (dynamic_cast<BinaryExpressionNode*>(target) || dynamic_cast<UnaryExpressionNode*>(target)) {
        return "(" + text + ")";
    }
    return text;
}

}  // namespace

std::string format_expression(ExpressionNode* expr) {
    if (!expr) return "";

    if (auto n = dynamic_cast<IntegerLiteralNode*>(expr)) {
        return std::to_string(n->value);
    }

    if (auto f = dynamic_cast<FloatLiteralNode*>(expr)) {
        return f->text.empty() ? format_float(f->value) : f->text;
    }

    if (auto s = dynamic_cast<StringLiteralNode*>(expr)) {
        return quote_string(s->value);
    }

    if (auto b = dynamic_cast<BooleanLiteralNode*>(expr)) {
        return b->value ? "true" : "false";
    }

    if (dynamic_cast<NullLiteralNode*>(expr)) {
        return "null";
    }

    if (auto id = dynamic_cast<IdentifierNode*>(expr)) {
        return id->name;
    }

    if (auto list = dynamic_cast<ListExpressionNode*>(expr)) {
        std::ostringstream ss;
        ss << "[";
        for (size_t i = 0; i < list->elements.size(); i++) {
            if (i > 0) ss << ", ";
            ss << format_expression(list->elements[i].get());
        }
        ss << "]";
        return ss.str();
    }

    if (auto u = dynamic_cast<UnaryExpressionNode*>(expr)) {
        std::string operand = format_expression(u->operand.get());
        if (dynamic_cast<BinaryExpressionNode*>(u->operand.get())) operand = "(" + operand + ")";
        return u->op + operand;
    }

    if (auto b = dynamic_cast<BinaryExpressionNode*>(expr)) {
        int p = precedence(b->op);
        std::string left = format_operand(b->left.get(), p, false);
        std::string right = format_operand(b->right.get(), p, true);
        return left + " " + b->op + " " + right;
    }

    if (auto call = dynamic_cast<CallExpressionNode*>(expr)) {
        std::ostringstream ss;
        ss << format_postfix_target(call->callee.get()) << "(";
        for (size_t i = 0; i < call->arguments.size(); i++) {
            if (i > 0) ss << ", ";
            ss << format_expression(call->arguments[i].get());
        }
        ss << ")";
        return ss.str();
    }

    if (auto mem = dynamic_cast<MemberExpressionNode*>(expr)) {
        return format_postfix_target(mem->object.get()) + "." + mem->property;
    }

    if (auto t = dynamic_cast<TemplateLiteralNode*>(expr)) {
        std::string out = "\"";
        for (size_t i = 0; i < t->quasis.size(); i++) {
            std::string chunk = quote_string(t->quasis[i]);
            out += chunk.substr(1, chunk.size() - 2);
            if (i < t->expressions.size()) {
                out += "${" + format_expression(t->expressions[i].get()) + "}";
            }
        }
        out += "\"";
        return out;
    }

    return expr->to_string();
}
