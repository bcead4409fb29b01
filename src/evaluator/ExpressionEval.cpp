#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include "evaluator.hpp"

// ----------------- Expression evaluation -----------------
Value Evaluator::evaluate_expression(ExpressionNode* expr, const EnvPtr& env) {
    if (!expr) return std::monostate{};

    if (auto n = dynamic_cast<IntegerLiteralNode*>(expr)) {
        return n->value;
    }

    if (auto f = dynamic_cast<FloatLiteralNode*>(expr)) {
        return f->value;
    }

    if (auto s = dynamic_cast<StringLiteralNode*>(expr)) {
        return s->value;
    }

    if (auto b = dynamic_cast<BooleanLiteralNode*>(expr)) {
        return b->value;
    }

    if (dynamic_cast<NullLiteralNode*>(expr)) {
        return std::monostate{};
    }

    if (auto id = dynamic_cast<IdentifierNode*>(expr)) {
        return env->lookup(id->name, id->token);
    }

    if (auto list = dynamic_cast<ListExpressionNode*>(expr)) {
        std::vector<Value> elems;
        elems.reserve(list->elements.size());
        for (auto& e : list->elements) elems.push_back(evaluate_expression(e.get(), env));
        return std::make_shared<ListValue>(std::move(elems));
    }

    if (auto t = dynamic_cast<TemplateLiteralNode*>(expr)) {
        return evaluate_template(t, env);
    }

    if (auto u = dynamic_cast<UnaryExpressionNode*>(expr)) {
        return evaluate_unary(u, env);
    }

    if (auto bin = dynamic_cast<BinaryExpressionNode*>(expr)) {
        return evaluate_binary(bin, env);
    }

    if (auto call = dynamic_cast<CallExpressionNode*>(expr)) {
        return evaluate_call(call, env);
    }

    if (auto mem = dynamic_cast<MemberExpressionNode*>(expr)) {
        return evaluate_member(mem, env);
    }

    throw RuntimeError("Unsupported expression '" + expr->to_string() + "'", expr->token.loc);
}

Value Evaluator::evaluate_template(TemplateLiteralNode* node, const EnvPtr& env) {
    std::string out;
    for (size_t i = 0; i < node->quasis.size(); ++i) {
        out += node->quasis[i];
        if (i < node->expressions.size()) {
            out += display_string(evaluate_expression(node->expressions[i].get(), env));
        }
    }
    return out;
}

Value Evaluator::evaluate_unary(UnaryExpressionNode* node, const EnvPtr& env) {
    Value operand = evaluate_expression(node->operand.get(), env);
    if (std::holds_alternative<std::int64_t>(operand)) {
        std::int64_t n = std::get<std::int64_t>(operand);
        if (n == std::numeric_limits<std::int64_t>::min()) {
            throw ArithmeticError("Integer overflow in negation", node->token.loc);
        }
        return -n;
    }
    if (std::holds_alternative<double>(operand)) {
        return -std::get<double>(operand);
    }
    throw RuntimeTypeError("Unary '-' needs a number, got " + type_name(operand), node->token.loc);
}

Value Evaluator::evaluate_binary(BinaryExpressionNode* node, const EnvPtr& env) {
    Value left = evaluate_expression(node->left.get(), env);
    Value right = evaluate_expression(node->right.get(), env);
    const std::string& op = node->op;

    if (op == "..") {
        return display_string(left) + display_string(right);
    }
    if (op == "=") {
        return values_equal(left, right);
    }
    if (op == "!=") {
        return !values_equal(left, right);
    }
    if (op == "<" || op == "<=" || op == ">" || op == ">=") {
        return compare(op, left, right, node->token);
    }
    return arithmetic(op, left, right, node->token);
}

static RuntimeTypeError operand_error(const std::string& op, const Value& left, const Value& right, const Token& tok) {
    return RuntimeTypeError("Cannot apply '" + op + "' to " + type_name(left) + " and " + type_name(right), tok.loc);
}

Value Evaluator::arithmetic(const std::string& op, const Value& left, const Value& right, const Token& tok) {
    if (op == "+") {
        if (std::holds_alternative<std::string>(left) && std::holds_alternative<std::string>(right)) {
            return std::get<std::string>(left) + std::get<std::string>(right);
        }
        if (std::holds_alternative<ListPtr>(left) && std::holds_alternative<ListPtr>(right)) {
            const ListPtr& a = std::get<ListPtr>(left);
            const ListPtr& b = std::get<ListPtr>(right);
            std::vector<Value> elems = a->elements;
            elems.insert(elems.end(), b->elements.begin(), b->elements.end());
            return std::make_shared<ListValue>(std::move(elems));
        }
    }

    if (!is_numeric(left) || !is_numeric(right)) {
        throw operand_error(op, left, right, tok);
    }

    const bool both_int = std::holds_alternative<std::int64_t>(left) && std::holds_alternative<std::int64_t>(right);

    if (op == "/") {
        double divisor = as_double(right);
        if (divisor == 0.0) {
            throw ArithmeticError("Division by zero", tok.loc);
        }
        return as_double(left) / divisor;
    }

    if (op == "%") {
        if (!both_int) {
            throw operand_error(op, left, right, tok);
        }
        std::int64_t a = std::get<std::int64_t>(left);
        std::int64_t b = std::get<std::int64_t>(right);
        if (b == 0) {
            throw ArithmeticError("Modulo by zero", tok.loc);
        }
        if (b == -1) return std::int64_t{0};
        return a % b;
    }

    if (both_int) {
        std::int64_t a = std::get<std::int64_t>(left);
        std::int64_t b = std::get<std::int64_t>(right);
        std::int64_t result = 0;
        bool overflow = false;
        if (op == "+")
            overflow = __builtin_add_overflow(a, b, &result);
        else if (op == "-")
            overflow = __builtin_sub_overflow(a, b, &result);
        else if (op == "*")
            overflow = __builtin_mul_overflow(a, b, &result);
        else
            throw RuntimeError("Unknown operator '" + op + "'", tok.loc);
        if (overflow) {
            throw ArithmeticError("Integer overflow in " + std::to_string(a) + " " + op + " " + std::to_string(b), tok.loc);
        }
        return result;
    }

    double a = as_double(left);
    double b = as_double(right);
    if (op == "+") return a + b;
    if (op == "-") return a - b;
    if (op == "*") return a * b;
    throw RuntimeError("Unknown operator '" + op + "'", tok.loc);
}

bool Evaluator::compare(const std::string& op, const Value& left, const Value& right, const Token& tok) {
    int order = 0;
    if (is_numeric(left) && is_numeric(right)) {
        if (std::isnan(as_double(left)) || std::isnan(as_double(right))) return false;
        order = compare_numbers(left, right);
    } else if (std::holds_alternative<std::string>(left) && std::holds_alternative<std::string>(right)) {
        int c = std::get<std::string>(left).compare(std::get<std::string>(right));
        order = c < 0 ? -1 : (c > 0 ? 1 : 0);
    } else {
        throw operand_error(op, left, right, tok);
    }

    if (op == "<") return order < 0;
    if (op == "<=") return order <= 0;
    if (op == ">") return order > 0;
    return order >= 0;
}

Value Evaluator::evaluate_call(CallExpressionNode* node, const EnvPtr& env) {
    Value callee = evaluate_expression(node->callee.get(), env);
    if (!std::holds_alternative<FunctionPtr>(callee)) {
        throw RuntimeTypeError("'" + node->callee->to_string() + "' is a " + type_name(callee) + ", not a function", node->token.loc);
    }
    FunctionPtr fn = std::get<FunctionPtr>(callee);

    std::vector<Value> args;
    args.reserve(node->arguments.size());
    for (auto& a : node->arguments) args.push_back(evaluate_expression(a.get(), env));

    if (fn->arity >= 0 && static_cast<size_t>(fn->arity) != args.size()) {
        throw RuntimeTypeError(fn->name + " expects " + std::to_string(fn->arity) + " argument(s), got " + std::to_string(args.size()), node->token.loc);
    }
    if (!fn->native_impl) {
        throw RuntimeError("Function " + fn->name + " has no implementation", node->token.loc);
    }
    return fn->native_impl(args, node->token);
}

Value Evaluator::evaluate_member(MemberExpressionNode* node, const EnvPtr& env) {
    Value object = evaluate_expression(node->object.get(), env);
    if (!std::holds_alternative<ModulePtr>(object)) {
        throw RuntimeTypeError("Cannot read member '" + node->property + "' of a " + type_name(object) + " (only modules have members)", node->token.loc);
    }
    const ModulePtr& mod = std::get<ModulePtr>(object);
    const Value* member = mod->member(node->property);
    if (!member) {
        throw NameError("Module '" + mod->name + "' has no member '" + node->property + "'", node->token.loc);
    }
    return *member;
}
