#pragma once
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "token.hpp"

// Base class for all AST nodes. Each node owns its children exclusively; the
// tree is immutable once the parser hands it out.
struct Node {
    virtual ~Node() = default;
    Token token;  // filename, line, column for this node (set by the parser)

    virtual std::string to_string() const {
        return "<node>";
    }
};

// Expressions
struct ExpressionNode : public Node {};

struct IntegerLiteralNode : public ExpressionNode {
    std::int64_t value = 0;
    std::string to_string() const override {
        return std::to_string(value);
    }
};

struct FloatLiteralNode : public ExpressionNode {
    double value = 0.0;
    std::string text;  // source spelling, kept so the formatter can reproduce it
    std::string to_string() const override {
        return text;
    }
};

struct StringLiteralNode : public ExpressionNode {
    std::string value;
    std::string to_string() const override {
        return "\"" + value + "\"";
    }
};

struct BooleanLiteralNode : public ExpressionNode {
    bool value = false;
    std::string to_string() const override {
        return value ? "true" : "false";
    }
};

struct NullLiteralNode : public ExpressionNode {
    std::string to_string() const override {
        return "null";
    }
};

struct IdentifierNode : public ExpressionNode {
    std::string name;
    std::string to_string() const override {
        return name;
    }
};

struct ListExpressionNode : public ExpressionNode {
    std::vector<std::unique_ptr<ExpressionNode>> elements;

    std::string to_string() const override {
        std::string s = "[";
        for (size_t i = 0; i < elements.size(); ++i) {
            if (i) s += ", ";
            s += elements[i] ? elements[i]->to_string() : "<null>";
        }
        s += "]";
        return s;
    }
};

struct UnaryExpressionNode : public ExpressionNode {
    std::string op;  // only "-" today
    std::unique_ptr<ExpressionNode> operand;
    std::string to_string() const override {
        std::string opnd = operand ? operand->to_string() : "<null>";
        return "(" + op + opnd + ")";
    }
};

struct BinaryExpressionNode : public ExpressionNode {
    std::string op;  // "+", "-", "*", "/", "%", "..", "=", "!=", "<", "<=", ">", ">="
    std::unique_ptr<ExpressionNode> left;
    std::unique_ptr<ExpressionNode> right;
    std::string to_string() const override {
        std::string l = left ? left->to_string() : "<null>";
        std::string r = right ? right->to_string() : "<null>";
        return "(" + l + " " + op + " " + r + ")";
    }
};

struct CallExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> callee;
    std::vector<std::unique_ptr<ExpressionNode>> arguments;

    std::string to_string() const override {
        std::string c = callee ? callee->to_string() : "<null>";
        std::string args;
        for (size_t i = 0; i < arguments.size(); ++i) {
            if (i) args += ", ";
            args += arguments[i] ? arguments[i]->to_string() : "<null>";
        }
        return c + "(" + args + ")";
    }
};

struct MemberExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> object;
    std::string property;

    std::string to_string() const override {
        std::string o = object ? object->to_string() : "<null>";
        return o + "." + property;
    }
};

struct TemplateLiteralNode : public ExpressionNode {
    // literal chunks between expressions; there are always
    // expressions.size() + 1 quasis (possibly empty strings at the ends)
    std::vector<std::string> quasis;
    std::vector<std::unique_ptr<ExpressionNode>> expressions;

    std::string to_string() const override {
        std::ostringstream ss;
        ss << "\"";
        for (size_t i = 0; i < quasis.size(); ++i) {
            ss << quasis[i];
            if (i < expressions.size()) {
                ss << "${" << (expressions[i] ? expressions[i]->to_string() : "") << "}";
            }
        }
        ss << "\"";
        return ss.str();
    }
};

// Statements
struct StatementNode : public Node {};

// with NAME as VALUE BODY -- NAME is transient, visible only inside BODY
struct WithStatementNode : public StatementNode {
    std::string name;
    std::unique_ptr<ExpressionNode> value;
    std::unique_ptr<StatementNode> body;
};

// with TARGET as ALIAS do BODY -- ALIAS refers to TARGET itself, not a copy
struct WithAliasStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> target;
    std::string alias;
    std::unique_ptr<StatementNode> body;
};

struct LetStatementNode : public StatementNode {
    std::string name;
    std::string type_hint;  // accepted and kept for formatting, never checked
};

struct SetStatementNode : public StatementNode {
    std::string name;
    std::unique_ptr<ExpressionNode> value;
};

struct IfStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    std::unique_ptr<StatementNode> then_branch;
    std::unique_ptr<StatementNode> else_branch;  // may be null
};

struct LoopStatementNode : public StatementNode {
    std::vector<std::unique_ptr<StatementNode>> body;
};

struct IterStatementNode : public StatementNode {
    std::string variable;
    std::unique_ptr<ExpressionNode> iterable;
    std::unique_ptr<StatementNode> body;
};

// do ... end
struct BlockStatementNode : public StatementNode {
    std::vector<std::unique_ptr<StatementNode>> body;
};

// S1 and S2 and ... -- runs in the current scope
struct SequenceStatementNode : public StatementNode {
    std::vector<std::unique_ptr<StatementNode>> statements;
};

struct BreakStatementNode : public StatementNode {
    std::string to_string() const override {
        return "break";
    }
};

struct PrintStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;
};

struct PromptStatementNode : public StatementNode {
    std::string message;
    std::unique_ptr<StatementNode> then_statement;
};

struct UsingStatementNode : public StatementNode {
    std::string name;         // member imported from the module path
    std::string module_path;  // "Clarice/Extra" or a script path
    bool is_file_path = false;  // written as a string literal
    Token module_token;
};

struct ExpressionStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;
};

struct ProgramNode : public Node {
    std::vector<std::unique_ptr<StatementNode>> body;
};
