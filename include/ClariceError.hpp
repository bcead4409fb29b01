#pragma once
#include <stdexcept>
#include <string>

#include "token.hpp"

// Root of every error the interpreter raises. `kind` is the user-facing
// category ("NameError", "ParseError", ...), `detail` the bare message.
class ClariceError : public std::runtime_error {
   public:
    ClariceError(const std::string& kind,
        const std::string& detail,
        const TokenLocation& loc)
        : std::runtime_error(format_message(kind, detail, loc)),
          kind_(kind),
          detail_(detail),
          loc_(loc) {}

    const std::string& kind() const { return kind_; }
    const std::string& detail() const { return detail_; }
    const TokenLocation& location() const { return loc_; }

   private:
    static std::string format_message(const std::string& kind,
        const std::string& detail,
        const TokenLocation& loc) {
        std::string msg = kind + " at " + loc.to_string() + "\n" + detail;
        if (loc.src_mgr) {
            msg += "\n --> Traced at:\n" + loc.get_line_trace();
        }
        return msg;
    }

    std::string kind_;
    std::string detail_;
    TokenLocation loc_;
};

// Malformed token or unterminated literal. `incomplete` marks errors caused by
// running out of input (the REPL keeps reading instead of reporting).
class LexError : public ClariceError {
   public:
    LexError(const std::string& detail, const TokenLocation& loc, bool incomplete = false)
        : ClariceError("LexError", detail, loc), incomplete_(incomplete) {}

    bool incomplete() const noexcept { return incomplete_; }

   private:
    bool incomplete_;
};

class ParseError : public ClariceError {
   public:
    ParseError(const std::string& expected, const Token& found)
        : ClariceError("ParseError", "Expected " + expected + ", found " + describe_token(found), found.loc),
          expected_(expected),
          found_(found) {}

    const std::string& expected() const { return expected_; }
    const Token& found() const { return found_; }
    bool incomplete() const noexcept { return found_.type == TokenType::EOF_TOKEN; }

   private:
    std::string expected_;
    Token found_;
};

// Base for everything raised while evaluating.
class RuntimeError : public ClariceError {
   public:
    RuntimeError(const std::string& detail, const TokenLocation& loc)
        : ClariceError("RuntimeError", detail, loc) {}

   protected:
    RuntimeError(const std::string& kind, const std::string& detail, const TokenLocation& loc)
        : ClariceError(kind, detail, loc) {}
};

class NameError : public RuntimeError {
   public:
    NameError(const std::string& detail, const TokenLocation& loc)
        : RuntimeError("NameError", detail, loc) {}
};

class RuntimeTypeError : public RuntimeError {
   public:
    RuntimeTypeError(const std::string& detail, const TokenLocation& loc)
        : RuntimeError("RuntimeTypeError", detail, loc) {}
};

class ModuleNotFoundError : public RuntimeError {
   public:
    ModuleNotFoundError(const std::string& detail, const TokenLocation& loc)
        : RuntimeError("ModuleNotFoundError", detail, loc) {}
};

class ControlFlowError : public RuntimeError {
   public:
    ControlFlowError(const std::string& detail, const TokenLocation& loc)
        : RuntimeError("ControlFlowError", detail, loc) {}
};

// Division by zero and integer overflow.
class ArithmeticError : public RuntimeError {
   public:
    ArithmeticError(const std::string& detail, const TokenLocation& loc)
        : RuntimeError("ArithmeticError", detail, loc) {}
};

class IOError : public RuntimeError {
   public:
    IOError(const std::string& detail, const TokenLocation& loc)
        : RuntimeError("IOError", detail, loc) {}
};
