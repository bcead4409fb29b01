#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

#include "ClariceError.hpp"
#include "builtins.hpp"

// ----------------- argument accessors -----------------

static std::string arg_position(size_t i) {
    return "argument " + std::to_string(i + 1);
}

const std::string& arg_string(const std::vector<Value>& args, size_t i, const std::string& fn, const Token& tok) {
    if (i >= args.size() || !std::holds_alternative<std::string>(args[i])) {
        std::string got = i < args.size() ? type_name(args[i]) : "nothing";
        throw RuntimeTypeError(fn + " expects a string as " + arg_position(i) + ", got " + got, tok.loc);
    }
    return std::get<std::string>(args[i]);
}

std::int64_t arg_int(const std::vector<Value>& args, size_t i, const std::string& fn, const Token& tok) {
    if (i >= args.size() || !std::holds_alternative<std::int64_t>(args[i])) {
        std::string got = i < args.size() ? type_name(args[i]) : "nothing";
        throw RuntimeTypeError(fn + " expects an int as " + arg_position(i) + ", got " + got, tok.loc);
    }
    return std::get<std::int64_t>(args[i]);
}

double arg_number(const std::vector<Value>& args, size_t i, const std::string& fn, const Token& tok) {
    if (i >= args.size() || !is_numeric(args[i])) {
        std::string got = i < args.size() ? type_name(args[i]) : "nothing";
        throw RuntimeTypeError(fn + " expects a number as " + arg_position(i) + ", got " + got, tok.loc);
    }
    return as_double(args[i]);
}

ListPtr arg_list(const std::vector<Value>& args, size_t i, const std::string& fn, const Token& tok) {
    if (i >= args.size() || !std::holds_alternative<ListPtr>(args[i])) {
        std::string got = i < args.size() ? type_name(args[i]) : "nothing";
        throw RuntimeTypeError(fn + " expects a list as " + arg_position(i) + ", got " + got, tok.loc);
    }
    return std::get<ListPtr>(args[i]);
}

// float -> int for Floor/Ceil/Round/ToInt; NaN, inf and out-of-range values
// have no integer counterpart
static std::int64_t float_to_int(double d, const std::string& fn, const Token& tok) {
    if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
        throw ArithmeticError(fn + ": " + format_float(d) + " does not fit in an int", tok.loc);
    }
    return static_cast<std::int64_t>(d);
}

// ----------------- Text -----------------

ModulePtr make_text_module() {
    auto mod = std::make_shared<ModuleValue>("Text");

    mod->define_function("Length", 1, [](const std::vector<Value>& args, const Token& tok) -> Value {
        return static_cast<std::int64_t>(utf8_length(arg_string(args, 0, "Text.Length", tok)));
    });

    mod->define_function("Upper", 1, [](const std::vector<Value>& args, const Token& tok) -> Value {
        std::string s = arg_string(args, 0, "Text.Upper", tok);
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    });

    mod->define_function("Lower", 1, [](const std::vector<Value>& args, const Token& tok) -> Value {
        std::string s = arg_string(args, 0, "Text.Lower", tok);
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    });

    mod->define_function("Trim", 1, [](const std::vector<Value>& args, const Token& tok) -> Value {
        const std::string& s = arg_string(args, 0, "Text.Trim", tok);
        size_t b = 0;
        size_t e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return s.substr(b, e - b);
    });

    mod->define_function("Contains", 2, [](const std::vector<Value>& args, const Token& tok) -> Value {
        const std::string& s = arg_string(args, 0, "Text.Contains", tok);
        const std::string& needle = arg_string(args, 1, "Text.Contains", tok);
        return s.find(needle) != std::string::npos;
    });

    // empty separator splits into single characters (code points)
    mod->define_function("Split", 2, [](const std::vector<Value>& args, const Token& tok) -> Value {
        const std::string& s = arg_string(args, 0, "Text.Split", tok);
        const std::string& sep = arg_string(args, 1, "Text.Split", tok);
        std::vector<Value> parts;
        if (sep.empty()) {
            for (std::string& c : utf8_chars(s)) parts.emplace_back(std::move(c));
        } else {
            size_t start = 0;
            while (true) {
                size_t pos = s.find(sep, start);
                if (pos == std::string::npos) {
                    parts.emplace_back(s.substr(start));
                    break;
                }
                parts.emplace_back(s.substr(start, pos - start));
                start = pos + sep.size();
            }
        }
        return std::make_shared<ListValue>(std::move(parts));
    });

    mod->define_function("Join", 2, [](const std::vector<Value>& args, const Token& tok) -> Value {
        ListPtr list = arg_list(args, 0, "Text.Join", tok);
        const std::string& sep = arg_string(args, 1, "Text.Join", tok);
        std::string out;
        for (size_t i = 0; i < list->elements.size(); ++i) {
            if (i) out += sep;
            out += display_string(list->elements[i]);
        }
        return out;
    });

    return mod;
}

// ----------------- Math -----------------

ModulePtr make_math_module() {
    auto mod = std::make_shared<ModuleValue>("Math");

    mod->define("Pi", 3.14159265358979323846);

    mod->define_function("Abs", 1, [](const std::vector<Value>& args, const Token& tok) -> Value {
        arg_number(args, 0, "Math.Abs", tok);
        if (std::holds_alternative<std::int64_t>(args[0])) {
            std::int64_t n = std::get<std::int64_t>(args[0]);
            if (n == std::numeric_limits<std::int64_t>::min()) {
                throw ArithmeticError("Math.Abs: integer overflow", tok.loc);
            }
            return n < 0 ? -n : n;
        }
        return std::fabs(std::get<double>(args[0]));
    });

    // Min/Max hand back the winning argument unchanged (int stays int)
    mod->define_function("Min", 2, [](const std::vector<Value>& args, const Token& tok) -> Value {
        double a = arg_number(args, 0, "Math.Min", tok);
        double b = arg_number(args, 1, "Math.Min", tok);
        return b < a ? args[1] : args[0];
    });

    mod->define_function("Max", 2, [](const std::vector<Value>& args, const Token& tok) -> Value {
        double a = arg_number(args, 0, "Math.Max", tok);
        double b = arg_number(args, 1, "Math.Max", tok);
        return b > a ? args[1] : args[0];
    });

    mod->define_function("Floor", 1, [](const std::vector<Value>& args, const Token& tok) -> Value {
        double d = arg_number(args, 0, "Math.Floor", tok);
        if (std::holds_alternative<std::int64_t>(args[0])) return args[0];
        return float_to_int(std::floor(d), "Math.Floor", tok);
    });

    mod->define_function("Ceil", 1, [](const std::vector<Value>& args, const Token& tok) -> Value {
        double d = arg_number(args, 0, "Math.Ceil", tok);
        if (std::holds_alternative<std::int64_t>(args[0])) return args[0];
        return float_to_int(std::ceil(d), "Math.Ceil", tok);
    });

    mod->define_function("Round", 1, [](const std::vector<Value>& args, const Token& tok) -> Value {
        double d = arg_number(args, 0, "Math.Round", tok);
        if (std::holds_alternative<std::int64_t>(args[0])) return args[0];
        return float_to_int(std::round(d), "Math.Round", tok);
    });

    mod->define_function("Sqrt", 1, [](const std::vector<Value>& args, const Token& tok) -> Value {
        double d = arg_number(args, 0, "Math.Sqrt", tok);
        if (d < 0) {
            throw ArithmeticError("Math.Sqrt of a negative number (" + display_string(args[0]) + ")", tok.loc);
        }
        return std::sqrt(d);
    });

    return mod;
}

// ----------------- Lists -----------------

static const std::int64_t kMaxRangeLength = 10000000;

ModulePtr make_lists_module() {
    auto mod = std::make_shared<ModuleValue>("Lists");

    mod->define_function("Length", 1, [](const std::vector<Value>& args, const Token& tok) -> Value {
        return static_cast<std::int64_t>(arg_list(args, 0, "Lists.Length", tok)->elements.size());
    });

    // lists are immutable: Append builds a new one
    mod->define_function("Append", 2, [](const std::vector<Value>& args, const Token& tok) -> Value {
        ListPtr list = arg_list(args, 0, "Lists.Append", tok);
        std::vector<Value> elems = list->elements;
        elems.push_back(args[1]);
        return std::make_shared<ListValue>(std::move(elems));
    });

    // zero-based; negative indexes count from the end
    mod->define_function("At", 2, [](const std::vector<Value>& args, const Token& tok) -> Value {
        ListPtr list = arg_list(args, 0, "Lists.At", tok);
        std::int64_t idx = arg_int(args, 1, "Lists.At", tok);
        std::int64_t n = static_cast<std::int64_t>(list->elements.size());
        std::int64_t real = idx < 0 ? n + idx : idx;
        if (real < 0 || real >= n) {
            throw RuntimeError("Lists.At: index " + std::to_string(idx) + " is out of range for a list of length " + std::to_string(n), tok.loc);
        }
        return list->elements[static_cast<size_t>(real)];
    });

    // [start, end)
    mod->define_function("Range", 2, [](const std::vector<Value>& args, const Token& tok) -> Value {
        std::int64_t start = arg_int(args, 0, "Lists.Range", tok);
        std::int64_t end = arg_int(args, 1, "Lists.Range", tok);
        std::vector<Value> elems;
        if (end > start) {
            std::int64_t len = 0;
            if (__builtin_sub_overflow(end, start, &len) || len > kMaxRangeLength) {
                throw RuntimeError("Lists.Range: range is too large", tok.loc);
            }
            elems.reserve(static_cast<size_t>(len));
            for (std::int64_t i = start; i < end; ++i) elems.emplace_back(i);
        }
        return std::make_shared<ListValue>(std::move(elems));
    });

    return mod;
}

// ----------------- Convert -----------------

static std::string trimmed(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

ModulePtr make_convert_module() {
    auto mod = std::make_shared<ModuleValue>("Convert");

    mod->define_function("ToString", 1, [](const std::vector<Value>& args, const Token&) -> Value {
        return display_string(args[0]);
    });

    mod->define_function("TypeOf", 1, [](const std::vector<Value>& args, const Token&) -> Value {
        return type_name(args[0]);
    });

    mod->define_function("ToInt", 1, [](const std::vector<Value>& args, const Token& tok) -> Value {
        const Value& v = args[0];
        if (std::holds_alternative<std::int64_t>(v)) return v;
        if (std::holds_alternative<double>(v)) return float_to_int(std::trunc(std::get<double>(v)), "Convert.ToInt", tok);
        if (std::holds_alternative<std::string>(v)) {
            std::string s = trimmed(std::get<std::string>(v));
            errno = 0;
            char* end = nullptr;
            long long n = std::strtoll(s.c_str(), &end, 10);
            if (s.empty() || *end != '\0') {
                throw RuntimeError("Convert.ToInt: \"" + std::get<std::string>(v) + "\" is not an integer", tok.loc);
            }
            if (errno == ERANGE) {
                throw ArithmeticError("Convert.ToInt: \"" + s + "\" does not fit in an int", tok.loc);
            }
            return static_cast<std::int64_t>(n);
        }
        throw RuntimeTypeError("Convert.ToInt cannot convert a " + type_name(v), tok.loc);
    });

    mod->define_function("ToFloat", 1, [](const std::vector<Value>& args, const Token& tok) -> Value {
        const Value& v = args[0];
        if (is_numeric(v)) return as_double(v);
        if (std::holds_alternative<std::string>(v)) {
            std::string s = trimmed(std::get<std::string>(v));
            char* end = nullptr;
            double d = std::strtod(s.c_str(), &end);
            if (s.empty() || *end != '\0') {
                throw RuntimeError("Convert.ToFloat: \"" + std::get<std::string>(v) + "\" is not a number", tok.loc);
            }
            return d;
        }
        throw RuntimeTypeError("Convert.ToFloat cannot convert a " + type_name(v), tok.loc);
    });

    return mod;
}
