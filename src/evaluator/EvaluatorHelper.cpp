#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include "evaluator.hpp"

// ----------------- value helpers -----------------

std::string type_name(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "null";
    if (std::holds_alternative<bool>(v)) return "bool";
    if (std::holds_alternative<std::int64_t>(v)) return "int";
    if (std::holds_alternative<double>(v)) return "float";
    if (std::holds_alternative<std::string>(v)) return "string";
    if (std::holds_alternative<ListPtr>(v)) return "list";
    if (std::holds_alternative<FunctionPtr>(v)) return "function";
    if (std::holds_alternative<ModulePtr>(v)) return "module";
    return "unknown";
}

std::string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";

    // fewest significant digits that still read back exactly
    char buf[64];
    int digits = 1;
    for (; digits < 17; ++digits) {
        std::snprintf(buf, sizeof(buf), "%.*e", digits - 1, d);
        if (std::strtod(buf, nullptr) == d) break;
    }
    std::snprintf(buf, sizeof(buf), "%.*e", digits - 1, d);
    int exponent = std::atoi(std::strchr(buf, 'e') + 1);

    std::string s;
    if (exponent >= -5 && exponent < 16) {
        int decimals = std::max(0, digits - 1 - exponent);
        std::snprintf(buf, sizeof(buf), "%.*f", decimals, d);
        s = buf;
        if (s.find('.') == std::string::npos) s += ".0";
    } else {
        s = buf;
    }
    return s;
}

static std::string quote_nested(const std::string& s) {
    std::ostringstream ss;
    ss << '"';
    for (char c : s) {
        if (c == '\\')
            ss << "\\\\";
        else if (c == '"')
            ss << "\\\"";
        else if (c == '\n')
            ss << "\\n";
        else if (c == '\t')
            ss << "\\t";
        else
            ss << c;
    }
    ss << '"';
    return ss.str();
}

static std::string display_nested(const Value& v) {
    if (std::holds_alternative<std::string>(v)) return quote_nested(std::get<std::string>(v));
    return display_string(v);
}

std::string display_string(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "null";
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<std::int64_t>(v)) return std::to_string(std::get<std::int64_t>(v));
    if (std::holds_alternative<double>(v)) return format_float(std::get<double>(v));
    if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
    if (std::holds_alternative<ListPtr>(v)) {
        const ListPtr& list = std::get<ListPtr>(v);
        std::string out = "[";
        for (size_t i = 0; list && i < list->elements.size(); ++i) {
            if (i) out += ", ";
            out += display_nested(list->elements[i]);
        }
        out += "]";
        return out;
    }
    if (std::holds_alternative<FunctionPtr>(v)) {
        const FunctionPtr& fn = std::get<FunctionPtr>(v);
        return "<function " + (fn ? fn->name : std::string("?")) + ">";
    }
    if (std::holds_alternative<ModulePtr>(v)) {
        const ModulePtr& mod = std::get<ModulePtr>(v);
        return "<module " + (mod ? mod->name : std::string("?")) + ">";
    }
    return "<unknown>";
}

static int compare_int_double(std::int64_t a, double b) {
    if (b >= 9223372036854775808.0) return -1;
    if (b < -9223372036854775808.0) return 1;
    double whole = std::trunc(b);
    std::int64_t ib = static_cast<std::int64_t>(whole);
    if (a < ib) return -1;
    if (a > ib) return 1;
    double frac = b - whole;
    return frac > 0 ? -1 : (frac < 0 ? 1 : 0);
}

int compare_numbers(const Value& a, const Value& b) {
    const bool a_int = std::holds_alternative<std::int64_t>(a);
    const bool b_int = std::holds_alternative<std::int64_t>(b);
    if (a_int && b_int) {
        std::int64_t x = std::get<std::int64_t>(a);
        std::int64_t y = std::get<std::int64_t>(b);
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a_int) return compare_int_double(std::get<std::int64_t>(a), std::get<double>(b));
    if (b_int) return -compare_int_double(std::get<std::int64_t>(b), std::get<double>(a));
    double x = std::get<double>(a);
    double y = std::get<double>(b);
    return x < y ? -1 : (x > y ? 1 : 0);
}

bool values_equal(const Value& a, const Value& b) {
    if (is_numeric(a) && is_numeric(b)) {
        if (std::holds_alternative<double>(a) && std::isnan(std::get<double>(a))) return false;
        if (std::holds_alternative<double>(b) && std::isnan(std::get<double>(b))) return false;
        return compare_numbers(a, b) == 0;
    }
    if (a.index() != b.index()) return false;

    if (std::holds_alternative<std::monostate>(a)) return true;
    if (std::holds_alternative<bool>(a)) return std::get<bool>(a) == std::get<bool>(b);
    if (std::holds_alternative<std::string>(a)) return std::get<std::string>(a) == std::get<std::string>(b);

    if (std::holds_alternative<ListPtr>(a)) {
        const ListPtr& A = std::get<ListPtr>(a);
        const ListPtr& B = std::get<ListPtr>(b);
        if (A == B) return true;
        if (!A || !B) return false;
        if (A->elements.size() != B->elements.size()) return false;
        for (size_t i = 0; i < A->elements.size(); ++i) {
            if (!values_equal(A->elements[i], B->elements[i])) return false;
        }
        return true;
    }

    if (std::holds_alternative<FunctionPtr>(a)) return std::get<FunctionPtr>(a) == std::get<FunctionPtr>(b);
    if (std::holds_alternative<ModulePtr>(a)) return std::get<ModulePtr>(a) == std::get<ModulePtr>(b);
    return false;
}

// number of bytes in the sequence starting at s[i]; 1 for anything malformed
static size_t utf8_sequence_length(const std::string& s, size_t i) {
    unsigned char lead = static_cast<unsigned char>(s[i]);
    size_t len = 1;
    if (lead >= 0xC2 && lead <= 0xDF)
        len = 2;
    else if (lead >= 0xE0 && lead <= 0xEF)
        len = 3;
    else if (lead >= 0xF0 && lead <= 0xF4)
        len = 4;
    if (i + len > s.size()) return 1;
    for (size_t k = 1; k < len; ++k) {
        if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return 1;
    }
    return len;
}

std::vector<std::string> utf8_chars(const std::string& s) {
    std::vector<std::string> out;
    for (size_t i = 0; i < s.size();) {
        size_t len = utf8_sequence_length(s, i);
        out.push_back(s.substr(i, len));
        i += len;
    }
    return out;
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (size_t i = 0; i < s.size(); i += utf8_sequence_length(s, i)) ++n;
    return n;
}

// ----------------- Evaluator helpers -----------------

bool Evaluator::to_condition(const Value& v, const Token& tok) {
    if (!std::holds_alternative<bool>(v)) {
        throw RuntimeTypeError("Condition must be a bool, got " + type_name(v) + " (" + display_string(v) + ")", tok.loc);
    }
    return std::get<bool>(v);
}

