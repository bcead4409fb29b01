#pragma once
#include <string>
#include <vector>

#include "value.hpp"

// Factories for the native modules published by the built-in registry.
ModulePtr make_markdown_module();
ModulePtr make_text_module();
ModulePtr make_math_module();
ModulePtr make_lists_module();
ModulePtr make_convert_module();

// Markdown subset -> HTML (headings, paragraphs, lists, fenced code,
// blockquotes, rules, emphasis, inline code, links).
std::string markdown_to_html(const std::string& markdown);

// Argument accessors for native functions. Each throws RuntimeTypeError
// naming the function and the argument position on a kind mismatch.
const std::string& arg_string(const std::vector<Value>& args, size_t i, const std::string& fn, const Token& tok);
std::int64_t arg_int(const std::vector<Value>& args, size_t i, const std::string& fn, const Token& tok);
double arg_number(const std::vector<Value>& args, size_t i, const std::string& fn, const Token& tok);
ListPtr arg_list(const std::vector<Value>& args, size_t i, const std::string& fn, const Token& tok);
