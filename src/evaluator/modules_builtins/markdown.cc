#include <cctype>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "ClariceError.hpp"
#include "builtins.hpp"

namespace {

std::string escape_html(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            default:
                out += c;
        }
    }
    return out;
}

std::string render_inline(const std::string& text) {
    std::string out;
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        char c = text[i];

        if (c == '\\' && i + 1 < n && std::ispunct(static_cast<unsigned char>(text[i + 1]))) {
            out += escape_html(std::string(1, text[i + 1]));
            i += 2;
            continue;
        }

        if (c == '`') {
            size_t close = text.find('`', i + 1);
            if (close != std::string::npos) {
                out += "<code>" + escape_html(text.substr(i + 1, close - i - 1)) + "</code>";
                i = close + 1;
                continue;
            }
        }

        if (c == '*' && i + 1 < n && text[i + 1] == '*') {
            size_t close = text.find("**", i + 2);
            if (close != std::string::npos && close > i + 2) {
                out += "<strong>" + render_inline(text.substr(i + 2, close - i - 2)) + "</strong>";
                i = close + 2;
                continue;
            }
        }

        if (c == '*' || c == '_') {
            size_t close = text.find(c, i + 1);
            if (close != std::string::npos && close > i + 1) {
                out += "<em>" + render_inline(text.substr(i + 1, close - i - 1)) + "</em>";
                i = close + 1;
                continue;
            }
        }

        if (c == '[') {
            size_t mid = text.find("](", i + 1);
            size_t close = mid == std::string::npos ? std::string::npos : text.find(')', mid + 2);
            if (close != std::string::npos) {
                std::string label = text.substr(i + 1, mid - i - 1);
                std::string url = text.substr(mid + 2, close - mid - 2);
                out += "<a href=\"" + escape_html(url) + "\">" + render_inline(label) + "</a>";
                i = close + 1;
                continue;
            }
        }

        out += escape_html(std::string(1, c));
        ++i;
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool is_rule(const std::string& line) {
    std::string t = trim(line);
    if (t.size() < 3) return false;
    char m = t[0];
    if (m != '-' && m != '*' && m != '_') return false;
    for (char c : t) {
        if (c != m && c != ' ') return false;
    }
    return true;
}

// "#".."######" followed by a space; 0 when the line is not a heading
int heading_level(const std::string& line) {
    int level = 0;
    while (level < static_cast<int>(line.size()) && line[level] == '#') ++level;
    if (level == 0 || level > 6) return 0;
    if (level < static_cast<int>(line.size()) && line[level] != ' ') return 0;
    return level;
}

// "- x", "* x", "+ x"
bool unordered_item(const std::string& line, std::string& item) {
    std::string t = trim(line);
    if (t.size() >= 2 && (t[0] == '-' || t[0] == '*' || t[0] == '+') && t[1] == ' ') {
        item = trim(t.substr(2));
        return true;
    }
    return false;
}

bool ordered_item(const std::string& line, std::string& item) {
    std::string t = trim(line);
    size_t i = 0;
    while (i < t.size() && std::isdigit(static_cast<unsigned char>(t[i]))) ++i;
    if (i == 0 || i + 1 >= t.size() || t[i] != '.' || t[i + 1] != ' ') return false;
    item = trim(t.substr(i + 2));
    return true;
}

class HtmlBuilder {
   public:
    std::string render(const std::vector<std::string>& lines) {
        size_t i = 0;
        while (i < lines.size()) {
            const std::string& line = lines[i];
            std::string t = trim(line);

            if (t.rfind("```", 0) == 0) {
                close_blocks();
                std::string lang = trim(t.substr(3));
                std::string code;
                ++i;
                while (i < lines.size() && trim(lines[i]).rfind("```", 0) != 0) {
                    code += lines[i] + "\n";
                    ++i;
                }
                ++i;  // closing fence (or end of input)
                out_ << "<pre><code";
                if (!lang.empty()) out_ << " class=\"language-" << escape_html(lang) << "\"";
                out_ << ">" << escape_html(code) << "</code></pre>\n";
                continue;
            }

            if (t.empty()) {
                close_blocks();
                ++i;
                continue;
            }

            if (t[0] == '>') {
                close_blocks();
                std::vector<std::string> inner;
                while (i < lines.size()) {
                    std::string q = trim(lines[i]);
                    if (q.empty() || q[0] != '>') break;
                    q.erase(0, 1);
                    if (!q.empty() && q[0] == ' ') q.erase(0, 1);
                    inner.push_back(q);
                    ++i;
                }
                HtmlBuilder nested;
                out_ << "<blockquote>\n" << nested.render(inner) << "</blockquote>\n";
                continue;
            }

            int level = heading_level(t);
            if (level > 0) {
                close_blocks();
                std::string body = trim(t.substr(static_cast<size_t>(level)));
                out_ << "<h" << level << ">" << render_inline(body) << "</h" << level << ">\n";
                ++i;
                continue;
            }

            if (is_rule(t)) {
                close_blocks();
                out_ << "<hr />\n";
                ++i;
                continue;
            }

            std::string item;
            if (unordered_item(t, item)) {
                open_list("ul");
                out_ << "<li>" << render_inline(item) << "</li>\n";
                ++i;
                continue;
            }
            if (ordered_item(t, item)) {
                open_list("ol");
                out_ << "<li>" << render_inline(item) << "</li>\n";
                ++i;
                continue;
            }

            close_list();
            paragraph_.push_back(t);
            ++i;
        }
        close_blocks();
        return out_.str();
    }

   private:
    std::ostringstream out_;
    std::vector<std::string> paragraph_;
    std::string list_tag_;

    void open_list(const std::string& tag) {
        flush_paragraph();
        if (list_tag_ == tag) return;
        close_list();
        list_tag_ = tag;
        out_ << "<" << tag << ">\n";
    }

    void close_list() {
        if (list_tag_.empty()) return;
        out_ << "</" << list_tag_ << ">\n";
        list_tag_.clear();
    }

    void flush_paragraph() {
        if (paragraph_.empty()) return;
        std::string text;
        for (size_t k = 0; k < paragraph_.size(); ++k) {
            if (k) text += "\n";
            text += paragraph_[k];
        }
        out_ << "<p>" << render_inline(text) << "</p>\n";
        paragraph_.clear();
    }

    void close_blocks() {
        flush_paragraph();
        close_list();
    }
};

}  // namespace

std::string markdown_to_html(const std::string& markdown) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream in(markdown);
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    HtmlBuilder builder;
    return builder.render(lines);
}

ModulePtr make_markdown_module() {
    auto mod = std::make_shared<ModuleValue>("Markdown");

    mod->define_function("ToHTML", 1, [](const std::vector<Value>& args, const Token& tok) -> Value {
        return markdown_to_html(arg_string(args, 0, "Markdown.ToHTML", tok));
    });

    // ConvertHTML(markdown, path): writes the rendered document, returns null
    mod->define_function("ConvertHTML", 2, [](const std::vector<Value>& args, const Token& tok) -> Value {
        const std::string& text = arg_string(args, 0, "Markdown.ConvertHTML", tok);
        const std::string& path = arg_string(args, 1, "Markdown.ConvertHTML", tok);
        std::string html = markdown_to_html(text);

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IOError("Markdown.ConvertHTML: cannot open '" + path + "' for writing", tok.loc);
        }
        out << html;
        out.flush();
        if (!out) {
            throw IOError("Markdown.ConvertHTML: failed writing '" + path + "'", tok.loc);
        }
        return std::monostate{};
    });

    return mod;
}
