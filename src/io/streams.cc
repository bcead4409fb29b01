#include "io.hpp"

void StreamOutput::write(const std::string& text) {
    out_ << text;
    out_.flush();
}

std::optional<std::string> StreamInput::read_line() {
    std::string line;
    if (!std::getline(in_, line)) return std::nullopt;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}
