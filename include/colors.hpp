#pragma once
#include <unistd.h>  // for isatty(), STDERR_FILENO

#include <cstdlib>
#include <string>

namespace Color {
// Diagnostics go to stderr, so that is the stream whose terminal-ness counts.
inline bool supports_color() {
    const char* no_color = std::getenv("NO_COLOR");
    if (no_color && no_color[0] != '\0') return false;
    return isatty(STDERR_FILENO);
}
const std::string reset = "\033[0m";

const std::string red = "\033[31m";
const std::string green = "\033[32m";
const std::string yellow = "\033[33m";
const std::string cyan = "\033[36m";

const std::string bright_black = "\033[90m";  // gray
const std::string bright_red = "\033[91m";

inline std::string paint(const std::string& text, const std::string& color, bool enabled) {
    return enabled ? color + text + reset : text;
}
}  // namespace Color
