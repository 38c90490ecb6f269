#include "pngfiles/log.hpp"

#include "pngfiles/cli_colors.hpp"
#include "pngfiles/env.hpp"

#include <iostream>

namespace pngfiles::log {

namespace {

int g_debug_override = -1;

void Emit(const char* label, const char* color, const std::string& message) {
    std::cerr << cli::Colorize(label, color, std::cerr) << " " << message << "\n";
}

}  // namespace

bool DebugEnabled() {
    if (g_debug_override >= 0) {
        return g_debug_override == 1;
    }
    return env::DebugRequested();
}

void SetDebugEnabled(bool enabled) {
    g_debug_override = enabled ? 1 : 0;
}

void Debug(const std::string& message) {
    if (!DebugEnabled()) {
        return;
    }
    Emit("DEBUG:", cli::color::BRIGHT_BLACK, message);
}

void Warn(const std::string& message) {
    Emit("WARN:", cli::color::YELLOW, message);
}

void Error(const std::string& message) {
    Emit("Error:", cli::color::BOLD_RED, message);
}

}  // namespace pngfiles::log
