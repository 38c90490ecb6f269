#include "pngfiles/cli_colors.hpp"

#include "pngfiles/env.hpp"

#include <cstdio>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
#else
    #include <unistd.h>
#endif

namespace pngfiles::cli {

namespace {
    bool g_forced = false;
    bool g_forced_value = false;

    bool IsTerminal(std::ostream& os) {
        if (&os == &std::cout) {
            return isatty(fileno(stdout)) != 0;
        }
        if (&os == &std::cerr || &os == &std::clog) {
            return isatty(fileno(stderr)) != 0;
        }
        return false;
    }
}

bool ColorsEnabled(std::ostream& os) {
    if (g_forced) {
        return g_forced_value;
    }
    if (pngfiles::env::ColorsDisabled()) {
        return false;
    }
    return IsTerminal(os);
}

void SetColorsEnabled(bool enabled) {
    g_forced = true;
    g_forced_value = enabled;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace pngfiles::cli
