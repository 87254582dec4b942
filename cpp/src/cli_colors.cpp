#include "repeathd/cli_colors.hpp"

#include "repeathd/env.hpp"

#include <iostream>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
#else
    #include <unistd.h>
#endif

namespace repeathd::cli {

namespace {
    bool g_colors_forced_off = false;
}

bool ColorsEnabled(std::ostream& os) {
    if (g_colors_forced_off || env::Load().colors_suppressed) {
        return false;
    }
    // Auto-detect: only color a stream attached to a TTY
    if (&os == &std::cout) {
        return isatty(fileno(stdout)) != 0;
    }
    if (&os == &std::cerr) {
        return isatty(fileno(stderr)) != 0;
    }
    return false;
}

void SetColorsEnabled(bool enabled) {
    g_colors_forced_off = !enabled;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

std::string StatusLabel(outcome::Status status, std::ostream& os) {
    std::string label = outcome::StatusName(status);
    switch (status) {
        case outcome::Status::Pass:  return BoldGreen(label, os);
        case outcome::Status::Fail:  return BoldYellow(label, os);
        case outcome::Status::Error: return BoldRed(label, os);
    }
    return label;
}

void Warn(const std::string& message) {
    std::cerr << Colorize("WARN: ", color::YELLOW, std::cerr) << message << "\n";
}

void Status(outcome::Status status, const std::string& detail) {
    std::cerr << StatusLabel(status, std::cerr);
    if (!detail.empty()) {
        std::cerr << " " << detail;
    }
    std::cerr << "\n";
}

}  // namespace repeathd::cli
