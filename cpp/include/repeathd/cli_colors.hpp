#pragma once

#include <iostream>
#include <ostream>
#include <string>

#include "repeathd/outcome.hpp"

namespace repeathd::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* YELLOW = "\033[0;33m";

    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BOLD_GREEN = "\033[1;32m";
    constexpr const char* BOLD_YELLOW = "\033[1;33m";
}

// Check if colors should be enabled for the given stream
bool ColorsEnabled(std::ostream& os = std::cout);

// Set whether colors are enabled (can be disabled via --no-color)
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string BoldRed(const std::string& text, std::ostream& os = std::cout) {
    return Colorize(text, color::BOLD_RED, os);
}
inline std::string BoldGreen(const std::string& text, std::ostream& os = std::cout) {
    return Colorize(text, color::BOLD_GREEN, os);
}
inline std::string BoldYellow(const std::string& text, std::ostream& os = std::cout) {
    return Colorize(text, color::BOLD_YELLOW, os);
}

// "PASS" in green, "FAIL" in yellow, "ERROR" in red.
std::string StatusLabel(outcome::Status status, std::ostream& os);

// Diagnostic lines on stderr.
void Warn(const std::string& message);
void Status(outcome::Status status, const std::string& detail);

}  // namespace repeathd::cli
