#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace repeathd::env {

// Process-level settings read from REPEATHD_STRICT, REPEATHD_VERBOSE and NO_COLOR.
struct Settings {
    bool strict = false;
    bool verbose = false;
    bool colors_suppressed = false;
};

std::string Get(std::string_view name);

/// Reads a yes/no switch: 1/true/yes/on or 0/false/no/off, case-insensitive,
/// surrounding whitespace ignored. Anything else is std::nullopt.
std::optional<bool> ParseSwitch(std::string_view value);
bool IsEnabled(std::string_view name, bool default_value = false);

Settings Load();

}  // namespace repeathd::env
