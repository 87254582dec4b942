#include "repeathd/env.hpp"

#include "repeathd/constants.hpp"

#include <cctype>
#include <cstdlib>

namespace repeathd::env {

namespace {

bool IsBlank(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

std::string_view TrimView(std::string_view value) {
    while (!value.empty() && IsBlank(value.front())) {
        value.remove_prefix(1);
    }
    while (!value.empty() && IsBlank(value.back())) {
        value.remove_suffix(1);
    }
    return value;
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

constexpr std::string_view kOnWords[] = {"1", "true", "yes", "on"};
constexpr std::string_view kOffWords[] = {"0", "false", "no", "off"};

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::optional<bool> ParseSwitch(std::string_view value) {
    value = TrimView(value);
    for (std::string_view word : kOnWords) {
        if (EqualsIgnoreCase(value, word)) {
            return true;
        }
    }
    for (std::string_view word : kOffWords) {
        if (EqualsIgnoreCase(value, word)) {
            return false;
        }
    }
    return std::nullopt;
}

bool IsEnabled(std::string_view name, bool default_value) {
    return ParseSwitch(Get(name)).value_or(default_value);
}

Settings Load() {
    Settings settings;
    settings.strict = IsEnabled(constants::kStrictEnv, false);
    settings.verbose = IsEnabled(constants::kVerboseEnv, false);
    // NO_COLOR counts when set to any non-empty value.
    settings.colors_suppressed = !Get(constants::kNoColorEnv).empty();
    return settings;
}

}  // namespace repeathd::env
