#include <cstdlib>
#include <iostream>
#include <string>

#include "repeathd/env.hpp"

namespace {

int g_failures = 0;

void Expect(bool ok, const std::string& what) {
    std::cout << (ok ? "  ok    " : "  FAIL  ") << what << std::endl;
    if (!ok) {
        ++g_failures;
    }
}

void Set(const char* name, const char* value) {
    setenv(name, value, 1);
}

}  // namespace

int main() {
    using repeathd::env::ParseSwitch;

    std::cout << "Switch words:" << std::endl;
    Expect(ParseSwitch("1") == true && ParseSwitch("YES") == true && ParseSwitch(" On ") == true,
           "on words, any case, trimmed");
    Expect(ParseSwitch("0") == false && ParseSwitch("False") == false && ParseSwitch("off\n") == false,
           "off words, any case, trimmed");
    Expect(!ParseSwitch("").has_value() && !ParseSwitch("maybe").has_value(), "anything else is unset");

    std::cout << "Environment:" << std::endl;
    Set("REPEATHD_TEST_SWITCH", "garbage");
    Expect(repeathd::env::IsEnabled("REPEATHD_TEST_SWITCH", true), "unrecognized value keeps the default");
    Set("REPEATHD_TEST_SWITCH", "no");
    Expect(!repeathd::env::IsEnabled("REPEATHD_TEST_SWITCH", true), "explicit off beats a true default");
    unsetenv("REPEATHD_TEST_SWITCH");
    Expect(repeathd::env::Get("REPEATHD_TEST_SWITCH").empty(), "unset variable reads empty");

    Set("REPEATHD_STRICT", "true");
    Set("REPEATHD_VERBOSE", "0");
    Set("NO_COLOR", "x");
    repeathd::env::Settings settings = repeathd::env::Load();
    Expect(settings.strict && !settings.verbose && settings.colors_suppressed, "Load reads all three settings");

    unsetenv("REPEATHD_STRICT");
    unsetenv("REPEATHD_VERBOSE");
    unsetenv("NO_COLOR");
    repeathd::env::Settings defaults = repeathd::env::Load();
    Expect(!defaults.strict && !defaults.verbose && !defaults.colors_suppressed, "defaults are all off");

    std::cout << (g_failures == 0 ? "All env checks passed" : "Env checks failed") << std::endl;
    return g_failures == 0 ? 0 : 1;
}
