#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "repeathd/outcome.hpp"

namespace repeathd::capsule {

struct Capsule {
    std::string encoding;
    std::string normalized_frame_hex;
    std::vector<std::string> errors;
};

// The rendered text for each output stream of a finished verification.
struct Rendered {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
};

Capsule Build(std::string_view normalized_frame_hex, const outcome::Outcome& result);

std::string ToJson(const Capsule& capsule, bool include_errors);
std::string ErrorsJson(const std::vector<std::string>& errors);

/// PASS: capsule on stdout. FAIL: capsule on stdout, errors on stderr.
/// ERROR: capsule with an empty hex and the errors on stdout.
Rendered Render(std::string_view normalized_frame_hex, const outcome::Outcome& result);

}  // namespace repeathd::capsule
