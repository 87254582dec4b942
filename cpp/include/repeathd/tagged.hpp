#pragma once

#include <string>
#include <string_view>

#include "repeathd/outcome.hpp"

namespace repeathd::tagged {

/// Legacy text format: "<text>:<lowercase sha256 hex of text>".
std::string Tag(std::string_view text);

// Splits on the last separator so the text itself may contain ':'.
outcome::Outcome Verify(std::string_view tagged);

}  // namespace repeathd::tagged
