#pragma once

#include <string>
#include <vector>

#include "repeathd/frame.hpp"

namespace repeathd::strict {

struct StrictReport {
    bool utf8_ok = false;
    bool reencode_ok = false;
    bool length_ok = false;
    bool no_nul_ok = false;
    bool size_ok = false;
    std::vector<std::string> reasons;

    bool Passed() const { return reasons.empty(); }
};

bool IsValidUtf8(const frame::Bytes& data);

/// Runs every self-consistency check on a frame decoded from `wire` and
/// records each violation in evaluation order. No check short-circuits another.
StrictReport Check(const frame::Bytes& wire, const frame::Frame& decoded);

}  // namespace repeathd::strict
