#pragma once

#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "repeathd/capsule.hpp"
#include "repeathd/constants.hpp"
#include "repeathd/frame.hpp"
#include "repeathd/hex.hpp"
#include "repeathd/outcome.hpp"
#include "repeathd/strict.hpp"
#include "repeathd/tagged.hpp"

namespace repeathd {

// Input that could not be read at all (missing file, broken stream).
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& reason) : std::runtime_error(reason) {}
};

struct VerifyOptions {
    bool strict = false;
};

struct Verification {
    outcome::Outcome result;
    std::string normalized_frame_hex;
};

// Both throw InputError.
std::vector<std::uint8_t> ReadFile(const std::string& path);
std::vector<std::uint8_t> ReadStream(std::istream& input);
void WriteFile(const std::string& path, const std::vector<std::uint8_t>& data);

// An ERROR verification carrying `reason`, for input that never reached a pipeline.
Verification InputFailure(const std::string& reason);

/// Frames `payload` and reports the frame as hex.
Verification EncodeFrame(const std::vector<std::uint8_t>& payload);

// Decode, checksum/length validation, then the strict suite when requested.
Verification VerifyFrameBytes(const std::vector<std::uint8_t>& wire, const VerifyOptions& options = {});

// Hex text is normalized with LengthRule::HeaderOnly before decoding.
Verification VerifyFrameHex(std::string_view raw_hex, const VerifyOptions& options = {});

// Standalone capsule check with LengthRule::Even; the result is PASS or ERROR.
Verification VerifyPublicHex(std::string_view raw_hex);

capsule::Rendered Render(const Verification& verification);

}  // namespace repeathd
