#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace repeathd::frame {

using Bytes = std::vector<std::uint8_t>;

// Raised when a wire buffer cannot be interpreted as a frame at all.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& reason) : std::runtime_error(reason) {}
};

struct Frame {
    std::uint32_t checksum = 0;
    std::uint32_t length = 0;
    Bytes payload;
};

struct DecodeResult {
    std::optional<Frame> frame;
    std::string error;
};

struct ValidationReport {
    bool length_ok = false;
    bool crc_ok = false;
    std::vector<std::string> reasons;

    bool Passed() const { return length_ok && crc_ok; }
};

std::uint32_t Crc32(const std::uint8_t* data, std::size_t size);
std::uint32_t Crc32(const Bytes& data);

/// Frames `payload` as [crc32 LE][length LE][payload].
/// Throws std::length_error when the payload does not fit a 32-bit length.
Bytes Encode(const Bytes& payload);
Bytes Encode(std::string_view text);

/// Splits a wire buffer into header fields and payload.
/// Only the structure is checked here; the checksum is left to Validate().
Frame Decode(const Bytes& wire);
DecodeResult TryDecode(const Bytes& wire);

ValidationReport Validate(const Frame& frame);

}  // namespace repeathd::frame
