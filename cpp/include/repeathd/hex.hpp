#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace repeathd::hex {

class NormalizeError : public std::runtime_error {
public:
    explicit NormalizeError(const std::string& reason) : std::runtime_error(reason) {}
};

// Which part of the normalized text must hold whole bytes.
enum class LengthRule {
    Even,        // the whole string, used by publichex-verify
    HeaderOnly,  // only the 16-digit frame header, used before frame decoding
};

struct NormalizeResult {
    std::string normalized;
    bool ok = false;
    std::string error;
};

/// Strips whitespace, lower-cases and checks the digits against `rule`.
/// Throws NormalizeError on empty input, a non-hex character or a length violation.
std::string Normalize(std::string_view raw, LengthRule rule = LengthRule::Even);
NormalizeResult TryNormalize(std::string_view raw, LengthRule rule = LengthRule::Even);

std::string HexEncode(const std::vector<std::uint8_t>& data);
std::vector<std::uint8_t> HexDecode(std::string_view normalized);

}  // namespace repeathd::hex
