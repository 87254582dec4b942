#include "repeathd/hex.hpp"

#include "repeathd/constants.hpp"

#include <array>
#include <cctype>

namespace repeathd::hex {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

std::array<int, 256> BuildDigitTable() {
    std::array<int, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 16; ++i) {
        table[static_cast<unsigned char>(kHexDigits[i])] = i;
    }
    return table;
}

const std::array<int, 256> kDigitTable = BuildDigitTable();

std::string DescribeChar(unsigned char ch) {
    if (std::isprint(ch)) {
        return std::string("'") + static_cast<char>(ch) + "'";
    }
    static constexpr char kUpper[] = "0123456789ABCDEF";
    std::string out = "0x";
    out.push_back(kUpper[(ch >> 4) & 0x0F]);
    out.push_back(kUpper[ch & 0x0F]);
    return out;
}

}  // namespace

std::string Normalize(std::string_view raw, LengthRule rule) {
    std::string out;
    out.reserve(raw.size());
    std::size_t position = 0;
    for (unsigned char ch : raw) {
        ++position;
        if (std::isspace(ch)) {
            continue;
        }
        unsigned char lowered = static_cast<unsigned char>(std::tolower(ch));
        if (kDigitTable[lowered] < 0) {
            throw NormalizeError("invalid character: non-hexadecimal " + DescribeChar(ch)
                                 + " at position " + std::to_string(position));
        }
        out.push_back(static_cast<char>(lowered));
    }
    if (out.empty()) {
        throw NormalizeError("empty input");
    }
    if (rule == LengthRule::Even) {
        if (out.size() % 2 != 0) {
            throw NormalizeError("odd number of hex digits (" + std::to_string(out.size()) + ")");
        }
    } else if (out.size() < constants::kFrameHeaderHexLen) {
        throw NormalizeError("header too short: need " + std::to_string(constants::kFrameHeaderHexLen)
                             + " hex digits, got " + std::to_string(out.size()));
    }
    return out;
}

NormalizeResult TryNormalize(std::string_view raw, LengthRule rule) {
    NormalizeResult result;
    try {
        result.normalized = Normalize(raw, rule);
        result.ok = true;
    } catch (const NormalizeError& exc) {
        result.error = exc.what();
    }
    return result;
}

std::string HexEncode(const std::vector<std::uint8_t>& data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t byte : data) {
        out.push_back(kHexDigits[(byte >> 4) & 0x0F]);
        out.push_back(kHexDigits[byte & 0x0F]);
    }
    return out;
}

std::vector<std::uint8_t> HexDecode(std::string_view normalized) {
    if (normalized.size() % 2 != 0) {
        throw NormalizeError("dangling nibble: " + std::to_string(normalized.size())
                             + " hex digits do not form whole bytes");
    }
    std::vector<std::uint8_t> out;
    out.reserve(normalized.size() / 2);
    for (std::size_t i = 0; i < normalized.size(); i += 2) {
        int hi = kDigitTable[static_cast<unsigned char>(normalized[i])];
        int lo = kDigitTable[static_cast<unsigned char>(normalized[i + 1])];
        if (hi < 0 || lo < 0) {
            throw NormalizeError("invalid character: non-hexadecimal digit at position "
                                 + std::to_string(hi < 0 ? i + 1 : i + 2));
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

}  // namespace repeathd::hex
