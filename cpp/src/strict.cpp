#include "repeathd/strict.hpp"

#include "repeathd/constants.hpp"

#include <algorithm>

namespace repeathd::strict {

namespace {

// Number of continuation bytes implied by a lead byte, or -1 if it cannot lead.
int SequenceTail(std::uint8_t lead) {
    if (lead < 0x80) {
        return 0;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return 1;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        return 2;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        return 3;
    }
    return -1;
}

}  // namespace

bool IsValidUtf8(const frame::Bytes& data) {
    std::size_t i = 0;
    while (i < data.size()) {
        std::uint8_t lead = data[i];
        int tail = SequenceTail(lead);
        if (tail < 0 || static_cast<std::size_t>(tail) > data.size() - i - 1) {
            return false;
        }
        for (int k = 1; k <= tail; ++k) {
            if ((data[i + static_cast<std::size_t>(k)] & 0xC0) != 0x80) {
                return false;
            }
        }
        if (tail >= 2) {
            std::uint8_t second = data[i + 1];
            // Reject overlongs, UTF-16 surrogates and code points above U+10FFFF.
            if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F)
                || (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F)) {
                return false;
            }
        }
        i += static_cast<std::size_t>(tail) + 1;
    }
    return true;
}

StrictReport Check(const frame::Bytes& wire, const frame::Frame& decoded) {
    StrictReport report;

    report.utf8_ok = IsValidUtf8(decoded.payload);
    if (!report.utf8_ok) {
        report.reasons.emplace_back("payload is not valid UTF-8");
    }

    frame::Bytes reencoded = frame::Encode(decoded.payload);
    report.reencode_ok = reencoded == wire;
    if (!report.reencode_ok) {
        report.reasons.emplace_back("re-encoding the payload does not reproduce the wire frame");
    }

    report.length_ok = static_cast<std::size_t>(decoded.length) == decoded.payload.size();
    if (!report.length_ok) {
        report.reasons.push_back("length field " + std::to_string(decoded.length)
                                 + " does not match payload size " + std::to_string(decoded.payload.size()));
    }

    report.no_nul_ok = std::find(decoded.payload.begin(), decoded.payload.end(), std::uint8_t{0})
                       == decoded.payload.end();
    if (!report.no_nul_ok) {
        report.reasons.emplace_back("payload contains a NUL byte");
    }

    std::size_t expected_size = constants::kFrameHeaderLen + static_cast<std::size_t>(decoded.length);
    report.size_ok = wire.size() == expected_size;
    if (!report.size_ok) {
        report.reasons.push_back("wire size " + std::to_string(wire.size()) + " does not equal 8 + length ("
                                 + std::to_string(expected_size) + ")");
    }
    return report;
}

}  // namespace repeathd::strict
