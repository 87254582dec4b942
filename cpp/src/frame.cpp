#include "repeathd/frame.hpp"

#include "repeathd/constants.hpp"

#include <algorithm>
#include <cstdio>
#include <limits>

#include <zlib.h>

namespace repeathd::frame {

namespace {

std::uint32_t ReadU32LE(const Bytes& data, std::size_t offset) {
    return static_cast<std::uint32_t>(data[offset])
           | (static_cast<std::uint32_t>(data[offset + 1]) << 8)
           | (static_cast<std::uint32_t>(data[offset + 2]) << 16)
           | (static_cast<std::uint32_t>(data[offset + 3]) << 24);
}

void WriteU32LE(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

std::string FormatCrc(std::uint32_t value) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "0x%08x", static_cast<unsigned int>(value));
    return std::string(buffer);
}

Bytes EncodeRaw(const std::uint8_t* data, std::size_t size) {
    if (size > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("Payload too large for a 32-bit length field");
    }
    Bytes out;
    out.reserve(constants::kFrameHeaderLen + size);
    WriteU32LE(out, Crc32(data, size));
    WriteU32LE(out, static_cast<std::uint32_t>(size));
    out.insert(out.end(), data, data + size);
    return out;
}

}  // namespace

std::uint32_t Crc32(const std::uint8_t* data, std::size_t size) {
    // zlib takes uInt lengths, so feed large buffers in slices.
    uLong crc = crc32(0L, Z_NULL, 0);
    constexpr std::size_t kSlice = 1u << 30;
    while (size > 0) {
        std::size_t take = std::min(size, kSlice);
        crc = crc32(crc, data, static_cast<uInt>(take));
        data += take;
        size -= take;
    }
    return static_cast<std::uint32_t>(crc);
}

std::uint32_t Crc32(const Bytes& data) {
    return Crc32(data.data(), data.size());
}

Bytes Encode(const Bytes& payload) {
    return EncodeRaw(payload.data(), payload.size());
}

Bytes Encode(std::string_view text) {
    return EncodeRaw(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

Frame Decode(const Bytes& wire) {
    if (wire.size() < constants::kFrameHeaderLen) {
        throw ParseError("too short");
    }
    Frame frame;
    frame.checksum = ReadU32LE(wire, 0);
    frame.length = ReadU32LE(wire, constants::kChecksumLen);
    std::size_t available = wire.size() - constants::kFrameHeaderLen;
    if (static_cast<std::size_t>(frame.length) != available) {
        throw ParseError("length mismatch");
    }
    frame.payload.assign(wire.begin() + static_cast<std::ptrdiff_t>(constants::kFrameHeaderLen), wire.end());
    return frame;
}

DecodeResult TryDecode(const Bytes& wire) {
    DecodeResult result;
    try {
        result.frame = Decode(wire);
    } catch (const ParseError& exc) {
        result.error = exc.what();
    }
    return result;
}

ValidationReport Validate(const Frame& frame) {
    ValidationReport report;
    report.length_ok = static_cast<std::size_t>(frame.length) == frame.payload.size();
    std::uint32_t actual = Crc32(frame.payload);
    report.crc_ok = frame.checksum == actual;
    if (!report.length_ok) {
        report.reasons.push_back("length field mismatch: header says " + std::to_string(frame.length)
                                 + " bytes, payload has " + std::to_string(frame.payload.size()));
    }
    if (!report.crc_ok) {
        report.reasons.push_back("checksum mismatch: expected " + FormatCrc(frame.checksum)
                                 + ", got " + FormatCrc(actual));
    }
    return report;
}

}  // namespace repeathd::frame
