#include "repeathd/repeathd.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace repeathd {

std::vector<std::uint8_t> ReadFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw InputError("Failed to open file: " + path);
    }
    input.seekg(0, std::ios::end);
    std::streamoff size = input.tellg();
    if (size < 0) {
        throw InputError("Failed to read file size: " + path);
    }
    input.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data;
    data.resize(static_cast<std::size_t>(size));

    if (!data.empty()) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!input) {
            throw InputError("Failed to read file: " + path);
        }
    }
    return data;
}

std::vector<std::uint8_t> ReadStream(std::istream& input) {
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw InputError("Failed to read input stream");
    }
    return data;
}

void WriteFile(const std::string& path, const std::vector<std::uint8_t>& data) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    if (!data.empty()) {
        output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    if (!output) {
        throw std::runtime_error("Failed to write file: " + path);
    }
}

Verification InputFailure(const std::string& reason) {
    Verification verification;
    verification.result = outcome::Outcome::MakeError({reason});
    return verification;
}

Verification EncodeFrame(const std::vector<std::uint8_t>& payload) {
    Verification verification;
    verification.normalized_frame_hex = hex::HexEncode(frame::Encode(payload));
    return verification;
}

Verification VerifyFrameBytes(const std::vector<std::uint8_t>& wire, const VerifyOptions& options) {
    Verification verification;
    frame::DecodeResult decoded = frame::TryDecode(wire);
    if (!decoded.frame) {
        verification.result = outcome::Outcome::MakeError({decoded.error});
        return verification;
    }
    verification.normalized_frame_hex = hex::HexEncode(wire);

    frame::ValidationReport report = frame::Validate(*decoded.frame);
    if (!report.Passed()) {
        verification.result = outcome::Outcome::MakeFail(std::move(report.reasons));
        return verification;
    }
    if (options.strict) {
        strict::StrictReport invariants = strict::Check(wire, *decoded.frame);
        if (!invariants.Passed()) {
            verification.result = outcome::Outcome::MakeFail(std::move(invariants.reasons));
            return verification;
        }
    }
    verification.result = outcome::Outcome::MakePass();
    return verification;
}

Verification VerifyFrameHex(std::string_view raw_hex, const VerifyOptions& options) {
    std::string normalized;
    std::vector<std::uint8_t> wire;
    try {
        normalized = hex::Normalize(raw_hex, hex::LengthRule::HeaderOnly);
        wire = hex::HexDecode(normalized);
    } catch (const hex::NormalizeError& exc) {
        Verification verification;
        verification.result = outcome::Outcome::MakeError({exc.what()});
        return verification;
    }
    // Whole bytes of normalized hex re-encode to the same text.
    return VerifyFrameBytes(wire, options);
}

Verification VerifyPublicHex(std::string_view raw_hex) {
    Verification verification;
    hex::NormalizeResult normalized = hex::TryNormalize(raw_hex, hex::LengthRule::Even);
    if (!normalized.ok) {
        verification.result = outcome::Outcome::MakeError({normalized.error});
        return verification;
    }
    verification.normalized_frame_hex = std::move(normalized.normalized);
    verification.result = outcome::Outcome::MakePass();
    return verification;
}

capsule::Rendered Render(const Verification& verification) {
    return capsule::Render(verification.normalized_frame_hex, verification.result);
}

}  // namespace repeathd
