#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace repeathd::constants {

inline constexpr std::string_view kEngineVersion = "0.1.0";
inline constexpr std::string_view kCapsuleEncoding = "publichex-v1";

inline constexpr std::size_t kChecksumLen = 4;
inline constexpr std::size_t kLengthFieldLen = 4;
inline constexpr std::size_t kFrameHeaderLen = kChecksumLen + kLengthFieldLen;
inline constexpr std::size_t kFrameHeaderHexLen = kFrameHeaderLen * 2;

inline constexpr char kTagSeparator = ':';

inline constexpr std::string_view kStrictEnv = "REPEATHD_STRICT";
inline constexpr std::string_view kVerboseEnv = "REPEATHD_VERBOSE";
inline constexpr std::string_view kNoColorEnv = "NO_COLOR";

}  // namespace repeathd::constants
