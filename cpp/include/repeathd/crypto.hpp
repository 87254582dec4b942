#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace repeathd::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes Sha256(std::string_view data);

}  // namespace repeathd::crypto
