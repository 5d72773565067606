#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Encode a byte span to a lowercase hexadecimal string.
std::string to_hex(std::span<const uint8_t> data);

// Decode a hexadecimal string to bytes. Returns nullopt if the input is
// invalid (odd length or non-hex characters). Both cases are accepted.
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

}  // namespace core
