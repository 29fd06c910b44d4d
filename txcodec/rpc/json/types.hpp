// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <txcodec/core/common/bytes.hpp>

// nlohmann adapters for the fixed-size value types; from_json throws DecodingException on malformed input
namespace evmc {

void to_json(nlohmann::json& json, const address& addr);
void from_json(const nlohmann::json& json, address& addr);

void to_json(nlohmann::json& json, const bytes32& b32);
void from_json(const nlohmann::json& json, bytes32& b32);

}  // namespace evmc

namespace txcodec::rpc {

std::string to_hex_no_leading_zeros(ByteView bytes);
std::string to_quantity(uint64_t number);
std::string to_quantity(const intx::uint256& number);
std::string to_quantity(ByteView bytes);

}  // namespace txcodec::rpc
