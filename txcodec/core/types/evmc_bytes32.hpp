// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <evmc/evmc.hpp>

#include <txcodec/core/common/bytes.hpp>
#include <txcodec/core/rlp/encode.hpp>

namespace txcodec {

// Converts bytes to evmc::bytes32; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::bytes32 to_bytes32(ByteView bytes);

std::string to_hex(const evmc::bytes32& value, bool with_prefix = false);

}  // namespace txcodec

namespace txcodec::rlp {

void encode(Bytes& to, const evmc::bytes32& value);
size_t length(const evmc::bytes32& value) noexcept;

}  // namespace txcodec::rlp

namespace evmc {
using txcodec::rlp::encode;
using txcodec::rlp::length;
}  // namespace evmc
