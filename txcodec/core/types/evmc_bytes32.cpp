// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "evmc_bytes32.hpp"

#include <algorithm>
#include <cstring>

#include <txcodec/core/common/util.hpp>
#include <txcodec/core/rlp/encode.hpp>

namespace txcodec {

evmc::bytes32 to_bytes32(ByteView bytes) {
    evmc::bytes32 out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kHashLength)};
        std::memcpy(out.bytes + kHashLength - n, bytes.data(), n);
    }
    return out;
}

std::string to_hex(const evmc::bytes32& value, bool with_prefix) {
    return txcodec::to_hex(ByteView{value.bytes}, with_prefix);
}

}  // namespace txcodec

namespace txcodec::rlp {

void encode(Bytes& to, const evmc::bytes32& value) {
    txcodec::rlp::encode(to, ByteView{value.bytes});
}

size_t length(const evmc::bytes32& value) noexcept {
    return txcodec::rlp::length(ByteView{value.bytes});
}

}  // namespace txcodec::rlp
