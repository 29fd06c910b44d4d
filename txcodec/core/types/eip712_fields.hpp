// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>

#include <txcodec/core/common/base.hpp>
#include <txcodec/core/common/bytes.hpp>
#include <txcodec/core/common/decoding_result.hpp>
#include <txcodec/core/common/endian.hpp>
#include <txcodec/core/rlp/item.hpp>
#include <txcodec/core/types/eip712_meta.hpp>

// Readers of the individual slots of an EIP-712 envelope once it has been parsed into an rlp::Item tree.
// Every slot is either absent, a byte string or a list; each reader accepts the shapes its field allows.
namespace txcodec::eip712 {

//! \brief Integer slot: must be a canonical big-endian byte string fitting T
template <UnsignedIntegral T>
DecodingResult decode_scalar(const rlp::Item& item, T& to) noexcept {
    if (item.is_absent()) {
        to = 0;
        return {};
    }
    const ByteView* str{item.string()};
    if (!str) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }
    return endian::from_big_compact(*str, to);
}

DecodingResult decode_bytes(const rlp::Item& item, Bytes& to);

//! \brief Address slot: absent or empty means none, exactly 20 bytes is an address, anything else is kMalformedAddress
DecodingResult decode_address(const rlp::Item& item, std::optional<evmc::address>& to) noexcept;

//! \brief Absent or a string yields no dependencies; a list must hold strings only
DecodingResult decode_factory_deps(const rlp::Item& item, std::vector<Bytes>& to);

//! \brief Classifies list elements by size: 20 bytes is the paymaster, anything else its input.
//! \remarks The pair only materialises if both halves are found; duplicates of either are kUnexpectedVariantShape
DecodingResult decode_paymaster_params(const rlp::Item& item, std::optional<PaymasterParams>& to);

}  // namespace txcodec::eip712

namespace txcodec::rlp {

//! \brief 20 address bytes, or the empty string when there is no address
void encode(Bytes& to, const std::optional<evmc::address>& address);
size_t length(const std::optional<evmc::address>& address) noexcept;

}  // namespace txcodec::rlp
