// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <txcodec/core/common/bytes.hpp>
#include <txcodec/core/common/decoding_result.hpp>
#include <txcodec/core/rlp/encode.hpp>

namespace txcodec {

//! The destination of a contract-creation transaction
inline constexpr evmc::address kContractDeploymentAddress{};

inline bool is_contract_deployment(const evmc::address& address) noexcept {
    return address == kContractDeploymentAddress;
}

// Converts bytes to evmc::address; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::address bytes_to_address(ByteView bytes);

//! \brief Parses a 0x-prefixed (or bare) hex address of exactly 20 bytes.
//! \remarks Mixed-case input must carry a valid EIP-55 checksum; all-lower or all-upper input is accepted as is.
//! \return kMalformedHex for non-hex input, kMalformedAddress for a wrong length or checksum
tl::expected<evmc::address, DecodingError> hex_to_address(std::string_view hex) noexcept;

//! \brief Lower-case 0x-prefixed hex form
std::string address_to_hex(const evmc::address& address);

//! \brief EIP-55 mixed-case checksum form
//! \see https://eips.ethereum.org/EIPS/eip-55
std::string address_to_checksum_hex(const evmc::address& address);

namespace rlp {
    void encode(Bytes& to, const evmc::address& address);
    size_t length(const evmc::address& address) noexcept;
}  // namespace rlp

}  // namespace txcodec

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address);

}  // namespace evmc
