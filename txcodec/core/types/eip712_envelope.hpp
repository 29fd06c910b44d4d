// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <txcodec/core/common/base.hpp>
#include <txcodec/core/common/bytes.hpp>
#include <txcodec/core/common/decoding_result.hpp>
#include <txcodec/core/types/address.hpp>
#include <txcodec/core/types/eip712_meta.hpp>

namespace txcodec {

// EIP-2718 type byte of L2 transactions carrying EIP-712 metadata
inline constexpr uint8_t kEip712TransactionType{0x71};

// EIP-2930: Optional access lists
struct AccessListEntry {
    evmc::address account{};
    std::vector<evmc::bytes32> storage_keys{};

    friend bool operator==(const AccessListEntry&, const AccessListEntry&) = default;
};

//! Positions of the items in the RLP list of a broadcast (signed) envelope
enum class Eip712BroadcastField : uint8_t {
    kNonce = 0,
    kMaxPriorityFeePerGas = 1,
    kMaxFeePerGas = 2,
    kGasLimit = 3,
    kTo = 4,
    kValue = 5,
    kData = 6,
    kChainId = 7,
    kReserved1 = 8,  // always the empty string
    kReserved2 = 9,  // always the empty string
    kChainIdDuplicate = 10,
    kFrom = 11,
    kGasPerPubdata = 12,
    kFactoryDeps = 13,
    kCustomSignature = 14,
    kPaymasterParams = 15,
    kCount,
};

//! Positions of the items in the RLP list hashed for signing
enum class Eip712SigningField : uint8_t {
    kNonce = 0,
    kMaxPriorityFeePerGas = 1,
    kMaxFeePerGas = 2,
    kGasLimit = 3,
    kTo = 4,
    kFrom = 5,
    kValue = 6,
    kData = 7,
    kChainId = 8,
    kGasPrice = 9,
    kAccessList = 10,
    kMeta = 11,
    kCount,
};

static_assert(static_cast<size_t>(Eip712BroadcastField::kCount) == 16);
static_assert(static_cast<size_t>(Eip712SigningField::kCount) == 12);

struct Eip712Envelope {
    uint64_t nonce{0};
    std::optional<intx::uint256> chain_id{std::nullopt};  // encoded as 0 when absent

    evmc::address to{kContractDeploymentAddress};
    intx::uint256 value{0};
    Bytes data{};

    intx::uint256 r{0}, s{0};  // signature
    uint8_t v{0};              // a single byte on the wire

    uint64_t gas_limit{0};
    intx::uint256 max_priority_fee_per_gas{0};
    intx::uint256 max_fee_per_gas{0};
    intx::uint256 gas_price{0};  // signing layout only

    std::vector<AccessListEntry> access_list{};  // signing layout only

    // Sender hint, not covered by the signature
    std::optional<evmc::address> from{std::nullopt};

    std::optional<Eip712Meta> meta{std::nullopt};

    //! \brief Signature bytes put on the wire: the custom signature if any, otherwise r || s || v
    Bytes wire_signature() const;

    //! \brief RLP list of the signing layout, prefixed with the type byte
    void encode_for_signing(Bytes& into) const;

    //! \brief Keccak-256 of the broadcast encoding
    evmc::bytes32 hash() const;

    std::string to_string() const;

    friend bool operator==(const Eip712Envelope&, const Eip712Envelope&) = default;
};

namespace rlp {
    void encode(Bytes& to, const AccessListEntry& entry);
    size_t length(const AccessListEntry& entry);

    //! \brief Broadcast encoding: the type byte followed by the 16-item RLP list
    void encode(Bytes& to, const Eip712Envelope& envelope);
    size_t length(const Eip712Envelope& envelope);
}  // namespace rlp

//! \brief Parses the broadcast encoding of an EIP-712 envelope.
//! \remarks The access list and gas price are not part of the broadcast layout and come back empty/zero.
//! The wire signature is both split into (r, s, v) and kept verbatim as meta.custom_signature.
tl::expected<Eip712Envelope, DecodingError> decode_eip712_envelope(ByteView from) noexcept;

}  // namespace txcodec
