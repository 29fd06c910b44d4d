// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <txcodec/core/common/bytes.hpp>

namespace txcodec {

//! \brief Account sponsoring the gas of a transaction, and the data handed to it
//! \remarks Each half is independently optional; the pair is only put on the wire when both are set
struct PaymasterParams {
    std::optional<evmc::address> paymaster{std::nullopt};
    std::optional<Bytes> paymaster_input{std::nullopt};

    bool is_complete() const noexcept { return paymaster && paymaster_input; }

    friend bool operator==(const PaymasterParams&, const PaymasterParams&) = default;
};

//! L2-specific metadata carried by an EIP-712 (0x71) transaction
struct Eip712Meta {
    std::optional<intx::uint256> gas_per_pubdata{std::nullopt};
    std::optional<Bytes> custom_signature{std::nullopt};  // overrides the (r, s, v) triplet on the wire
    std::optional<PaymasterParams> paymaster_params{std::nullopt};
    std::vector<Bytes> factory_deps{};

    friend bool operator==(const Eip712Meta&, const Eip712Meta&) = default;
};

namespace rlp {
    // [gas_per_pubdata or 0, custom_signature or "", [paymaster, input] or [], [factory_deps...]]
    void encode(Bytes& to, const Eip712Meta& meta);
    size_t length(const Eip712Meta& meta);

    // [paymaster, input] when complete, otherwise the empty list
    void encode(Bytes& to, const std::optional<PaymasterParams>& params);
    size_t length(const std::optional<PaymasterParams>& params);
}  // namespace rlp

}  // namespace txcodec
