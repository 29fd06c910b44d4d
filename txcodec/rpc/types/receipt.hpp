// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <txcodec/core/common/base.hpp>
#include <txcodec/core/common/bytes.hpp>
#include <txcodec/core/types/bloom.hpp>
#include <txcodec/rpc/types/log.hpp>

namespace txcodec::rpc {

// Message sent from an L2 transaction to the L1 settlement layer
struct L2ToL1Log {
    uint64_t block_number{0};
    Bytes block_hash;
    uint64_t l1_batch_number{0};
    uint64_t transaction_index{0};
    uint64_t shard_id{0};
    bool is_service{false};
    evmc::address sender;
    // kept as transmitted
    std::string key;
    std::string value;
    std::string transaction_hash;
    uint64_t log_index{0};

    friend bool operator==(const L2ToL1Log&, const L2ToL1Log&) = default;
};

struct TransactionReceipt {
    enum class Status : uint8_t {
        kNotYetProcessed,
        kSuccess,
        kFailure,
    };

    Bytes transaction_hash;
    Bytes block_hash;  // empty until the transaction is included
    uint64_t block_number{0};
    uint64_t transaction_index{0};
    uint64_t cumulative_gas_used{0};
    uint64_t gas_used{0};
    intx::uint256 effective_gas_price{0};

    /* L2 batch position */
    std::optional<uint64_t> l1_batch_number{std::nullopt};
    std::optional<uint64_t> l1_batch_tx_index{std::nullopt};

    std::optional<evmc::address> contract_address{std::nullopt};
    Logs logs;
    std::optional<std::vector<L2ToL1Log>> l2_to_l1_logs{std::nullopt};
    Status status{Status::kNotYetProcessed};
    std::optional<Bloom> logs_bloom{std::nullopt};

    //! \brief Placeholder receipt for a transaction known only by its hash
    static TransactionReceipt not_processed(Bytes tx_hash);

    std::string to_string() const;

    friend bool operator==(const TransactionReceipt&, const TransactionReceipt&) = default;
};

std::ostream& operator<<(std::ostream& out, const TransactionReceipt& r);

Bloom bloom_from_logs(const Logs& logs);

}  // namespace txcodec::rpc
