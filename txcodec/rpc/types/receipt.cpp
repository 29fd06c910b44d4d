// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <sstream>
#include <utility>

#include <magic_enum.hpp>

#include <txcodec/core/common/util.hpp>
#include <txcodec/core/types/address.hpp>

namespace txcodec::rpc {

TransactionReceipt TransactionReceipt::not_processed(Bytes tx_hash) {
    TransactionReceipt receipt;
    receipt.transaction_hash = std::move(tx_hash);
    receipt.l1_batch_number = 0;
    receipt.l1_batch_tx_index = 0;
    return receipt;
}

std::ostream& operator<<(std::ostream& out, const TransactionReceipt& r) {
    out << "tx_hash: " << to_hex(r.transaction_hash);
    out << " block_hash: " << to_hex(r.block_hash);
    out << " block_num: " << r.block_number;
    out << " tx_index: " << r.transaction_index;
    if (r.l1_batch_number) {
        out << " l1_batch_number: " << *r.l1_batch_number;
    }
    if (r.l1_batch_tx_index) {
        out << " l1_batch_tx_index: " << *r.l1_batch_tx_index;
    }
    if (r.contract_address) {
        out << " contract_address: " << address_to_hex(*r.contract_address);
    } else {
        out << " contract_address: null";
    }
    out << " cumulative_gas_used: " << r.cumulative_gas_used;
    out << " gas_used: " << r.gas_used;
    out << " effective_gas_price: " << intx::to_string(r.effective_gas_price);
    out << " #logs: " << r.logs.size();
    if (r.l2_to_l1_logs) {
        out << " #l2_to_l1_logs: " << r.l2_to_l1_logs->size();
    }
    if (r.logs_bloom) {
        out << " bloom: " << to_hex(*r.logs_bloom);
    }
    out << " status: " << magic_enum::enum_name(r.status);
    return out;
}

std::string TransactionReceipt::to_string() const {
    std::stringstream out;
    out << *this;
    return out.str();
}

Bloom bloom_from_logs(const Logs& logs) {
    Bloom bloom{};
    for (const auto& log : logs) {
        m3_2048(bloom, log.address.bytes);
        for (const auto& topic : log.topics) {
            m3_2048(bloom, topic.bytes);
        }
    }
    return bloom;
}

}  // namespace txcodec::rpc
