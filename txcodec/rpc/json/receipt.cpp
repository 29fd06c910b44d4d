// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <string_view>
#include <utility>
#include <vector>

#include <magic_enum.hpp>

#include <txcodec/core/common/util.hpp>
#include <txcodec/core/types/address.hpp>
#include <txcodec/infra/common/decoding_exception.hpp>
#include <txcodec/infra/common/log.hpp>
#include <txcodec/rpc/json/hex.hpp>
#include <txcodec/rpc/json/log.hpp>

#include "types.hpp"

namespace txcodec::rpc {

//! \brief Turns a failed decode of a best-effort field into an absent value
template <class T>
static std::optional<T> optional_or_none(tl::expected<std::optional<T>, DecodingError> res, std::string_view key) {
    if (!res) {
        TXC_DEBUG << "receipt field " << key << " dropped: " << magic_enum::enum_name(res.error());
        return std::nullopt;
    }
    return std::move(*res);
}

static tl::expected<std::optional<evmc::address>, DecodingError> optional_address(const nlohmann::json& json,
                                                                                  std::string_view key) {
    const nlohmann::json* value{find_field(json, key)};
    if (!value) {
        return std::optional<evmc::address>{};
    }
    if (!value->is_string()) {
        return tl::unexpected{DecodingError::kMalformedAddress};
    }
    const auto address{hex_to_address(value->get_ref<const std::string&>())};
    if (!address) {
        return tl::unexpected{address.error()};
    }
    return std::optional<evmc::address>{*address};
}

static tl::expected<std::string, DecodingError> required_string(const nlohmann::json& json, std::string_view key) {
    const nlohmann::json* value{find_field(json, key)};
    if (!value) {
        return tl::unexpected{DecodingError::kMissingField};
    }
    if (!value->is_string()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }
    return value->get<std::string>();
}

tl::expected<L2ToL1Log, DecodingError> decode_l2_to_l1_log_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }

    L2ToL1Log log;

    const auto block_number{required_quantity<uint64_t>(json, "blockNumber")};
    if (!block_number) {
        return tl::unexpected{block_number.error()};
    }
    log.block_number = *block_number;

    auto block_hash{required_bytes(json, "blockHash")};
    if (!block_hash) {
        return tl::unexpected{block_hash.error()};
    }
    log.block_hash = std::move(*block_hash);

    const auto l1_batch_number{required_quantity<uint64_t>(json, "l1BatchNumber")};
    if (!l1_batch_number) {
        return tl::unexpected{l1_batch_number.error()};
    }
    log.l1_batch_number = *l1_batch_number;

    const auto transaction_index{required_quantity<uint64_t>(json, "transactionIndex")};
    if (!transaction_index) {
        return tl::unexpected{transaction_index.error()};
    }
    log.transaction_index = *transaction_index;

    const auto shard_id{required_quantity<uint64_t>(json, "shardId")};
    if (!shard_id) {
        return tl::unexpected{shard_id.error()};
    }
    log.shard_id = *shard_id;

    const nlohmann::json* is_service{find_field(json, "isService")};
    if (!is_service) {
        return tl::unexpected{DecodingError::kMissingField};
    }
    if (!is_service->is_boolean()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }
    log.is_service = is_service->get<bool>();

    const auto sender{optional_address(json, "sender")};
    if (!sender) {
        return tl::unexpected{sender.error()};
    }
    if (!*sender) {
        return tl::unexpected{DecodingError::kMissingField};
    }
    log.sender = **sender;

    auto key{required_string(json, "key")};
    if (!key) {
        return tl::unexpected{key.error()};
    }
    log.key = std::move(*key);

    auto value{required_string(json, "value")};
    if (!value) {
        return tl::unexpected{value.error()};
    }
    log.value = std::move(*value);

    auto transaction_hash{required_string(json, "transactionHash")};
    if (!transaction_hash) {
        return tl::unexpected{transaction_hash.error()};
    }
    log.transaction_hash = std::move(*transaction_hash);

    const auto log_index{required_quantity<uint64_t>(json, "logIndex")};
    if (!log_index) {
        return tl::unexpected{log_index.error()};
    }
    log.log_index = *log_index;

    return log;
}

static tl::expected<std::optional<std::vector<L2ToL1Log>>, DecodingError> decode_l2_to_l1_logs(const nlohmann::json& json) {
    const nlohmann::json* logs{find_field(json, "l2ToL1Logs")};
    if (!logs) {
        return std::optional<std::vector<L2ToL1Log>>{};
    }
    if (!logs->is_array()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }
    std::vector<L2ToL1Log> decoded;
    decoded.reserve(logs->size());
    for (const auto& element : *logs) {
        auto log{decode_l2_to_l1_log_json(element)};
        if (!log) {
            return tl::unexpected{log.error()};
        }
        decoded.push_back(std::move(*log));
    }
    return std::optional<std::vector<L2ToL1Log>>{std::move(decoded)};
}

static tl::expected<std::optional<Bloom>, DecodingError> decode_logs_bloom(const nlohmann::json& json) {
    const auto bytes{optional_bytes(json, "logsBloom")};
    if (!bytes) {
        return tl::unexpected{bytes.error()};
    }
    if (!*bytes) {
        return std::optional<Bloom>{};
    }
    const auto bloom{bloom_from_bytes(**bytes)};
    if (!bloom) {
        return tl::unexpected{bloom.error()};
    }
    return std::optional<Bloom>{*bloom};
}

static TransactionReceipt::Status decode_status(const nlohmann::json& json) {
    const auto status{optional_or_none(optional_quantity<intx::uint256>(json, "status"), "status")};
    if (!status) {
        return TransactionReceipt::Status::kNotYetProcessed;
    }
    return *status == intx::uint256{1} ? TransactionReceipt::Status::kSuccess : TransactionReceipt::Status::kFailure;
}

tl::expected<TransactionReceipt, DecodingError> decode_receipt_json(const nlohmann::json& json) {
    TXC_TRACE << "decode_receipt_json keys: " << json.size();
    if (!json.is_object()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }

    TransactionReceipt receipt;

    const auto block_number{required_quantity<uint64_t>(json, "blockNumber")};
    if (!block_number) {
        return tl::unexpected{block_number.error()};
    }
    receipt.block_number = *block_number;

    receipt.l1_batch_number = optional_or_none(optional_quantity<uint64_t>(json, "l1BatchNumber"), "l1BatchNumber");
    receipt.l1_batch_tx_index = optional_or_none(optional_quantity<uint64_t>(json, "l1BatchTxIndex"), "l1BatchTxIndex");

    auto block_hash{required_bytes(json, "blockHash")};
    if (!block_hash) {
        return tl::unexpected{block_hash.error()};
    }
    receipt.block_hash = std::move(*block_hash);

    const auto transaction_index{required_quantity<uint64_t>(json, "transactionIndex")};
    if (!transaction_index) {
        return tl::unexpected{transaction_index.error()};
    }
    receipt.transaction_index = *transaction_index;

    auto transaction_hash{required_bytes(json, "transactionHash")};
    if (!transaction_hash) {
        return tl::unexpected{transaction_hash.error()};
    }
    receipt.transaction_hash = std::move(*transaction_hash);

    receipt.contract_address = optional_or_none(optional_address(json, "contractAddress"), "contractAddress");

    const auto cumulative_gas_used{required_quantity<uint64_t>(json, "cumulativeGasUsed")};
    if (!cumulative_gas_used) {
        return tl::unexpected{cumulative_gas_used.error()};
    }
    receipt.cumulative_gas_used = *cumulative_gas_used;

    const auto gas_used{required_quantity<uint64_t>(json, "gasUsed")};
    if (!gas_used) {
        return tl::unexpected{gas_used.error()};
    }
    receipt.gas_used = *gas_used;

    receipt.effective_gas_price =
        optional_or_none(optional_quantity<intx::uint256>(json, "effectiveGasPrice"), "effectiveGasPrice").value_or(0);

    receipt.status = decode_status(json);

    const nlohmann::json* logs{find_field(json, "logs")};
    if (!logs) {
        return tl::unexpected{DecodingError::kMissingField};
    }
    auto decoded_logs{decode_logs_json(*logs)};
    if (!decoded_logs) {
        return tl::unexpected{decoded_logs.error()};
    }
    receipt.logs = std::move(*decoded_logs);

    receipt.l2_to_l1_logs = optional_or_none(decode_l2_to_l1_logs(json), "l2ToL1Logs");
    receipt.logs_bloom = optional_or_none(decode_logs_bloom(json), "logsBloom");

    return receipt;
}

void to_json(nlohmann::json& json, const L2ToL1Log& log) {
    json["blockNumber"] = to_quantity(log.block_number);
    json["blockHash"] = "0x" + txcodec::to_hex(log.block_hash);
    json["l1BatchNumber"] = to_quantity(log.l1_batch_number);
    json["transactionIndex"] = to_quantity(log.transaction_index);
    json["shardId"] = to_quantity(log.shard_id);
    json["isService"] = log.is_service;
    json["sender"] = log.sender;
    json["key"] = log.key;
    json["value"] = log.value;
    json["transactionHash"] = log.transaction_hash;
    json["logIndex"] = to_quantity(log.log_index);
}

void from_json(const nlohmann::json& json, L2ToL1Log& log) {
    log = unwrap_or_throw(decode_l2_to_l1_log_json(json));
}

void to_json(nlohmann::json& json, const TransactionReceipt& receipt) {
    json["blockHash"] = "0x" + txcodec::to_hex(receipt.block_hash);
    json["blockNumber"] = to_quantity(receipt.block_number);
    json["transactionHash"] = "0x" + txcodec::to_hex(receipt.transaction_hash);
    json["transactionIndex"] = to_quantity(receipt.transaction_index);
    if (receipt.l1_batch_number) {
        json["l1BatchNumber"] = to_quantity(*receipt.l1_batch_number);
    }
    if (receipt.l1_batch_tx_index) {
        json["l1BatchTxIndex"] = to_quantity(*receipt.l1_batch_tx_index);
    }
    json["gasUsed"] = to_quantity(receipt.gas_used);
    json["cumulativeGasUsed"] = to_quantity(receipt.cumulative_gas_used);
    json["effectiveGasPrice"] = to_quantity(receipt.effective_gas_price);
    if (receipt.contract_address) {
        json["contractAddress"] = *receipt.contract_address;
    } else {
        json["contractAddress"] = nlohmann::json{};
    }
    json["logs"] = receipt.logs;
    if (receipt.l2_to_l1_logs) {
        json["l2ToL1Logs"] = *receipt.l2_to_l1_logs;
    }
    if (receipt.logs_bloom) {
        json["logsBloom"] = "0x" + txcodec::to_hex(*receipt.logs_bloom);
    }
    switch (receipt.status) {
        case TransactionReceipt::Status::kSuccess:
            json["status"] = to_quantity(uint64_t{1});
            break;
        case TransactionReceipt::Status::kFailure:
            json["status"] = to_quantity(uint64_t{0});
            break;
        case TransactionReceipt::Status::kNotYetProcessed:
            json["status"] = nlohmann::json{};
            break;
    }
}

void from_json(const nlohmann::json& json, TransactionReceipt& receipt) {
    receipt = unwrap_or_throw(decode_receipt_json(json));
}

}  // namespace txcodec::rpc
