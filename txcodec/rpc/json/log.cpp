// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <txcodec/core/common/util.hpp>
#include <txcodec/core/types/address.hpp>
#include <txcodec/core/types/evmc_bytes32.hpp>
#include <txcodec/infra/common/decoding_exception.hpp>
#include <txcodec/rpc/json/hex.hpp>

#include "types.hpp"

namespace txcodec::rpc {

static tl::expected<evmc::bytes32, DecodingError> decode_hash(const nlohmann::json& value) {
    const auto bytes{decode_hex_bytes(value)};
    if (!bytes) {
        return tl::unexpected{bytes.error()};
    }
    if (bytes->size() != kHashLength) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    return to_bytes32(*bytes);
}

static tl::expected<evmc::bytes32, DecodingError> required_hash(const nlohmann::json& json, std::string_view key) {
    const nlohmann::json* value{find_field(json, key)};
    if (!value) {
        return tl::unexpected{DecodingError::kMissingField};
    }
    return decode_hash(*value);
}

tl::expected<Log, DecodingError> decode_log_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }

    Log log;

    const nlohmann::json* address{find_field(json, "address")};
    if (!address) {
        return tl::unexpected{DecodingError::kMissingField};
    }
    if (!address->is_string()) {
        return tl::unexpected{DecodingError::kMalformedAddress};
    }
    const auto account{hex_to_address(address->get_ref<const std::string&>())};
    if (!account) {
        return tl::unexpected{account.error()};
    }
    log.address = *account;

    const nlohmann::json* topics{find_field(json, "topics")};
    if (!topics) {
        return tl::unexpected{DecodingError::kMissingField};
    }
    if (!topics->is_array()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }
    log.topics.reserve(topics->size());
    for (const auto& topic : *topics) {
        const auto hash{decode_hash(topic)};
        if (!hash) {
            return tl::unexpected{hash.error()};
        }
        log.topics.push_back(*hash);
    }

    auto data{required_bytes(json, "data")};
    if (!data) {
        return tl::unexpected{data.error()};
    }
    log.data = std::move(*data);

    const auto block_num{required_quantity<uint64_t>(json, "blockNumber")};
    if (!block_num) {
        return tl::unexpected{block_num.error()};
    }
    log.block_num = *block_num;

    const auto tx_hash{required_hash(json, "transactionHash")};
    if (!tx_hash) {
        return tl::unexpected{tx_hash.error()};
    }
    log.tx_hash = *tx_hash;

    const auto tx_index{required_quantity<uint32_t>(json, "transactionIndex")};
    if (!tx_index) {
        return tl::unexpected{tx_index.error()};
    }
    log.tx_index = *tx_index;

    const auto block_hash{required_hash(json, "blockHash")};
    if (!block_hash) {
        return tl::unexpected{block_hash.error()};
    }
    log.block_hash = *block_hash;

    const auto index{required_quantity<uint32_t>(json, "logIndex")};
    if (!index) {
        return tl::unexpected{index.error()};
    }
    log.index = *index;

    const nlohmann::json* removed{find_field(json, "removed")};
    if (!removed) {
        return tl::unexpected{DecodingError::kMissingField};
    }
    if (!removed->is_boolean()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }
    log.removed = removed->get<bool>();

    return log;
}

tl::expected<Logs, DecodingError> decode_logs_json(const nlohmann::json& json) {
    if (!json.is_array()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }
    Logs logs;
    logs.reserve(json.size());
    for (const auto& element : json) {
        auto log{decode_log_json(element)};
        if (!log) {
            return tl::unexpected{log.error()};
        }
        logs.push_back(std::move(*log));
    }
    return logs;
}

void to_json(nlohmann::json& json, const Log& log) {
    json["address"] = log.address;
    json["topics"] = log.topics;
    json["data"] = "0x" + txcodec::to_hex(log.data);
    json["blockNumber"] = to_quantity(log.block_num);
    json["blockHash"] = log.block_hash;
    json["transactionHash"] = log.tx_hash;
    json["transactionIndex"] = to_quantity(log.tx_index);
    json["logIndex"] = to_quantity(log.index);
    json["removed"] = log.removed;
}

void from_json(const nlohmann::json& json, Log& log) {
    log = unwrap_or_throw(decode_log_json(json));
}

}  // namespace txcodec::rpc
