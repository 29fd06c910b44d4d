// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "access_list_entry.hpp"

#include <txcodec/core/types/evmc_bytes32.hpp>
#include <txcodec/infra/common/decoding_exception.hpp>
#include <txcodec/rpc/json/hex.hpp>

#include "types.hpp"

namespace txcodec::rpc {

static tl::expected<AccessListEntry, DecodingError> decode_access_list_entry(const nlohmann::json& json) {
    const nlohmann::json* address{find_field(json, "address")};
    const nlohmann::json* storage_keys{find_field(json, "storageKeys")};
    if (!address || !storage_keys) {
        return tl::unexpected{DecodingError::kMissingField};
    }
    if (!address->is_string() || !storage_keys->is_array()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }

    AccessListEntry entry;
    const auto account{hex_to_address(address->get_ref<const std::string&>())};
    if (!account) {
        return tl::unexpected{account.error()};
    }
    entry.account = *account;

    entry.storage_keys.reserve(storage_keys->size());
    for (const auto& key : *storage_keys) {
        const auto key_bytes{decode_hex_bytes(key)};
        if (!key_bytes) {
            return tl::unexpected{key_bytes.error()};
        }
        if (key_bytes->size() != kHashLength) {
            return tl::unexpected{DecodingError::kUnexpectedLength};
        }
        entry.storage_keys.push_back(to_bytes32(*key_bytes));
    }
    return entry;
}

tl::expected<std::vector<AccessListEntry>, DecodingError> decode_access_list_json(const nlohmann::json& json) {
    if (!json.is_array()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }
    std::vector<AccessListEntry> access_list;
    access_list.reserve(json.size());
    for (const auto& element : json) {
        auto entry{decode_access_list_entry(element)};
        if (!entry) {
            return tl::unexpected{entry.error()};
        }
        access_list.push_back(std::move(*entry));
    }
    return access_list;
}

}  // namespace txcodec::rpc

namespace txcodec {

void from_json(const nlohmann::json& json, AccessListEntry& entry) {
    entry.account = json.at("address").get<evmc::address>();
    entry.storage_keys = json.at("storageKeys").get<std::vector<evmc::bytes32>>();
}

void to_json(nlohmann::json& json, const AccessListEntry& access_list) {
    json["address"] = access_list.account;
    json["storageKeys"] = access_list.storage_keys;
}

}  // namespace txcodec
