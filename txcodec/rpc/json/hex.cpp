// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include "hex.hpp"

namespace txcodec::rpc {

const nlohmann::json* find_field(const nlohmann::json& json, std::string_view key) {
    if (!json.is_object()) {
        return nullptr;
    }
    const auto it{json.find(std::string{key})};
    if (it == json.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

tl::expected<Bytes, DecodingError> decode_hex_bytes(const nlohmann::json& value) {
    if (!value.is_string()) {
        return tl::unexpected{DecodingError::kMalformedHex};
    }
    std::optional<Bytes> bytes{from_hex(value.get_ref<const std::string&>())};
    if (!bytes) {
        return tl::unexpected{DecodingError::kMalformedHex};
    }
    return std::move(*bytes);
}

tl::expected<Bytes, DecodingError> required_bytes(const nlohmann::json& json, std::string_view key) {
    const nlohmann::json* value{find_field(json, key)};
    if (!value) {
        return tl::unexpected{DecodingError::kMissingField};
    }
    return decode_hex_bytes(*value);
}

tl::expected<Bytes, DecodingError> bytes_or(const nlohmann::json& json, std::string_view key, const Bytes& default_value) {
    const nlohmann::json* value{find_field(json, key)};
    if (!value) {
        return default_value;
    }
    return decode_hex_bytes(*value);
}

tl::expected<std::optional<Bytes>, DecodingError> optional_bytes(const nlohmann::json& json, std::string_view key) {
    const nlohmann::json* value{find_field(json, key)};
    if (!value) {
        return std::optional<Bytes>{};
    }
    auto bytes{decode_hex_bytes(*value)};
    if (!bytes) {
        return tl::unexpected{bytes.error()};
    }
    return std::optional<Bytes>{std::move(*bytes)};
}

}  // namespace txcodec::rpc
