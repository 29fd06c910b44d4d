// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <txcodec/core/common/base.hpp>
#include <txcodec/core/common/bytes.hpp>
#include <txcodec/core/common/decoding_result.hpp>
#include <txcodec/core/common/util.hpp>

// Readers of hex-encoded members of a keyed JSON object.
// A member holding JSON null counts as absent. A present member must be a hex string.
namespace txcodec::rpc {

//! \return the member value, or nullptr if json is not an object, has no such key or maps it to null
const nlohmann::json* find_field(const nlohmann::json& json, std::string_view key);

//! \brief Decodes a JSON hex string into bytes
tl::expected<Bytes, DecodingError> decode_hex_bytes(const nlohmann::json& value);

//! \brief Decodes a JSON hex string into an unsigned integer
template <UnsignedIntegral T>
tl::expected<T, DecodingError> decode_hex_quantity(const nlohmann::json& value) {
    if (!value.is_string()) {
        return tl::unexpected{DecodingError::kMalformedHex};
    }
    return from_hex_quantity<T>(value.get_ref<const std::string&>());
}

//! \return kMissingField if absent
template <UnsignedIntegral T>
tl::expected<T, DecodingError> required_quantity(const nlohmann::json& json, std::string_view key) {
    const nlohmann::json* value{find_field(json, key)};
    if (!value) {
        return tl::unexpected{DecodingError::kMissingField};
    }
    return decode_hex_quantity<T>(*value);
}

//! \return default_value if absent
template <UnsignedIntegral T>
tl::expected<T, DecodingError> quantity_or(const nlohmann::json& json, std::string_view key, T default_value) {
    const nlohmann::json* value{find_field(json, key)};
    if (!value) {
        return default_value;
    }
    return decode_hex_quantity<T>(*value);
}

template <UnsignedIntegral T>
tl::expected<std::optional<T>, DecodingError> optional_quantity(const nlohmann::json& json, std::string_view key) {
    const nlohmann::json* value{find_field(json, key)};
    if (!value) {
        return std::optional<T>{};
    }
    const auto quantity{decode_hex_quantity<T>(*value)};
    if (!quantity) {
        return tl::unexpected{quantity.error()};
    }
    return std::optional<T>{*quantity};
}

//! \return kMissingField if absent
tl::expected<Bytes, DecodingError> required_bytes(const nlohmann::json& json, std::string_view key);

//! \return default_value if absent
tl::expected<Bytes, DecodingError> bytes_or(const nlohmann::json& json, std::string_view key, const Bytes& default_value);

tl::expected<std::optional<Bytes>, DecodingError> optional_bytes(const nlohmann::json& json, std::string_view key);

}  // namespace txcodec::rpc
