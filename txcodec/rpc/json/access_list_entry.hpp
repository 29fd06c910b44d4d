// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include <txcodec/core/common/decoding_result.hpp>
#include <txcodec/core/types/eip712_envelope.hpp>

namespace txcodec {

void from_json(const nlohmann::json& json, AccessListEntry& entry);
void to_json(nlohmann::json& json, const AccessListEntry& access_list);

}  // namespace txcodec

namespace txcodec::rpc {

//! \brief Decodes an array of {"address", "storageKeys"} objects
tl::expected<std::vector<AccessListEntry>, DecodingError> decode_access_list_json(const nlohmann::json& json);

}  // namespace txcodec::rpc
