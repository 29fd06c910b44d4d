// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <txcodec/core/common/decoding_result.hpp>
#include <txcodec/core/types/eip712_meta.hpp>

namespace txcodec {

// Absent members are omitted, never written as null
void to_json(nlohmann::json& json, const PaymasterParams& params);
void to_json(nlohmann::json& json, const Eip712Meta& meta);

void from_json(const nlohmann::json& json, PaymasterParams& params);
void from_json(const nlohmann::json& json, Eip712Meta& meta);

}  // namespace txcodec

namespace txcodec::rpc {

//! \brief Every member is optional, malformed content is not
tl::expected<PaymasterParams, DecodingError> decode_paymaster_params_json(const nlohmann::json& json);

//! \brief Every member is optional, malformed content is not
tl::expected<Eip712Meta, DecodingError> decode_meta_json(const nlohmann::json& json);

}  // namespace txcodec::rpc
