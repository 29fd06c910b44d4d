// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <txcodec/core/common/decoding_result.hpp>
#include <txcodec/core/types/eip712_envelope.hpp>

namespace txcodec {

void to_json(nlohmann::json& json, const Eip712Envelope& envelope);

//! \throws DecodingException
void from_json(const nlohmann::json& json, Eip712Envelope& envelope);

}  // namespace txcodec

namespace txcodec::rpc {

//! \brief Decodes the keyed transaction-request form of an envelope.
//! \return kMissingField if any of to, nonce, value, chainId, data/input, v, r, s is not a key of the object
tl::expected<Eip712Envelope, DecodingError> decode_envelope_json(const nlohmann::json& json);

}  // namespace txcodec::rpc
