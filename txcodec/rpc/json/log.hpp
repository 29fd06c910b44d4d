// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <txcodec/core/common/decoding_result.hpp>
#include <txcodec/rpc/types/log.hpp>

namespace txcodec::rpc {

//! \brief Decodes an event log object; every key is mandatory
tl::expected<Log, DecodingError> decode_log_json(const nlohmann::json& json);

tl::expected<Logs, DecodingError> decode_logs_json(const nlohmann::json& json);

void to_json(nlohmann::json& json, const Log& log);

//! \throws DecodingException
void from_json(const nlohmann::json& json, Log& log);

}  // namespace txcodec::rpc
