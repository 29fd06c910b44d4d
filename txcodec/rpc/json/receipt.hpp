// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <txcodec/core/common/decoding_result.hpp>
#include <txcodec/rpc/types/receipt.hpp>

namespace txcodec::rpc {

//! \brief Decodes an L2-to-L1 log object; every key is mandatory
tl::expected<L2ToL1Log, DecodingError> decode_l2_to_l1_log_json(const nlohmann::json& json);

//! \brief Decodes a transaction receipt object.
//! \details l1BatchNumber, l1BatchTxIndex, contractAddress, l2ToL1Logs, logsBloom and status are best-effort:
//! absent or malformed values are dropped. effectiveGasPrice falls back to zero.
tl::expected<TransactionReceipt, DecodingError> decode_receipt_json(const nlohmann::json& json);

void to_json(nlohmann::json& json, const L2ToL1Log& log);
void from_json(const nlohmann::json& json, L2ToL1Log& log);

void to_json(nlohmann::json& json, const TransactionReceipt& receipt);
void from_json(const nlohmann::json& json, TransactionReceipt& receipt);

}  // namespace txcodec::rpc
