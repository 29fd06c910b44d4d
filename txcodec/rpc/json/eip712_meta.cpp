// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include "eip712_meta.hpp"

#include <txcodec/core/common/util.hpp>
#include <txcodec/core/types/address.hpp>
#include <txcodec/infra/common/decoding_exception.hpp>
#include <txcodec/rpc/json/hex.hpp>

#include "types.hpp"

namespace txcodec::rpc {

tl::expected<PaymasterParams, DecodingError> decode_paymaster_params_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }

    PaymasterParams params;
    if (const nlohmann::json* paymaster{find_field(json, "paymaster")}) {
        if (!paymaster->is_string()) {
            return tl::unexpected{DecodingError::kMalformedAddress};
        }
        const auto address{hex_to_address(paymaster->get_ref<const std::string&>())};
        if (!address) {
            return tl::unexpected{address.error()};
        }
        params.paymaster = *address;
    }

    auto input{optional_bytes(json, "paymasterInput")};
    if (!input) {
        return tl::unexpected{input.error()};
    }
    params.paymaster_input = std::move(*input);
    return params;
}

tl::expected<Eip712Meta, DecodingError> decode_meta_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }

    Eip712Meta meta;

    const auto gas_per_pubdata{optional_quantity<intx::uint256>(json, "gasPerPubdata")};
    if (!gas_per_pubdata) {
        return tl::unexpected{gas_per_pubdata.error()};
    }
    meta.gas_per_pubdata = *gas_per_pubdata;

    auto custom_signature{optional_bytes(json, "customSignature")};
    if (!custom_signature) {
        return tl::unexpected{custom_signature.error()};
    }
    meta.custom_signature = std::move(*custom_signature);

    if (const nlohmann::json* params{find_field(json, "paymasterParams")}) {
        auto paymaster_params{decode_paymaster_params_json(*params)};
        if (!paymaster_params) {
            return tl::unexpected{paymaster_params.error()};
        }
        meta.paymaster_params = std::move(*paymaster_params);
    }

    if (const nlohmann::json* deps{find_field(json, "factoryDeps")}) {
        if (!deps->is_array()) {
            return tl::unexpected{DecodingError::kUnexpectedVariantShape};
        }
        meta.factory_deps.reserve(deps->size());
        for (const auto& dep : *deps) {
            auto bytes{decode_hex_bytes(dep)};
            if (!bytes) {
                return tl::unexpected{bytes.error()};
            }
            meta.factory_deps.push_back(std::move(*bytes));
        }
    }

    return meta;
}

}  // namespace txcodec::rpc

namespace txcodec {

void to_json(nlohmann::json& json, const PaymasterParams& params) {
    json = nlohmann::json::object();
    if (params.paymaster) {
        json["paymaster"] = *params.paymaster;
    }
    if (params.paymaster_input) {
        json["paymasterInput"] = "0x" + to_hex(*params.paymaster_input);
    }
}

void to_json(nlohmann::json& json, const Eip712Meta& meta) {
    json = nlohmann::json::object();
    if (meta.gas_per_pubdata) {
        json["gasPerPubdata"] = rpc::to_quantity(*meta.gas_per_pubdata);
    }
    if (meta.custom_signature) {
        json["customSignature"] = "0x" + to_hex(*meta.custom_signature);
    }
    if (meta.paymaster_params) {
        json["paymasterParams"] = *meta.paymaster_params;
    }
    if (!meta.factory_deps.empty()) {
        auto& deps = json["factoryDeps"] = nlohmann::json::array();
        for (const Bytes& dep : meta.factory_deps) {
            deps.push_back("0x" + to_hex(dep));
        }
    }
}

void from_json(const nlohmann::json& json, PaymasterParams& params) {
    params = unwrap_or_throw(rpc::decode_paymaster_params_json(json));
}

void from_json(const nlohmann::json& json, Eip712Meta& meta) {
    meta = unwrap_or_throw(rpc::decode_meta_json(json));
}

}  // namespace txcodec
