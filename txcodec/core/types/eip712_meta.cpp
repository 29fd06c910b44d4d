// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include "eip712_meta.hpp"

#include <txcodec/core/rlp/encode_vector.hpp>
#include <txcodec/core/types/address.hpp>

namespace txcodec::rlp {

static Header header(const std::optional<PaymasterParams>& params) {
    Header h{.list = true};
    if (params && params->is_complete()) {
        h.payload_length = kAddressLength + 1;
        h.payload_length += length(ByteView{*params->paymaster_input});
    }
    return h;
}

size_t length(const std::optional<PaymasterParams>& params) {
    const Header h{header(params)};
    return length_of_length(h.payload_length) + h.payload_length;
}

void encode(Bytes& to, const std::optional<PaymasterParams>& params) {
    encode_header(to, header(params));
    if (params && params->is_complete()) {
        encode(to, *params->paymaster);
        encode(to, ByteView{*params->paymaster_input});
    }
}

static Header header(const Eip712Meta& meta) {
    Header h{.list = true};
    h.payload_length = length(meta.gas_per_pubdata.value_or(0));
    h.payload_length += meta.custom_signature ? length(ByteView{*meta.custom_signature}) : 1;
    h.payload_length += length(meta.paymaster_params);
    h.payload_length += length(meta.factory_deps);
    return h;
}

size_t length(const Eip712Meta& meta) {
    const Header h{header(meta)};
    return length_of_length(h.payload_length) + h.payload_length;
}

void encode(Bytes& to, const Eip712Meta& meta) {
    encode_header(to, header(meta));
    encode(to, meta.gas_per_pubdata.value_or(0));
    if (meta.custom_signature) {
        encode(to, ByteView{*meta.custom_signature});
    } else {
        to.push_back(kEmptyStringCode);
    }
    encode(to, meta.paymaster_params);
    encode(to, meta.factory_deps);
}

}  // namespace txcodec::rlp
