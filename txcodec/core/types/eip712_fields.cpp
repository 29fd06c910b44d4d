// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include "eip712_fields.hpp"

#include <txcodec/core/common/overloaded.hpp>
#include <txcodec/core/types/address.hpp>

namespace txcodec::eip712 {

DecodingResult decode_bytes(const rlp::Item& item, Bytes& to) {
    if (item.is_absent()) {
        to.clear();
        return {};
    }
    const ByteView* str{item.string()};
    if (!str) {
        return tl::unexpected{DecodingError::kUnexpectedVariantShape};
    }
    to = Bytes{*str};
    return {};
}

DecodingResult decode_address(const rlp::Item& item, std::optional<evmc::address>& to) noexcept {
    return std::visit(
        Overloaded{
            [&](const std::monostate&) -> DecodingResult {
                to = std::nullopt;
                return {};
            },
            [&](const ByteView& str) -> DecodingResult {
                if (str.empty()) {
                    to = std::nullopt;
                    return {};
                }
                if (str.size() != kAddressLength) {
                    return tl::unexpected{DecodingError::kMalformedAddress};
                }
                to = bytes_to_address(str);
                return {};
            },
            [](const rlp::ItemList&) -> DecodingResult {
                return tl::unexpected{DecodingError::kMalformedAddress};
            },
        },
        item.content);
}

DecodingResult decode_factory_deps(const rlp::Item& item, std::vector<Bytes>& to) {
    to.clear();
    const rlp::ItemList* elements{item.list()};
    if (!elements) {
        return {};
    }
    to.reserve(elements->size());
    for (const rlp::Item& element : *elements) {
        const ByteView* dep{element.string()};
        if (!dep) {
            return tl::unexpected{DecodingError::kUnexpectedVariantShape};
        }
        to.emplace_back(*dep);
    }
    return {};
}

DecodingResult decode_paymaster_params(const rlp::Item& item, std::optional<PaymasterParams>& to) {
    to = std::nullopt;
    const rlp::ItemList* elements{item.list()};
    if (!elements) {
        return {};
    }

    PaymasterParams params;
    for (const rlp::Item& element : *elements) {
        const ByteView* str{element.string()};
        if (!str) {
            return tl::unexpected{DecodingError::kUnexpectedVariantShape};
        }
        if (str->size() == kAddressLength) {
            if (params.paymaster) {
                return tl::unexpected{DecodingError::kUnexpectedVariantShape};
            }
            params.paymaster = bytes_to_address(*str);
        } else {
            if (params.paymaster_input) {
                return tl::unexpected{DecodingError::kUnexpectedVariantShape};
            }
            params.paymaster_input = Bytes{*str};
        }
    }

    if (params.is_complete()) {
        to = std::move(params);
    }
    return {};
}

}  // namespace txcodec::eip712

namespace txcodec::rlp {

void encode(Bytes& to, const std::optional<evmc::address>& address) {
    if (address) {
        encode(to, *address);
    } else {
        to.push_back(kEmptyStringCode);
    }
}

size_t length(const std::optional<evmc::address>& address) noexcept {
    return address ? kAddressLength + 1 : 1;
}

}  // namespace txcodec::rlp
