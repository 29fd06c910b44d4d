// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include "item.hpp"

#include <txcodec/core/common/overloaded.hpp>

namespace txcodec::rlp {

static tl::expected<Item, DecodingError> decode_item_at_depth(ByteView& from, size_t depth) noexcept {
    if (depth > kMaxItemDepth) {
        return tl::unexpected{DecodingError::kOverflow};
    }

    const auto h{decode_header(from)};
    if (!h) {
        return tl::unexpected{h.error()};
    }

    ByteView payload{from.substr(0, h->payload_length)};
    from.remove_prefix(h->payload_length);

    if (!h->list) {
        return Item{payload};
    }

    ItemList elements;
    while (!payload.empty()) {
        auto element{decode_item_at_depth(payload, depth + 1)};
        if (!element) {
            return tl::unexpected{element.error()};
        }
        elements.push_back(std::move(*element));
    }
    return Item{std::move(elements)};
}

tl::expected<Item, DecodingError> decode_item(ByteView& from, Leftover mode) noexcept {
    auto item{decode_item_at_depth(from, 0)};
    if (!item) {
        return item;
    }
    if (mode != Leftover::kAllow && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return item;
}

static size_t payload_length(const ItemList& list) {
    size_t total{0};
    for (const Item& element : list) {
        total += length(element);
    }
    return total;
}

size_t length(const Item& item) {
    return std::visit(
        Overloaded{
            [](const std::monostate&) -> size_t { return 1; },
            [](const ByteView& str) -> size_t { return length(str); },
            [](const ItemList& list) -> size_t {
                const size_t len{payload_length(list)};
                return length_of_length(len) + len;
            },
        },
        item.content);
}

void encode(Bytes& to, const Item& item) {
    std::visit(
        Overloaded{
            [&](const std::monostate&) { to.push_back(kEmptyStringCode); },
            [&](const ByteView& str) { encode(to, str); },
            [&](const ItemList& list) {
                encode_header(to, {.list = true, .payload_length = payload_length(list)});
                for (const Item& element : list) {
                    encode(to, element);
                }
            },
        },
        item.content);
}

}  // namespace txcodec::rlp
