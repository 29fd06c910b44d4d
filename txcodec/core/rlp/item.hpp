// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <variant>
#include <vector>

#include <txcodec/core/common/bytes.hpp>
#include <txcodec/core/common/decoding_result.hpp>
#include <txcodec/core/rlp/decode.hpp>

namespace txcodec::rlp {

struct Item;

using ItemList = std::vector<Item>;

//! \brief A node of a decoded RLP tree: either absent, a byte string or a list of nodes.
//! \remarks String payloads are views into the decoded buffer, which must outlive the Item.
struct Item {
    std::variant<std::monostate, ByteView, ItemList> content;

    Item() = default;
    explicit Item(ByteView str) : content{str} {}
    explicit Item(ItemList list) : content{std::move(list)} {}

    bool is_absent() const noexcept { return std::holds_alternative<std::monostate>(content); }
    bool is_string() const noexcept { return std::holds_alternative<ByteView>(content); }
    bool is_list() const noexcept { return std::holds_alternative<ItemList>(content); }

    //! \return the string payload, or nullptr when the item is not a string
    const ByteView* string() const noexcept { return std::get_if<ByteView>(&content); }

    //! \return the list elements, or nullptr when the item is not a list
    const ItemList* list() const noexcept { return std::get_if<ItemList>(&content); }
};

//! Nested lists deeper than this are rejected with kOverflow
inline constexpr size_t kMaxItemDepth{64};

//! \brief Decodes one RLP item (string or arbitrarily nested list) from the head of the input
tl::expected<Item, DecodingError> decode_item(ByteView& from, Leftover mode = Leftover::kProhibit) noexcept;

//! \brief Encodes an item tree; an absent item is encoded as the empty string
void encode(Bytes& to, const Item& item);

size_t length(const Item& item);

}  // namespace txcodec::rlp
