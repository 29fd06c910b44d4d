// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <numeric>
#include <vector>

#include <txcodec/core/rlp/encode.hpp>

namespace txcodec::rlp {

// std::vector to RLP overloads

template <typename T>
size_t length_items(const std::vector<T>& v) {
    return std::accumulate(v.begin(), v.end(), size_t{0}, [](size_t sum, const T& x) { return sum + length(x); });
}

template <typename T>
size_t length(const std::vector<T>& v) {
    const size_t payload_length = length_items(v);
    return length_of_length(payload_length) + payload_length;
}

template <typename T>
void encode(Bytes& to, const std::vector<T>& v) {
    const Header h{.list = true, .payload_length = length_items(v)};
    to.reserve(to.size() + length_of_length(h.payload_length) + h.payload_length);
    encode_header(to, h);
    for (const T& x : v) {
        encode(to, x);
    }
}

}  // namespace txcodec::rlp
