// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include <txcodec/core/common/bytes.hpp>
#include <txcodec/core/common/decoding_result.hpp>

namespace txcodec {

inline constexpr size_t kBloomByteLength{256};

using Bloom = std::array<uint8_t, kBloomByteLength>;

//! See Section 4.3.1 "Transaction Receipt" of the Yellow Paper
void m3_2048(Bloom& bloom, ByteView x);

//! \brief Whether x may have been added to the bloom (no false negatives)
bool bloom_contains(const Bloom& bloom, ByteView x);

//! \brief Builds a bloom from its raw 256-byte form; any other length is kUnexpectedLength
tl::expected<Bloom, DecodingError> bloom_from_bytes(ByteView bytes) noexcept;

inline void join(Bloom& sum, const Bloom& addend) {
    for (size_t i{0}; i < kBloomByteLength; ++i) {
        sum[i] |= addend[i];
    }
}

}  // namespace txcodec
