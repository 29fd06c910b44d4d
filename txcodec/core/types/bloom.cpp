// Copyright 2026 The Txcodec Authors
// SPDX-License-Identifier: Apache-2.0

#include "bloom.hpp"

#include <algorithm>

#include <txcodec/core/common/util.hpp>

namespace txcodec {

// The three bloom bits selected by the first six bytes of keccak256(x)
static std::array<unsigned, 3> bloom_bits(ByteView x) {
    const ethash::hash256 hash{keccak256(x)};
    std::array<unsigned, 3> bits{};
    for (unsigned i{0}; i < 6; i += 2) {
        bits[i / 2] = static_cast<unsigned>(hash.bytes[i + 1] + (hash.bytes[i] << 8)) & 0x7FFu;
    }
    return bits;
}

void m3_2048(Bloom& bloom, ByteView x) {
    for (const unsigned bit : bloom_bits(x)) {
        bloom[kBloomByteLength - 1 - bit / 8] |= static_cast<uint8_t>(1u << (bit % 8));
    }
}

bool bloom_contains(const Bloom& bloom, ByteView x) {
    return std::ranges::all_of(bloom_bits(x), [&](unsigned bit) {
        return (bloom[kBloomByteLength - 1 - bit / 8] & (1u << (bit % 8))) != 0;
    });
}

tl::expected<Bloom, DecodingError> bloom_from_bytes(ByteView bytes) noexcept {
    if (bytes.size() != kBloomByteLength) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    Bloom bloom;
    std::ranges::copy(bytes, bloom.begin());
    return bloom;
}

}  // namespace txcodec
