/*
   Copyright 2022 The Silkworm Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#pragma once

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>
#include <intx/intx.hpp>

#include <txcodec/core/common/base.hpp>
#include <txcodec/core/common/bytes.hpp>
#include <txcodec/core/common/decoding_result.hpp>

// intx does not include operator<< overloading for uint<N>
namespace intx {

template <unsigned N>
inline std::ostream& operator<<(std::ostream& out, const uint<N>& value) {
    out << "0x" << intx::hex(value);
    return out;
}

}  // namespace intx

namespace txcodec {

//! \brief Strips leftmost zeroed bytes from byte sequence
//! \param [in] data : The view to process
//! \return A new view of the sequence
ByteView zeroless_view(ByteView data);

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Returns a string representing the hex form of provided integral
template <typename T>
    requires(std::is_integral_v<T> && std::is_unsigned_v<T>)
std::string to_hex(T value, bool with_prefix = false) {
    uint8_t bytes[sizeof(T)];
    intx::be::store(bytes, value);
    std::string hexed{to_hex(zeroless_view(bytes), with_prefix)};
    if (hexed.length() == (with_prefix ? 2 : 0)) {
        hexed += "00";
    }
    return hexed;
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Parses a case-insensitive, optionally 0x-prefixed hex string into bytes
//! \remarks Odd-length digit sequences and non-hex characters yield std::nullopt; "0x" yields empty bytes
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

//! \brief Parses a hex quantity (e.g. "0x1", "0x2a") into an unsigned integer
//! \return kMalformedHex for an empty digit sequence or a non-hex character, kOverflow if the value does not fit T
template <UnsignedIntegral T>
tl::expected<T, DecodingError> from_hex_quantity(std::string_view hex) noexcept {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    if (hex.empty()) {
        return tl::unexpected{DecodingError::kMalformedHex};
    }
    constexpr unsigned kTopNibbleShift{sizeof(T) * 8 - 4};
    T out{0};
    for (const char ch : hex) {
        const std::optional<uint8_t> digit{decode_hex_digit(ch)};
        if (!digit) {
            return tl::unexpected{DecodingError::kMalformedHex};
        }
        if ((out >> kTopNibbleShift) != 0) {
            return tl::unexpected{DecodingError::kOverflow};
        }
        out = static_cast<T>((out << 4) | T{*digit});
    }
    return out;
}

inline ethash::hash256 keccak256(ByteView view) { return ethash::keccak256(view.data(), view.size()); }

inline std::ostream& operator<<(std::ostream& out, ByteView bytes) {
    for (const auto& b : bytes) {
        out << std::hex << std::setw(2) << std::setfill('0') << int{b};
    }
    out << std::dec;
    return out;
}

inline std::ostream& operator<<(std::ostream& out, const Bytes& bytes) {
    out << to_hex(bytes);
    return out;
}

}  // namespace txcodec
