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

#include "address.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

#include <txcodec/core/common/util.hpp>
#include <txcodec/core/rlp/encode.hpp>

namespace txcodec {

namespace rlp {

    void encode(Bytes& to, const evmc::address& address) {
        encode(to, ByteView{address.bytes});
    }

    size_t length(const evmc::address& address) noexcept {
        return length(ByteView{address.bytes});
    }

}  // namespace rlp

evmc::address bytes_to_address(ByteView bytes) {
    evmc::address out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kAddressLength)};
        std::memcpy(out.bytes + kAddressLength - n, bytes.data(), n);
    }
    return out;
}

tl::expected<evmc::address, DecodingError> hex_to_address(std::string_view hex) noexcept {
    const std::optional<Bytes> bytes{from_hex(hex)};
    if (!bytes) {
        return tl::unexpected{DecodingError::kMalformedHex};
    }
    if (bytes->size() != kAddressLength) {
        return tl::unexpected{DecodingError::kMalformedAddress};
    }
    evmc::address address{bytes_to_address(*bytes)};

    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    const bool has_lower{std::ranges::any_of(hex, [](char c) { return std::islower(static_cast<unsigned char>(c)); })};
    const bool has_upper{std::ranges::any_of(hex, [](char c) { return std::isupper(static_cast<unsigned char>(c)); })};
    if (has_lower && has_upper && address_to_checksum_hex(address).substr(2) != hex) {
        return tl::unexpected{DecodingError::kMalformedAddress};
    }
    return address;
}

std::string address_to_hex(const evmc::address& address) {
    return to_hex(ByteView{address.bytes}, true);
}

std::string address_to_checksum_hex(const evmc::address& address) {
    std::string hex{to_hex(ByteView{address.bytes})};
    const ethash::hash256 hash{ethash::keccak256(reinterpret_cast<const uint8_t*>(hex.data()), hex.size())};
    for (size_t i{0}; i < hex.size(); ++i) {
        const uint8_t nibble{static_cast<uint8_t>((i % 2 == 0) ? hash.bytes[i / 2] >> 4 : hash.bytes[i / 2] & 0x0f)};
        if (nibble >= 8) {
            hex[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(hex[i])));
        }
    }
    return "0x" + hex;
}

}  // namespace txcodec

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    return out << txcodec::address_to_checksum_hex(address);
}

}  // namespace evmc
