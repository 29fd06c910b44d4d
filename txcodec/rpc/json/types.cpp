/*
   Copyright 2023 The Silkworm Authors

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

#include "types.hpp"

#include <txcodec/core/common/endian.hpp>
#include <txcodec/core/common/util.hpp>
#include <txcodec/core/types/address.hpp>
#include <txcodec/core/types/evmc_bytes32.hpp>
#include <txcodec/infra/common/decoding_exception.hpp>

namespace txcodec::rpc {

std::string to_hex_no_leading_zeros(ByteView bytes) {
    static constexpr const char* kHexDigits{"0123456789abcdef"};

    std::string out{};
    if (bytes.empty()) {
        out.push_back('0');
        return out;
    }
    out.reserve(bytes.size() * 2);

    bool found_nonzero{false};
    for (size_t i{0}; i < bytes.size(); ++i) {
        const uint8_t x{bytes[i]};
        const char hi{kHexDigits[x >> 4]};
        const char lo{kHexDigits[x & 0x0f]};
        if (!found_nonzero && hi != '0') {
            found_nonzero = true;
        }
        if (found_nonzero) {
            out.push_back(hi);
        }
        if (!found_nonzero && lo != '0') {
            found_nonzero = true;
        }
        if (found_nonzero || i == bytes.size() - 1) {
            out.push_back(lo);
        }
    }
    return out;
}

std::string to_quantity(ByteView bytes) {
    return "0x" + to_hex_no_leading_zeros(bytes);
}

std::string to_quantity(uint64_t number) {
    Bytes number_bytes(8, '\0');
    endian::store_big_u64(number_bytes.data(), number);
    return to_quantity(number_bytes);
}

std::string to_quantity(const intx::uint256& number) {
    if (number == 0) {
        return "0x0";
    }
    return to_quantity(endian::to_big_compact(number));
}

}  // namespace txcodec::rpc

namespace evmc {

void to_json(nlohmann::json& json, const address& addr) {
    json = txcodec::address_to_hex(addr);
}

void from_json(const nlohmann::json& json, address& addr) {
    addr = txcodec::unwrap_or_throw(txcodec::hex_to_address(json.get<std::string>()));
}

void to_json(nlohmann::json& json, const bytes32& b32) {
    json = txcodec::to_hex(b32, /*with_prefix=*/true);
}

void from_json(const nlohmann::json& json, bytes32& b32) {
    const auto b32_bytes{txcodec::from_hex(json.get<std::string>())};
    if (!b32_bytes) {
        throw txcodec::DecodingException{txcodec::DecodingError::kMalformedHex};
    }
    if (b32_bytes->size() != txcodec::kHashLength) {
        throw txcodec::DecodingException{txcodec::DecodingError::kUnexpectedLength};
    }
    b32 = txcodec::to_bytes32(*b32_bytes);
}

}  // namespace evmc
