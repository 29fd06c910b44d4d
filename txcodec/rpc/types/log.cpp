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

#include "log.hpp"

#include <sstream>

#include <txcodec/core/types/address.hpp>
#include <txcodec/core/types/evmc_bytes32.hpp>

namespace txcodec::rpc {

std::ostream& operator<<(std::ostream& out, const Log& log) {
    out << log.to_string();
    return out;
}

std::string Log::to_string() const {
    const auto& log = *this;
    std::stringstream out;

    out << "#topics: " << log.topics.size();
    out << " #data: " << log.data.size();
    out << " block_num: " << log.block_num;
    out << " tx_hash: " << txcodec::to_hex(log.tx_hash);
    out << " tx_index: " << log.tx_index;
    out << " block_hash: " << txcodec::to_hex(log.block_hash);
    out << " index: " << log.index;
    out << " removed: " << log.removed;
    out << " address: " << address_to_hex(log.address);
    return out.str();
}

}  // namespace txcodec::rpc
