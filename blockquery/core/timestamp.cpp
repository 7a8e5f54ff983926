/*
   Copyright 2023 The Silkrpc Authors

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

#include "timestamp.hpp"

#include <chrono>

#include <boost/endian/conversion.hpp>

#include <blockquery/common/constants.hpp>
#include <blockquery/common/log.hpp>

namespace blockquery::core {

std::optional<uint64_t> decode_compact_u64(silkworm::ByteView data) {
    if (data.empty()) {
        return std::nullopt;
    }
    const uint8_t prefix = data[0];
    switch (prefix & 0b11) {
        case 0b00:
            return prefix >> 2;
        case 0b01:
            if (data.size() < 2) {
                return std::nullopt;
            }
            return boost::endian::load_little_u16(data.data()) >> 2;
        case 0b10:
            if (data.size() < 4) {
                return std::nullopt;
            }
            return boost::endian::load_little_u32(data.data()) >> 2;
        default: {
            const std::size_t length = (prefix >> 2) + 4u;
            if (length > sizeof(uint64_t) || data.size() < length + 1) {
                return std::nullopt;
            }
            uint64_t value{0};
            for (std::size_t i{length}; i > 0; --i) {
                value = (value << 8) | data[i];
            }
            return value;
        }
    }
}

uint64_t InherentTimestampExtractor::extract(const chain::BlockHandle& block, const std::vector<chain::ExtrinsicHandle>& extrinsics) {
    for (const auto& extrinsic : extrinsics) {
        if (extrinsic.pallet != kTimestampPallet || extrinsic.call != kTimestampSetCall) {
            continue;
        }
        const auto milliseconds = decode_compact_u64(extrinsic.call_args);
        if (milliseconds) {
            return *milliseconds / 1000;
        }
        BLOCKQUERY_WARN << "malformed timestamp inherent in block " << block.number << "\n";
        break;
    }
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    BLOCKQUERY_WARN << "timestamp unavailable for block " << block.number << ", using wall clock\n";
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

} // namespace blockquery::core
