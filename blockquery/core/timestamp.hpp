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

#ifndef BLOCKQUERY_CORE_TIMESTAMP_HPP_
#define BLOCKQUERY_CORE_TIMESTAMP_HPP_

#include <cstdint>
#include <optional>
#include <vector>

#include <silkworm/common/base.hpp>

#include <blockquery/chain/client.hpp>

namespace blockquery::core {

//! Decode a SCALE compact-encoded unsigned integer fitting 64 bits, std::nullopt if malformed or too wide.
std::optional<uint64_t> decode_compact_u64(silkworm::ByteView data);

class TimestampExtractor {
public:
    virtual ~TimestampExtractor() = default;

    //! Block production time in Unix seconds.
    virtual uint64_t extract(const chain::BlockHandle& block, const std::vector<chain::ExtrinsicHandle>& extrinsics) = 0;
};

//! Reads the Timestamp::set inherent, falling back to the local wall clock when the block has none.
class InherentTimestampExtractor : public TimestampExtractor {
public:
    uint64_t extract(const chain::BlockHandle& block, const std::vector<chain::ExtrinsicHandle>& extrinsics) override;
};

} // namespace blockquery::core

#endif  // BLOCKQUERY_CORE_TIMESTAMP_HPP_
