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

#ifndef BLOCKQUERY_CORE_BLOCK_BUILDER_HPP_
#define BLOCKQUERY_CORE_BLOCK_BUILDER_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include <blockquery/chain/client.hpp>
#include <blockquery/common/constants.hpp>
#include <blockquery/core/timestamp.hpp>
#include <blockquery/types/block.hpp>

namespace blockquery::core {

//! Finality heuristic: a block buried more than \p finality_depth blocks below head. Not a consensus guarantee.
bool is_finalized(uint64_t block_number, uint64_t head_number, uint64_t finality_depth = kFinalityDepth);

class BlockRecordBuilder {
public:
    explicit BlockRecordBuilder(chain::ChainClient& client, uint64_t finality_depth = kFinalityDepth,
        std::unique_ptr<TimestampExtractor> timestamp_extractor = std::make_unique<InherentTimestampExtractor>());

    BlockRecordBuilder(const BlockRecordBuilder&) = delete;
    BlockRecordBuilder& operator=(const BlockRecordBuilder&) = delete;

    boost::asio::awaitable<BlockRecord> build(const chain::BlockHandle& block, uint64_t head_number);

    boost::asio::awaitable<std::vector<ExtrinsicRecord>> extract_extrinsics(const chain::BlockHandle& block);

    boost::asio::awaitable<std::vector<EventRecord>> extract_events(const chain::BlockHandle& block);

    boost::asio::awaitable<DetailedBlockRecord> build_detailed(const chain::BlockHandle& block, uint64_t head_number);

private:
    boost::asio::awaitable<std::vector<chain::ExtrinsicHandle>> fetch_extrinsics(const chain::BlockHandle& block);
    boost::asio::awaitable<std::optional<uint32_t>> count_events(const chain::BlockHandle& block, const std::vector<chain::ExtrinsicHandle>& extrinsics);

    chain::ChainClient& client_;
    uint64_t finality_depth_;
    std::unique_ptr<TimestampExtractor> timestamp_extractor_;
};

} // namespace blockquery::core

#endif  // BLOCKQUERY_CORE_BLOCK_BUILDER_HPP_
