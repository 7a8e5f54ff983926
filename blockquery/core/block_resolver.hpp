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

#ifndef BLOCKQUERY_CORE_BLOCK_RESOLVER_HPP_
#define BLOCKQUERY_CORE_BLOCK_RESOLVER_HPP_

#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include <blockquery/chain/client.hpp>
#include <blockquery/common/block_cache.hpp>
#include <blockquery/common/constants.hpp>
#include <blockquery/core/block_builder.hpp>
#include <blockquery/core/timestamp.hpp>
#include <blockquery/types/block.hpp>

namespace blockquery::core {

struct ResolverConfig {
    uint64_t max_traverse_depth{kMaxTraverseDepth};
    uint64_t finality_depth{kFinalityDepth};
};

//! Answers block queries by number or hash, serving from the shared cache when possible.
//! Blocks by number are reached walking parent hashes back from head, at most max_traverse_depth hops:
//! older blocks must be queried by hash.
//! A block fetched by hash is cached under its number too, even when it is not on the canonical chain:
//! until that entry expires or is replaced, get_block_by_number serves it without walking from head.
//! All operations raise std::system_error carrying a BlockError code.
class BlockResolver {
public:
    BlockResolver(chain::ChainClient& client, BlockCache& cache, const ResolverConfig& config = {},
        std::unique_ptr<TimestampExtractor> timestamp_extractor = std::make_unique<InherentTimestampExtractor>());

    BlockResolver(const BlockResolver&) = delete;
    BlockResolver& operator=(const BlockResolver&) = delete;

    boost::asio::awaitable<BlockRecord> get_block_by_number(uint64_t number, std::stop_token stop = {});

    boost::asio::awaitable<BlockRecord> get_block_by_hash(std::string hash, std::stop_token stop = {});

    //! Always fetched from chain, only the summary part gets cached.
    boost::asio::awaitable<DetailedBlockRecord> get_detailed_block(uint64_t number, std::stop_token stop = {});

    const ResolverConfig& config() const { return config_; }

private:
    //! Handle of block \p number together with the head number observed while resolving it.
    boost::asio::awaitable<std::pair<chain::BlockHandle, uint64_t>> resolve_by_number(uint64_t number, const std::stop_token& stop);

    boost::asio::awaitable<chain::BlockHandle> fetch_head(const std::stop_token& stop);

    chain::ChainClient& client_;
    BlockCache& cache_;
    ResolverConfig config_;
    BlockRecordBuilder builder_;
};

} // namespace blockquery::core

#endif  // BLOCKQUERY_CORE_BLOCK_RESOLVER_HPP_
