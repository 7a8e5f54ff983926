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

#include "block_resolver.hpp"

#include <exception>
#include <optional>

#include <blockquery/common/log.hpp>
#include <blockquery/common/util.hpp>
#include <blockquery/types/error.hpp>

namespace blockquery::core {

namespace {

void throw_if_stop_requested(const std::stop_token& stop, const std::string& target) {
    if (stop.stop_requested()) {
        throw make_block_error(BlockError::cancelled, "query for " + target + " cancelled");
    }
}

} // namespace

BlockResolver::BlockResolver(chain::ChainClient& client, BlockCache& cache, const ResolverConfig& config,
    std::unique_ptr<TimestampExtractor> timestamp_extractor)
    : client_(client), cache_(cache), config_(config), builder_(client, config.finality_depth, std::move(timestamp_extractor)) {}

boost::asio::awaitable<BlockRecord> BlockResolver::get_block_by_number(uint64_t number, std::stop_token stop) {
    BLOCKQUERY_DEBUG << "BlockResolver::get_block_by_number number=" << number << "\n";
    throw_if_stop_requested(stop, "block " + std::to_string(number));

    if (const auto cached = cache_.get_block_by_number(number)) {
        BLOCKQUERY_TRACE << "BlockResolver::get_block_by_number cache hit number=" << number << "\n";
        co_return *cached;
    }

    const auto [block, head_number] = co_await resolve_by_number(number, stop);
    const auto record = co_await builder_.build(block, head_number);
    cache_.put_block(record);
    co_return record;
}

boost::asio::awaitable<BlockRecord> BlockResolver::get_block_by_hash(std::string hash, std::stop_token stop) {
    BLOCKQUERY_DEBUG << "BlockResolver::get_block_by_hash hash=" << hash << "\n";
    const auto block_hash = parse_hash32(hash);
    if (!block_hash) {
        throw make_block_error(BlockError::invalid_input, "invalid block hash: " + hash);
    }
    throw_if_stop_requested(stop, "block " + hash);

    if (const auto cached = cache_.get_block_by_hash(*block_hash)) {
        BLOCKQUERY_TRACE << "BlockResolver::get_block_by_hash cache hit hash=" << hash << "\n";
        co_return *cached;
    }

    const auto head = co_await fetch_head(stop);
    throw_if_stop_requested(stop, "block " + hash);

    std::optional<chain::BlockHandle> block;
    std::optional<std::string> failure;
    try {
        block = co_await client_.block_at(*block_hash);
    } catch (const std::exception& e) {
        failure = e.what();
    }
    if (failure) {
        throw make_block_error(BlockError::connection, "cannot fetch block " + hash + ": " + *failure);
    }
    if (!block) {
        throw make_block_error(BlockError::not_found, "block " + hash + " not found");
    }

    const auto record = co_await builder_.build(*block, head.number);
    cache_.put_block(record);
    co_return record;
}

boost::asio::awaitable<DetailedBlockRecord> BlockResolver::get_detailed_block(uint64_t number, std::stop_token stop) {
    BLOCKQUERY_DEBUG << "BlockResolver::get_detailed_block number=" << number << "\n";
    throw_if_stop_requested(stop, "block " + std::to_string(number));

    const auto [block, head_number] = co_await resolve_by_number(number, stop);
    const auto detailed = co_await builder_.build_detailed(block, head_number);
    cache_.put_block(detailed.basic);
    co_return detailed;
}

boost::asio::awaitable<std::pair<chain::BlockHandle, uint64_t>> BlockResolver::resolve_by_number(uint64_t number, const std::stop_token& stop) {
    const auto target = "block " + std::to_string(number);
    const auto head = co_await fetch_head(stop);

    if (number > head.number) {
        throw make_block_error(BlockError::not_found, target + " is in the future, head is " + std::to_string(head.number));
    }
    if (number == head.number) {
        co_return std::make_pair(head, head.number);
    }

    const uint64_t depth = head.number - number;
    if (depth > config_.max_traverse_depth) {
        throw make_block_error(BlockError::too_far, target + " is " + std::to_string(depth) + " blocks behind head, max traversal is " +
            std::to_string(config_.max_traverse_depth) + ": query it by hash");
    }

    auto current = head;
    for (uint64_t hop{0}; hop < depth; ++hop) {
        throw_if_stop_requested(stop, target);

        std::optional<chain::BlockHandle> parent;
        std::optional<std::string> failure;
        try {
            parent = co_await client_.block_at(current.parent_hash);
        } catch (const std::exception& e) {
            failure = e.what();
        }
        if (failure) {
            throw make_block_error(BlockError::connection, "cannot traverse to " + target + ": " + *failure);
        }
        if (!parent) {
            throw make_block_error(BlockError::connection, "cannot traverse to " + target + ": parent " + to_hex_hash(current.parent_hash) +
                " of block " + std::to_string(current.number) + " not found");
        }
        if (parent->number == number) {
            BLOCKQUERY_TRACE << "BlockResolver::resolve_by_number number=" << number << " #hops=" << hop + 1 << "\n";
            co_return std::make_pair(std::move(*parent), head.number);
        }
        current = std::move(*parent);
    }

    throw make_block_error(BlockError::inconsistent_chain, "cannot traverse to " + target + ": ancestry of head " +
        std::to_string(head.number) + " reached block " + std::to_string(current.number) + " after " + std::to_string(depth) + " hops");
}

boost::asio::awaitable<chain::BlockHandle> BlockResolver::fetch_head(const std::stop_token& stop) {
    throw_if_stop_requested(stop, "head");

    std::optional<chain::BlockHandle> head;
    std::optional<std::string> failure;
    try {
        head = co_await client_.head();
    } catch (const std::exception& e) {
        failure = e.what();
    }
    if (failure) {
        throw make_block_error(BlockError::connection, "cannot fetch head: " + *failure);
    }
    co_return std::move(*head);
}

} // namespace blockquery::core
