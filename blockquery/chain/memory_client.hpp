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

#ifndef BLOCKQUERY_CHAIN_MEMORY_CLIENT_HPP_
#define BLOCKQUERY_CHAIN_MEMORY_CLIENT_HPP_

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <blockquery/chain/client.hpp>

namespace blockquery::chain {

struct StoredExtrinsic {
    ExtrinsicHandle extrinsic;
    std::vector<EventHandle> events;
};

//! ChainClient serving a fixed chain snapshot held in memory.
//! Blocks must be added before the client is shared with concurrent readers.
class InMemoryChainClient : public ChainClient {
public:
    InMemoryChainClient() = default;

    InMemoryChainClient(const InMemoryChainClient&) = delete;
    InMemoryChainClient& operator=(const InMemoryChainClient&) = delete;

    //! Load a snapshot document: {"head": hash (optional), "blocks": [...]}
    void load(const nlohmann::json& snapshot);
    void load_file(const std::filesystem::path& snapshot_file);

    //! Add or replace a block. The highest block added becomes head unless set_head is used.
    void add_block(const BlockHandle& block, std::vector<StoredExtrinsic> extrinsics = {});
    void set_head(const evmc::bytes32& hash);

    std::size_t size() const { return blocks_.size(); }
    uint64_t head_calls() const { return head_calls_; }
    uint64_t block_at_calls() const { return block_at_calls_; }

    boost::asio::awaitable<BlockHandle> head() override;
    boost::asio::awaitable<std::optional<BlockHandle>> block_at(const evmc::bytes32& hash) override;
    boost::asio::awaitable<std::vector<ExtrinsicHandle>> extrinsics(const BlockHandle& block) override;
    boost::asio::awaitable<std::vector<EventHandle>> events(const ExtrinsicHandle& extrinsic) override;

private:
    struct StoredBlock {
        BlockHandle block;
        std::vector<StoredExtrinsic> extrinsics;
    };

    const StoredBlock& stored_block(const evmc::bytes32& hash) const;

    std::map<evmc::bytes32, StoredBlock> blocks_;
    std::optional<evmc::bytes32> head_hash_;
    bool explicit_head_{false};
    std::atomic_uint64_t head_calls_{0};
    std::atomic_uint64_t block_at_calls_{0};
};

} // namespace blockquery::chain

#endif  // BLOCKQUERY_CHAIN_MEMORY_CLIENT_HPP_
