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

#ifndef BLOCKQUERY_CHAIN_CLIENT_HPP_
#define BLOCKQUERY_CHAIN_CLIENT_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <evmc/evmc.hpp>

#include <silkworm/common/base.hpp>

namespace blockquery::chain {

struct BlockHandle {
    uint64_t number{0};
    evmc::bytes32 hash;
    evmc::bytes32 parent_hash;
    std::optional<evmc::bytes32> state_root;
    std::optional<evmc::bytes32> extrinsics_root;
};

struct ExtrinsicHandle {
    evmc::bytes32 block_hash;
    uint32_t index{0};
    silkworm::Bytes bytes; // raw encoded extrinsic
    bool is_signed{false};
    std::optional<silkworm::Bytes> signer; // address bytes, only for signed extrinsics
    std::string pallet;
    std::string call;
    silkworm::Bytes call_args; // encoded call arguments
};

struct EventHandle {
    std::string pallet;
    std::string event;
};

//! Access to a remote chain node. Every call is a network round trip and throws on connection failure.
class ChainClient {
public:
    virtual ~ChainClient() = default;

    //! Most recently observed block.
    virtual boost::asio::awaitable<BlockHandle> head() = 0;

    //! Block identified by \p hash, std::nullopt if the node does not know it.
    virtual boost::asio::awaitable<std::optional<BlockHandle>> block_at(const evmc::bytes32& hash) = 0;

    //! Extrinsics of \p block in on-chain order.
    virtual boost::asio::awaitable<std::vector<ExtrinsicHandle>> extrinsics(const BlockHandle& block) = 0;

    //! Events emitted by \p extrinsic in emission order.
    virtual boost::asio::awaitable<std::vector<EventHandle>> events(const ExtrinsicHandle& extrinsic) = 0;
};

} // namespace blockquery::chain

#endif  // BLOCKQUERY_CHAIN_CLIENT_HPP_
