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

#ifndef BLOCKQUERY_TEST_MOCK_CHAIN_CLIENT_HPP_
#define BLOCKQUERY_TEST_MOCK_CHAIN_CLIENT_HPP_

#include <optional>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <evmc/evmc.hpp>
#include <gmock/gmock.h>

#include <blockquery/chain/client.hpp>

namespace blockquery::test {

class MockChainClient : public chain::ChainClient {
public:
    MOCK_METHOD((boost::asio::awaitable<chain::BlockHandle>), head, (), (override));
    MOCK_METHOD((boost::asio::awaitable<std::optional<chain::BlockHandle>>), block_at, (const evmc::bytes32&), (override));
    MOCK_METHOD((boost::asio::awaitable<std::vector<chain::ExtrinsicHandle>>), extrinsics, (const chain::BlockHandle&), (override));
    MOCK_METHOD((boost::asio::awaitable<std::vector<chain::EventHandle>>), events, (const chain::ExtrinsicHandle&), (override));
};

}  // namespace blockquery::test

#endif  // BLOCKQUERY_TEST_MOCK_CHAIN_CLIENT_HPP_
