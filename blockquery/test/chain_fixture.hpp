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

#ifndef BLOCKQUERY_TEST_CHAIN_FIXTURE_HPP_
#define BLOCKQUERY_TEST_CHAIN_FIXTURE_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include <boost/endian/conversion.hpp>
#include <evmc/evmc.hpp>

#include <silkworm/common/base.hpp>
#include <silkworm/common/util.hpp>

#include <blockquery/chain/client.hpp>
#include <blockquery/chain/memory_client.hpp>
#include <blockquery/common/constants.hpp>
#include <blockquery/common/util.hpp>

namespace blockquery::test {

// Timestamp::set argument for 2023-11-14T22:13:20Z (1'700'000'000'000 ms), SCALE compact encoded
inline const silkworm::Bytes kTimestampSetArgs{*silkworm::from_hex("0b0068e5cf8b01")};
constexpr uint64_t kTimestampSeconds{1'700'000'000};

//! Deterministic hash of block \p number on branch \p fork.
inline evmc::bytes32 block_hash(uint64_t number, uint8_t fork = 0) {
    silkworm::Bytes seed(9, 0);
    boost::endian::store_big_u64(seed.data(), number);
    seed[8] = fork;
    return hash_of(seed);
}

inline chain::BlockHandle make_block(uint64_t number, uint8_t fork = 0) {
    chain::BlockHandle block;
    block.number = number;
    block.hash = block_hash(number, fork);
    block.parent_hash = number == 0 ? evmc::bytes32{} : block_hash(number - 1, fork);
    return block;
}

inline chain::StoredExtrinsic make_timestamp_extrinsic() {
    chain::StoredExtrinsic stored;
    stored.extrinsic.bytes = *silkworm::from_hex("280403000b0068e5cf8b01");
    stored.extrinsic.pallet = kTimestampPallet;
    stored.extrinsic.call = kTimestampSetCall;
    stored.extrinsic.call_args = kTimestampSetArgs;
    stored.events.push_back({kSystemPallet, kExtrinsicSuccessEvent});
    return stored;
}

inline chain::StoredExtrinsic make_transfer_extrinsic(uint8_t nonce, bool success = true) {
    chain::StoredExtrinsic stored;
    stored.extrinsic.bytes = silkworm::Bytes{0x84, 0x05, 0x07, nonce};
    stored.extrinsic.is_signed = true;
    stored.extrinsic.signer = silkworm::Bytes(32, nonce);
    stored.extrinsic.pallet = "Balances";
    stored.extrinsic.call = "transfer";
    stored.events.push_back({"Balances", "Transfer"});
    stored.events.push_back({kSystemPallet, success ? kExtrinsicSuccessEvent : "ExtrinsicFailed"});
    return stored;
}

//! Add blocks [first, last] linked by parent hash, each carrying one timestamp inherent.
inline void add_linear_chain(chain::InMemoryChainClient& client, uint64_t first, uint64_t last, uint8_t fork = 0) {
    for (uint64_t number{first}; number <= last; ++number) {
        client.add_block(make_block(number, fork), {make_timestamp_extrinsic()});
    }
}

}  // namespace blockquery::test

#endif  // BLOCKQUERY_TEST_CHAIN_FIXTURE_HPP_
