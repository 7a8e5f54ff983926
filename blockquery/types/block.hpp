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

#ifndef BLOCKQUERY_TYPES_BLOCK_HPP_
#define BLOCKQUERY_TYPES_BLOCK_HPP_

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>

#include <silkworm/common/base.hpp>

namespace blockquery {

//! Summary view of one block, the unit stored in the block cache.
struct BlockRecord {
    uint64_t number{0};
    evmc::bytes32 hash;
    evmc::bytes32 parent_hash;
    uint64_t timestamp{0}; // seconds since epoch
    std::vector<evmc::bytes32> transactions; // extrinsic hashes in on-chain order
    std::optional<evmc::bytes32> state_root;
    std::optional<evmc::bytes32> extrinsics_root;
    uint32_t extrinsic_count{0};
    std::optional<uint32_t> event_count; // advisory, absent when event enumeration failed
    bool is_finalized{false};

    bool operator==(const BlockRecord&) const = default;
};

struct ExtrinsicRecord {
    uint32_t index{0};
    evmc::bytes32 hash;
    bool is_signed{false};
    std::optional<silkworm::Bytes> signer;
    std::string pallet;
    std::string call;
    bool success{false};

    bool operator==(const ExtrinsicRecord&) const = default;
};

struct EventRecord {
    uint32_t index{0}; // position within block
    std::optional<uint32_t> extrinsic_index; // absent for block-level events
    std::string pallet;
    std::string event;

    bool operator==(const EventRecord&) const = default;
};

struct DetailedBlockRecord {
    BlockRecord basic;
    std::vector<ExtrinsicRecord> extrinsics;
    std::vector<EventRecord> events;

    bool operator==(const DetailedBlockRecord&) const = default;
};

std::ostream& operator<<(std::ostream& out, const BlockRecord& r);

std::ostream& operator<<(std::ostream& out, const ExtrinsicRecord& r);

std::ostream& operator<<(std::ostream& out, const EventRecord& r);

std::ostream& operator<<(std::ostream& out, const DetailedBlockRecord& r);

} // namespace blockquery

#endif  // BLOCKQUERY_TYPES_BLOCK_HPP_
