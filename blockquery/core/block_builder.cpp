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

#include "block_builder.hpp"

#include <exception>
#include <string>
#include <utility>

#include <blockquery/common/log.hpp>
#include <blockquery/common/util.hpp>
#include <blockquery/types/error.hpp>

namespace blockquery::core {

bool is_finalized(uint64_t block_number, uint64_t head_number, uint64_t finality_depth) {
    return head_number > block_number && head_number - block_number > finality_depth;
}

BlockRecordBuilder::BlockRecordBuilder(chain::ChainClient& client, uint64_t finality_depth, std::unique_ptr<TimestampExtractor> timestamp_extractor)
    : client_(client), finality_depth_(finality_depth), timestamp_extractor_(std::move(timestamp_extractor)) {}

boost::asio::awaitable<BlockRecord> BlockRecordBuilder::build(const chain::BlockHandle& block, uint64_t head_number) {
    const auto extrinsics = co_await fetch_extrinsics(block);

    BlockRecord record;
    record.number = block.number;
    record.hash = block.hash;
    record.parent_hash = block.parent_hash;
    record.timestamp = timestamp_extractor_->extract(block, extrinsics);
    record.transactions.reserve(extrinsics.size());
    for (const auto& extrinsic : extrinsics) {
        record.transactions.push_back(hash_of(extrinsic.bytes));
    }
    record.state_root = block.state_root;
    record.extrinsics_root = block.extrinsics_root;
    record.extrinsic_count = static_cast<uint32_t>(extrinsics.size());
    record.event_count = co_await count_events(block, extrinsics);
    record.is_finalized = is_finalized(block.number, head_number, finality_depth_);

    BLOCKQUERY_DEBUG << "BlockRecordBuilder::build number=" << record.number << " #extrinsics=" << record.extrinsic_count
                     << " finalized=" << record.is_finalized << "\n";
    co_return record;
}

boost::asio::awaitable<std::vector<ExtrinsicRecord>> BlockRecordBuilder::extract_extrinsics(const chain::BlockHandle& block) {
    const auto extrinsics = co_await fetch_extrinsics(block);

    std::vector<ExtrinsicRecord> records;
    records.reserve(extrinsics.size());
    for (const auto& extrinsic : extrinsics) {
        ExtrinsicRecord record;
        record.index = extrinsic.index;
        record.hash = hash_of(extrinsic.bytes);
        record.is_signed = extrinsic.is_signed;
        if (extrinsic.is_signed) {
            record.signer = extrinsic.signer;
        }
        record.pallet = extrinsic.pallet;
        record.call = extrinsic.call;

        bool events_available{true};
        std::vector<chain::EventHandle> events;
        try {
            events = co_await client_.events(extrinsic);
        } catch (const std::exception& e) {
            BLOCKQUERY_DEBUG << "cannot fetch events of extrinsic " << block.number << "-" << extrinsic.index << ": " << e.what() << "\n";
            events_available = false;
        }
        if (events_available) {
            for (const auto& event : events) {
                if (event.pallet == kSystemPallet && event.event == kExtrinsicSuccessEvent) {
                    record.success = true;
                    break;
                }
            }
        }
        records.push_back(std::move(record));
    }
    co_return records;
}

boost::asio::awaitable<std::vector<EventRecord>> BlockRecordBuilder::extract_events(const chain::BlockHandle& block) {
    const auto extrinsics = co_await fetch_extrinsics(block);

    std::vector<EventRecord> records;
    uint32_t index{0};
    for (const auto& extrinsic : extrinsics) {
        std::vector<chain::EventHandle> events;
        std::optional<std::string> failure;
        try {
            events = co_await client_.events(extrinsic);
        } catch (const std::exception& e) {
            failure = e.what();
        }
        if (failure) {
            throw make_block_error(BlockError::connection, "cannot fetch events of extrinsic " + std::to_string(block.number) + "-" +
                std::to_string(extrinsic.index) + ": " + *failure);
        }
        for (const auto& event : events) {
            records.push_back(EventRecord{index++, extrinsic.index, event.pallet, event.event});
        }
    }
    co_return records;
}

boost::asio::awaitable<DetailedBlockRecord> BlockRecordBuilder::build_detailed(const chain::BlockHandle& block, uint64_t head_number) {
    DetailedBlockRecord detailed;
    detailed.basic = co_await build(block, head_number);
    detailed.extrinsics = co_await extract_extrinsics(block);
    detailed.events = co_await extract_events(block);
    co_return detailed;
}

boost::asio::awaitable<std::vector<chain::ExtrinsicHandle>> BlockRecordBuilder::fetch_extrinsics(const chain::BlockHandle& block) {
    std::vector<chain::ExtrinsicHandle> extrinsics;
    std::optional<std::string> failure;
    try {
        extrinsics = co_await client_.extrinsics(block);
    } catch (const std::exception& e) {
        failure = e.what();
    }
    if (failure) {
        throw make_block_error(BlockError::connection, "cannot fetch extrinsics of block " + std::to_string(block.number) + ": " + *failure);
    }
    co_return extrinsics;
}

boost::asio::awaitable<std::optional<uint32_t>> BlockRecordBuilder::count_events(const chain::BlockHandle& block, const std::vector<chain::ExtrinsicHandle>& extrinsics) {
    uint32_t count{0};
    for (const auto& extrinsic : extrinsics) {
        bool counted{true};
        try {
            const auto events = co_await client_.events(extrinsic);
            count += static_cast<uint32_t>(events.size());
        } catch (const std::exception& e) {
            BLOCKQUERY_WARN << "event count unavailable for block " << block.number << ": " << e.what() << "\n";
            counted = false;
        }
        if (!counted) {
            co_return std::nullopt;
        }
    }
    co_return count;
}

} // namespace blockquery::core
