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

#ifndef BLOCKQUERY_COMMON_BLOCK_CACHE_HPP_
#define BLOCKQUERY_COMMON_BLOCK_CACHE_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>

#include <absl/container/btree_map.h>
#include <boost/thread/mutex.hpp>
#include <evmc/evmc.hpp>

#include <blockquery/common/constants.hpp>
#include <blockquery/types/block.hpp>

namespace blockquery {

struct CacheConfig {
    std::chrono::milliseconds block_ttl_finalized{kDefaultBlockTtlFinalized};
    std::chrono::milliseconds block_ttl_recent{kDefaultBlockTtlRecent};
    std::size_t max_entries{kDefaultMaxEntries};

    CacheConfig with_block_ttl_finalized(std::chrono::milliseconds ttl) const;
    CacheConfig with_block_ttl_recent(std::chrono::milliseconds ttl) const;
    CacheConfig with_max_entries(std::size_t max) const;
};

//! Block records stored under both number and hash.
//! Each record lives in one entry referenced by both indices, so the two keys always share content and TTL.
//! Expiry is lazy (checked on access) and capacity eviction happens inline in put_block.
class BlockCache {
public:
    explicit BlockCache(const CacheConfig& config = {});

    BlockCache(const BlockCache&) = delete;
    BlockCache& operator=(const BlockCache&) = delete;

    void put_block(const BlockRecord& record);

    std::optional<BlockRecord> get_block_by_number(uint64_t number);

    std::optional<BlockRecord> get_block_by_hash(const evmc::bytes32& hash);

    void clear();

    std::size_t size();

    uint64_t hit_count();
    uint64_t miss_count();
    uint64_t expired_count();
    uint64_t eviction_count();

    const CacheConfig& config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    struct CacheEntry {
        BlockRecord record;
        Clock::time_point inserted_at;
        Clock::duration ttl;

        bool is_expired(Clock::time_point now) const { return now - inserted_at > ttl; }
    };

    using Entries = std::list<CacheEntry>;

    std::optional<BlockRecord> lookup(Entries::iterator it, Clock::time_point now);
    void erase(Entries::iterator it);
    void make_room(Clock::time_point now);

    const CacheConfig config_;

    // Insertion order, oldest first
    Entries entries_;
    absl::btree_map<uint64_t, Entries::iterator> by_number_;
    absl::btree_map<evmc::bytes32, Entries::iterator> by_hash_;
    boost::mutex mtx_;

    uint64_t hit_count_{0};
    uint64_t miss_count_{0};
    uint64_t expired_count_{0};
    uint64_t eviction_count_{0};
};

} // namespace blockquery

#endif // BLOCKQUERY_COMMON_BLOCK_CACHE_HPP_
