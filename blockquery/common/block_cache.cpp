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

#include "block_cache.hpp"

#include <iterator>
#include <stdexcept>

#include <boost/thread/lock_guard.hpp>

#include <blockquery/common/log.hpp>
#include <blockquery/common/util.hpp>

namespace blockquery {

CacheConfig CacheConfig::with_block_ttl_finalized(std::chrono::milliseconds ttl) const {
    CacheConfig config{*this};
    config.block_ttl_finalized = ttl;
    return config;
}

CacheConfig CacheConfig::with_block_ttl_recent(std::chrono::milliseconds ttl) const {
    CacheConfig config{*this};
    config.block_ttl_recent = ttl;
    return config;
}

CacheConfig CacheConfig::with_max_entries(std::size_t max) const {
    CacheConfig config{*this};
    config.max_entries = max;
    return config;
}

BlockCache::BlockCache(const CacheConfig& config) : config_(config) {
    if (config.max_entries == 0) {
        throw std::invalid_argument{"unexpected zero max_entries"};
    }
    BLOCKQUERY_TRACE << "BlockCache::ctor ttl_finalized=" << config_.block_ttl_finalized.count()
                     << "ms ttl_recent=" << config_.block_ttl_recent.count() << "ms max_entries=" << config_.max_entries << "\n";
}

void BlockCache::put_block(const BlockRecord& record) {
    boost::lock_guard<boost::mutex> lock{mtx_};

    const auto now = Clock::now();

    // Any entry sharing either key is dropped together with its other key
    if (const auto number_it = by_number_.find(record.number); number_it != by_number_.end()) {
        erase(number_it->second);
    }
    if (const auto hash_it = by_hash_.find(record.hash); hash_it != by_hash_.end()) {
        erase(hash_it->second);
    }

    make_room(now);

    const auto ttl = record.is_finalized ? config_.block_ttl_finalized : config_.block_ttl_recent;
    entries_.push_back(CacheEntry{record, now, ttl});
    const auto entry_it = std::prev(entries_.end());
    by_number_.insert_or_assign(record.number, entry_it);
    by_hash_.insert_or_assign(record.hash, entry_it);

    BLOCKQUERY_DEBUG << "BlockCache::put_block number=" << record.number << " hash=" << to_hex_hash(record.hash)
                     << " finalized=" << record.is_finalized << " size=" << entries_.size() << "\n";
}

std::optional<BlockRecord> BlockCache::get_block_by_number(uint64_t number) {
    boost::lock_guard<boost::mutex> lock{mtx_};

    const auto number_it = by_number_.find(number);
    if (number_it == by_number_.end()) {
        ++miss_count_;
        return std::nullopt;
    }
    return lookup(number_it->second, Clock::now());
}

std::optional<BlockRecord> BlockCache::get_block_by_hash(const evmc::bytes32& hash) {
    boost::lock_guard<boost::mutex> lock{mtx_};

    const auto hash_it = by_hash_.find(hash);
    if (hash_it == by_hash_.end()) {
        ++miss_count_;
        return std::nullopt;
    }
    return lookup(hash_it->second, Clock::now());
}

void BlockCache::clear() {
    boost::lock_guard<boost::mutex> lock{mtx_};

    by_number_.clear();
    by_hash_.clear();
    entries_.clear();
    BLOCKQUERY_DEBUG << "BlockCache::clear hits=" << hit_count_ << " misses=" << miss_count_
                     << " expired=" << expired_count_ << " evictions=" << eviction_count_ << "\n";
}

std::size_t BlockCache::size() {
    boost::lock_guard<boost::mutex> lock{mtx_};
    return entries_.size();
}

uint64_t BlockCache::hit_count() {
    boost::lock_guard<boost::mutex> lock{mtx_};
    return hit_count_;
}

uint64_t BlockCache::miss_count() {
    boost::lock_guard<boost::mutex> lock{mtx_};
    return miss_count_;
}

uint64_t BlockCache::expired_count() {
    boost::lock_guard<boost::mutex> lock{mtx_};
    return expired_count_;
}

uint64_t BlockCache::eviction_count() {
    boost::lock_guard<boost::mutex> lock{mtx_};
    return eviction_count_;
}

std::optional<BlockRecord> BlockCache::lookup(Entries::iterator it, Clock::time_point now) {
    if (it->is_expired(now)) {
        BLOCKQUERY_TRACE << "BlockCache::lookup expired number=" << it->record.number << "\n";
        erase(it);
        ++expired_count_;
        ++miss_count_;
        return std::nullopt;
    }
    ++hit_count_;
    return it->record;
}

void BlockCache::erase(Entries::iterator it) {
    by_number_.erase(it->record.number);
    by_hash_.erase(it->record.hash);
    entries_.erase(it);
}

void BlockCache::make_room(Clock::time_point now) {
    if (entries_.size() < config_.max_entries) {
        return;
    }
    // Expired entries go first, whatever their age
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto next = std::next(it);
        if (it->is_expired(now)) {
            erase(it);
            ++eviction_count_;
        }
        it = next;
    }
    // Then the oldest insertions
    while (entries_.size() >= config_.max_entries) {
        BLOCKQUERY_TRACE << "BlockCache::make_room evict number=" << entries_.front().record.number << "\n";
        erase(entries_.begin());
        ++eviction_count_;
    }
}

} // namespace blockquery
