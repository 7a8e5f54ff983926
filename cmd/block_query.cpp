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

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <future>
#include <iostream>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/flags/usage_config.h>
#include <absl/strings/match.h>
#include <absl/strings/string_view.h>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>
#include <nlohmann/json.hpp>

#include <blockquery/chain/memory_client.hpp>
#include <blockquery/common/block_cache.hpp>
#include <blockquery/common/constants.hpp>
#include <blockquery/common/log.hpp>
#include <blockquery/common/util.hpp>
#include <blockquery/core/block_resolver.hpp>
#include <blockquery/json/types.hpp>

using std::chrono::duration_cast;
using std::chrono::seconds;

ABSL_FLAG(std::string, snapshot, blockquery::kEmptySnapshot, "chain snapshot path as JSON file");
ABSL_FLAG(int64_t, number, -1, "block number to query as 64-bit integer");
ABSL_FLAG(std::string, hash, blockquery::kEmptyBlockHash, "block hash to query as 32-byte hex string");
ABSL_FLAG(bool, detailed, false, "flag indicating if extrinsics and events must be included (requires --number)");
ABSL_FLAG(uint32_t, repeat, 1, "number of query repetitions as 32-bit integer");
ABSL_FLAG(uint32_t, timeout, blockquery::kDefaultTimeout.count(), "query timeout in msecs as 32-bit integer, checked before every parent hop");
ABSL_FLAG(uint32_t, block_ttl_finalized, duration_cast<seconds>(blockquery::kDefaultBlockTtlFinalized).count(), "cache TTL in secs for finalized blocks");
ABSL_FLAG(uint32_t, block_ttl_recent, duration_cast<seconds>(blockquery::kDefaultBlockTtlRecent).count(), "cache TTL in secs for recent blocks");
ABSL_FLAG(uint64_t, max_entries, blockquery::kDefaultMaxEntries, "max number of cached blocks as 64-bit integer");
ABSL_FLAG(uint64_t, max_traverse_depth, blockquery::kMaxTraverseDepth, "max parent hops when querying by number");
ABSL_FLAG(uint64_t, finality_depth, blockquery::kFinalityDepth, "depth behind head after which a block is considered finalized");
ABSL_FLAG(blockquery::LogLevel, logLevel, blockquery::LogLevel::Critical, "logging level");

boost::asio::awaitable<nlohmann::json> query_block(blockquery::core::BlockResolver& resolver, std::optional<uint64_t> number,
    std::string hash, bool detailed, std::stop_token stop) {
    nlohmann::json output;
    if (number && detailed) {
        output = co_await resolver.get_detailed_block(*number, stop);
    } else if (number) {
        output = co_await resolver.get_block_by_number(*number, stop);
    } else {
        output = co_await resolver.get_block_by_hash(hash, stop);
    }
    co_return output;
}

int main(int argc, char* argv[]) {
    absl::FlagsUsageConfig config;
    config.contains_helpshort_flags = [](absl::string_view) { return false; };
    config.contains_help_flags = [](absl::string_view filename) { return absl::EndsWith(filename, "block_query.cpp"); };
    config.contains_helppackage_flags = [](absl::string_view) { return false; };
    config.normalize_filename = [](absl::string_view f) { return std::string{f.substr(f.rfind("/") + 1)}; };
    config.version_string = []() { return "block_query 0.1.0\n"; };
    absl::SetFlagsUsageConfig(config);
    absl::SetProgramUsageMessage("Query blocks by number or hash from a chain snapshot through the block cache");
    absl::ParseCommandLine(argc, argv);

    BLOCKQUERY_LOG_VERBOSITY(absl::GetFlag(FLAGS_logLevel));

    try {
        auto snapshot{absl::GetFlag(FLAGS_snapshot)};
        if (snapshot.empty() || !std::filesystem::exists(snapshot)) {
            BLOCKQUERY_ERROR << "Parameter snapshot is invalid: [" << snapshot << "]\n";
            BLOCKQUERY_ERROR << "Use --snapshot flag to specify the path of the chain snapshot file\n";
            return -1;
        }

        auto number{absl::GetFlag(FLAGS_number)};
        auto hash{absl::GetFlag(FLAGS_hash)};
        if ((number < 0) == hash.empty()) {
            BLOCKQUERY_ERROR << "Parameters number and hash are invalid: [" << number << ", " << hash << "]\n";
            BLOCKQUERY_ERROR << "Use either --number or --hash flag to specify the block to query\n";
            return -1;
        }

        auto detailed{absl::GetFlag(FLAGS_detailed)};
        if (detailed && number < 0) {
            BLOCKQUERY_ERROR << "Parameter detailed is invalid without number\n";
            BLOCKQUERY_ERROR << "Use --number flag to specify the block to query in detail\n";
            return -1;
        }

        auto repeat{absl::GetFlag(FLAGS_repeat)};
        if (repeat == 0) {
            BLOCKQUERY_ERROR << "Parameter repeat is invalid: [" << repeat << "]\n";
            BLOCKQUERY_ERROR << "Use --repeat flag to specify the number of query repetitions\n";
            return -1;
        }

        auto timeout{absl::GetFlag(FLAGS_timeout)};
        if (timeout == 0) {
            BLOCKQUERY_ERROR << "Parameter timeout is invalid: [" << timeout << "]\n";
            BLOCKQUERY_ERROR << "Use --timeout flag to specify the query timeout in msecs\n";
            return -1;
        }

        auto max_entries{absl::GetFlag(FLAGS_max_entries)};
        if (max_entries == 0) {
            BLOCKQUERY_ERROR << "Parameter max_entries is invalid: [" << max_entries << "]\n";
            BLOCKQUERY_ERROR << "Use --max_entries flag to specify the block cache capacity\n";
            return -1;
        }

        const auto cache_config = blockquery::CacheConfig{}
            .with_block_ttl_finalized(seconds{absl::GetFlag(FLAGS_block_ttl_finalized)})
            .with_block_ttl_recent(seconds{absl::GetFlag(FLAGS_block_ttl_recent)})
            .with_max_entries(max_entries);
        const blockquery::core::ResolverConfig resolver_config{absl::GetFlag(FLAGS_max_traverse_depth), absl::GetFlag(FLAGS_finality_depth)};

        blockquery::chain::InMemoryChainClient client;
        client.load_file(snapshot);
        BLOCKQUERY_LOG << "block_query loaded snapshot " << snapshot << " with " << client.size() << " blocks\n";

        blockquery::BlockCache cache{cache_config};
        blockquery::core::BlockResolver resolver{client, cache, resolver_config};

        const auto block_number = number < 0 ? std::nullopt : std::make_optional(static_cast<uint64_t>(number));

        // Queries run on a worker thread so that the timeout can request a stop while the resolver is traversing
        boost::asio::thread_pool worker_pool{1};
        int exit_code{0};
        for (uint32_t i{0}; i < repeat && exit_code == 0; ++i) {
            std::stop_source stop_source;
            const auto start = std::chrono::steady_clock::now();
            auto result = boost::asio::co_spawn(worker_pool, query_block(resolver, block_number, hash, detailed, stop_source.get_token()),
                boost::asio::use_future);
            if (result.wait_for(std::chrono::milliseconds{timeout}) == std::future_status::timeout) {
                BLOCKQUERY_WARN << "query timeout expired after " << timeout << "ms\n";
                stop_source.request_stop();
            }
            try {
                const auto output = result.get();
                std::cout << output.dump(4) << "\n";
            } catch (const std::system_error& e) {
                BLOCKQUERY_ERROR << "Query failed: " << e.code().message() << ": " << e.what() << "\n";
                std::cerr << "error: " << e.what() << "\n";
                exit_code = -1;
            }
            const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
            BLOCKQUERY_INFO << "query #" << i << " completed in " << elapsed.count() << "us cached=" << cache.size() << "\n";
        }
        worker_pool.join();
        return exit_code;
    } catch (const std::exception& e) {
        BLOCKQUERY_CRIT << "Exception: " << e.what() << "\n" << std::flush;
        std::cerr << "Exception: " << e.what() << "\n";
    }
    return -1;
}
