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

#ifndef BLOCKQUERY_COMMON_CONSTANTS_HPP_
#define BLOCKQUERY_COMMON_CONSTANTS_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace blockquery {

using namespace std::chrono_literals; // NOLINT(build/namespaces)

// Maximum number of parent-hash hops performed when resolving a block by number
constexpr uint64_t kMaxTraverseDepth{100};

// Blocks deeper than this behind head are considered finalized (heuristic, not a finality proof)
constexpr uint64_t kFinalityDepth{100};

constexpr std::chrono::milliseconds kDefaultBlockTtlFinalized{3600s};
constexpr std::chrono::milliseconds kDefaultBlockTtlRecent{12s};
constexpr std::size_t kDefaultMaxEntries{10'000};

constexpr std::chrono::milliseconds kDefaultTimeout{10000};

constexpr const char* kEmptySnapshot{""};
constexpr const char* kEmptyBlockHash{""};

constexpr const char* kSystemPallet{"System"};
constexpr const char* kExtrinsicSuccessEvent{"ExtrinsicSuccess"};
constexpr const char* kTimestampPallet{"Timestamp"};
constexpr const char* kTimestampSetCall{"set"};

} // namespace blockquery

#endif  // BLOCKQUERY_COMMON_CONSTANTS_HPP_
