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

#include "timestamp.hpp"

#include <chrono>

#include <catch2/catch.hpp>

#include <silkworm/common/util.hpp>

#include <blockquery/common/log.hpp>
#include <blockquery/test/chain_fixture.hpp>

namespace blockquery::core {

TEST_CASE("decode_compact_u64", "[blockquery][core][timestamp]") {
    SECTION("single byte mode") {
        CHECK(decode_compact_u64(*silkworm::from_hex("00")) == 0);
        CHECK(decode_compact_u64(*silkworm::from_hex("04")) == 1);
        CHECK(decode_compact_u64(*silkworm::from_hex("fc")) == 63);
    }

    SECTION("two byte mode") {
        CHECK(decode_compact_u64(*silkworm::from_hex("0101")) == 64);
        CHECK(decode_compact_u64(*silkworm::from_hex("fdff")) == 16383);
    }

    SECTION("four byte mode") {
        CHECK(decode_compact_u64(*silkworm::from_hex("02000100")) == 16384);
        CHECK(decode_compact_u64(*silkworm::from_hex("feffffff")) == 1073741823);
    }

    SECTION("big integer mode") {
        CHECK(decode_compact_u64(*silkworm::from_hex("0300000040")) == 1073741824);
        CHECK(decode_compact_u64(test::kTimestampSetArgs) == 1'700'000'000'000);
        CHECK(decode_compact_u64(*silkworm::from_hex("13ffffffffffffffff")) == 0xffffffffffffffff);
    }

    SECTION("malformed") {
        CHECK(!decode_compact_u64({}));
        CHECK(!decode_compact_u64(*silkworm::from_hex("01")));
        CHECK(!decode_compact_u64(*silkworm::from_hex("020001")));
        CHECK(!decode_compact_u64(*silkworm::from_hex("0b0068e5cf8b")));
    }

    SECTION("wider than 64 bits") {
        CHECK(!decode_compact_u64(*silkworm::from_hex("17ffffffffffffffffff")));
    }
}

TEST_CASE("InherentTimestampExtractor::extract", "[blockquery][core][timestamp]") {
    BLOCKQUERY_LOG_STREAMS(null_stream(), null_stream());
    InherentTimestampExtractor extractor;
    const auto block = test::make_block(7);
    const auto wall_clock = []() {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
    };

    SECTION("timestamp inherent") {
        auto timestamp = test::make_timestamp_extrinsic().extrinsic;
        CHECK(extractor.extract(block, {test::make_transfer_extrinsic(1).extrinsic, timestamp}) == test::kTimestampSeconds);
    }

    SECTION("no inherent") {
        const auto before = wall_clock();
        const auto timestamp = extractor.extract(block, {test::make_transfer_extrinsic(1).extrinsic});
        CHECK(timestamp >= before);
        CHECK(timestamp <= wall_clock());
    }

    SECTION("malformed inherent") {
        auto timestamp = test::make_timestamp_extrinsic().extrinsic;
        timestamp.call_args = silkworm::Bytes{0x01};
        const auto before = wall_clock();
        CHECK(extractor.extract(block, {timestamp}) >= before);
    }
}

} // namespace blockquery::core
