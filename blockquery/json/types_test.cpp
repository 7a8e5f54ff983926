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

#include "types.hpp"

#include <stdexcept>
#include <string>

#include <catch2/catch.hpp>
#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>
#include <silkworm/common/util.hpp>

namespace blockquery {

using evmc::literals::operator""_bytes32;

static const BlockRecord kFullRecord{
    12345678,
    0x1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef_bytes32,
    0xabcdef1234567890abcdef1234567890abcdef1234567890abcdef1234567890_bytes32,
    1704067200,
    {0x0000000000000000000000000000000000000000000000000000000000000111_bytes32,
     0x0000000000000000000000000000000000000000000000000000000000000222_bytes32},
    0xfedcba9876543210fedcba9876543210fedcba9876543210fedcba9876543210_bytes32,
    0x9876543210fedcba9876543210fedcba9876543210fedcba9876543210fedcba_bytes32,
    2,
    6,
    true};

TEST_CASE("serialize empty bytes32", "[blockquery][to_json]") {
    evmc::bytes32 b32{};
    nlohmann::json j = b32;
    CHECK(j == R"("0x0000000000000000000000000000000000000000000000000000000000000000")"_json);
}

TEST_CASE("deserialize bytes32", "[blockquery][from_json]") {
    SECTION("with prefix") {
        auto j = R"("0x374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c")"_json;
        CHECK(j.get<evmc::bytes32>() == 0x374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c_bytes32);
    }
    SECTION("without prefix") {
        auto j = R"("374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c")"_json;
        CHECK(j.get<evmc::bytes32>() == 0x374f3a049e006f36f6cf91b02a3b0ee16c858af2f75858733eb0e927b5b7126c_bytes32);
    }
    SECTION("malformed") {
        auto j = R"("0x111")"_json;
        CHECK_THROWS_AS(j.get<evmc::bytes32>(), std::invalid_argument);
    }
}

TEST_CASE("serialize block record", "[blockquery][to_json]") {
    nlohmann::json j = kFullRecord;
    CHECK(j == R"({
        "number":12345678,
        "hash":"0x1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef",
        "parent_hash":"0xabcdef1234567890abcdef1234567890abcdef1234567890abcdef1234567890",
        "timestamp":1704067200,
        "transactions":[
            "0x0000000000000000000000000000000000000000000000000000000000000111",
            "0x0000000000000000000000000000000000000000000000000000000000000222"
        ],
        "state_root":"0xfedcba9876543210fedcba9876543210fedcba9876543210fedcba9876543210",
        "extrinsics_root":"0x9876543210fedcba9876543210fedcba9876543210fedcba9876543210fedcba",
        "extrinsic_count":2,
        "event_count":6,
        "is_finalized":true
    })"_json);
}

TEST_CASE("serialize block record with absent fields", "[blockquery][to_json]") {
    BlockRecord record{kFullRecord};
    record.transactions.clear();
    record.state_root = std::nullopt;
    record.extrinsics_root = std::nullopt;
    record.extrinsic_count = 0;
    record.event_count = std::nullopt;
    record.is_finalized = false;
    nlohmann::json j = record;
    CHECK(j["state_root"].is_null());
    CHECK(j["extrinsics_root"].is_null());
    CHECK(j["event_count"].is_null());
    CHECK(j["extrinsic_count"] == 0);
    CHECK(j["is_finalized"] == false);
    CHECK(j["transactions"].empty());
}

TEST_CASE("block record round trip", "[blockquery][json]") {
    SECTION("all fields populated") {
        const nlohmann::json j = kFullRecord;
        CHECK(j.get<BlockRecord>() == kFullRecord);
    }

    SECTION("through text") {
        const auto text = nlohmann::json(kFullRecord).dump();
        CHECK(text.find("12345678") != std::string::npos);
        CHECK(text.find("1704067200") != std::string::npos);
        CHECK(nlohmann::json::parse(text).get<BlockRecord>() == kFullRecord);
    }

    SECTION("mismatched transaction count is preserved") {
        BlockRecord record{kFullRecord};
        record.extrinsic_count = 5;
        const nlohmann::json j = record;
        const auto decoded = j.get<BlockRecord>();
        CHECK(decoded.extrinsic_count == 5);
        CHECK(decoded.transactions.size() == 2);
    }
}

TEST_CASE("deserialize block record without post-hoc fields", "[blockquery][from_json]") {
    const auto j = R"({
        "number": 12345678,
        "hash": "0x1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef",
        "parent_hash": "0xabcdef1234567890abcdef1234567890abcdef1234567890abcdef1234567890",
        "timestamp": 1704067200,
        "transactions": []
    })"_json;
    const auto record = j.get<BlockRecord>();
    CHECK(record.number == 12345678);
    CHECK(record.hash == 0x1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef_bytes32);
    CHECK(record.timestamp == 1704067200);
    CHECK(record.state_root == std::nullopt);
    CHECK(record.extrinsics_root == std::nullopt);
    CHECK(record.extrinsic_count == 0);
    CHECK(record.event_count == std::nullopt);
    CHECK(!record.is_finalized);
}

TEST_CASE("deserialize block record with null optional fields", "[blockquery][from_json]") {
    const auto j = R"({
        "number": 1,
        "hash": "0x1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef",
        "parent_hash": "0xabcdef1234567890abcdef1234567890abcdef1234567890abcdef1234567890",
        "timestamp": 0,
        "transactions": [],
        "state_root": null,
        "event_count": null,
        "is_finalized": null
    })"_json;
    const auto record = j.get<BlockRecord>();
    CHECK(!record.state_root);
    CHECK(!record.event_count);
    CHECK(!record.is_finalized);
}

TEST_CASE("deserialize block record missing mandatory field", "[blockquery][from_json]") {
    const auto j = R"({
        "number": 1,
        "parent_hash": "0xabcdef1234567890abcdef1234567890abcdef1234567890abcdef1234567890",
        "timestamp": 0,
        "transactions": []
    })"_json;
    CHECK_THROWS_AS(j.get<BlockRecord>(), nlohmann::json::out_of_range);
}

TEST_CASE("serialize extrinsic record", "[blockquery][to_json]") {
    SECTION("unsigned") {
        ExtrinsicRecord record{0, 0x1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef_bytes32,
                               false, std::nullopt, "Timestamp", "set", true};
        nlohmann::json j = record;
        CHECK(j == R"({
            "index":0,
            "hash":"0x1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef",
            "signed":false,
            "signer":null,
            "pallet":"Timestamp",
            "call":"set",
            "success":true
        })"_json);
        CHECK(j.get<ExtrinsicRecord>() == record);
    }

    SECTION("signed") {
        ExtrinsicRecord record{1, 0x1234567890abcdef1234567890abcdef1234567890abcdef1234567890abcdef_bytes32,
                               true, *silkworm::from_hex("d43593c715fdd31c61141abd04a99fd6"), "Balances", "transfer", false};
        nlohmann::json j = record;
        CHECK(j["signer"] == "0xd43593c715fdd31c61141abd04a99fd6");
        CHECK(j.get<ExtrinsicRecord>() == record);
    }
}

TEST_CASE("serialize event record", "[blockquery][to_json]") {
    EventRecord block_event{3, std::nullopt, "System", "NewAccount"};
    nlohmann::json j1 = block_event;
    CHECK(j1 == R"({"index":3,"extrinsic_index":null,"pallet":"System","event":"NewAccount"})"_json);
    CHECK(j1.get<EventRecord>() == block_event);

    EventRecord extrinsic_event{4, 1, "System", "ExtrinsicSuccess"};
    nlohmann::json j2 = extrinsic_event;
    CHECK(j2 == R"({"index":4,"extrinsic_index":1,"pallet":"System","event":"ExtrinsicSuccess"})"_json);
    CHECK(j2.get<EventRecord>() == extrinsic_event);
}

TEST_CASE("detailed block record round trip", "[blockquery][json]") {
    DetailedBlockRecord detailed{
        kFullRecord,
        {ExtrinsicRecord{0, kFullRecord.transactions[0], false, std::nullopt, "Timestamp", "set", true},
         ExtrinsicRecord{1, kFullRecord.transactions[1], true, *silkworm::from_hex("0x01"), "Balances", "transfer", false}},
        {EventRecord{0, 0, "System", "ExtrinsicSuccess"},
         EventRecord{1, 1, "System", "ExtrinsicFailed"}}};
    const nlohmann::json j = detailed;
    CHECK(j.contains("basic"));
    CHECK(j["extrinsics"].size() == 2);
    CHECK(j["events"].size() == 2);
    CHECK(j.get<DetailedBlockRecord>() == detailed);
}

} // namespace blockquery
