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

#include <silkworm/common/util.hpp>

#include <blockquery/common/util.hpp>

namespace evmc {

void to_json(nlohmann::json& json, const bytes32& b32) {
    json = blockquery::to_hex_hash(b32);
}

void from_json(const nlohmann::json& json, bytes32& b32) {
    const auto hex = json.get<std::string>();
    const auto parsed = blockquery::parse_hash32(hex);
    if (!parsed) {
        throw std::invalid_argument{"invalid 32-byte hash: " + hex};
    }
    b32 = *parsed;
}

} // namespace evmc

namespace blockquery {

namespace {

template <typename T>
std::optional<T> optional_field(const nlohmann::json& json, const char* name) {
    if (json.count(name) == 0 || json.at(name).is_null()) {
        return std::nullopt;
    }
    return json.at(name).get<T>();
}

template <typename T>
nlohmann::json optional_value(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

} // namespace

void to_json(nlohmann::json& json, const BlockRecord& record) {
    json["number"] = record.number;
    json["hash"] = record.hash;
    json["parent_hash"] = record.parent_hash;
    json["timestamp"] = record.timestamp;
    json["transactions"] = record.transactions;
    json["state_root"] = optional_value(record.state_root);
    json["extrinsics_root"] = optional_value(record.extrinsics_root);
    json["extrinsic_count"] = record.extrinsic_count;
    json["event_count"] = optional_value(record.event_count);
    json["is_finalized"] = record.is_finalized;
}

void from_json(const nlohmann::json& json, BlockRecord& record) {
    record.number = json.at("number").get<uint64_t>();
    record.hash = json.at("hash").get<evmc::bytes32>();
    record.parent_hash = json.at("parent_hash").get<evmc::bytes32>();
    record.timestamp = json.at("timestamp").get<uint64_t>();
    record.transactions = json.at("transactions").get<std::vector<evmc::bytes32>>();
    record.state_root = optional_field<evmc::bytes32>(json, "state_root");
    record.extrinsics_root = optional_field<evmc::bytes32>(json, "extrinsics_root");
    record.extrinsic_count = optional_field<uint32_t>(json, "extrinsic_count").value_or(0);
    record.event_count = optional_field<uint32_t>(json, "event_count");
    record.is_finalized = optional_field<bool>(json, "is_finalized").value_or(false);
}

void to_json(nlohmann::json& json, const ExtrinsicRecord& record) {
    json["index"] = record.index;
    json["hash"] = record.hash;
    json["signed"] = record.is_signed;
    if (record.signer) {
        json["signer"] = silkworm::to_hex(*record.signer, /*with_prefix=*/true);
    } else {
        json["signer"] = nullptr;
    }
    json["pallet"] = record.pallet;
    json["call"] = record.call;
    json["success"] = record.success;
}

void from_json(const nlohmann::json& json, ExtrinsicRecord& record) {
    record.index = json.at("index").get<uint32_t>();
    record.hash = json.at("hash").get<evmc::bytes32>();
    record.is_signed = json.at("signed").get<bool>();
    const auto signer_hex = optional_field<std::string>(json, "signer");
    if (signer_hex) {
        const auto signer = silkworm::from_hex(*signer_hex);
        if (!signer) {
            throw std::invalid_argument{"invalid signer: " + *signer_hex};
        }
        record.signer = *signer;
    } else {
        record.signer = std::nullopt;
    }
    record.pallet = json.at("pallet").get<std::string>();
    record.call = json.at("call").get<std::string>();
    record.success = json.at("success").get<bool>();
}

void to_json(nlohmann::json& json, const EventRecord& record) {
    json["index"] = record.index;
    json["extrinsic_index"] = optional_value(record.extrinsic_index);
    json["pallet"] = record.pallet;
    json["event"] = record.event;
}

void from_json(const nlohmann::json& json, EventRecord& record) {
    record.index = json.at("index").get<uint32_t>();
    record.extrinsic_index = optional_field<uint32_t>(json, "extrinsic_index");
    record.pallet = json.at("pallet").get<std::string>();
    record.event = json.at("event").get<std::string>();
}

void to_json(nlohmann::json& json, const DetailedBlockRecord& record) {
    json["basic"] = record.basic;
    json["extrinsics"] = record.extrinsics;
    json["events"] = record.events;
}

void from_json(const nlohmann::json& json, DetailedBlockRecord& record) {
    record.basic = json.at("basic").get<BlockRecord>();
    record.extrinsics = json.at("extrinsics").get<std::vector<ExtrinsicRecord>>();
    record.events = json.at("events").get<std::vector<EventRecord>>();
}

} // namespace blockquery
