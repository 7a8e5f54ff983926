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

#include "memory_client.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <silkworm/common/util.hpp>

#include <blockquery/common/log.hpp>
#include <blockquery/common/util.hpp>
#include <blockquery/json/types.hpp>

namespace blockquery::chain {

namespace {

silkworm::Bytes bytes_field(const nlohmann::json& json, const char* name) {
    if (json.count(name) == 0 || json.at(name).is_null()) {
        return {};
    }
    const auto hex = json.at(name).get<std::string>();
    const auto bytes = silkworm::from_hex(hex);
    if (!bytes) {
        throw std::invalid_argument{std::string{"invalid hex in snapshot field "} + name + ": " + hex};
    }
    return *bytes;
}

std::optional<evmc::bytes32> hash_field(const nlohmann::json& json, const char* name) {
    if (json.count(name) == 0 || json.at(name).is_null()) {
        return std::nullopt;
    }
    return json.at(name).get<evmc::bytes32>();
}

} // namespace

void InMemoryChainClient::load(const nlohmann::json& snapshot) {
    for (const auto& json_block : snapshot.at("blocks")) {
        BlockHandle block;
        block.number = json_block.at("number").get<uint64_t>();
        block.hash = json_block.at("hash").get<evmc::bytes32>();
        block.parent_hash = json_block.at("parent_hash").get<evmc::bytes32>();
        block.state_root = hash_field(json_block, "state_root");
        block.extrinsics_root = hash_field(json_block, "extrinsics_root");

        std::vector<StoredExtrinsic> extrinsics;
        if (json_block.count("extrinsics") != 0) {
            for (const auto& json_extrinsic : json_block.at("extrinsics")) {
                StoredExtrinsic stored;
                stored.extrinsic.bytes = bytes_field(json_extrinsic, "bytes");
                if (json_extrinsic.count("signer") != 0 && !json_extrinsic.at("signer").is_null()) {
                    stored.extrinsic.is_signed = true;
                    stored.extrinsic.signer = bytes_field(json_extrinsic, "signer");
                }
                stored.extrinsic.pallet = json_extrinsic.at("pallet").get<std::string>();
                stored.extrinsic.call = json_extrinsic.at("call").get<std::string>();
                stored.extrinsic.call_args = bytes_field(json_extrinsic, "args");
                if (json_extrinsic.count("events") != 0) {
                    for (const auto& json_event : json_extrinsic.at("events")) {
                        stored.events.push_back({json_event.at("pallet").get<std::string>(), json_event.at("event").get<std::string>()});
                    }
                }
                extrinsics.push_back(std::move(stored));
            }
        }
        add_block(block, std::move(extrinsics));
    }
    if (snapshot.count("head") != 0 && !snapshot.at("head").is_null()) {
        set_head(snapshot.at("head").get<evmc::bytes32>());
    }
    BLOCKQUERY_DEBUG << "InMemoryChainClient::load #blocks=" << blocks_.size() << "\n";
}

void InMemoryChainClient::load_file(const std::filesystem::path& snapshot_file) {
    std::ifstream input{snapshot_file};
    if (!input) {
        throw std::invalid_argument{"cannot open snapshot file: " + snapshot_file.string()};
    }
    load(nlohmann::json::parse(input));
}

void InMemoryChainClient::add_block(const BlockHandle& block, std::vector<StoredExtrinsic> extrinsics) {
    for (std::size_t i{0}; i < extrinsics.size(); ++i) {
        extrinsics[i].extrinsic.block_hash = block.hash;
        extrinsics[i].extrinsic.index = static_cast<uint32_t>(i);
    }
    blocks_.insert_or_assign(block.hash, StoredBlock{block, std::move(extrinsics)});
    if (!explicit_head_ && (!head_hash_ || blocks_.at(*head_hash_).block.number < block.number)) {
        head_hash_ = block.hash;
    }
}

void InMemoryChainClient::set_head(const evmc::bytes32& hash) {
    if (blocks_.find(hash) == blocks_.end()) {
        throw std::invalid_argument{"unknown head block: " + to_hex_hash(hash)};
    }
    head_hash_ = hash;
    explicit_head_ = true;
}

const InMemoryChainClient::StoredBlock& InMemoryChainClient::stored_block(const evmc::bytes32& hash) const {
    const auto it = blocks_.find(hash);
    if (it == blocks_.end()) {
        throw std::runtime_error{"unknown block: " + to_hex_hash(hash)};
    }
    return it->second;
}

boost::asio::awaitable<BlockHandle> InMemoryChainClient::head() {
    ++head_calls_;
    if (!head_hash_) {
        throw std::runtime_error{"empty chain snapshot"};
    }
    co_return stored_block(*head_hash_).block;
}

boost::asio::awaitable<std::optional<BlockHandle>> InMemoryChainClient::block_at(const evmc::bytes32& hash) {
    ++block_at_calls_;
    const auto it = blocks_.find(hash);
    if (it == blocks_.end()) {
        co_return std::nullopt;
    }
    co_return it->second.block;
}

boost::asio::awaitable<std::vector<ExtrinsicHandle>> InMemoryChainClient::extrinsics(const BlockHandle& block) {
    const auto& stored = stored_block(block.hash);
    std::vector<ExtrinsicHandle> extrinsics;
    extrinsics.reserve(stored.extrinsics.size());
    for (const auto& stored_extrinsic : stored.extrinsics) {
        extrinsics.push_back(stored_extrinsic.extrinsic);
    }
    co_return extrinsics;
}

boost::asio::awaitable<std::vector<EventHandle>> InMemoryChainClient::events(const ExtrinsicHandle& extrinsic) {
    const auto& stored = stored_block(extrinsic.block_hash);
    if (extrinsic.index >= stored.extrinsics.size()) {
        throw std::runtime_error{"unknown extrinsic index " + std::to_string(extrinsic.index) + " in block " + to_hex_hash(extrinsic.block_hash)};
    }
    co_return stored.extrinsics[extrinsic.index].events;
}

} // namespace blockquery::chain
