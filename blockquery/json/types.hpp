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

#ifndef BLOCKQUERY_JSON_TYPES_HPP_
#define BLOCKQUERY_JSON_TYPES_HPP_

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <blockquery/types/block.hpp>

namespace evmc {

void to_json(nlohmann::json& json, const bytes32& b32);
void from_json(const nlohmann::json& json, bytes32& b32);

} // namespace evmc

namespace blockquery {

// Fields added after the first record format (state_root, extrinsics_root, extrinsic_count,
// event_count, is_finalized) are optional on input and take their default values when missing.
void to_json(nlohmann::json& json, const BlockRecord& record);
void from_json(const nlohmann::json& json, BlockRecord& record);

void to_json(nlohmann::json& json, const ExtrinsicRecord& record);
void from_json(const nlohmann::json& json, ExtrinsicRecord& record);

void to_json(nlohmann::json& json, const EventRecord& record);
void from_json(const nlohmann::json& json, EventRecord& record);

void to_json(nlohmann::json& json, const DetailedBlockRecord& record);
void from_json(const nlohmann::json& json, DetailedBlockRecord& record);

} // namespace blockquery

#endif  // BLOCKQUERY_JSON_TYPES_HPP_
