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

#ifndef BLOCKQUERY_COMMON_UTIL_HPP_
#define BLOCKQUERY_COMMON_UTIL_HPP_

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <silkworm/common/base.hpp>
#include <silkworm/common/util.hpp>

namespace blockquery {

//! Content hash of a raw extrinsic (blake2b with 32-byte digest), the extrinsic id on Substrate chains.
evmc::bytes32 hash_of(silkworm::ByteView bytes);

//! Decode a 32-byte identifier from hex, accepting an optional 0x prefix.
//! Returns std::nullopt for any other length or for non-hex content.
std::optional<evmc::bytes32> parse_hash32(std::string_view hex);

//! Hex form with 0x prefix, as identifiers are displayed to callers.
std::string to_hex_hash(const evmc::bytes32& hash);

inline silkworm::ByteView full_view(const evmc::bytes32& hash) {
    return {hash.bytes, silkworm::kHashLength};
}

} // namespace blockquery

namespace evmc {

inline std::ostream& operator<<(std::ostream& out, const bytes32& b32) {
    out << blockquery::to_hex_hash(b32);
    return out;
}

} // namespace evmc

#endif // BLOCKQUERY_COMMON_UTIL_HPP_
