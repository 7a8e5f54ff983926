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

#include "util.hpp"

#include <stdexcept>

#include <sodium.h>

namespace blockquery {

namespace {

struct SodiumInitializer {
    SodiumInitializer() {
        if (sodium_init() < 0) {
            throw std::runtime_error{"cannot initialize libsodium"};
        }
    }
};

} // namespace

evmc::bytes32 hash_of(silkworm::ByteView bytes) {
    static SodiumInitializer sodium_initializer;

    evmc::bytes32 digest;
    if (crypto_generichash(digest.bytes, silkworm::kHashLength, bytes.data(), bytes.length(), nullptr, 0) != 0) {
        throw std::runtime_error{"blake2b-256 hashing failed"};
    }
    return digest;
}

std::optional<evmc::bytes32> parse_hash32(std::string_view hex) {
    if (silkworm::has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    // from_hex would accept an odd number of digits, so the length is checked first
    if (hex.length() != 2 * silkworm::kHashLength) {
        return std::nullopt;
    }
    const auto bytes{silkworm::from_hex(hex)};
    if (!bytes || bytes->length() != silkworm::kHashLength) {
        return std::nullopt;
    }
    return silkworm::to_bytes32(*bytes);
}

std::string to_hex_hash(const evmc::bytes32& hash) {
    return silkworm::to_hex(full_view(hash), /*with_prefix=*/true);
}

} // namespace blockquery
