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

#include "error.hpp"

#include <string>

namespace blockquery {

namespace {

struct BlockErrorCategory : std::error_category {
    const char* name() const noexcept override;
    std::string message(int ev) const override;
};

const char* BlockErrorCategory::name() const noexcept { return "block"; }

std::string BlockErrorCategory::message(int ev) const {
    switch (static_cast<BlockError>(ev)) {
        case BlockError::connection:
            return "chain client call failed";
        case BlockError::not_found:
            return "block not found";
        case BlockError::too_far:
            return "block too far from head, use lookup by hash";
        case BlockError::invalid_input:
            return "invalid input";
        case BlockError::cancelled:
            return "operation cancelled";
        case BlockError::inconsistent_chain:
            return "inconsistent chain ancestry";
    }
    return "unknown block error";
}

const BlockErrorCategory block_error_category{};

} // namespace

std::error_code make_error_code(BlockError errc) {
    return {static_cast<int>(errc), block_error_category};
}

std::system_error make_block_error(BlockError errc, const std::string& what) {
    return std::system_error{make_error_code(errc), what};
}

} // namespace blockquery
