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

#ifndef BLOCKQUERY_TYPES_ERROR_HPP_
#define BLOCKQUERY_TYPES_ERROR_HPP_

#include <string>
#include <system_error>

namespace blockquery {

enum class BlockError {
    // value 0 reserved for no error
    connection = 100,
    not_found,
    too_far,
    invalid_input,
    cancelled,
    inconsistent_chain,
};

std::error_code make_error_code(BlockError errc);

//! Build the exception thrown by query operations for the given error kind.
std::system_error make_block_error(BlockError errc, const std::string& what);

} // namespace blockquery

namespace std {

template<>
struct is_error_code_enum<blockquery::BlockError> : true_type {};

} // namespace std

#endif // BLOCKQUERY_TYPES_ERROR_HPP_
