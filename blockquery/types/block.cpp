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

#include "block.hpp"

#include <silkworm/common/util.hpp>

#include <blockquery/common/util.hpp>

namespace blockquery {

std::ostream& operator<<(std::ostream& out, const BlockRecord& r) {
    out << "number: " << r.number;
    out << " hash: " << to_hex_hash(r.hash);
    out << " parent_hash: " << to_hex_hash(r.parent_hash);
    out << " timestamp: " << r.timestamp;
    out << " #transactions: " << r.transactions.size();
    out << " state_root: " << (r.state_root ? to_hex_hash(*r.state_root) : "null");
    out << " extrinsics_root: " << (r.extrinsics_root ? to_hex_hash(*r.extrinsics_root) : "null");
    out << " extrinsic_count: " << r.extrinsic_count;
    out << " event_count: ";
    if (r.event_count) {
        out << *r.event_count;
    } else {
        out << "null";
    }
    out << " is_finalized: " << r.is_finalized;
    return out;
}

std::ostream& operator<<(std::ostream& out, const ExtrinsicRecord& r) {
    out << "index: " << r.index;
    out << " hash: " << to_hex_hash(r.hash);
    out << " signed: " << r.is_signed;
    out << " signer: " << (r.signer ? silkworm::to_hex(*r.signer, true) : "null");
    out << " pallet: " << r.pallet;
    out << " call: " << r.call;
    out << " success: " << r.success;
    return out;
}

std::ostream& operator<<(std::ostream& out, const EventRecord& r) {
    out << "index: " << r.index;
    out << " extrinsic_index: ";
    if (r.extrinsic_index) {
        out << *r.extrinsic_index;
    } else {
        out << "null";
    }
    out << " pallet: " << r.pallet;
    out << " event: " << r.event;
    return out;
}

std::ostream& operator<<(std::ostream& out, const DetailedBlockRecord& r) {
    out << r.basic;
    out << " #extrinsics: " << r.extrinsics.size();
    out << " #events: " << r.events.size();
    return out;
}

} // namespace blockquery
