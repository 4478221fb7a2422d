/*
 *     Copyright 2021 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace txnpurge
{
namespace purge
{
    /**
     * Lifecycle of a transaction record, as stored in the "s" field of the transaction log.
     *
     * The numeric values are the wire codes written by the transaction engine.
     */
    enum class txn_state {
        /**
         * A code this tool does not recognise.  Treated as outstanding, never as completed.
         */
        UNKNOWN = 0,
        PREPARING = 1,
        PREPARED = 2,
        ABORTING = 3,
        APPLYING = 4,
        ABORTED = 5,
        APPLIED = 6,

        /**
         * Not a wire code: the record lives in the stash rather than the log.
         */
        STASHED = 100
    };

    inline const char* txn_state_name(txn_state state)
    {
        switch (state) {
            case txn_state::UNKNOWN:
                return "UNKNOWN";
            case txn_state::PREPARING:
                return "PREPARING";
            case txn_state::PREPARED:
                return "PREPARED";
            case txn_state::ABORTING:
                return "ABORTING";
            case txn_state::APPLYING:
                return "APPLYING";
            case txn_state::ABORTED:
                return "ABORTED";
            case txn_state::APPLIED:
                return "APPLIED";
            case txn_state::STASHED:
                return "STASHED";
            default:
                throw std::runtime_error("unknown txn state");
        }
    }

    inline txn_state txn_state_value(int code)
    {
        switch (code) {
            case 1:
                return txn_state::PREPARING;
            case 2:
                return txn_state::PREPARED;
            case 3:
                return txn_state::ABORTING;
            case 4:
                return txn_state::APPLYING;
            case 5:
                return txn_state::ABORTED;
            case 6:
                return txn_state::APPLIED;
            default:
                return txn_state::UNKNOWN;
        }
    }

    // aborted or applied: nothing will touch the record again
    inline bool is_terminal(txn_state state)
    {
        return state == txn_state::ABORTED || state == txn_state::APPLIED;
    }

    /**
     * @brief Extract the transaction ID from a queue token.
     *
     * Tokens look like "<txn-id>_<nonce>".  A token without a nonce is taken to be a bare ID.
     */
    std::string txn_id_from_token(const std::string& token);
} // namespace purge
} // namespace txnpurge
