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

#include <txnpurge/purge/database.hxx>
#include <txnpurge/purge/purge_config.hxx>
#include <txnpurge/purge/txn_state.hxx>
#include <txnpurge/support.hxx>

#include <boost/optional.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>

namespace txnpurge
{
namespace purge
{
    /**
     * @brief The transactions known to the system when a run starts.
     *
     * Holds the ID and state of every record in the transaction log, plus the ID of every
     * record in the stash.  A queue entry whose transaction is not in here is orphaned.
     *
     * Built once per run and never refreshed: the log is pruned later in the run, and a
     * rebuilt index would classify entries differently from the stages that already ran.
     */
    class known_transactions
    {
      public:
        /**
         * @brief Scan the log and the stash.
         *
         * @throws purge_error with FAIL_READ if the log does not exist, or if either scan fails.
         *         A partial index is never returned, since it would report live transactions as
         *         orphaned.  A missing stash just means nothing is stashed.
         */
        static known_transactions build(database& db, const purge_config& config);

        known_transactions() = default;

        /**
         * Mostly for tests: an index over records already in hand.  Stash IDs that also appear
         * in the log keep their log state.
         */
        known_transactions(const std::vector<txn_record>& log, const std::vector<std::string>& stash);

        TXNPURGE_NODISCARD bool contains(const std::string& txn_id) const
        {
            return states_.count(txn_id) > 0;
        }

        TXNPURGE_NODISCARD boost::optional<txn_state> state(const std::string& txn_id) const;

        // known, and fully applied according to the log
        TXNPURGE_NODISCARD bool is_applied(const std::string& txn_id) const;

        // known, and not yet aborted or applied
        TXNPURGE_NODISCARD bool is_outstanding(const std::string& txn_id) const;

        TXNPURGE_NODISCARD size_t size() const
        {
            return states_.size();
        }

        TXNPURGE_NODISCARD size_t stashed() const
        {
            return stashed_;
        }

      private:
        std::unordered_map<std::string, txn_state> states_;
        size_t stashed_{ 0 };

        void add_stashed(const std::string& txn_id);
    };
} // namespace purge
} // namespace txnpurge
