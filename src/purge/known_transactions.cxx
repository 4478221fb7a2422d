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

#include <txnpurge/logging.hxx>
#include <txnpurge/purge/exceptions.hxx>
#include <txnpurge/purge/known_transactions.hxx>

namespace txnpurge
{
namespace purge
{
    known_transactions::known_transactions(const std::vector<txn_record>& log, const std::vector<std::string>& stash)
    {
        for (const auto& record : log) {
            states_[record.id] = record.state;
        }
        for (const auto& id : stash) {
            add_stashed(id);
        }
    }

    void known_transactions::add_stashed(const std::string& txn_id)
    {
        if (states_.emplace(txn_id, txn_state::STASHED).second) {
            stashed_++;
        }
    }

    known_transactions known_transactions::build(database& db, const purge_config& config)
    {
        // an empty index would make every queue entry look orphaned
        if (!db.has_collection(config.txns_collection())) {
            throw purge_error(FAIL_READ, "transaction log collection " + config.txns_collection() + " does not exist");
        }
        known_transactions known;
        {
            auto log = db.scan_transactions(config.txns_collection());
            txn_record record;
            while (log->next(record)) {
                known.states_[record.id] = record.state;
            }
        }
        purge_log->debug("{} transactions in {}", known.states_.size(), config.txns_collection());
        {
            auto stash = db.scan_transactions(config.stash_collection());
            txn_record record;
            while (stash->next(record)) {
                known.add_stashed(record.id);
            }
        }
        purge_log->debug("{} transactions only in {}", known.stashed_, config.stash_collection());
        return known;
    }

    boost::optional<txn_state> known_transactions::state(const std::string& txn_id) const
    {
        auto it = states_.find(txn_id);
        if (it == states_.end()) {
            return {};
        }
        return it->second;
    }

    bool known_transactions::is_applied(const std::string& txn_id) const
    {
        auto it = states_.find(txn_id);
        return it != states_.end() && it->second == txn_state::APPLIED;
    }

    bool known_transactions::is_outstanding(const std::string& txn_id) const
    {
        auto it = states_.find(txn_id);
        return it != states_.end() && !is_terminal(it->second);
    }
} // namespace purge
} // namespace txnpurge
