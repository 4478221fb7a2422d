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

#include <txnpurge/purge/txn_state.hxx>

#include <set>
#include <string>
#include <vector>

namespace txnpurge
{
namespace purge
{
    /**
     * Entries of queue whose transaction ID satisfies keep, in their original order.  The IDs
     * of dropped entries are added to removed.
     */
    template<typename Keep>
    std::vector<std::string> filter_queue(const std::vector<std::string>& queue, Keep keep, std::set<std::string>& removed)
    {
        std::vector<std::string> kept;
        kept.reserve(queue.size());
        for (const auto& token : queue) {
            auto txn_id = txn_id_from_token(token);
            if (keep(txn_id)) {
                kept.push_back(token);
            } else {
                removed.insert(txn_id);
            }
        }
        return kept;
    }

    inline std::string join_ids(const std::set<std::string>& ids)
    {
        std::string out;
        for (const auto& id : ids) {
            if (!out.empty()) {
                out += ",";
            }
            out += id;
        }
        return out;
    }
} // namespace purge
} // namespace txnpurge
