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
#include <txnpurge/purge/singleton_repair.hxx>

#include "queue_filter.hxx"

namespace txnpurge
{
namespace purge
{
    singleton_repair_stats repair_singleton_queue(database& db, const known_transactions& known, const purge_config& config)
    {
        singleton_repair_stats stats;
        const auto& collection = config.singleton_collection();
        const auto& id = config.singleton_id();
        auto doc = db.find_queue(collection, id, config.queue_field());
        if (!doc) {
            purge_log->info("{}/{} not found, nothing to repair", collection, id);
            return stats;
        }
        stats.found = true;
        stats.before = doc->queue.size();

        std::set<std::string> orphans;
        auto queue = filter_queue(doc->queue, [&](const std::string& txn_id) { return known.contains(txn_id); }, orphans);
        stats.orphans_removed = stats.before - queue.size();

        auto limit = config.singleton_queue_limit();
        if (limit > 0 && queue.size() > limit) {
            purge_log->warn("{}/{} still has {} queued transactions (limit {}), keeping outstanding ones only",
                            collection,
                            id,
                            queue.size(),
                            limit);
            std::set<std::string> settled;
            auto outstanding = filter_queue(queue, [&](const std::string& txn_id) { return known.is_outstanding(txn_id); }, settled);
            stats.truncated = queue.size() - outstanding.size();
            queue = std::move(outstanding);
        }
        stats.after = queue.size();

        if (stats.after == stats.before) {
            purge_log->info("{}/{} queue is clean ({} entries)", collection, id, stats.before);
            return stats;
        }
        db.replace_queue(collection, *doc, config.queue_field(), queue);
        stats.updated = true;
        purge_log->info("{}/{} queue reduced from {} to {} entries ({} orphaned, {} over limit)",
                        collection,
                        id,
                        stats.before,
                        stats.after,
                        stats.orphans_removed,
                        stats.truncated);
        return stats;
    }
} // namespace purge
} // namespace txnpurge
