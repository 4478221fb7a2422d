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
#include <txnpurge/purge/txn_pruner.hxx>

#include <unordered_set>

namespace txnpurge
{
namespace purge
{
    static std::unordered_set<std::string> referenced_transactions(database& db,
                                                                   const std::vector<std::string>& collections,
                                                                   const std::string& field)
    {
        std::unordered_set<std::string> referenced;
        for (const auto& collection : collections) {
            auto docs = db.scan_queues(collection, field);
            queued_document doc;
            while (docs->next(doc)) {
                for (const auto& token : doc.queue) {
                    referenced.insert(txn_id_from_token(token));
                }
            }
        }
        return referenced;
    }

    prune_stats prune_transactions(database& db, const std::vector<std::string>& collections, const purge_config& config)
    {
        prune_stats stats;
        auto referenced = referenced_transactions(db, collections, config.queue_field());
        stats.referenced = referenced.size();
        purge_log->debug("{} transactions referenced from {} collections", stats.referenced, collections.size());

        auto txns = db.scan_transactions(config.txns_collection());
        txn_record record;
        while (txns->next(record)) {
            stats.scanned++;
            if (!is_terminal(record.state) || referenced.count(record.id) > 0) {
                continue;
            }
            if (db.remove_document(config.txns_collection(), record.id)) {
                stats.removed++;
            }
        }
        purge_log->info("pruned {} of {} transactions ({} still referenced)", stats.removed, stats.scanned, stats.referenced);
        return stats;
    }
} // namespace purge
} // namespace txnpurge
