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
#include <txnpurge/purge/orphan_purger.hxx>

#include "queue_rewriter.hxx"

namespace txnpurge
{
namespace purge
{
    queue_purge_stats purge_orphans_in_collection(database& db,
                                                  const known_transactions& known,
                                                  const std::string& collection,
                                                  const purge_config& config)
    {
        return rewrite_queues(
          db, collection, config.queue_field(), [&known](const std::string& txn_id) { return known.contains(txn_id); }, "missing");
    }

    queue_purge_stats purge_orphans(database& db,
                                    const known_transactions& known,
                                    const std::vector<std::string>& collections,
                                    const purge_config& config)
    {
        queue_purge_stats total;
        for (const auto& collection : collections) {
            purge_log->debug("purging orphaned transactions in {}", collection);
            total += purge_orphans_in_collection(db, known, collection, config);
        }
        purge_log->info("{} collections: {} documents scanned, {} updated, {} orphaned entries removed",
                        total.collections,
                        total.documents_scanned,
                        total.documents_updated,
                        total.entries_removed);
        return total;
    }
} // namespace purge
} // namespace txnpurge
