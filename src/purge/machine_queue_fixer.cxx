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
#include <txnpurge/purge/machine_queue_fixer.hxx>

#include "queue_rewriter.hxx"

namespace txnpurge
{
namespace purge
{
    queue_purge_stats fix_machine_queues(database& db, const known_transactions& known, const purge_config& config)
    {
        auto stats = rewrite_queues(
          db,
          config.machines_collection(),
          config.queue_field(),
          [&known](const std::string& txn_id) { return !known.is_applied(txn_id); },
          "completed");
        purge_log->info("{}: {} documents scanned, {} updated, {} completed entries removed",
                        config.machines_collection(),
                        stats.documents_scanned,
                        stats.documents_updated,
                        stats.entries_removed);
        return stats;
    }
} // namespace purge
} // namespace txnpurge
