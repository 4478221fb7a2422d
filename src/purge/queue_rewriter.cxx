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

#include "queue_rewriter.hxx"
#include "queue_filter.hxx"

#include <txnpurge/logging.hxx>

namespace txnpurge
{
namespace purge
{
    queue_purge_stats rewrite_queues(database& db,
                                     const std::string& collection,
                                     const std::string& field,
                                     const std::function<bool(const std::string&)>& keep,
                                     const char* reason)
    {
        queue_purge_stats stats;
        stats.collections = 1;
        auto docs = db.scan_queues(collection, field);
        queued_document doc;
        while (docs->next(doc)) {
            stats.documents_scanned++;
            std::set<std::string> removed;
            auto queue = filter_queue(doc.queue, keep, removed);
            if (queue.size() == doc.queue.size()) {
                continue;
            }
            purge_log->warn("purging from document {}/{} the {} transaction ids {}", collection, doc.id, reason, join_ids(removed));
            db.replace_queue(collection, doc, field, queue);
            stats.documents_updated++;
            stats.entries_removed += doc.queue.size() - queue.size();
        }
        purge_log->debug("{}: {} documents scanned, {} updated, {} entries removed",
                         collection,
                         stats.documents_scanned,
                         stats.documents_updated,
                         stats.entries_removed);
        return stats;
    }
} // namespace purge
} // namespace txnpurge
