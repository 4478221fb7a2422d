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
#include <txnpurge/purge/known_transactions.hxx>
#include <txnpurge/purge/purge_config.hxx>

#include <cstddef>
#include <string>
#include <vector>

namespace txnpurge
{
namespace purge
{
    struct queue_purge_stats {
        size_t collections{ 0 };
        size_t documents_scanned{ 0 };
        size_t documents_updated{ 0 };
        size_t entries_removed{ 0 };

        queue_purge_stats& operator+=(const queue_purge_stats& other)
        {
            collections += other.collections;
            documents_scanned += other.documents_scanned;
            documents_updated += other.documents_updated;
            entries_removed += other.entries_removed;
            return *this;
        }
    };

    /**
     * @brief Remove queue entries of unknown transactions from every document of the given
     * collections.
     *
     * Collections are handled in the order given, documents one at a time as the scan returns
     * them.  Only the queue field of a document is written, only when it changed, and only if
     * the document is still the version that was read.  A queue emptied this way is stored as
     * an empty array.
     *
     * @throws on the first failed read or write; documents already rewritten stay rewritten,
     *         and a later run will simply find them clean.
     */
    queue_purge_stats purge_orphans(database& db,
                                    const known_transactions& known,
                                    const std::vector<std::string>& collections,
                                    const purge_config& config);

    /**
     * @brief Same as @ref purge_orphans for one collection.
     */
    queue_purge_stats purge_orphans_in_collection(database& db,
                                                  const known_transactions& known,
                                                  const std::string& collection,
                                                  const purge_config& config);
} // namespace purge
} // namespace txnpurge
