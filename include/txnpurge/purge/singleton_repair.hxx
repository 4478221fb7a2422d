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

namespace txnpurge
{
namespace purge
{
    struct singleton_repair_stats {
        bool found{ false };
        bool updated{ false };
        size_t before{ 0 };
        size_t after{ 0 };
        // entries whose transaction is unknown
        size_t orphans_removed{ 0 };
        // known entries dropped because the queue exceeded the limit
        size_t truncated{ 0 };
    };

    /**
     * @brief Repair the queue of the host-ports singleton.
     *
     * The document is rewritten by a recurring transaction, so a fault that keeps re-queuing
     * it grows its queue far past any other document's.  Entries of unknown transactions are
     * always removed.  If more than @ref purge_config::singleton_queue_limit known entries are
     * left, only those of outstanding transactions are kept.
     *
     * A missing document is not an error.  Running twice changes nothing the second time.
     */
    singleton_repair_stats repair_singleton_queue(database& db, const known_transactions& known, const purge_config& config);
} // namespace purge
} // namespace txnpurge
