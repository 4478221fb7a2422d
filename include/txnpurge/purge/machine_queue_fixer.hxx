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
#include <txnpurge/purge/orphan_purger.hxx>
#include <txnpurge/purge/purge_config.hxx>

namespace txnpurge
{
namespace purge
{
    /**
     * @brief Remove entries of applied transactions from the queues of machine documents.
     *
     * A transaction can be applied and still linger in a machine's queue.  Unlike an orphaned
     * entry, completion can be checked against the log, so only entries whose transaction is
     * known to be applied are removed; entries of unknown transactions are left alone.
     */
    queue_purge_stats fix_machine_queues(database& db, const known_transactions& known, const purge_config& config);
} // namespace purge
} // namespace txnpurge
