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
#include <txnpurge/purge/purge_config.hxx>

#include <cstddef>
#include <string>
#include <vector>

namespace txnpurge
{
namespace purge
{
    struct prune_stats {
        size_t referenced{ 0 };
        size_t scanned{ 0 };
        size_t removed{ 0 };
    };

    /**
     * @brief Delete transaction records that are finished and referenced by no queue.
     *
     * A record is removed when it is aborted or applied and no queue entry in the given
     * collections names it.  The queues are read afresh, not taken from the run's index.
     * Removing a record that is already gone is not an error.
     */
    prune_stats prune_transactions(database& db, const std::vector<std::string>& collections, const purge_config& config);
} // namespace purge
} // namespace txnpurge
