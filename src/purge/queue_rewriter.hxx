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
#include <txnpurge/purge/orphan_purger.hxx>

#include <functional>
#include <string>

namespace txnpurge
{
namespace purge
{
    /**
     * Rewrite the queue of every document in collection, keeping the entries whose transaction
     * ID satisfies keep.  Clean documents are not written.
     */
    queue_purge_stats rewrite_queues(database& db,
                                     const std::string& collection,
                                     const std::string& field,
                                     const std::function<bool(const std::string&)>& keep,
                                     const char* reason);
} // namespace purge
} // namespace txnpurge
