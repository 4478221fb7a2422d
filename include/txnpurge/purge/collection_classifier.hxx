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

#include <txnpurge/purge/purge_config.hxx>

#include <string>
#include <vector>

namespace txnpurge
{
namespace purge
{
    /**
     * @brief Does orphan purging apply to this collection?
     *
     * False for the transaction log, anything derived from it (its stash included), and
     * collections reserved by the database engine.
     */
    bool is_purgeable_collection(const std::string& name, const purge_config& config);

    /**
     * @brief Select the purgeable collections from a catalog snapshot, keeping catalog order.
     */
    std::vector<std::string> purgeable_collections(const std::vector<std::string>& catalog, const purge_config& config);
} // namespace purge
} // namespace txnpurge
