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

#include <txnpurge/purge/collection_classifier.hxx>

#include <algorithm>
#include <iterator>

namespace txnpurge
{
namespace purge
{
    static bool starts_with(const std::string& str, const std::string& prefix)
    {
        return !prefix.empty() && str.compare(0, prefix.size(), prefix) == 0;
    }

    bool is_purgeable_collection(const std::string& name, const purge_config& config)
    {
        if (name == config.txns_collection()) {
            return false;
        }
        if (starts_with(name, config.txns_collection() + config.txns_separator())) {
            return false;
        }
        if (name == config.stash_collection()) {
            return false;
        }
        const auto& reserved = config.reserved_prefixes();
        return std::none_of(reserved.begin(), reserved.end(), [&](const std::string& prefix) { return starts_with(name, prefix); });
    }

    std::vector<std::string> purgeable_collections(const std::vector<std::string>& catalog, const purge_config& config)
    {
        std::vector<std::string> collections;
        std::copy_if(catalog.begin(), catalog.end(), std::back_inserter(collections), [&](const std::string& name) {
            return is_purgeable_collection(name, config);
        });
        return collections;
    }
} // namespace purge
} // namespace txnpurge
