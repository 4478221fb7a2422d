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

#include <txnpurge/client/bucket.hxx>
#include <txnpurge/client/lookup_in_spec.hxx>
#include <txnpurge/client/mutate_in_spec.hxx>
#include <txnpurge/client/options.hxx>
#include <txnpurge/client/result.hxx>
#include <txnpurge/support.hxx>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace txnpurge
{
class collection
{
    friend class bucket;

  private:
    std::weak_ptr<bucket> bucket_;
    std::string scope_;
    std::string name_;

    collection(std::shared_ptr<bucket> bucket, std::string scope, std::string name);

    static void install_callbacks(lcb_st* lcb);

    lcb_st* instance();
    bool set_collection() const;

  public:
    /**
     * @brief Remove document
     *
     * @param id Key of document to remove.
     * @param opts Options to use when removing.  For instance, you can set a cas.
     * @return Result of the operation.  A missing document is reported with
     *         @ref result::is_not_found, not thrown.
     */
    result remove(const std::string& id, const remove_options& opts = remove_options());

    /**
     * @brief Mutate some elements of a document.
     *
     * Mutates some paths within a document, leaving the rest of it alone.
     *
     * @param id Key of doc to mutate.
     * @param specs Vector of specs that represent the mutations.
     * @param opts Options to use when mutating.  You can specify a cas, for instance.
     * @return Result of operation.
     */
    result mutate_in(const std::string& id, std::vector<mutate_in_spec> specs, const mutate_in_options& opts = mutate_in_options());

    /**
     * @brief Lookup some elements of a document.
     *
     * Subdoc errors (a missing path, say) are reported per spec in @ref result::values, and
     * do not make the result unsuccessful.
     *
     * @param id Key of doc to look up.
     * @param specs Vector of specs that represent the lookups.
     * @param opts Options to use.
     * @return Result of operation.
     */
    result lookup_in(const std::string& id, std::vector<lookup_in_spec> specs, const lookup_in_options& opts = lookup_in_options());

    /**
     * @brief Get name of collection
     *
     *  @return Name of collection.  Note the default collection is named "_default".
     */
    TXNPURGE_NODISCARD const std::string& name() const
    {
        return name_;
    }

    /**
     * @brief Name of scope for this collection
     *
     * @return Scope of collection.  Note default scope is "_default".
     */
    TXNPURGE_NODISCARD const std::string& scope() const
    {
        return scope_;
    }

    /**
     * @brief Get name of bucket for this collection
     */
    TXNPURGE_NODISCARD const std::string& bucket_name() const
    {
        return bucket_.lock()->name();
    }

    /**
     * @brief Fully qualified, quoted N1QL keyspace: `bucket`.`scope`.`collection`
     */
    TXNPURGE_NODISCARD std::string keyspace() const;
};
} // namespace txnpurge
