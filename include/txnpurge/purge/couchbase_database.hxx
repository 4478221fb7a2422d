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
#include <txnpurge/client/cluster.hxx>
#include <txnpurge/client/result.hxx>
#include <txnpurge/purge/database.hxx>
#include <txnpurge/purge/purge_config.hxx>

#include <memory>
#include <string>

namespace txnpurge
{
namespace purge
{
    /**
     * @brief Interpret the result of a queue field lookup.
     *
     * A missing document, or a missing collection or scope, is not found.  A document without
     * the field has an empty queue.
     *
     * @throws purge_error with FAIL_READ for any other failure, or a queue that is not a list of strings.
     */
    boost::optional<queued_document> queue_from_lookup(const result& res, const std::string& collection, const std::string& id);

    /**
     * @brief The repair stages' view of one scope of a Couchbase bucket.
     *
     * Collections are the scope's collections.  Scans are N1QL statements, paged by document
     * key and run at request_plus consistency, so each collection needs a primary index.
     * Queue reads and writes are subdoc operations on the queue field alone.
     */
    class couchbase_database : public database
    {
      private:
        cluster& cluster_;
        std::shared_ptr<bucket> bucket_;
        std::string scope_;
        size_t page_size_;

      public:
        couchbase_database(cluster& c, const std::string& bucket_name, const std::string& scope, const purge_config& config);

        std::vector<std::string> collection_names() override;
        bool has_collection(const std::string& collection) override;
        std::unique_ptr<document_cursor> scan_queues(const std::string& collection, const std::string& field) override;
        std::unique_ptr<txn_cursor> scan_transactions(const std::string& collection) override;
        boost::optional<queued_document> find_queue(const std::string& collection,
                                                    const std::string& id,
                                                    const std::string& field) override;
        void replace_queue(const std::string& collection,
                           const queued_document& doc,
                           const std::string& field,
                           const std::vector<std::string>& queue) override;
        bool remove_document(const std::string& collection, const std::string& id) override;
        void compact() override;

        TXNPURGE_NODISCARD const std::string& scope() const
        {
            return scope_;
        }
    };
} // namespace purge
} // namespace txnpurge
