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

#include <txnpurge/purge/txn_state.hxx>
#include <txnpurge/support.hxx>

#include <boost/optional.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/**
 * @file
 * The storage operations the repair stages are written against.
 *
 * The stages never talk to libcouchbase directly: @ref couchbase_database implements this
 * interface for a live cluster, and the tests provide an in-memory one.
 */
namespace txnpurge
{
namespace purge
{
    /**
     * @brief A document's queue, as read at one point in time.
     *
     * The cas identifies the version that was read; writes are only accepted against it.
     */
    struct queued_document {
        std::string id;
        std::vector<std::string> queue;
        uint64_t cas{ 0 };
    };

    struct txn_record {
        std::string id;
        txn_state state{ txn_state::UNKNOWN };
    };

    /**
     * @brief Forward-only stream of items.
     *
     * Owned by the stage consuming it; whatever server-side resources back it are released
     * when it is destroyed.
     */
    template<typename T>
    class cursor
    {
      public:
        virtual ~cursor() = default;

        /**
         * @brief Fetch the next item.
         *
         * @return false once the stream is exhausted, in which case item is untouched.
         * @throws purge_error with FAIL_READ if the stream cannot be continued.
         */
        virtual bool next(T& item) = 0;
    };

    using document_cursor = cursor<queued_document>;
    using txn_cursor = cursor<txn_record>;

    class database
    {
      public:
        virtual ~database() = default;

        /**
         * @brief Names of all collections in the logical database.
         *
         * @throws purge_error with FAIL_CATALOG.
         */
        virtual std::vector<std::string> collection_names() = 0;

        /**
         * @brief Whether a collection exists.
         *
         * Scans of a missing collection come back empty, which is only acceptable where an
         * absent collection means "nothing there" (the stash, say).
         *
         * @throws purge_error with FAIL_CATALOG.
         */
        virtual bool has_collection(const std::string& collection) = 0;

        /**
         * @brief Stream every document of a collection whose queue field is a non-empty array.
         */
        virtual std::unique_ptr<document_cursor> scan_queues(const std::string& collection, const std::string& field) = 0;

        /**
         * @brief Stream every record of a transaction collection (the log or the stash).
         *
         * Records without a recognisable state come back as txn_state::UNKNOWN.
         */
        virtual std::unique_ptr<txn_cursor> scan_transactions(const std::string& collection) = 0;

        /**
         * @brief Read the queue of a single document.
         *
         * @return none if the document does not exist.  A document without the field comes back
         *         with an empty queue.
         */
        virtual boost::optional<queued_document> find_queue(const std::string& collection,
                                                            const std::string& id,
                                                            const std::string& field) = 0;

        /**
         * @brief Replace the queue field of a document, and nothing else.
         *
         * The write is rejected if the document changed since doc was read.
         *
         * @throws concurrent_modification if doc.cas no longer matches.
         * @throws purge_error with FAIL_WRITE for any other failure.
         */
        virtual void replace_queue(const std::string& collection,
                                   const queued_document& doc,
                                   const std::string& field,
                                   const std::vector<std::string>& queue) = 0;

        /**
         * @brief Remove a document.
         *
         * @return false if it was already gone.
         */
        virtual bool remove_document(const std::string& collection, const std::string& id) = 0;

        /**
         * @brief Ask the storage engine to reclaim space.
         *
         * @throws purge_error with FAIL_EXTERNAL.
         */
        virtual void compact() = 0;
    };
} // namespace purge
} // namespace txnpurge
