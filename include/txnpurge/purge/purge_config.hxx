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

#include <txnpurge/support.hxx>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace txnpurge
{
namespace purge
{
    static const std::string DEFAULT_TXNS_COLLECTION = "txns";
    static const std::string DEFAULT_STASH_COLLECTION = "txns.stash";
    static const std::string DEFAULT_MACHINES_COLLECTION = "machines";
    static const std::string DEFAULT_QUEUE_FIELD = "txn-queue";
    static const std::string DEFAULT_SINGLETON_COLLECTION = "controllers";
    static const std::string DEFAULT_SINGLETON_ID = "apiHostPorts";
    static const size_t DEFAULT_SINGLETON_QUEUE_LIMIT = 1000;
    static const size_t DEFAULT_SCAN_PAGE_SIZE = 1000;

    /**
     * Tunables for a repair run.
     *
     * Collection and field names describe the layout of the transaction protocol; the
     * remaining settings select optional stages and bound the work done per request.
     */
    class purge_config
    {
      public:
        purge_config();

        /**
         * @brief Overlay the settings present in a JSON object.
         *
         * Absent keys keep their current value.  Recognised keys are the setter names below
         * (for example "txns_collection", "singleton_queue_limit", "fix_machines").
         *
         * @throws purge_error with FAIL_CONFIG when a key has the wrong type.
         */
        void merge(const nlohmann::json& conf);

        static purge_config from_json(const nlohmann::json& conf);

        static purge_config from_file(const std::string& path);

        TXNPURGE_NODISCARD const std::string& txns_collection() const
        {
            return txns_collection_;
        }
        purge_config& txns_collection(const std::string& name)
        {
            txns_collection_ = name;
            return *this;
        }

        TXNPURGE_NODISCARD const std::string& stash_collection() const
        {
            return stash_collection_;
        }
        purge_config& stash_collection(const std::string& name)
        {
            stash_collection_ = name;
            return *this;
        }

        /**
         * Collections whose names start with the log name followed by this separator are
         * derived from the log, and never purged.
         */
        TXNPURGE_NODISCARD const std::string& txns_separator() const
        {
            return txns_separator_;
        }
        purge_config& txns_separator(const std::string& separator)
        {
            txns_separator_ = separator;
            return *this;
        }

        TXNPURGE_NODISCARD const std::vector<std::string>& reserved_prefixes() const
        {
            return reserved_prefixes_;
        }
        purge_config& reserved_prefixes(std::vector<std::string> prefixes)
        {
            reserved_prefixes_ = std::move(prefixes);
            return *this;
        }

        TXNPURGE_NODISCARD const std::string& machines_collection() const
        {
            return machines_collection_;
        }
        purge_config& machines_collection(const std::string& name)
        {
            machines_collection_ = name;
            return *this;
        }

        TXNPURGE_NODISCARD const std::string& queue_field() const
        {
            return queue_field_;
        }
        purge_config& queue_field(const std::string& name)
        {
            queue_field_ = name;
            return *this;
        }

        TXNPURGE_NODISCARD const std::string& singleton_collection() const
        {
            return singleton_collection_;
        }
        purge_config& singleton_collection(const std::string& name)
        {
            singleton_collection_ = name;
            return *this;
        }

        TXNPURGE_NODISCARD const std::string& singleton_id() const
        {
            return singleton_id_;
        }
        purge_config& singleton_id(const std::string& id)
        {
            singleton_id_ = id;
            return *this;
        }

        /**
         * Once the singleton queue holds more known entries than this, it is cut down to the
         * entries of outstanding transactions.  Zero disables the limit.
         */
        TXNPURGE_NODISCARD size_t singleton_queue_limit() const
        {
            return singleton_queue_limit_;
        }
        purge_config& singleton_queue_limit(size_t limit)
        {
            singleton_queue_limit_ = limit;
            return *this;
        }

        TXNPURGE_NODISCARD size_t scan_page_size() const
        {
            return scan_page_size_;
        }
        purge_config& scan_page_size(size_t size)
        {
            scan_page_size_ = size;
            return *this;
        }

        TXNPURGE_NODISCARD bool fix_machines() const
        {
            return fix_machines_;
        }
        purge_config& fix_machines(bool value)
        {
            fix_machines_ = value;
            return *this;
        }

        TXNPURGE_NODISCARD bool prune() const
        {
            return prune_;
        }
        purge_config& prune(bool value)
        {
            prune_ = value;
            return *this;
        }

        TXNPURGE_NODISCARD bool compact() const
        {
            return compact_;
        }
        purge_config& compact(bool value)
        {
            compact_ = value;
            return *this;
        }

      private:
        std::string txns_collection_;
        std::string stash_collection_;
        std::string txns_separator_;
        std::vector<std::string> reserved_prefixes_;
        std::string machines_collection_;
        std::string queue_field_;
        std::string singleton_collection_;
        std::string singleton_id_;
        size_t singleton_queue_limit_;
        size_t scan_page_size_;
        bool fix_machines_;
        bool prune_;
        bool compact_;
    };
} // namespace purge
} // namespace txnpurge
