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

#include <txnpurge/purge/exceptions.hxx>
#include <txnpurge/purge/purge_config.hxx>

#include <fstream>

namespace txnpurge
{
namespace purge
{
    purge_config::purge_config()
      : txns_collection_(DEFAULT_TXNS_COLLECTION)
      , stash_collection_(DEFAULT_STASH_COLLECTION)
      , txns_separator_(".")
      , reserved_prefixes_({ "system." })
      , machines_collection_(DEFAULT_MACHINES_COLLECTION)
      , queue_field_(DEFAULT_QUEUE_FIELD)
      , singleton_collection_(DEFAULT_SINGLETON_COLLECTION)
      , singleton_id_(DEFAULT_SINGLETON_ID)
      , singleton_queue_limit_(DEFAULT_SINGLETON_QUEUE_LIMIT)
      , scan_page_size_(DEFAULT_SCAN_PAGE_SIZE)
      , fix_machines_(true)
      , prune_(true)
      , compact_(true)
    {
    }

    template<typename T>
    static void read_key(const nlohmann::json& conf, const char* key, T& target)
    {
        auto it = conf.find(key);
        if (it == conf.end()) {
            return;
        }
        try {
            target = it->get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw purge_error(FAIL_CONFIG, std::string("bad value for '") + key + "': " + e.what());
        }
    }

    // counts must be non-negative integers; get<size_t>() would wrap -1 around
    static void read_key(const nlohmann::json& conf, const char* key, size_t& target)
    {
        auto it = conf.find(key);
        if (it == conf.end()) {
            return;
        }
        if (!it->is_number_unsigned()) {
            throw purge_error(FAIL_CONFIG, std::string("bad value for '") + key + "': expected a non-negative integer, got " + it->dump());
        }
        target = it->get<size_t>();
    }

    void purge_config::merge(const nlohmann::json& conf)
    {
        if (!conf.is_object()) {
            throw purge_error(FAIL_CONFIG, "configuration must be a JSON object");
        }
        read_key(conf, "txns_collection", txns_collection_);
        read_key(conf, "stash_collection", stash_collection_);
        read_key(conf, "txns_separator", txns_separator_);
        read_key(conf, "reserved_prefixes", reserved_prefixes_);
        read_key(conf, "machines_collection", machines_collection_);
        read_key(conf, "queue_field", queue_field_);
        read_key(conf, "singleton_collection", singleton_collection_);
        read_key(conf, "singleton_id", singleton_id_);
        read_key(conf, "singleton_queue_limit", singleton_queue_limit_);
        read_key(conf, "scan_page_size", scan_page_size_);
        read_key(conf, "fix_machines", fix_machines_);
        read_key(conf, "prune", prune_);
        read_key(conf, "compact", compact_);
        if (txns_collection_.empty()) {
            throw purge_error(FAIL_CONFIG, "txns_collection must not be empty");
        }
        if (queue_field_.empty()) {
            throw purge_error(FAIL_CONFIG, "queue_field must not be empty");
        }
        if (scan_page_size_ == 0) {
            throw purge_error(FAIL_CONFIG, "scan_page_size must be positive");
        }
    }

    purge_config purge_config::from_json(const nlohmann::json& conf)
    {
        purge_config config;
        config.merge(conf);
        return config;
    }

    purge_config purge_config::from_file(const std::string& path)
    {
        std::ifstream in(path, std::ifstream::in);
        if (!in) {
            throw purge_error(FAIL_CONFIG, "cannot open configuration file " + path);
        }
        nlohmann::json conf;
        try {
            conf = nlohmann::json::parse(in);
        } catch (const nlohmann::json::parse_error& e) {
            throw purge_error(FAIL_CONFIG, "cannot parse configuration file " + path + ": " + e.what());
        }
        return from_json(conf);
    }
} // namespace purge
} // namespace txnpurge
