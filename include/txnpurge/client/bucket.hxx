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

#include <txnpurge/client/cluster.hxx>
#include <txnpurge/client/options.hxx>
#include <txnpurge/client/result.hxx>
#include <txnpurge/support.hxx>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace txnpurge
{
class collection;
class cluster;

/**
 * Couchbase bucket.
 *
 * Exposes bucket-level operations and collections accessors.
 */
class bucket : public std::enable_shared_from_this<bucket>
{
    friend class collection;
    friend class cluster;

  private:
    lcb_st* lcb_;
    const std::string name_;
    cluster_options options_;
    std::vector<std::shared_ptr<class collection>> collections_;

    bucket(lcb_st* lcb, const std::string& name, const cluster_options& options);

  public:
    static const std::string default_name;

    bucket(const bucket&) = delete;
    bucket& operator=(const bucket&) = delete;

    /**
     * @brief Get a collection by scope and name.
     *
     * @return shared pointer to the collection.  The collection is not checked for existence.
     */
    TXNPURGE_NODISCARD std::shared_ptr<class collection> collection(const std::string& scope, const std::string& name);

    /**
     * @brief Run a N1QL statement and collect its rows.
     *
     * The statement is expected to return a bounded number of rows (scans page with LIMIT).
     */
    TXNPURGE_NODISCARD query_result query(const std::string& statement, const query_options& opts = query_options());

    /**
     *  @brief Get bucket name
     */
    TXNPURGE_NODISCARD const std::string& name() const
    {
        return name_;
    };

    /**
     * @brief return default kv timeout
     */
    TXNPURGE_NODISCARD boost::optional<std::chrono::microseconds> default_kv_timeout() const
    {
        return options_.kv_timeout();
    }

    /**
     *  @brief Destroy the bucket
     *
     * Disconnects the bucket, and every collection obtained from it, from the cluster.
     */
    ~bucket();

    template<typename OStream>
    friend OStream& operator<<(OStream& os, const bucket& b)
    {
        os << "bucket:{";
        os << "name: " << b.name();
        os << "}";
        return os;
    }
};

/**
 * Quote a name for use as a N1QL identifier.
 */
std::string
n1ql_escape(const std::string& identifier);
} // namespace txnpurge
