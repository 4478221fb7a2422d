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

#include <chrono>
#include <list>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <txnpurge/client/result.hxx>
#include <txnpurge/support.hxx>

namespace txnpurge
{
class bucket;

/**
 *  @brief Options for cluster connections
 */
class cluster_options
{
  private:
    boost::optional<std::chrono::microseconds> kv_timeout_;
    boost::optional<std::chrono::microseconds> query_timeout_;

  public:
    /**
     * @brief Default kv timeout
     *
     * This is the default kv timeout to use for any kv operation within the cluster
     * if it has not been specified in the options for that operation.
     *
     * @return The duration this cluster is using, if it was set.
     */
    TXNPURGE_NODISCARD boost::optional<std::chrono::microseconds> kv_timeout() const
    {
        return kv_timeout_;
    }
    template<typename T>
    cluster_options& kv_timeout(T duration)
    {
        kv_timeout_ = std::chrono::duration_cast<std::chrono::microseconds>(duration);
        return *this;
    }

    /**
     * @brief Default query timeout
     *
     * Scans page through collections, so this bounds a single page, not a whole scan.
     */
    TXNPURGE_NODISCARD boost::optional<std::chrono::microseconds> query_timeout() const
    {
        return query_timeout_;
    }
    template<typename T>
    cluster_options& query_timeout(T duration)
    {
        query_timeout_ = std::chrono::duration_cast<std::chrono::microseconds>(duration);
        return *this;
    }
};

/**
 * @brief A connection to a Couchbase cluster.
 *
 * Owns one libcouchbase instance for cluster-level (management) requests; every bucket
 * opened from it gets an instance of its own.  Not thread safe.
 */
class cluster
{
  private:
    lcb_st* lcb_;
    std::string cluster_address_;
    std::string user_name_;
    std::string password_;
    cluster_options options_;
    std::list<std::shared_ptr<class bucket>> open_buckets_;

    http_result http(int method, const std::string& path, const std::string& body = "");

  public:
    /**
     * @brief Create a new cluster and connect to it
     *
     * @param cluster_address Connection string, say couchbases://1.2.3.4?ssl=no_verify
     * @param user_name User name to use for this connection.  Empty to connect without
     *                  credentials.
     * @param password Password for this user.
     * @throws connection_error if the cluster cannot be reached or refuses the credentials.
     */
    explicit cluster(std::string cluster_address,
                     std::string user_name,
                     std::string password,
                     const cluster_options& opts = cluster_options());

    cluster(const cluster&) = delete;
    cluster& operator=(const cluster&) = delete;

    /**
     * @brief Destroy a cluster
     *
     * Closes every bucket opened through it, then the cluster connection.
     */
    ~cluster();

    /**
     *  @brief Open a connection to a bucket.
     *
     * @param name Name of the bucket to connect to.
     * @return shared pointer to the bucket.
     */
    TXNPURGE_NODISCARD std::shared_ptr<class bucket> bucket(const std::string& name);

    /**
     * @brief List the collections of a scope.
     *
     * Reads the collection manifest of the bucket from the management API.
     *
     * @return collection names, in manifest order.  Empty if the scope does not exist.
     * @throws std::runtime_error if the manifest cannot be fetched or parsed.
     */
    TXNPURGE_NODISCARD std::vector<std::string> collection_names(const std::string& bucket_name, const std::string& scope_name);

    /**
     * @brief Start compaction of a bucket.
     *
     * @throws std::runtime_error if the server refuses the request.
     */
    void compact_bucket(const std::string& bucket_name);

    /**
     * @brief return the cluster address
     *
     * @return A constant string containing the cluster address used for this cluster.
     */
    TXNPURGE_NODISCARD const std::string& cluster_address() const
    {
        return cluster_address_;
    }

    TXNPURGE_NODISCARD const cluster_options& options() const
    {
        return options_;
    }
};
} // namespace txnpurge
