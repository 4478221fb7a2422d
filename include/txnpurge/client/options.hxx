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

#include <boost/optional.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <vector>

/**
 * @file
 * Provides options objects for the kv and query operations.
 */
namespace txnpurge
{
/**
 *  @brief base class for all options
 *
 *  Contains options common to all operations.
 */
template<typename T>
class common_options
{
  private:
    boost::optional<std::chrono::microseconds> timeout_;

  public:
    /**
     * @brief get timeout
     *
     * @return The timeout value, if set.
     */
    TXNPURGE_NODISCARD boost::optional<std::chrono::microseconds> timeout() const
    {
        return timeout_;
    }
    /**
     * @brief Set timeout
     *
     * @param timeout Set the timeout for this option object.
     * @return reference to this options class.  Makes these calls chainable.
     */
    template<typename R>
    T& timeout(R timeout)
    {
        timeout_ = std::chrono::duration_cast<std::chrono::microseconds>(timeout);
        return *static_cast<T*>(this);
    }
};

/**
 *  @brief Options common to mutation operations
 */
template<typename T>
class common_mutate_options : public common_options<T>
{
  private:
    boost::optional<uint64_t> cas_;

  public:
    /**
     *  @brief Get cas
     *
     * @returns The cas, if set.
     */
    TXNPURGE_NODISCARD boost::optional<uint64_t> cas() const
    {
        return cas_;
    }
    /**
     * @brief Set current CAS
     *
     * @param cas the current CAS of the document.  Mutation will fail with a
     *            result code of LCB_ERR_CAS_MISMATCH when this doesn't match the
     *            current CAS of the document.  Ignored if 0.
     * @return A reference to this object, so the calls can be chained.
     */
    T& cas(uint64_t cas)
    {
        cas_ = cas;
        return *static_cast<T*>(this);
    }
};

class lookup_in_options : public common_options<lookup_in_options>
{
};

class mutate_in_options : public common_mutate_options<mutate_in_options>
{
};

class remove_options : public common_options<remove_options>
{
};

/**
 * @brief Options for N1QL queries
 */
class query_options : public common_options<query_options>
{
  private:
    bool request_plus_{ false };
    bool readonly_{ false };
    std::vector<nlohmann::json> positional_parameters_;

  public:
    TXNPURGE_NODISCARD bool request_plus() const
    {
        return request_plus_;
    }
    /**
     * @brief Wait for all mutations made before the query to be indexed.
     */
    query_options& request_plus(bool value)
    {
        request_plus_ = value;
        return *this;
    }

    TXNPURGE_NODISCARD bool readonly() const
    {
        return readonly_;
    }
    query_options& readonly(bool value)
    {
        readonly_ = value;
        return *this;
    }

    TXNPURGE_NODISCARD const std::vector<nlohmann::json>& positional_parameters() const
    {
        return positional_parameters_;
    }
    /**
     * @brief Bind the next $n parameter of the statement.
     */
    template<typename T>
    query_options& add_positional_parameter(const T& value)
    {
        positional_parameters_.emplace_back(value);
        return *this;
    }
};
} // namespace txnpurge
