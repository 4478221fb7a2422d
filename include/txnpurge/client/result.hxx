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

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file
 * Provides objects encapsulating the results of kv, query and http operations.
 */
namespace txnpurge
{
struct result_base {
    std::string raw_value;

    result_base() = default;

    result_base(const std::string& res)
      : raw_value(res)
    {
    }

    bool has_value() const
    {
        return !raw_value.empty();
    }
};

/**
 * @brief Result of one spec within a subdoc operation.
 *
 * See @ref collection::lookup_in and @ref collection::mutate_in
 */
struct subdoc_result : result_base {
    uint32_t status;

    subdoc_result()
      : result_base()
      , status(0)
    {
    }
    subdoc_result(uint32_t s)
      : status(s)
    {
    }
    subdoc_result(const std::string& v, uint32_t s)
      : result_base(v)
      , status(s)
    {
    }
};

/**
 * @brief The result of a kv operation.
 *
 * For subdoc operations, values holds one entry per spec, in spec order.
 */
struct result : result_base {
    /** @brief return code for operation */
    uint32_t rc;
    /** @brief CAS for document, if any */
    uint64_t cas;
    /** @brief document key */
    std::string key;
    /** @brief results of subdoc spec operations */
    std::vector<subdoc_result> values;
    bool ignore_subdoc_errors;

    result()
      : result_base()
      , rc(0)
      , cas(0)
      , ignore_subdoc_errors(false)
    {
    }
    /**
     * Get description of error
     *
     * @return String describing the error code.
     */
    TXNPURGE_NODISCARD std::string strerror() const;
    TXNPURGE_NODISCARD bool is_not_found() const;
    /** The scope or collection the operation targeted does not exist. */
    TXNPURGE_NODISCARD bool is_collection_not_found() const;
    TXNPURGE_NODISCARD bool is_cas_mismatch() const;
    TXNPURGE_NODISCARD bool is_success() const;
    /**
     *  Get error code.  This is either the rc, or if that is LCB_SUCCESS,
     *  then the first error in the values (if any).
     */
    TXNPURGE_NODISCARD uint32_t error() const;

    template<typename OStream>
    friend OStream& operator<<(OStream& os, const result& res)
    {
        os << "result{";
        os << "rc:" << res.rc << ",";
        os << "strerror:" << res.strerror() << ",";
        os << "cas:" << res.cas << ",";
        os << "key:" << res.key;
        if (!res.values.empty()) {
            os << ",values:[";
            for (auto& v : res.values) {
                os << "{" << v.raw_value << "," << v.status << "},";
            }
            os << "]";
        }
        os << "}";
        return os;
    }
};

/**
 * @brief The result of a N1QL query.
 *
 * Rows are kept as the raw JSON text the server sent.
 */
struct query_result {
    uint32_t rc{ 0 };
    std::vector<std::string> rows;
    std::string meta;
    std::string error_message;

    TXNPURGE_NODISCARD bool is_success() const;
    TXNPURGE_NODISCARD bool is_keyspace_not_found() const;
    TXNPURGE_NODISCARD std::string strerror() const;
};

/**
 * @brief The result of a request to the cluster management REST API.
 */
struct http_result : result_base {
    uint32_t rc{ 0 };
    uint16_t http_status{ 0 };

    TXNPURGE_NODISCARD bool is_success() const;
    TXNPURGE_NODISCARD std::string strerror() const;
};
} // namespace txnpurge
