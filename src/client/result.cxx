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

#include <txnpurge/client/result.hxx>

#include <libcouchbase/couchbase.h>

std::string
txnpurge::result::strerror() const
{
    return lcb_strerror_short(static_cast<lcb_STATUS>(error()));
}

bool
txnpurge::result::is_not_found() const
{
    return rc == LCB_ERR_DOCUMENT_NOT_FOUND;
}

bool
txnpurge::result::is_collection_not_found() const
{
    return rc == LCB_ERR_COLLECTION_NOT_FOUND || rc == LCB_ERR_SCOPE_NOT_FOUND;
}

bool
txnpurge::result::is_cas_mismatch() const
{
    return rc == LCB_ERR_CAS_MISMATCH;
}

bool
txnpurge::result::is_success() const
{
    return rc == LCB_SUCCESS;
}

uint32_t
txnpurge::result::error() const
{
    if (rc != LCB_SUCCESS || ignore_subdoc_errors) {
        return rc;
    }
    for (const auto& v : values) {
        if (v.status != LCB_SUCCESS) {
            return v.status;
        }
    }
    return rc;
}

bool
txnpurge::query_result::is_success() const
{
    return rc == LCB_SUCCESS;
}

bool
txnpurge::query_result::is_keyspace_not_found() const
{
    return rc == LCB_ERR_KEYSPACE_NOT_FOUND;
}

std::string
txnpurge::query_result::strerror() const
{
    std::string msg = lcb_strerror_short(static_cast<lcb_STATUS>(rc));
    if (!error_message.empty()) {
        msg += ": " + error_message;
    }
    return msg;
}

bool
txnpurge::http_result::is_success() const
{
    return rc == LCB_SUCCESS && http_status >= 200 && http_status < 300;
}

std::string
txnpurge::http_result::strerror() const
{
    if (rc != LCB_SUCCESS) {
        return lcb_strerror_short(static_cast<lcb_STATUS>(rc));
    }
    return "HTTP " + std::to_string(http_status) + (raw_value.empty() ? "" : ": " + raw_value);
}
