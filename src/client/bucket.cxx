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

#include <memory>

#include "connection.hxx"

#include <txnpurge/client/bucket.hxx>
#include <txnpurge/client/collection.hxx>
#include <txnpurge/client/exceptions.hxx>
#include <txnpurge/logging.hxx>
#include <txnpurge/support.hxx>

#include <libcouchbase/couchbase.h>

#include <algorithm>

namespace tp = txnpurge;

const std::string tp::bucket::default_name = "_default";

extern "C" {
static void
open_callback(lcb_INSTANCE* instance, lcb_STATUS status)
{
    auto* rc = static_cast<lcb_STATUS*>(const_cast<void*>(lcb_get_cookie(instance)));
    *rc = status;
}

static void
query_callback(lcb_INSTANCE*, int, const lcb_RESPQUERY* resp)
{
    tp::query_result* res = nullptr;
    lcb_respquery_cookie(resp, reinterpret_cast<void**>(&res));
    const char* data = nullptr;
    size_t ndata = 0;
    lcb_respquery_row(resp, &data, &ndata);
    if (lcb_respquery_is_final(resp)) {
        res->rc = lcb_respquery_status(resp);
        if (data != nullptr) {
            res->meta.assign(data, ndata);
        }
        if (res->rc != LCB_SUCCESS) {
            const lcb_QUERY_ERROR_CONTEXT* ctx = nullptr;
            lcb_respquery_error_context(resp, &ctx);
            const char* msg = nullptr;
            size_t nmsg = 0;
            if (ctx != nullptr && lcb_errctx_query_first_error_message(ctx, &msg, &nmsg) == LCB_SUCCESS && msg != nullptr) {
                res->error_message.assign(msg, nmsg);
            }
        }
    } else {
        res->rows.emplace_back(data, ndata);
    }
}
}

tp::bucket::bucket(lcb_st* lcb, const std::string& name, const cluster_options& options)
  : lcb_(lcb)
  , name_(name)
  , options_(options)
{
    lcb_STATUS rc;
    lcb_set_open_callback(lcb_, open_callback);
    lcb_set_cookie(lcb_, &rc);
    rc = lcb_open(lcb_, name_.c_str(), name_.size());
    if (rc != LCB_SUCCESS) {
        shutdown(lcb_);
        throw connection_error(std::string("failed to open bucket (sched): ") + lcb_strerror_short(rc));
    }
    lcb_wait(lcb_, LCB_WAIT_DEFAULT);
    lcb_set_cookie(lcb_, nullptr);
    if (rc != LCB_SUCCESS) {
        shutdown(lcb_);
        throw connection_error(std::string("failed to open bucket ") + name_ + ": " + lcb_strerror_short(rc));
    }
    collection::install_callbacks(lcb_);
    client_log->info("opened bucket {}", name_);
}

tp::bucket::~bucket()
{
    collections_.clear();
    shutdown(lcb_);
}

std::shared_ptr<tp::collection>
tp::bucket::collection(const std::string& scope, const std::string& name)
{
    auto scope_name = scope.empty() ? default_name : scope;
    auto collection_name = name.empty() ? default_name : name;
    auto it = std::find_if(collections_.begin(), collections_.end(), [&](const std::shared_ptr<tp::collection>& c) {
        return c->scope() == scope_name && c->name() == collection_name;
    });
    if (it != collections_.end()) {
        return *it;
    }
    collections_.push_back(std::shared_ptr<tp::collection>(new tp::collection(shared_from_this(), scope_name, collection_name)));
    return collections_.back();
}

tp::query_result
tp::bucket::query(const std::string& statement, const query_options& opts)
{
    lcb_CMDQUERY* cmd;
    lcb_cmdquery_create(&cmd);
    lcb_cmdquery_statement(cmd, statement.data(), statement.size());
    for (const auto& param : opts.positional_parameters()) {
        auto value = param.dump();
        lcb_cmdquery_positional_param(cmd, value.data(), value.size());
    }
    if (opts.request_plus()) {
        lcb_cmdquery_consistency(cmd, LCB_QUERY_CONSISTENCY_REQUEST);
    }
    if (opts.readonly()) {
        lcb_cmdquery_readonly(cmd, 1);
    }
    auto timeout = opts.timeout() ? opts.timeout() : options_.query_timeout();
    if (timeout) {
        lcb_cmdquery_timeout(cmd, static_cast<uint32_t>(timeout->count()));
    }
    lcb_cmdquery_callback(cmd, query_callback);
    query_result res;
    lcb_STATUS rc = lcb_query(lcb_, &res, cmd);
    lcb_cmdquery_destroy(cmd);
    if (rc != LCB_SUCCESS) {
        throw std::runtime_error(std::string("failed to schedule query: ") + lcb_strerror_short(rc));
    }
    lcb_wait(lcb_, LCB_WAIT_DEFAULT);
    client_log->trace("query returned {} rows, rc={}", res.rows.size(), res.rc);
    return res;
}

std::string
tp::n1ql_escape(const std::string& identifier)
{
    std::string out("`");
    for (char c : identifier) {
        if (c == '`') {
            out += "``";
        } else {
            out += c;
        }
    }
    out += "`";
    return out;
}
