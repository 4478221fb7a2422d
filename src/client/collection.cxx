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

#include <utility>

#include <txnpurge/client/bucket.hxx>
#include <txnpurge/client/collection.hxx>
#include <txnpurge/client/exceptions.hxx>
#include <txnpurge/client/lookup_in_spec.hxx>
#include <txnpurge/logging.hxx>

#include <libcouchbase/couchbase.h>

#include <stdexcept>

namespace tp = txnpurge;

extern "C" {
static void
remove_callback(lcb_INSTANCE*, int, const lcb_RESPREMOVE* resp)
{
    tp::result* res = nullptr;
    lcb_respremove_cookie(resp, reinterpret_cast<void**>(&res));
    res->rc = lcb_respremove_status(resp);
    lcb_respremove_cas(resp, &res->cas);
    const char* data = nullptr;
    size_t ndata = 0;
    lcb_respremove_key(resp, &data, &ndata);
    res->key = std::string(data, ndata);
}

static void
subdoc_callback(lcb_INSTANCE*, int, const lcb_RESPSUBDOC* resp)
{
    tp::result* res = nullptr;
    lcb_respsubdoc_cookie(resp, reinterpret_cast<void**>(&res));
    res->rc = lcb_respsubdoc_status(resp);
    lcb_respsubdoc_cas(resp, &res->cas);
    const char* data = nullptr;
    size_t ndata = 0;
    lcb_respsubdoc_key(resp, &data, &ndata);
    res->key = std::string(data, ndata);

    size_t len = lcb_respsubdoc_result_size(resp);
    res->values.reserve(len);
    for (size_t idx = 0; idx < len; idx++) {
        data = nullptr;
        ndata = 0;
        lcb_STATUS status = lcb_respsubdoc_result_status(resp, idx);
        lcb_respsubdoc_result_value(resp, idx, &data, &ndata);
        if (data) {
            res->values.emplace_back(std::string(data, ndata), status);
        } else {
            res->values.emplace_back(status);
        }
    }
}
}

void
tp::collection::install_callbacks(lcb_st* lcb)
{
    lcb_install_callback(lcb, LCB_CALLBACK_REMOVE, reinterpret_cast<lcb_RESPCALLBACK>(remove_callback));
    lcb_install_callback(lcb, LCB_CALLBACK_SDLOOKUP, reinterpret_cast<lcb_RESPCALLBACK>(subdoc_callback));
    lcb_install_callback(lcb, LCB_CALLBACK_SDMUTATE, reinterpret_cast<lcb_RESPCALLBACK>(subdoc_callback));
}

tp::collection::collection(std::shared_ptr<tp::bucket> bucket, std::string scope, std::string name)
  : bucket_(std::move(bucket))
  , scope_(std::move(scope))
  , name_(std::move(name))
{
}

lcb_st*
tp::collection::instance()
{
    auto b = bucket_.lock();
    if (!b) {
        throw std::runtime_error("bucket of collection " + name_ + " has been closed");
    }
    return b->lcb_;
}

bool
tp::collection::set_collection() const
{
    return !(scope_ == bucket::default_name && name_ == bucket::default_name);
}

std::string
tp::collection::keyspace() const
{
    return n1ql_escape(bucket_name()) + "." + n1ql_escape(scope_) + "." + n1ql_escape(name_);
}

tp::result
tp::collection::remove(const std::string& id, const remove_options& opts)
{
    lcb_CMDREMOVE* cmd;
    lcb_cmdremove_create(&cmd);
    lcb_cmdremove_key(cmd, id.data(), id.size());
    if (set_collection()) {
        lcb_cmdremove_collection(cmd, scope_.data(), scope_.size(), name_.data(), name_.size());
    }
    auto timeout = opts.timeout() ? opts.timeout() : bucket_.lock()->default_kv_timeout();
    if (timeout) {
        lcb_cmdremove_timeout(cmd, static_cast<uint32_t>(timeout->count()));
    }
    auto lcb = instance();
    result res;
    lcb_STATUS rc = lcb_remove(lcb, reinterpret_cast<void*>(&res), cmd);
    lcb_cmdremove_destroy(cmd);
    if (rc != LCB_SUCCESS) {
        res.rc = rc;
        throw client_error("failed to remove (sched) document", res);
    }
    lcb_wait(lcb, LCB_WAIT_DEFAULT);
    tp::client_log->trace("remove {} returning rc={} ({}), cas={}", res.key, res.rc, res.strerror(), res.cas);
    return res;
}

tp::result
tp::collection::mutate_in(const std::string& id, std::vector<mutate_in_spec> specs, const mutate_in_options& opts)
{
    lcb_CMDSUBDOC* cmd;
    lcb_cmdsubdoc_create(&cmd);
    lcb_cmdsubdoc_key(cmd, id.data(), id.size());
    if (set_collection()) {
        lcb_cmdsubdoc_collection(cmd, scope_.data(), scope_.size(), name_.data(), name_.size());
    }
    if (opts.cas()) {
        lcb_cmdsubdoc_cas(cmd, *opts.cas());
    }
    auto timeout = opts.timeout() ? opts.timeout() : bucket_.lock()->default_kv_timeout();
    if (timeout) {
        lcb_cmdsubdoc_timeout(cmd, static_cast<uint32_t>(timeout->count()));
    }
    lcb_SUBDOCSPECS* ops;
    lcb_subdocspecs_create(&ops, specs.size());
    size_t idx = 0;
    for (const auto& spec : specs) {
        switch (spec.type_) {
            case mutate_in_spec_type::MUTATE_IN_UPSERT:
                lcb_subdocspecs_dict_upsert(
                  ops, idx++, spec.flags_, spec.path_.data(), spec.path_.size(), spec.value_.data(), spec.value_.size());
                break;
        }
    }
    lcb_cmdsubdoc_specs(cmd, ops);
    lcb_cmdsubdoc_store_semantics(cmd, LCB_SUBDOC_STORE_REPLACE);
    auto lcb = instance();
    result res;
    lcb_STATUS rc = lcb_subdoc(lcb, reinterpret_cast<void*>(&res), cmd);
    lcb_cmdsubdoc_destroy(cmd);
    lcb_subdocspecs_destroy(ops);
    if (rc != LCB_SUCCESS) {
        res.rc = rc;
        throw client_error("failed to mutate (sched) sub-document", res);
    }
    lcb_wait(lcb, LCB_WAIT_DEFAULT);
    // LCB returns LCB_ERR_DOCUMENT_EXISTS when it should return LCB_ERR_CAS_MISMATCH
    // for mutate_in with replace semantics (CCBC-1323).
    if (res.rc == LCB_ERR_DOCUMENT_EXISTS) {
        res.rc = LCB_ERR_CAS_MISMATCH;
    }
    res.ignore_subdoc_errors = false;
    tp::client_log->trace("mutate_in {} returning rc={} ({}), cas={}", res.key, res.rc, res.strerror(), res.cas);
    return res;
}

tp::result
tp::collection::lookup_in(const std::string& id, std::vector<lookup_in_spec> specs, const lookup_in_options& opts)
{
    lcb_CMDSUBDOC* cmd;
    lcb_cmdsubdoc_create(&cmd);
    lcb_cmdsubdoc_key(cmd, id.data(), id.size());
    if (set_collection()) {
        lcb_cmdsubdoc_collection(cmd, scope_.data(), scope_.size(), name_.data(), name_.size());
    }
    auto timeout = opts.timeout() ? opts.timeout() : bucket_.lock()->default_kv_timeout();
    if (timeout) {
        lcb_cmdsubdoc_timeout(cmd, static_cast<uint32_t>(timeout->count()));
    }
    lcb_SUBDOCSPECS* ops;
    lcb_subdocspecs_create(&ops, specs.size());
    size_t idx = 0;
    for (const auto& spec : specs) {
        switch (spec.type_) {
            case lookup_in_spec_type::LOOKUP_IN_GET:
                lcb_subdocspecs_get(ops, idx++, spec.flags_, spec.path_.data(), spec.path_.size());
                break;
        }
    }
    lcb_cmdsubdoc_specs(cmd, ops);
    auto lcb = instance();
    result res;
    lcb_STATUS rc = lcb_subdoc(lcb, reinterpret_cast<void*>(&res), cmd);
    lcb_cmdsubdoc_destroy(cmd);
    lcb_subdocspecs_destroy(ops);
    if (rc != LCB_SUCCESS) {
        res.rc = rc;
        throw client_error("failed to lookup (sched) sub-document", res);
    }
    lcb_wait(lcb, LCB_WAIT_DEFAULT);
    res.ignore_subdoc_errors = true;
    tp::client_log->trace("lookup_in {} returning rc={} ({}), cas={}", res.key, res.rc, res.strerror(), res.cas);
    return res;
}
