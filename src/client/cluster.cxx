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

#include <txnpurge/client/bucket.hxx>
#include <txnpurge/client/cluster.hxx>
#include <txnpurge/client/exceptions.hxx>
#include <txnpurge/client/result.hxx>
#include <txnpurge/logging.hxx>
#include <txnpurge/support.hxx>

#include <libcouchbase/couchbase.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <utility>

#include "connection.hxx"

namespace tp = txnpurge;

void
tp::shutdown(lcb_st* lcb)
{
    if (lcb == nullptr) {
        return;
    }
    lcb_destroy(lcb);
}

lcb_st*
tp::connect(const std::string& cluster_address, const std::string& user_name, const std::string& password)
{
    lcb_st* lcb = nullptr;
    lcb_STATUS rc;
    lcb_CREATEOPTS* opts;
    lcb_createopts_create(&opts, LCB_TYPE_CLUSTER);
    lcb_createopts_connstr(opts, cluster_address.c_str(), cluster_address.size());
    if (!user_name.empty()) {
        lcb_createopts_credentials(opts, user_name.c_str(), user_name.size(), password.c_str(), password.size());
    }
    rc = lcb_create(&lcb, opts);
    lcb_createopts_destroy(opts);
    if (rc != LCB_SUCCESS) {
        throw connection_error(std::string("failed to create libcouchbase instance: ") + lcb_strerror_short(rc));
    }

    rc = lcb_connect(lcb);
    if (rc != LCB_SUCCESS) {
        lcb_destroy(lcb);
        throw connection_error(std::string("failed to connect (sched) libcouchbase instance: ") + lcb_strerror_short(rc));
    }
    lcb_wait(lcb, LCB_WAIT_DEFAULT);
    rc = lcb_get_bootstrap_status(lcb);
    if (rc != LCB_SUCCESS) {
        lcb_destroy(lcb);
        throw connection_error(std::string("failed to connect (wait) libcouchbase instance: ") + lcb_strerror_short(rc));
    }
    client_log->trace("cluster connection successful, returning {}", (void*)lcb);
    return lcb;
}

tp::cluster::cluster(std::string cluster_address, std::string user_name, std::string password, const cluster_options& opts)
  : lcb_(nullptr)
  , cluster_address_(std::move(cluster_address))
  , user_name_(std::move(user_name))
  , password_(std::move(password))
  , options_(opts)
{
    client_log->info("txnpurge {} attempting to connect to {}", TXNPURGE_VERSION_STR, cluster_address_);
    lcb_ = connect(cluster_address_, user_name_, password_);
}

tp::cluster::~cluster()
{
    open_buckets_.clear();
    shutdown(lcb_);
}

std::shared_ptr<tp::bucket>
tp::cluster::bucket(const std::string& name)
{
    auto it =
      std::find_if(open_buckets_.begin(), open_buckets_.end(), [&](const std::shared_ptr<tp::bucket>& b) { return b->name() == name; });
    if (it != open_buckets_.end()) {
        return *it;
    }
    client_log->trace("will open bucket {} now...", name);
    auto lcb = connect(cluster_address_, user_name_, password_);
    auto b = std::shared_ptr<tp::bucket>(new tp::bucket(lcb, name, options_));
    open_buckets_.push_back(b);
    return b;
}

extern "C" {
static void
http_callback(lcb_INSTANCE*, int, const lcb_RESPHTTP* resp)
{
    tp::http_result* res = nullptr;
    lcb_resphttp_cookie(resp, reinterpret_cast<void**>(&res));
    res->rc = lcb_resphttp_status(resp);
    lcb_resphttp_http_status(resp, &res->http_status);
    const char* data = nullptr;
    size_t ndata = 0;
    lcb_resphttp_body(resp, &data, &ndata);
    if (data != nullptr) {
        res->raw_value.assign(data, ndata);
    }
}
}

tp::http_result
tp::cluster::http(int method, const std::string& path, const std::string& body)
{
    lcb_CMDHTTP* cmd;
    lcb_cmdhttp_create(&cmd, LCB_HTTP_TYPE_MANAGEMENT);
    lcb_cmdhttp_method(cmd, static_cast<lcb_HTTP_METHOD>(method));
    lcb_cmdhttp_path(cmd, path.data(), path.size());
    if (!body.empty()) {
        static const std::string content_type = "application/x-www-form-urlencoded";
        lcb_cmdhttp_content_type(cmd, content_type.data(), content_type.size());
        lcb_cmdhttp_body(cmd, body.data(), body.size());
    }
    lcb_install_callback(lcb_, LCB_CALLBACK_HTTP, reinterpret_cast<lcb_RESPCALLBACK>(http_callback));
    http_result res;
    lcb_STATUS rc = lcb_http(lcb_, &res, cmd);
    lcb_cmdhttp_destroy(cmd);
    if (rc != LCB_SUCCESS) {
        throw std::runtime_error(std::string("failed to schedule http request: ") + lcb_strerror_short(rc));
    }
    lcb_wait(lcb_, LCB_WAIT_DEFAULT);
    client_log->trace("{} returned {}", path, res.http_status);
    return res;
}

std::vector<std::string>
tp::cluster::collection_names(const std::string& bucket_name, const std::string& scope_name)
{
    auto res = http(LCB_HTTP_METHOD_GET, "/pools/default/buckets/" + bucket_name + "/scopes");
    if (!res.is_success()) {
        throw std::runtime_error("failed to retrieve collection manifest for " + bucket_name + ": " + res.strerror());
    }
    std::vector<std::string> names;
    try {
        auto manifest = nlohmann::json::parse(res.raw_value);
        for (const auto& scope : manifest.at("scopes")) {
            if (scope.at("name").get<std::string>() != scope_name) {
                continue;
            }
            for (const auto& coll : scope.at("collections")) {
                names.push_back(coll.at("name").get<std::string>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("malformed collection manifest for " + bucket_name + ": " + e.what());
    }
    return names;
}

void
tp::cluster::compact_bucket(const std::string& bucket_name)
{
    auto res = http(LCB_HTTP_METHOD_POST, "/pools/default/buckets/" + bucket_name + "/controller/compactBucket");
    if (!res.is_success()) {
        throw std::runtime_error("failed to compact bucket " + bucket_name + ": " + res.strerror());
    }
    client_log->info("compaction of {} started", bucket_name);
}
