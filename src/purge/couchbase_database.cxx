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

#include <txnpurge/client/collection.hxx>
#include <txnpurge/client/exceptions.hxx>
#include <txnpurge/client/lookup_in_spec.hxx>
#include <txnpurge/client/mutate_in_spec.hxx>
#include <txnpurge/logging.hxx>
#include <txnpurge/purge/couchbase_database.hxx>
#include <txnpurge/purge/exceptions.hxx>

#include <libcouchbase/couchbase.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <deque>
#include <functional>
#include <utility>

namespace tp = txnpurge;

namespace
{
std::vector<std::string>
queue_from_json(const nlohmann::json& value, const std::string& id)
{
    std::vector<std::string> queue;
    if (!value.is_array()) {
        return queue;
    }
    for (const auto& entry : value) {
        if (!entry.is_string()) {
            throw tp::purge::purge_error(tp::purge::FAIL_READ, "document " + id + " has a non-string queue entry " + entry.dump());
        }
        queue.push_back(entry.get<std::string>());
    }
    return queue;
}

/**
 * Keyset pagination over a collection: each page asks for the keys after the last one seen,
 * so documents rewritten while the scan is running are neither skipped nor seen twice.
 */
template<typename T>
class paged_cursor : public tp::purge::cursor<T>
{
  public:
    using row_parser = std::function<T(const nlohmann::json&)>;

  private:
    std::shared_ptr<tp::bucket> bucket_;
    std::string statement_;
    std::string keyspace_;
    row_parser parse_;
    std::deque<T> page_;
    std::string last_id_;
    size_t page_size_;
    bool exhausted_{ false };

    void fetch()
    {
        tp::query_options opts;
        opts.request_plus(true).readonly(true).add_positional_parameter(last_id_);
        auto res = bucket_->query(statement_, opts);
        if (res.is_keyspace_not_found()) {
            tp::purge_log->debug("{} does not exist, nothing to scan", keyspace_);
            exhausted_ = true;
            return;
        }
        if (!res.is_success()) {
            throw tp::purge::purge_error(tp::purge::FAIL_READ, "failed to scan " + keyspace_ + ": " + res.strerror());
        }
        for (const auto& raw : res.rows) {
            try {
                page_.push_back(parse_(nlohmann::json::parse(raw)));
            } catch (const nlohmann::json::exception& e) {
                throw tp::purge::purge_error(tp::purge::FAIL_READ, "malformed row from " + keyspace_ + ": " + e.what());
            }
            last_id_ = page_.back().id;
        }
        exhausted_ = res.rows.size() < page_size_;
    }

  public:
    paged_cursor(std::shared_ptr<tp::bucket> bucket, std::string statement, std::string keyspace, row_parser parse, size_t page_size)
      : bucket_(std::move(bucket))
      , statement_(std::move(statement))
      , keyspace_(std::move(keyspace))
      , parse_(std::move(parse))
      , page_size_(page_size)
    {
    }

    bool next(T& item) override
    {
        if (page_.empty() && !exhausted_) {
            fetch();
        }
        if (page_.empty()) {
            return false;
        }
        item = std::move(page_.front());
        page_.pop_front();
        return true;
    }
};
} // namespace

tp::purge::couchbase_database::couchbase_database(tp::cluster& c,
                                                  const std::string& bucket_name,
                                                  const std::string& scope,
                                                  const purge_config& config)
  : cluster_(c)
  , bucket_(c.bucket(bucket_name))
  , scope_(scope.empty() ? bucket::default_name : scope)
  , page_size_(config.scan_page_size())
{
}

std::vector<std::string>
tp::purge::couchbase_database::collection_names()
{
    try {
        return cluster_.collection_names(bucket_->name(), scope_);
    } catch (const std::runtime_error& e) {
        throw purge_error(FAIL_CATALOG, e.what());
    }
}

bool
tp::purge::couchbase_database::has_collection(const std::string& collection)
{
    auto names = collection_names();
    return std::find(names.begin(), names.end(), collection) != names.end();
}

std::unique_ptr<tp::purge::document_cursor>
tp::purge::couchbase_database::scan_queues(const std::string& collection, const std::string& field)
{
    auto keyspace = bucket_->collection(scope_, collection)->keyspace();
    auto queue = "d." + n1ql_escape(field);
    auto statement = "SELECT META(d).id AS id, META(d).cas AS cas, " + queue + " AS queue FROM " + keyspace +
                     " AS d WHERE META(d).id > $1 AND IS_ARRAY(" + queue + ") AND ARRAY_LENGTH(" + queue +
                     ") > 0 ORDER BY META(d).id LIMIT " + std::to_string(page_size_);
    return std::unique_ptr<document_cursor>(new paged_cursor<queued_document>(
      bucket_,
      statement,
      keyspace,
      [](const nlohmann::json& row) {
          queued_document doc;
          doc.id = row.at("id").get<std::string>();
          doc.cas = row.at("cas").get<uint64_t>();
          doc.queue = queue_from_json(row.at("queue"), doc.id);
          return doc;
      },
      page_size_));
}

std::unique_ptr<tp::purge::txn_cursor>
tp::purge::couchbase_database::scan_transactions(const std::string& collection)
{
    auto keyspace = bucket_->collection(scope_, collection)->keyspace();
    auto statement = "SELECT META(t).id AS id, t.s AS s FROM " + keyspace + " AS t WHERE META(t).id > $1 ORDER BY META(t).id LIMIT " +
                     std::to_string(page_size_);
    return std::unique_ptr<txn_cursor>(new paged_cursor<txn_record>(
      bucket_,
      statement,
      keyspace,
      [](const nlohmann::json& row) {
          txn_record rec;
          rec.id = row.at("id").get<std::string>();
          auto s = row.find("s");
          if (s != row.end() && s->is_number_integer()) {
              rec.state = txn_state_value(s->get<int>());
          }
          return rec;
      },
      page_size_));
}

boost::optional<tp::purge::queued_document>
tp::purge::queue_from_lookup(const result& res, const std::string& collection, const std::string& id)
{
    if (res.is_not_found() || res.is_collection_not_found()) {
        return {};
    }
    if (!res.is_success()) {
        throw purge_error(FAIL_READ, "failed to read " + collection + "/" + id + ": " + res.strerror());
    }
    queued_document doc;
    doc.id = id;
    doc.cas = res.cas;
    if (!res.values.empty() && res.values[0].status == LCB_SUCCESS && res.values[0].has_value()) {
        try {
            doc.queue = queue_from_json(nlohmann::json::parse(res.values[0].raw_value), id);
        } catch (const nlohmann::json::exception& e) {
            throw purge_error(FAIL_READ, "malformed queue in " + collection + "/" + id + ": " + e.what());
        }
    }
    return doc;
}

boost::optional<tp::purge::queued_document>
tp::purge::couchbase_database::find_queue(const std::string& collection, const std::string& id, const std::string& field)
{
    auto coll = bucket_->collection(scope_, collection);
    result res;
    try {
        res = coll->lookup_in(id, { lookup_in_spec::get(field) });
    } catch (const client_error& e) {
        res = e.res();
    } catch (const std::runtime_error& e) {
        throw purge_error(FAIL_READ, e.what());
    }
    return queue_from_lookup(res, collection, id);
}

void
tp::purge::couchbase_database::replace_queue(const std::string& collection,
                                             const queued_document& doc,
                                             const std::string& field,
                                             const std::vector<std::string>& queue)
{
    auto coll = bucket_->collection(scope_, collection);
    result res;
    try {
        res = coll->mutate_in(doc.id, { mutate_in_spec::upsert(field, queue) }, mutate_in_options().cas(doc.cas));
    } catch (const std::runtime_error& e) {
        throw purge_error(FAIL_WRITE, e.what());
    }
    if (res.is_cas_mismatch() || res.is_not_found()) {
        throw concurrent_modification("document " + collection + "/" + doc.id + " changed while it was being purged");
    }
    if (!res.is_success()) {
        throw purge_error(FAIL_WRITE, "failed to update " + collection + "/" + doc.id + ": " + res.strerror());
    }
}

bool
tp::purge::couchbase_database::remove_document(const std::string& collection, const std::string& id)
{
    auto coll = bucket_->collection(scope_, collection);
    result res;
    try {
        res = coll->remove(id);
    } catch (const std::runtime_error& e) {
        throw purge_error(FAIL_WRITE, e.what());
    }
    if (res.is_not_found()) {
        return false;
    }
    if (!res.is_success()) {
        throw purge_error(FAIL_WRITE, "failed to remove " + collection + "/" + id + ": " + res.strerror());
    }
    return true;
}

void
tp::purge::couchbase_database::compact()
{
    try {
        cluster_.compact_bucket(bucket_->name());
    } catch (const std::runtime_error& e) {
        throw purge_error(FAIL_EXTERNAL, e.what());
    }
}
