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


#include <gtest/gtest.h>

#include <txnpurge/purge/couchbase_database.hxx>
#include <txnpurge/purge/exceptions.hxx>

#include <libcouchbase/couchbase.h>

using namespace txnpurge;
using namespace txnpurge::purge;

namespace
{
result
lookup(uint32_t rc, uint32_t status = LCB_SUCCESS, const std::string& value = "")
{
    result res;
    res.rc = rc;
    res.cas = 42;
    res.key = "u/0";
    res.values.emplace_back(value, status);
    res.ignore_subdoc_errors = true;
    return res;
}
} // namespace

TEST(QueueLookup, ReadsQueueAndCas)
{
    auto doc = queue_from_lookup(lookup(LCB_SUCCESS, LCB_SUCCESS, R"(["t1_a","t2_b"])"), "units", "u/0");
    ASSERT_TRUE(doc);
    ASSERT_EQ("u/0", doc->id);
    ASSERT_EQ(42u, doc->cas);
    ASSERT_EQ((std::vector<std::string>{ "t1_a", "t2_b" }), doc->queue);
}

TEST(QueueLookup, MissingFieldIsEmptyQueue)
{
    auto doc = queue_from_lookup(lookup(LCB_SUCCESS, LCB_ERR_SUBDOC_PATH_NOT_FOUND), "units", "u/0");
    ASSERT_TRUE(doc);
    ASSERT_TRUE(doc->queue.empty());
}

TEST(QueueLookup, MissingDocumentIsNotFound)
{
    ASSERT_FALSE(queue_from_lookup(lookup(LCB_ERR_DOCUMENT_NOT_FOUND), "units", "u/0"));
}

TEST(QueueLookup, MissingCollectionIsNotFound)
{
    ASSERT_FALSE(queue_from_lookup(lookup(LCB_ERR_COLLECTION_NOT_FOUND), "units", "u/0"));
    ASSERT_FALSE(queue_from_lookup(lookup(LCB_ERR_SCOPE_NOT_FOUND), "units", "u/0"));
}

TEST(QueueLookup, OtherFailuresAreReadErrors)
{
    try {
        queue_from_lookup(lookup(LCB_ERR_TIMEOUT), "units", "u/0");
        FAIL() << "expected purge_error";
    } catch (const purge_error& e) {
        ASSERT_EQ(FAIL_READ, e.ec());
        ASSERT_NE(std::string::npos, std::string(e.what()).find("units/u/0"));
    }
}

TEST(QueueLookup, NonStringEntryIsReadError)
{
    try {
        queue_from_lookup(lookup(LCB_SUCCESS, LCB_SUCCESS, R"(["t1_a",7])"), "units", "u/0");
        FAIL() << "expected purge_error";
    } catch (const purge_error& e) {
        ASSERT_EQ(FAIL_READ, e.ec());
    }
}

TEST(QueueLookup, NonArrayFieldIsEmptyQueue)
{
    auto doc = queue_from_lookup(lookup(LCB_SUCCESS, LCB_SUCCESS, R"("t1_a")"), "units", "u/0");
    ASSERT_TRUE(doc);
    ASSERT_TRUE(doc->queue.empty());
}
