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

#include "memory_database.hxx"

#include <txnpurge/purge/txn_pruner.hxx>

using namespace txnpurge::purge;

TEST(TxnPruner, RemovesTerminalUnreferencedRecords)
{
    memory_database db;
    db.put_txn("txns", "applied", 6)
      .put_txn("txns", "aborted", 5)
      .put_txn("txns", "preparing", 1)
      .put_txn("txns", "applying", 4)
      .put_txn("txns", "garbled", 42);
    purge_config config;
    auto stats = prune_transactions(db, {}, config);
    ASSERT_EQ(5u, stats.scanned);
    ASSERT_EQ(2u, stats.removed);
    ASSERT_FALSE(db.exists("txns", "applied"));
    ASSERT_FALSE(db.exists("txns", "aborted"));
    ASSERT_TRUE(db.exists("txns", "preparing"));
    ASSERT_TRUE(db.exists("txns", "applying"));
    ASSERT_TRUE(db.exists("txns", "garbled"));
}

TEST(TxnPruner, KeepsReferencedRecords)
{
    memory_database db;
    db.put_txn("txns", "t1", 6).put_txn("txns", "t2", 6).put_txn("txns", "t3", 5);
    db.put("machines", "0", { "t1_abc" });
    db.put("units", "u/0", { "t3_abc" });
    purge_config config;
    auto stats = prune_transactions(db, { "machines", "units" }, config);
    ASSERT_EQ(2u, stats.referenced);
    ASSERT_EQ(1u, stats.removed);
    ASSERT_TRUE(db.exists("txns", "t1"));
    ASSERT_FALSE(db.exists("txns", "t2"));
    ASSERT_TRUE(db.exists("txns", "t3"));
}

TEST(TxnPruner, OnlyScansTheGivenCollections)
{
    memory_database db;
    db.put_txn("txns", "t1", 6);
    db.put("other", "0", { "t1_abc" });
    purge_config config;
    prune_transactions(db, { "machines" }, config);
    ASSERT_FALSE(db.exists("txns", "t1"));
}

TEST(TxnPruner, NeverTouchesTheStash)
{
    memory_database db;
    db.put_txn("txns.stash", "t1", 6);
    purge_config config;
    prune_transactions(db, {}, config);
    ASSERT_TRUE(db.exists("txns.stash", "t1"));
}

TEST(TxnPruner, SecondRunRemovesNothing)
{
    memory_database db;
    db.put_txn("txns", "t1", 6).put_txn("txns", "t2", 2);
    purge_config config;
    prune_transactions(db, {}, config);
    auto stats = prune_transactions(db, {}, config);
    ASSERT_EQ(1u, stats.scanned);
    ASSERT_EQ(0u, stats.removed);
    ASSERT_EQ(1u, db.removes);
}

TEST(TxnPruner, RecordRemovedConcurrentlyIsNotAnError)
{
    class vanishing_database : public memory_database
    {
      public:
        std::unique_ptr<txn_cursor> scan_transactions(const std::string& collection) override
        {
            auto records = memory_database::scan_transactions(collection);
            memory_database::remove_document(collection, "t1");
            removes = 0;
            return records;
        }
    };
    vanishing_database db;
    db.put_txn("txns", "t1", 6).put_txn("txns", "t2", 6);
    purge_config config;
    auto stats = prune_transactions(db, {}, config);
    ASSERT_EQ(2u, stats.scanned);
    ASSERT_EQ(1u, stats.removed);
}

TEST(TxnPruner, ReadFailurePropagates)
{
    memory_database db;
    db.put_txn("txns", "t1", 6);
    db.fail_scan.insert("machines");
    purge_config config;
    ASSERT_THROW(prune_transactions(db, { "machines" }, config), purge_error);
    ASSERT_TRUE(db.exists("txns", "t1"));
}
