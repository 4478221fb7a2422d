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

#include <txnpurge/purge/orphan_purger.hxx>

using namespace txnpurge::purge;

class OrphanPurgerTest : public ::testing::Test
{
  protected:
    memory_database db;
    purge_config config;
    known_transactions known{ { { "a1", txn_state::APPLIED }, { "a2", txn_state::PREPARED }, { "a3", txn_state::ABORTED } },
                              { "s1" } };

    void expect_all_known(const std::vector<std::string>& collections)
    {
        for (const auto& collection : collections) {
            auto docs = db.scan_queues(collection, config.queue_field());
            queued_document doc;
            while (docs->next(doc)) {
                for (const auto& token : doc.queue) {
                    EXPECT_TRUE(known.contains(txn_id_from_token(token))) << collection << "/" << doc.id << " has " << token;
                }
            }
        }
    }
};

TEST_F(OrphanPurgerTest, RemovesOnlyUnknownEntries)
{
    db.put("machines", "0", { "a1_x", "b1_y", "a2_z" });
    auto stats = purge_orphans(db, known, { "machines" }, config);
    std::vector<std::string> expected{ "a1_x", "a2_z" };
    ASSERT_EQ(expected, db.queue("machines", "0"));
    ASSERT_EQ(1u, stats.collections);
    ASSERT_EQ(1u, stats.documents_scanned);
    ASSERT_EQ(1u, stats.documents_updated);
    ASSERT_EQ(1u, stats.entries_removed);
}

TEST_F(OrphanPurgerTest, StashedTransactionsAreKnown)
{
    db.put("units", "u/0", { "s1_n", "zz_n" });
    purge_orphans(db, known, { "units" }, config);
    std::vector<std::string> expected{ "s1_n" };
    ASSERT_EQ(expected, db.queue("units", "u/0"));
}

TEST_F(OrphanPurgerTest, EmptiedQueueIsWrittenEmpty)
{
    db.put("units", "u/0", { "b1_x", "b2_y" });
    purge_orphans(db, known, { "units" }, config);
    ASSERT_TRUE(db.exists("units", "u/0"));
    ASSERT_TRUE(db.get("units", "u/0").has_queue);
    ASSERT_TRUE(db.queue("units", "u/0").empty());
}

TEST_F(OrphanPurgerTest, CleanDocumentsAreNotWritten)
{
    db.put("units", "u/0", { "a1_x" });
    db.put("units", "u/1", { "a2_x", "a3_y" });
    db.put_plain("units", "u/2");
    auto stats = purge_orphans(db, known, { "units" }, config);
    ASSERT_EQ(0u, db.writes);
    ASSERT_EQ(2u, stats.documents_scanned);
    ASSERT_EQ(0u, stats.documents_updated);
}

TEST_F(OrphanPurgerTest, PreservesOrderAndDuplicates)
{
    db.put("units", "u/0", { "a2_1", "b_1", "a1_1", "a2_2", "b_2", "a1_1" });
    purge_orphans(db, known, { "units" }, config);
    std::vector<std::string> expected{ "a2_1", "a1_1", "a2_2", "a1_1" };
    ASSERT_EQ(expected, db.queue("units", "u/0"));
}

TEST_F(OrphanPurgerTest, EveryQueueReferencesKnownTransactionsAfterwards)
{
    db.put("machines", "0", { "a1_x", "b1_y" });
    db.put("machines", "1", { "c1_y" });
    db.put("units", "u/0", { "a3_x", "a2_y", "d_q" });
    db.put("applications", "app", { "s1_q" });
    std::vector<std::string> collections{ "machines", "units", "applications" };
    auto stats = purge_orphans(db, known, collections, config);
    ASSERT_EQ(3u, stats.collections);
    ASSERT_EQ(4u, stats.documents_scanned);
    ASSERT_EQ(3u, stats.documents_updated);
    ASSERT_EQ(3u, stats.entries_removed);
    expect_all_known(collections);
}

TEST_F(OrphanPurgerTest, SecondRunWritesNothing)
{
    db.put("machines", "0", { "a1_x", "b1_y" });
    db.put("units", "u/0", { "c_q" });
    std::vector<std::string> collections{ "machines", "units" };
    purge_orphans(db, known, collections, config);
    auto writes = db.writes;
    auto stats = purge_orphans(db, known, collections, config);
    ASSERT_EQ(writes, db.writes);
    ASSERT_EQ(0u, stats.documents_updated);
}

TEST_F(OrphanPurgerTest, OnlyTheGivenCollectionsAreTouched)
{
    db.put("machines", "0", { "b1_y" });
    db.put("units", "u/0", { "b1_y" });
    purge_orphans(db, known, { "units" }, config);
    ASSERT_EQ(1u, db.queue("machines", "0").size());
    ASSERT_TRUE(db.queue("units", "u/0").empty());
}

TEST_F(OrphanPurgerTest, WriteFailureAborts)
{
    db.put("machines", "0", { "b1_y" });
    db.put("units", "u/0", { "b1_y" });
    db.fail_write.insert("machines");
    try {
        purge_orphans(db, known, { "machines", "units" }, config);
        FAIL() << "expected purge_error";
    } catch (const purge_error& e) {
        ASSERT_EQ(FAIL_WRITE, e.ec());
    }
    // nothing after the failing collection was processed
    ASSERT_EQ(1u, db.queue("units", "u/0").size());
}

TEST_F(OrphanPurgerTest, ReadFailureAborts)
{
    db.put("units", "u/0", { "b1_y" });
    db.fail_scan.insert("units");
    ASSERT_THROW(purge_orphans(db, known, { "units" }, config), purge_error);
}

TEST_F(OrphanPurgerTest, ConcurrentChangeIsReported)
{
    // a cursor that hands out a stale version of the document
    class stale_database : public memory_database
    {
      public:
        std::unique_ptr<document_cursor> scan_queues(const std::string& collection, const std::string& field) override
        {
            auto docs = memory_database::scan_queues(collection, field);
            touch(collection, "u/0");
            return docs;
        }
    };
    stale_database stale;
    stale.put("units", "u/0", { "b1_y" });
    try {
        purge_orphans(stale, known, { "units" }, config);
        FAIL() << "expected concurrent_modification";
    } catch (const concurrent_modification& e) {
        ASSERT_EQ(FAIL_CAS_MISMATCH, e.ec());
    }
    ASSERT_EQ(1u, stale.queue("units", "u/0").size());
}
