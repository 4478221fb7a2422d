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

#include <txnpurge/purge/known_transactions.hxx>

using namespace txnpurge::purge;

TEST(KnownTransactions, BuildsFromLogAndStash)
{
    memory_database db;
    db.put_txn("txns", "a1", 6).put_txn("txns", "a2", 2).put_txn("txns", "a3", 5);
    db.put_txn("txns.stash", "s1", 0);
    purge_config config;
    auto known = known_transactions::build(db, config);
    ASSERT_EQ(4u, known.size());
    ASSERT_EQ(1u, known.stashed());
    ASSERT_TRUE(known.contains("a1"));
    ASSERT_TRUE(known.contains("s1"));
    ASSERT_FALSE(known.contains("b1"));
    ASSERT_EQ(txn_state::APPLIED, *known.state("a1"));
    ASSERT_EQ(txn_state::STASHED, *known.state("s1"));
    ASSERT_FALSE(known.state("b1"));
}

TEST(KnownTransactions, LogStateWinsOverStash)
{
    memory_database db;
    db.put_txn("txns", "a1", 6);
    db.put_txn("txns.stash", "a1", 0);
    purge_config config;
    auto known = known_transactions::build(db, config);
    ASSERT_EQ(1u, known.size());
    ASSERT_EQ(0u, known.stashed());
    ASSERT_TRUE(known.is_applied("a1"));
}

TEST(KnownTransactions, MissingLogIsAnError)
{
    memory_database db;
    db.put_txn("txns.stash", "s1", 0);
    purge_config config;
    try {
        auto known = known_transactions::build(db, config);
        FAIL() << "expected purge_error";
    } catch (const purge_error& e) {
        ASSERT_EQ(FAIL_READ, e.ec());
        ASSERT_NE(std::string::npos, std::string(e.what()).find("txns"));
    }
}

TEST(KnownTransactions, EmptyLogAndMissingStashGiveEmptyIndex)
{
    memory_database db;
    db.add_collection("txns");
    purge_config config;
    auto known = known_transactions::build(db, config);
    ASSERT_EQ(0u, known.size());
    ASSERT_EQ(0u, known.stashed());
}

TEST(KnownTransactions, ReadFailureAbortsBuild)
{
    memory_database db;
    db.put_txn("txns", "a1", 6);
    db.fail_scan.insert("txns.stash");
    purge_config config;
    try {
        auto known = known_transactions::build(db, config);
        FAIL() << "expected purge_error";
    } catch (const purge_error& e) {
        ASSERT_EQ(FAIL_READ, e.ec());
    }
}

TEST(KnownTransactions, OutstandingMeansKnownAndNotTerminal)
{
    known_transactions known({ { "prep", txn_state::PREPARING },
                               { "applying", txn_state::APPLYING },
                               { "done", txn_state::APPLIED },
                               { "aborted", txn_state::ABORTED },
                               { "odd", txn_state::UNKNOWN } },
                             { "stashed" });
    ASSERT_TRUE(known.is_outstanding("prep"));
    ASSERT_TRUE(known.is_outstanding("applying"));
    ASSERT_TRUE(known.is_outstanding("stashed"));
    ASSERT_TRUE(known.is_outstanding("odd"));
    ASSERT_FALSE(known.is_outstanding("done"));
    ASSERT_FALSE(known.is_outstanding("aborted"));
    ASSERT_FALSE(known.is_outstanding("missing"));

    ASSERT_TRUE(known.is_applied("done"));
    ASSERT_FALSE(known.is_applied("aborted"));
    ASSERT_FALSE(known.is_applied("missing"));
}
