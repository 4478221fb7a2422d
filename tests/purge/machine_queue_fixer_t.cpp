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

#include <txnpurge/purge/machine_queue_fixer.hxx>

using namespace txnpurge::purge;

TEST(MachineQueueFixer, RemovesOnlyAppliedEntries)
{
    memory_database db;
    db.put("machines", "0", { "a_1", "p_1", "x_1", "r_1", "s_1" });
    purge_config config;
    known_transactions known({ { "a", txn_state::APPLIED }, { "p", txn_state::PREPARED }, { "r", txn_state::ABORTED } }, { "s" });
    auto stats = fix_machine_queues(db, known, config);
    // unknown entries belong to the orphan purge, aborted ones stay too
    std::vector<std::string> expected{ "p_1", "x_1", "r_1", "s_1" };
    ASSERT_EQ(expected, db.queue("machines", "0"));
    ASSERT_EQ(1u, stats.documents_updated);
    ASSERT_EQ(1u, stats.entries_removed);
}

TEST(MachineQueueFixer, LeavesOtherCollectionsAlone)
{
    memory_database db;
    db.put("units", "u/0", { "a_1" });
    db.put("machines", "0", { "a_2" });
    purge_config config;
    known_transactions known({ { "a", txn_state::APPLIED } }, {});
    fix_machine_queues(db, known, config);
    ASSERT_EQ(1u, db.queue("units", "u/0").size());
    ASSERT_TRUE(db.queue("machines", "0").empty());
}

TEST(MachineQueueFixer, NoMachinesCollection)
{
    memory_database db;
    purge_config config;
    known_transactions known({ { "a", txn_state::APPLIED } }, {});
    auto stats = fix_machine_queues(db, known, config);
    ASSERT_EQ(0u, stats.documents_scanned);
    ASSERT_EQ(0u, db.writes);
}

TEST(MachineQueueFixer, SecondRunWritesNothing)
{
    memory_database db;
    db.put("machines", "0", { "a_1", "p_1" });
    db.put("machines", "1", { "a_2" });
    purge_config config;
    known_transactions known({ { "a", txn_state::APPLIED }, { "p", txn_state::APPLYING } }, {});
    fix_machine_queues(db, known, config);
    ASSERT_EQ(2u, db.writes);
    fix_machine_queues(db, known, config);
    ASSERT_EQ(2u, db.writes);
}

TEST(MachineQueueFixer, UsesConfiguredCollection)
{
    memory_database db;
    db.put("hosts", "0", { "a_1" });
    purge_config config;
    config.machines_collection("hosts");
    known_transactions known({ { "a", txn_state::APPLIED } }, {});
    auto stats = fix_machine_queues(db, known, config);
    ASSERT_EQ(1u, stats.entries_removed);
}
