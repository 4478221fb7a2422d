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

#include <txnpurge/purge/txn_state.hxx>

using namespace txnpurge::purge;

TEST(TxnToken, IdIsTextBeforeFirstUnderscore)
{
    ASSERT_EQ("5a2f0c", txn_id_from_token("5a2f0c_9ad2b1e6"));
    ASSERT_EQ("abc", txn_id_from_token("abc_def_ghi"));
}

TEST(TxnToken, TokenWithoutNonceIsAllId)
{
    ASSERT_EQ("5a2f0c", txn_id_from_token("5a2f0c"));
    ASSERT_EQ("", txn_id_from_token(""));
    ASSERT_EQ("", txn_id_from_token("_nonce"));
}

TEST(TxnState, ParsesProtocolCodes)
{
    ASSERT_EQ(txn_state::PREPARING, txn_state_value(1));
    ASSERT_EQ(txn_state::PREPARED, txn_state_value(2));
    ASSERT_EQ(txn_state::ABORTING, txn_state_value(3));
    ASSERT_EQ(txn_state::APPLYING, txn_state_value(4));
    ASSERT_EQ(txn_state::ABORTED, txn_state_value(5));
    ASSERT_EQ(txn_state::APPLIED, txn_state_value(6));
    ASSERT_EQ(txn_state::UNKNOWN, txn_state_value(0));
    ASSERT_EQ(txn_state::UNKNOWN, txn_state_value(7));
    ASSERT_EQ(txn_state::UNKNOWN, txn_state_value(100));
}

TEST(TxnState, OnlyAbortedAndAppliedAreTerminal)
{
    ASSERT_TRUE(is_terminal(txn_state::ABORTED));
    ASSERT_TRUE(is_terminal(txn_state::APPLIED));
    ASSERT_FALSE(is_terminal(txn_state::PREPARING));
    ASSERT_FALSE(is_terminal(txn_state::PREPARED));
    ASSERT_FALSE(is_terminal(txn_state::ABORTING));
    ASSERT_FALSE(is_terminal(txn_state::APPLYING));
    ASSERT_FALSE(is_terminal(txn_state::STASHED));
    ASSERT_FALSE(is_terminal(txn_state::UNKNOWN));
}

TEST(TxnState, Names)
{
    ASSERT_STREQ("APPLIED", txn_state_name(txn_state::APPLIED));
    ASSERT_STREQ("STASHED", txn_state_name(txn_state::STASHED));
}
