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

#include <txnpurge/purge/exceptions.hxx>
#include <txnpurge/purge/purge_config.hxx>

#include <cstdio>
#include <fstream>

using namespace txnpurge::purge;

TEST(PurgeConfig, Defaults)
{
    purge_config config;
    ASSERT_EQ("txns", config.txns_collection());
    ASSERT_EQ("txns.stash", config.stash_collection());
    ASSERT_EQ(".", config.txns_separator());
    ASSERT_EQ(std::vector<std::string>{ "system." }, config.reserved_prefixes());
    ASSERT_EQ("machines", config.machines_collection());
    ASSERT_EQ("txn-queue", config.queue_field());
    ASSERT_EQ("controllers", config.singleton_collection());
    ASSERT_EQ("apiHostPorts", config.singleton_id());
    ASSERT_EQ(1000u, config.singleton_queue_limit());
    ASSERT_EQ(1000u, config.scan_page_size());
    ASSERT_TRUE(config.fix_machines());
    ASSERT_TRUE(config.prune());
    ASSERT_TRUE(config.compact());
}

TEST(PurgeConfig, FromJsonOverridesPresentKeys)
{
    auto config = purge_config::from_json(nlohmann::json::parse(R"({
        "stash_collection": "txns_stash",
        "singleton_queue_limit": 0,
        "reserved_prefixes": ["system.", "_"],
        "compact": false
    })"));
    ASSERT_EQ("txns_stash", config.stash_collection());
    ASSERT_EQ(0u, config.singleton_queue_limit());
    ASSERT_EQ(2u, config.reserved_prefixes().size());
    ASSERT_FALSE(config.compact());
    // untouched
    ASSERT_EQ("txns", config.txns_collection());
    ASSERT_TRUE(config.prune());
}

TEST(PurgeConfig, WrongTypeIsConfigError)
{
    try {
        purge_config::from_json(nlohmann::json::parse(R"({"prune": "no"})"));
        FAIL() << "expected purge_error";
    } catch (const purge_error& e) {
        ASSERT_EQ(FAIL_CONFIG, e.ec());
        ASSERT_NE(std::string::npos, std::string(e.what()).find("prune"));
    }
}

TEST(PurgeConfig, NegativeCountsAreConfigErrors)
{
    for (const char* key : { "singleton_queue_limit", "scan_page_size" }) {
        nlohmann::json conf;
        conf[key] = -1;
        try {
            purge_config::from_json(conf);
            FAIL() << "expected purge_error for " << key;
        } catch (const purge_error& e) {
            ASSERT_EQ(FAIL_CONFIG, e.ec());
            ASSERT_NE(std::string::npos, std::string(e.what()).find(key));
        }
    }
}

TEST(PurgeConfig, FractionalCountIsConfigError)
{
    ASSERT_THROW(purge_config::from_json(nlohmann::json::parse(R"({"singleton_queue_limit": 2.5})")), purge_error);
    auto config = purge_config::from_json(nlohmann::json::parse(R"({"singleton_queue_limit": 0, "scan_page_size": 7})"));
    ASSERT_EQ(0u, config.singleton_queue_limit());
    ASSERT_EQ(7u, config.scan_page_size());
}

TEST(PurgeConfig, RejectsNonObject)
{
    ASSERT_THROW(purge_config::from_json(nlohmann::json::parse("[1, 2]")), purge_error);
}

TEST(PurgeConfig, RejectsUnusableValues)
{
    ASSERT_THROW(purge_config::from_json(nlohmann::json::parse(R"({"txns_collection": ""})")), purge_error);
    ASSERT_THROW(purge_config::from_json(nlohmann::json::parse(R"({"queue_field": ""})")), purge_error);
    ASSERT_THROW(purge_config::from_json(nlohmann::json::parse(R"({"scan_page_size": 0})")), purge_error);
}

TEST(PurgeConfig, FromFile)
{
    std::string path = testing::TempDir() + "purge_config_t.json";
    {
        std::ofstream out(path);
        out << R"({"machines_collection": "hosts", "scan_page_size": 50})";
    }
    auto config = purge_config::from_file(path);
    ASSERT_EQ("hosts", config.machines_collection());
    ASSERT_EQ(50u, config.scan_page_size());
    std::remove(path.c_str());
}

TEST(PurgeConfig, MissingOrBrokenFile)
{
    ASSERT_THROW(purge_config::from_file(testing::TempDir() + "does-not-exist.json"), purge_error);
    std::string path = testing::TempDir() + "purge_config_broken_t.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    ASSERT_THROW(purge_config::from_file(path), purge_error);
    std::remove(path.c_str());
}
