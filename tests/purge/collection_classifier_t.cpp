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

#include <txnpurge/purge/collection_classifier.hxx>

using namespace txnpurge::purge;

TEST(CollectionClassifier, ExcludesLogStashAndSystemCollections)
{
    purge_config config;
    std::vector<std::string> catalog{ "txns", "txns.stash", "machines", "units", "system.indexes" };
    auto collections = purgeable_collections(catalog, config);
    std::vector<std::string> expected{ "machines", "units" };
    ASSERT_EQ(expected, collections);
}

TEST(CollectionClassifier, KeepsCatalogOrder)
{
    purge_config config;
    std::vector<std::string> catalog{ "units", "system.js", "applications", "txns", "machines" };
    std::vector<std::string> expected{ "units", "applications", "machines" };
    ASSERT_EQ(expected, purgeable_collections(catalog, config));
}

TEST(CollectionClassifier, EmptyCatalog)
{
    purge_config config;
    ASSERT_TRUE(purgeable_collections({}, config).empty());
}

TEST(CollectionClassifier, AnythingUnderTheLogIsExcluded)
{
    purge_config config;
    ASSERT_FALSE(is_purgeable_collection("txns", config));
    ASSERT_FALSE(is_purgeable_collection("txns.stash", config));
    ASSERT_FALSE(is_purgeable_collection("txns.log", config));
    // only the separator makes it part of the log
    ASSERT_TRUE(is_purgeable_collection("txnsfoo", config));
    ASSERT_TRUE(is_purgeable_collection("mytxns", config));
}

TEST(CollectionClassifier, ReservedPrefixes)
{
    purge_config config;
    ASSERT_FALSE(is_purgeable_collection("system.users", config));
    ASSERT_TRUE(is_purgeable_collection("systemx", config));

    config.reserved_prefixes({ "system.", "_" });
    ASSERT_FALSE(is_purgeable_collection("_system", config));
    ASSERT_TRUE(is_purgeable_collection("units", config));
}

TEST(CollectionClassifier, StashWithoutSeparator)
{
    purge_config config;
    config.txns_separator("_").stash_collection("txns_stash");
    std::vector<std::string> catalog{ "_default", "txns", "txns_stash", "machines" };
    std::vector<std::string> expected{ "_default", "machines" };
    ASSERT_EQ(expected, purgeable_collections(catalog, config));
}

TEST(CollectionClassifier, ConfiguredStashIsExcludedByName)
{
    purge_config config;
    config.stash_collection("stash");
    ASSERT_FALSE(is_purgeable_collection("stash", config));
    ASSERT_TRUE(is_purgeable_collection("stash2", config));
}
