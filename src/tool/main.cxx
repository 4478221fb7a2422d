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


#include "tool.hxx"

#include <txnpurge/client/cluster.hxx>
#include <txnpurge/purge/couchbase_database.hxx>

#include <chrono>
#include <iostream>

namespace tp = txnpurge;

int
main(int argc, char* argv[])
{
    return tp::tool::run(argc, argv, std::cin, std::cout, std::cerr, [](const tp::tool::tool_options& args, const tp::purge::purge_config& config) {
        tp::cluster_options opts;
        opts.kv_timeout(std::chrono::seconds(10)).query_timeout(std::chrono::seconds(75));
        tp::cluster cluster(tp::tool::connection_string(args), args.username, args.password, opts);
        tp::purge::couchbase_database db(cluster, args.bucket, args.scope, config);
        return tp::purge::purge_pipeline(db, config).run();
    });
}
