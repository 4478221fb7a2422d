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
#include "prompt.hxx"

#include <txnpurge/logging.hxx>
#include <txnpurge/purge/exceptions.hxx>

#include <exception>

namespace txnpurge
{
namespace tool
{
    int run(int argc,
            const char* const argv[],
            std::istream& in,
            std::ostream& out,
            std::ostream& err,
            const purge_runner& runner)
    {
        tool_options args;
        try {
            args = parse_command_line(argc, argv);
        } catch (const command_line_error& e) {
            err << "error: " << e.what() << std::endl << std::endl << usage();
            return 2;
        }
        if (args.help) {
            out << usage();
            return 0;
        }
        create_loggers(args.level);

        purge::purge_config config;
        if (!args.config_file.empty()) {
            try {
                config = purge::purge_config::from_file(args.config_file);
            } catch (const purge::purge_error& e) {
                purge_log->error("config: {}", e.what());
                return 2;
            }
        }
        config.fix_machines(config.fix_machines() && args.fix_machines)
          .prune(config.prune() && args.prune)
          .compact(config.compact() && args.compact);

        if (args.prompt && !prompt_yes_no(CONTROLLER_PROMPT, in, out)) {
            return 0;
        }

        try {
            auto result = runner(args, config);
            return result.success() ? 0 : 1;
        } catch (const std::exception& e) {
            purge_log->error("connect: {}", e.what());
            return 1;
        }
    }
} // namespace tool
} // namespace txnpurge
