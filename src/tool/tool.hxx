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


#pragma once

#include "command_line.hxx"

#include <txnpurge/purge/pipeline.hxx>
#include <txnpurge/purge/purge_config.hxx>

#include <functional>
#include <istream>
#include <ostream>

namespace txnpurge
{
namespace tool
{
    /**
     * Connects to the database described by the options and runs the pipeline with the
     * given configuration.
     */
    using purge_runner = std::function<purge::pipeline_result(const tool_options&, const purge::purge_config&)>;

    /**
     * @brief Run the tool and return its exit status.
     *
     * 0 when the pipeline succeeds, when help is shown, or when the prompt is declined.  1 when
     * the pipeline fails or the runner throws.  2 for a bad command line or configuration file.
     *
     * The --no-* switches can only turn stages off; a stage the configuration file disables
     * stays disabled.
     */
    int run(int argc,
            const char* const argv[],
            std::istream& in,
            std::ostream& out,
            std::ostream& err,
            const purge_runner& runner);
} // namespace tool
} // namespace txnpurge
