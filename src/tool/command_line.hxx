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

#include <txnpurge/logging.hxx>

#include <stdexcept>
#include <string>

namespace txnpurge
{
namespace tool
{
    struct tool_options {
        std::string hostname{ "localhost" };
        std::string port;
        bool ssl{ true };
        std::string username{ "admin" };
        std::string password;
        std::string bucket{ "juju" };
        std::string scope{ "_default" };
        std::string config_file;
        bool prompt{ true };
        bool fix_machines{ true };
        bool prune{ true };
        bool compact{ true };
        log_level level{ log_level::INFO };
        bool help{ false };
    };

    class command_line_error : public std::runtime_error
    {
      public:
        explicit command_line_error(const std::string& what)
          : std::runtime_error(what)
        {
        }
    };

    /**
     * @brief Parse the command line.
     *
     * Options are accepted with one dash as well as two (-yes, --yes).  When --help is given
     * nothing else is checked.
     *
     * @throws command_line_error for unknown options, bad values, or a user name without a
     *         password.
     */
    tool_options parse_command_line(int argc, const char* const argv[]);

    std::string usage();

    /**
     * @brief libcouchbase connection string for the options, e.g.
     * couchbases://localhost?ssl=no_verify
     *
     * The server certificate is never verified.  IPv6 addresses are bracketed.
     */
    std::string connection_string(const tool_options& opts);
} // namespace tool
} // namespace txnpurge
