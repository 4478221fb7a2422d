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

#include "command_line.hxx"

#include <boost/program_options.hpp>

#include <sstream>

namespace po = boost::program_options;

namespace txnpurge
{
namespace tool
{
    namespace
    {
        po::options_description describe_options()
        {
            po::options_description options("options");
            // clang-format off
            options.add_options()
                ("help", "show this help and exit")
                ("hostname", po::value<std::string>()->default_value("localhost"), "hostname of the Couchbase server")
                ("port", po::value<std::string>()->default_value(""), "port of the Couchbase server (default: the scheme's)")
                ("ssl", po::value<bool>()->default_value(true), "use TLS to connect to Couchbase")
                ("username", po::value<std::string>()->default_value("admin"), "user for connecting to Couchbase (use \"\" for no authentication)")
                ("password", po::value<std::string>()->default_value(""), "password for connecting to Couchbase")
                ("bucket", po::value<std::string>()->default_value("juju"), "bucket holding the database")
                ("scope", po::value<std::string>()->default_value("_default"), "scope holding the collections")
                ("config", po::value<std::string>(), "JSON file with purge settings")
                ("yes", po::bool_switch(), "answer 'yes' to prompts")
                ("no-machines", po::bool_switch(), "skip removal of completed txn-queue entries from machines collection")
                ("no-prune", po::bool_switch(), "skip pruning of completed transactions")
                ("no-compact", po::bool_switch(), "skip compacting of database")
                ("verbose,v", po::bool_switch(), "log at debug level")
                ("log-level", po::value<std::string>()->default_value("info"), "trace, debug, info, warn, error, critical or off");
            // clang-format on
            return options;
        }

        std::string bracket_ipv6(const std::string& host)
        {
            if (host.find(':') != std::string::npos && host.front() != '[') {
                return "[" + host + "]";
            }
            return host;
        }
    } // namespace

    tool_options parse_command_line(int argc, const char* const argv[])
    {
        /* same style as mongo's tools: -option is accepted for --option */
        int style = (((po::command_line_style::unix_style ^ po::command_line_style::allow_guessing) |
                      po::command_line_style::allow_long_disguise) ^
                     po::command_line_style::allow_sticky);
        auto options = describe_options();
        po::variables_map params;
        try {
            po::store(po::command_line_parser(argc, argv).options(options).style(style).run(), params);
            po::notify(params);
        } catch (const po::error& e) {
            throw command_line_error(e.what());
        }

        tool_options opts;
        if (params.count("help")) {
            opts.help = true;
            return opts;
        }
        opts.hostname = params["hostname"].as<std::string>();
        opts.port = params["port"].as<std::string>();
        opts.ssl = params["ssl"].as<bool>();
        opts.username = params["username"].as<std::string>();
        opts.password = params["password"].as<std::string>();
        opts.bucket = params["bucket"].as<std::string>();
        opts.scope = params["scope"].as<std::string>();
        if (params.count("config")) {
            opts.config_file = params["config"].as<std::string>();
        }
        opts.prompt = !params["yes"].as<bool>();
        opts.fix_machines = !params["no-machines"].as<bool>();
        opts.prune = !params["no-prune"].as<bool>();
        opts.compact = !params["no-compact"].as<bool>();
        try {
            opts.level = log_level_from_string(params["log-level"].as<std::string>());
        } catch (const std::invalid_argument& e) {
            throw command_line_error(e.what());
        }
        if (params["verbose"].as<bool>() && opts.level > log_level::DEBUG) {
            opts.level = log_level::DEBUG;
        }

        if (opts.password.empty() && !opts.username.empty()) {
            throw command_line_error("-password must be used if username is provided");
        }
        if (opts.hostname.empty()) {
            throw command_line_error("-hostname must not be empty");
        }
        if (opts.bucket.empty()) {
            throw command_line_error("-bucket must not be empty");
        }
        return opts;
    }

    std::string usage()
    {
        std::ostringstream os;
        os << "usage: txnpurge [options]" << std::endl << std::endl;
        os << describe_options();
        return os.str();
    }

    std::string connection_string(const tool_options& opts)
    {
        std::string address = opts.ssl ? "couchbases://" : "couchbase://";
        address += bracket_ipv6(opts.hostname);
        if (!opts.port.empty()) {
            address += ":" + opts.port;
        }
        if (opts.ssl) {
            address += "?ssl=no_verify";
        }
        return address;
    }
} // namespace tool
} // namespace txnpurge
