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

#include <txnpurge/logging.hxx>

#include <spdlog/sinks/stdout_sinks.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace txnpurge
{
static std::shared_ptr<spdlog::logger>
init_logger(const std::string& name)
{
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_logger_mt(name);
        logger->set_pattern(LOGGER_PATTERN);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> purge_log = init_logger(PURGE_LOGGER);
std::shared_ptr<spdlog::logger> client_log = init_logger(CLIENT_LOGGER);

spdlog::level::level_enum
to_spdlog_level(log_level level)
{
    switch (level) {
        case log_level::TRACE:
            return spdlog::level::trace;
        case log_level::DEBUG:
            return spdlog::level::debug;
        case log_level::INFO:
            return spdlog::level::info;
        case log_level::WARN:
            return spdlog::level::warn;
        case log_level::ERROR:
            return spdlog::level::err;
        case log_level::CRITICAL:
            return spdlog::level::critical;
        default:
            return spdlog::level::off;
    }
}

static std::shared_ptr<spdlog::logger>
replace_logger(const std::string& name, spdlog::sink_ptr sink)
{
    spdlog::drop(name);
    std::shared_ptr<spdlog::logger> logger;
    if (sink) {
        logger = std::make_shared<spdlog::logger>(name, sink);
        spdlog::register_logger(logger);
    } else {
        logger = spdlog::stdout_logger_mt(name);
    }
    logger->set_pattern(LOGGER_PATTERN);
    return logger;
}

void
create_loggers(log_level level, spdlog::sink_ptr sink)
{
    purge_log = replace_logger(PURGE_LOGGER, sink);
    client_log = replace_logger(CLIENT_LOGGER, sink);
    set_purge_log_level(level);
}

void
set_purge_log_level(log_level level)
{
    purge_log->set_level(to_spdlog_level(level));
    client_log->set_level(to_spdlog_level(level));
}

log_level
log_level_from_string(const std::string& name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "trace") {
        return log_level::TRACE;
    } else if (lower == "debug") {
        return log_level::DEBUG;
    } else if (lower == "info") {
        return log_level::INFO;
    } else if (lower == "warn" || lower == "warning") {
        return log_level::WARN;
    } else if (lower == "error") {
        return log_level::ERROR;
    } else if (lower == "critical") {
        return log_level::CRITICAL;
    } else if (lower == "off") {
        return log_level::OFF;
    }
    throw std::invalid_argument("unknown log level: " + name);
}
} // namespace txnpurge
