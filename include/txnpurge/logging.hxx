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

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

// To avoid static initialization order issues, #define instead of static const
#define PURGE_LOGGER "purge"
#define CLIENT_LOGGER "client"
#define LOGGER_PATTERN "[%H:%M:%S.%e][%n][%l] %v"

namespace txnpurge
{
enum class log_level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL, OFF };

/**
 * Logger for the repair stages.  Stage start/completion, purged entries and failures go here.
 */
extern std::shared_ptr<spdlog::logger> purge_log;

/**
 * Logger for the libcouchbase layer.
 */
extern std::shared_ptr<spdlog::logger> client_log;

/**
 * @brief (Re)create both loggers.
 *
 * With no sink, both loggers write to stdout.  Otherwise they share the given sink, which
 * is how tests capture output.
 */
void
create_loggers(log_level level = log_level::INFO, spdlog::sink_ptr sink = nullptr);

void
set_purge_log_level(log_level level);

spdlog::level::level_enum
to_spdlog_level(log_level level);

/**
 * Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
 *
 * @throws std::invalid_argument for anything else.
 */
log_level
log_level_from_string(const std::string& name);
} // namespace txnpurge
