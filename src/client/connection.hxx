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

#include <txnpurge/support.hxx>

#include <string>

namespace txnpurge
{
/**
 * Create and bootstrap a libcouchbase instance.  An empty user name skips authentication.
 *
 * @throws connection_error
 */
lcb_st*
connect(const std::string& cluster_address, const std::string& user_name, const std::string& password);

void
shutdown(lcb_st* lcb);
} // namespace txnpurge
