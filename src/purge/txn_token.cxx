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

#include <txnpurge/purge/txn_state.hxx>

namespace txnpurge
{
namespace purge
{
    std::string txn_id_from_token(const std::string& token)
    {
        auto pos = token.find('_');
        if (pos == std::string::npos) {
            return token;
        }
        return token.substr(0, pos);
    }
} // namespace purge
} // namespace txnpurge
