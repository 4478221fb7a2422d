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

#include <istream>
#include <ostream>
#include <string>

namespace txnpurge
{
namespace tool
{
    extern const char* const CONTROLLER_PROMPT;

    /**
     * Ask a yes/no question.  Only "y" or "yes", in any case, count as yes.  Anything else,
     * including end of input, is no.
     */
    bool prompt_yes_no(const std::string& question, std::istream& in, std::ostream& out);
} // namespace tool
} // namespace txnpurge
