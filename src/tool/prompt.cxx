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

#include "prompt.hxx"

#include <boost/algorithm/string.hpp>

namespace txnpurge
{
namespace tool
{
    const char* const CONTROLLER_PROMPT =
      "This program should only be used to recover from specific transaction\n"
      "related problems in a Juju database. Casual use is strongly\n"
      "discouraged. Irreversible damage may be caused to a Juju deployment\n"
      "through improper use of this tool.\n"
      "\n"
      "This program should not be run while any Juju controller machine\n"
      "agents are running.\n"
      "\n"
      "Have all controller machine agents been shut down?";

    bool prompt_yes_no(const std::string& question, std::istream& in, std::ostream& out)
    {
        out << question << " [y/n] " << std::flush;
        std::string answer;
        if (!std::getline(in, answer)) {
            return false;
        }
        boost::algorithm::trim(answer);
        boost::algorithm::to_lower(answer);
        return answer == "y" || answer == "yes";
    }
} // namespace tool
} // namespace txnpurge
