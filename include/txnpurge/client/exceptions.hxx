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

#include <txnpurge/client/result.hxx>

#include <stdexcept>
#include <string>

namespace txnpurge
{
/**
 * @brief A kv operation the server (or libcouchbase) rejected.
 */
class client_error : public std::runtime_error
{
  private:
    result res_;

  public:
    explicit client_error(const std::string& what, const result& res)
      : std::runtime_error(what + ": " + res.strerror())
      , res_(res)
    {
    }

    const result& res() const
    {
        return res_;
    }
};

/**
 * @brief Could not create, connect or open a libcouchbase instance.
 */
class connection_error : public std::runtime_error
{
  public:
    explicit connection_error(const std::string& what)
      : std::runtime_error(what)
    {
    }
};
} // namespace txnpurge
