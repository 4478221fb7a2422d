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

#include <stdexcept>
#include <string>

namespace txnpurge
{
namespace purge
{
    enum error_class {
        FAIL_CONNECT = 0,
        FAIL_CATALOG,
        FAIL_READ,
        FAIL_WRITE,
        FAIL_CAS_MISMATCH,
        FAIL_EXTERNAL,
        FAIL_CONFIG
    };

    inline const char* error_class_name(error_class ec)
    {
        switch (ec) {
            case FAIL_CONNECT:
                return "FAIL_CONNECT";
            case FAIL_CATALOG:
                return "FAIL_CATALOG";
            case FAIL_READ:
                return "FAIL_READ";
            case FAIL_WRITE:
                return "FAIL_WRITE";
            case FAIL_CAS_MISMATCH:
                return "FAIL_CAS_MISMATCH";
            case FAIL_EXTERNAL:
                return "FAIL_EXTERNAL";
            case FAIL_CONFIG:
                return "FAIL_CONFIG";
            default:
                throw std::runtime_error("unknown error class");
        }
    }

    /**
     * @brief Raised by the database layer and the repair stages.
     *
     * Every failure in a run surfaces as one of these (or a std::runtime_error from below),
     * and is fatal to the stage that raised it.  There is no retry.
     */
    class purge_error : public std::runtime_error
    {
      private:
        error_class ec_;

      public:
        explicit purge_error(error_class ec, const std::string& what)
          : std::runtime_error(what)
          , ec_(ec)
        {
        }

        error_class ec() const
        {
            return ec_;
        }
    };

    // Reads better than purge_error(FAIL_CAS_MISMATCH, ...) at the call sites
    class concurrent_modification : public purge_error
    {
      public:
        explicit concurrent_modification(const std::string& what)
          : purge_error(FAIL_CAS_MISMATCH, what)
        {
        }
    };
} // namespace purge
} // namespace txnpurge
