/* <kvsyslog/severity.h>

   ----------------------------------------------------------------------------
   Copyright 2019 Dave Peterson <dave@dspeterson.com>

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

     http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
   ----------------------------------------------------------------------------

   Application severity of a log event.
 */

#pragma once

#include <string>

namespace KvSyslog {

  /* Ordered least to most severe, so the built in comparison operators give
     severity order. */
  enum class TSeverity {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Critical
  };  // TSeverity

  const char *ToString(TSeverity severity) noexcept;

  /* Parse a name as returned by ToString(), ignoring case.  Throws
     TUnknownNameError on failure. */
  TSeverity ToSeverity(const std::string &name);

}  // KvSyslog
