/* <kvsyslog/severity.cc>

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

   Implements <kvsyslog/severity.h>.
 */

#include <kvsyslog/severity.h>

#include <boost/algorithm/string/case_conv.hpp>

#include <base/no_default_case.h>
#include <kvsyslog/error.h>

using namespace KvSyslog;

const char *KvSyslog::ToString(TSeverity severity) noexcept {
  switch (severity) {
    case TSeverity::Trace: {
      return "trace";
    }
    case TSeverity::Debug: {
      return "debug";
    }
    case TSeverity::Info: {
      return "info";
    }
    case TSeverity::Warning: {
      return "warning";
    }
    case TSeverity::Error: {
      return "error";
    }
    case TSeverity::Critical: {
      return "critical";
    }
    NO_DEFAULT_CASE;
  }
}

TSeverity KvSyslog::ToSeverity(const std::string &name) {
  static const TSeverity all[] = {
    TSeverity::Trace, TSeverity::Debug, TSeverity::Info, TSeverity::Warning,
    TSeverity::Error, TSeverity::Critical
  };

  const std::string lower = boost::algorithm::to_lower_copy(name);

  for (TSeverity severity : all) {
    if (lower == ToString(severity)) {
      return severity;
    }
  }

  throw TUnknownNameError("severity", name);
}
