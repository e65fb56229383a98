/* <kvsyslog/level.cc>

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

   Implements <kvsyslog/level.h>.
 */

#include <kvsyslog/level.h>

#include <cstddef>

#include <boost/algorithm/string/case_conv.hpp>

#include <base/no_default_case.h>
#include <kvsyslog/error.h>

using namespace KvSyslog;

namespace {

  struct TLevelName {
    const char *Name;

    TLevel Level;
  };  // TLevelName

  /* Canonical names come first, aliases last. */
  const TLevelName LevelNames[] = {
    {"emerg", TLevel::Emerg},
    {"alert", TLevel::Alert},
    {"crit", TLevel::Crit},
    {"err", TLevel::Err},
    {"warning", TLevel::Warning},
    {"notice", TLevel::Notice},
    {"info", TLevel::Info},
    {"debug", TLevel::Debug},
    {"panic", TLevel::Emerg},
    {"error", TLevel::Err},
    {"warn", TLevel::Warning}
  };

  const size_t CanonicalNameCount = 8;

}  // namespace

const char *KvSyslog::ToString(TLevel level) noexcept {
  for (size_t i = 0; i < CanonicalNameCount; ++i) {
    if (LevelNames[i].Level == level) {
      return LevelNames[i].Name;
    }
  }

  Base::Die("Unknown syslog level");
}

TLevel KvSyslog::ToLevel(const std::string &name) {
  const std::string lower = boost::algorithm::to_lower_copy(name);

  for (const TLevelName &item : LevelNames) {
    if (lower == item.Name) {
      return item.Level;
    }
  }

  throw TUnknownNameError("syslog level", name);
}

TLevel KvSyslog::ToLevel(TSeverity severity) noexcept {
  switch (severity) {
    case TSeverity::Trace:
    case TSeverity::Debug: {
      return TLevel::Debug;
    }
    case TSeverity::Info: {
      return TLevel::Info;
    }
    case TSeverity::Warning: {
      return TLevel::Warning;
    }
    case TSeverity::Error: {
      return TLevel::Err;
    }
    case TSeverity::Critical: {
      return TLevel::Crit;
    }
    NO_DEFAULT_CASE;
  }
}

std::optional<TLevel> KvSyslog::LevelFromInt(int value) noexcept {
  std::optional<TLevel> result;

  for (size_t i = 0; i < CanonicalNameCount; ++i) {
    if (ToSyslog(LevelNames[i].Level) == value) {
      result = LevelNames[i].Level;
      break;
    }
  }

  return result;
}
