/* <kvsyslog/level.h>

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

   Syslog message levels.
 */

#pragma once

#include <optional>
#include <string>

#include <syslog.h>

#include <kvsyslog/severity.h>

namespace KvSyslog {

  /* Numeric values are those of <syslog.h>, where a smaller number is more
     severe.  The comparison operators below compare by severity instead, so
     TLevel::Debug is the least and TLevel::Emerg the greatest. */
  enum class TLevel {
    Emerg = LOG_EMERG,
    Alert = LOG_ALERT,
    Crit = LOG_CRIT,
    Err = LOG_ERR,
    Warning = LOG_WARNING,
    Notice = LOG_NOTICE,
    Info = LOG_INFO,
    Debug = LOG_DEBUG
  };  // TLevel

  inline int ToSyslog(TLevel level) noexcept {
    return static_cast<int>(level);
  }

  inline bool operator<(TLevel lhs, TLevel rhs) noexcept {
    return ToSyslog(lhs) > ToSyslog(rhs);
  }

  inline bool operator>(TLevel lhs, TLevel rhs) noexcept {
    return rhs < lhs;
  }

  inline bool operator<=(TLevel lhs, TLevel rhs) noexcept {
    return !(rhs < lhs);
  }

  inline bool operator>=(TLevel lhs, TLevel rhs) noexcept {
    return !(lhs < rhs);
  }

  /* Returns one of "emerg", "alert", "crit", "err", "warning", "notice",
     "info", "debug". */
  const char *ToString(TLevel level) noexcept;

  /* Parse a level name, ignoring case.  In addition to the names returned by
     ToString(), "panic", "error" and "warn" are accepted.  Throws
     TUnknownNameError on failure. */
  TLevel ToLevel(const std::string &name);

  /* Fixed mapping from application severity to syslog level.  Trace and
     Debug both map to TLevel::Debug. */
  TLevel ToLevel(TSeverity severity) noexcept;

  /* Return the level with the given <syslog.h> value, or an empty optional if
     there is none. */
  std::optional<TLevel> LevelFromInt(int value) noexcept;

}  // KvSyslog
