/* <kvsyslog/record.h>

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

   A single log event as seen by a drain.
 */

#pragma once

#include <cassert>
#include <string>
#include <utility>

#include <kvsyslog/key_values.h>
#include <kvsyslog/severity.h>

namespace KvSyslog {

  /* Input to TDrain::Log().  Refers to attributes owned by the caller, so a
     record must not outlive the call it is passed to. */
  class TRecord final {
    public:
    TRecord(TSeverity severity, std::string msg,
        const TKeyValues &key_values = TKeyValues::GetEmpty(),
        const char *file = "", unsigned int line = 0, const char *module = "")
        : Severity(severity),
          Msg(std::move(msg)),
          KeyValues(key_values),
          File(file),
          Line(line),
          Module(module) {
      assert(file);
      assert(module);
    }

    TSeverity GetSeverity() const noexcept {
      assert(this);
      return Severity;
    }

    const std::string &GetMsg() const noexcept {
      assert(this);
      return Msg;
    }

    const TKeyValues &GetKeyValues() const noexcept {
      assert(this);
      return KeyValues;
    }

    const char *GetFile() const noexcept {
      assert(this);
      return File;
    }

    unsigned int GetLine() const noexcept {
      assert(this);
      return Line;
    }

    const char *GetModule() const noexcept {
      assert(this);
      return Module;
    }

    private:
    TSeverity Severity;

    std::string Msg;

    const TKeyValues &KeyValues;

    const char *File;

    unsigned int Line;

    const char *Module;
  };  // TRecord

}  // KvSyslog
