/* <kvsyslog/test_util/mock_syslog_api.h>

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

   Mock implementation of TSyslogApi that records calls, for unit tests.
 */

#pragma once

#include <cassert>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include <base/no_copy_semantics.h>
#include <kvsyslog/syslog_api.h>

namespace KvSyslog {

  namespace TestUtil {

    /* One recorded call. */
    struct TSyslogEvent {
      enum class TKind {
        OpenLog,
        SysLog,
        CloseLog,
        DropOwnedIdent
      };  // TKind

      static TSyslogEvent OpenLog(int facility, int flags,
          const std::string &ident) {
        TSyslogEvent event(TKind::OpenLog);
        event.Facility = facility;
        event.Flags = flags;
        event.Text = ident;
        return event;
      }

      static TSyslogEvent SysLog(int priority, const std::string &msg) {
        TSyslogEvent event(TKind::SysLog);
        event.Priority = priority;
        event.Text = msg;
        return event;
      }

      static TSyslogEvent CloseLog() {
        return TSyslogEvent(TKind::CloseLog);
      }

      static TSyslogEvent DropOwnedIdent(const std::string &ident) {
        TSyslogEvent event(TKind::DropOwnedIdent);
        event.Text = ident;
        return event;
      }

      TKind Kind;

      int Facility = 0;

      int Flags = 0;

      int Priority = 0;

      /* Ident for OpenLog (empty if null) and DropOwnedIdent, message for
         SysLog. */
      std::string Text;

      private:
      explicit TSyslogEvent(TKind kind)
          : Kind(kind) {
      }
    };  // TSyslogEvent

    bool operator==(const TSyslogEvent &lhs, const TSyslogEvent &rhs);

    inline bool operator!=(const TSyslogEvent &lhs, const TSyslogEvent &rhs) {
      return !(lhs == rhs);
    }

    /* Lets gtest print events in failure messages. */
    std::ostream &operator<<(std::ostream &out, const TSyslogEvent &event);

    class TMockSyslogApi final : public TSyslogApi {
      NO_COPY_SEMANTICS(TMockSyslogApi);

      public:
      TMockSyslogApi() = default;

      void OpenLog(const char *ident, int option, int facility) override;

      void SysLog(int priority, const char *msg) override;

      void CloseLog() override;

      void OnIdentRelease(const char *ident) override;

      /* Make the next call of the given kind throw std::runtime_error
         before recording anything. */
      void FailNext(TSyslogEvent::TKind kind);

      std::vector<TSyslogEvent> GetEvents() const;

      void ClearEvents();

      /* Ident pointer received by the last OpenLog() call with a non-null
         ident.  Never dereferenced. */
      const char *GetLastIdentPtr() const;

      private:
      /* Caller must hold 'Mutex'.  Throws if a failure was requested for
         'kind'. */
      void CheckFail(TSyslogEvent::TKind kind);

      mutable std::mutex Mutex;

      std::vector<TSyslogEvent> Events;

      std::vector<TSyslogEvent::TKind> Failures;

      const char *LastIdentPtr = nullptr;
    };  // TMockSyslogApi

  }  // TestUtil

}  // KvSyslog
