/* <kvsyslog/test_util/mock_syslog_api.cc>

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

   Implements <kvsyslog/test_util/mock_syslog_api.h>.
 */

#include <kvsyslog/test_util/mock_syslog_api.h>

#include <algorithm>
#include <stdexcept>

#include <base/no_default_case.h>

using namespace KvSyslog;
using namespace KvSyslog::TestUtil;

bool KvSyslog::TestUtil::operator==(const TSyslogEvent &lhs,
    const TSyslogEvent &rhs) {
  return (lhs.Kind == rhs.Kind) && (lhs.Facility == rhs.Facility) &&
      (lhs.Flags == rhs.Flags) && (lhs.Priority == rhs.Priority) &&
      (lhs.Text == rhs.Text);
}

std::ostream &KvSyslog::TestUtil::operator<<(std::ostream &out,
    const TSyslogEvent &event) {
  switch (event.Kind) {
    case TSyslogEvent::TKind::OpenLog: {
      out << "OpenLog(facility " << event.Facility << ", flags "
          << event.Flags << ", ident \"" << event.Text << "\")";
      break;
    }
    case TSyslogEvent::TKind::SysLog: {
      out << "SysLog(priority " << event.Priority << ", \"" << event.Text
          << "\")";
      break;
    }
    case TSyslogEvent::TKind::CloseLog: {
      out << "CloseLog()";
      break;
    }
    case TSyslogEvent::TKind::DropOwnedIdent: {
      out << "DropOwnedIdent(\"" << event.Text << "\")";
      break;
    }
    NO_DEFAULT_CASE;
  }

  return out;
}

void TMockSyslogApi::OpenLog(const char *ident, int option, int facility) {
  assert(this);
  std::lock_guard<std::mutex> lock(Mutex);
  CheckFail(TSyslogEvent::TKind::OpenLog);
  Events.push_back(TSyslogEvent::OpenLog(facility, option,
      ident ? ident : ""));

  if (ident) {
    LastIdentPtr = ident;
  }
}

void TMockSyslogApi::SysLog(int priority, const char *msg) {
  assert(this);
  assert(msg);
  std::lock_guard<std::mutex> lock(Mutex);
  CheckFail(TSyslogEvent::TKind::SysLog);
  Events.push_back(TSyslogEvent::SysLog(priority, msg));
}

void TMockSyslogApi::CloseLog() {
  assert(this);
  std::lock_guard<std::mutex> lock(Mutex);
  CheckFail(TSyslogEvent::TKind::CloseLog);
  Events.push_back(TSyslogEvent::CloseLog());
  LastIdentPtr = nullptr;
}

void TMockSyslogApi::OnIdentRelease(const char *ident) {
  assert(this);
  assert(ident);
  std::lock_guard<std::mutex> lock(Mutex);
  CheckFail(TSyslogEvent::TKind::DropOwnedIdent);
  Events.push_back(TSyslogEvent::DropOwnedIdent(ident));
}

void TMockSyslogApi::FailNext(TSyslogEvent::TKind kind) {
  assert(this);
  std::lock_guard<std::mutex> lock(Mutex);
  Failures.push_back(kind);
}

std::vector<TSyslogEvent> TMockSyslogApi::GetEvents() const {
  assert(this);
  std::lock_guard<std::mutex> lock(Mutex);
  return Events;
}

void TMockSyslogApi::ClearEvents() {
  assert(this);
  std::lock_guard<std::mutex> lock(Mutex);
  Events.clear();
}

const char *TMockSyslogApi::GetLastIdentPtr() const {
  assert(this);
  std::lock_guard<std::mutex> lock(Mutex);
  return LastIdentPtr;
}

void TMockSyslogApi::CheckFail(TSyslogEvent::TKind kind) {
  assert(this);
  auto iter = std::find(Failures.begin(), Failures.end(), kind);

  if (iter != Failures.end()) {
    Failures.erase(iter);
    throw std::runtime_error("mock syslog failure");
  }
}
