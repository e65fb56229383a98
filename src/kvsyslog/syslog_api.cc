/* <kvsyslog/syslog_api.cc>

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

   Implements <kvsyslog/syslog_api.h>.
 */

#include <kvsyslog/syslog_api.h>

#include <cassert>

#include <syslog.h>

using namespace KvSyslog;

void TLibcSyslogApi::OpenLog(const char *ident, int option, int facility) {
  assert(this);
  openlog(ident, option, facility);
}

void TLibcSyslogApi::SysLog(int priority, const char *msg) {
  assert(this);
  assert(msg);
  syslog(priority, "%s", msg);
}

void TLibcSyslogApi::CloseLog() {
  assert(this);
  closelog();
}
