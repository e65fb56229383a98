/* <kvsyslog/transport/rfc3164.cc>

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

   Implements <kvsyslog/transport/rfc3164.h>.
 */

#include <kvsyslog/transport/rfc3164.h>

#include <cstddef>

using namespace KvSyslog;
using namespace KvSyslog::Transport;

void KvSyslog::Transport::AppendRfc3164Header(std::string &out, int priority,
    time_t now, const std::string &hostname, const std::string &process,
    int pid) {
  out += '<';
  out += std::to_string(priority);
  out += '>';
  struct tm tm_buf;
  char time_buf[32];

  if (localtime_r(&now, &tm_buf)) {
    const size_t len = std::strftime(time_buf, sizeof(time_buf), "%b %d %T",
        &tm_buf);
    out.append(time_buf, len);
  }

  out += ' ';

  if (!hostname.empty()) {
    out += hostname;
    out += ' ';
  }

  out += process;
  out += '[';
  out += std::to_string(pid);
  out += "]: ";
}
