/* <kvsyslog/remote_drain.cc>

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

   Implements <kvsyslog/remote_drain.h>.
 */

#include <kvsyslog/remote_drain.h>

#include <ctime>
#include <utility>

#include <kvsyslog/transport/rfc3164.h>

using namespace KvSyslog;
using namespace KvSyslog::Transport;

TRemoteDrain::TRemoteDrain(std::unique_ptr<TSenderBase> &&sender,
    const std::string &hostname, const std::string &process, int pid,
    TFacility facility, const TAdapter &adapter,
    const std::optional<TSeverity> &threshold)
    : TDrain(adapter, facility, threshold),
      Hostname(hostname),
      Process(process),
      Pid(pid),
      Sender(std::move(sender)) {
  assert(Sender);
  Sender->PrepareToSend();
}

void TRemoteDrain::WriteMsg(int priority, std::string &msg) {
  assert(this);
  std::string line;
  line.reserve(64 + Hostname.size() + Process.size() + msg.size());
  AppendRfc3164Header(line, priority, std::time(nullptr), Hostname, Process,
      Pid);
  line += msg;
  std::lock_guard<std::mutex> lock(SendMutex);
  Sender->Send(line.data(), line.size());
}
