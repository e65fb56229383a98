/* <kvsyslog/syslog_drain.cc>

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

   Implements <kvsyslog/syslog_drain.h>.
 */

#include <kvsyslog/syslog_drain.h>

#include <algorithm>
#include <utility>

#include <syslog.h>

#include <kvsyslog/error.h>
#include <log/log.h>

using namespace KvSyslog;
using namespace Log;

TSyslogDrain::TSyslogDrain(std::shared_ptr<TConnectionLifecycle> lifecycle,
    TIdent &&ident, int option, TFacility facility, const TAdapter &adapter,
    const std::optional<TSeverity> &threshold)
    : TDrain(adapter, facility, threshold),
      Lifecycle(std::move(lifecycle)),
      Ident(std::move(ident)),
      Option(option) {
  assert(Lifecycle);

  try {
    Lifecycle->Open(Ident, Option, ToSyslog(facility));
  } catch (const TTransportError &) {
    /* openlog() may have kept a pointer to the ident, so don't free it. */
    if (Ident.IsOwned() && Lifecycle->IsBroken()) {
      LOG(TPri::WARNING) << "Leaking syslog ident [" << Ident.Get()
          << "] after openlog() failure";
      Ident.Leak();
    }

    throw;
  }
}

TSyslogDrain::~TSyslogDrain() {
  Lifecycle->Close(Ident);
}

void TSyslogDrain::WriteMsg(int priority, std::string &msg) {
  assert(this);
  msg.erase(std::remove(msg.begin(), msg.end(), '\0'), msg.end());
  msg.push_back('\0');
  Lifecycle->Write(priority, msg.data());
}

int TSyslogDrain::GetFormatErrorPriority(int /*priority*/) const noexcept {
  assert(this);
  return LOG_ERR;
}
