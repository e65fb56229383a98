/* <kvsyslog/connection_lifecycle.cc>

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

   Implements <kvsyslog/connection_lifecycle.h>.
 */

#include <kvsyslog/connection_lifecycle.h>

#include <exception>
#include <string>
#include <system_error>
#include <utility>

#include <kvsyslog/error.h>
#include <log/log.h>

using namespace KvSyslog;
using namespace Log;

TConnectionLifecycle::TConnectionLifecycle(std::shared_ptr<TSyslogApi> api)
    : Api(std::move(api)) {
  assert(Api);
}

const std::shared_ptr<TConnectionLifecycle> &
TConnectionLifecycle::GetDefault() {
  static const std::shared_ptr<TConnectionLifecycle> lifecycle =
      std::make_shared<TConnectionLifecycle>(
          std::make_shared<TLibcSyslogApi>());
  return lifecycle;
}

void TConnectionLifecycle::Open(const TIdent &ident, int option,
    int facility) {
  assert(this);
  std::lock_guard<std::mutex> lock(Mutex);

  if (Broken) {
    throw TTransportError(
        "syslog connection state is unusable after an earlier failure");
  }

  try {
    Api->OpenLog(ident.Get(), option, facility);
  } catch (const std::exception &x) {
    Broken = true;
    throw TTransportError(std::string("openlog failed: ") + x.what());
  }

  if (ident.IsOwned()) {
    Owner = ident.Get();
  }
}

void TConnectionLifecycle::Close(TIdent &ident) noexcept {
  assert(this);

  if (!ident.IsOwned()) {
    ident.Reset();
    return;
  }

  bool leak = false;

  try {
    std::lock_guard<std::mutex> lock(Mutex);

    if (Broken) {
      leak = true;
    } else if (ident.Get() == Owner) {
      try {
        Api->CloseLog();
        Owner = nullptr;
      } catch (const std::exception &x) {
        Broken = true;
        leak = true;
        LOG(TPri::ERR) << "closelog failed: " << x.what();
      }
    }
  } catch (const std::system_error &x) {
    /* Without the lock the recorded owner can't be checked. */
    leak = true;
    LOG(TPri::ERR) << "Failed to lock syslog connection state: " << x.what();
  }

  if (leak) {
    LOG(TPri::WARNING) << "Leaking syslog ident [" << ident.Get()
        << "] because syslog connection state is broken";
    ident.Leak();
    return;
  }

  try {
    Api->OnIdentRelease(ident.Get());
  } catch (const std::exception &x) {
    LOG(TPri::ERR) << "Syslog ident release hook failed: " << x.what();
  }

  ident.Reset();
}

void TConnectionLifecycle::Write(int priority, const char *msg) {
  assert(this);
  assert(msg);
  std::lock_guard<std::mutex> lock(Mutex);

  try {
    Api->SysLog(priority, msg);
  } catch (const TTransportError &) {
    throw;
  } catch (const std::exception &x) {
    throw TTransportError(std::string("syslog failed: ") + x.what());
  }
}

bool TConnectionLifecycle::IsBroken() const noexcept {
  assert(this);
  std::lock_guard<std::mutex> lock(Mutex);
  return Broken;
}
