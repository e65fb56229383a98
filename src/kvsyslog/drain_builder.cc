/* <kvsyslog/drain_builder.cc>

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

   Implements <kvsyslog/drain_builder.h>.
 */

#include <kvsyslog/drain_builder.h>

#include <cerrno>
#include <climits>
#include <cstddef>
#include <vector>

#include <unistd.h>

#include <base/basename.h>
#include <base/no_default_case.h>
#include <kvsyslog/ident.h>
#include <kvsyslog/remote_drain.h>
#include <kvsyslog/syslog_drain.h>
#include <kvsyslog/transport/tcp_sender.h>
#include <kvsyslog/transport/udp_sender.h>
#include <kvsyslog/transport/unix_sender.h>
#include <log/log.h>

using namespace Base;
using namespace KvSyslog;
using namespace KvSyslog::Transport;
using namespace Log;

TDrainBuilder &TDrainBuilder::Ident(const std::string &ident) {
  assert(this);
  /* Reject a bad ident now, before anything is opened. */
  TIdent checked(ident);
  Settings.OwnedIdent = ident;
  Settings.StaticIdent = nullptr;
  return *this;
}

const char *TDrainBuilder::GetIdent() const noexcept {
  assert(this);
  return Settings.OwnedIdent ?
      Settings.OwnedIdent->c_str() : Settings.StaticIdent;
}

std::unique_ptr<TDrain> TDrainBuilder::Build() const {
  assert(this);
  std::unique_ptr<TSenderBase> sender;

  switch (Settings.Target) {
    case TTarget::Local: {
      TIdent ident;

      if (Settings.OwnedIdent) {
        ident = TIdent(*Settings.OwnedIdent);
      } else if (Settings.StaticIdent) {
        ident = TIdent::Borrowed(Settings.StaticIdent);
      }

      return std::make_unique<TSyslogDrain>(
          Settings.Lifecycle ?
              Settings.Lifecycle : TConnectionLifecycle::GetDefault(),
          std::move(ident), Settings.Option, Settings.Facility,
          Settings.Adapter, Settings.Threshold);
    }
    case TTarget::UnixPath: {
      sender = std::make_unique<TUnixSender>(Settings.Path);
      break;
    }
    case TTarget::Udp: {
      sender = std::make_unique<TUdpSender>(Settings.LocalEndpoint,
          Settings.RemoteEndpoint);
      break;
    }
    case TTarget::Tcp: {
      sender = std::make_unique<TTcpSender>(Settings.RemoteEndpoint);
      break;
    }
    NO_DEFAULT_CASE;
  }

  /* The process name falls back to the ident, which is what syslog() itself
     would show. */
  std::string process;

  if (Settings.Process) {
    process = *Settings.Process;
  } else {
    process = DetectProcessName();

    if (process.empty() && GetIdent()) {
      process = GetIdent();
    }
  }

  return std::make_unique<TRemoteDrain>(std::move(sender),
      Settings.Hostname ? *Settings.Hostname : DetectHostname(), process,
      Settings.Pid ? *Settings.Pid : static_cast<int>(getpid()),
      Settings.Facility, Settings.Adapter, Settings.Threshold);
}

std::string KvSyslog::DetectProcessName() {
  std::vector<char> buf(PATH_MAX + 1);
  const ssize_t len = readlink("/proc/self/exe", &buf[0], buf.size() - 1);

  if (len < 0) {
    LOG_ERRNO(TPri::DEBUG, errno)
        << "Failed to read /proc/self/exe for process name: ";
    return std::string();
  }

  return Basename(std::string(&buf[0], static_cast<size_t>(len)));
}

std::string KvSyslog::DetectHostname() {
  std::vector<char> buf(HOST_NAME_MAX + 1);

  if (gethostname(&buf[0], buf.size()) < 0) {
    LOG_ERRNO(TPri::DEBUG, errno) << "Failed to get hostname: ";
    return std::string();
  }

  buf.back() = '\0';
  return std::string(&buf[0]);
}
