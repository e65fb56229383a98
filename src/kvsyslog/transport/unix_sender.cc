/* <kvsyslog/transport/unix_sender.cc>

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

   Implements <kvsyslog/transport/unix_sender.h>.
 */

#include <kvsyslog/transport/unix_sender.h>

#include <cassert>
#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <sys/types.h>

#include <base/error_util.h>
#include <kvsyslog/error.h>
#include <log/log.h>

using namespace Base;
using namespace KvSyslog;
using namespace KvSyslog::Transport;
using namespace Log;

TUnixSender::TUnixSender(const std::string &path)
    : Description("UNIX socket " + path) {
  if (path.empty()) {
    throw TConfigError("Syslog UNIX socket path is empty");
  }

  std::memset(&Addr, 0, sizeof(Addr));

  if (path.size() >= sizeof(Addr.sun_path)) {
    throw TConfigError("Syslog UNIX socket path is too long: " + path);
  }

  Addr.sun_family = AF_LOCAL;
  std::memcpy(Addr.sun_path, path.data(), path.size());
}

int TUnixSender::Connect(int sock_type) {
  assert(this);
  Sock = IfLt0(socket(AF_LOCAL, sock_type | SOCK_CLOEXEC, 0));

  if (connect(Sock, reinterpret_cast<const struct sockaddr *>(&Addr),
      sizeof(Addr)) < 0) {
    const int err = errno;
    Sock.Reset();
    return err;
  }

  return 0;
}

void TUnixSender::DoPrepareToSend() {
  assert(this);
  Stream = false;
  int err = Connect(SOCK_DGRAM);

  if (err == EPROTOTYPE) {
    LOG(TPri::DEBUG) << Description
        << " is not a datagram socket: trying stream";
    Stream = true;
    err = Connect(SOCK_STREAM);
  }

  if (err) {
    ThrowSystemError(err);
  }
}

void TUnixSender::DoSend(const uint8_t *msg, size_t msg_size) {
  assert(this);

  if (Stream) {
    SendFramed(Sock, msg, msg_size);
    return;
  }

  for (; ; ) {
    if (send(Sock, msg, msg_size, MSG_NOSIGNAL) >= 0) {
      break;
    }

    if (errno != EINTR) {
      ThrowSystemError(errno);
    }
  }
}

void TUnixSender::DoReset() noexcept {
  assert(this);
  Sock.Reset();
}
