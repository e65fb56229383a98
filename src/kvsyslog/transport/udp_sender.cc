/* <kvsyslog/transport/udp_sender.cc>

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

   Implements <kvsyslog/transport/udp_sender.h>.
 */

#include <kvsyslog/transport/udp_sender.h>

#include <cassert>
#include <cerrno>

#include <sys/socket.h>
#include <sys/types.h>

#include <base/error_util.h>

using namespace Base;
using namespace KvSyslog;
using namespace KvSyslog::Transport;

TUdpSender::TUdpSender(const TEndpoint &local, const TEndpoint &remote)
    : RemoteAddr(Resolve(remote, SOCK_DGRAM)),
      Description("UDP " + ToString(remote)) {
  LocalAddr = Resolve(local, SOCK_DGRAM, RemoteAddr.GetFamily(),
      true /* passive */);
}

void TUdpSender::DoPrepareToSend() {
  assert(this);
  Sock = IfLt0(socket(RemoteAddr.GetFamily(), SOCK_DGRAM | SOCK_CLOEXEC, 0));
  IfLt0(bind(Sock, LocalAddr.Get(), LocalAddr.Len));
  IfLt0(connect(Sock, RemoteAddr.Get(), RemoteAddr.Len));
}

void TUdpSender::DoSend(const uint8_t *msg, size_t msg_size) {
  assert(this);

  for (; ; ) {
    if (send(Sock, msg, msg_size, MSG_NOSIGNAL) >= 0) {
      break;
    }

    if (errno != EINTR) {
      ThrowSystemError(errno);
    }
  }
}

void TUdpSender::DoReset() noexcept {
  assert(this);
  Sock.Reset();
}
