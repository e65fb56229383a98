/* <kvsyslog/transport/tcp_sender.cc>

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

   Implements <kvsyslog/transport/tcp_sender.h>.
 */

#include <kvsyslog/transport/tcp_sender.h>

#include <cassert>

#include <sys/socket.h>
#include <sys/types.h>

#include <base/error_util.h>
#include <log/log.h>

using namespace Base;
using namespace KvSyslog;
using namespace KvSyslog::Transport;
using namespace Log;

TTcpSender::TTcpSender(const TEndpoint &remote)
    : RemoteAddr(Resolve(remote, SOCK_STREAM)),
      Description("TCP " + ToString(remote)) {
}

void TTcpSender::DoPrepareToSend() {
  assert(this);
  Sock = IfLt0(socket(RemoteAddr.GetFamily(), SOCK_STREAM | SOCK_CLOEXEC,
      0));
  IfLt0(connect(Sock, RemoteAddr.Get(), RemoteAddr.Len));

  LOG(TPri::DEBUG) << "Connected to syslog collector " << Description;
}

void TTcpSender::DoSend(const uint8_t *msg, size_t msg_size) {
  assert(this);
  SendFramed(Sock, msg, msg_size);
}

void TTcpSender::DoReset() noexcept {
  assert(this);
  Sock.Reset();
}
