/* <kvsyslog/transport/sender_base.cc>

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

   Implements <kvsyslog/transport/sender_base.h>.
 */

#include <kvsyslog/transport/sender_base.h>

#include <cerrno>
#include <string>
#include <system_error>

#include <sys/socket.h>
#include <sys/types.h>
#include <sys/uio.h>

#include <base/error_util.h>
#include <kvsyslog/error.h>

using namespace Base;
using namespace KvSyslog;
using namespace KvSyslog::Transport;

void TSenderBase::PrepareToSend() {
  assert(this);

  try {
    DoPrepareToSend();
  } catch (const std::system_error &x) {
    DoReset();
    throw TTransportError((std::string("Connect to ") +
        GetDescription()).c_str(), x);
  }
}

void TSenderBase::Send(const void *msg, size_t msg_size) {
  assert(this);

  try {
    DoSend(reinterpret_cast<const uint8_t *>(msg), msg_size);
  } catch (const std::system_error &x) {
    throw TTransportError((std::string("Send to ") +
        GetDescription()).c_str(), x);
  }
}

void TSenderBase::SendFramed(int fd, const uint8_t *msg, size_t msg_size) {
  std::string prefix = std::to_string(msg_size);
  prefix += ' ';
  struct iovec iov[2];
  iov[0].iov_base = &prefix[0];
  iov[0].iov_len = prefix.size();
  iov[1].iov_base = const_cast<uint8_t *>(msg);
  iov[1].iov_len = msg_size;
  struct iovec *pos = iov;
  size_t iov_count = 2;

  while (iov_count) {
    struct msghdr hdr = {};
    hdr.msg_iov = pos;
    hdr.msg_iovlen = iov_count;
    ssize_t ret = sendmsg(fd, &hdr, MSG_NOSIGNAL);

    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }

      ThrowSystemError(errno);
    }

    auto sent = static_cast<size_t>(ret);

    while (iov_count && (sent >= pos->iov_len)) {
      sent -= pos->iov_len;
      ++pos;
      --iov_count;
    }

    if (iov_count) {
      pos->iov_base = static_cast<uint8_t *>(pos->iov_base) + sent;
      pos->iov_len -= sent;
    }
  }
}
