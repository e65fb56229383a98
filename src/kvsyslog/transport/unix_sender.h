/* <kvsyslog/transport/unix_sender.h>

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

   Sends syslog messages to a UNIX domain socket at a given path.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/un.h>

#include <base/fd.h>
#include <base/no_copy_semantics.h>
#include <kvsyslog/transport/sender_base.h>

namespace KvSyslog {

  namespace Transport {

    /* Connects as a datagram socket, which is what syslog daemons normally
       listen on (for instance /dev/log).  If the peer is a stream socket,
       falls back to a stream connection with octet counted messages. */
    class TUnixSender final : public TSenderBase {
      NO_COPY_SEMANTICS(TUnixSender);

      public:
      /* Throws TConfigError if 'path' is empty or too long. */
      explicit TUnixSender(const std::string &path);

      ~TUnixSender() override = default;

      const char *GetDescription() const noexcept override {
        assert(this);
        return Description.c_str();
      }

      bool IsStream() const noexcept {
        assert(this);
        return Stream;
      }

      protected:
      void DoPrepareToSend() override;

      void DoSend(const uint8_t *msg, size_t msg_size) override;

      void DoReset() noexcept override;

      private:
      /* Returns the errno value from connect(), or 0 on success. */
      int Connect(int sock_type);

      struct sockaddr_un Addr;

      std::string Description;

      bool Stream = false;

      Base::TFd Sock;
    };  // TUnixSender

  }  // Transport

}  // KvSyslog
