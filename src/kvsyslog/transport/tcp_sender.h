/* <kvsyslog/transport/tcp_sender.h>

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

   Sends octet counted syslog messages over TCP.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <base/fd.h>
#include <base/no_copy_semantics.h>
#include <kvsyslog/transport/endpoint.h>
#include <kvsyslog/transport/sender_base.h>

namespace KvSyslog {

  namespace Transport {

    /* Octet counting framing as described in RFC 6587: each message is
       preceded by its length in bytes and a space.  Newlines inside a
       message do not split it. */
    class TTcpSender final : public TSenderBase {
      NO_COPY_SEMANTICS(TTcpSender);

      public:
      /* Throws TConfigError if 'remote' can not be resolved. */
      explicit TTcpSender(const TEndpoint &remote);

      ~TTcpSender() override = default;

      const char *GetDescription() const noexcept override {
        assert(this);
        return Description.c_str();
      }

      protected:
      void DoPrepareToSend() override;

      void DoSend(const uint8_t *msg, size_t msg_size) override;

      void DoReset() noexcept override;

      private:
      TSockAddr RemoteAddr;

      std::string Description;

      Base::TFd Sock;
    };  // TTcpSender

  }  // Transport

}  // KvSyslog
