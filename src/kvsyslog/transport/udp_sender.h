/* <kvsyslog/transport/udp_sender.h>

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

   Sends syslog messages as UDP datagrams.
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

    /* One datagram per message, from a socket bound to 'local' and connected
       to 'remote'. */
    class TUdpSender final : public TSenderBase {
      NO_COPY_SEMANTICS(TUdpSender);

      public:
      /* Throws TConfigError if either endpoint can not be resolved, or if
         they resolve to different address families. */
      TUdpSender(const TEndpoint &local, const TEndpoint &remote);

      ~TUdpSender() override = default;

      const char *GetDescription() const noexcept override {
        assert(this);
        return Description.c_str();
      }

      protected:
      void DoPrepareToSend() override;

      void DoSend(const uint8_t *msg, size_t msg_size) override;

      void DoReset() noexcept override;

      private:
      TSockAddr LocalAddr;

      TSockAddr RemoteAddr;

      std::string Description;

      Base::TFd Sock;
    };  // TUdpSender

  }  // Transport

}  // KvSyslog
