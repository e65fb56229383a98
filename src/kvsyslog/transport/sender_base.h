/* <kvsyslog/transport/sender_base.h>

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

   Base class for sockets that carry messages to a remote syslog collector.
 */

#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>

#include <base/no_copy_semantics.h>

namespace KvSyslog {

  namespace Transport {

    class TSenderBase {
      NO_COPY_SEMANTICS(TSenderBase);

      public:
      virtual ~TSenderBase() = default;

      /* Create and connect the socket.  Throws TTransportError on failure. */
      void PrepareToSend();

      /* Send one complete message.  Stream senders add the length prefix
         that frames it.  Throws TTransportError on failure. */
      void Send(const void *msg, size_t msg_size);

      /* Close the socket.  PrepareToSend() may be called again after. */
      void Reset() noexcept {
        assert(this);
        DoReset();
      }

      /* Something like "UDP 192.0.2.1:514", for error messages. */
      virtual const char *GetDescription() const noexcept = 0;

      protected:
      TSenderBase() = default;

      virtual void DoPrepareToSend() = 0;

      virtual void DoSend(const uint8_t *msg, size_t msg_size) = 0;

      virtual void DoReset() noexcept = 0;

      /* Write 'msg' to stream socket 'fd' as one RFC 6587 octet counted
         frame ("<length> <msg>"), handling partial writes. */
      static void SendFramed(int fd, const uint8_t *msg, size_t msg_size);
    };  // TSenderBase

  }  // Transport

}  // KvSyslog
