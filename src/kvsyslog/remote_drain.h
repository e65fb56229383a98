/* <kvsyslog/remote_drain.h>

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

   Drain writing RFC 3164 messages to a socket of its own.
 */

#pragma once

#include <cassert>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <base/no_copy_semantics.h>
#include <kvsyslog/adapter.h>
#include <kvsyslog/drain.h>
#include <kvsyslog/facility.h>
#include <kvsyslog/severity.h>
#include <kvsyslog/transport/sender_base.h>

namespace KvSyslog {

  /* Sends each message through 'sender' with a header naming this host,
     process and pid.  Does not touch the process-wide openlog() handle. */
  class TRemoteDrain final : public TDrain {
    NO_COPY_SEMANTICS(TRemoteDrain);

    public:
    /* Connects 'sender'.  Throws TTransportError on failure. */
    TRemoteDrain(std::unique_ptr<Transport::TSenderBase> &&sender,
        const std::string &hostname, const std::string &process, int pid,
        TFacility facility, const TAdapter &adapter,
        const std::optional<TSeverity> &threshold);

    ~TRemoteDrain() override = default;

    const std::string &GetHostname() const noexcept {
      assert(this);
      return Hostname;
    }

    const std::string &GetProcess() const noexcept {
      assert(this);
      return Process;
    }

    int GetPid() const noexcept {
      assert(this);
      return Pid;
    }

    const Transport::TSenderBase &GetSender() const noexcept {
      assert(this);
      return *Sender;
    }

    protected:
    void WriteMsg(int priority, std::string &msg) override;

    private:
    const std::string Hostname;

    const std::string Process;

    const int Pid;

    /* Serializes writers of 'Sender'. */
    std::mutex SendMutex;

    std::unique_ptr<Transport::TSenderBase> Sender;
  };  // TRemoteDrain

}  // KvSyslog
