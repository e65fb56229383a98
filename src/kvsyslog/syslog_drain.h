/* <kvsyslog/syslog_drain.h>

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

   Drain writing to the local syslog daemon through openlog() and syslog().
 */

#pragma once

#include <cassert>
#include <memory>
#include <optional>
#include <string>

#include <base/no_copy_semantics.h>
#include <kvsyslog/adapter.h>
#include <kvsyslog/connection_lifecycle.h>
#include <kvsyslog/drain.h>
#include <kvsyslog/facility.h>
#include <kvsyslog/ident.h>
#include <kvsyslog/severity.h>

namespace KvSyslog {

  /* Opens the process-wide syslog handle on construction, through
     'lifecycle'.  See TConnectionLifecycle for what that means when more
     than one of these exists at a time. */
  class TSyslogDrain final : public TDrain {
    NO_COPY_SEMANTICS(TSyslogDrain);

    public:
    /* 'option' is the openlog() option word.  Throws TTransportError if
       openlog() fails. */
    TSyslogDrain(std::shared_ptr<TConnectionLifecycle> lifecycle,
        TIdent &&ident, int option, TFacility facility,
        const TAdapter &adapter, const std::optional<TSeverity> &threshold);

    /* Calls closelog() if this drain's ident was the last one passed to
       openlog(), then frees the ident. */
    ~TSyslogDrain() override;

    const char *GetIdent() const noexcept {
      assert(this);
      return Ident.Get();
    }

    int GetOption() const noexcept {
      assert(this);
      return Option;
    }

    protected:
    /* Drops NUL bytes from 'msg', since syslog() can't carry them. */
    void WriteMsg(int priority, std::string &msg) override;

    /* Plain LOG_ERR, leaving the facility to the one given to openlog(). */
    int GetFormatErrorPriority(int priority) const noexcept override;

    private:
    const std::shared_ptr<TConnectionLifecycle> Lifecycle;

    TIdent Ident;

    const int Option;
  };  // TSyslogDrain

}  // KvSyslog
