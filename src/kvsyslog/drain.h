/* <kvsyslog/drain.h>

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

   Base class for destinations that log events are written to.
 */

#pragma once

#include <cassert>
#include <optional>
#include <string>

#include <base/no_copy_semantics.h>
#include <kvsyslog/adapter.h>
#include <kvsyslog/facility.h>
#include <kvsyslog/key_values.h>
#include <kvsyslog/priority.h>
#include <kvsyslog/record.h>
#include <kvsyslog/severity.h>

namespace KvSyslog {

  class TDrain {
    NO_COPY_SEMANTICS(TDrain);

    public:
    virtual ~TDrain() = default;

    /* Format 'record' and write it with one transport call.  Events below
       the threshold are dropped before they are formatted.  If formatting
       fails, the bare message text is written instead, followed by a second
       message at level err describing the failure.  Throws TTransportError
       if a write fails.  Safe to call from multiple threads. */
    void Log(const TRecord &record,
        const TKeyValues &scope_values = TKeyValues::GetEmpty());

    const std::optional<TSeverity> &GetThreshold() const noexcept {
      assert(this);
      return Threshold;
    }

    /* Facility used for priorities that don't specify one. */
    TFacility GetFacility() const noexcept {
      assert(this);
      return Facility;
    }

    const TAdapter &GetAdapter() const noexcept {
      assert(this);
      return Adapter;
    }

    /* Resolved priority for 'record': the adapter's choice, with this
       drain's facility filled in if the adapter gave none. */
    TPriority GetPriority(const TRecord &record,
        const TKeyValues &scope_values) const;

    protected:
    TDrain(const TAdapter &adapter, TFacility facility,
        const std::optional<TSeverity> &threshold)
        : Adapter(adapter),
          Facility(facility),
          Threshold(threshold) {
    }

    /* Write 'msg' with the given syslog() priority.  'msg' may be modified
       in place.  Throws TTransportError on failure. */
    virtual void WriteMsg(int priority, std::string &msg) = 0;

    /* Priority of the message reporting a formatting failure of a message
       with priority 'priority'. */
    virtual int GetFormatErrorPriority(int priority) const noexcept;

    private:
    const TAdapter Adapter;

    const TFacility Facility;

    const std::optional<TSeverity> Threshold;
  };  // TDrain

}  // KvSyslog
