/* <kvsyslog/connection_lifecycle.h>

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

   Guards the single process-wide openlog() state.
 */

#pragma once

#include <cassert>
#include <memory>
#include <mutex>

#include <base/no_copy_semantics.h>
#include <kvsyslog/ident.h>
#include <kvsyslog/syslog_api.h>

namespace KvSyslog {

  /* openlog() configures one handle shared by the whole process, and keeps
     using the ident pointer it was last given.  This class records which
     owned ident (if any) was passed to openlog() most recently, so a drain
     being destroyed can tell whether it must call closelog() before freeing
     its ident.

     Opening a second drain while the first is alive silently changes the
     facility, options and ident the first one logs with.  That is how the
     underlying API works, and this class does not try to hide it. */
  class TConnectionLifecycle final {
    NO_COPY_SEMANTICS(TConnectionLifecycle);

    public:
    explicit TConnectionLifecycle(std::shared_ptr<TSyslogApi> api);

    /* Process-wide instance using TLibcSyslogApi. */
    static const std::shared_ptr<TConnectionLifecycle> &GetDefault();

    /* Call openlog() with the given arguments.  An owned 'ident' becomes the
       recorded owner.  An absent or borrowed one leaves the recorded owner
       unchanged.
       Throws TTransportError if the api call fails, or if an earlier failure
       left this object broken. */
    void Open(const TIdent &ident, int option, int facility);

    /* Release 'ident', which belongs to a drain being destroyed, and leave
       it absent.  If it is owned and is the recorded owner, call closelog()
       first.  If this object is broken, an owned ident is leaked instead of
       freed.  Does nothing for an ident that is not owned. */
    void Close(TIdent &ident) noexcept;

    /* Write one message with syslog().  'msg' must be NUL terminated.
       Throws TTransportError on failure. */
    void Write(int priority, const char *msg);

    /* True once an api call failed during Open() or Close().  The recorded
       owner can no longer be trusted at that point. */
    bool IsBroken() const noexcept;

    TSyslogApi &GetApi() const noexcept {
      assert(this);
      return *Api;
    }

    private:
    const std::shared_ptr<TSyslogApi> Api;

    /* Protects 'Owner' and 'Broken', and is held across openlog() and
       closelog(). */
    mutable std::mutex Mutex;

    /* Address of the owned ident most recently passed to openlog(), or null.
       Only compared, never dereferenced. */
    const char *Owner = nullptr;

    bool Broken = false;
  };  // TConnectionLifecycle

}  // KvSyslog
