/* <kvsyslog/syslog_api.h>

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

   Interface to openlog(), syslog() and closelog(), replaceable for testing.
 */

#pragma once

#include <base/no_copy_semantics.h>

namespace KvSyslog {

  class TSyslogApi {
    NO_COPY_SEMANTICS(TSyslogApi);

    public:
    virtual ~TSyslogApi() = default;

    /* 'ident' may be null.  Otherwise it must stay valid until CloseLog() is
       called or OpenLog() is called again with another non-null ident. */
    virtual void OpenLog(const char *ident, int option, int facility) = 0;

    /* 'msg' is written as is, not used as a format string. */
    virtual void SysLog(int priority, const char *msg) = 0;

    virtual void CloseLog() = 0;

    /* Called by TConnectionLifecycle just before it frees an owned ident.
       Does nothing by default.  An exception thrown here is logged and
       otherwise ignored. */
    virtual void OnIdentRelease(const char * /*ident*/) {
    }

    protected:
    TSyslogApi() = default;
  };  // TSyslogApi

  /* The real thing. */
  class TLibcSyslogApi final : public TSyslogApi {
    public:
    TLibcSyslogApi() = default;

    void OpenLog(const char *ident, int option, int facility) override;

    void SysLog(int priority, const char *msg) override;

    void CloseLog() override;
  };  // TLibcSyslogApi

}  // KvSyslog
