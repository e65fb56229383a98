/* <kvsyslog/facility.h>

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

   Syslog facilities.
 */

#pragma once

#include <optional>
#include <string>

namespace KvSyslog {

  /* Superset of the facilities known across platforms.  A facility the
     platform does not define is replaced by a similar one when converted
     with ToSyslog(). */
  enum class TFacility {
    Auth,
    AuthPriv,
    Cron,
    Daemon,
    Ftp,
    Kern,
    Install,
    Launchd,
    Local0,
    Local1,
    Local2,
    Local3,
    Local4,
    Local5,
    Local6,
    Local7,
    Lpr,
    Mail,
    Ntp,
    NetInfo,
    News,
    Ras,
    RemoteAuth,
    Security,
    Syslog,
    User,
    Uucp
  };  // TFacility

  const TFacility DefaultFacility = TFacility::User;

  /* Return the <syslog.h> value for 'facility', after platform fallback:
     Install and Ras become User, Launchd, Ntp, NetInfo, RemoteAuth, Cron and
     Ftp become Daemon, Security and AuthPriv become Auth. */
  int ToSyslog(TFacility facility) noexcept;

  /* Return true if the platform defines 'facility' itself, so that
     ToSyslog() does not substitute another one. */
  bool IsNative(TFacility facility) noexcept;

  /* Returns the lowercase name, for instance "local0" or "authpriv". */
  const char *ToString(TFacility facility) noexcept;

  /* Parse a facility name, ignoring case.  Throws TUnknownNameError on
     failure. */
  TFacility ToFacility(const std::string &name);

  /* Return the native facility with the given <syslog.h> value, or an empty
     optional if there is none. */
  std::optional<TFacility> FacilityFromInt(int value) noexcept;

}  // KvSyslog
