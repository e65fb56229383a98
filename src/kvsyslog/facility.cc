/* <kvsyslog/facility.cc>

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

   Implements <kvsyslog/facility.h>.
 */

#include <kvsyslog/facility.h>

#include <cassert>
#include <cstddef>

#include <syslog.h>

#include <boost/algorithm/string/case_conv.hpp>

#include <kvsyslog/error.h>

using namespace KvSyslog;

namespace {

  struct TFacilityInfo {
    TFacility Facility;

    const char *Name;

    int Value;

    bool Native;
  };  // TFacilityInfo

  /* Indexed by TFacility value. */
  const TFacilityInfo FacilityTable[] = {
    {TFacility::Auth, "auth", LOG_AUTH, true},
#ifdef LOG_AUTHPRIV
    {TFacility::AuthPriv, "authpriv", LOG_AUTHPRIV, true},
#else
    {TFacility::AuthPriv, "authpriv", LOG_AUTH, false},
#endif
#ifdef LOG_CRON
    {TFacility::Cron, "cron", LOG_CRON, true},
#else
    {TFacility::Cron, "cron", LOG_DAEMON, false},
#endif
    {TFacility::Daemon, "daemon", LOG_DAEMON, true},
#ifdef LOG_FTP
    {TFacility::Ftp, "ftp", LOG_FTP, true},
#else
    {TFacility::Ftp, "ftp", LOG_DAEMON, false},
#endif
    {TFacility::Kern, "kern", LOG_KERN, true},
#ifdef LOG_INSTALL
    {TFacility::Install, "install", LOG_INSTALL, true},
#else
    {TFacility::Install, "install", LOG_USER, false},
#endif
#ifdef LOG_LAUNCHD
    {TFacility::Launchd, "launchd", LOG_LAUNCHD, true},
#else
    {TFacility::Launchd, "launchd", LOG_DAEMON, false},
#endif
    {TFacility::Local0, "local0", LOG_LOCAL0, true},
    {TFacility::Local1, "local1", LOG_LOCAL1, true},
    {TFacility::Local2, "local2", LOG_LOCAL2, true},
    {TFacility::Local3, "local3", LOG_LOCAL3, true},
    {TFacility::Local4, "local4", LOG_LOCAL4, true},
    {TFacility::Local5, "local5", LOG_LOCAL5, true},
    {TFacility::Local6, "local6", LOG_LOCAL6, true},
    {TFacility::Local7, "local7", LOG_LOCAL7, true},
    {TFacility::Lpr, "lpr", LOG_LPR, true},
    {TFacility::Mail, "mail", LOG_MAIL, true},
#ifdef LOG_NTP
    {TFacility::Ntp, "ntp", LOG_NTP, true},
#else
    {TFacility::Ntp, "ntp", LOG_DAEMON, false},
#endif
#ifdef LOG_NETINFO
    {TFacility::NetInfo, "netinfo", LOG_NETINFO, true},
#else
    {TFacility::NetInfo, "netinfo", LOG_DAEMON, false},
#endif
    {TFacility::News, "news", LOG_NEWS, true},
#ifdef LOG_RAS
    {TFacility::Ras, "ras", LOG_RAS, true},
#else
    {TFacility::Ras, "ras", LOG_USER, false},
#endif
#ifdef LOG_REMOTEAUTH
    {TFacility::RemoteAuth, "remoteauth", LOG_REMOTEAUTH, true},
#else
    {TFacility::RemoteAuth, "remoteauth", LOG_DAEMON, false},
#endif
#ifdef LOG_SECURITY
    {TFacility::Security, "security", LOG_SECURITY, true},
#else
    {TFacility::Security, "security", LOG_AUTH, false},
#endif
    {TFacility::Syslog, "syslog", LOG_SYSLOG, true},
    {TFacility::User, "user", LOG_USER, true},
    {TFacility::Uucp, "uucp", LOG_UUCP, true}
  };

  const TFacilityInfo &GetInfo(TFacility facility) noexcept {
    const auto index = static_cast<size_t>(facility);
    assert(index < (sizeof(FacilityTable) / sizeof(*FacilityTable)));
    const TFacilityInfo &info = FacilityTable[index];
    assert(info.Facility == facility);
    return info;
  }

}  // namespace

int KvSyslog::ToSyslog(TFacility facility) noexcept {
  return GetInfo(facility).Value;
}

bool KvSyslog::IsNative(TFacility facility) noexcept {
  return GetInfo(facility).Native;
}

const char *KvSyslog::ToString(TFacility facility) noexcept {
  return GetInfo(facility).Name;
}

TFacility KvSyslog::ToFacility(const std::string &name) {
  const std::string lower = boost::algorithm::to_lower_copy(name);

  for (const TFacilityInfo &info : FacilityTable) {
    if (lower == info.Name) {
      return info.Facility;
    }
  }

  throw TUnknownNameError("syslog facility", name);
}

std::optional<TFacility> KvSyslog::FacilityFromInt(int value) noexcept {
  std::optional<TFacility> result;

  for (const TFacilityInfo &info : FacilityTable) {
    if (info.Native && (info.Value == value)) {
      result = info.Facility;
      break;
    }
  }

  return result;
}
