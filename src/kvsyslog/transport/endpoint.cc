/* <kvsyslog/transport/endpoint.cc>

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

   Implements <kvsyslog/transport/endpoint.h>.
 */

#include <kvsyslog/transport/endpoint.h>

#include <cstring>
#include <memory>

#include <netdb.h>

#include <kvsyslog/error.h>

using namespace KvSyslog;
using namespace KvSyslog::Transport;

std::string KvSyslog::Transport::ToString(const TEndpoint &endpoint) {
  std::string result;

  if (endpoint.Host.find(':') == std::string::npos) {
    result = endpoint.Host;
  } else {
    result = "[" + endpoint.Host + "]";
  }

  result += ':';
  result += std::to_string(endpoint.Port);
  return result;
}

TSockAddr KvSyslog::Transport::Resolve(const TEndpoint &endpoint,
    int sock_type, int family, bool passive) {
  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = family;
  hints.ai_socktype = sock_type;
  hints.ai_flags = passive ? (AI_NUMERICSERV | AI_PASSIVE) : AI_NUMERICSERV;
  struct addrinfo *found = nullptr;
  const std::string port = std::to_string(endpoint.Port);
  const int ret = getaddrinfo(
      endpoint.Host.empty() ? nullptr : endpoint.Host.c_str(), port.c_str(),
      &hints, &found);

  if (ret != 0) {
    std::string msg("Failed to resolve syslog endpoint ");
    msg += ToString(endpoint);
    msg += ": ";
    msg += gai_strerror(ret);
    throw TConfigError(msg);
  }

  std::unique_ptr<struct addrinfo, void (*)(struct addrinfo *)>
      found_ptr(found, freeaddrinfo);

  if ((found == nullptr) || (found->ai_addrlen > sizeof(TSockAddr::Addr))) {
    throw TConfigError("No usable address for syslog endpoint " +
        ToString(endpoint));
  }

  TSockAddr result;
  std::memset(&result.Addr, 0, sizeof(result.Addr));
  std::memcpy(&result.Addr, found->ai_addr, found->ai_addrlen);
  result.Len = found->ai_addrlen;
  return result;
}
