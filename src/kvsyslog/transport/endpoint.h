/* <kvsyslog/transport/endpoint.h>

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

   Network address of a syslog collector.
 */

#pragma once

#include <string>

#include <netinet/in.h>
#include <sys/socket.h>

namespace KvSyslog {

  namespace Transport {

    /* Host name or numeric address, and port.  An empty host means the
       wildcard address when binding a local socket, and the loopback
       address otherwise. */
    struct TEndpoint {
      TEndpoint() = default;

      TEndpoint(const std::string &host, in_port_t port)
          : Host(host),
            Port(port) {
      }

      std::string Host;

      in_port_t Port = 0;
    };  // TEndpoint

    /* "host:port", with brackets around an IPv6 address. */
    std::string ToString(const TEndpoint &endpoint);

    /* Resolved socket address. */
    struct TSockAddr {
      struct sockaddr_storage Addr;

      socklen_t Len = 0;

      int GetFamily() const noexcept {
        return Addr.ss_family;
      }

      const struct sockaddr *Get() const noexcept {
        return reinterpret_cast<const struct sockaddr *>(&Addr);
      }
    };  // TSockAddr

    /* Resolve 'endpoint' for sockets of type 'sock_type' (SOCK_DGRAM or
       SOCK_STREAM), taking the first address found.  If 'family' is not
       AF_UNSPEC, only addresses of that family are considered.  Pass true
       for 'passive' when the result is an address to bind to.  Throws
       TConfigError if nothing is found. */
    TSockAddr Resolve(const TEndpoint &endpoint, int sock_type,
        int family = AF_UNSPEC, bool passive = false);

  }  // Transport

}  // KvSyslog
