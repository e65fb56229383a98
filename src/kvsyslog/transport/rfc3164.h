/* <kvsyslog/transport/rfc3164.h>

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

   BSD syslog message header, as described in RFC 3164.
 */

#pragma once

#include <ctime>
#include <string>

namespace KvSyslog {

  namespace Transport {

    /* Append a header of the form

           <PRI>Mmm dd hh:mm:ss HOSTNAME PROCESS[PID]: 

       to 'out'.  'now' is rendered in local time.  "HOSTNAME " is left out
       when 'hostname' is empty. */
    void AppendRfc3164Header(std::string &out, int priority, time_t now,
        const std::string &hostname, const std::string &process, int pid);

  }  // Transport

}  // KvSyslog
