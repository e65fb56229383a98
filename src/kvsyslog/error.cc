/* <kvsyslog/error.cc>

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

   Implements <kvsyslog/error.h>.
 */

#include <kvsyslog/error.h>

using namespace KvSyslog;

std::string TTransportError::BuildMsg(const char *what_failed,
    const std::system_error &x) {
  std::string msg(what_failed);
  msg += " failed: ";
  msg += x.what();
  return msg;
}

std::string TUnknownNameError::BuildMsg(const char *kind,
    const std::string &name) {
  std::string msg("unrecognized ");
  msg += kind;
  msg += " name `";
  msg += name;
  msg += "`";
  return msg;
}
