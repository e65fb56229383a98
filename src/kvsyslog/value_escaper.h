/* <kvsyslog/value_escaper.h>

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

   Escaping of attribute values in structured messages.
 */

#pragma once

#include <string>

namespace KvSyslog {

  /* Append 'value' to 'out', with a backslash in front of each '\', '"' and
     ']' character.  All other bytes are copied unchanged. */
  void EscapeValue(std::string &out, const std::string &value);

  /* Inverse of EscapeValue(): drop each escaping backslash. */
  std::string UnescapeValue(const std::string &escaped);

}  // KvSyslog
