/* <kvsyslog/value_escaper.cc>

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

   Implements <kvsyslog/value_escaper.h>.
 */

#include <kvsyslog/value_escaper.h>

#include <cstddef>

using namespace KvSyslog;

void KvSyslog::EscapeValue(std::string &out, const std::string &value) {
  static const char special[] = "\\\"]";
  size_t start = 0;

  for (; ; ) {
    const size_t pos = value.find_first_of(special, start);

    if (pos == std::string::npos) {
      out.append(value, start, std::string::npos);
      break;
    }

    out.append(value, start, pos - start);
    out += '\\';
    out += value[pos];
    start = pos + 1;
  }
}

std::string KvSyslog::UnescapeValue(const std::string &escaped) {
  std::string result;
  result.reserve(escaped.size());

  for (size_t i = 0; i < escaped.size(); ++i) {
    if ((escaped[i] == '\\') && ((i + 1) < escaped.size())) {
      ++i;
    }

    result += escaped[i];
  }

  return result;
}
