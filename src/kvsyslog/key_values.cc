/* <kvsyslog/key_values.cc>

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

   Implements <kvsyslog/key_values.h>.
 */

#include <kvsyslog/key_values.h>

using namespace KvSyslog;

TKeyValues::TKeyValues(
    std::initializer_list<std::pair<std::string, std::string>> init) {
  Items.reserve(init.size());

  for (const auto &item : init) {
    Add(item.first, item.second);
  }
}

void TKeyValues::Serialize(TKvSerializer &serializer) const {
  assert(this);

  for (const TItem &item : Items) {
    if (item.Lazy) {
      serializer.Emit(item.Key, item.Lazy());
    } else {
      serializer.Emit(item.Key, item.Value);
    }
  }
}

const TKeyValues &TKeyValues::GetEmpty() noexcept {
  static const TKeyValues empty;
  return empty;
}
