/* <kvsyslog/priority.cc>

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

   Implements <kvsyslog/priority.h>.
 */

#include <kvsyslog/priority.h>

using namespace KvSyslog;

int TPriority::ToRaw() const noexcept {
  assert(this);

  if (RawValue) {
    return *RawValue;
  }

  return ToSyslog(Level) | (Facility ? ToSyslog(*Facility) : 0);
}

TPriority TPriority::Overlay(const TPriority &other) const noexcept {
  assert(this);

  if (!IsRaw() && !Facility && other.GetFacility()) {
    return TPriority(Level, *other.GetFacility());
  }

  return *this;
}

std::string TPriority::ToString() const {
  assert(this);

  if (RawValue) {
    return "raw(" + std::to_string(*RawValue) + ")";
  }

  std::string result;

  if (Facility) {
    result = KvSyslog::ToString(*Facility);
    result += '.';
  }

  result += KvSyslog::ToString(Level);
  return result;
}
