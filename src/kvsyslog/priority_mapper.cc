/* <kvsyslog/priority_mapper.cc>

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

   Implements <kvsyslog/priority_mapper.h>.
 */

#include <kvsyslog/priority_mapper.h>

#include <base/no_default_case.h>
#include <kvsyslog/level.h>

using namespace KvSyslog;

TPriority TDefaultPriorityMapper::GetPriority(const TRecord &record,
    const TKeyValues & /*scope_values*/) const {
  assert(this);
  return TPriority(ToLevel(record.GetSeverity()));
}

TPriority TCustomPriorityMapper::GetPriority(const TRecord &record,
    const TKeyValues &scope_values) const {
  assert(this);
  return Fn(record, scope_values);
}

const std::optional<TPriority> &TPriorityConfig::Get(
    TSeverity severity) const noexcept {
  assert(this);

  switch (severity) {
    case TSeverity::Trace: {
      return Trace;
    }
    case TSeverity::Debug: {
      return Debug;
    }
    case TSeverity::Info: {
      return Info;
    }
    case TSeverity::Warning: {
      return Warning;
    }
    case TSeverity::Error: {
      return Error;
    }
    case TSeverity::Critical: {
      return Critical;
    }
    NO_DEFAULT_CASE;
  }
}

std::optional<TPriority> &TPriorityConfig::Get(TSeverity severity) noexcept {
  assert(this);
  const TPriorityConfig &self = *this;
  return const_cast<std::optional<TPriority> &>(self.Get(severity));
}

bool TPriorityConfig::IsEmpty() const noexcept {
  assert(this);
  return !All && !Trace && !Debug && !Info && !Warning && !Error &&
      !Critical;
}

TPriority TPriorityConfig::Resolve(TSeverity severity) const noexcept {
  assert(this);
  const std::optional<TPriority> &entry = Get(severity);

  if (entry) {
    return All ? entry->Overlay(*All) : *entry;
  }

  return All ? *All : TPriority(ToLevel(severity));
}

TPriority TConfiguredPriorityMapper::GetPriority(const TRecord &record,
    const TKeyValues & /*scope_values*/) const {
  assert(this);
  return Config.Resolve(record.GetSeverity());
}
