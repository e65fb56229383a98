/* <kvsyslog/drain.cc>

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

   Implements <kvsyslog/drain.h>.
 */

#include <kvsyslog/drain.h>

#include <cstddef>
#include <optional>
#include <string>

#include <syslog.h>

#include <base/on_destroy.h>
#include <kvsyslog/error.h>
#include <kvsyslog/level.h>
#include <log/log.h>

using namespace Base;
using namespace KvSyslog;
using namespace Log;

namespace {

  /* Reused by all drains on a thread.  Emptied after every Log() call. */
  thread_local std::string ScratchBuf;

  /* Number of Log() calls in progress on this thread.  A lazy value or a
     custom format may log while an outer call still owns 'ScratchBuf'. */
  thread_local size_t LogDepth = 0;

}  // namespace

void TDrain::Log(const TRecord &record, const TKeyValues &scope_values) {
  assert(this);

  if (Threshold && (record.GetSeverity() < *Threshold)) {
    return;
  }

  /* Only the outermost call on a thread uses the shared buffer. */
  std::string nested_buf;
  std::string &buf = LogDepth ? nested_buf : ScratchBuf;
  ++LogDepth;
  auto cleanup = OnDestroy([&buf]() noexcept {
    buf.clear();
    --LogDepth;
  });

  const int priority = GetPriority(record, scope_values).ToRaw();
  std::optional<std::string> format_error;

  try {
    Adapter.FormatMsg(buf, record, scope_values);
  } catch (const TFormatError &x) {
    LOG(TPri::DEBUG) << "Failed to format log message: " << x.what();
    format_error.emplace(x.what());
    buf.assign(record.GetMsg());
  }

  WriteMsg(priority, buf);

  if (format_error) {
    buf.assign("Error fully formatting the previous log message: ");
    buf += *format_error;
    WriteMsg(GetFormatErrorPriority(priority), buf);
  }
}

TPriority TDrain::GetPriority(const TRecord &record,
    const TKeyValues &scope_values) const {
  assert(this);
  return Adapter.GetPriority(record, scope_values).Overlay(
      TPriority(TLevel::Debug, Facility));
}

int TDrain::GetFormatErrorPriority(int priority) const noexcept {
  assert(this);
  return LOG_FAC(priority) ? ((priority & LOG_FACMASK) | LOG_ERR) : LOG_ERR;
}
