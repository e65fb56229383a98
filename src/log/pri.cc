/* <log/pri.cc>

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

   Implements <log/pri.h>.
 */

#include <log/pri.h>

#include <atomic>
#include <cstddef>
#include <stdexcept>

using namespace Log;

static std::atomic<unsigned int> LogMask(UpTo(TPri::NOTICE));

/* Indexed by the numeric value of TPri. */
static const char *const PriNames[] = {
  "EMERG", "ALERT", "CRIT", "ERR", "WARNING", "NOTICE", "INFO", "DEBUG"
};

static const size_t PriCount = sizeof(PriNames) / sizeof(*PriNames);

unsigned int Log::GetLogMask() noexcept {
  return LogMask.load(std::memory_order_relaxed);
}

void Log::SetLogMask(unsigned int mask) noexcept {
  LogMask.store(mask, std::memory_order_relaxed);
}

const char *Log::ToString(TPri p) noexcept {
  const auto index = static_cast<size_t>(p);
  return (index < PriCount) ? PriNames[index] : "";
}

TPri Log::ToPri(const std::string &pri_string) {
  for (size_t i = 0; i < PriCount; ++i) {
    if (pri_string == PriNames[i]) {
      return static_cast<TPri>(i);
    }
  }

  std::string msg("Invalid log level: ");
  msg += pri_string;
  throw std::range_error(msg);
}
