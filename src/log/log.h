/* <log/log.h>

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

   Header to include for basic diagnostic logging operations.
 */

#pragma once

#include <cstddef>

#include <log/log_entry.h>
#include <log/log_writer.h>
#include <log/pri.h>

namespace Log {

  /* Bytes of space available to hold a single log entry. */
  const size_t LogEntryBufSize = 512;

  /* Used in LOG() and LOG_ERRNO() macros below. */
  using TLogEntryType = TLogEntry<LogEntryBufSize>;

}  // Log

/* Facilitates expressions such as the following.

       LOG(TPri::INFO) << "The answer is " << ComputeAnswer();

   Since Log::TLogEntry has a bool conversion operator, the entire
   subexpression following the && operator in the macro below has a type of
   bool, and is not evaluated if Log::IsEnabled(TPri::INFO) returns false,
   avoiding an unnecessary call to ComputeAnswer().
 */
#define LOG(p) Log::IsEnabled(p) && Log::TLogEntryType(Log::GetLogWriter(), p)

/* Same as LOG(), but appends a strerror() message associated with errno_value
   to log entry before writing. */
#define LOG_ERRNO(p, errno_value) Log::IsEnabled(p) && \
    Log::TLogEntryType(Log::GetLogWriter(), p, errno_value)
