/* <log/log_entry.h>

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

   A single diagnostic log entry, which functions as a std::ostream backed by
   a fixed size buffer.
 */

#pragma once

#include <cassert>
#include <cstddef>
#include <memory>
#include <ostream>
#include <streambuf>
#include <utility>

#include <base/error_util.h>
#include <base/no_copy_semantics.h>
#include <log/log_writer.h>
#include <log/pri.h>

namespace Log {

  /* Simple std::streambuf backed by an internal array of size 'BufSize'.
     Output beyond the end of the array is discarded. */
  template <size_t BufSize>
  struct TArrayStreambuf : public std::streambuf {
    NO_COPY_SEMANTICS(TArrayStreambuf);

    TArrayStreambuf() noexcept {
      setp(Buf, Buf + BufSize);
    }

    /* Output is stored here. */
    char Buf[BufSize];
  };  // TArrayStreambuf

  /* A single log entry.  At most 'BufSize' bytes of output are kept.  The
     entry is handed to its log writer on destruction, unless Write() was
     called first. */
  template <size_t BufSize>
  class TLogEntry final
      : private TArrayStreambuf<BufSize>,
        public std::ostream {
    NO_COPY_SEMANTICS(TLogEntry);

    public:
    /* If 'errno_value' is nonzero, a strerror() message is appended to the
       entry before it is written. */
    TLogEntry(std::shared_ptr<TLogWriterBase> &&log_writer, TPri level,
        int errno_value = 0) noexcept
        : TArrayStreambuf<BufSize>(),
          std::ostream(this),
          LogWriter(std::move(log_writer)),
          Level(level),
          ErrnoValue(errno_value) {
      assert(!!LogWriter);
    }

    ~TLogEntry() override {
      Write();
    }

    /* Facilitates expressions such as the following.

           IsEnabled(TPri::INFO) && TLogEntry<K>(GetLogWriter(), TPri::INFO)
               << "The answer is " << ComputeAnswer();

       The subexpression following the && operator has type bool, and is not
       evaluated if IsEnabled(TPri::INFO) returns false.  See the LOG() macro
       in <log/log.h>. */
    explicit operator bool() const noexcept {
      return true;
    }

    TPri GetLevel() const noexcept {
      return Level;
    }

    /* Number of bytes currently held. */
    size_t Size() const noexcept {
      return static_cast<size_t>(this->pptr() - this->Buf);
    }

    /* If log entry has not already been written, write it. */
    void Write() noexcept {
      if (!Written) {
        Written = true;

        if (ErrnoValue) {
          Base::AppendStrerror(ErrnoValue, *this);
        }

        if (Size()) {
          LogWriter->WriteEntry(Level, this->Buf, Size());
        }
      }
    }

    private:
    const std::shared_ptr<TLogWriterBase> LogWriter;

    const TPri Level;

    /* If nonzero, append strerror() message. */
    const int ErrnoValue;

    bool Written = false;
  };  // TLogEntry

}  // Log
