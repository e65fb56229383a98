/* <log/log_writer.h>

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

   Destinations for the library's own diagnostic messages, and global log
   writer access.
 */

#pragma once

#include <cassert>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

#include <sys/stat.h>
#include <sys/types.h>

#include <base/fd.h>
#include <base/no_copy_semantics.h>
#include <log/pri.h>

namespace Log {

  /* Log writer base class. */
  class TLogWriterBase {
    NO_COPY_SEMANTICS(TLogWriterBase);

    public:
    virtual ~TLogWriterBase() = default;

    /* Write one entry of 'len' bytes starting at 'msg'.  The entry has no
       trailing newline.  Writes are best effort: a failure is not reported. */
    virtual void WriteEntry(TPri pri, const char *msg,
        size_t len) const noexcept = 0;

    protected:
    TLogWriterBase() = default;
  };  // TLogWriterBase

  /* Writes entries to stderr.  This is the writer in effect until
     SetLogWriter() is called. */
  class TStderrLogWriter final : public TLogWriterBase {
    NO_COPY_SEMANTICS(TStderrLogWriter);

    public:
    TStderrLogWriter() = default;

    void WriteEntry(TPri pri, const char *msg,
        size_t len) const noexcept override;
  };  // TStderrLogWriter

  /* Appends entries to a file. */
  class TFileLogWriter final : public TLogWriterBase {
    NO_COPY_SEMANTICS(TFileLogWriter);

    public:
    /* Thrown by constructor if the path is not absolute. */
    class TInvalidPath : public std::runtime_error {
      public:
      explicit TInvalidPath(const std::string &path);

      const std::string &GetPath() const noexcept {
        assert(this);
        return Path;
      }

      private:
      std::string Path;
    };  // TInvalidPath

    static const mode_t DEFAULT_FILE_MODE = S_IRUSR | S_IWUSR;

    /* 'path' must be absolute.  The file is created if necessary.  Throws
       std::system_error if the file can not be opened. */
    explicit TFileLogWriter(const std::string &path,
        mode_t open_mode = DEFAULT_FILE_MODE);

    const std::string &GetPath() const noexcept {
      assert(this);
      return Path;
    }

    void WriteEntry(TPri pri, const char *msg,
        size_t len) const noexcept override;

    private:
    const std::string Path;

    const Base::TFd Fd;
  };  // TFileLogWriter

  /* Install 'writer' as the global log writer.  Entries already being
     written through the previous writer finish there. */
  void SetLogWriter(std::shared_ptr<TLogWriterBase> writer) noexcept;

  /* Restore the default stderr writer.  Intended for unit tests. */
  void DropLogWriter() noexcept;

  /* Get a reference to the current global log writer. */
  std::shared_ptr<TLogWriterBase> GetLogWriter() noexcept;

}  // Log
