/* <log/log_writer.cc>

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

   Implements <log/log_writer.h>.
 */

#include <log/log_writer.h>

#include <atomic>

#include <fcntl.h>
#include <sys/uio.h>
#include <unistd.h>

#include <base/error_util.h>

using namespace Base;
using namespace Log;

static void WriteLine(int fd, const char *msg, size_t len) noexcept {
  /* One writev() call keeps the entry and its newline together. */
  struct iovec iov[2];
  iov[0].iov_base = const_cast<char *>(msg);
  iov[0].iov_len = len;
  iov[1].iov_base = const_cast<char *>("\n");
  iov[1].iov_len = 1;

  while ((writev(fd, iov, 2) < 0) && (errno == EINTR)) {
  }
}

void TStderrLogWriter::WriteEntry(TPri /* pri */, const char *msg,
    size_t len) const noexcept {
  assert(this);
  WriteLine(2, msg, len);
}

static std::string MakeInvalidPathMsg(const std::string &path) {
  std::string msg("Logfile path must be absolute: [");
  msg += path;
  msg += "]";
  return msg;
}

TFileLogWriter::TInvalidPath::TInvalidPath(const std::string &path)
    : std::runtime_error(MakeInvalidPathMsg(path)),
      Path(path) {
}

static const std::string &ValidatePath(const std::string &path) {
  if (path.empty() || (path[0] != '/')) {
    throw TFileLogWriter::TInvalidPath(path);
  }

  return path;
}

TFileLogWriter::TFileLogWriter(const std::string &path, mode_t open_mode)
    : Path(ValidatePath(path)),
      Fd(open(path.c_str(), O_CREAT | O_APPEND | O_WRONLY | O_CLOEXEC,
          open_mode)) {
}

void TFileLogWriter::WriteEntry(TPri /* pri */, const char *msg,
    size_t len) const noexcept {
  assert(this);
  WriteLine(Fd, msg, len);
}

static std::shared_ptr<TLogWriterBase> &GlobalWriter() noexcept {
  static std::shared_ptr<TLogWriterBase> writer =
      std::make_shared<TStderrLogWriter>();
  return writer;
}

void Log::SetLogWriter(std::shared_ptr<TLogWriterBase> writer) noexcept {
  assert(writer);
  std::atomic_store(&GlobalWriter(), std::move(writer));
}

void Log::DropLogWriter() noexcept {
  std::shared_ptr<TLogWriterBase> writer(new TStderrLogWriter);
  std::atomic_store(&GlobalWriter(), std::move(writer));
}

std::shared_ptr<TLogWriterBase> Log::GetLogWriter() noexcept {
  return std::atomic_load(&GlobalWriter());
}
