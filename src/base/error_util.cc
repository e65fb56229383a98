/* <base/error_util.cc>

   ----------------------------------------------------------------------------
   Copyright 2010-2013 if(we)
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

   Implements <base/error_util.h>.
 */

#include <base/error_util.h>

#include <atomic>
#include <cassert>
#include <cstdlib>
#include <cstring>
#include <exception>

#include <execinfo.h>
#include <sys/uio.h>
#include <unistd.h>

using namespace Base;

const char *Base::Strerror(int errno_value, char *buf,
    size_t buf_size) noexcept {
  assert(buf);
  assert(buf_size);

  /* The man page for strerror_r explains all of this ugliness. */

#if ((_POSIX_C_SOURCE >= 200112L || _XOPEN_SOURCE >= 600) && ! _GNU_SOURCE)
  /* This is the XSI-compliant version of strerror_r(). */
  int err = strerror_r(errno_value, buf, buf_size);

  if (err) {
    buf[0] = '\0';
  }

  return buf;
#else
  /* This is the GNU-specific version of strerror_r().  Its return type is
     'char *'. */
  return strerror_r(errno_value, buf, buf_size);
#endif
}

static const size_t StrerrorBufSize = 256;

void Base::AppendStrerror(int errno_value, std::string &msg) {
  char tmp_buf[StrerrorBufSize];
  msg += Strerror(errno_value, tmp_buf, sizeof(tmp_buf));
}

void Base::AppendStrerror(int errno_value, std::ostream &out) {
  char tmp_buf[StrerrorBufSize];
  out << Strerror(errno_value, tmp_buf, sizeof(tmp_buf));
}

static const int StderrFd = 2;

static void WriteFatalMsg(const char *msg) noexcept {
  /* A single writev() keeps the message and its newline together when other
     threads are writing to stderr.  The write is best effort. */
  struct iovec iov[2];
  iov[0].iov_base = const_cast<char *>(msg);
  iov[0].iov_len = std::strlen(msg);
  iov[1].iov_base = const_cast<char *>("\n");
  iov[1].iov_len = 1;
  writev(StderrFd, iov, sizeof(iov) / sizeof(*iov));
}

[[ noreturn ]] static void TerminateHandler() noexcept {
  Die("Calling Die() on terminate");
}

void Base::DieOnTerminate() noexcept {
  std::set_terminate(TerminateHandler);
}

/* First caller of Die() takes this flag. */
static std::atomic_flag DieFlag = ATOMIC_FLAG_INIT;

void Base::Die(const char *msg) noexcept {
  if (!DieFlag.test_and_set()) {
    /* Static so the trace buffer doesn't consume stack space.  Only the first
       caller gets here. */
    static const int STACK_TRACE_SIZE = 128;
    static void *trace_buf[STACK_TRACE_SIZE];
    const int trace_size = backtrace(trace_buf, STACK_TRACE_SIZE);
    WriteFatalMsg(msg);
    backtrace_symbols_fd(trace_buf, trace_size, StderrFd);
  } else {
    /* Recursive or concurrent call.  Skip the stack trace. */
    WriteFatalMsg(msg);
  }

  std::abort();
}
