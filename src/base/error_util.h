/* <base/error_util.h>

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

   Error utilities.
 */

#pragma once

#include <cerrno>
#include <cstddef>
#include <ostream>
#include <string>
#include <system_error>

namespace Base {

  /* Throw the given code as an error in the system category. */
  template <typename TCode>
  inline void ThrowSystemError(TCode code) {
    throw std::system_error(code, std::system_category());
  }

  /* If the given value is < 0, throw a system error based on errno.
     Use this function to test the results of system I/O calls. */
  template <typename TRet>
  TRet IfLt0(TRet &&ret) {
    if (ret < 0) {
      ThrowSystemError(errno);
    }

    return ret;
  }

  /* If the given value != 0, throw a system error based on the return value.
     Use this function to test the results of pthread calls. */
  template <typename TRet>
  TRet IfNe0(TRet &&ret) {
    if (ret != 0) {
      ThrowSystemError(ret);
    }

    return ret;
  }

  /* Return true iff. the error was caused by a signal. */
  inline bool WasInterrupted(const std::system_error &error) noexcept {
    return error.code().value() == EINTR;
  }

  /* Thread safe wrapper that hides the platform-specific differences of
     strerror_r().  Either copies an error message corresponding to
     'errno_value' into 'buf' and returns 'buf', or returns a pointer to a
     statically allocated string constant.  The returned pointer must not be
     used beyond the lifetime of 'buf'. */
  const char *Strerror(int errno_value, char *buf, size_t buf_size) noexcept;

  /* Append the strerror() message for 'errno_value' to 'msg'. */
  void AppendStrerror(int errno_value, std::string &msg);

  /* Same as above, but writes to a std::ostream. */
  void AppendStrerror(int errno_value, std::ostream &out);

  /* Call std::set_terminate() to install a std::terminate_handler that
     immediately calls Die(), which should generate a stack trace before
     calling std::abort(). */
  void DieOnTerminate() noexcept;

  /* Write 'msg' and a stack trace to stderr, and dump core. */
  [[ noreturn ]] void Die(const char *msg) noexcept;

}  // Base
