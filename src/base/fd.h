/* <base/fd.h>

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

   RAII wrapper for a file descriptor.
 */

#pragma once

#include <cassert>
#include <utility>

#include <base/error_util.h>
#include <base/no_copy_semantics.h>

namespace Base {

  /* Owns a file descriptor and closes it on destruction.  Movable, not
     copyable.  A TFd with a negative handle is empty. */
  class TFd final {
    NO_COPY_SEMANTICS(TFd);

    public:
    /* Tag for the nonthrowing constructor. */
    enum TNoThrow { NoThrow };

    TFd() noexcept = default;

    /* Take ownership of 'os_handle'.  If 'os_handle' is negative, throw a
       std::system_error based on errno.  This allows the result of a system
       call to be assigned directly, as in:

           TFd sock = socket(AF_INET, SOCK_DGRAM, 0);
     */
    TFd(int os_handle)
        : OsHandle(IfLt0(os_handle)) {
    }

    /* Take ownership of 'os_handle', which may be negative (empty). */
    TFd(int os_handle, TNoThrow) noexcept
        : OsHandle(os_handle) {
    }

    TFd(TFd &&that) noexcept
        : OsHandle(that.OsHandle) {
      that.OsHandle = -1;
    }

    ~TFd() {
      Reset();
    }

    TFd &operator=(TFd &&that) noexcept {
      assert(this);

      if (&that != this) {
        Reset();
        OsHandle = that.OsHandle;
        that.OsHandle = -1;
      }

      return *this;
    }

    TFd &operator=(int os_handle) {
      assert(this);
      return *this = TFd(os_handle);
    }

    operator int() const noexcept {
      assert(this);
      return OsHandle;
    }

    bool IsOpen() const noexcept {
      assert(this);
      return (OsHandle >= 0);
    }

    /* Wait up to 'timeout' milliseconds for the descriptor to become readable.
       A negative timeout waits forever.  Return true if readable. */
    bool IsReadable(int timeout) const;

    /* Give up ownership of the descriptor without closing it. */
    int Release() noexcept {
      assert(this);
      int result = OsHandle;
      OsHandle = -1;
      return result;
    }

    /* Close the descriptor, if any, and leave this object empty. */
    void Reset() noexcept;

    void Swap(TFd &that) noexcept {
      assert(this);
      std::swap(OsHandle, that.OsHandle);
    }

    private:
    int OsHandle = -1;
  };  // TFd

}  // Base
