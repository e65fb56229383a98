/* <base/fd.cc>

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

   Implements <base/fd.h>.
 */

#include <base/fd.h>

#include <poll.h>
#include <unistd.h>

using namespace Base;

bool TFd::IsReadable(int timeout) const {
  assert(this);
  assert(OsHandle >= 0);
  pollfd p;
  p.fd = OsHandle;
  p.events = POLLIN;
  p.revents = 0;

  for (; ; ) {
    int ret = poll(&p, 1, timeout);

    if (ret >= 0) {
      return (ret != 0);
    }

    if (errno != EINTR) {
      ThrowSystemError(errno);
    }
  }
}

void TFd::Reset() noexcept {
  assert(this);

  if (OsHandle >= 0) {
    /* close() may fail with EINTR, but on Linux the descriptor is released
       anyway, so retrying would be wrong. */
    close(OsHandle);
    OsHandle = -1;
  }
}
