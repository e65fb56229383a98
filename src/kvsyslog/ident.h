/* <kvsyslog/ident.h>

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

   Program name passed to openlog().
 */

#pragma once

#include <cassert>
#include <memory>
#include <string>
#include <utility>

#include <base/no_copy_semantics.h>

namespace KvSyslog {

  /* Either absent, borrowed (the caller guarantees the string outlives every
     drain using it) or owned (a heap copy with a stable address).  An owned
     ident is freed only through TConnectionLifecycle::Close(). */
  class TIdent final {
    NO_COPY_SEMANTICS(TIdent);

    public:
    /* Absent ident: openlog() receives a null pointer. */
    TIdent() noexcept = default;

    /* Owned copy of 'ident'.  Throws TIdentContainsNul if 'ident' contains a
       NUL byte. */
    explicit TIdent(const std::string &ident);

    static TIdent Borrowed(const char *ident) noexcept {
      assert(ident);
      TIdent result;
      result.Ptr = ident;
      return result;
    }

    TIdent(TIdent &&that) noexcept
        : Owned(std::move(that.Owned)),
          Ptr(that.Ptr) {
      that.Ptr = nullptr;
    }

    TIdent &operator=(TIdent &&that) noexcept {
      assert(this);

      if (&that != this) {
        Owned = std::move(that.Owned);
        Ptr = that.Ptr;
        that.Ptr = nullptr;
      }

      return *this;
    }

    /* Pointer for openlog().  Null if absent. */
    const char *Get() const noexcept {
      assert(this);
      return Ptr;
    }

    bool IsAbsent() const noexcept {
      assert(this);
      return (Ptr == nullptr);
    }

    bool IsOwned() const noexcept {
      assert(this);
      return (Owned != nullptr);
    }

    /* Free an owned string and make this ident absent. */
    void Reset() noexcept {
      assert(this);
      Owned.reset();
      Ptr = nullptr;
    }

    /* Give up an owned string without freeing it, and make this ident
       absent. */
    void Leak() noexcept {
      assert(this);
      static_cast<void>(Owned.release());
      Ptr = nullptr;
    }

    private:
    std::unique_ptr<const std::string> Owned;

    const char *Ptr = nullptr;
  };  // TIdent

}  // KvSyslog
