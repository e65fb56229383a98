/* <base/on_destroy.h>

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

   Utility class for executing caller-supplied function on destructor
   invocation.
 */

#pragma once

#include <cassert>
#include <type_traits>
#include <utility>

#include <base/no_copy_semantics.h>

namespace Base {

  /* RAII class template that calls the provided function object on
     destruction, unless Cancel() was called first.  Construct one directly
     (class template argument deduction picks the lambda type) or through the
     OnDestroy() helper below. */
  template <typename TFn>
  class TOnDestroy final {
    NO_COPY_SEMANTICS(TOnDestroy);

    public:
    explicit TOnDestroy(const TFn &fn)
        : Fn(fn) {
    }

    explicit TOnDestroy(TFn &&fn)
        : Fn(std::move(fn)) {
    }

    TOnDestroy(TOnDestroy &&that)
        : Fn(std::move(that.Fn)),
          Active(that.Active) {
      that.Active = false;
    }

    ~TOnDestroy() {
      if (Active) {
        Fn();
      }
    }

    void Cancel() noexcept {
      assert(this);
      Active = false;
    }

    private:
    TFn Fn;

    bool Active = true;
  };  // TOnDestroy

  template <typename TFn>
  TOnDestroy<typename std::decay<TFn>::type> OnDestroy(TFn &&fn) {
    return TOnDestroy<typename std::decay<TFn>::type>(std::forward<TFn>(fn));
  }

}  // Base
