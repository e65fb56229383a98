/* <kvsyslog/key_values.h>

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

   Ordered key-value attributes attached to a log event.
 */

#pragma once

#include <cassert>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include <boost/lexical_cast.hpp>

namespace KvSyslog {

  /* Receives the attributes of a TKeyValues in order. */
  class TKvSerializer {
    public:
    virtual ~TKvSerializer() = default;

    virtual void Emit(const std::string &key, const std::string &value) = 0;
  };  // TKvSerializer

  class TKeyValues final {
    public:
    /* Renders a value when the event is formatted.  May throw. */
    using TLazyFn = std::function<std::string()>;

    TKeyValues() = default;

    TKeyValues(
        std::initializer_list<std::pair<std::string, std::string>> init);

    TKeyValues &Add(std::string key, std::string value) {
      assert(this);
      Items.push_back(TItem{std::move(key), std::move(value), nullptr});
      return *this;
    }

    TKeyValues &Add(std::string key, const char *value) {
      assert(this);
      assert(value);
      return Add(std::move(key), std::string(value));
    }

    /* Values of other types are rendered immediately with
       boost::lexical_cast. */
    template <typename T>
    TKeyValues &Add(std::string key, const T &value) {
      assert(this);
      return Add(std::move(key), boost::lexical_cast<std::string>(value));
    }

    TKeyValues &AddLazy(std::string key, TLazyFn fn) {
      assert(this);
      assert(fn);
      Items.push_back(TItem{std::move(key), std::string(), std::move(fn)});
      return *this;
    }

    bool IsEmpty() const noexcept {
      assert(this);
      return Items.empty();
    }

    size_t Size() const noexcept {
      assert(this);
      return Items.size();
    }

    /* Pass each attribute to 'serializer' in insertion order, evaluating
       lazy values as they are reached.  An exception from a lazy value or
       from 'serializer' propagates, leaving the remaining attributes
       unvisited. */
    void Serialize(TKvSerializer &serializer) const;

    /* A shared empty instance. */
    static const TKeyValues &GetEmpty() noexcept;

    private:
    struct TItem {
      std::string Key;

      std::string Value;

      TLazyFn Lazy;
    };  // TItem

    std::vector<TItem> Items;
  };  // TKeyValues

}  // KvSyslog
