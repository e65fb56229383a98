/* <kvsyslog/priority.h>

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

   Syslog priority: a level with optional facility, or a raw number.
 */

#pragma once

#include <cassert>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include <kvsyslog/facility.h>
#include <kvsyslog/level.h>

namespace KvSyslog {

  class TPriority final {
    public:
    /* Construct a symbolic priority.  Implicit, so a TLevel can be used where
       a TPriority is expected. */
    TPriority(TLevel level) noexcept
        : Level(level) {
    }

    TPriority(TLevel level, TFacility facility) noexcept
        : Level(level),
          Facility(facility) {
    }

    TPriority(TLevel level, const std::optional<TFacility> &facility) noexcept
        : Level(level),
          Facility(facility) {
    }

    /* Construct a priority from the number passed to syslog(), normally
       (level | facility).  It is used as is. */
    static TPriority FromRaw(int value) noexcept {
      return TPriority(value);
    }

    TPriority(const TPriority &) noexcept = default;

    TPriority &operator=(const TPriority &) noexcept = default;

    bool IsRaw() const noexcept {
      assert(this);
      return RawValue.has_value();
    }

    /* Returns an empty optional for a raw priority. */
    std::optional<TLevel> GetLevel() const noexcept {
      assert(this);
      return IsRaw() ? std::nullopt : std::optional<TLevel>(Level);
    }

    /* Returns an empty optional for a raw priority, or for a symbolic one
       with no facility. */
    std::optional<TFacility> GetFacility() const noexcept {
      assert(this);
      return IsRaw() ? std::nullopt : Facility;
    }

    /* Return the number to pass to syslog().  A missing facility contributes
       0, which tells syslog() to use the facility given to openlog(). */
    int ToRaw() const noexcept;

    /* If this priority is symbolic with no facility, and 'other' is symbolic
       with a facility, return this level with the facility of 'other'.
       Otherwise return this priority unchanged. */
    TPriority Overlay(const TPriority &other) const noexcept;

    /* Something like "info", "local0.info" or "raw(134)". */
    std::string ToString() const;

    private:
    explicit TPriority(int raw_value) noexcept
        : RawValue(raw_value) {
    }

    TLevel Level = TLevel::Debug;

    std::optional<TFacility> Facility;

    std::optional<int> RawValue;
  };  // TPriority

  /* Two priorities are equal if syslog() would see the same number. */
  inline bool operator==(const TPriority &lhs, const TPriority &rhs) noexcept {
    return lhs.ToRaw() == rhs.ToRaw();
  }

  inline bool operator!=(const TPriority &lhs, const TPriority &rhs) noexcept {
    return !(lhs == rhs);
  }

}  // KvSyslog

namespace std {

  template <>
  struct hash<KvSyslog::TPriority> {
    size_t operator()(const KvSyslog::TPriority &priority) const noexcept {
      return std::hash<int>()(priority.ToRaw());
    }
  };  // hash<KvSyslog::TPriority>

}  // std
