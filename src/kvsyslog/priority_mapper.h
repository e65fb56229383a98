/* <kvsyslog/priority_mapper.h>

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

   Strategies for choosing the syslog priority of a log event.
 */

#pragma once

#include <cassert>
#include <functional>
#include <optional>
#include <utility>

#include <base/no_copy_semantics.h>
#include <kvsyslog/key_values.h>
#include <kvsyslog/priority.h>
#include <kvsyslog/record.h>
#include <kvsyslog/severity.h>

namespace KvSyslog {

  /* Base class for priority mappers. */
  class TPriorityMapper {
    NO_COPY_SEMANTICS(TPriorityMapper);

    public:
    virtual ~TPriorityMapper() = default;

    /* The drain fills in its own facility if the result has none. */
    virtual TPriority GetPriority(const TRecord &record,
        const TKeyValues &scope_values) const = 0;

    protected:
    TPriorityMapper() = default;
  };  // TPriorityMapper

  /* Maps the event severity with ToLevel(TSeverity), leaving the facility
     unset. */
  class TDefaultPriorityMapper final : public TPriorityMapper {
    public:
    TDefaultPriorityMapper() = default;

    TPriority GetPriority(const TRecord &record,
        const TKeyValues &scope_values) const override;
  };  // TDefaultPriorityMapper

  /* Delegates to a caller supplied function. */
  class TCustomPriorityMapper final : public TPriorityMapper {
    public:
    using TPriorityFn = std::function<TPriority(const TRecord &record,
        const TKeyValues &scope_values)>;

    explicit TCustomPriorityMapper(TPriorityFn fn)
        : Fn(std::move(fn)) {
      assert(Fn);
    }

    TPriority GetPriority(const TRecord &record,
        const TKeyValues &scope_values) const override;

    private:
    TPriorityFn Fn;
  };  // TCustomPriorityMapper

  /* Per severity priority overrides, as found in a config file. */
  struct TPriorityConfig {
    /* Used for every severity.  A per severity entry without a facility
       takes its facility from here. */
    std::optional<TPriority> All;

    std::optional<TPriority> Trace;

    std::optional<TPriority> Debug;

    std::optional<TPriority> Info;

    std::optional<TPriority> Warning;

    std::optional<TPriority> Error;

    std::optional<TPriority> Critical;

    const std::optional<TPriority> &Get(TSeverity severity) const noexcept;

    std::optional<TPriority> &Get(TSeverity severity) noexcept;

    bool IsEmpty() const noexcept;

    /* The per severity entry overlaid with 'All' if both are present, else
       whichever one is present, else ToLevel(severity). */
    TPriority Resolve(TSeverity severity) const noexcept;
  };  // TPriorityConfig

  /* Resolves priorities from a TPriorityConfig. */
  class TConfiguredPriorityMapper final : public TPriorityMapper {
    public:
    explicit TConfiguredPriorityMapper(const TPriorityConfig &config)
        : Config(config) {
    }

    TPriority GetPriority(const TRecord &record,
        const TKeyValues &scope_values) const override;

    const TPriorityConfig &GetConfig() const noexcept {
      assert(this);
      return Config;
    }

    private:
    TPriorityConfig Config;
  };  // TConfiguredPriorityMapper

}  // KvSyslog
