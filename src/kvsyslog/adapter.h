/* <kvsyslog/adapter.h>

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

   Pairs a message format with a priority mapper.
 */

#pragma once

#include <cassert>
#include <memory>
#include <string>
#include <utility>

#include <kvsyslog/key_values.h>
#include <kvsyslog/msg_format.h>
#include <kvsyslog/priority.h>
#include <kvsyslog/priority_mapper.h>
#include <kvsyslog/record.h>

namespace KvSyslog {

  /* Everything a drain needs to turn an event into text and a priority.
     Defaults to TDefaultMsgFormat and TDefaultPriorityMapper. */
  class TAdapter final {
    public:
    TAdapter()
        : Format(std::make_shared<TDefaultMsgFormat>()),
          PriorityMapper(std::make_shared<TDefaultPriorityMapper>()) {
    }

    TAdapter(std::shared_ptr<const TMsgFormat> format,
        std::shared_ptr<const TPriorityMapper> priority_mapper)
        : Format(std::move(format)),
          PriorityMapper(std::move(priority_mapper)) {
      assert(Format);
      assert(PriorityMapper);
    }

    void SetFormat(std::shared_ptr<const TMsgFormat> format) noexcept {
      assert(this);
      assert(format);
      Format = std::move(format);
    }

    void SetPriorityMapper(
        std::shared_ptr<const TPriorityMapper> priority_mapper) noexcept {
      assert(this);
      assert(priority_mapper);
      PriorityMapper = std::move(priority_mapper);
    }

    const std::shared_ptr<const TMsgFormat> &GetFormat() const noexcept {
      assert(this);
      return Format;
    }

    const std::shared_ptr<const TPriorityMapper> &
    GetPriorityMapper() const noexcept {
      assert(this);
      return PriorityMapper;
    }

    /* See TMsgFormat::Format(). */
    void FormatMsg(std::string &out, const TRecord &record,
        const TKeyValues &scope_values) const {
      assert(this);
      Format->Format(out, record, scope_values);
    }

    TPriority GetPriority(const TRecord &record,
        const TKeyValues &scope_values) const {
      assert(this);
      return PriorityMapper->GetPriority(record, scope_values);
    }

    private:
    std::shared_ptr<const TMsgFormat> Format;

    std::shared_ptr<const TPriorityMapper> PriorityMapper;
  };  // TAdapter

}  // KvSyslog
