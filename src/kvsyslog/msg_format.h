/* <kvsyslog/msg_format.h>

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

   Strategies for turning a log event into message text.
 */

#pragma once

#include <cassert>
#include <functional>
#include <string>
#include <utility>

#include <base/no_copy_semantics.h>
#include <kvsyslog/key_values.h>
#include <kvsyslog/record.h>

namespace KvSyslog {

  /* Base class for message formats. */
  class TMsgFormat {
    NO_COPY_SEMANTICS(TMsgFormat);

    public:
    virtual ~TMsgFormat() = default;

    /* Append the text for 'record' to 'out'.  'scope_values' are attributes
       of the logger the event was sent through.  Throws TFormatError: kind
       Sink if 'out' could not grow, otherwise kind Source. */
    void Format(std::string &out, const TRecord &record,
        const TKeyValues &scope_values) const;

    protected:
    TMsgFormat() = default;

    virtual void DoFormat(std::string &out, const TRecord &record,
        const TKeyValues &scope_values) const = 0;
  };  // TMsgFormat

  /* The message text only.  Attributes are ignored. */
  class TBasicMsgFormat final : public TMsgFormat {
    public:
    TBasicMsgFormat() = default;

    protected:
    void DoFormat(std::string &out, const TRecord &record,
        const TKeyValues &scope_values) const override;
  };  // TBasicMsgFormat

  /* The message text followed by the attributes in a form similar to RFC
     5424 structured data:

         Hello, world! [key1="value1" key2="value2"]

     Scope attributes come first.  Values are escaped with EscapeValue().
     With no attributes, only the message text is written. */
  class TDefaultMsgFormat final : public TMsgFormat {
    public:
    TDefaultMsgFormat() = default;

    protected:
    void DoFormat(std::string &out, const TRecord &record,
        const TKeyValues &scope_values) const override;
  };  // TDefaultMsgFormat

  /* Delegates to a caller supplied function. */
  class TCustomMsgFormat final : public TMsgFormat {
    public:
    using TFormatFn = std::function<void(std::string &out,
        const TRecord &record, const TKeyValues &scope_values)>;

    explicit TCustomMsgFormat(TFormatFn fn)
        : Fn(std::move(fn)) {
      assert(Fn);
    }

    protected:
    void DoFormat(std::string &out, const TRecord &record,
        const TKeyValues &scope_values) const override;

    private:
    TFormatFn Fn;
  };  // TCustomMsgFormat

}  // KvSyslog
