/* <kvsyslog/msg_format.cc>

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

   Implements <kvsyslog/msg_format.h>.
 */

#include <kvsyslog/msg_format.h>

#include <cstddef>
#include <exception>
#include <new>
#include <stdexcept>

#include <kvsyslog/error.h>
#include <kvsyslog/value_escaper.h>

using namespace KvSyslog;

void TMsgFormat::Format(std::string &out, const TRecord &record,
    const TKeyValues &scope_values) const {
  assert(this);

  try {
    DoFormat(out, record, scope_values);
  } catch (const TFormatError &) {
    throw;
  } catch (const std::length_error &x) {
    throw TFormatError(TFormatError::TKind::Sink, x.what());
  } catch (const std::bad_alloc &x) {
    throw TFormatError(TFormatError::TKind::Sink, x.what());
  } catch (const std::exception &x) {
    throw TFormatError(TFormatError::TKind::Source, x.what());
  }
}

void TBasicMsgFormat::DoFormat(std::string &out, const TRecord &record,
    const TKeyValues & /*scope_values*/) const {
  assert(this);
  out += record.GetMsg();
}

namespace {

  /* Writes ' [k1="v1"' for the first attribute and ' k2="v2"' after that. */
  class TStructuredSerializer final : public TKvSerializer {
    NO_COPY_SEMANTICS(TStructuredSerializer);

    public:
    explicit TStructuredSerializer(std::string &out)
        : Out(out) {
    }

    void Emit(const std::string &key, const std::string &value) override {
      assert(this);
      Out += (Count == 0) ? " [" : " ";
      Out += key;
      Out += "=\"";
      EscapeValue(Out, value);
      Out += '"';
      ++Count;
    }

    void Finish() {
      assert(this);

      if (Count) {
        Out += ']';
      }
    }

    private:
    std::string &Out;

    size_t Count = 0;
  };  // TStructuredSerializer

}  // namespace

void TDefaultMsgFormat::DoFormat(std::string &out, const TRecord &record,
    const TKeyValues &scope_values) const {
  assert(this);
  out += record.GetMsg();
  TStructuredSerializer serializer(out);
  scope_values.Serialize(serializer);
  record.GetKeyValues().Serialize(serializer);
  serializer.Finish();
}

void TCustomMsgFormat::DoFormat(std::string &out, const TRecord &record,
    const TKeyValues &scope_values) const {
  assert(this);
  Fn(out, record, scope_values);
}
