/* <kvsyslog/error.h>

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

   Exception classes thrown by the kvsyslog library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace KvSyslog {

  /* Invalid drain builder state or invalid config content. */
  class TConfigError : public std::runtime_error {
    public:
    explicit TConfigError(const std::string &msg)
        : std::runtime_error(msg) {
    }
  };  // TConfigError

  /* Thrown when an owned ident is constructed from a string with an embedded
     NUL byte.  This is a programming error on the caller's part. */
  class TIdentContainsNul : public std::logic_error {
    public:
    TIdentContainsNul()
        : std::logic_error("syslog ident contains an embedded NUL byte") {
    }
  };  // TIdentContainsNul

  /* Failure while rendering a message and its attributes. */
  class TFormatError : public std::runtime_error {
    public:
    enum class TKind {
      /* An attribute source (for instance a lazy value) failed. */
      Source,

      /* The output buffer could not be written. */
      Sink
    };  // TKind

    TFormatError(TKind kind, const std::string &msg)
        : std::runtime_error(msg),
          Kind(kind) {
    }

    TKind GetKind() const noexcept {
      return Kind;
    }

    private:
    TKind Kind;
  };  // TFormatError

  /* Failure opening or writing to the underlying transport. */
  class TTransportError : public std::runtime_error {
    public:
    explicit TTransportError(const std::string &msg)
        : std::runtime_error(msg) {
    }

    /* 'what_failed' describes the operation, for instance "UDP send". */
    TTransportError(const char *what_failed, const std::system_error &x)
        : std::runtime_error(BuildMsg(what_failed, x)),
          ErrnoValue(x.code().value()) {
    }

    /* Return the errno value of the underlying system error, or 0 if there
       was none. */
    int GetErrnoValue() const noexcept {
      return ErrnoValue;
    }

    private:
    static std::string BuildMsg(const char *what_failed,
        const std::system_error &x);

    int ErrnoValue = 0;
  };  // TTransportError

  /* A facility, level or severity name matched no known value. */
  class TUnknownNameError : public std::runtime_error {
    public:
    /* 'kind' is something like "syslog facility". */
    TUnknownNameError(const char *kind, const std::string &name)
        : std::runtime_error(BuildMsg(kind, name)),
          Name(name) {
    }

    /* Return the offending name. */
    const std::string &GetName() const noexcept {
      return Name;
    }

    private:
    static std::string BuildMsg(const char *kind, const std::string &name);

    std::string Name;
  };  // TUnknownNameError

}  // KvSyslog
