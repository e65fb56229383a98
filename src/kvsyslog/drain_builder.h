/* <kvsyslog/drain_builder.h>

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

   Fluent configuration of a syslog drain.
 */

#pragma once

#include <cassert>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <syslog.h>

#include <kvsyslog/adapter.h>
#include <kvsyslog/connection_lifecycle.h>
#include <kvsyslog/drain.h>
#include <kvsyslog/facility.h>
#include <kvsyslog/msg_format.h>
#include <kvsyslog/priority_mapper.h>
#include <kvsyslog/severity.h>
#include <kvsyslog/transport/endpoint.h>

namespace KvSyslog {

  /* Example:

         auto drain = TDrainBuilder()
             .Facility(TFacility::Local0)
             .Ident("myapp")
             .LogPid()
             .Threshold(TSeverity::Info)
             .Build();

     By default the drain writes to the local syslog daemon through
     openlog() and syslog(), with facility user, no ident, option word 0, the
     default message format and the default priority mapping.  A builder may
     be used to build any number of drains. */
  class TDrainBuilder final {
    public:
    enum class TTarget {
      /* openlog() and syslog(). */
      Local,

      /* A UNIX domain socket given by path. */
      UnixPath,

      Udp,

      Tcp
    };  // TTarget

    TDrainBuilder() = default;

    TDrainBuilder &Facility(TFacility facility) {
      assert(this);
      Settings.Facility = facility;
      return *this;
    }

    /* The drain keeps a copy of 'ident'.  Throws TIdentContainsNul if
       'ident' contains a NUL byte. */
    TDrainBuilder &Ident(const std::string &ident);

    /* 'ident' is not copied, and must outlive every drain built with it. */
    TDrainBuilder &IdentStatic(const char *ident) {
      assert(this);
      assert(ident);
      Settings.OwnedIdent.reset();
      Settings.StaticIdent = ident;
      return *this;
    }

    /* Sets LOG_PID. */
    TDrainBuilder &LogPid() {
      assert(this);
      Settings.Option |= LOG_PID;
      return *this;
    }

    /* Sets LOG_NDELAY and clears LOG_ODELAY. */
    TDrainBuilder &LogNdelay() {
      assert(this);
      Settings.Option = (Settings.Option & ~LOG_ODELAY) | LOG_NDELAY;
      return *this;
    }

    /* Sets LOG_ODELAY and clears LOG_NDELAY. */
    TDrainBuilder &LogOdelay() {
      assert(this);
      Settings.Option = (Settings.Option & ~LOG_NDELAY) | LOG_ODELAY;
      return *this;
    }

    /* Sets LOG_NOWAIT. */
    TDrainBuilder &LogNowait() {
      assert(this);
      Settings.Option |= LOG_NOWAIT;
      return *this;
    }

    /* Sets LOG_PERROR, which also copies messages to stderr. */
    TDrainBuilder &LogPerror() {
      assert(this);
      Settings.Option |= LOG_PERROR;
      return *this;
    }

    /* Drop events less severe than 'severity'. */
    TDrainBuilder &Threshold(TSeverity severity) {
      assert(this);
      Settings.Threshold = severity;
      return *this;
    }

    TDrainBuilder &Format(std::shared_ptr<const TMsgFormat> format) {
      assert(this);
      Settings.Adapter.SetFormat(std::move(format));
      return *this;
    }

    TDrainBuilder &Format(TCustomMsgFormat::TFormatFn fn) {
      assert(this);
      return Format(std::make_shared<TCustomMsgFormat>(std::move(fn)));
    }

    TDrainBuilder &Priority(std::shared_ptr<const TPriorityMapper> mapper) {
      assert(this);
      Settings.Adapter.SetPriorityMapper(std::move(mapper));
      return *this;
    }

    TDrainBuilder &Priority(TCustomPriorityMapper::TPriorityFn fn) {
      assert(this);
      return Priority(std::make_shared<TCustomPriorityMapper>(std::move(fn)));
    }

    /* Hostname, process name and pid only appear in messages sent by remote
       drains.  Any of them not given is detected by Build(). */
    TDrainBuilder &Hostname(const std::string &hostname) {
      assert(this);
      Settings.Hostname = hostname;
      return *this;
    }

    TDrainBuilder &Process(const std::string &process) {
      assert(this);
      Settings.Process = process;
      return *this;
    }

    TDrainBuilder &Pid(int pid) {
      assert(this);
      Settings.Pid = pid;
      return *this;
    }

    TDrainBuilder &Udp(const Transport::TEndpoint &local,
        const Transport::TEndpoint &remote) {
      assert(this);
      Settings.Target = TTarget::Udp;
      Settings.LocalEndpoint = local;
      Settings.RemoteEndpoint = remote;
      return *this;
    }

    TDrainBuilder &Tcp(const Transport::TEndpoint &remote) {
      assert(this);
      Settings.Target = TTarget::Tcp;
      Settings.RemoteEndpoint = remote;
      return *this;
    }

    TDrainBuilder &UnixPath(const std::string &path) {
      assert(this);
      Settings.Target = TTarget::UnixPath;
      Settings.Path = path;
      return *this;
    }

    /* Go back to the default openlog() and syslog() target. */
    TDrainBuilder &Local() {
      assert(this);
      Settings.Target = TTarget::Local;
      return *this;
    }

    /* Use 'lifecycle' instead of TConnectionLifecycle::GetDefault() for a
       local drain. */
    TDrainBuilder &Lifecycle(std::shared_ptr<TConnectionLifecycle> lifecycle) {
      assert(this);
      assert(lifecycle);
      Settings.Lifecycle = std::move(lifecycle);
      return *this;
    }

    int GetOption() const noexcept {
      assert(this);
      return Settings.Option;
    }

    TFacility GetFacility() const noexcept {
      assert(this);
      return Settings.Facility;
    }

    const std::optional<TSeverity> &GetThreshold() const noexcept {
      assert(this);
      return Settings.Threshold;
    }

    TTarget GetTarget() const noexcept {
      assert(this);
      return Settings.Target;
    }

    /* Null if no ident was given. */
    const char *GetIdent() const noexcept;

    const TAdapter &GetAdapter() const noexcept {
      assert(this);
      return Settings.Adapter;
    }

    /* Create a drain.  A local drain calls openlog() before this returns.
       Throws TConfigError if a remote endpoint or path is unusable, and
       TTransportError if the transport can not be opened. */
    std::unique_ptr<TDrain> Build() const;

    private:
    struct TSettings {
      TFacility Facility = DefaultFacility;

      std::optional<std::string> OwnedIdent;

      const char *StaticIdent = nullptr;

      int Option = 0;

      std::optional<TSeverity> Threshold;

      TAdapter Adapter;

      std::optional<std::string> Hostname;

      std::optional<std::string> Process;

      std::optional<int> Pid;

      TTarget Target = TTarget::Local;

      Transport::TEndpoint LocalEndpoint;

      Transport::TEndpoint RemoteEndpoint;

      std::string Path;

      std::shared_ptr<TConnectionLifecycle> Lifecycle;
    };  // TSettings

    TSettings Settings;
  };  // TDrainBuilder

  /* Name of the running executable, or the empty string if it can not be
     determined. */
  std::string DetectProcessName();

  /* Name of this host, or the empty string if it can not be determined. */
  std::string DetectHostname();

}  // KvSyslog
