/* <kvsyslog/drain_builder.test.cc>

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

   Unit tests for <kvsyslog/drain_builder.h>.
 */

#include <kvsyslog/drain_builder.h>

#include <memory>
#include <string>
#include <vector>

#include <syslog.h>
#include <unistd.h>

#include <base/tmp_file.h>
#include <kvsyslog/error.h>
#include <kvsyslog/remote_drain.h>
#include <kvsyslog/syslog_drain.h>
#include <kvsyslog/test_util/mock_syslog_api.h>
#include <test_util/test_logging.h>

#include <gtest/gtest.h>

using namespace Base;
using namespace KvSyslog;
using namespace KvSyslog::TestUtil;
using namespace KvSyslog::Transport;

namespace {

  using TEvents = std::vector<TSyslogEvent>;

  class TDrainBuilderTest : public ::testing::Test {
    protected:
    TDrainBuilderTest() = default;

    ~TDrainBuilderTest() override = default;

    void SetUp() override {
    }

    void TearDown() override {
    }
  };  // TDrainBuilderTest

  TEST_F(TDrainBuilderTest, Defaults) {
    TDrainBuilder builder;
    ASSERT_EQ(builder.GetOption(), 0);
    ASSERT_EQ(builder.GetFacility(), TFacility::User);
    ASSERT_FALSE(builder.GetThreshold());
    ASSERT_EQ(builder.GetTarget(), TDrainBuilder::TTarget::Local);
    ASSERT_EQ(builder.GetIdent(), nullptr);
    ASSERT_TRUE(builder.GetAdapter().GetFormat());
    ASSERT_TRUE(builder.GetAdapter().GetPriorityMapper());
  }

  TEST_F(TDrainBuilderTest, OptionFlags) {
    TDrainBuilder builder;
    builder.LogPid().LogNowait().LogPerror();
    ASSERT_EQ(builder.GetOption(), LOG_PID | LOG_NOWAIT | LOG_PERROR);

    /* LOG_NDELAY and LOG_ODELAY exclude each other. */
    builder.LogNdelay();
    ASSERT_EQ(builder.GetOption(),
        LOG_PID | LOG_NOWAIT | LOG_PERROR | LOG_NDELAY);
    builder.LogOdelay();
    ASSERT_EQ(builder.GetOption(),
        LOG_PID | LOG_NOWAIT | LOG_PERROR | LOG_ODELAY);
    builder.LogNdelay();
    ASSERT_EQ(builder.GetOption() & (LOG_NDELAY | LOG_ODELAY), LOG_NDELAY);
  }

  TEST_F(TDrainBuilderTest, Ident) {
    TDrainBuilder builder;
    builder.Ident("owned");
    ASSERT_EQ(std::string(builder.GetIdent()), "owned");

    static const char borrowed[] = "borrowed";
    builder.IdentStatic(borrowed);
    ASSERT_EQ(builder.GetIdent(), borrowed);

    builder.Ident("owned again");
    ASSERT_EQ(std::string(builder.GetIdent()), "owned again");
  }

  TEST_F(TDrainBuilderTest, IdentWithNul) {
    TDrainBuilder builder;
    builder.Ident("good");
    ASSERT_THROW(builder.Ident(std::string("bad\0ident", 9)),
        TIdentContainsNul);

    /* A rejected ident leaves the old one in place. */
    ASSERT_EQ(std::string(builder.GetIdent()), "good");
  }

  TEST_F(TDrainBuilderTest, Targets) {
    TDrainBuilder builder;
    builder.Udp(TEndpoint("127.0.0.1", 0), TEndpoint("127.0.0.1", 514));
    ASSERT_EQ(builder.GetTarget(), TDrainBuilder::TTarget::Udp);
    builder.Tcp(TEndpoint("127.0.0.1", 514));
    ASSERT_EQ(builder.GetTarget(), TDrainBuilder::TTarget::Tcp);
    builder.UnixPath("/dev/log");
    ASSERT_EQ(builder.GetTarget(), TDrainBuilder::TTarget::UnixPath);
    builder.Local();
    ASSERT_EQ(builder.GetTarget(), TDrainBuilder::TTarget::Local);
  }

  TEST_F(TDrainBuilderTest, BuildLocal) {
    auto api = std::make_shared<TMockSyslogApi>();
    auto lifecycle = std::make_shared<TConnectionLifecycle>(api);
    TDrainBuilder builder;
    builder.Facility(TFacility::Daemon)
        .Ident("builder-test")
        .LogPid()
        .Threshold(TSeverity::Warning)
        .Lifecycle(lifecycle);

    {
      std::unique_ptr<TDrain> drain = builder.Build();
      auto &syslog_drain = dynamic_cast<TSyslogDrain &>(*drain);
      ASSERT_EQ(std::string(syslog_drain.GetIdent()), "builder-test");

      /* The drain owns a copy, not the builder's string. */
      ASSERT_NE(syslog_drain.GetIdent(), builder.GetIdent());
      ASSERT_EQ(syslog_drain.GetOption(), LOG_PID);
      ASSERT_EQ(syslog_drain.GetFacility(), TFacility::Daemon);
      ASSERT_TRUE(syslog_drain.GetThreshold());
      ASSERT_EQ(*syslog_drain.GetThreshold(), TSeverity::Warning);
    }

    /* The builder can be used again. */
    std::unique_ptr<TDrain> drain = builder.Build();
    drain.reset();

    const TEvents expected = {
      TSyslogEvent::OpenLog(LOG_DAEMON, LOG_PID, "builder-test"),
      TSyslogEvent::CloseLog(),
      TSyslogEvent::DropOwnedIdent("builder-test"),
      TSyslogEvent::OpenLog(LOG_DAEMON, LOG_PID, "builder-test"),
      TSyslogEvent::CloseLog(),
      TSyslogEvent::DropOwnedIdent("builder-test")
    };
    ASSERT_EQ(api->GetEvents(), expected);
  }

  TEST_F(TDrainBuilderTest, BuildRemote) {
    TDrainBuilder builder;
    builder.Hostname("h").Process("p").Pid(42)
        .Udp(TEndpoint("127.0.0.1", 0), TEndpoint("127.0.0.1", 514));
    std::unique_ptr<TDrain> drain = builder.Build();
    const auto &remote = dynamic_cast<const TRemoteDrain &>(*drain);
    ASSERT_EQ(remote.GetHostname(), "h");
    ASSERT_EQ(remote.GetProcess(), "p");
    ASSERT_EQ(remote.GetPid(), 42);
  }

  TEST_F(TDrainBuilderTest, BuildRemoteDetectsProcess) {
    TDrainBuilder builder;
    builder.Udp(TEndpoint("127.0.0.1", 0), TEndpoint("127.0.0.1", 514));
    std::unique_ptr<TDrain> drain = builder.Build();
    const auto &remote = dynamic_cast<const TRemoteDrain &>(*drain);
    ASSERT_EQ(remote.GetProcess(), DetectProcessName());
    ASSERT_EQ(remote.GetHostname(), DetectHostname());
    ASSERT_EQ(remote.GetPid(), static_cast<int>(getpid()));
  }

  TEST_F(TDrainBuilderTest, BadEndpoint) {
    TDrainBuilder builder;
    builder.Udp(TEndpoint("127.0.0.1", 0),
        TEndpoint("no such host.invalid", 514));
    ASSERT_THROW(builder.Build(), TConfigError);
  }

  TEST_F(TDrainBuilderTest, DetectProcessName) {
    /* Test executables are named after their source file. */
    ASSERT_NE(DetectProcessName().find("drain_builder"), std::string::npos);
    ASSERT_FALSE(DetectHostname().empty());
  }

}  // namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  TTmpFile test_logfile = ::TestUtil::InitTestLogging(argv[0]);
  return RUN_ALL_TESTS();
}
