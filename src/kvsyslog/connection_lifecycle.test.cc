/* <kvsyslog/connection_lifecycle.test.cc>

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

   Unit tests for <kvsyslog/connection_lifecycle.h>.
 */

#include <kvsyslog/connection_lifecycle.h>

#include <memory>
#include <vector>

#include <syslog.h>

#include <base/tmp_file.h>
#include <kvsyslog/error.h>
#include <kvsyslog/ident.h>
#include <kvsyslog/test_util/mock_syslog_api.h>
#include <test_util/test_logging.h>

#include <gtest/gtest.h>

using namespace Base;
using namespace KvSyslog;
using namespace KvSyslog::TestUtil;

namespace {

  using TEvents = std::vector<TSyslogEvent>;

  /* The fixture for testing the openlog() owner bookkeeping. */
  class TConnectionLifecycleTest : public ::testing::Test {
    protected:
    TConnectionLifecycleTest()
        : Api(std::make_shared<TMockSyslogApi>()),
          Lifecycle(Api) {
    }

    ~TConnectionLifecycleTest() override = default;

    void SetUp() override {
    }

    void TearDown() override {
    }

    std::shared_ptr<TMockSyslogApi> Api;

    TConnectionLifecycle Lifecycle;
  };  // TConnectionLifecycleTest

  TEST_F(TConnectionLifecycleTest, CloseBeforeFree) {
    TIdent hello("hello");
    Lifecycle.Open(hello, LOG_PID, LOG_USER);
    ASSERT_EQ(Api->GetLastIdentPtr(), hello.Get());
    Lifecycle.Close(hello);
    ASSERT_TRUE(hello.IsAbsent());
    const TEvents expected = {
      TSyslogEvent::OpenLog(LOG_USER, LOG_PID, "hello"),
      TSyslogEvent::CloseLog(),
      TSyslogEvent::DropOwnedIdent("hello")
    };
    ASSERT_EQ(Api->GetEvents(), expected);
  }

  TEST_F(TConnectionLifecycleTest, SecondOwnerSuppressesClose) {
    TIdent x("x");
    TIdent y("y");
    Lifecycle.Open(x, 0, LOG_LOCAL0);
    Lifecycle.Open(y, 0, LOG_LOCAL1);
    Lifecycle.Close(x);
    TEvents expected = {
      TSyslogEvent::OpenLog(LOG_LOCAL0, 0, "x"),
      TSyslogEvent::OpenLog(LOG_LOCAL1, 0, "y"),
      TSyslogEvent::DropOwnedIdent("x")
    };
    ASSERT_EQ(Api->GetEvents(), expected);

    /* 'y' is still the owner, so it closes. */
    Lifecycle.Close(y);
    expected.push_back(TSyslogEvent::CloseLog());
    expected.push_back(TSyslogEvent::DropOwnedIdent("y"));
    ASSERT_EQ(Api->GetEvents(), expected);
  }

  TEST_F(TConnectionLifecycleTest, AbsentIdentKeepsOwner) {
    TIdent owned("owned");
    TIdent absent;
    Lifecycle.Open(owned, 0, LOG_USER);
    Lifecycle.Open(absent, 0, LOG_DAEMON);

    /* openlog() still uses "owned", so it must be closed before freeing. */
    Lifecycle.Close(absent);
    Lifecycle.Close(owned);
    const TEvents expected = {
      TSyslogEvent::OpenLog(LOG_USER, 0, "owned"),
      TSyslogEvent::OpenLog(LOG_DAEMON, 0, ""),
      TSyslogEvent::CloseLog(),
      TSyslogEvent::DropOwnedIdent("owned")
    };
    ASSERT_EQ(Api->GetEvents(), expected);
  }

  TEST_F(TConnectionLifecycleTest, BorrowedIdentKeepsOwner) {
    TIdent owned("owned");
    TIdent borrowed = TIdent::Borrowed("borrowed");
    Lifecycle.Open(owned, 0, LOG_USER);
    Lifecycle.Open(borrowed, 0, LOG_USER);
    Lifecycle.Close(owned);
    Lifecycle.Close(borrowed);
    const TEvents expected = {
      TSyslogEvent::OpenLog(LOG_USER, 0, "owned"),
      TSyslogEvent::OpenLog(LOG_USER, 0, "borrowed"),
      TSyslogEvent::CloseLog(),
      TSyslogEvent::DropOwnedIdent("owned")
    };
    ASSERT_EQ(Api->GetEvents(), expected);
  }

  TEST_F(TConnectionLifecycleTest, Write) {
    Lifecycle.Write(LOG_LOCAL0 | LOG_INFO, "hi");
    const TEvents expected = {
      TSyslogEvent::SysLog(LOG_LOCAL0 | LOG_INFO, "hi")
    };
    ASSERT_EQ(Api->GetEvents(), expected);
    Api->FailNext(TSyslogEvent::TKind::SysLog);
    bool caught = false;

    try {
      Lifecycle.Write(LOG_INFO, "lost");
    } catch (const TTransportError &) {
      caught = true;
    }

    ASSERT_TRUE(caught);

    /* A failed write doesn't break anything. */
    ASSERT_FALSE(Lifecycle.IsBroken());
  }

  TEST_F(TConnectionLifecycleTest, BrokenLeaksIdent) {
    TIdent first("first");
    Lifecycle.Open(first, 0, LOG_USER);
    Api->FailNext(TSyslogEvent::TKind::OpenLog);
    TIdent second("second");
    bool caught = false;

    try {
      Lifecycle.Open(second, 0, LOG_USER);
    } catch (const TTransportError &) {
      caught = true;
    }

    ASSERT_TRUE(caught);
    ASSERT_TRUE(Lifecycle.IsBroken());

    /* Neither closed nor freed. */
    Lifecycle.Close(first);
    ASSERT_TRUE(first.IsAbsent());
    const TEvents expected = {
      TSyslogEvent::OpenLog(LOG_USER, 0, "first")
    };
    ASSERT_EQ(Api->GetEvents(), expected);

    /* Further opens are refused. */
    caught = false;

    try {
      Lifecycle.Open(second, 0, LOG_USER);
    } catch (const TTransportError &) {
      caught = true;
    }

    ASSERT_TRUE(caught);
  }

  TEST_F(TConnectionLifecycleTest, FailedCloseLeaksIdent) {
    TIdent ident("ident");
    Lifecycle.Open(ident, 0, LOG_USER);
    Api->FailNext(TSyslogEvent::TKind::CloseLog);
    Lifecycle.Close(ident);
    ASSERT_TRUE(ident.IsAbsent());
    ASSERT_TRUE(Lifecycle.IsBroken());
    const TEvents expected = {
      TSyslogEvent::OpenLog(LOG_USER, 0, "ident")
    };
    ASSERT_EQ(Api->GetEvents(), expected);
  }

  TEST_F(TConnectionLifecycleTest, ReleaseHookFailure) {
    TIdent ident("hook");
    Lifecycle.Open(ident, 0, LOG_USER);
    Api->FailNext(TSyslogEvent::TKind::DropOwnedIdent);

    /* Close() is noexcept: the failure is logged and the ident still
       freed. */
    Lifecycle.Close(ident);
    ASSERT_TRUE(ident.IsAbsent());
    ASSERT_FALSE(Lifecycle.IsBroken());
    const TEvents expected = {
      TSyslogEvent::OpenLog(LOG_USER, 0, "hook"),
      TSyslogEvent::CloseLog()
    };
    ASSERT_EQ(Api->GetEvents(), expected);

    /* A later owner is still closed and released normally. */
    TIdent next("next");
    Lifecycle.Open(next, 0, LOG_USER);
    Lifecycle.Close(next);
    ASSERT_EQ(Api->GetEvents().back(), TSyslogEvent::DropOwnedIdent("next"));
  }

  TEST_F(TConnectionLifecycleTest, NulInIdent) {
    bool caught = false;

    try {
      TIdent ident(std::string("bad\0ident", 9));
    } catch (const TIdentContainsNul &) {
      caught = true;
    }

    ASSERT_TRUE(caught);
    ASSERT_TRUE(Api->GetEvents().empty());
  }

}  // namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  TTmpFile test_logfile = ::TestUtil::InitTestLogging(argv[0]);
  return RUN_ALL_TESTS();
}
