/* <kvsyslog/level.test.cc>

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

   Unit tests for <kvsyslog/level.h> and <kvsyslog/severity.h>.
 */

#include <kvsyslog/level.h>

#include <syslog.h>

#include <base/tmp_file.h>
#include <kvsyslog/error.h>
#include <kvsyslog/severity.h>
#include <test_util/test_logging.h>

#include <gtest/gtest.h>

using namespace Base;
using namespace KvSyslog;

namespace {

  /* The fixture for testing syslog levels. */
  class TLevelTest : public ::testing::Test {
    protected:
    TLevelTest() = default;

    ~TLevelTest() override = default;

    void SetUp() override {
    }

    void TearDown() override {
    }
  };  // TLevelTest

  TEST_F(TLevelTest, NumericValues) {
    ASSERT_EQ(ToSyslog(TLevel::Emerg), LOG_EMERG);
    ASSERT_EQ(ToSyslog(TLevel::Alert), LOG_ALERT);
    ASSERT_EQ(ToSyslog(TLevel::Crit), LOG_CRIT);
    ASSERT_EQ(ToSyslog(TLevel::Err), LOG_ERR);
    ASSERT_EQ(ToSyslog(TLevel::Warning), LOG_WARNING);
    ASSERT_EQ(ToSyslog(TLevel::Notice), LOG_NOTICE);
    ASSERT_EQ(ToSyslog(TLevel::Info), LOG_INFO);
    ASSERT_EQ(ToSyslog(TLevel::Debug), LOG_DEBUG);
  }

  TEST_F(TLevelTest, OrderedBySeverity) {
    ASSERT_TRUE(TLevel::Debug < TLevel::Info);
    ASSERT_TRUE(TLevel::Info < TLevel::Notice);
    ASSERT_TRUE(TLevel::Notice < TLevel::Warning);
    ASSERT_TRUE(TLevel::Warning < TLevel::Err);
    ASSERT_TRUE(TLevel::Err < TLevel::Crit);
    ASSERT_TRUE(TLevel::Crit < TLevel::Alert);
    ASSERT_TRUE(TLevel::Alert < TLevel::Emerg);
    ASSERT_TRUE(TLevel::Emerg > TLevel::Debug);
    ASSERT_TRUE(TLevel::Info <= TLevel::Info);
    ASSERT_TRUE(TLevel::Info >= TLevel::Info);
    ASSERT_FALSE(TLevel::Emerg < TLevel::Emerg);
  }

  TEST_F(TLevelTest, Names) {
    ASSERT_STREQ(ToString(TLevel::Emerg), "emerg");
    ASSERT_STREQ(ToString(TLevel::Err), "err");
    ASSERT_STREQ(ToString(TLevel::Warning), "warning");
    ASSERT_STREQ(ToString(TLevel::Debug), "debug");
    ASSERT_EQ(ToLevel("notice"), TLevel::Notice);
    ASSERT_EQ(ToLevel("INFO"), TLevel::Info);
    ASSERT_EQ(ToLevel("panic"), TLevel::Emerg);
    ASSERT_EQ(ToLevel("error"), TLevel::Err);
    ASSERT_EQ(ToLevel("Warn"), TLevel::Warning);
    ASSERT_EQ(ToLevel("crit"), TLevel::Crit);
    ASSERT_EQ(ToLevel("alert"), TLevel::Alert);
    bool caught = false;

    try {
      ToLevel("loud");
    } catch (const TUnknownNameError &x) {
      caught = true;
      ASSERT_EQ(x.GetName(), "loud");
      ASSERT_STREQ(x.what(), "unrecognized syslog level name `loud`");
    }

    ASSERT_TRUE(caught);
  }

  TEST_F(TLevelTest, FromInt) {
    for (int i = LOG_EMERG; i <= LOG_DEBUG; ++i) {
      auto level = LevelFromInt(i);
      ASSERT_TRUE(level.has_value());
      ASSERT_EQ(ToSyslog(*level), i);
    }

    ASSERT_FALSE(LevelFromInt(-1).has_value());
    ASSERT_FALSE(LevelFromInt(8).has_value());
  }

  TEST_F(TLevelTest, SeverityMapping) {
    ASSERT_EQ(ToLevel(TSeverity::Critical), TLevel::Crit);
    ASSERT_EQ(ToLevel(TSeverity::Error), TLevel::Err);
    ASSERT_EQ(ToLevel(TSeverity::Warning), TLevel::Warning);
    ASSERT_EQ(ToLevel(TSeverity::Info), TLevel::Info);
    ASSERT_EQ(ToLevel(TSeverity::Debug), TLevel::Debug);
    ASSERT_EQ(ToLevel(TSeverity::Trace), TLevel::Debug);
  }

  TEST_F(TLevelTest, Severity) {
    ASSERT_TRUE(TSeverity::Trace < TSeverity::Debug);
    ASSERT_TRUE(TSeverity::Error < TSeverity::Critical);
    ASSERT_STREQ(ToString(TSeverity::Warning), "warning");
    ASSERT_EQ(ToSeverity("Trace"), TSeverity::Trace);
    ASSERT_EQ(ToSeverity("critical"), TSeverity::Critical);
    bool caught = false;

    try {
      ToSeverity("fatal");
    } catch (const TUnknownNameError &x) {
      caught = true;
      ASSERT_EQ(x.GetName(), "fatal");
    }

    ASSERT_TRUE(caught);
  }

}  // namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  TTmpFile test_logfile = ::TestUtil::InitTestLogging(argv[0]);
  return RUN_ALL_TESTS();
}
