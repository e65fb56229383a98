/* <test_util/test_logging.cc>

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

   Implements <test_util/test_logging.h>.
 */

#include <test_util/test_logging.h>

#include <iostream>
#include <memory>
#include <string>

#include <base/basename.h>
#include <log/log.h>

#include <gtest/gtest.h>

using namespace Base;
using namespace Log;
using namespace TestUtil;

static TTmpFile MakeTestLogfile(const std::string &prog_basename) {
  std::string name_template("/tmp/");
  name_template += prog_basename;
  name_template += ".XXXXXX";
  return TTmpFile(name_template, true /* delete_on_destroy */);
}

namespace {

  class TTestNameEventListener : public testing::EmptyTestEventListener {
    public:
    void OnTestStart(const testing::TestInfo &test_info) override {
      LOG(TPri::NOTICE) << "Starting test [" << test_info.test_suite_name()
          << "." << test_info.name() << "]";
    }

    void OnTestEnd(const testing::TestInfo &test_info) override {
      LOG(TPri::NOTICE) << "Finished test [" << test_info.test_suite_name()
          << "." << test_info.name() << "]: "
          << (test_info.result()->Passed() ? "passed" : "FAILED");
    }
  };  // TTestNameEventListener

}  // namespace

TTmpFile TestUtil::InitTestLogging(const char *prog_name) {
  const std::string prog_basename = Basename(prog_name);
  TTmpFile tmp_logfile = MakeTestLogfile(prog_basename);
  SetLogWriter(std::make_shared<TFileLogWriter>(tmp_logfile.GetName()));
  SetLogMask(UpTo(TPri::DEBUG));
  testing::UnitTest::GetInstance()->listeners().Append(
      new TTestNameEventListener);
  std::cout << "Logfile [" << tmp_logfile.GetName() << "]" << std::endl;
  LOG(TPri::NOTICE) << "Log started for test [" << prog_basename << "]";
  return tmp_logfile;
}
