/* <log/log.test.cc>

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

   Unit test for diagnostic logging.
 */

#include <log/log.h>

#include <cerrno>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <base/error_util.h>
#include <base/file_reader.h>
#include <base/tmp_file.h>
#include <log/log_writer.h>
#include <log/pri.h>

#include <gtest/gtest.h>

using namespace Base;
using namespace Log;

namespace {

  const char name_template[] = "/tmp/log_test.XXXXXX";

  int Foo() {
    static int value = 0;
    return ++value;
  }

  /* The fixture for testing diagnostic logging. */
  class TLogTest : public ::testing::Test {
    protected:
    TLogTest() = default;

    ~TLogTest() override = default;

    void SetUp() override {
      SavedMask = GetLogMask();
    }

    void TearDown() override {
      SetLogMask(SavedMask);
      DropLogWriter();
    }

    unsigned int SavedMask = 0;
  };  // TLogTest

  TEST_F(TLogTest, MaskFiltersAndSkipsEvaluation) {
    TTmpFile tmp_file(name_template, true /* delete_on_destroy */);
    SetLogWriter(std::make_shared<TFileLogWriter>(tmp_file.GetName()));
    SetLogMask(UpTo(TPri::NOTICE));
    std::string msg1("first message ");
    std::string msg2("second message ");
    std::string msg3("third message ");

    /* Logged with Foo() returning 1. */
    LOG(TPri::NOTICE) << msg1 << Foo();

    /* Masked out, so Foo() is not called. */
    LOG(TPri::INFO) << msg2 << Foo();

    /* Logged with Foo() returning 2. */
    LOG(TPri::WARNING) << msg3 << Foo();

    std::ostringstream os;
    os << msg1 << 1 << std::endl << msg3 << 2 << std::endl;
    ASSERT_EQ(ReadFileIntoString(tmp_file.GetName()), os.str());
  }

  TEST_F(TLogTest, Errno) {
    TTmpFile tmp_file(name_template, true /* delete_on_destroy */);
    SetLogWriter(std::make_shared<TFileLogWriter>(tmp_file.GetName()));
    SetLogMask(UpTo(TPri::DEBUG));
    LOG_ERRNO(TPri::ERR, ENOENT) << "open failed: ";
    std::string expected("open failed: ");
    AppendStrerror(ENOENT, expected);
    expected += "\n";
    ASSERT_EQ(ReadFileIntoString(tmp_file.GetName()), expected);
  }

  TEST_F(TLogTest, TruncatesLongEntry) {
    TTmpFile tmp_file(name_template, true /* delete_on_destroy */);
    SetLogWriter(std::make_shared<TFileLogWriter>(tmp_file.GetName()));
    SetLogMask(UpTo(TPri::DEBUG));
    LOG(TPri::INFO) << std::string(2 * LogEntryBufSize, 'x');
    std::string contents = ReadFileIntoString(tmp_file.GetName());
    ASSERT_EQ(contents, std::string(LogEntryBufSize, 'x') + "\n");
  }

  TEST_F(TLogTest, PriNames) {
    ASSERT_STREQ(ToString(TPri::WARNING), "WARNING");
    ASSERT_EQ(ToPri("DEBUG"), TPri::DEBUG);
    ASSERT_THROW(ToPri("LOUD"), std::range_error);
    ASSERT_EQ(UpTo(TPri::ERR), 0x0fu);
    ASSERT_EQ(Mask(TPri::ERR), 0x08u);
  }

  TEST_F(TLogTest, RelativeLogfilePath) {
    ASSERT_THROW(TFileLogWriter("relative/path.log"),
        TFileLogWriter::TInvalidPath);
  }

}  // namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  DieOnTerminate();
  return RUN_ALL_TESTS();
}
