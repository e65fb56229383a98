/* <base/file_reader.cc>

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

   Implements <base/file_reader.h>.
 */

#include <base/file_reader.h>

#include <cerrno>
#include <fstream>
#include <ios>
#include <iterator>

#include <base/error_util.h>

using namespace Base;

static void ThrowFileError(const char *what, const std::string &filename,
    int errno_value) {
  std::string msg(what);
  msg += " [";
  msg += filename;
  msg += "]: ";
  AppendStrerror(errno_value, msg);
  throw std::ios_base::failure(msg);
}

std::string Base::ReadFileIntoString(const std::string &filename) {
  errno = 0;
  std::ifstream stream(filename, std::ios_base::in | std::ios_base::binary);

  if (!stream.is_open()) {
    ThrowFileError("Cannot open file for reading", filename, errno);
  }

  std::string contents;
  contents.assign(std::istreambuf_iterator<char>(stream),
      std::istreambuf_iterator<char>());

  if (stream.bad()) {
    ThrowFileError("Cannot read file", filename, errno);
  }

  return contents;
}
