/* <base/basename.cc>

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

   Implements <base/basename.h>.
 */

#include <base/basename.h>

using namespace Base;

std::string Base::Basename(const std::string &path) {
  std::string::size_type end = path.find_last_not_of('/');

  if (end == std::string::npos) {
    /* Empty, or nothing but slashes. */
    return path.empty() ? std::string() : std::string("/");
  }

  std::string::size_type start = path.rfind('/', end);
  start = (start == std::string::npos) ? 0 : (start + 1);
  return path.substr(start, end - start + 1);
}
