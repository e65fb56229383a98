/* <base/basename.h>

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

   Extract the last component of a path.
 */

#pragma once

#include <string>

namespace Base {

  /* Return the part of 'path' following its last '/'.  Trailing slashes are
     ignored, so "/usr/bin/" yields "bin".  Unlike basename(3), 'path' is never
     modified, and the result for "" is "". */
  std::string Basename(const std::string &path);

  inline std::string Basename(const char *path) {
    return Basename(std::string(path ? path : ""));
  }

}  // Base
