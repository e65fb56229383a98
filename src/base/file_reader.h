/* <base/file_reader.h>

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

   Read an entire file in one operation.
 */

#pragma once

#include <string>

namespace Base {

  /* Open 'filename', read its entire contents, and close it.  On error, throw
     a std::ios_base::failure whose what() message names the file and the
     system error, so it can be shown to the end user as is.  The file should
     be reasonably small, since its contents are held in memory. */
  std::string ReadFileIntoString(const std::string &filename);

}  // Base
