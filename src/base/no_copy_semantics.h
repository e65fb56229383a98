/* <base/no_copy_semantics.h>

   ----------------------------------------------------------------------------
   Copyright 2010-2013 if(we)
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

   Place NO_COPY_SEMANTICS(cls) at the top of a class body to delete its copy
   constructor and copy assignment operator.  Move semantics are unaffected,
   so a class may still declare its own move constructor and move assignment
   operator.
 */

#pragma once

#define NO_COPY_SEMANTICS(cls) \
  cls(const cls &) = delete; \
  cls &operator=(const cls &) = delete
