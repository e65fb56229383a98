/* <base/no_default_case.h>

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

   Use NO_DEFAULT_CASE as the last label of a switch statement over an enum
   whose cases are all handled.  Reaching it means that the enum has a value
   the switch does not know about, which is a bug.
 */

#pragma once

#include <base/error_util.h>

#define NO_DEFAULT_CASE \
  default: \
    Base::Die("Unhandled enum value in switch statement")
