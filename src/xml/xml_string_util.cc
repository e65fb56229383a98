/* <xml/xml_string_util.cc>

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

   Implements <xml/xml_string_util.h>.
 */

#include <xml/xml_string_util.h>

using namespace Xml;

std::string Xml::TranscodeToString(const XMLCh *xml_string) {
  if (!xml_string) {
    return std::string();
  }

  auto transcoded = GetTranscoded(xml_string);
  return std::string(transcoded ? transcoded.get() : "");
}
