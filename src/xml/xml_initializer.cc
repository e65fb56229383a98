/* <xml/xml_initializer.cc>

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

   Implements <xml/xml_initializer.h>.
 */

#include <xml/xml_initializer.h>

#include <xercesc/util/PlatformUtils.hpp>
#include <xercesc/util/XMLException.hpp>

#include <log/log.h>
#include <xml/config/config_errors.h>
#include <xml/xml_string_util.h>

using namespace xercesc;

using namespace Log;
using namespace Xml;
using namespace Xml::Config;

TXmlInitializer::TXmlInitializer() {
  try {
    XMLPlatformUtils::Initialize();
  } catch (const XMLException &x) {
    throw TXmlError(x);
  }
}

TXmlInitializer::~TXmlInitializer() {
  try {
    XMLPlatformUtils::Terminate();
  } catch (const XMLException &x) {
    LOG(TPri::ERR) << "Xerces XML library cleanup error: "
        << TranscodeToString(x.getMessage());
  }
}
