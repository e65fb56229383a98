/* <xml/xml_initializer.h>

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

   RAII initialization and cleanup for the Xerces XML processing library.
 */

#pragma once

#include <base/no_copy_semantics.h>

namespace Xml {

  /* Calls xercesc::XMLPlatformUtils::Initialize() on construction and
     Terminate() on destruction.  Xerces keeps a reference count, so nested
     instances are fine.  Create one before parsing any XML, and keep it alive
     until all Xerces objects are gone. */
  class TXmlInitializer final {
    NO_COPY_SEMANTICS(TXmlInitializer);

    public:
    /* Throws Xml::Config::TXmlError if Xerces can not be initialized. */
    TXmlInitializer();

    /* An error during cleanup is logged, not thrown. */
    ~TXmlInitializer();
  };  // TXmlInitializer

}  // Xml
