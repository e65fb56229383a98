/* <xml/xml_string_util.h>

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

   Utilities for working with Xerces XML strings.
 */

#pragma once

#include <memory>
#include <string>
#include <type_traits>

#include <xercesc/util/XercesDefs.hpp>
#include <xercesc/util/XMLString.hpp>

namespace Xml {

  /* Custom deleter for strings allocated by Xerces.  TCharType will be XMLCh,
     char, or the const variant of either type. */
  template <typename TCharType>
  void DeleteXmlString(TCharType *xml_string) {
    using TBaseCharType = typename std::remove_const<TCharType>::type;
    xercesc::XMLString::release(const_cast<TBaseCharType **>(&xml_string));
  }

  template <typename TCharType>
  using TXmlStringPtr = std::unique_ptr<TCharType, void (*)(TCharType *)>;

  /* Transcode from 'const XMLCh *' to the native code page.  The result owns
     the transcoded string. */
  inline TXmlStringPtr<const char> GetTranscoded(const XMLCh *xml_string) {
    return TXmlStringPtr<const char>(
        xercesc::XMLString::transcode(xml_string),
        DeleteXmlString<const char>);
  }

  /* Same as above, but transcodes from the native code page to
     'const XMLCh *'. */
  inline TXmlStringPtr<const XMLCh> GetTranscoded(const char *str) {
    return TXmlStringPtr<const XMLCh>(xercesc::XMLString::transcode(str),
        DeleteXmlString<const XMLCh>);
  }

  /* Same as GetTranscoded(const XMLCh *), but returns a std::string.  A null
     'xml_string' gives the empty string. */
  std::string TranscodeToString(const XMLCh *xml_string);

}  // Xml
