/* <xml/config/config_errors.cc>

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

   Implements <xml/config/config_errors.h>.
 */

#include <xml/config/config_errors.h>

#include <xml/xml_string_util.h>

using namespace xercesc;

using namespace Xml;
using namespace Xml::Config;

std::pair<TFileLocation, std::string> TXmlError::BuildInfo(
    const XMLException &x) {
  return std::make_pair(TFileLocation(x.getSrcLine()),
      TranscodeToString(x.getMessage()));
}

std::string TXmlError::BuildMsg(const std::optional<TFileLocation> &location,
    const char *msg) {
  std::string result;

  if (location) {
    result = "(line ";
    result += std::to_string(location->Line);

    if (location->Column) {
      result += ", column ";
      result += std::to_string(*location->Column);
    }

    result += "): ";
  }

  result += msg;
  return result;
}

std::pair<TFileLocation, std::string>
TSaxParseError::BuildInfo(const SAXParseException &x) {
  std::string msg("XML document parse error: ");
  msg += TranscodeToString(x.getMessage());
  return std::make_pair(TFileLocation(x.getLineNumber(), x.getColumnNumber()),
      std::move(msg));
}

std::string TDomError::BuildMsg(const DOMException &x) {
  std::string result("XML DOM error: ");
  result += TranscodeToString(x.getMessage());
  return result;
}

std::string TWrongEncoding::BuildMsg(const char *encoding,
    const char *expected_encoding) {
  std::string result("XML document has wrong encoding of [");
  result += encoding;
  result += "]: expected value is [";
  result += expected_encoding;
  result += "]";
  return result;
}

static std::string ElemName(const DOMElement &elem) {
  return TranscodeToString(elem.getNodeName());
}

TElementError::TElementError(const DOMElement &elem, const char *msg)
    : TContentError(msg),
      ElementName(ElemName(elem)) {
}

std::string TWrongRootElement::BuildMsg(const DOMElement &elem,
    const char *expected_name) {
  std::string result("XML document has root element [");
  result += ElemName(elem);
  result += "]: expected element is [";
  result += expected_name;
  result += "]";
  return result;
}

std::string TDuplicateElement::BuildMsg(const DOMElement &elem) {
  std::string result("XML document contains unexpected duplicate element [");
  result += ElemName(elem);
  result += "]";
  return result;
}

std::string TUnknownElement::BuildMsg(const DOMElement &elem) {
  std::string result("XML document contains unknown element [");
  result += ElemName(elem);
  result += "]";
  return result;
}

std::string TExpectedLeaf::BuildMsg(const DOMElement &elem) {
  std::string result("XML element [");
  result += ElemName(elem);
  result += "] must not have children";
  return result;
}

std::string TMissingAttrValue::BuildMsg(const DOMElement &elem,
    const char *attr_name) {
  std::string result("XML element [");
  result += ElemName(elem);
  result += "] is missing attribute [";
  result += attr_name;
  result += "]";
  return result;
}

std::string TInvalidAttr::BuildMsg(const DOMElement &elem,
    const char *attr_name, const char *attr_value) {
  std::string result("XML element [");
  result += ElemName(elem);
  result += "] has invalid value for attribute [";
  result += attr_name;
  result += "]: [";
  result += attr_value;
  result += "]";
  return result;
}

std::string TInvalidBoolAttr::BuildMsg(const DOMElement &elem,
    const char *attr_name, const char *attr_value) {
  std::string result = TInvalidAttr::BuildMsg(elem, attr_name, attr_value);
  result += ": expected [true] or [false]";
  return result;
}
