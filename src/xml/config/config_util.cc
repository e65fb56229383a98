/* <xml/config/config_util.cc>

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

   Implements <xml/config/config_util.h>.
 */

#include <xml/config/config_util.h>

#include <cassert>
#include <cctype>
#include <unordered_set>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <xercesc/dom/DOMAttr.hpp>
#include <xercesc/dom/DOMException.hpp>
#include <xercesc/dom/DOMNode.hpp>
#include <xercesc/framework/MemBufInputSource.hpp>
#include <xercesc/parsers/XercesDOMParser.hpp>
#include <xercesc/sax/HandlerBase.hpp>
#include <xercesc/sax/SAXParseException.hpp>
#include <xercesc/util/XMLException.hpp>

#include <xml/xml_string_util.h>

using namespace xercesc;

using namespace Xml;
using namespace Xml::Config;

TDomDocumentPtr Xml::Config::ParseXmlConfig(const void *buf, size_t buf_size,
    const char *expected_encoding) {
  assert(buf);
  assert(expected_encoding);

  try {
    MemBufInputSource input_source(
        reinterpret_cast<const XMLByte *>(buf), buf_size, "XML config file");
    XercesDOMParser parser;

    /* HandlerBase throws SAXParseException on fatal errors.  Plain errors
       are ignored unless it is told otherwise. */
    HandlerBase err_handler;
    parser.setErrorHandler(&err_handler);
    parser.parse(input_source);
    parser.setErrorHandler(nullptr);
    TDomDocumentPtr doc(parser.adoptDocument(), DeleteDomDocument);

    if (!doc || !doc->getDocumentElement()) {
      throw TXmlError(std::nullopt, "XML document is empty");
    }

    std::string doc_encoding = TranscodeToString(doc->getXmlEncoding());

    if (!doc_encoding.empty() &&
        !boost::algorithm::iequals(doc_encoding, expected_encoding)) {
      throw TWrongEncoding(doc_encoding.c_str(), expected_encoding);
    }

    return doc;
  } catch (const XMLException &x) {
    throw TXmlError(x);
  } catch (const SAXParseException &x) {
    throw TSaxParseError(x);
  } catch (const DOMException &x) {
    throw TDomError(x);
  }
}

const DOMElement &Xml::Config::GetRootElement(const DOMDocument &doc,
    const char *expected_name) {
  assert(expected_name);
  const DOMElement *root = doc.getDocumentElement();
  assert(root);

  if (TranscodeToString(root->getTagName()) != expected_name) {
    throw TWrongRootElement(*root, expected_name);
  }

  return *root;
}

bool Xml::Config::IsAllWhitespace(const DOMText &node) {
  std::string data = TranscodeToString(node.getData());

  for (char c : data) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      return false;
    }
  }

  return true;
}

std::unordered_map<std::string, const DOMElement *>
Xml::Config::GetSubsectionElements(const DOMElement &parent,
    const std::vector<std::string> &subsection_names,
    bool allow_unknown_subsection) {
  std::unordered_map<std::string, const DOMElement *> result;
  const std::unordered_set<std::string> known(subsection_names.begin(),
      subsection_names.end());

  for (const DOMNode *child = parent.getFirstChild();
      child;
      child = child->getNextSibling()) {
    switch (child->getNodeType()) {
      case DOMNode::ELEMENT_NODE: {
        const auto *elem = static_cast<const DOMElement *>(child);
        std::string name(TranscodeToString(elem->getTagName()));

        if (known.count(name)) {
          if (!result.insert(std::make_pair(name, elem)).second) {
            throw TDuplicateElement(*elem);
          }
        } else if (!allow_unknown_subsection) {
          throw TUnknownElement(*elem);
        }

        break;
      }
      case DOMNode::TEXT_NODE:
      case DOMNode::CDATA_SECTION_NODE: {
        if (!IsAllWhitespace(*static_cast<const DOMText *>(child))) {
          throw TUnexpectedText();
        }

        break;
      }
      default: {
        break;  // ignore comments and other node types
      }
    }
  }

  return result;
}

void Xml::Config::RequireLeaf(const DOMElement &elem) {
  if (elem.getFirstChild()) {
    throw TExpectedLeaf(elem);
  }
}

std::optional<std::string> TAttrReader::GetOptString(const DOMElement &elem,
    const char *attr_name, unsigned int opts) {
  assert(attr_name);
  assert(opts == (opts & TOpts::TRIM_WHITESPACE));
  std::optional<std::string> result;
  const DOMAttr *attr = elem.getAttributeNode(GetTranscoded(attr_name).get());

  if (attr) {
    std::string value(TranscodeToString(attr->getValue()));

    if (opts & TOpts::TRIM_WHITESPACE) {
      boost::algorithm::trim(value);
    }

    result.emplace(std::move(value));
  }

  return result;
}

std::string TAttrReader::GetString(const DOMElement &elem,
    const char *attr_name, unsigned int opts) {
  assert(attr_name);
  assert(opts == (opts & (TOpts::THROW_IF_EMPTY | TOpts::TRIM_WHITESPACE)));
  auto opt_value = GetOptString(elem, attr_name,
      opts & TOpts::TRIM_WHITESPACE);

  if (!opt_value || ((opts & TOpts::THROW_IF_EMPTY) && opt_value->empty())) {
    throw TMissingAttrValue(elem, attr_name);
  }

  return std::move(*opt_value);
}

std::optional<bool> TAttrReader::GetOptBool(const DOMElement &elem,
    const char *attr_name) {
  std::optional<bool> result;
  auto opt_s = GetOptString(elem, attr_name, TOpts::TRIM_WHITESPACE);

  if (opt_s && !opt_s->empty()) {
    std::string lower = boost::algorithm::to_lower_copy(*opt_s);

    if (lower == "true") {
      result.emplace(true);
    } else if (lower == "false") {
      result.emplace(false);
    } else {
      throw TInvalidBoolAttr(elem, attr_name, opt_s->c_str());
    }
  }

  return result;
}

bool TAttrReader::GetBool(const DOMElement &elem, const char *attr_name) {
  auto opt_value = GetOptBool(elem, attr_name);

  if (!opt_value) {
    throw TMissingAttrValue(elem, attr_name);
  }

  return *opt_value;
}
