/* <xml/config/config_util.h>

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

   Utilities for working with config files using Xerces XML processing library.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <xercesc/dom/DOMDocument.hpp>
#include <xercesc/dom/DOMElement.hpp>
#include <xercesc/dom/DOMText.hpp>

#include <xml/config/config_errors.h>

namespace Xml {

  namespace Config {

    /* Custom deleter calling DOMDocument::release(). */
    inline void DeleteDomDocument(xercesc::DOMDocument *doc) {
      doc->release();
    }

    using TDomDocumentPtr = std::unique_ptr<xercesc::DOMDocument,
        void (*)(xercesc::DOMDocument *)>;

    /* Parse the given buffer of XML content.  'expected_encoding' should be
       something like "US-ASCII".  If the document declares an encoding that
       differs from it (compared case-insensitively), TWrongEncoding is
       thrown.  A document with no encoding declaration is accepted.  Parse
       errors are thrown as TSaxParseError, TDomError or TXmlError. */
    TDomDocumentPtr ParseXmlConfig(const void *buf, size_t buf_size,
        const char *expected_encoding);

    /* Return the root element of 'doc', after verifying that its name is
       'expected_name'.  Throws TWrongRootElement otherwise. */
    const xercesc::DOMElement &GetRootElement(const xercesc::DOMDocument &doc,
        const char *expected_name);

    /* Return true if the text associated with this node contains no
       non-whitespace characters, or false otherwise. */
    bool IsAllWhitespace(const xercesc::DOMText &node);

    /* Treat 'parent' as the root of a subtree with child elements representing
       subsections.  Return a hash where the keys are subsection element names
       and the values are pointers to their corresponding elements.
       'subsection_names' lists the subsections we recognize, all of them
       optional.  A repeated subsection throws TDuplicateElement.  An
       unrecognized one throws TUnknownElement unless
       'allow_unknown_subsection' is true.  Text other than whitespace throws
       TUnexpectedText. */
    std::unordered_map<std::string, const xercesc::DOMElement *>
    GetSubsectionElements(const xercesc::DOMElement &parent,
        const std::vector<std::string> &subsection_names,
        bool allow_unknown_subsection);

    /* Verify that 'elem' is a leaf (i.e. has no child nodes of any type).
       If a child is found, throw a TExpectedLeaf exception that references
       'elem'. */
    void RequireLeaf(const xercesc::DOMElement &elem);

    /* Class for reading attributes from XML elements.  All methods are static,
       and class can not be instantiated. */
    class TAttrReader {
      TAttrReader() = delete;

      public:
      /* Options for reading attribute values. */
      enum TOpts {
        /* Trim leading and trailing whitespace from string values.  This is
           always done for boolean values. */
        TRIM_WHITESPACE = 1U << 0,

        /* For GetString(), throw TMissingAttrValue if the attribute value is
           the empty string (after trimming whitespace if 'TRIM_WHITESPACE' was
           specified). */
        THROW_IF_EMPTY = 1U << 1
      };  // TOpts

      /* See if 'elem' has an attribute named 'attr_name'.  If not, return an
         empty optional.  Otherwise, return the attribute value.
         allowed opts: TRIM_WHITESPACE */
      static std::optional<std::string> GetOptString(
          const xercesc::DOMElement &elem, const char *attr_name,
          unsigned int opts = 0);

      /* Return the value of the attribute of 'elem' with name 'attr_name'.
         Throw TMissingAttrValue if no such attribute exists.
         allowed opts: TRIM_WHITESPACE, THROW_IF_EMPTY */
      static std::string GetString(const xercesc::DOMElement &elem,
          const char *attr_name, unsigned int opts = 0);

      /* Get an optional boolean value, spelled "true" or "false" in any
         letter case.  An absent or empty attribute gives an empty optional.
         Throw TInvalidBoolAttr if the value is anything else. */
      static std::optional<bool> GetOptBool(const xercesc::DOMElement &elem,
          const char *attr_name);

      /* Same as above, but throw TMissingAttrValue if the attribute is
         absent or empty. */
      static bool GetBool(const xercesc::DOMElement &elem,
          const char *attr_name);
    };  // TAttrReader

  }  // Config

}  // Xml
