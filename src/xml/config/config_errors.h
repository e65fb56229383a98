/* <xml/config/config_errors.h>

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

   Exception classes related to working with config files and Xerces XML
   processing library.  Some of these classes correspond to exceptions defined
   by Xerces, but are derived from std::runtime_error.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <xercesc/dom/DOMElement.hpp>
#include <xercesc/dom/DOMException.hpp>
#include <xercesc/dom/DOMNode.hpp>
#include <xercesc/sax/SAXParseException.hpp>
#include <xercesc/util/XMLException.hpp>

namespace Xml {

  namespace Config {

    struct TFileLocation {
      explicit TFileLocation(size_t line) noexcept
          : Line(line) {
      }

      TFileLocation(size_t line, size_t column) noexcept
          : Line(line),
            Column(column) {
      }

      size_t Line;

      std::optional<size_t> Column;
    };  // TFileLocation

    class TXmlError : public std::runtime_error {
      public:
      TXmlError(const std::optional<TFileLocation> &location,
          const char *msg)
          : std::runtime_error(BuildMsg(location, msg)),
            Location(location) {
      }

      explicit TXmlError(const xercesc::XMLException &x)
          : TXmlError(BuildInfo(x)) {
      }

      const std::optional<TFileLocation> &GetLocation() const noexcept {
        return Location;
      }

      private:
      static std::pair<TFileLocation, std::string>
      BuildInfo(const xercesc::XMLException &x);

      static std::string BuildMsg(const std::optional<TFileLocation> &location,
          const char *msg);

      explicit TXmlError(const std::pair<TFileLocation, std::string> &info)
          : TXmlError(info.first, info.second.c_str()) {
      }

      std::optional<TFileLocation> Location;
    };  // TXmlError

    class TSaxParseError : public TXmlError {
      public:
      explicit TSaxParseError(const xercesc::SAXParseException &x)
          : TSaxParseError(BuildInfo(x)) {
      }

      private:
      static std::pair<TFileLocation, std::string> BuildInfo(
          const xercesc::SAXParseException &x);

      explicit TSaxParseError(
          const std::pair<TFileLocation, std::string> &info)
          : TXmlError(info.first, info.second.c_str()) {
      }
    };  // TSaxParseError

    class TDomError : public TXmlError {
      public:
      explicit TDomError(const xercesc::DOMException &x)
          : TXmlError(std::nullopt, BuildMsg(x).c_str()) {
      }

      private:
      static std::string BuildMsg(const xercesc::DOMException &x);
    };  // TDomError

    class TWrongEncoding : public TXmlError {
      public:
      TWrongEncoding(const char *encoding, const char *expected_encoding)
          : TXmlError(std::nullopt,
                BuildMsg(encoding, expected_encoding).c_str()),
            Encoding(encoding) {
      }

      /* Return the document's actual encoding (not the expected one). */
      const std::string &GetEncoding() const noexcept {
        return Encoding;
      }

      private:
      static std::string BuildMsg(const char *encoding,
          const char *expected_encoding);

      std::string Encoding;
    };  // TWrongEncoding

    /* Base class for errors in the content of a well formed document. */
    class TContentError : public TXmlError {
      protected:
      explicit TContentError(const char *msg)
          : TXmlError(std::nullopt, msg) {
      }
    };  // TContentError

    class TUnexpectedText : public TContentError {
      public:
      TUnexpectedText()
          : TContentError("XML document contains unexpected text") {
      }
    };  // TUnexpectedText

    class TElementError : public TContentError {
      public:
      const std::string &GetElementName() const noexcept {
        return ElementName;
      }

      protected:
      TElementError(const xercesc::DOMElement &elem, const char *msg);

      private:
      std::string ElementName;
    };  // TElementError

    class TWrongRootElement : public TElementError {
      public:
      TWrongRootElement(const xercesc::DOMElement &elem,
          const char *expected_name)
          : TElementError(elem, BuildMsg(elem, expected_name).c_str()) {
      }

      private:
      static std::string BuildMsg(const xercesc::DOMElement &elem,
          const char *expected_name);
    };  // TWrongRootElement

    class TDuplicateElement : public TElementError {
      public:
      explicit TDuplicateElement(const xercesc::DOMElement &elem)
          : TElementError(elem, BuildMsg(elem).c_str()) {
      }

      private:
      static std::string BuildMsg(const xercesc::DOMElement &elem);
    };  // TDuplicateElement

    class TUnknownElement : public TElementError {
      public:
      explicit TUnknownElement(const xercesc::DOMElement &elem)
          : TElementError(elem, BuildMsg(elem).c_str()) {
      }

      private:
      static std::string BuildMsg(const xercesc::DOMElement &elem);
    };  // TUnknownElement

    class TExpectedLeaf : public TElementError {
      public:
      explicit TExpectedLeaf(const xercesc::DOMElement &elem)
          : TElementError(elem, BuildMsg(elem).c_str()) {
      }

      private:
      static std::string BuildMsg(const xercesc::DOMElement &elem);
    };  // TExpectedLeaf

    class TAttrError : public TElementError {
      public:
      const std::string &GetAttrName() const noexcept {
        return AttrName;
      }

      protected:
      TAttrError(const xercesc::DOMElement &elem, const char *attr_name,
          const char *msg)
          : TElementError(elem, msg),
            AttrName(attr_name) {
      }

      private:
      std::string AttrName;
    };  // TAttrError

    class TMissingAttrValue : public TAttrError {
      public:
      TMissingAttrValue(const xercesc::DOMElement &elem, const char *attr_name)
          : TAttrError(elem, attr_name, BuildMsg(elem, attr_name).c_str()) {
      }

      private:
      static std::string BuildMsg(const xercesc::DOMElement &elem,
          const char *attr_name);
    };  // TMissingAttrValue

    class TInvalidAttr : public TAttrError {
      public:
      TInvalidAttr(const xercesc::DOMElement &elem, const char *attr_name,
          const char *attr_value, const char *msg)
          : TAttrError(elem, attr_name, msg),
            AttrValue(attr_value) {
      }

      TInvalidAttr(const xercesc::DOMElement &elem, const char *attr_name,
          const char *attr_value)
          : TInvalidAttr(elem, attr_name, attr_value,
                BuildMsg(elem, attr_name, attr_value).c_str()) {
      }

      const std::string &GetAttrValue() const noexcept {
        return AttrValue;
      }

      protected:
      static std::string BuildMsg(const xercesc::DOMElement &elem,
          const char *attr_name, const char *attr_value);

      private:
      std::string AttrValue;
    };  // TInvalidAttr

    class TInvalidBoolAttr : public TInvalidAttr {
      public:
      TInvalidBoolAttr(const xercesc::DOMElement &elem,
          const char *attr_name, const char *attr_value)
          : TInvalidAttr(elem, attr_name, attr_value,
                BuildMsg(elem, attr_name, attr_value).c_str()) {
      }

      private:
      static std::string BuildMsg(const xercesc::DOMElement &elem,
          const char *attr_name, const char *attr_value);
    };  // TInvalidBoolAttr

  }  // Config

}  // Xml
