/* <kvsyslog/conf/conf.h>

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

   Drain configuration read from an XML document.
 */

#pragma once

#include <cstddef>
#include <cstring>
#include <optional>
#include <string>

#include <xercesc/dom/DOMElement.hpp>

#include <kvsyslog/drain_builder.h>
#include <kvsyslog/facility.h>
#include <kvsyslog/priority.h>
#include <kvsyslog/priority_mapper.h>
#include <kvsyslog/severity.h>

namespace KvSyslog {

  namespace Conf {

    enum class TFormatKind {
      /* TDefaultMsgFormat */
      Default,

      /* TBasicMsgFormat */
      Basic
    };  // TFormatKind

    /* Example document:

           <?xml version="1.0" encoding="US-ASCII"?>
           <kvsyslogConfig>
             <format value="default" />
             <facility value="daemon" />
             <ident value="myapp" />
             <log_pid value="true" />
             <log_delay value="false" />
             <log_perror value="false" />
             <threshold value="info" />
             <priority>
               <all level="notice" />
               <critical level="alert" facility="mail" />
             </priority>
           </kvsyslogConfig>

       Every element is optional. */
    struct TConf final {
      class TBuilder;

      /* Read and parse the file at 'path'.  An Xml::TXmlInitializer must be
         alive during the call.  Throws std::ios_base::failure if the file
         can not be read, and Xml::Config::TXmlError on bad content. */
      static TConf LoadFile(const std::string &path);

      /* Builder with these settings, using TConfiguredPriorityMapper. */
      TDrainBuilder MakeBuilder() const;

      TFormatKind Format = TFormatKind::Default;

      TFacility Facility = DefaultFacility;

      std::optional<std::string> Ident;

      bool LogPid = false;

      /* true: LOG_ODELAY.  false: LOG_NDELAY.  Absent: neither. */
      std::optional<bool> LogDelay;

      bool LogPerror = false;

      std::optional<TSeverity> Threshold;

      TPriorityConfig Priority;
    };  // TConf

    class TConf::TBuilder final {
      public:
      TBuilder() = default;

      /* Throws Xml::Config::TXmlError or one of its subclasses on bad
         content.  An unknown facility, level or severity name is reported as
         Xml::Config::TInvalidAttr. */
      TConf Build(const void *buf, size_t buf_size);

      TConf Build(const char *xml) {
        return Build(xml, std::strlen(xml));
      }

      TConf Build(const std::string &xml) {
        return Build(xml.data(), xml.size());
      }

      private:
      void ProcessRootElem(const xercesc::DOMElement &root);

      void ProcessPriorityElem(const xercesc::DOMElement &priority_elem);

      TConf BuildResult;
    };  // TConf::TBuilder

  }  // Conf

}  // KvSyslog
